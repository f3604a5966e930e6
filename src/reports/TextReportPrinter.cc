// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "ReportPrinters.hh"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include "attest/AttestErrors.hh"

using namespace attest;

TextReportPrinter::TextReportPrinter(std::ostream &out, bool use_color)
  : out(out)
  , use_color(use_color)
{
}

outcome::std_result<void>
TextReportPrinter::print(const VerificationResponse &response)
{
  const auto &verifications = response.evidence_verifications;
  auto succeeded = static_cast<std::size_t>(std::count_if(verifications.begin(), verifications.end(), is_verification_succeeded));

  fmt::print(out, "Subject sha256:        {}\n", response.subject.sha256);
  fmt::print(out, "Subject:               {}\n", response.subject.path);
  fmt::print(out, "Loaded {} evidence\n", verifications.size());
  fmt::print(out, "\n{}\n\n", summary_text(succeeded, verifications.size()));

  for (std::size_t i = 0; i < verifications.size(); i++)
    {
      print_verification(verifications[i], i);
    }
  out.flush();

  if (response.overall_status == VerificationStatus::Failed)
    {
      return AttestErrc::VerificationFailed;
    }
  return outcome::success();
}

void
TextReportPrinter::print_verification(const EvidenceVerification &verification, std::size_t index)
{
  const auto &result = verification.result;

  fmt::print(out, "- Evidence {}:\n", index + 1);
  fmt::print(out, "    - Media type:                     {}\n", verification.media_type);
  fmt::print(out, "    - Predicate type:                 {}\n", verification.predicate_type);
  fmt::print(out, "    - Evidence subject sha256:        {}\n", verification.subject_checksum);
  if (!result.key_source.empty())
    {
      fmt::print(out, "    - Key source:                     {}\n", result.key_source);
    }
  if (!result.key_fingerprint.empty())
    {
      fmt::print(out, "    - Key fingerprint:                {}\n", result.key_fingerprint);
    }
  fmt::print(out, "    - Sha256 verification status:     {}\n", status_text(result.sha256_status));
  if (verification.media_type == MediaType::SimpleDSSE)
    {
      fmt::print(out, "    - Signatures verification status: {}\n", status_text(result.signatures_status));
    }
  if (verification.media_type == MediaType::SigstoreBundle)
    {
      fmt::print(out, "    - Sigstore verification status:   {}\n", status_text(result.sigstore_status));
    }
  if (result.sigstore_result)
    {
      fmt::print(out, "    - Signer identity:                {}\n", result.sigstore_result->certificate_subject);
      fmt::print(out, "    - Signer issuer:                  {}\n", result.sigstore_result->certificate_issuer);
      fmt::print(out, "    - Transparency log entries:       {}\n", result.sigstore_result->log_entries.size());
    }
  if (!result.failure_reason.empty())
    {
      fmt::print(out, "    - Failure reason:                 {}\n", result.failure_reason);
    }
}

std::string
TextReportPrinter::status_text(VerificationStatus status) const
{
  if (status == VerificationStatus::Success)
    {
      return use_color ? fmt::format(fmt::fg(fmt::terminal_color::green), "success") : "success";
    }
  return use_color ? fmt::format(fmt::fg(fmt::terminal_color::red), "failed") : "failed";
}

std::string
TextReportPrinter::summary_text(std::size_t succeeded, std::size_t total) const
{
  auto message = fmt::format("Verification passed for {} out of {} evidence", succeeded, total);
  if (!use_color)
    {
      return message;
    }

  auto color = fmt::terminal_color::green;
  if (succeeded == 0)
    {
      color = fmt::terminal_color::red;
    }
  else if (succeeded != total)
    {
      color = fmt::terminal_color::yellow;
    }
  return fmt::format(fmt::fg(color), "{}", message);
}
