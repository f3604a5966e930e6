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

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "attest/AttestErrors.hh"

using namespace attest;

namespace
{
  std::string_view
  status_name(const EvidenceVerification &verification)
  {
    return is_verification_succeeded(verification) ? "success" : "failed";
  }

  std::string
  or_dash(const std::string &value)
  {
    return value.empty() ? "-" : value;
  }
} // namespace

MarkdownReportPrinter::MarkdownReportPrinter(std::ostream &out)
  : out(out)
{
}

outcome::std_result<void>
MarkdownReportPrinter::print(const VerificationResponse &response)
{
  const auto &verifications = response.evidence_verifications;

  fmt::print(out, "# Evidence Verification Result\n\n");
  fmt::print(out, "**Subject:** {}  \n", response.subject.path);
  fmt::print(out, "**Subject sha256:** {}  \n", response.subject.sha256);

  std::size_t succeeded = 0;
  fmt::print(out, "## Quick Summary\n");
  fmt::print(out, "| Predicate type | Verification status |\n");
  fmt::print(out, "|-|-|\n");
  for (const auto &verification: verifications)
    {
      if (is_verification_succeeded(verification))
        {
          succeeded++;
        }
      fmt::print(out, "| {} | {} |\n", verification.predicate_type, status_name(verification));
    }

  fmt::print(out, "**Total loaded evidence:** {}  \n", verifications.size());
  fmt::print(out, "**Successful verifications:** {}  \n", succeeded);
  fmt::print(out, "**Failed verifications:** {}  \n", verifications.size() - succeeded);
  fmt::print(out,
             "**Overall verification status:** {}  \n",
             response.overall_status == VerificationStatus::Failed ? "failed" : "success");

  fmt::print(out, "\n## Full Results\n");
  fmt::print(out,
             "| Predicate type | Subject Path | Subject Digest | Media type | Key source | Key fingerprint | Verification status | Failure reason |\n");
  fmt::print(out, "|-|-|-|-|-|-|-|-|\n");
  for (const auto &verification: verifications)
    {
      const auto &result = verification.result;
      fmt::print(out,
                 "| {} | {} | {} | {} | {} | {} | {} | {} |\n",
                 verification.predicate_type,
                 response.subject.path,
                 response.subject.sha256,
                 verification.media_type,
                 or_dash(result.key_source),
                 or_dash(result.key_fingerprint),
                 status_name(verification),
                 or_dash(result.failure_reason));
    }

  if (std::ranges::any_of(verifications, [](const auto &verification) { return verification.result.sigstore_result.has_value(); }))
    {
      fmt::print(out, "\n## Sigstore Signers\n");
      fmt::print(out, "| Predicate type | Signer identity | Issuer | Transparency log entries |\n");
      fmt::print(out, "|-|-|-|-|\n");
      for (const auto &verification: verifications)
        {
          const auto &verified = verification.result.sigstore_result;
          if (verified)
            {
              fmt::print(out,
                         "| {} | {} | {} | {} |\n",
                         verification.predicate_type,
                         or_dash(verified->certificate_subject),
                         or_dash(verified->certificate_issuer),
                         verified->log_entries.size());
            }
        }
    }
  out.flush();

  if (response.overall_status == VerificationStatus::Failed)
    {
      return AttestErrc::VerificationFailed;
    }
  fmt::print(out, "\n");
  return outcome::success();
}
