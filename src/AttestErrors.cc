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

#include "attest/AttestErrors.hh"

#include <string>

using namespace attest;

namespace
{
  class AttestErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept final
    {
      return "attest";
    }

    std::string message(int ev) const final
    {
      switch (static_cast<AttestErrc>(ev))
        {
        case AttestErrc::Success:
          return "success";
        case AttestErrc::InvalidInput:
          return "empty evidence or result provided";
        case AttestErrc::NoEvidence:
          return "no evidence metadata provided";
        case AttestErrc::NoEvidenceFound:
          return "no evidence found for the given subject";
        case AttestErrc::EnvelopeReadFailed:
          return "failed to read envelope";
        case AttestErrc::RemoteReadFailed:
          return "failed to read remote file";
        case AttestErrc::UnsupportedEvidence:
          return "unsupported evidence file for client-side verification";
        case AttestErrc::KeyReadFailed:
          return "failed to read key";
        case AttestErrc::KeyLoadFailed:
          return "failed to load key";
        case AttestErrc::ArtifactoryKeyLoadFailed:
          return "failed to load artifactory key";
        case AttestErrc::MissingBundle:
          return "invalid bundle: missing protobuf bundle";
        case AttestErrc::TrustedRootLoadFailed:
          return "failed to load TUF root certificate";
        case AttestErrc::InvalidDigest:
          return "invalid hex digest";
        case AttestErrc::UnsupportedMediaType:
          return "unsupported verification mode";
        case AttestErrc::InvalidEvidenceMetadata:
          return "invalid evidence metadata";
        case AttestErrc::SettingsError:
          return "failed to access settings";
        case AttestErrc::VerificationFailed:
          return "verification failed";
        }
      return "(unknown)";
    }
  };

  const AttestErrorCategory globalAttestErrorCategory{};
} // namespace

std::error_code
attest::make_error_code(AttestErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalAttestErrorCategory};
}
