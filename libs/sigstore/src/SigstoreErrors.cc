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

#include "sigstore/SigstoreErrors.hh"

namespace attest::sigstore
{
  const char *SigstoreErrorCategory::name() const noexcept
  {
    return "sigstore";
  }

  std::string SigstoreErrorCategory::message(int ev) const
  {
    switch (static_cast<SigstoreError>(ev))
      {
      case SigstoreError::InvalidBundle:
        return "invalid bundle";
      case SigstoreError::UnsupportedBundleContent:
        return "unsupported bundle content";
      case SigstoreError::InvalidEnvelope:
        return "invalid DSSE envelope";
      case SigstoreError::InvalidSignature:
        return "signature verification failed";
      case SigstoreError::InvalidCertificate:
        return "invalid signing certificate";
      case SigstoreError::CertificateChainInvalid:
        return "certificate does not chain to a trusted certificate authority";
      case SigstoreError::InvalidPublicKey:
        return "invalid public key";
      case SigstoreError::InvalidTransparencyLog:
        return "transparency log verification failed";
      case SigstoreError::InsufficientTransparencyLogEntries:
        return "not enough verified transparency log entries";
      case SigstoreError::InvalidSignedCertificateTimestamp:
        return "signed certificate timestamp verification failed";
      case SigstoreError::InsufficientSignedCertificateTimestamps:
        return "not enough verified signed certificate timestamps";
      case SigstoreError::InvalidTimestamp:
        return "timestamp verification failed";
      case SigstoreError::InsufficientObserverTimestamps:
        return "not enough verified observer timestamps";
      case SigstoreError::ArtifactDigestMismatch:
        return "artifact digest does not match the bundle";
      case SigstoreError::InvalidTrustedRoot:
        return "invalid trusted root";
      case SigstoreError::TrustedRootUnavailable:
        return "trusted root unavailable";
      case SigstoreError::InvalidTufMetadata:
        return "invalid TUF metadata";
      case SigstoreError::TufSignatureThresholdNotMet:
        return "TUF metadata is not signed by enough trusted keys";
      case SigstoreError::TufMetadataExpired:
        return "TUF metadata expired";
      case SigstoreError::TufVersionMismatch:
        return "unexpected TUF metadata version";
      case SigstoreError::TufTargetMismatch:
        return "TUF file does not match its recorded length or hash";
      case SigstoreError::JsonParseError:
        return "JSON parse error";
      case SigstoreError::SystemError:
        return "system error";
      default:
        return "unknown error";
      }
  }

  const std::error_category &sigstore_error_category()
  {
    static SigstoreErrorCategory category;
    return category;
  }

  std::error_code make_error_code(SigstoreError e)
  {
    return {static_cast<int>(e), sigstore_error_category()};
  }
} // namespace attest::sigstore
