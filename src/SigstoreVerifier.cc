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

#include "SigstoreVerifier.hh"

#include <regex>
#include <utility>

#include "attest/AttestErrors.hh"

using namespace attest;

SigstoreBundleVerifier::SigstoreBundleVerifier(const VerifierConfig &config,
                                               std::shared_ptr<sigstore::TrustedRootProvider> trusted_root_provider)
  : policy_template{.artifact_digest_sha256 = {},
                    .required_signed_certificate_timestamps = config.required_signed_certificate_timestamps,
                    .required_observer_timestamps = config.required_observer_timestamps,
                    .required_transparency_log_entries = config.required_transparency_log_entries}
  , trusted_root_provider(std::move(trusted_root_provider))
{
}

outcome::std_result<const sigstore::BundleVerifier *>
SigstoreBundleVerifier::get_bundle_verifier()
{
  std::call_once(trusted_root_once, [this]() {
    auto trusted_root = trusted_root_provider->load_trusted_root();
    if (!trusted_root)
      {
        logger->error("failed to load TUF root certificate ({})", trusted_root.error().message());
        trusted_root_error = AttestErrc::TrustedRootLoadFailed;
        return;
      }
    bundle_verifier = std::make_unique<sigstore::BundleVerifier>(trusted_root.value());
  });

  if (trusted_root_error)
    {
      return trusted_root_error;
    }
  return bundle_verifier.get();
}

outcome::std_result<void>
SigstoreBundleVerifier::verify(const std::string &subject_sha256, EvidenceVerification *result)
{
  const auto *sigstore_evidence = result != nullptr ? std::get_if<SigstoreEvidence>(&result->evidence) : nullptr;
  if (sigstore_evidence == nullptr || !sigstore_evidence->bundle)
    {
      logger->error("invalid bundle: missing protobuf bundle");
      return AttestErrc::MissingBundle;
    }

  auto verifier = get_bundle_verifier();
  if (!verifier)
    {
      return verifier.error();
    }

  static const std::regex sha256_hex("^[0-9a-fA-F]{64}$");
  if (!std::regex_match(subject_sha256, sha256_hex))
    {
      logger->error("invalid hex digest {}", subject_sha256);
      return AttestErrc::InvalidDigest;
    }

  auto policy = policy_template;
  policy.artifact_digest_sha256 = subject_sha256;

  auto verified = verifier.value()->verify(*sigstore_evidence->bundle, policy);
  if (!verified)
    {
      logger->warn("Sigstore verification of {} failed ({})", result->download_path, verified.error().message());
      result->result.sigstore_status = VerificationStatus::Failed;
      result->result.failure_reason = verified.error().message();
      return outcome::success();
    }

  result->result.key_source = SIGSTORE_KEY_SOURCE;
  result->result.key_fingerprint = verified.value().key_fingerprint;
  result->result.sigstore_status = VerificationStatus::Success;
  result->result.sigstore_result = std::move(verified.value());
  return outcome::success();
}
