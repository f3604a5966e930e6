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

#include "sigstore/BundleVerifier.hh"

#include <algorithm>
#include <optional>
#include <boost/algorithm/string/case_conv.hpp>
#include <openssl/x509v3.h>

#include "CertificateStore.hh"
#include "CertificateTimestampVerifier.hh"
#include "InTotoStatement.hh"
#include "TimestampAuthorityVerifier.hh"
#include "TransparencyLogVerifier.hh"
#include "sigstore/BundleLoader.hh"
#include "sigstore/Certificate.hh"
#include "sigstore/Dsse.hh"
#include "sigstore/PublicKey.hh"
#include "sigstore/SigstoreErrors.hh"
#include "utils/DateUtils.hh"
#include "utils/Hex.hh"
#include "utils/Logging.hh"

#include "sigstore_bundle.pb.h"

namespace attest::sigstore
{
  namespace
  {
    struct SigningMaterial
    {
      std::optional<Certificate> leaf;
      std::vector<Certificate> intermediates;
    };
  } // namespace

  class BundleVerifier::Impl
  {
  public:
    explicit Impl(std::shared_ptr<const TrustedRoot> trusted_root)
      : trusted_root_(std::move(trusted_root))
      , tlog_verifier_(*trusted_root_)
      , tsa_verifier_(*trusted_root_)
      , sct_verifier_(*trusted_root_)
      , certificate_store_(trusted_root_->certificate_authorities())
    {
    }

    outcome::std_result<BundleVerificationResult> verify(const v1::Bundle &bundle, const VerificationPolicy &policy) const;

  private:
    outcome::std_result<SigningMaterial> load_signing_material(const v1::Bundle &bundle) const;
    outcome::std_result<void> verify_content(const v1::Bundle &bundle, const Certificate &leaf, const VerificationPolicy &policy) const;
    outcome::std_result<void> verify_artifact_binding(const v1::Envelope &envelope, const VerificationPolicy &policy) const;
    outcome::std_result<std::vector<VerifiedLogEntry>> verify_log_entries(const v1::Bundle &bundle,
                                                                          const Certificate &leaf,
                                                                          const VerificationPolicy &policy) const;
    outcome::std_result<std::vector<std::chrono::system_clock::time_point>> collect_timestamps(
      const v1::Bundle &bundle,
      const std::vector<VerifiedLogEntry> &log_entries,
      const VerificationPolicy &policy) const;
    outcome::std_result<void> verify_certificate(const SigningMaterial &material,
                                                 const std::vector<std::chrono::system_clock::time_point> &timestamps) const;
    outcome::std_result<std::size_t> verify_signed_certificate_timestamps(const SigningMaterial &material,
                                                                          const VerificationPolicy &policy) const;
    const Certificate *find_issuer(const SigningMaterial &material) const;
    static std::string signature_bytes(const v1::Bundle &bundle);

  private:
    std::shared_ptr<const TrustedRoot> trusted_root_;
    TransparencyLogVerifier tlog_verifier_;
    TimestampAuthorityVerifier tsa_verifier_;
    CertificateTimestampVerifier sct_verifier_;
    CertificateStore certificate_store_;
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:bundle_verifier")};
  };

  BundleVerifier::BundleVerifier(std::shared_ptr<const TrustedRoot> trusted_root)
    : impl_(std::make_unique<Impl>(std::move(trusted_root)))
  {
  }

  BundleVerifier::~BundleVerifier() = default;
  BundleVerifier::BundleVerifier(BundleVerifier &&) noexcept = default;
  BundleVerifier &BundleVerifier::operator=(BundleVerifier &&) noexcept = default;

  outcome::std_result<BundleVerificationResult> BundleVerifier::verify(const v1::Bundle &bundle, const VerificationPolicy &policy) const
  {
    VerificationPolicy normalized = policy;
    boost::algorithm::to_lower(normalized.artifact_digest_sha256);
    return impl_->verify(bundle, normalized);
  }

  outcome::std_result<BundleVerificationResult> BundleVerifier::Impl::verify(const v1::Bundle &bundle, const VerificationPolicy &policy) const
  {
    auto material = load_signing_material(bundle);
    if (!material)
      {
        return material.error();
      }
    const auto &leaf = *material.value().leaf;

    auto content_valid = verify_content(bundle, leaf, policy);
    if (!content_valid)
      {
        return content_valid.error();
      }

    auto log_entries = verify_log_entries(bundle, leaf, policy);
    if (!log_entries)
      {
        return log_entries.error();
      }

    auto timestamps = collect_timestamps(bundle, log_entries.value(), policy);
    if (!timestamps)
      {
        return timestamps.error();
      }

    auto certificate_valid = verify_certificate(material.value(), timestamps.value());
    if (!certificate_valid)
      {
        return certificate_valid.error();
      }

    auto sct_count = verify_signed_certificate_timestamps(material.value(), policy);
    if (!sct_count)
      {
        return sct_count.error();
      }

    auto key = leaf.get_public_key();
    if (!key)
      {
        return key.error();
      }

    BundleVerificationResult result{
      .certificate_subject = leaf.subject_email(),
      .certificate_issuer = leaf.oidc_issuer(),
      .key_fingerprint = key.value().fingerprint(),
      .log_entries = std::move(log_entries.value()),
      .timestamps = std::move(timestamps.value()),
      .signed_certificate_timestamps = sct_count.value(),
    };
    if (result.certificate_subject.empty())
      {
        result.certificate_subject = leaf.subject_uri();
      }

    logger_->info("Bundle verified: signer {} issued by {}", result.certificate_subject, result.certificate_issuer);
    return result;
  }

  outcome::std_result<SigningMaterial> BundleVerifier::Impl::load_signing_material(const v1::Bundle &bundle) const
  {
    const auto &verification_material = bundle.verification_material();
    SigningMaterial material;

    if (verification_material.has_certificate())
      {
        auto leaf = Certificate::from_der(verification_material.certificate().raw_bytes());
        if (!leaf)
          {
            return leaf.error();
          }
        material.leaf.emplace(std::move(leaf.value()));
        return material;
      }

    if (verification_material.has_x509_certificate_chain())
      {
        const auto &certificates = verification_material.x509_certificate_chain().certificates();
        for (const auto &raw: certificates)
          {
            auto cert = Certificate::from_der(raw.raw_bytes());
            if (!cert)
              {
                return cert.error();
              }
            if (!material.leaf)
              {
                material.leaf.emplace(std::move(cert.value()));
              }
            else
              {
                material.intermediates.push_back(std::move(cert.value()));
              }
          }
        if (material.leaf)
          {
            return material;
          }
      }

    logger_->error("Bundle does not contain a signing certificate");
    return SigstoreError::InvalidCertificate;
  }

  outcome::std_result<void> BundleVerifier::Impl::verify_content(const v1::Bundle &bundle,
                                                                 const Certificate &leaf,
                                                                 const VerificationPolicy &policy) const
  {
    auto key = leaf.get_public_key();
    if (!key)
      {
        return key.error();
      }

    if (bundle.has_dsse_envelope())
      {
        auto valid = verify_envelope(BundleLoader::to_envelope(bundle.dsse_envelope()), key.value());
        if (!valid)
          {
            return valid.error();
          }
        if (!valid.value())
          {
            logger_->error("No DSSE signature verifies with the signing certificate");
            return SigstoreError::InvalidSignature;
          }
        return verify_artifact_binding(bundle.dsse_envelope(), policy);
      }

    if (bundle.has_message_signature())
      {
        const auto &message_signature = bundle.message_signature();
        const auto &digest = message_signature.message_digest().digest();
        if (message_signature.message_digest().algorithm() != v1::SHA2_256
            || attest::utils::Hex::encode(digest) != policy.artifact_digest_sha256)
          {
            logger_->error("Message digest does not match artifact digest {}", policy.artifact_digest_sha256);
            return SigstoreError::ArtifactDigestMismatch;
          }

        auto valid = key.value().verify_digest(digest, message_signature.signature(), DigestAlgorithm::SHA256);
        if (!valid)
          {
            return valid.error();
          }
        if (!valid.value())
          {
            logger_->error("Message signature does not verify with the signing certificate");
            return SigstoreError::InvalidSignature;
          }
        return outcome::success();
      }

    return SigstoreError::UnsupportedBundleContent;
  }

  outcome::std_result<void> BundleVerifier::Impl::verify_artifact_binding(const v1::Envelope &envelope,
                                                                          const VerificationPolicy &policy) const
  {
    auto statement = InTotoStatement::from_json(envelope.payload());
    if (!statement)
      {
        logger_->error("DSSE payload is not an in-toto statement");
        return SigstoreError::InvalidEnvelope;
      }

    if (!statement.value().has_subject_digest(policy.artifact_digest_sha256))
      {
        logger_->error("No in-toto subject has digest sha256:{}", policy.artifact_digest_sha256);
        return SigstoreError::ArtifactDigestMismatch;
      }
    return outcome::success();
  }

  outcome::std_result<std::vector<VerifiedLogEntry>> BundleVerifier::Impl::verify_log_entries(const v1::Bundle &bundle,
                                                                                              const Certificate &leaf,
                                                                                              const VerificationPolicy &policy) const
  {
    std::vector<VerifiedLogEntry> verified;
    for (const auto &entry: bundle.verification_material().tlog_entries())
      {
        if (trusted_root_->find_tlog(entry.log_id().key_id()) == nullptr)
          {
            logger_->warn("Ignoring transparency log entry {} from an untrusted log", entry.log_index());
            continue;
          }

        auto result = tlog_verifier_.verify(entry, bundle, leaf);
        if (!result)
          {
            return result.error();
          }
        verified.push_back(std::move(result.value()));
      }

    if (verified.size() < policy.required_transparency_log_entries)
      {
        logger_->error("Verified {} transparency log entries, {} required", verified.size(), policy.required_transparency_log_entries);
        return SigstoreError::InsufficientTransparencyLogEntries;
      }
    return verified;
  }

  outcome::std_result<std::vector<std::chrono::system_clock::time_point>> BundleVerifier::Impl::collect_timestamps(
    const v1::Bundle &bundle,
    const std::vector<VerifiedLogEntry> &log_entries,
    const VerificationPolicy &policy) const
  {
    std::vector<std::chrono::system_clock::time_point> timestamps;
    for (const auto &entry: log_entries)
      {
        if (entry.inclusion_promise_verified)
          {
            timestamps.push_back(entry.integrated_time);
          }
      }

    const std::string signature = signature_bytes(bundle);
    for (const auto &timestamp: bundle.verification_material().timestamp_verification_data().rfc3161_timestamps())
      {
        auto time = tsa_verifier_.verify(timestamp.signed_timestamp(), signature);
        if (!time)
          {
            return time.error();
          }
        logger_->debug("RFC 3161 timestamp at {}", attest::utils::DateUtils::format_rfc3339(time.value()));
        timestamps.push_back(time.value());
      }

    if (timestamps.size() < policy.required_observer_timestamps)
      {
        logger_->error("Verified {} observer timestamps, {} required", timestamps.size(), policy.required_observer_timestamps);
        return SigstoreError::InsufficientObserverTimestamps;
      }
    return timestamps;
  }

  outcome::std_result<void> BundleVerifier::Impl::verify_certificate(const SigningMaterial &material,
                                                                     const std::vector<std::chrono::system_clock::time_point> &timestamps) const
  {
    const auto &leaf = *material.leaf;
    if (!leaf.has_code_signing_usage())
      {
        logger_->error("Signing certificate lacks the code signing extended key usage");
        return SigstoreError::InvalidCertificate;
      }

    std::vector<const Certificate *> intermediates;
    for (const auto &cert: material.intermediates)
      {
        intermediates.push_back(&cert);
      }

    for (const auto &timestamp: timestamps)
      {
        auto valid_at = leaf.is_valid_at_time(timestamp);
        if (!valid_at)
          {
            return valid_at.error();
          }
        if (!valid_at.value())
          {
            logger_->error("Signing certificate was not valid at {}", attest::utils::DateUtils::format_rfc3339(timestamp));
            return SigstoreError::InvalidCertificate;
          }

        auto chained = certificate_store_.verify_certificate_chain(leaf, timestamp, intermediates);
        if (!chained)
          {
            return chained.error();
          }
        if (!chained.value())
          {
            logger_->error("Signing certificate does not chain to a trusted authority at {}",
                           attest::utils::DateUtils::format_rfc3339(timestamp));
            return SigstoreError::CertificateChainInvalid;
          }
      }
    return outcome::success();
  }

  outcome::std_result<std::size_t> BundleVerifier::Impl::verify_signed_certificate_timestamps(const SigningMaterial &material,
                                                                                              const VerificationPolicy &policy) const
  {
    if (policy.required_signed_certificate_timestamps == 0)
      {
        return std::size_t{0};
      }

    const auto *issuer = find_issuer(material);
    if (issuer == nullptr)
      {
        logger_->error("Issuer of the signing certificate not found");
        return SigstoreError::InvalidSignedCertificateTimestamp;
      }

    auto count = sct_verifier_.verify(*material.leaf, *issuer);
    if (!count)
      {
        return count.error();
      }
    if (count.value() < policy.required_signed_certificate_timestamps)
      {
        logger_->error("Verified {} signed certificate timestamps, {} required",
                       count.value(),
                       policy.required_signed_certificate_timestamps);
        return SigstoreError::InsufficientSignedCertificateTimestamps;
      }
    return count.value();
  }

  const Certificate *BundleVerifier::Impl::find_issuer(const SigningMaterial &material) const
  {
    X509 *leaf = material.leaf->get();
    for (const auto &cert: material.intermediates)
      {
        if (X509_check_issued(cert.get(), leaf) == X509_V_OK)
          {
            return &cert;
          }
      }
    for (const auto &authority: trusted_root_->certificate_authorities())
      {
        for (const auto &cert: authority.chain)
          {
            if (X509_check_issued(cert->get(), leaf) == X509_V_OK)
              {
                return cert.get();
              }
          }
      }
    return nullptr;
  }

  std::string BundleVerifier::Impl::signature_bytes(const v1::Bundle &bundle)
  {
    if (bundle.has_dsse_envelope())
      {
        const auto &signatures = bundle.dsse_envelope().signatures();
        return signatures.empty() ? std::string{} : signatures.Get(0).sig();
      }
    return bundle.message_signature().signature();
  }

} // namespace attest::sigstore
