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

#include "TransparencyLogVerifier.hh"

#include <algorithm>
#include <fmt/format.h>

#include "sigstore/PublicKey.hh"
#include "sigstore/SigstoreErrors.hh"
#include "utils/Base64.hh"
#include "utils/Hex.hh"

namespace attest::sigstore
{
  namespace
  {
    constexpr std::size_t KEY_HINT_SIZE = 4;

    bool same_verifier(const std::string &verifier_pem, const Certificate &certificate)
    {
      auto verifier_cert = Certificate::from_pem(verifier_pem);
      if (verifier_cert)
        {
          return verifier_cert.value() == certificate;
        }

      auto verifier_key = PublicKey::from_pem(verifier_pem);
      auto certificate_key = certificate.get_public_key();
      return verifier_key && certificate_key && verifier_key.value().to_der() == certificate_key.value().to_der();
    }
  } // namespace

  TransparencyLogVerifier::TransparencyLogVerifier(const TrustedRoot &trusted_root)
    : trusted_root_(trusted_root)
  {
  }

  outcome::std_result<VerifiedLogEntry> TransparencyLogVerifier::verify(const v1::TransparencyLogEntry &entry,
                                                                        const v1::Bundle &bundle,
                                                                        const Certificate &certificate) const
  {
    logger_->debug("Verifying transparency log entry with log index {}", entry.log_index());

    const auto *tlog = trusted_root_.find_tlog(entry.log_id().key_id());
    if (tlog == nullptr)
      {
        logger_->warn("Transparency log entry {} is from an unknown log {}",
                      entry.log_index(),
                      attest::utils::Hex::encode(entry.log_id().key_id()));
        return SigstoreError::InvalidTransparencyLog;
      }

    if (entry.canonicalized_body().empty())
      {
        logger_->error("Transparency log entry {} has no canonicalized body", entry.log_index());
        return SigstoreError::InvalidTransparencyLog;
      }

    auto consistent = verify_body_consistency(entry, bundle, certificate);
    if (!consistent)
      {
        return consistent.error();
      }

    VerifiedLogEntry verified{
      .log_index = entry.log_index(),
      .log_id = attest::utils::Hex::encode(entry.log_id().key_id()),
      .integrated_time = std::chrono::system_clock::time_point{std::chrono::seconds{entry.integrated_time()}},
      .inclusion_proof_verified = entry.has_inclusion_proof() && verify_inclusion_proof(entry, *tlog),
      .inclusion_promise_verified = entry.has_inclusion_promise() && verify_inclusion_promise(entry, *tlog),
    };

    if (!verified.inclusion_proof_verified && !verified.inclusion_promise_verified)
      {
        logger_->error("Transparency log entry {} has neither a valid inclusion proof nor a valid inclusion promise",
                       entry.log_index());
        return SigstoreError::InvalidTransparencyLog;
      }

    if (verified.inclusion_promise_verified)
      {
        auto time_valid = verify_integrated_time(entry, certificate);
        if (!time_valid)
          {
            return time_valid.error();
          }
      }

    if (!tlog->valid_for.contains(verified.integrated_time))
      {
        logger_->error("Transparency log {} was not valid at integrated time {}", verified.log_id, entry.integrated_time());
        return SigstoreError::InvalidTransparencyLog;
      }

    logger_->debug("Transparency log entry {} verified (proof: {}, promise: {})",
                   entry.log_index(),
                   verified.inclusion_proof_verified,
                   verified.inclusion_promise_verified);
    return verified;
  }

  // =============================================================================
  // Body consistency
  // =============================================================================

  outcome::std_result<void> TransparencyLogVerifier::verify_body_consistency(const v1::TransparencyLogEntry &entry,
                                                                             const v1::Bundle &bundle,
                                                                             const Certificate &certificate) const
  {
    auto parsed = body_parser_.parse(entry.canonicalized_body());
    if (!parsed)
      {
        return parsed.error();
      }
    const auto &log_entry = parsed.value();

    if (entry.has_kind_version() && entry.kind_version().kind() != log_entry.kind)
      {
        logger_->error("Entry kind {} does not match body kind {}", entry.kind_version().kind(), log_entry.kind);
        return SigstoreError::InvalidTransparencyLog;
      }

    if (const auto *hashed = std::get_if<HashedRekord>(&log_entry.spec))
      {
        return verify_hashed_rekord(*hashed, bundle, certificate);
      }
    if (const auto *dsse = std::get_if<DsseRekord>(&log_entry.spec))
      {
        return verify_envelope_rekord(dsse->payload_hash_algorithm, dsse->payload_hash, dsse->signatures, bundle, certificate);
      }
    const auto &intoto = std::get<IntotoRekord>(log_entry.spec);
    return verify_envelope_rekord(intoto.payload_hash_algorithm, intoto.payload_hash, intoto.signatures, bundle, certificate);
  }

  outcome::std_result<void> TransparencyLogVerifier::verify_hashed_rekord(const HashedRekord &rekord,
                                                                          const v1::Bundle &bundle,
                                                                          const Certificate &certificate) const
  {
    if (!bundle.has_message_signature())
      {
        logger_->error("hashedrekord entry requires a message signature bundle");
        return SigstoreError::InvalidTransparencyLog;
      }

    const auto &message_signature = bundle.message_signature();
    if (rekord.signature != message_signature.signature())
      {
        logger_->error("hashedrekord signature does not match the bundle signature");
        return SigstoreError::InvalidTransparencyLog;
      }

    if (message_signature.has_message_digest()
        && rekord.hash_value != attest::utils::Hex::encode(message_signature.message_digest().digest()))
      {
        logger_->error("hashedrekord digest {} does not match the bundle digest", rekord.hash_value);
        return SigstoreError::InvalidTransparencyLog;
      }

    if (!same_verifier(rekord.public_key, certificate))
      {
        logger_->error("hashedrekord verifier does not match the signing certificate");
        return SigstoreError::InvalidTransparencyLog;
      }
    return outcome::success();
  }

  outcome::std_result<void> TransparencyLogVerifier::verify_envelope_rekord(const std::string &payload_hash_algorithm,
                                                                            const std::string &payload_hash,
                                                                            const std::vector<RekordSignature> &signatures,
                                                                            const v1::Bundle &bundle,
                                                                            const Certificate &certificate) const
  {
    if (!bundle.has_dsse_envelope())
      {
        logger_->error("Envelope entry requires a DSSE envelope bundle");
        return SigstoreError::InvalidTransparencyLog;
      }
    const auto &envelope = bundle.dsse_envelope();

    auto algorithm = digest_algorithm_from_string(payload_hash_algorithm);
    if (!algorithm)
      {
        logger_->error("Unsupported payload hash algorithm {}", payload_hash_algorithm);
        return SigstoreError::InvalidTransparencyLog;
      }
    auto digest = compute_digest(algorithm.value(), envelope.payload());
    if (!digest)
      {
        return digest.error();
      }
    if (attest::utils::Hex::encode(digest.value()) != payload_hash)
      {
        logger_->error("Payload hash {} does not match the envelope payload", payload_hash);
        return SigstoreError::InvalidTransparencyLog;
      }

    bool found = std::ranges::any_of(signatures, [&](const RekordSignature &signature) {
      return std::ranges::any_of(envelope.signatures(), [&](const auto &envelope_signature) {
        return envelope_signature.sig() == signature.signature;
      });
    });
    if (!found)
      {
        logger_->error("No envelope signature matches the transparency log entry");
        return SigstoreError::InvalidTransparencyLog;
      }

    bool verifier_found = std::ranges::any_of(signatures, [&](const RekordSignature &signature) {
      return same_verifier(signature.verifier, certificate);
    });
    if (!verifier_found)
      {
        logger_->error("Transparency log entry verifier does not match the signing certificate");
        return SigstoreError::InvalidTransparencyLog;
      }
    return outcome::success();
  }

  // =============================================================================
  // Inclusion proof
  // =============================================================================

  bool TransparencyLogVerifier::verify_inclusion_proof(const v1::TransparencyLogEntry &entry, const TransparencyLogInstance &tlog) const
  {
    const auto &proof = entry.inclusion_proof();
    std::vector<std::string> hashes(proof.hashes().begin(), proof.hashes().end());

    auto leaf_hash = hasher_.hash_leaf(entry.canonicalized_body());
    auto included = merkle_validator_.verify_inclusion_proof(hashes, proof.log_index(), proof.tree_size(), leaf_hash, proof.root_hash());
    if (!included || !included.value())
      {
        logger_->warn("Inclusion proof of entry {} does not verify", entry.log_index());
        return false;
      }

    if (!proof.has_checkpoint() || proof.checkpoint().envelope().empty())
      {
        logger_->warn("Inclusion proof of entry {} has no checkpoint", entry.log_index());
        return false;
      }
    return verify_checkpoint(proof, tlog);
  }

  bool TransparencyLogVerifier::verify_checkpoint(const v1::InclusionProof &proof, const TransparencyLogInstance &tlog) const
  {
    auto parsed = checkpoint_parser_.parse(proof.checkpoint().envelope());
    if (!parsed)
      {
        return false;
      }
    const auto &checkpoint = parsed.value();

    if (static_cast<std::int64_t>(checkpoint.tree_size) != proof.tree_size())
      {
        logger_->warn("Checkpoint tree size {} does not match proof tree size {}", checkpoint.tree_size, proof.tree_size());
        return false;
      }
    if (checkpoint.root_hash != proof.root_hash())
      {
        logger_->warn("Checkpoint root hash does not match proof root hash");
        return false;
      }

    const std::string key_hint = tlog.log_id.substr(0, KEY_HINT_SIZE);
    for (const auto &signature: checkpoint.signatures)
      {
        if (signature.key_hint != key_hint)
          {
            logger_->debug("Skipping checkpoint signature from {}", signature.signer);
            continue;
          }

        auto valid = tlog.public_key->verify_signature(checkpoint.body, signature.signature);
        if (valid && valid.value())
          {
            return true;
          }
        logger_->warn("Checkpoint signature from {} does not verify", signature.signer);
      }

    logger_->warn("No checkpoint signature verifies with the key of log {}", attest::utils::Hex::encode(tlog.log_id));
    return false;
  }

  // =============================================================================
  // Inclusion promise
  // =============================================================================

  bool TransparencyLogVerifier::verify_inclusion_promise(const v1::TransparencyLogEntry &entry, const TransparencyLogInstance &tlog) const
  {
    const auto &signed_entry_timestamp = entry.inclusion_promise().signed_entry_timestamp();
    if (signed_entry_timestamp.empty())
      {
        return false;
      }

    auto payload = fmt::format(R"({{"body":"{}","integratedTime":{},"logID":"{}","logIndex":{}}})",
                               attest::utils::Base64::encode(entry.canonicalized_body()),
                               entry.integrated_time(),
                               attest::utils::Hex::encode(entry.log_id().key_id()),
                               entry.log_index());

    auto valid = tlog.public_key->verify_signature(payload, signed_entry_timestamp);
    if (!valid || !valid.value())
      {
        logger_->warn("Signed entry timestamp of entry {} does not verify", entry.log_index());
        return false;
      }
    return true;
  }

  // =============================================================================
  // Integrated time
  // =============================================================================

  outcome::std_result<void> TransparencyLogVerifier::verify_integrated_time(const v1::TransparencyLogEntry &entry,
                                                                            const Certificate &certificate) const
  {
    auto integrated_time = std::chrono::system_clock::time_point{std::chrono::seconds{entry.integrated_time()}};

    if (integrated_time > std::chrono::system_clock::now() + MAX_CLOCK_SKEW)
      {
        logger_->error("Integrated time {} lies in the future", entry.integrated_time());
        return SigstoreError::InvalidTransparencyLog;
      }

    auto valid = certificate.is_valid_at_time(integrated_time);
    if (!valid)
      {
        return valid.error();
      }
    if (!valid.value())
      {
        logger_->error("Certificate was not valid at integrated time {}", entry.integrated_time());
        return SigstoreError::InvalidTransparencyLog;
      }
    return outcome::success();
  }

} // namespace attest::sigstore
