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

#ifndef ATTEST_SIGSTORE_TRANSPARENCY_LOG_VERIFIER_HH
#define ATTEST_SIGSTORE_TRANSPARENCY_LOG_VERIFIER_HH

#include <chrono>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "CanonicalBodyParser.hh"
#include "CheckpointParser.hh"
#include "MerkleTreeValidator.hh"
#include "RFC6962Hasher.hh"
#include "sigstore/BundleVerifier.hh"
#include "sigstore/Certificate.hh"
#include "sigstore/TrustedRoot.hh"
#include "utils/Logging.hh"

#include "sigstore_bundle.pb.h"
#include "sigstore_rekor.pb.h"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  class TransparencyLogVerifier
  {
  public:
    static constexpr std::chrono::seconds MAX_CLOCK_SKEW{300};

    explicit TransparencyLogVerifier(const TrustedRoot &trusted_root);

    // Fails with InvalidTransparencyLog unless the entry belongs to a trusted
    // log, is consistent with the bundle and has a valid inclusion proof or
    // inclusion promise.
    outcome::std_result<VerifiedLogEntry> verify(const v1::TransparencyLogEntry &entry,
                                                 const v1::Bundle &bundle,
                                                 const Certificate &certificate) const;

  private:
    outcome::std_result<void> verify_body_consistency(const v1::TransparencyLogEntry &entry,
                                                      const v1::Bundle &bundle,
                                                      const Certificate &certificate) const;
    outcome::std_result<void> verify_hashed_rekord(const HashedRekord &rekord,
                                                   const v1::Bundle &bundle,
                                                   const Certificate &certificate) const;
    outcome::std_result<void> verify_envelope_rekord(const std::string &payload_hash_algorithm,
                                                     const std::string &payload_hash,
                                                     const std::vector<RekordSignature> &signatures,
                                                     const v1::Bundle &bundle,
                                                     const Certificate &certificate) const;

    bool verify_inclusion_proof(const v1::TransparencyLogEntry &entry, const TransparencyLogInstance &tlog) const;
    bool verify_checkpoint(const v1::InclusionProof &proof, const TransparencyLogInstance &tlog) const;
    bool verify_inclusion_promise(const v1::TransparencyLogEntry &entry, const TransparencyLogInstance &tlog) const;

    outcome::std_result<void> verify_integrated_time(const v1::TransparencyLogEntry &entry, const Certificate &certificate) const;

  private:
    const TrustedRoot &trusted_root_;
    RFC6962Hasher hasher_;
    MerkleTreeValidator merkle_validator_;
    CheckpointParser checkpoint_parser_;
    CanonicalBodyParser body_parser_;
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:tlog_verifier")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_TRANSPARENCY_LOG_VERIFIER_HH
