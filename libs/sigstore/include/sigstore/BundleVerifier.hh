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

#ifndef ATTEST_SIGSTORE_BUNDLE_VERIFIER_HH
#define ATTEST_SIGSTORE_BUNDLE_VERIFIER_HH

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>

#include "sigstore/TrustedRoot.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore::v1
{
  class Bundle;
} // namespace attest::sigstore::v1

namespace attest::sigstore
{
  struct VerificationPolicy
  {
    // Hex sha256 of the artifact the bundle must be bound to, in either case.
    std::string artifact_digest_sha256;
    std::size_t required_signed_certificate_timestamps = 1;
    std::size_t required_observer_timestamps = 1;
    std::size_t required_transparency_log_entries = 1;
  };

  struct VerifiedLogEntry
  {
    std::int64_t log_index = 0;
    std::string log_id; // hex
    std::chrono::system_clock::time_point integrated_time;
    bool inclusion_proof_verified = false;
    bool inclusion_promise_verified = false;
  };

  struct BundleVerificationResult
  {
    std::string certificate_subject;
    std::string certificate_issuer;
    std::string key_fingerprint;
    std::vector<VerifiedLogEntry> log_entries;
    std::vector<std::chrono::system_clock::time_point> timestamps;
    std::size_t signed_certificate_timestamps = 0;
  };

  // Offline verification of a Sigstore bundle against a trusted root.
  class BundleVerifier
  {
  public:
    explicit BundleVerifier(std::shared_ptr<const TrustedRoot> trusted_root);
    ~BundleVerifier();

    BundleVerifier(const BundleVerifier &) = delete;
    BundleVerifier &operator=(const BundleVerifier &) = delete;
    BundleVerifier(BundleVerifier &&) noexcept;
    BundleVerifier &operator=(BundleVerifier &&) noexcept;

    outcome::std_result<BundleVerificationResult> verify(const v1::Bundle &bundle, const VerificationPolicy &policy) const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_BUNDLE_VERIFIER_HH
