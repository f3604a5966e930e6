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

#ifndef DSSE_VERIFIER_HH
#define DSSE_VERIFIER_HH

#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "attest/Model.hh"
#include "SigningKeyResolver.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

class DsseVerifier
{
public:
  virtual ~DsseVerifier() = default;

  // Sets the signature status of result. Only unusable key material is an error.
  virtual outcome::std_result<void> verify(const std::string &subject_sha256,
                                           const attest::EvidenceMetadata *evidence,
                                           attest::EvidenceVerification *result) = 0;
};

class DsseSignatureVerifier : public DsseVerifier
{
public:
  DsseSignatureVerifier(std::vector<std::string> key_paths,
                        bool use_artifactory_keys,
                        std::shared_ptr<SigningKeyResolver> key_resolver);

  outcome::std_result<void> verify(const std::string &subject_sha256,
                                   const attest::EvidenceMetadata *evidence,
                                   attest::EvidenceVerification *result) override;

private:
  outcome::std_result<const PublicKeys *> get_local_keys();
  outcome::std_result<PublicKeys> load_local_keys() const;
  bool verify_envelope(const PublicKeys &keys, const attest::sigstore::DsseEnvelope &envelope, attest::VerificationResult &result) const;

private:
  static constexpr const char *NO_MATCHING_KEY = "no matching key found for envelope signatures";

  std::vector<std::string> key_paths;
  bool use_artifactory_keys;
  std::shared_ptr<SigningKeyResolver> key_resolver;
  std::once_flag local_keys_once;
  PublicKeys local_keys;
  std::error_code local_keys_error;
  std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:core:dsse")};
};

#endif // DSSE_VERIFIER_HH
