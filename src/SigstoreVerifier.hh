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

#ifndef SIGSTORE_VERIFIER_HH
#define SIGSTORE_VERIFIER_HH

#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "attest/EvidenceVerifier.hh"
#include "attest/Model.hh"
#include "sigstore/BundleVerifier.hh"
#include "sigstore/TrustedRootProvider.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

class SigstoreVerifier
{
public:
  virtual ~SigstoreVerifier() = default;

  // Sets the Sigstore status of result. Policy and signature failures are not errors.
  virtual outcome::std_result<void> verify(const std::string &subject_sha256, attest::EvidenceVerification *result) = 0;
};

class SigstoreBundleVerifier : public SigstoreVerifier
{
public:
  SigstoreBundleVerifier(const attest::VerifierConfig &config, std::shared_ptr<attest::sigstore::TrustedRootProvider> trusted_root_provider);

  outcome::std_result<void> verify(const std::string &subject_sha256, attest::EvidenceVerification *result) override;

private:
  outcome::std_result<const attest::sigstore::BundleVerifier *> get_bundle_verifier();

private:
  attest::sigstore::VerificationPolicy policy_template;
  std::shared_ptr<attest::sigstore::TrustedRootProvider> trusted_root_provider;
  std::once_flag trusted_root_once;
  std::unique_ptr<attest::sigstore::BundleVerifier> bundle_verifier;
  std::error_code trusted_root_error;
  std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:core:sigstore")};
};

#endif // SIGSTORE_VERIFIER_HH
