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

#ifndef ATTEST_EVIDENCE_VERIFIER_HH
#define ATTEST_EVIDENCE_VERIFIER_HH

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>

#include "attest/BlobFetcher.hh"
#include "attest/Model.hh"
#include "attest/ProgressSink.hh"
#include "sigstore/TrustedRootProvider.hh"

namespace attest
{
  namespace outcome = boost::outcome_v2;

  struct VerifierConfig
  {
    // PEM public key files tried before any repository key.
    std::vector<std::string> key_paths;
    bool use_artifactory_keys = true;
    std::size_t required_signed_certificate_timestamps = 1;
    std::size_t required_observer_timestamps = 1;
    std::size_t required_transparency_log_entries = 1;
  };

  class EvidenceVerifier
  {
  public:
    virtual ~EvidenceVerifier() = default;

    static std::shared_ptr<EvidenceVerifier> create(VerifierConfig config,
                                                    std::shared_ptr<BlobFetcher> blob_fetcher,
                                                    std::shared_ptr<sigstore::TrustedRootProvider> trusted_root_provider);

    // Verifies every evidence record against the subject. Fails on an empty
    // list or when a record cannot be read; verification failures are
    // reported in the response.
    virtual outcome::std_result<VerificationResponse> verify(const std::string &subject_sha256,
                                                             const std::vector<EvidenceMetadata> &evidence_metadata,
                                                             const std::string &subject_path) = 0;

    virtual void set_progress_sink(std::shared_ptr<ProgressSink> progress_sink) = 0;
  };
} // namespace attest

#endif // ATTEST_EVIDENCE_VERIFIER_HH
