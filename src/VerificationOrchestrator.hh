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

#ifndef VERIFICATION_ORCHESTRATOR_HH
#define VERIFICATION_ORCHESTRATOR_HH

#include <memory>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "attest/EvidenceVerifier.hh"
#include "attest/Model.hh"
#include "attest/ProgressSink.hh"
#include "DsseVerifier.hh"
#include "EvidenceParser.hh"
#include "SigstoreVerifier.hh"
#include "utils/Logging.hh"

class VerificationOrchestrator : public attest::EvidenceVerifier
{
public:
  VerificationOrchestrator(std::shared_ptr<EvidenceParser> parser,
                           std::shared_ptr<DsseVerifier> dsse_verifier,
                           std::shared_ptr<SigstoreVerifier> sigstore_verifier);

  outcome::std_result<attest::VerificationResponse> verify(const std::string &subject_sha256,
                                                           const std::vector<attest::EvidenceMetadata> &evidence_metadata,
                                                           const std::string &subject_path) override;

  void set_progress_sink(std::shared_ptr<attest::ProgressSink> progress_sink) override;

private:
  outcome::std_result<void> verify_evidence(const std::string &subject_sha256,
                                            const attest::EvidenceMetadata &evidence,
                                            attest::EvidenceVerification &result);

private:
  std::shared_ptr<EvidenceParser> parser;
  std::shared_ptr<DsseVerifier> dsse_verifier;
  std::shared_ptr<SigstoreVerifier> sigstore_verifier;
  std::shared_ptr<attest::ProgressSink> progress_sink;
  std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:core:verifier")};
};

#endif // VERIFICATION_ORCHESTRATOR_HH
