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

#ifndef EVIDENCE_PARSER_HH
#define EVIDENCE_PARSER_HH

#include <memory>
#include <string>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "attest/BlobFetcher.hh"
#include "attest/Model.hh"
#include "sigstore/BundleLoader.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

class EvidenceParser
{
public:
  virtual ~EvidenceParser() = default;

  // Downloads the evidence file and stores the decoded envelope or bundle in result.
  virtual outcome::std_result<void> parse_evidence(const attest::EvidenceMetadata *evidence, attest::EvidenceVerification *result) = 0;
};

class RemoteEvidenceParser : public EvidenceParser
{
public:
  explicit RemoteEvidenceParser(std::shared_ptr<attest::BlobFetcher> blob_fetcher);

  outcome::std_result<void> parse_evidence(const attest::EvidenceMetadata *evidence, attest::EvidenceVerification *result) override;

  // Classifies content as a Sigstore bundle, then as a DSSE envelope.
  bool decode(const std::string &content, attest::EvidenceVerification &result) const;

private:
  bool try_parse_sigstore_bundle(const std::string &content, attest::EvidenceVerification &result) const;
  bool try_parse_dsse_envelope(const std::string &content, attest::EvidenceVerification &result) const;

private:
  std::shared_ptr<attest::BlobFetcher> blob_fetcher;
  attest::sigstore::BundleLoader loader;
  std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:core:parser")};
};

#endif // EVIDENCE_PARSER_HH
