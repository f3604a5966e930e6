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

#ifndef SIGNING_KEY_RESOLVER_HH
#define SIGNING_KEY_RESOLVER_HH

#include <memory>
#include <vector>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "attest/Model.hh"
#include "sigstore/PublicKey.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

using PublicKeys = std::vector<std::shared_ptr<const attest::sigstore::PublicKey>>;

// Resolves the signing keys the repository stores for an evidence record.
class SigningKeyResolver
{
public:
  virtual ~SigningKeyResolver() = default;

  virtual outcome::std_result<PublicKeys> resolve(const attest::EvidenceMetadata &evidence) = 0;
};

class RepositorySigningKeyResolver : public SigningKeyResolver
{
public:
  // An empty key yields no keys; an undecodable key is an error.
  outcome::std_result<PublicKeys> resolve(const attest::EvidenceMetadata &evidence) override;

private:
  std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:core:key_resolver")};
};

#endif // SIGNING_KEY_RESOLVER_HH
