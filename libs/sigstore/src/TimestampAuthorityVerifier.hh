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

#ifndef ATTEST_SIGSTORE_TIMESTAMP_AUTHORITY_VERIFIER_HH
#define ATTEST_SIGSTORE_TIMESTAMP_AUTHORITY_VERIFIER_HH

#include <chrono>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "sigstore/TrustedRoot.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  // Verifies RFC 3161 timestamp responses against the timestamp authorities of a trusted root.
  class TimestampAuthorityVerifier
  {
  public:
    explicit TimestampAuthorityVerifier(const TrustedRoot &trusted_root);

    // Returns the generation time of a DER encoded TimeStampResp whose message
    // imprint covers signature and whose signer chains to a trusted authority.
    outcome::std_result<std::chrono::system_clock::time_point> verify(const std::string &signed_timestamp,
                                                                      const std::string &signature) const;

  private:
    const TrustedRoot &trusted_root_;
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:tsa_verifier")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_TIMESTAMP_AUTHORITY_VERIFIER_HH
