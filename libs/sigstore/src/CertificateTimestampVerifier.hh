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

#ifndef ATTEST_SIGSTORE_CERTIFICATE_TIMESTAMP_VERIFIER_HH
#define ATTEST_SIGSTORE_CERTIFICATE_TIMESTAMP_VERIFIER_HH

#include <cstddef>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "sigstore/Certificate.hh"
#include "sigstore/TrustedRoot.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  // Verifies the signed certificate timestamps (RFC 6962) embedded in a precertificate.
  class CertificateTimestampVerifier
  {
  public:
    explicit CertificateTimestampVerifier(const TrustedRoot &trusted_root);

    // Returns the number of embedded SCTs that verify against a trusted CT log.
    outcome::std_result<std::size_t> verify(const Certificate &leaf, const Certificate &issuer) const;

  private:
    outcome::std_result<std::string> precert_tbs(const Certificate &leaf) const;

  private:
    const TrustedRoot &trusted_root_;
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:sct_verifier")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_CERTIFICATE_TIMESTAMP_VERIFIER_HH
