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

#ifndef ATTEST_SIGSTORE_TRUSTED_ROOT_HH
#define ATTEST_SIGSTORE_TRUSTED_ROOT_HH

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>

#include "sigstore/Certificate.hh"
#include "sigstore/PublicKey.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  struct ValidityPeriod
  {
    std::optional<std::chrono::system_clock::time_point> start;
    std::optional<std::chrono::system_clock::time_point> end;

    bool contains(std::chrono::system_clock::time_point tp) const;
  };

  // A transparency log (Rekor) or certificate transparency log instance.
  struct TransparencyLogInstance
  {
    std::string base_url;
    std::string log_id; // raw key id bytes
    std::shared_ptr<const PublicKey> public_key;
    ValidityPeriod valid_for;
  };

  // A certificate authority (Fulcio) or timestamp authority.
  struct CertificateAuthority
  {
    std::string uri;
    std::vector<std::shared_ptr<const Certificate>> chain; // leaf-most first, root last
    ValidityPeriod valid_for;
  };

  // Sigstore trusted root (application/vnd.dev.sigstore.trustedroot+json).
  class TrustedRoot
  {
  public:
    static outcome::std_result<std::shared_ptr<const TrustedRoot>> from_json(const std::string &json);
    static outcome::std_result<std::shared_ptr<const TrustedRoot>> from_file(const std::filesystem::path &path);

    const std::vector<TransparencyLogInstance> &tlogs() const;
    const std::vector<TransparencyLogInstance> &ctlogs() const;
    const std::vector<CertificateAuthority> &certificate_authorities() const;
    const std::vector<CertificateAuthority> &timestamp_authorities() const;

    const TransparencyLogInstance *find_tlog(const std::string &log_id) const;
    const TransparencyLogInstance *find_ctlog(const std::string &log_id) const;

  private:
    std::vector<TransparencyLogInstance> tlogs_;
    std::vector<TransparencyLogInstance> ctlogs_;
    std::vector<CertificateAuthority> certificate_authorities_;
    std::vector<CertificateAuthority> timestamp_authorities_;
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_TRUSTED_ROOT_HH
