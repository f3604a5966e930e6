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

#ifndef ATTEST_SIGSTORE_CERTIFICATE_HH
#define ATTEST_SIGSTORE_CERTIFICATE_HH

#include <chrono>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>
#include <openssl/x509.h>

#include "utils/Logging.hh"
#include "sigstore/CryptographicAlgorithms.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  class PublicKey;

  class Certificate
  {
  public:
    explicit Certificate(std::unique_ptr<X509, decltype(&X509_free)> x509_cert);
    Certificate() = delete;

    Certificate(Certificate &&other) noexcept = default;
    Certificate &operator=(Certificate &&other) noexcept = default;
    Certificate(const Certificate &) = delete;
    Certificate &operator=(const Certificate &) = delete;
    ~Certificate() = default;

    X509 *get() const;

    static outcome::std_result<Certificate> from_pem(const std::string &cert_pem);
    static outcome::std_result<Certificate> from_der(const std::string &cert_der);

    std::string to_der() const;
    std::string subject_name() const;
    std::string issuer_name() const;

    // First e-mail or URI subject alternative name.
    std::string subject_email() const;
    std::string subject_uri() const;

    // Fulcio OIDC issuer extension (1.3.6.1.4.1.57264.1.8, falling back to the deprecated .1.1).
    std::string oidc_issuer() const;

    bool is_self_signed() const;
    bool is_ca() const;
    bool has_code_signing_usage() const;

    outcome::std_result<std::chrono::system_clock::time_point> get_not_before() const;
    outcome::std_result<std::chrono::system_clock::time_point> get_not_after() const;
    outcome::std_result<bool> is_valid_at_time(const std::chrono::system_clock::time_point &timestamp) const;

    outcome::std_result<PublicKey> get_public_key() const;

    outcome::std_result<bool> verify_signature(const std::string &data, const std::string &signature) const;

    bool operator==(const Certificate &other) const;
    bool operator!=(const Certificate &other) const;

  private:
    std::unique_ptr<X509, decltype(&X509_free)> x509_cert_{nullptr, X509_free};
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:certificate")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_CERTIFICATE_HH
