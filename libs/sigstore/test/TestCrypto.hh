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

#ifndef ATTEST_SIGSTORE_TEST_CRYPTO_HH
#define ATTEST_SIGSTORE_TEST_CRYPTO_HH

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <openssl/evp.h>
#include <openssl/x509.h>

#include "sigstore_bundle.pb.h"

namespace attest::test
{
  namespace v1 = attest::sigstore::v1;

  // ECDSA P-256 key pair generated at runtime.
  class TestKey
  {
  public:
    static TestKey generate();

    EVP_PKEY *get() const;
    std::string public_key_pem() const;
    std::string public_key_der() const;

    // ECDSA with SHA-256, DER encoded.
    std::string sign(const std::string &data) const;

  private:
    std::shared_ptr<EVP_PKEY> key;
  };

  class TestCertificate
  {
  public:
    explicit TestCertificate(std::shared_ptr<X509> x509);

    X509 *get() const;
    std::string der() const;
    std::string pem() const;

  private:
    std::shared_ptr<X509> x509;
  };

  struct LeafOptions
  {
    std::string email = "signer@example.com";
    bool code_signing = true;
    std::chrono::seconds not_before{-3600};
    std::chrono::seconds not_after{3600};
  };

  TestCertificate create_ca_certificate(const TestKey &key, const std::string &common_name);
  TestCertificate create_leaf_certificate(const TestKey &key,
                                          const TestKey &issuer_key,
                                          const TestCertificate &issuer,
                                          const LeafOptions &options = {});

  std::string in_toto_statement(const std::string &subject_sha256);

  // A complete Sigstore deployment: Fulcio style CA, signing certificate and a Rekor log key.
  class TestSigstore
  {
  public:
    explicit TestSigstore(const LeafOptions &leaf_options = {});

    std::string trusted_root_json() const;

    // DSSE bundle over an in-toto statement for subject_sha256, with one
    // transparency log entry carrying a signed entry timestamp.
    std::shared_ptr<v1::Bundle> create_dsse_bundle(const std::string &subject_sha256) const;

    // Message signature bundle over artifact, logged as a hashedrekord.
    std::shared_ptr<v1::Bundle> create_message_signature_bundle(const std::string &artifact) const;

    std::string bundle_json(const v1::Bundle &bundle) const;

    const TestKey &get_leaf_key() const;
    const TestCertificate &get_leaf_certificate() const;
    const TestKey &get_log_key() const;
    const std::string &get_log_id() const;

    std::int64_t integrated_time = 0;

  private:
    void add_log_entry(v1::Bundle &bundle, const std::string &kind, const std::string &body) const;

  private:
    TestKey ca_key;
    TestCertificate ca_certificate;
    TestKey leaf_key;
    TestCertificate leaf_certificate;
    TestKey log_key;
    std::string log_id;
  };
} // namespace attest::test

#endif // ATTEST_SIGSTORE_TEST_CRYPTO_HH
