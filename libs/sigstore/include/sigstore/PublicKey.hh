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

#ifndef ATTEST_SIGSTORE_PUBLIC_KEY_HH
#define ATTEST_SIGSTORE_PUBLIC_KEY_HH

#include <memory>
#include <optional>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>
#include <openssl/evp.h>

#include "utils/Logging.hh"
#include "sigstore/CryptographicAlgorithms.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  class PublicKey
  {
  private:
    struct EVPKeyDeleter
    {
      void operator()(EVP_PKEY *key) const
      {
        if (key != nullptr)
          {
            EVP_PKEY_free(key);
          }
      }
    };

  public:
    explicit PublicKey(std::unique_ptr<EVP_PKEY, EVPKeyDeleter> evp_key);
    PublicKey() = delete;
    PublicKey(PublicKey &&other) noexcept = default;
    PublicKey &operator=(PublicKey &&other) noexcept = default;
    PublicKey(const PublicKey &) = delete;
    PublicKey &operator=(const PublicKey &) = delete;
    ~PublicKey() = default;

    static outcome::std_result<PublicKey> from_pem(const std::string &key_pem);
    static outcome::std_result<PublicKey> from_der(const std::string &key_der);

    // 32 byte raw Ed25519 public key.
    static outcome::std_result<PublicKey> from_ed25519(const std::string &raw_key);

    // Takes ownership of evp_key.
    static outcome::std_result<PublicKey> from_evp_key(EVP_PKEY *evp_key);

    EVP_PKEY *get() const;
    KeyAlgorithm get_algorithm() const;
    std::string get_algorithm_name() const;

    // DER encoded SubjectPublicKeyInfo.
    std::string to_der() const;

    // Lowercase hex sha256 of the DER encoded SubjectPublicKeyInfo.
    std::string fingerprint() const;

    // Digest implied by the key: SHA384 for P-384, SHA512 for P-521,
    // SHA256 otherwise. nullopt for EdDSA which signs the message directly.
    std::optional<DigestAlgorithm> default_digest() const;

    // Verifies a signature over data using the digest implied by the key.
    // RSA signatures are accepted with either PKCS#1 v1.5 or PSS padding.
    outcome::std_result<bool> verify_signature(const std::string &data, const std::string &signature) const;

    outcome::std_result<bool> verify_signature(const std::string &data,
                                               const std::string &signature,
                                               DigestAlgorithm digest_algorithm) const;

    // Verifies a signature over an already computed digest. Not supported for EdDSA.
    outcome::std_result<bool> verify_digest(const std::string &digest,
                                            const std::string &signature,
                                            DigestAlgorithm digest_algorithm) const;

  private:
    outcome::std_result<bool> verify_with_padding(const std::string &data,
                                                  const std::string &signature,
                                                  const EVP_MD *md,
                                                  int padding) const;

  private:
    std::unique_ptr<EVP_PKEY, EVPKeyDeleter> evp_key_{nullptr};
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:publickey")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_PUBLIC_KEY_HH
