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

#include "sigstore/PublicKey.hh"

#include <array>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include "sigstore/SigstoreErrors.hh"
#include "utils/Hex.hh"

namespace attest::sigstore
{
  namespace
  {
    const EVP_MD *to_evp_md(DigestAlgorithm digest_algorithm)
    {
      switch (digest_algorithm)
        {
        case DigestAlgorithm::SHA256:
          return EVP_sha256();
        case DigestAlgorithm::SHA384:
          return EVP_sha384();
        case DigestAlgorithm::SHA512:
          return EVP_sha512();
        case DigestAlgorithm::SHA1:
          return EVP_sha1();
        }
      return nullptr;
    }

    std::string openssl_error()
    {
      std::array<char, 256> buf{};
      ERR_error_string_n(ERR_get_error(), buf.data(), buf.size());
      return buf.data();
    }

    using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;

    BioPtr memory_bio(const std::string &data)
    {
      return BioPtr(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), BIO_free);
    }
  } // namespace

  PublicKey::PublicKey(std::unique_ptr<EVP_PKEY, EVPKeyDeleter> evp_key)
    : evp_key_(std::move(evp_key))
  {
  }

  outcome::std_result<PublicKey> PublicKey::from_pem(const std::string &key_pem)
  {
    auto bio = memory_bio(key_pem);
    if (!bio)
      {
        return SigstoreError::SystemError;
      }
    return from_evp_key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
  }

  outcome::std_result<PublicKey> PublicKey::from_der(const std::string &key_der)
  {
    auto bio = memory_bio(key_der);
    if (!bio)
      {
        return SigstoreError::SystemError;
      }
    return from_evp_key(d2i_PUBKEY_bio(bio.get(), nullptr));
  }

  outcome::std_result<PublicKey> PublicKey::from_ed25519(const std::string &raw_key)
  {
    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    const auto *data = reinterpret_cast<const unsigned char *>(raw_key.data());
    return from_evp_key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, data, raw_key.size()));
  }

  outcome::std_result<PublicKey> PublicKey::from_evp_key(EVP_PKEY *evp_key)
  {
    if (evp_key == nullptr)
      {
        ERR_clear_error();
        return SigstoreError::InvalidPublicKey;
      }
    return PublicKey(std::unique_ptr<EVP_PKEY, EVPKeyDeleter>(evp_key));
  }

  EVP_PKEY *PublicKey::get() const
  {
    return evp_key_.get();
  }

  KeyAlgorithm PublicKey::get_algorithm() const
  {
    if (!evp_key_)
      {
        return KeyAlgorithm::Unknown;
      }

    switch (EVP_PKEY_get_base_id(evp_key_.get()))
      {
      case EVP_PKEY_RSA:
      case EVP_PKEY_RSA_PSS:
        return KeyAlgorithm::RSA;
      case EVP_PKEY_EC:
        return KeyAlgorithm::ECDSA;
      case EVP_PKEY_ED25519:
      case EVP_PKEY_ED448:
        return KeyAlgorithm::EdDSA;
      default:
        return KeyAlgorithm::Unknown;
      }
  }

  std::string PublicKey::get_algorithm_name() const
  {
    switch (get_algorithm())
      {
      case KeyAlgorithm::RSA:
        return "RSA";
      case KeyAlgorithm::ECDSA:
        return "ECDSA";
      case KeyAlgorithm::EdDSA:
        return "EdDSA";
      case KeyAlgorithm::Unknown:
      default:
        return "Unknown";
      }
  }

  std::string PublicKey::to_der() const
  {
    if (!evp_key_)
      {
        return {};
      }

    unsigned char *der = nullptr;
    int len = i2d_PUBKEY(evp_key_.get(), &der);
    if (len <= 0)
      {
        return {};
      }

    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    std::string result(reinterpret_cast<const char *>(der), static_cast<std::size_t>(len));
    OPENSSL_free(der);
    return result;
  }

  std::string PublicKey::fingerprint() const
  {
    auto der = to_der();
    if (der.empty())
      {
        return {};
      }
    return sha256_hex(der);
  }

  std::optional<DigestAlgorithm> PublicKey::default_digest() const
  {
    switch (get_algorithm())
      {
      case KeyAlgorithm::EdDSA:
        return std::nullopt;

      case KeyAlgorithm::ECDSA:
        {
          constexpr int P384_BITS = 384;
          int bits = EVP_PKEY_get_bits(evp_key_.get());
          if (bits > P384_BITS)
            {
              return DigestAlgorithm::SHA512;
            }
          if (bits == P384_BITS)
            {
              return DigestAlgorithm::SHA384;
            }
          return DigestAlgorithm::SHA256;
        }

      default:
        return DigestAlgorithm::SHA256;
      }
  }

  outcome::std_result<bool> PublicKey::verify_with_padding(const std::string &data,
                                                           const std::string &signature,
                                                           const EVP_MD *md,
                                                           int padding) const
  {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx)
      {
        logger_->error("Failed to create EVP_MD_CTX");
        return SigstoreError::SystemError;
      }

    EVP_PKEY_CTX *pkey_ctx = nullptr;
    if (EVP_DigestVerifyInit(ctx.get(), &pkey_ctx, md, nullptr, evp_key_.get()) != 1)
      {
        logger_->error("Failed to initialize signature verification: {}", openssl_error());
        return SigstoreError::SystemError;
      }

    if (padding != 0)
      {
        if (EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, padding) != 1)
          {
            logger_->error("Failed to set RSA padding: {}", openssl_error());
            return SigstoreError::SystemError;
          }
        if (padding == RSA_PKCS1_PSS_PADDING && EVP_PKEY_CTX_set_rsa_pss_saltlen(pkey_ctx, RSA_PSS_SALTLEN_AUTO) != 1)
          {
            logger_->error("Failed to set RSA PSS salt length: {}", openssl_error());
            return SigstoreError::SystemError;
          }
      }

    // NOLINTBEGIN: OpenSSL API requires binary data conversion
    int result = EVP_DigestVerify(ctx.get(),
                                  reinterpret_cast<const unsigned char *>(signature.data()),
                                  signature.size(),
                                  reinterpret_cast<const unsigned char *>(data.data()),
                                  data.size());
    // NOLINTEND

    if (result == 1)
      {
        return true;
      }

    // A malformed signature (e.g. bad DER for ECDSA) is reported as a mismatch.
    ERR_clear_error();
    return false;
  }

  outcome::std_result<bool> PublicKey::verify_signature(const std::string &data, const std::string &signature) const
  {
    if (!evp_key_)
      {
        logger_->error("Cannot verify signature: no public key loaded");
        return SigstoreError::InvalidPublicKey;
      }

    auto digest = default_digest();
    if (!digest)
      {
        return verify_with_padding(data, signature, nullptr, 0);
      }
    return verify_signature(data, signature, *digest);
  }

  outcome::std_result<bool> PublicKey::verify_signature(const std::string &data,
                                                        const std::string &signature,
                                                        DigestAlgorithm digest_algorithm) const
  {
    if (!evp_key_)
      {
        logger_->error("Cannot verify signature: no public key loaded");
        return SigstoreError::InvalidPublicKey;
      }

    if (get_algorithm() == KeyAlgorithm::EdDSA)
      {
        return verify_with_padding(data, signature, nullptr, 0);
      }

    const EVP_MD *md = to_evp_md(digest_algorithm);
    if (get_algorithm() != KeyAlgorithm::RSA)
      {
        return verify_with_padding(data, signature, md, 0);
      }

    auto result = verify_with_padding(data, signature, md, RSA_PKCS1_PADDING);
    if (!result || result.value())
      {
        return result;
      }
    logger_->debug("PKCS#1 v1.5 verification failed, trying PSS");
    return verify_with_padding(data, signature, md, RSA_PKCS1_PSS_PADDING);
  }

  outcome::std_result<bool> PublicKey::verify_digest(const std::string &digest,
                                                     const std::string &signature,
                                                     DigestAlgorithm digest_algorithm) const
  {
    if (!evp_key_ || get_algorithm() == KeyAlgorithm::EdDSA)
      {
        logger_->error("Cannot verify a prehashed digest with key type {}", get_algorithm_name());
        return SigstoreError::InvalidPublicKey;
      }

    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(EVP_PKEY_CTX_new(evp_key_.get(), nullptr), EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_verify_init(ctx.get()) != 1
        || EVP_PKEY_CTX_set_signature_md(ctx.get(), to_evp_md(digest_algorithm)) != 1)
      {
        logger_->error("Failed to initialize digest verification: {}", openssl_error());
        return SigstoreError::SystemError;
      }

    // NOLINTBEGIN: OpenSSL API requires binary data conversion
    int result = EVP_PKEY_verify(ctx.get(),
                                 reinterpret_cast<const unsigned char *>(signature.data()),
                                 signature.size(),
                                 reinterpret_cast<const unsigned char *>(digest.data()),
                                 digest.size());
    // NOLINTEND
    ERR_clear_error();
    return result == 1;
  }

} // namespace attest::sigstore
