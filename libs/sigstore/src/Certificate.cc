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

#include "sigstore/Certificate.hh"

#include <ctime>
#include <utility>
#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include "sigstore/PublicKey.hh"
#include "sigstore/SigstoreErrors.hh"

namespace attest::sigstore
{
  namespace
  {
    constexpr const char *OIDC_ISSUER_V1_OID = "1.3.6.1.4.1.57264.1.1";
    constexpr const char *OIDC_ISSUER_V2_OID = "1.3.6.1.4.1.57264.1.8";

    std::string asn1_string_to_string(const ASN1_STRING *str)
    {
      if (str == nullptr)
        {
          return {};
        }
      const unsigned char *data = ASN1_STRING_get0_data(str);
      // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
      return {reinterpret_cast<const char *>(data), static_cast<std::size_t>(ASN1_STRING_length(str))};
    }

    std::string name_to_string(const X509_NAME *name)
    {
      if (name == nullptr)
        {
          return {};
        }
      char *text = X509_NAME_oneline(name, nullptr, 0);
      std::string result = text != nullptr ? text : "";
      OPENSSL_free(text);
      return result;
    }

    std::string find_general_name(X509 *cert, int type)
    {
      auto *san_names = static_cast<STACK_OF(GENERAL_NAME) *>(X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
      if (san_names == nullptr)
        {
          return {};
        }

      std::string value;
      for (int i = 0; i < sk_GENERAL_NAME_num(san_names); i++)
        {
          GENERAL_NAME *san = sk_GENERAL_NAME_value(san_names, i);
          if (san != nullptr && san->type == type)
            {
              // NOLINTNEXTLINE: OpenSSL API
              value = asn1_string_to_string(san->d.ia5);
              break;
            }
        }

      sk_GENERAL_NAME_pop_free(san_names, GENERAL_NAME_free);
      return value;
    }

    outcome::std_result<std::chrono::system_clock::time_point> asn1_time_to_time_point(const ASN1_TIME *time)
    {
      if (time == nullptr)
        {
          return SigstoreError::InvalidCertificate;
        }

      struct tm tm_time = {};
      if (ASN1_TIME_to_tm(time, &tm_time) != 1)
        {
          return SigstoreError::InvalidCertificate;
        }

      return std::chrono::system_clock::from_time_t(timegm(&tm_time));
    }
  } // namespace

  Certificate::Certificate(std::unique_ptr<X509, decltype(&X509_free)> x509_cert)
    : x509_cert_(std::move(x509_cert))
  {
  }

  X509 *Certificate::get() const
  {
    return x509_cert_.get();
  }

  outcome::std_result<Certificate> Certificate::from_pem(const std::string &cert_pem)
  {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(cert_pem.data(), static_cast<int>(cert_pem.size())), BIO_free);
    if (!bio)
      {
        return SigstoreError::SystemError;
      }

    X509 *cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (cert == nullptr)
      {
        return SigstoreError::InvalidCertificate;
      }
    return Certificate(std::unique_ptr<X509, decltype(&X509_free)>(cert, X509_free));
  }

  outcome::std_result<Certificate> Certificate::from_der(const std::string &cert_der)
  {
    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    const auto *data = reinterpret_cast<const unsigned char *>(cert_der.data());
    X509 *cert = d2i_X509(nullptr, &data, static_cast<long>(cert_der.size()));
    if (cert == nullptr)
      {
        return SigstoreError::InvalidCertificate;
      }
    return Certificate(std::unique_ptr<X509, decltype(&X509_free)>(cert, X509_free));
  }

  std::string Certificate::to_der() const
  {
    unsigned char *der = nullptr;
    int len = i2d_X509(get(), &der);
    if (len <= 0)
      {
        return {};
      }
    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    std::string result(reinterpret_cast<const char *>(der), static_cast<std::size_t>(len));
    OPENSSL_free(der);
    return result;
  }

  std::string Certificate::subject_name() const
  {
    return name_to_string(X509_get_subject_name(get()));
  }

  std::string Certificate::issuer_name() const
  {
    return name_to_string(X509_get_issuer_name(get()));
  }

  bool Certificate::is_self_signed() const
  {
    X509 *cert = get();

    X509_NAME *issuer = X509_get_issuer_name(cert);
    X509_NAME *subject = X509_get_subject_name(cert);
    if (issuer == nullptr || subject == nullptr || X509_NAME_cmp(issuer, subject) != 0)
      {
        return false;
      }

    EVP_PKEY *pkey = X509_get0_pubkey(cert);
    return pkey != nullptr && X509_verify(cert, pkey) == 1;
  }

  bool Certificate::is_ca() const
  {
    return X509_check_ca(get()) > 0;
  }

  bool Certificate::has_code_signing_usage() const
  {
    X509 *cert = get();

    uint32_t key_usage = X509_get_key_usage(cert);
    if ((key_usage & KU_DIGITAL_SIGNATURE) == 0)
      {
        logger_->debug("certificate lacks the digitalSignature key usage");
        return false;
      }

    uint32_t extended_key_usage = X509_get_extended_key_usage(cert);
    if ((extended_key_usage & XKU_CODE_SIGN) == 0)
      {
        logger_->debug("certificate lacks the codeSigning extended key usage");
        return false;
      }
    return true;
  }

  std::string Certificate::subject_email() const
  {
    return find_general_name(get(), GEN_EMAIL);
  }

  std::string Certificate::subject_uri() const
  {
    return find_general_name(get(), GEN_URI);
  }

  std::string Certificate::oidc_issuer() const
  {
    X509 *cert = get();

    for (const auto &[oid_text, der_encoded]: {std::pair{OIDC_ISSUER_V2_OID, true}, std::pair{OIDC_ISSUER_V1_OID, false}})
      {
        std::unique_ptr<ASN1_OBJECT, decltype(&ASN1_OBJECT_free)> oid(OBJ_txt2obj(oid_text, 1), ASN1_OBJECT_free);
        if (!oid)
          {
            logger_->error("Failed to create OID object for {}", oid_text);
            continue;
          }

        int ext_idx = X509_get_ext_by_OBJ(cert, oid.get(), -1);
        if (ext_idx < 0)
          {
            continue;
          }

        ASN1_OCTET_STRING *ext_data = X509_EXTENSION_get_data(X509_get_ext(cert, ext_idx));
        if (ext_data == nullptr)
          {
            continue;
          }

        if (!der_encoded)
          {
            return asn1_string_to_string(ext_data);
          }

        // The v2 extension holds a DER encoded UTF8String.
        const unsigned char *data = ASN1_STRING_get0_data(ext_data);
        std::unique_ptr<ASN1_UTF8STRING, decltype(&ASN1_UTF8STRING_free)> value(
          d2i_ASN1_UTF8STRING(nullptr, &data, ASN1_STRING_length(ext_data)),
          ASN1_UTF8STRING_free);
        if (value)
          {
            return asn1_string_to_string(value.get());
          }
      }

    logger_->debug("OIDC issuer extension not found in certificate");
    return {};
  }

  outcome::std_result<std::chrono::system_clock::time_point> Certificate::get_not_before() const
  {
    auto result = asn1_time_to_time_point(X509_get0_notBefore(get()));
    if (!result)
      {
        logger_->error("Failed to convert certificate notBefore time");
      }
    return result;
  }

  outcome::std_result<std::chrono::system_clock::time_point> Certificate::get_not_after() const
  {
    auto result = asn1_time_to_time_point(X509_get0_notAfter(get()));
    if (!result)
      {
        logger_->error("Failed to convert certificate notAfter time");
      }
    return result;
  }

  outcome::std_result<bool> Certificate::is_valid_at_time(const std::chrono::system_clock::time_point &timestamp) const
  {
    auto not_before_result = get_not_before();
    if (!not_before_result)
      {
        return not_before_result.error();
      }
    auto not_after_result = get_not_after();
    if (!not_after_result)
      {
        return not_after_result.error();
      }

    auto not_before = not_before_result.value();
    auto not_after = not_after_result.value();
    bool valid = (timestamp >= not_before && timestamp <= not_after);
    if (!valid)
      {
        logger_->debug("Certificate not valid at timestamp {}: valid from {} to {}",
                       std::chrono::system_clock::to_time_t(timestamp),
                       std::chrono::system_clock::to_time_t(not_before),
                       std::chrono::system_clock::to_time_t(not_after));
      }
    return valid;
  }

  outcome::std_result<PublicKey> Certificate::get_public_key() const
  {
    if (!x509_cert_)
      {
        logger_->error("Cannot extract public key: no certificate loaded");
        return SigstoreError::InvalidCertificate;
      }

    EVP_PKEY *pkey = X509_get_pubkey(x509_cert_.get());
    if (pkey == nullptr)
      {
        logger_->error("Failed to extract public key from certificate");
        return SigstoreError::InvalidCertificate;
      }

    return PublicKey::from_evp_key(pkey);
  }

  outcome::std_result<bool> Certificate::verify_signature(const std::string &data, const std::string &signature) const
  {
    auto public_key_result = get_public_key();
    if (!public_key_result)
      {
        return public_key_result.error();
      }
    return public_key_result.value().verify_signature(data, signature);
  }

  bool Certificate::operator==(const Certificate &other) const
  {
    return X509_cmp(get(), other.get()) == 0;
  }

  bool Certificate::operator!=(const Certificate &other) const
  {
    return !(*this == other);
  }

} // namespace attest::sigstore
