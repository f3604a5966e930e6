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

#include "CertificateTimestampVerifier.hh"

#include <chrono>
#include <openssl/ct.h>
#include <openssl/x509v3.h>

#include "sigstore/PublicKey.hh"
#include "sigstore/SigstoreErrors.hh"
#include "utils/Hex.hh"

namespace attest::sigstore
{
  namespace
  {
    constexpr unsigned char SIGNATURE_TYPE_CERTIFICATE_TIMESTAMP = 0;
    constexpr unsigned int ENTRY_TYPE_PRECERT = 1;

    void append_uint(std::string &out, std::uint64_t value, int bytes)
    {
      for (int i = bytes - 1; i >= 0; --i)
        {
          out.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
        }
    }

    std::string to_string(const unsigned char *data, std::size_t len)
    {
      // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
      return {reinterpret_cast<const char *>(data), len};
    }
  } // namespace

  CertificateTimestampVerifier::CertificateTimestampVerifier(const TrustedRoot &trusted_root)
    : trusted_root_(trusted_root)
  {
  }

  outcome::std_result<std::string> CertificateTimestampVerifier::precert_tbs(const Certificate &leaf) const
  {
    std::unique_ptr<X509, decltype(&X509_free)> precert(X509_dup(leaf.get()), X509_free);
    if (!precert)
      {
        return SigstoreError::SystemError;
      }

    int index = X509_get_ext_by_NID(precert.get(), NID_ct_precert_scts, -1);
    if (index >= 0)
      {
        X509_EXTENSION_free(X509_delete_ext(precert.get(), index));
      }

    unsigned char *der = nullptr;
    int len = i2d_re_X509_tbs(precert.get(), &der);
    if (len <= 0)
      {
        logger_->error("Failed to encode precertificate TBS");
        return SigstoreError::InvalidCertificate;
      }
    std::string tbs = to_string(der, static_cast<std::size_t>(len));
    OPENSSL_free(der);
    return tbs;
  }

  outcome::std_result<std::size_t> CertificateTimestampVerifier::verify(const Certificate &leaf, const Certificate &issuer) const
  {
    using SctList = std::unique_ptr<STACK_OF(SCT), void (*)(STACK_OF(SCT) *)>;
    SctList scts(static_cast<STACK_OF(SCT) *>(X509_get_ext_d2i(leaf.get(), NID_ct_precert_scts, nullptr, nullptr)),
                 [](STACK_OF(SCT) * list) { SCT_LIST_free(list); });
    if (!scts || sk_SCT_num(scts.get()) == 0)
      {
        logger_->debug("Certificate has no embedded SCTs");
        return 0;
      }

    auto issuer_key = issuer.get_public_key();
    if (!issuer_key)
      {
        return issuer_key.error();
      }
    auto issuer_key_hash = compute_digest(DigestAlgorithm::SHA256, issuer_key.value().to_der());
    if (!issuer_key_hash)
      {
        return issuer_key_hash.error();
      }

    auto tbs = precert_tbs(leaf);
    if (!tbs)
      {
        return tbs.error();
      }

    std::size_t verified = 0;
    for (int i = 0; i < sk_SCT_num(scts.get()); ++i)
      {
        SCT *sct = sk_SCT_value(scts.get(), i);

        unsigned char *log_id_data = nullptr;
        std::size_t log_id_len = SCT_get0_log_id(sct, &log_id_data);
        std::string log_id = to_string(log_id_data, log_id_len);

        const auto *ctlog = trusted_root_.find_ctlog(log_id);
        if (ctlog == nullptr)
          {
            logger_->debug("SCT from unknown CT log {}", attest::utils::Hex::encode(log_id));
            continue;
          }
        if (SCT_get_version(sct) != SCT_VERSION_V1)
          {
            logger_->warn("Unsupported SCT version from CT log {}", ctlog->base_url);
            continue;
          }

        auto timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(SCT_get_timestamp(sct)));
        if (!ctlog->valid_for.contains(timestamp))
          {
            logger_->warn("SCT from {} outside the validity period of the log key", ctlog->base_url);
            continue;
          }

        unsigned char *ext_data = nullptr;
        std::size_t ext_len = SCT_get0_extensions(sct, &ext_data);
        unsigned char *sig_data = nullptr;
        std::size_t sig_len = SCT_get0_signature(sct, &sig_data);

        std::string signed_data;
        append_uint(signed_data, SCT_VERSION_V1, 1);
        append_uint(signed_data, SIGNATURE_TYPE_CERTIFICATE_TIMESTAMP, 1);
        append_uint(signed_data, SCT_get_timestamp(sct), 8);
        append_uint(signed_data, ENTRY_TYPE_PRECERT, 2);
        signed_data.append(issuer_key_hash.value());
        append_uint(signed_data, tbs.value().size(), 3);
        signed_data.append(tbs.value());
        append_uint(signed_data, ext_len, 2);
        signed_data.append(to_string(ext_data, ext_len));

        auto result = ctlog->public_key->verify_signature(signed_data, to_string(sig_data, sig_len), DigestAlgorithm::SHA256);
        if (result && result.value())
          {
            logger_->debug("Verified SCT from CT log {}", ctlog->base_url);
            verified++;
          }
        else
          {
            logger_->warn("SCT signature from CT log {} does not verify", ctlog->base_url);
          }
      }
    return verified;
  }

} // namespace attest::sigstore
