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

#include "TimestampAuthorityVerifier.hh"

#include <ctime>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ts.h>
#include <openssl/x509_vfy.h>

#include "CertificateStore.hh"
#include "sigstore/SigstoreErrors.hh"

namespace attest::sigstore
{
  TimestampAuthorityVerifier::TimestampAuthorityVerifier(const TrustedRoot &trusted_root)
    : trusted_root_(trusted_root)
  {
  }

  outcome::std_result<std::chrono::system_clock::time_point> TimestampAuthorityVerifier::verify(const std::string &signed_timestamp,
                                                                                                const std::string &signature) const
  {
    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    const auto *der = reinterpret_cast<const unsigned char *>(signed_timestamp.data());
    std::unique_ptr<TS_RESP, decltype(&TS_RESP_free)> response(d2i_TS_RESP(nullptr, &der, static_cast<long>(signed_timestamp.size())),
                                                               TS_RESP_free);
    if (!response)
      {
        logger_->error("Failed to decode RFC 3161 timestamp response");
        return SigstoreError::InvalidTimestamp;
      }

    TS_TST_INFO *tst_info = TS_RESP_get_tst_info(response.get());
    const ASN1_GENERALIZEDTIME *gen_time = tst_info != nullptr ? TS_TST_INFO_get_time(tst_info) : nullptr;
    struct tm tm_time = {};
    if (gen_time == nullptr || ASN1_TIME_to_tm(gen_time, &tm_time) != 1)
      {
        logger_->error("Timestamp response has no valid generation time");
        return SigstoreError::InvalidTimestamp;
      }
    auto timestamp = std::chrono::system_clock::from_time_t(timegm(&tm_time));

    for (const auto &authority: trusted_root_.timestamp_authorities())
      {
        if (!authority.valid_for.contains(timestamp))
          {
            continue;
          }

        std::unique_ptr<TS_VERIFY_CTX, decltype(&TS_VERIFY_CTX_free)> ctx(TS_VERIFY_CTX_new(), TS_VERIFY_CTX_free);
        auto store = CertificateStore::create_root_store(authority);
        auto untrusted = CertificateStore::create_intermediate_stack(authority);
        BIO *data = BIO_new_mem_buf(signature.data(), static_cast<int>(signature.size()));
        if (!ctx || !store || !untrusted || data == nullptr)
          {
            BIO_free(data);
            return SigstoreError::SystemError;
          }

        X509_VERIFY_PARAM_set_time(X509_STORE_get0_param(store.get()), std::chrono::system_clock::to_time_t(timestamp));

        // The verification context takes ownership of the store, certificates and data.
        TS_VERIFY_CTX_set_flags(ctx.get(), TS_VFY_VERSION | TS_VFY_SIGNATURE | TS_VFY_DATA);
        TS_VERIFY_CTX_set_data(ctx.get(), data);
        TS_VERIFY_CTX_set_store(ctx.get(), store.release());
        TS_VERIFY_CTX_set_certs(ctx.get(), untrusted.release());

        if (TS_RESP_verify_response(ctx.get(), response.get()) == 1)
          {
            logger_->debug("Timestamp verified against authority {}", authority.uri);
            return timestamp;
          }

        const char *reason = ERR_reason_error_string(ERR_get_error());
        logger_->debug("Timestamp does not verify against authority {}: {}", authority.uri, reason != nullptr ? reason : "unknown");
        ERR_clear_error();
      }

    logger_->warn("Timestamp response does not verify against any trusted timestamp authority");
    return SigstoreError::InvalidTimestamp;
  }

} // namespace attest::sigstore
