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

#include "CertificateStore.hh"

#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

#include "sigstore/SigstoreErrors.hh"

namespace attest::sigstore
{
  CertificateStore::CertificateStore(const std::vector<CertificateAuthority> &authorities)
    : authorities_(authorities)
  {
  }

  X509StorePtr CertificateStore::create_root_store(const CertificateAuthority &authority)
  {
    X509StorePtr store(X509_STORE_new(), X509_STORE_free);
    if (!store)
      {
        return store;
      }

    for (std::size_t i = 0; i < authority.chain.size(); ++i)
      {
        const auto &cert = authority.chain[i];
        bool is_root = (i == authority.chain.size() - 1) || cert->is_self_signed();
        if (is_root && X509_STORE_add_cert(store.get(), cert->get()) != 1)
          {
            spdlog::warn("Failed to add root certificate {} to store", cert->subject_name());
          }
      }
    return store;
  }

  X509StackPtr CertificateStore::create_intermediate_stack(const CertificateAuthority &authority,
                                                           const std::vector<const Certificate *> &extra_intermediates)
  {
    X509StackPtr untrusted(sk_X509_new_null(), [](STACK_OF(X509) * sk) { sk_X509_pop_free(sk, X509_free); });
    if (!untrusted)
      {
        return untrusted;
      }

    auto push = [&untrusted](X509 *cert) {
      X509_up_ref(cert);
      if (sk_X509_push(untrusted.get(), cert) <= 0)
        {
          X509_free(cert);
        }
    };

    for (std::size_t i = 0; i + 1 < authority.chain.size(); ++i)
      {
        if (!authority.chain[i]->is_self_signed())
          {
            push(authority.chain[i]->get());
          }
      }
    for (const auto *cert: extra_intermediates)
      {
        push(cert->get());
      }
    return untrusted;
  }

  outcome::std_result<bool> CertificateStore::verify_certificate_chain(const Certificate &cert,
                                                                       std::chrono::system_clock::time_point time,
                                                                       const std::vector<const Certificate *> &extra_intermediates) const
  {
    for (const auto &authority: authorities_)
      {
        if (!authority.valid_for.contains(time))
          {
            logger_->debug("Skipping certificate authority {}: not valid at verification time", authority.uri);
            continue;
          }

        auto store = create_root_store(authority);
        auto untrusted = create_intermediate_stack(authority, extra_intermediates);
        std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)> ctx(X509_STORE_CTX_new(), X509_STORE_CTX_free);
        if (!store || !untrusted || !ctx)
          {
            logger_->error("Failed to create certificate verification context");
            return SigstoreError::SystemError;
          }

        if (X509_STORE_CTX_init(ctx.get(), store.get(), cert.get(), untrusted.get()) != 1)
          {
            logger_->error("Failed to initialize verification context");
            return SigstoreError::SystemError;
          }
        X509_STORE_CTX_set_time(ctx.get(), 0, std::chrono::system_clock::to_time_t(time));

        if (X509_verify_cert(ctx.get()) == 1)
          {
            logger_->debug("Certificate chains to authority {}", authority.uri);
            log_validated_chain(ctx.get());
            return true;
          }

        int error = X509_STORE_CTX_get_error(ctx.get());
        logger_->debug("Certificate chain verification against {} failed: {}", authority.uri, X509_verify_cert_error_string(error));
      }

    return false;
  }

  std::size_t CertificateStore::get_authority_count() const
  {
    return authorities_.size();
  }

  void CertificateStore::log_validated_chain(X509_STORE_CTX *cert_ctx) const
  {
    STACK_OF(X509) *chain = X509_STORE_CTX_get0_chain(cert_ctx);
    if (chain == nullptr)
      {
        return;
      }

    for (int i = 0; i < sk_X509_num(chain); ++i)
      {
        X509 *cert = sk_X509_value(chain, i);
        char *subject = X509_NAME_oneline(X509_get_subject_name(cert), nullptr, 0);
        char *issuer = X509_NAME_oneline(X509_get_issuer_name(cert), nullptr, 0);
        logger_->debug("  Cert {}: subject {} issuer {}", i, subject, issuer);
        OPENSSL_free(subject);
        OPENSSL_free(issuer);
      }
  }

} // namespace attest::sigstore
