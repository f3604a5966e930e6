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

#ifndef ATTEST_SIGSTORE_CERTIFICATE_STORE_HH
#define ATTEST_SIGSTORE_CERTIFICATE_STORE_HH

#include <chrono>
#include <memory>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>

#include "sigstore/Certificate.hh"
#include "sigstore/TrustedRoot.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  using X509StorePtr = std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)>;
  using X509StackPtr = std::unique_ptr<STACK_OF(X509), void (*)(STACK_OF(X509) *)>;

  // Verifies certificates against the certificate authorities of a trusted root.
  class CertificateStore
  {
  public:
    explicit CertificateStore(const std::vector<CertificateAuthority> &authorities);

    // True if cert chains to one of the authorities that is valid at time, with all
    // certificates in the chain valid at time. extra_intermediates come from the bundle.
    outcome::std_result<bool> verify_certificate_chain(const Certificate &cert,
                                                       std::chrono::system_clock::time_point time,
                                                       const std::vector<const Certificate *> &extra_intermediates = {}) const;

    std::size_t get_authority_count() const;

    // Trust anchors (the root of the chain) and intermediates of one authority.
    static X509StorePtr create_root_store(const CertificateAuthority &authority);
    static X509StackPtr create_intermediate_stack(const CertificateAuthority &authority,
                                                  const std::vector<const Certificate *> &extra_intermediates = {});

  private:
    void log_validated_chain(X509_STORE_CTX *cert_ctx) const;

  private:
    const std::vector<CertificateAuthority> &authorities_;
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:certificatestore")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_CERTIFICATE_STORE_HH
