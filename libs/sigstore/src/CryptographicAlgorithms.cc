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

#include "sigstore/CryptographicAlgorithms.hh"

#include <array>
#include <memory>
#include <utility>

#include <boost/algorithm/string/case_conv.hpp>
#include <openssl/evp.h>

#include "sigstore/SigstoreErrors.hh"
#include "utils/Hex.hh"

namespace attest::sigstore
{
  namespace
  {
    const EVP_MD *to_evp_md(DigestAlgorithm algorithm)
    {
      switch (algorithm)
        {
        case DigestAlgorithm::SHA1:
          return EVP_sha1();
        case DigestAlgorithm::SHA256:
          return EVP_sha256();
        case DigestAlgorithm::SHA384:
          return EVP_sha384();
        case DigestAlgorithm::SHA512:
          return EVP_sha512();
        }
      return nullptr;
    }
  } // namespace

  outcome::std_result<DigestAlgorithm> digest_algorithm_from_string(const std::string &algorithm_name)
  {
    static const std::array<std::pair<const char *, DigestAlgorithm>, 7> names{{
      {"sha1", DigestAlgorithm::SHA1},
      {"sha256", DigestAlgorithm::SHA256},
      {"sha2_256", DigestAlgorithm::SHA256},
      {"sha384", DigestAlgorithm::SHA384},
      {"sha2_384", DigestAlgorithm::SHA384},
      {"sha512", DigestAlgorithm::SHA512},
      {"sha2_512", DigestAlgorithm::SHA512},
    }};

    auto name = boost::algorithm::to_lower_copy(algorithm_name);
    for (const auto &[key, algorithm]: names)
      {
        if (name == key)
          {
            return algorithm;
          }
      }
    return SigstoreError::InvalidSignature;
  }

  outcome::std_result<std::string> compute_digest(DigestAlgorithm algorithm, const std::string &data)
  {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx)
      {
        return SigstoreError::SystemError;
      }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), to_evp_md(algorithm), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1)
      {
        return SigstoreError::SystemError;
      }

    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    return std::string(reinterpret_cast<const char *>(digest.data()), digest_len);
  }

  std::string sha256_hex(const std::string &data)
  {
    auto digest = compute_digest(DigestAlgorithm::SHA256, data);
    if (!digest)
      {
        return {};
      }
    return utils::Hex::encode(digest.value());
  }
} // namespace attest::sigstore
