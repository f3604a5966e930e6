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

#include "RFC6962Hasher.hh"

#include "sigstore/CryptographicAlgorithms.hh"

namespace attest::sigstore
{
  namespace
  {
    std::string sha256(const std::string &data)
    {
      auto digest = compute_digest(DigestAlgorithm::SHA256, data);
      return digest ? digest.value() : std::string{};
    }
  } // namespace

  std::string RFC6962Hasher::hash_leaf(const std::string &data) const
  {
    std::string prefixed_data;
    prefixed_data.reserve(1 + data.size());
    prefixed_data.push_back(LEAF_HASH_PREFIX);
    prefixed_data.append(data);
    return sha256(prefixed_data);
  }

  std::string RFC6962Hasher::hash_children(const std::string &left_hash, const std::string &right_hash) const
  {
    std::string prefixed_data;
    prefixed_data.reserve(1 + left_hash.size() + right_hash.size());
    prefixed_data.push_back(INTERNAL_HASH_PREFIX);
    prefixed_data.append(left_hash);
    prefixed_data.append(right_hash);
    return sha256(prefixed_data);
  }

} // namespace attest::sigstore
