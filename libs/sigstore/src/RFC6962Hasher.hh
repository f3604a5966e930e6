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

#ifndef ATTEST_SIGSTORE_RFC6962_HASHER_HH
#define ATTEST_SIGSTORE_RFC6962_HASHER_HH

#include <string>

namespace attest::sigstore
{
  // RFC 6962 section 2.1 Merkle tree hashing over SHA-256.
  class RFC6962Hasher
  {
  public:
    std::string hash_leaf(const std::string &data) const;
    std::string hash_children(const std::string &left_hash, const std::string &right_hash) const;

  private:
    static constexpr char LEAF_HASH_PREFIX = 0x00;
    static constexpr char INTERNAL_HASH_PREFIX = 0x01;
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_RFC6962_HASHER_HH
