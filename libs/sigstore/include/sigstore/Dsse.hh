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

#ifndef ATTEST_SIGSTORE_DSSE_HH
#define ATTEST_SIGSTORE_DSSE_HH

#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  class PublicKey;

  struct DsseSignature
  {
    std::string keyid;
    std::string sig; // raw signature bytes
  };

  // Dead Simple Signing Envelope. payload holds the decoded payload bytes.
  struct DsseEnvelope
  {
    std::string payload;
    std::string payload_type;
    std::vector<DsseSignature> signatures;
  };

  // DSSE pre-authentication encoding: "DSSEv1 <len(type)> <type> <len(payload)> <payload>".
  std::string pae(const std::string &payload_type, const std::string &payload);

  // Returns true if any signature of the envelope verifies with key.
  outcome::std_result<bool> verify_envelope(const DsseEnvelope &envelope, const PublicKey &key);

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_DSSE_HH
