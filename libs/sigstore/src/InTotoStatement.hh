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

#ifndef ATTEST_SIGSTORE_INTOTO_STATEMENT_HH
#define ATTEST_SIGSTORE_INTOTO_STATEMENT_HH

#include <map>
#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  struct InTotoSubject
  {
    std::string name;
    std::map<std::string, std::string> digest;
  };

  // in-toto attestation statement (https://in-toto.io/Statement/v1).
  struct InTotoStatement
  {
    static constexpr const char *PAYLOAD_TYPE = "application/vnd.in-toto+json";

    std::string type;
    std::string predicate_type;
    std::vector<InTotoSubject> subjects;

    static outcome::std_result<InTotoStatement> from_json(const std::string &json);

    // True if a subject carries the given lowercase hex sha256 digest.
    bool has_subject_digest(const std::string &sha256) const;
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_INTOTO_STATEMENT_HH
