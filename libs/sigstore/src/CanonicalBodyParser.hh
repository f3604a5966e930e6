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

#ifndef ATTEST_SIGSTORE_CANONICAL_BODY_PARSER_HH
#define ATTEST_SIGSTORE_CANONICAL_BODY_PARSER_HH

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <boost/json/object.hpp>
#include <spdlog/spdlog.h>

#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  struct RekordSignature
  {
    std::string signature; // raw bytes
    std::string verifier;  // PEM certificate or public key
  };

  // hashedrekord 0.0.1
  struct HashedRekord
  {
    std::string hash_algorithm;
    std::string hash_value; // hex
    std::string signature;
    std::string public_key;
  };

  // dsse 0.0.1
  struct DsseRekord
  {
    std::string payload_hash_algorithm;
    std::string payload_hash; // hex
    std::vector<RekordSignature> signatures;
  };

  // intoto 0.0.2
  struct IntotoRekord
  {
    std::string payload_hash_algorithm;
    std::string payload_hash; // hex
    std::vector<RekordSignature> signatures;
  };

  struct LogEntry
  {
    std::string kind;
    std::string api_version;
    std::variant<HashedRekord, DsseRekord, IntotoRekord> spec;
  };

  // Parses the canonicalized body of a Rekor log entry.
  class CanonicalBodyParser
  {
  public:
    outcome::std_result<LogEntry> parse(const std::string &json_body) const;

  private:
    outcome::std_result<HashedRekord> parse_hashed_rekord(const boost::json::object &spec) const;
    outcome::std_result<DsseRekord> parse_dsse(const boost::json::object &spec) const;
    outcome::std_result<IntotoRekord> parse_intoto(const boost::json::object &spec) const;

  private:
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:canonical_body_parser")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_CANONICAL_BODY_PARSER_HH
