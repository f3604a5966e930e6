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

#ifndef ATTEST_SIGSTORE_CHECKPOINT_PARSER_HH
#define ATTEST_SIGSTORE_CHECKPOINT_PARSER_HH

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  struct CheckpointSignature
  {
    std::string signer;
    std::string key_hint; // first 4 bytes of the decoded signature
    std::string signature;
  };

  // Signed note (https://github.com/C2SP/C2SP/blob/main/signed-note.md) holding a log checkpoint.
  struct ParsedCheckpoint
  {
    std::string origin;
    std::uint64_t tree_size = 0;
    std::string root_hash; // raw bytes
    std::vector<std::string> extensions;
    std::vector<CheckpointSignature> signatures;
    std::string body; // signed text, including the final newline
  };

  class CheckpointParser
  {
  public:
    outcome::std_result<ParsedCheckpoint> parse(const std::string &checkpoint_data) const;

  private:
    bool parse_body(std::string_view body_text, ParsedCheckpoint &checkpoint) const;
    bool parse_signatures(std::string_view signature_text, ParsedCheckpoint &checkpoint) const;

    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:checkpoint_parser")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_CHECKPOINT_PARSER_HH
