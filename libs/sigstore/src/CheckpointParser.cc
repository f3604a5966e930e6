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

#include "CheckpointParser.hh"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string.hpp>

#include "sigstore/SigstoreErrors.hh"
#include "utils/Base64.hh"

namespace attest::sigstore
{
  namespace
  {
    constexpr std::size_t KEY_HINT_SIZE = 4;
    constexpr std::string_view EM_DASH = "—";
  } // namespace

  outcome::std_result<ParsedCheckpoint> CheckpointParser::parse(const std::string &checkpoint_data) const
  {
    if (checkpoint_data.empty())
      {
        logger_->error("Checkpoint is empty");
        return SigstoreError::InvalidTransparencyLog;
      }

    std::string text = boost::algorithm::replace_all_copy(checkpoint_data, "\r\n", "\n");
    const auto separator_pos = text.find("\n\n");
    if (separator_pos == std::string::npos)
      {
        logger_->error("Checkpoint format error: missing blank line between body and signatures");
        return SigstoreError::InvalidTransparencyLog;
      }

    auto body_text = std::string_view(text).substr(0, separator_pos);
    auto signature_text = std::string_view(text).substr(separator_pos + 2);

    ParsedCheckpoint checkpoint;
    if (!parse_body(body_text, checkpoint) || !parse_signatures(signature_text, checkpoint))
      {
        return SigstoreError::InvalidTransparencyLog;
      }
    checkpoint.body = std::string(body_text) + "\n";
    return checkpoint;
  }

  bool CheckpointParser::parse_body(std::string_view body_text, ParsedCheckpoint &checkpoint) const
  {
    std::vector<std::string> lines;
    boost::algorithm::split(lines, body_text, boost::is_any_of("\n"), boost::token_compress_off);
    if (lines.size() < 3)
      {
        logger_->error("Checkpoint body must have at least 3 lines");
        return false;
      }

    checkpoint.origin = lines[0];
    if (checkpoint.origin.empty())
      {
        logger_->error("Checkpoint origin is empty");
        return false;
      }

    const auto &size_line = lines[1];
    if (size_line.empty() || !std::all_of(size_line.begin(), size_line.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
      {
        logger_->error("Tree size line is not decimal: {}", size_line);
        return false;
      }

    try
      {
        checkpoint.tree_size = std::stoull(size_line);
        checkpoint.root_hash = attest::utils::Base64::decode(lines[2]);
      }
    catch (const std::exception &e)
      {
        logger_->error("Failed to parse checkpoint body: {}", e.what());
        return false;
      }

    checkpoint.extensions.assign(lines.begin() + 3, lines.end());
    return true;
  }

  bool CheckpointParser::parse_signatures(std::string_view signature_text, ParsedCheckpoint &checkpoint) const
  {
    std::vector<std::string> lines;
    boost::algorithm::split(lines, signature_text, boost::is_any_of("\n"), boost::token_compress_off);
    lines.erase(std::remove(lines.begin(), lines.end(), std::string{}), lines.end());
    if (lines.empty())
      {
        logger_->error("Checkpoint has no signature lines");
        return false;
      }

    for (const auto &line: lines)
      {
        std::string_view rest = line;
        if (rest.starts_with(EM_DASH))
          {
            rest.remove_prefix(EM_DASH.size());
          }
        else if (rest.starts_with("-"))
          {
            rest.remove_prefix(1);
          }
        else
          {
            logger_->error("Signature line must start with a dash: {}", line);
            return false;
          }

        rest.remove_prefix(std::min(rest.find_first_not_of(' '), rest.size()));
        const auto space_pos = rest.find(' ');
        if (space_pos == std::string_view::npos)
          {
            logger_->error("Signature line has no space after signer: {}", line);
            return false;
          }

        CheckpointSignature signature;
        signature.signer = std::string(rest.substr(0, space_pos));
        try
          {
            std::string decoded = attest::utils::Base64::decode(std::string(rest.substr(space_pos + 1)));
            if (decoded.size() <= KEY_HINT_SIZE)
              {
                logger_->error("Checkpoint signature from {} is too short", signature.signer);
                return false;
              }
            signature.key_hint = decoded.substr(0, KEY_HINT_SIZE);
            signature.signature = decoded.substr(KEY_HINT_SIZE);
          }
        catch (const attest::utils::Base64Exception &e)
          {
            logger_->error("Invalid checkpoint signature encoding: {}", e.what());
            return false;
          }
        checkpoint.signatures.push_back(std::move(signature));
      }
    return true;
  }
} // namespace attest::sigstore
