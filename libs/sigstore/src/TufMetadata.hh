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

#ifndef ATTEST_SIGSTORE_TUF_METADATA_HH
#define ATTEST_SIGSTORE_TUF_METADATA_HH

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/json/object.hpp>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "sigstore/PublicKey.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  // One signed TUF metadata document: {"signed": {...}, "signatures": [...]}.
  class TufMetadata
  {
  public:
    static outcome::std_result<TufMetadata> parse(const std::string &content, const std::string &expected_type);

    const std::string &get_type() const;
    std::int64_t get_version() const;
    std::chrono::system_clock::time_point get_expires() const;
    bool is_expired(std::chrono::system_clock::time_point now) const;

    const boost::json::object &get_signed() const;
    const boost::json::array &get_signatures() const;
    const std::string &get_content() const;

    // Version (and optional length/sha256) recorded for file in signed.meta.
    struct MetaFile
    {
      std::int64_t version = 0;
      std::optional<std::int64_t> length;
      std::optional<std::string> sha256;
    };
    outcome::std_result<MetaFile> get_meta(const std::string &file) const;

    struct Target
    {
      std::int64_t length = 0;
      std::string sha256;
    };
    outcome::std_result<Target> get_target(const std::string &name) const;

  private:
    TufMetadata() = default;

  private:
    std::string content;
    boost::json::object document;
    std::string type;
    std::int64_t version = 0;
    std::chrono::system_clock::time_point expires;
  };

  // Trusted root role metadata: the keys and thresholds of all top-level roles.
  class TufRoot
  {
  public:
    static outcome::std_result<TufRoot> from_metadata(TufMetadata metadata);

    // Succeeds when at least threshold distinct keys of role signed metadata.
    outcome::std_result<void> verify_role(const std::string &role, const TufMetadata &metadata) const;

    // Accepts root version N+1 signed by this root and by itself.
    outcome::std_result<TufRoot> update(const std::string &content) const;

    std::int64_t get_version() const;
    bool is_expired(std::chrono::system_clock::time_point now) const;
    const std::string &get_content() const;

  private:
    explicit TufRoot(TufMetadata metadata);

    struct Role
    {
      std::vector<std::string> keyids;
      std::size_t threshold = 0;
    };

  private:
    TufMetadata metadata;
    std::map<std::string, std::shared_ptr<const PublicKey>> keys;
    std::map<std::string, Role> roles;
    std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:sigstore:tuf")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_TUF_METADATA_HH
