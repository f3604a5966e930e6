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

#ifndef ATTEST_SIGSTORE_TRUSTED_ROOT_PROVIDER_HH
#define ATTEST_SIGSTORE_TRUSTED_ROOT_PROVIDER_HH

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/awaitable.hpp>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "http/HttpClient.hh"
#include "sigstore/TrustedRoot.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  class TrustedRootProvider
  {
  public:
    virtual ~TrustedRootProvider() = default;

    virtual outcome::std_result<std::shared_ptr<const TrustedRoot>> load_trusted_root() = 0;
  };

  // Loads a pinned trusted_root.json.
  class FileTrustedRootProvider : public TrustedRootProvider
  {
  public:
    explicit FileTrustedRootProvider(std::filesystem::path path);

    outcome::std_result<std::shared_ptr<const TrustedRoot>> load_trusted_root() override;

  private:
    std::filesystem::path path_;
  };

  class TufRoot;
  class TufMetadata;

  // Keeps a cached trusted_root.json up to date from the Sigstore TUF repository.
  //
  // The chain of trust starts at root.json in the cache directory, or at
  // initial_root when nothing is cached yet. Every refresh walks newer root
  // versions and verifies timestamp, snapshot and targets before accepting
  // the trusted_root.json target.
  class TufTrustedRootProvider : public TrustedRootProvider
  {
  public:
    static constexpr const char *DEFAULT_REPOSITORY_URL = "https://tuf-repo-cdn.sigstore.dev";
    static constexpr const char *TRUSTED_ROOT_TARGET = "trusted_root.json";
    static constexpr std::chrono::seconds DEFAULT_REFRESH_INTERVAL{std::chrono::hours(24)};
    static constexpr int MAX_ROOT_ROTATIONS = 32;

    TufTrustedRootProvider(std::shared_ptr<attest::http::IHttpClient> http_client,
                           std::filesystem::path cache_dir,
                           std::string initial_root,
                           std::chrono::seconds refresh_interval = DEFAULT_REFRESH_INTERVAL,
                           std::string repository_url = DEFAULT_REPOSITORY_URL);

    outcome::std_result<std::shared_ptr<const TrustedRoot>> load_trusted_root() override;

    std::filesystem::path get_cache_file() const;

  private:
    struct TrustedFiles
    {
      std::string root;
      std::string targets;
      std::string trusted_root;
    };

    outcome::std_result<TufRoot> load_root() const;
    outcome::std_result<std::string> load_cache() const;
    bool is_cache_fresh() const;
    outcome::std_result<TrustedFiles> refresh();
    boost::asio::awaitable<outcome::std_result<TrustedFiles>> update(TufRoot root);
    boost::asio::awaitable<outcome::std_result<TufRoot>> update_root(TufRoot root);
    boost::asio::awaitable<outcome::std_result<TufMetadata>>
    fetch_metadata(const TufRoot &root, const std::string &role, const std::string &path);
    boost::asio::awaitable<outcome::std_result<std::optional<std::string>>> fetch(const std::string &path);
    outcome::std_result<void> verify_target(const TufMetadata &targets, const std::string &content) const;
    outcome::std_result<void> verify_file(const std::string &name,
                                          const std::string &content,
                                          std::optional<std::int64_t> length,
                                          std::optional<std::string> sha256) const;
    outcome::std_result<void> store_cache(const TrustedFiles &files) const;
    outcome::std_result<void> store_file(const std::string &name, const std::string &content) const;

  private:
    std::shared_ptr<attest::http::IHttpClient> http_client_;
    std::filesystem::path cache_dir_;
    std::string initial_root_;
    std::chrono::seconds refresh_interval_;
    std::string repository_url_;
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:tuf")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_TRUSTED_ROOT_PROVIDER_HH
