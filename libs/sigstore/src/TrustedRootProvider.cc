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

#include "sigstore/TrustedRootProvider.hh"

#include <exception>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "TufMetadata.hh"
#include "sigstore/CryptographicAlgorithms.hh"
#include "sigstore/SigstoreErrors.hh"

namespace attest::sigstore
{
  namespace
  {
    constexpr const char *ROOT_FILE = "root.json";
    constexpr const char *TARGETS_FILE = "targets.json";

    std::optional<std::string> read_file(const std::filesystem::path &path)
    {
      std::ifstream file(path, std::ios::binary);
      if (!file.is_open())
        {
          return std::nullopt;
        }
      std::stringstream buffer;
      buffer << file.rdbuf();
      return buffer.str();
    }
  } // namespace

  FileTrustedRootProvider::FileTrustedRootProvider(std::filesystem::path path)
    : path_(std::move(path))
  {
  }

  outcome::std_result<std::shared_ptr<const TrustedRoot>> FileTrustedRootProvider::load_trusted_root()
  {
    return TrustedRoot::from_file(path_);
  }

  TufTrustedRootProvider::TufTrustedRootProvider(std::shared_ptr<attest::http::IHttpClient> http_client,
                                                 std::filesystem::path cache_dir,
                                                 std::string initial_root,
                                                 std::chrono::seconds refresh_interval,
                                                 std::string repository_url)
    : http_client_(std::move(http_client))
    , cache_dir_(std::move(cache_dir))
    , initial_root_(std::move(initial_root))
    , refresh_interval_(refresh_interval)
    , repository_url_(std::move(repository_url))
  {
  }

  std::filesystem::path TufTrustedRootProvider::get_cache_file() const
  {
    return cache_dir_ / TRUSTED_ROOT_TARGET;
  }

  outcome::std_result<std::shared_ptr<const TrustedRoot>> TufTrustedRootProvider::load_trusted_root()
  {
    auto cached = load_cache();
    if (cached && is_cache_fresh())
      {
        logger_->debug("Using cached trusted root {}", get_cache_file().string());
        return TrustedRoot::from_json(cached.value());
      }

    std::error_code error;
    auto files = refresh();
    if (files)
      {
        auto trusted_root = TrustedRoot::from_json(files.value().trusted_root);
        if (trusted_root)
          {
            auto stored = store_cache(files.value());
            if (!stored)
              {
                logger_->warn("Failed to cache trusted root ({})", stored.error().message());
              }
            return trusted_root;
          }
        logger_->error("Downloaded trusted root is invalid ({})", trusted_root.error().message());
        error = trusted_root.error();
      }
    else
      {
        error = files.error();
      }

    if (cached)
      {
        logger_->warn("Failed to refresh trusted root, using stale cache {}", get_cache_file().string());
        return TrustedRoot::from_json(cached.value());
      }

    logger_->error("No trusted root available ({})", error.message());
    return error;
  }

  outcome::std_result<TufRoot> TufTrustedRootProvider::load_root() const
  {
    auto content = read_file(cache_dir_ / ROOT_FILE);
    if (!content)
      {
        if (initial_root_.empty())
          {
            logger_->error("No TUF root in {} and no initial root configured", cache_dir_.string());
            return SigstoreError::TrustedRootUnavailable;
          }
        content = initial_root_;
      }

    auto metadata = TufMetadata::parse(*content, "root");
    if (!metadata)
      {
        return metadata.as_failure();
      }
    return TufRoot::from_metadata(std::move(metadata.value()));
  }

  // Returns the cached trusted_root.json after checking it against the cached
  // targets metadata and the trusted TUF root.
  outcome::std_result<std::string> TufTrustedRootProvider::load_cache() const
  {
    auto trusted_root = read_file(get_cache_file());
    auto targets_content = read_file(cache_dir_ / TARGETS_FILE);
    if (!trusted_root || !targets_content)
      {
        return SigstoreError::TrustedRootUnavailable;
      }

    auto root = load_root();
    if (!root)
      {
        return root.as_failure();
      }

    auto targets = TufMetadata::parse(*targets_content, "targets");
    if (!targets)
      {
        return targets.as_failure();
      }

    if (auto rc = root.value().verify_role("targets", targets.value()); !rc)
      {
        logger_->warn("Ignoring cached trusted root, {} is not trusted", TARGETS_FILE);
        return rc.as_failure();
      }
    if (targets.value().is_expired(std::chrono::system_clock::now()))
      {
        logger_->warn("Ignoring cached trusted root, {} expired", TARGETS_FILE);
        return SigstoreError::TufMetadataExpired;
      }
    if (auto rc = verify_target(targets.value(), *trusted_root); !rc)
      {
        logger_->warn("Ignoring cached trusted root, it does not match {}", TARGETS_FILE);
        return rc.as_failure();
      }
    return *trusted_root;
  }

  bool TufTrustedRootProvider::is_cache_fresh() const
  {
    std::error_code ec;
    auto modified = std::filesystem::last_write_time(get_cache_file(), ec);
    if (ec)
      {
        return false;
      }
    auto age = std::filesystem::file_time_type::clock::now() - modified;
    return age < refresh_interval_;
  }

  outcome::std_result<TufTrustedRootProvider::TrustedFiles> TufTrustedRootProvider::refresh()
  {
    auto root = load_root();
    if (!root)
      {
        return root.as_failure();
      }

    outcome::std_result<TrustedFiles> result = SigstoreError::TrustedRootUnavailable;

    boost::asio::io_context ioc;
    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> { result = co_await update(std::move(root.value())); },
      [&](std::exception_ptr e) {
        if (e)
          {
            try
              {
                std::rethrow_exception(e);
              }
            catch (const std::exception &ex)
              {
                logger_->error("Trusted root refresh failed ({})", ex.what());
              }
          }
      });
    ioc.run();
    return result;
  }

  boost::asio::awaitable<outcome::std_result<TufTrustedRootProvider::TrustedFiles>> TufTrustedRootProvider::update(TufRoot root)
  {
    logger_->info("Refreshing trusted root from {}", repository_url_);

    auto updated = co_await update_root(std::move(root));
    if (!updated)
      {
        co_return updated.as_failure();
      }
    const auto &trusted = updated.value();

    if (trusted.is_expired(std::chrono::system_clock::now()))
      {
        logger_->error("TUF root version {} expired", trusted.get_version());
        co_return SigstoreError::TufMetadataExpired;
      }

    auto timestamp = co_await fetch_metadata(trusted, "timestamp", "timestamp.json");
    if (!timestamp)
      {
        co_return timestamp.as_failure();
      }

    auto snapshot_meta = timestamp.value().get_meta("snapshot.json");
    if (!snapshot_meta)
      {
        co_return snapshot_meta.as_failure();
      }
    const auto snapshot_file = std::to_string(snapshot_meta.value().version) + ".snapshot.json";
    auto snapshot = co_await fetch_metadata(trusted, "snapshot", snapshot_file);
    if (!snapshot)
      {
        co_return snapshot.as_failure();
      }
    if (auto rc = verify_file(snapshot_file, snapshot.value().get_content(), snapshot_meta.value().length, snapshot_meta.value().sha256); !rc)
      {
        co_return rc.as_failure();
      }
    if (snapshot.value().get_version() != snapshot_meta.value().version)
      {
        logger_->error("{} has version {}", snapshot_file, snapshot.value().get_version());
        co_return SigstoreError::TufVersionMismatch;
      }

    auto targets_meta = snapshot.value().get_meta(TARGETS_FILE);
    if (!targets_meta)
      {
        co_return targets_meta.as_failure();
      }
    const auto targets_file = std::to_string(targets_meta.value().version) + "." + TARGETS_FILE;
    auto targets = co_await fetch_metadata(trusted, "targets", targets_file);
    if (!targets)
      {
        co_return targets.as_failure();
      }
    if (auto rc = verify_file(targets_file, targets.value().get_content(), targets_meta.value().length, targets_meta.value().sha256); !rc)
      {
        co_return rc.as_failure();
      }
    if (targets.value().get_version() != targets_meta.value().version)
      {
        logger_->error("{} has version {}", targets_file, targets.value().get_version());
        co_return SigstoreError::TufVersionMismatch;
      }

    if (auto cached = read_file(cache_dir_ / TARGETS_FILE); cached)
      {
        auto previous = TufMetadata::parse(*cached, "targets");
        if (previous && previous.value().get_version() > targets.value().get_version())
          {
            logger_->error("{} version {} is older than the cached version {}",
                           TARGETS_FILE,
                           targets.value().get_version(),
                           previous.value().get_version());
            co_return SigstoreError::TufVersionMismatch;
          }
      }

    auto target = targets.value().get_target(TRUSTED_ROOT_TARGET);
    if (!target)
      {
        co_return target.as_failure();
      }
    auto content = co_await fetch("targets/" + target.value().sha256 + "." + TRUSTED_ROOT_TARGET);
    if (!content)
      {
        co_return content.as_failure();
      }
    if (!content.value())
      {
        logger_->error("{} is not available", TRUSTED_ROOT_TARGET);
        co_return SigstoreError::TrustedRootUnavailable;
      }
    if (auto rc = verify_target(targets.value(), *content.value()); !rc)
      {
        co_return rc.as_failure();
      }

    co_return TrustedFiles{.root = trusted.get_content(), .targets = targets.value().get_content(), .trusted_root = *content.value()};
  }

  boost::asio::awaitable<outcome::std_result<TufRoot>> TufTrustedRootProvider::update_root(TufRoot root)
  {
    for (int i = 0; i < MAX_ROOT_ROTATIONS; i++)
      {
        auto content = co_await fetch(std::to_string(root.get_version() + 1) + "." + ROOT_FILE);
        if (!content)
          {
            co_return content.as_failure();
          }
        if (!content.value())
          {
            break;
          }

        auto next = root.update(*content.value());
        if (!next)
          {
            co_return next.as_failure();
          }
        root = std::move(next.value());
      }
    co_return std::move(root);
  }

  boost::asio::awaitable<outcome::std_result<TufMetadata>>
  TufTrustedRootProvider::fetch_metadata(const TufRoot &root, const std::string &role, const std::string &path)
  {
    auto content = co_await fetch(path);
    if (!content)
      {
        co_return content.as_failure();
      }
    if (!content.value())
      {
        logger_->error("{} is not available", path);
        co_return SigstoreError::TrustedRootUnavailable;
      }

    auto metadata = TufMetadata::parse(*content.value(), role);
    if (!metadata)
      {
        co_return metadata.as_failure();
      }
    if (auto rc = root.verify_role(role, metadata.value()); !rc)
      {
        co_return rc.as_failure();
      }
    if (metadata.value().is_expired(std::chrono::system_clock::now()))
      {
        logger_->error("{} expired", path);
        co_return SigstoreError::TufMetadataExpired;
      }
    co_return metadata;
  }

  // An empty optional means the file does not exist in the repository.
  boost::asio::awaitable<outcome::std_result<std::optional<std::string>>> TufTrustedRootProvider::fetch(const std::string &path)
  {
    auto url = repository_url_ + "/" + path;
    auto response = co_await http_client_->get(url);
    if (!response)
      {
        logger_->error("Failed to fetch {} ({})", url, response.error().message());
        co_return response.as_failure();
      }

    auto [status, body] = response.value();
    if (status == 404 || status == 403)
      {
        logger_->debug("{} not found (HTTP {})", url, status);
        co_return std::optional<std::string>{};
      }
    if (status != 200)
      {
        logger_->error("Failed to fetch {} (HTTP {})", url, status);
        co_return SigstoreError::TrustedRootUnavailable;
      }
    co_return std::optional<std::string>{std::move(body)};
  }

  outcome::std_result<void> TufTrustedRootProvider::verify_target(const TufMetadata &targets, const std::string &content) const
  {
    auto target = targets.get_target(TRUSTED_ROOT_TARGET);
    if (!target)
      {
        return target.as_failure();
      }
    return verify_file(TRUSTED_ROOT_TARGET, content, target.value().length, target.value().sha256);
  }

  outcome::std_result<void> TufTrustedRootProvider::verify_file(const std::string &name,
                                                                const std::string &content,
                                                                std::optional<std::int64_t> length,
                                                                std::optional<std::string> sha256) const
  {
    if (length && static_cast<std::int64_t>(content.size()) != *length)
      {
        logger_->error("{} has length {}, expected {}", name, content.size(), *length);
        return SigstoreError::TufTargetMismatch;
      }
    if (sha256 && sha256_hex(content) != *sha256)
      {
        logger_->error("{} does not match sha256 {}", name, *sha256);
        return SigstoreError::TufTargetMismatch;
      }
    return outcome::success();
  }

  outcome::std_result<void> TufTrustedRootProvider::store_cache(const TrustedFiles &files) const
  {
    std::error_code ec;
    std::filesystem::create_directories(cache_dir_, ec);
    if (ec)
      {
        logger_->error("Failed to create {} ({})", cache_dir_.string(), ec.message());
        return ec;
      }

    if (auto rc = store_file(ROOT_FILE, files.root); !rc)
      {
        return rc;
      }
    if (auto rc = store_file(TARGETS_FILE, files.targets); !rc)
      {
        return rc;
      }
    return store_file(TRUSTED_ROOT_TARGET, files.trusted_root);
  }

  outcome::std_result<void> TufTrustedRootProvider::store_file(const std::string &name, const std::string &content) const
  {
    auto path = cache_dir_ / name;
    auto temp_file = path;
    temp_file += ".tmp";
    {
      std::ofstream file(temp_file, std::ios::binary | std::ios::trunc);
      if (!file.is_open())
        {
          return SigstoreError::SystemError;
        }
      file << content;
      if (!file)
        {
          return SigstoreError::SystemError;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_file, path, ec);
    if (ec)
      {
        logger_->error("Failed to store {} ({})", path.string(), ec.message());
        return ec;
      }
    return outcome::success();
  }

} // namespace attest::sigstore
