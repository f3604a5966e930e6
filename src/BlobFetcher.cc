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

#include "attest/BlobFetcher.hh"

#include <exception>
#include <fstream>
#include <sstream>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/url.hpp>

#include "attest/AttestErrors.hh"

using namespace attest;

ArtifactoryBlobFetcher::ArtifactoryBlobFetcher(std::shared_ptr<http::IHttpClient> http_client, std::string url, std::string access_token)
  : http_client(std::move(http_client))
  , url(std::move(url))
{
  while (!this->url.empty() && this->url.back() == '/')
    {
      this->url.pop_back();
    }
  if (!access_token.empty())
    {
      this->http_client->options().set_bearer_token(access_token);
    }
}

outcome::std_result<std::string>
ArtifactoryBlobFetcher::get_file_url(const std::string &path) const
{
  auto base = boost::urls::parse_uri(url);
  if (!base)
    {
      logger->error("invalid server URL {} ({})", url, base.error().message());
      return AttestErrc::InvalidInput;
    }

  boost::urls::url file_url(base.value());
  auto segments = file_url.segments();
  segments.push_back("artifactory");

  std::string::size_type start = 0;
  while (start <= path.size())
    {
      auto end = path.find('/', start);
      if (end == std::string::npos)
        {
          end = path.size();
        }
      if (end > start)
        {
          segments.push_back(std::string_view(path).substr(start, end - start));
        }
      start = end + 1;
    }
  file_url.set_path_absolute(true);
  return std::string(file_url.buffer());
}

outcome::std_result<std::string>
ArtifactoryBlobFetcher::read_remote_file(const std::string &path)
{
  auto file_url_rc = get_file_url(path);
  if (!file_url_rc)
    {
      return file_url_rc.as_failure();
    }
  const auto &file_url = file_url_rc.value();
  logger->debug("fetching {}", file_url);

  outcome::std_result<http::Response> response = AttestErrc::RemoteReadFailed;

  boost::asio::io_context ioc;
  boost::asio::co_spawn(
    ioc,
    [&]() -> boost::asio::awaitable<void> { response = co_await http_client->get(file_url); },
    [&](std::exception_ptr e) {
      if (e)
        {
          try
            {
              std::rethrow_exception(e);
            }
          catch (const std::exception &ex)
            {
              logger->error("request for {} failed ({})", file_url, ex.what());
            }
        }
    });
  ioc.run();

  if (!response)
    {
      logger->error("failed to fetch {} ({})", file_url, response.error().message());
      return AttestErrc::RemoteReadFailed;
    }

  auto [status, body] = std::move(response.value());
  if (status < 200 || status >= 300)
    {
      logger->error("failed to fetch {} (HTTP {})", file_url, status);
      return AttestErrc::RemoteReadFailed;
    }
  return body;
}

LocalBlobFetcher::LocalBlobFetcher(std::filesystem::path root)
  : root(std::move(root))
{
}

outcome::std_result<std::string>
LocalBlobFetcher::read_remote_file(const std::string &path)
{
  auto file = root / std::filesystem::path(path).relative_path();

  std::ifstream in(file, std::ios::binary);
  if (!in.is_open())
    {
      logger->error("failed to open {}", file.string());
      return AttestErrc::RemoteReadFailed;
    }

  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad())
    {
      logger->error("failed to read {}", file.string());
      return AttestErrc::RemoteReadFailed;
    }
  return ss.str();
}
