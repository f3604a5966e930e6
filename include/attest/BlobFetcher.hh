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

#ifndef ATTEST_BLOB_FETCHER_HH
#define ATTEST_BLOB_FETCHER_HH

#include <filesystem>
#include <memory>
#include <string>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "http/HttpClient.hh"
#include "utils/Logging.hh"

namespace attest
{
  namespace outcome = boost::outcome_v2;

  // Reads the raw bytes of an evidence file given its download path.
  class BlobFetcher
  {
  public:
    virtual ~BlobFetcher() = default;

    virtual outcome::std_result<std::string> read_remote_file(const std::string &path) = 0;
  };

  // Fetches <url>/artifactory/<path>, optionally with a bearer token.
  class ArtifactoryBlobFetcher : public BlobFetcher
  {
  public:
    ArtifactoryBlobFetcher(std::shared_ptr<attest::http::IHttpClient> http_client, std::string url, std::string access_token = "");

    outcome::std_result<std::string> read_remote_file(const std::string &path) override;

    outcome::std_result<std::string> get_file_url(const std::string &path) const;

  private:
    std::shared_ptr<attest::http::IHttpClient> http_client;
    std::string url;
    std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:core:artifactory")};
  };

  // Reads <root>/<path> from the local filesystem.
  class LocalBlobFetcher : public BlobFetcher
  {
  public:
    explicit LocalBlobFetcher(std::filesystem::path root);

    outcome::std_result<std::string> read_remote_file(const std::string &path) override;

  private:
    std::filesystem::path root;
    std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:core:local")};
  };

} // namespace attest

#endif // ATTEST_BLOB_FETCHER_HH
