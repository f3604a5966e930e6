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

#ifndef VERIFY_COMMAND_HH
#define VERIFY_COMMAND_HH

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "attest/BlobFetcher.hh"
#include "attest/EvidenceVerifier.hh"
#include "attest/ReportPrinter.hh"
#include "attest/Settings.hh"
#include "http/HttpClient.hh"
#include "sigstore/TrustedRootProvider.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

struct VerifyOptions
{
  std::string subject_sha256;
  std::string subject_file;
  std::string subject_path;
  std::string evidence_metadata;
  std::string evidence_dir;
  std::string url;
  std::string access_token;
  std::vector<std::string> keys;
  std::optional<bool> use_artifactory_keys;
  attest::ReportFormat format = attest::ReportFormat::Text;
  std::string trusted_root;
  std::string tuf_root;
  std::string home;
  std::string log_level;
  std::string log_file;
  bool save_settings = false;
};

class VerifyCommand
{
public:
  static constexpr int EXIT_VERIFICATION_FAILED = 1;
  static constexpr int EXIT_ERROR = 2;
  static constexpr const char *USER_AGENT = "attest-verify/0.1.0";

  explicit VerifyCommand(VerifyOptions options);

  int run();

  static std::filesystem::path default_home();

private:
  outcome::std_result<void> init_settings();
  outcome::std_result<void> save_settings();
  outcome::std_result<std::string> get_subject_sha256() const;
  outcome::std_result<std::shared_ptr<attest::BlobFetcher>> create_blob_fetcher();
  std::shared_ptr<attest::http::HttpClient> create_http_client() const;
  std::shared_ptr<attest::sigstore::TrustedRootProvider> create_trusted_root_provider();
  attest::VerifierConfig create_verifier_config() const;
  std::string get_url() const;
  std::string get_access_token() const;

private:
  VerifyOptions options;
  std::filesystem::path home;
  std::shared_ptr<attest::Settings> settings;
  std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:cli:verify")};
};

#endif // VERIFY_COMMAND_HH
