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

#include "VerifyCommand.hh"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include <unistd.h>

#include "attest/AttestErrors.hh"
#include "attest/EvidenceMetadataLoader.hh"
#include "attest/ProgressSink.hh"
#include "attest/SettingsStorage.hh"
#include "http/HttpClient.hh"
#include "sigstore/CryptographicAlgorithms.hh"

using namespace attest;

namespace
{
  class LoggingProgressSink : public ProgressSink
  {
  public:
    void start(std::size_t total) override
    {
      total_ = total;
      logger->info("verifying {} evidence", total);
    }

    void increment() override
    {
      done++;
      logger->debug("verified {}/{}", done, total_);
    }

  private:
    std::size_t total_ = 0;
    std::size_t done = 0;
    std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:cli:progress")};
  };

  std::string
  get_env(const char *name)
  {
    const char *value = std::getenv(name);
    return value != nullptr ? value : "";
  }
} // namespace

VerifyCommand::VerifyCommand(VerifyOptions options)
  : options(std::move(options))
{
}

std::filesystem::path
VerifyCommand::default_home()
{
  auto attest_home = get_env("ATTEST_HOME");
  if (!attest_home.empty())
    {
      return attest_home;
    }
  auto user_home = get_env("HOME");
  if (user_home.empty())
    {
      return std::filesystem::current_path() / ".attest";
    }
  return std::filesystem::path(user_home) / ".attest";
}

int
VerifyCommand::run()
{
  home = options.home.empty() ? default_home() : std::filesystem::path(options.home);

  if (auto rc = init_settings(); !rc)
    {
      std::cerr << "Error: " << rc.error().message() << std::endl;
      return EXIT_ERROR;
    }

  if (options.save_settings)
    {
      if (auto rc = save_settings(); !rc)
        {
          std::cerr << "Error: " << rc.error().message() << std::endl;
          return EXIT_ERROR;
        }
    }

  auto subject_sha256 = get_subject_sha256();
  if (!subject_sha256)
    {
      std::cerr << "Error: " << subject_sha256.error().message() << std::endl;
      return EXIT_ERROR;
    }

  EvidenceMetadataLoader loader;
  auto evidence = loader.load_file(options.evidence_metadata);
  if (!evidence)
    {
      std::cerr << "Error: " << evidence.error().message() << std::endl;
      return EXIT_ERROR;
    }

  auto blob_fetcher = create_blob_fetcher();
  if (!blob_fetcher)
    {
      std::cerr << "Error: " << blob_fetcher.error().message() << std::endl;
      return EXIT_ERROR;
    }

  auto verifier = EvidenceVerifier::create(create_verifier_config(), blob_fetcher.value(), create_trusted_root_provider());
  verifier->set_progress_sink(std::make_shared<LoggingProgressSink>());

  auto subject_path = options.subject_path.empty() ? options.subject_file : options.subject_path;
  auto response = verifier->verify(subject_sha256.value(), evidence.value(), subject_path);
  if (!response)
    {
      std::cerr << "Error: " << response.error().message() << std::endl;
      return EXIT_ERROR;
    }

  bool use_color = options.format == ReportFormat::Text && isatty(STDOUT_FILENO) != 0;
  auto printer = ReportPrinter::create(options.format, std::cout, use_color);
  auto printed = printer->print(response.value());
  if (!printed)
    {
      if (printed.error() == AttestErrc::VerificationFailed)
        {
          return EXIT_VERIFICATION_FAILED;
        }
      std::cerr << "Error: " << printed.error().message() << std::endl;
      return EXIT_ERROR;
    }
  return EXIT_SUCCESS;
}

outcome::std_result<void>
VerifyCommand::init_settings()
{
  std::error_code ec;
  std::filesystem::create_directories(home, ec);
  if (ec)
    {
      logger->error("failed to create {} ({})", home.string(), ec.message());
      return AttestErrc::SettingsError;
    }
  settings = std::make_shared<Settings>(SettingsStorage::create(home / "config.json"));
  return outcome::success();
}

outcome::std_result<void>
VerifyCommand::save_settings()
{
  if (!options.url.empty())
    {
      auto rc = settings->set_server_url(options.url);
      if (!rc)
        {
          return rc.error();
        }
    }
  if (!options.access_token.empty())
    {
      auto rc = settings->set_access_token(options.access_token);
      if (!rc)
        {
          return rc.error();
        }
    }
  if (!options.trusted_root.empty())
    {
      auto rc = settings->set_trusted_root_path(std::filesystem::absolute(options.trusted_root).string());
      if (!rc)
        {
          return rc.error();
        }
    }
  if (!options.tuf_root.empty())
    {
      auto rc = settings->set_tuf_root_path(std::filesystem::absolute(options.tuf_root).string());
      if (!rc)
        {
          return rc.error();
        }
    }
  if (options.use_artifactory_keys)
    {
      auto rc = settings->set_use_artifactory_keys(*options.use_artifactory_keys);
      if (!rc)
        {
          return rc.error();
        }
    }
  logger->info("settings saved to {}", (home / "config.json").string());
  return outcome::success();
}

outcome::std_result<std::string>
VerifyCommand::get_subject_sha256() const
{
  if (!options.subject_sha256.empty())
    {
      return options.subject_sha256;
    }

  std::ifstream in(options.subject_file, std::ios::binary);
  if (!in.is_open())
    {
      logger->error("failed to open subject {}", options.subject_file);
      return AttestErrc::InvalidInput;
    }
  std::ostringstream ss;
  ss << in.rdbuf();
  return sigstore::sha256_hex(ss.str());
}

std::string
VerifyCommand::get_url() const
{
  if (!options.url.empty())
    {
      return options.url;
    }
  auto url = get_env("ATTEST_URL");
  return url.empty() ? settings->get_server_url() : url;
}

std::string
VerifyCommand::get_access_token() const
{
  if (!options.access_token.empty())
    {
      return options.access_token;
    }
  auto token = get_env("ATTEST_ACCESS_TOKEN");
  return token.empty() ? settings->get_access_token() : token;
}

outcome::std_result<std::shared_ptr<BlobFetcher>>
VerifyCommand::create_blob_fetcher()
{
  if (!options.evidence_dir.empty())
    {
      return std::make_shared<LocalBlobFetcher>(options.evidence_dir);
    }

  auto url = get_url();
  if (url.empty())
    {
      logger->error("no evidence directory or server URL configured");
      return AttestErrc::InvalidInput;
    }
  return std::make_shared<ArtifactoryBlobFetcher>(create_http_client(), url, get_access_token());
}

std::shared_ptr<http::HttpClient>
VerifyCommand::create_http_client() const
{
  auto http_client = std::make_shared<http::HttpClient>();
  http_client->options().set_user_agent(USER_AGENT);
  return http_client;
}

std::shared_ptr<sigstore::TrustedRootProvider>
VerifyCommand::create_trusted_root_provider()
{
  auto trusted_root = options.trusted_root.empty() ? settings->get_trusted_root_path() : options.trusted_root;
  if (!trusted_root.empty())
    {
      return std::make_shared<sigstore::FileTrustedRootProvider>(trusted_root);
    }

  std::string initial_root;
  auto tuf_root = options.tuf_root.empty() ? settings->get_tuf_root_path() : options.tuf_root;
  if (!tuf_root.empty())
    {
      std::ifstream in(tuf_root, std::ios::binary);
      if (in.is_open())
        {
          std::ostringstream ss;
          ss << in.rdbuf();
          initial_root = ss.str();
        }
      else
        {
          logger->warn("failed to open TUF root {}", tuf_root);
        }
    }
  return std::make_shared<sigstore::TufTrustedRootProvider>(create_http_client(),
                                                            home / "security" / "certs",
                                                            initial_root,
                                                            settings->get_trust_root_refresh_interval());
}

VerifierConfig
VerifyCommand::create_verifier_config() const
{
  return VerifierConfig{
    .key_paths = options.keys,
    .use_artifactory_keys = options.use_artifactory_keys.value_or(settings->get_use_artifactory_keys()),
    .required_signed_certificate_timestamps = settings->get_required_signed_certificate_timestamps(),
    .required_observer_timestamps = settings->get_required_observer_timestamps(),
    .required_transparency_log_entries = settings->get_required_transparency_log_entries(),
  };
}
