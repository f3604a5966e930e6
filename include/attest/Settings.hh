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

#ifndef ATTEST_SETTINGS_HH
#define ATTEST_SETTINGS_HH

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "attest/SettingsStorage.hh"
#include "utils/Logging.hh"

namespace attest
{
  namespace outcome = boost::outcome_v2;

  class Settings
  {
  public:
    explicit Settings(std::shared_ptr<SettingsStorage> storage);

    std::string get_server_url() const;
    outcome::std_result<void> set_server_url(const std::string &url);

    std::string get_access_token() const;
    outcome::std_result<void> set_access_token(const std::string &token);

    std::string get_trusted_root_path() const;
    outcome::std_result<void> set_trusted_root_path(const std::string &path);

    std::string get_tuf_root_path() const;
    outcome::std_result<void> set_tuf_root_path(const std::string &path);

    bool get_use_artifactory_keys() const;
    outcome::std_result<void> set_use_artifactory_keys(bool use);

    std::chrono::seconds get_trust_root_refresh_interval() const;
    outcome::std_result<void> set_trust_root_refresh_interval(std::chrono::seconds interval);

    std::size_t get_required_signed_certificate_timestamps() const;
    outcome::std_result<void> set_required_signed_certificate_timestamps(std::size_t count);

    std::size_t get_required_observer_timestamps() const;
    outcome::std_result<void> set_required_observer_timestamps(std::size_t count);

    std::size_t get_required_transparency_log_entries() const;
    outcome::std_result<void> set_required_transparency_log_entries(std::size_t count);

  private:
    std::string get_string(const char *name) const;
    std::size_t get_count(const char *name, std::size_t default_value) const;
    outcome::std_result<void> set(const char *name, const SettingValue &value);

  private:
    std::shared_ptr<SettingsStorage> storage;
    std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:core:settings")};
  };
} // namespace attest

#endif // ATTEST_SETTINGS_HH
