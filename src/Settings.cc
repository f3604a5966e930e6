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

#include "attest/Settings.hh"

#include <utility>

namespace
{
  constexpr const char *server_url = "ServerUrl";
  constexpr const char *access_token = "AccessToken";
  constexpr const char *trusted_root_path = "TrustedRootPath";
  constexpr const char *tuf_root_path = "TufRootPath";
  constexpr const char *use_artifactory_keys = "UseArtifactoryKeys";
  constexpr const char *trust_root_refresh_interval = "TrustRootRefreshInterval";
  constexpr const char *required_signed_certificate_timestamps = "RequiredSignedCertificateTimestamps";
  constexpr const char *required_observer_timestamps = "RequiredObserverTimestamps";
  constexpr const char *required_transparency_log_entries = "RequiredTransparencyLogEntries";

  constexpr std::chrono::seconds default_refresh_interval{std::chrono::hours(24)};
  constexpr std::size_t default_threshold = 1;
} // namespace

using namespace attest;

Settings::Settings(std::shared_ptr<SettingsStorage> storage)
  : storage(std::move(storage))
{
}

std::string
Settings::get_string(const char *name) const
{
  auto value = storage->get_value(name, SettingType::String);
  if (value)
    {
      return std::get<std::string>(value.value());
    }
  return {};
}

std::size_t
Settings::get_count(const char *name, std::size_t default_value) const
{
  auto value = storage->get_value(name, SettingType::Int64);
  if (value && std::get<int64_t>(value.value()) >= 0)
    {
      return static_cast<std::size_t>(std::get<int64_t>(value.value()));
    }
  return default_value;
}

outcome::std_result<void>
Settings::set(const char *name, const SettingValue &value)
{
  auto rc = storage->set_value(name, value);
  if (!rc)
    {
      logger->error("Failed to set {} ({})", name, rc.error().message());
    }
  return rc;
}

std::string
Settings::get_server_url() const
{
  return get_string(server_url);
}

outcome::std_result<void>
Settings::set_server_url(const std::string &url)
{
  return set(server_url, url);
}

std::string
Settings::get_access_token() const
{
  return get_string(access_token);
}

outcome::std_result<void>
Settings::set_access_token(const std::string &token)
{
  return set(access_token, token);
}

std::string
Settings::get_trusted_root_path() const
{
  return get_string(trusted_root_path);
}

outcome::std_result<void>
Settings::set_trusted_root_path(const std::string &path)
{
  return set(trusted_root_path, path);
}

std::string
Settings::get_tuf_root_path() const
{
  return get_string(tuf_root_path);
}

outcome::std_result<void>
Settings::set_tuf_root_path(const std::string &path)
{
  return set(tuf_root_path, path);
}

bool
Settings::get_use_artifactory_keys() const
{
  auto use = storage->get_value(use_artifactory_keys, SettingType::Boolean);
  if (use)
    {
      return std::get<bool>(use.value());
    }
  return true;
}

outcome::std_result<void>
Settings::set_use_artifactory_keys(bool use)
{
  return set(use_artifactory_keys, use);
}

std::chrono::seconds
Settings::get_trust_root_refresh_interval() const
{
  auto interval = storage->get_value(trust_root_refresh_interval, SettingType::Int64);
  if (interval)
    {
      return std::chrono::seconds(std::get<int64_t>(interval.value()));
    }
  return default_refresh_interval;
}

outcome::std_result<void>
Settings::set_trust_root_refresh_interval(std::chrono::seconds interval)
{
  return set(trust_root_refresh_interval, static_cast<int64_t>(interval.count()));
}

std::size_t
Settings::get_required_signed_certificate_timestamps() const
{
  return get_count(required_signed_certificate_timestamps, default_threshold);
}

outcome::std_result<void>
Settings::set_required_signed_certificate_timestamps(std::size_t count)
{
  return set(required_signed_certificate_timestamps, static_cast<int64_t>(count));
}

std::size_t
Settings::get_required_observer_timestamps() const
{
  return get_count(required_observer_timestamps, default_threshold);
}

outcome::std_result<void>
Settings::set_required_observer_timestamps(std::size_t count)
{
  return set(required_observer_timestamps, static_cast<int64_t>(count));
}

std::size_t
Settings::get_required_transparency_log_entries() const
{
  return get_count(required_transparency_log_entries, default_threshold);
}

outcome::std_result<void>
Settings::set_required_transparency_log_entries(std::size_t count)
{
  return set(required_transparency_log_entries, static_cast<int64_t>(count));
}
