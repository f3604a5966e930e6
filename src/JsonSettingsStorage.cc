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

#include "JsonSettingsStorage.hh"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

#include "attest/AttestErrors.hh"

using namespace attest;

std::shared_ptr<SettingsStorage>
SettingsStorage::create(std::filesystem::path file)
{
  return std::make_shared<JsonSettingsStorage>(std::move(file));
}

JsonSettingsStorage::JsonSettingsStorage(std::filesystem::path file)
  : file(std::move(file))
{
  load();
}

void
JsonSettingsStorage::load()
{
  std::error_code ec;
  if (!std::filesystem::exists(file, ec))
    {
      logger->debug("No settings file {}", file.string());
      return;
    }

  std::ifstream in(file, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();

  boost::system::error_code parse_ec;
  auto value = boost::json::parse(buffer.str(), parse_ec);
  if (parse_ec || !value.is_object())
    {
      logger->warn("Ignoring malformed settings file {} ({})", file.string(), parse_ec.message());
      return;
    }
  store = std::move(value.as_object());
}

outcome::std_result<void>
JsonSettingsStorage::save() const
{
  std::error_code ec;
  if (file.has_parent_path())
    {
      std::filesystem::create_directories(file.parent_path(), ec);
      if (ec)
        {
          logger->error("Failed to create {} ({})", file.parent_path().string(), ec.message());
          return AttestErrc::SettingsError;
        }
    }

  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  if (!out.is_open())
    {
      logger->error("Failed to open {} for writing", file.string());
      return AttestErrc::SettingsError;
    }
  out << boost::json::serialize(store) << '\n';
  if (!out)
    {
      logger->error("Failed to write {}", file.string());
      return AttestErrc::SettingsError;
    }
  return outcome::success();
}

outcome::std_result<void>
JsonSettingsStorage::remove_key(const std::string &name)
{
  if (store.erase(name) == 0)
    {
      return outcome::success();
    }
  return save();
}

std::optional<SettingValue>
JsonSettingsStorage::get_value(const std::string &name, SettingType type) const
{
  const auto *value = store.if_contains(name);
  if (value == nullptr)
    {
      return {};
    }

  switch (type)
    {
    case SettingType::Boolean:
      if (value->is_bool())
        {
          return value->as_bool();
        }
      break;

    case SettingType::Int32:
      if (value->is_int64())
        {
          return static_cast<int32_t>(value->as_int64());
        }
      break;

    case SettingType::Int64:
      if (value->is_int64())
        {
          return value->as_int64();
        }
      if (value->is_uint64())
        {
          return static_cast<int64_t>(value->as_uint64());
        }
      break;

    case SettingType::Double:
      if (value->is_number())
        {
          return value->to_number<double>();
        }
      break;

    case SettingType::Unknown:
      [[fallthrough]];

    case SettingType::String:
      if (value->is_string())
        {
          return std::string(value->as_string());
        }
      break;
    }

  logger->warn("Setting {} has an unexpected type", name);
  return {};
}

outcome::std_result<void>
JsonSettingsStorage::set_value(const std::string &name, const SettingValue &value)
{
  std::visit(
    [this, &name](auto &&arg) {
      using T = std::decay_t<decltype(arg)>;

      if constexpr (std::is_same_v<std::string, T>)
        {
          store[name] = boost::json::string(arg);
        }
      else
        {
          store[name] = arg;
        }
    },
    value);
  return save();
}
