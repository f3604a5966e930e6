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

#ifndef ATTEST_SETTINGS_STORAGE_HH
#define ATTEST_SETTINGS_STORAGE_HH

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <boost/outcome/std_result.hpp>

namespace attest
{
  namespace outcome = boost::outcome_v2;

  enum class SettingType
  {
    Unknown,
    Boolean,
    Int32,
    Int64,
    Double,
    String,
  };

  using SettingValue = std::variant<bool, int32_t, int64_t, double, std::string>;

  class SettingsStorage
  {
  public:
    virtual ~SettingsStorage() = default;

    // JSON file backed storage.
    static std::shared_ptr<SettingsStorage> create(std::filesystem::path file);

    virtual outcome::std_result<void> remove_key(const std::string &name) = 0;
    virtual std::optional<SettingValue> get_value(const std::string &name, SettingType type) const = 0;
    virtual outcome::std_result<void> set_value(const std::string &name, const SettingValue &value) = 0;
  };
} // namespace attest

#endif // ATTEST_SETTINGS_STORAGE_HH
