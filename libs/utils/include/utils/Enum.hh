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

#ifndef ATTEST_UTILS_ENUM_HH
#define ATTEST_UTILS_ENUM_HH

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace attest::utils
{
  // Specialise with a static constexpr `names` array of {string_view, Enum} pairs.
  template<typename Enum>
  struct enum_traits
  {
  };

  template<typename Enum, typename = std::void_t<>>
  struct enum_has_names : std::false_type
  {
  };

  template<typename Enum>
  struct enum_has_names<Enum, std::void_t<decltype(enum_traits<Enum>::names)>> : std::true_type
  {
  };

  template<typename Enum>
  constexpr inline bool enum_has_names_v = enum_has_names<Enum>::value;

  template<typename Enum>
  std::optional<Enum> enum_from_string(std::string_view key)
  {
    const auto &names = enum_traits<Enum>::names;
    const auto it = std::find_if(begin(names), end(names), [&key](const auto &v) { return v.first == key; });
    if (it == std::end(names))
      {
        return std::nullopt;
      }
    return it->second;
  }

  template<typename Enum>
  std::string_view enum_to_string(Enum e)
  {
    const auto &names = enum_traits<Enum>::names;
    const auto it = std::find_if(begin(names), end(names), [&e](const auto &v) { return v.second == e; });
    if (it == std::end(names))
      {
        return {};
      }
    return it->first;
  }
} // namespace attest::utils

template<typename Enum>
requires attest::utils::enum_has_names_v<Enum>
struct fmt::formatter<Enum> : fmt::formatter<std::string_view>
{
  auto format(Enum e, format_context &ctx) const
  {
    return fmt::formatter<std::string_view>::format(attest::utils::enum_to_string(e), ctx);
  }
};

#endif // ATTEST_UTILS_ENUM_HH
