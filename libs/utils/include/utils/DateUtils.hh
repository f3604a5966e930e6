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

#ifndef ATTEST_UTILS_DATEUTILS_HH
#define ATTEST_UTILS_DATEUTILS_HH

#include <chrono>
#include <optional>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace attest::utils
{
  class DateUtils
  {
  public:
    // Parses RFC 3339 / ISO 8601 timestamps (fractional seconds and numeric
    // offsets allowed) and RFC 1123 dates. Throws std::runtime_error.
    static std::chrono::system_clock::time_point parse_time_point(const std::string &date_str);

    static std::string format_rfc3339(std::chrono::system_clock::time_point tp);

  private:
    static std::optional<boost::posix_time::ptime> try_parse(const std::string &date_str, const std::string &format);
  };
} // namespace attest::utils

#endif // ATTEST_UTILS_DATEUTILS_HH
