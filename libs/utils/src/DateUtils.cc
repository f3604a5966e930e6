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

#include "utils/DateUtils.hh"

#include <boost/date_time/gregorian/gregorian.hpp>
#include <regex>
#include <sstream>
#include <stdexcept>

using namespace attest::utils;

namespace
{
  const std::regex rfc3339_regex(R"(^(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2})(\.\d+)?(Z|z|[+-]\d{2}:\d{2})?$)");
}

std::optional<boost::posix_time::ptime>
DateUtils::try_parse(const std::string &date_str, const std::string &format)
{
  std::locale locale(std::locale::classic(), new boost::posix_time::time_input_facet(format));
  std::istringstream iss(date_str);
  iss.imbue(locale);

  boost::posix_time::ptime pt;
  try
    {
      iss >> pt;
    }
  catch (const std::exception &)
    {
      return std::nullopt;
    }

  if (pt != boost::posix_time::ptime())
    {
      return pt;
    }
  return std::nullopt;
}

std::chrono::system_clock::time_point
DateUtils::parse_time_point(const std::string &date_str)
{
  std::optional<boost::posix_time::ptime> pt;
  boost::posix_time::time_duration offset;

  std::smatch match;
  if (std::regex_match(date_str, match, rfc3339_regex))
    {
      pt = try_parse(match[1].str(), "%Y-%m-%dT%H:%M:%S");

      std::string zone = match[3].str();
      if (zone.size() == 6)
        {
          int hours = std::stoi(zone.substr(1, 2));
          int minutes = std::stoi(zone.substr(4, 2));
          offset = boost::posix_time::hours(hours) + boost::posix_time::minutes(minutes);
          if (zone[0] == '-')
            {
              offset = -offset;
            }
        }
    }
  else
    {
      pt = try_parse(date_str, "%a, %d %b %Y %H:%M:%S %ZP");
    }

  if (!pt)
    {
      throw std::runtime_error("Failed to parse time string: " + date_str);
    }

  boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
  boost::posix_time::time_duration duration = (*pt - offset) - epoch;
  return std::chrono::system_clock::time_point(std::chrono::seconds(duration.total_seconds()));
}

std::string
DateUtils::format_rfc3339(std::chrono::system_clock::time_point tp)
{
  auto pt = boost::posix_time::from_time_t(std::chrono::system_clock::to_time_t(tp));
  return boost::posix_time::to_iso_extended_string(pt) + "Z";
}
