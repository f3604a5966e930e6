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

#include "utils/Base64.hh"

#include <algorithm>
#include <cctype>

#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

using namespace attest::utils;

namespace
{
  bool is_base64_char(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' || c == '/';
  }

  // Returns the number of trailing '=' characters. Input length is a multiple of 4.
  std::size_t check_base64(const std::string &input)
  {
    auto padding_pos = input.find('=');
    auto data_end = padding_pos == std::string::npos ? input.end() : input.begin() + static_cast<std::ptrdiff_t>(padding_pos);

    auto invalid = std::find_if(input.begin(), data_end, [](char c) { return !is_base64_char(c); });
    if (invalid != data_end)
      {
        throw Base64Exception("Invalid character in Base64 input: '" + std::string(1, *invalid) + "'");
      }

    if (padding_pos == std::string::npos)
      {
        return 0;
      }

    std::size_t padding = input.size() - padding_pos;
    if (padding > 2)
      {
        throw Base64Exception("Too many padding characters in Base64 input");
      }
    if (std::any_of(data_end, input.end(), [](char c) { return c != '='; }))
      {
        throw Base64Exception("Invalid Base64 padding");
      }
    return padding;
  }
} // namespace

std::string
Base64::decode(const std::string &val)
{
  if (val.empty())
    {
      return "";
    }

  std::string input = val;
  input.append((4 - input.size() % 4) % 4, '=');
  std::size_t padding = check_base64(input);

  try
    {
      using namespace boost::archive::iterators;
      using It = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

      std::replace(input.begin(), input.end(), '=', 'A');
      std::string output(It(input.begin()), It(input.end()));
      output.erase(output.end() - static_cast<std::string::difference_type>(padding), output.end());
      return output;
    }
  catch (const std::exception &e)
    {
      throw Base64Exception("Base64 decode failed: " + std::string(e.what()));
    }
}

std::string
Base64::encode(const std::string &val)
{
  if (val.empty())
    {
      return "";
    }

  try
    {
      using namespace boost::archive::iterators;
      using It = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

      std::string encoded(It(val.begin()), It(val.end()));
      return encoded.append((3 - val.size() % 3) % 3, '=');
    }
  catch (const std::exception &e)
    {
      throw Base64Exception("Base64 encode failed: " + std::string(e.what()));
    }
}
