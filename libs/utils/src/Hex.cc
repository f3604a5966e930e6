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

#include "utils/Hex.hh"

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/case_conv.hpp>

using namespace attest::utils;

std::string
Hex::encode(const std::string &data)
{
  std::string result;
  result.reserve(data.size() * 2);
  boost::algorithm::hex_lower(data.begin(), data.end(), std::back_inserter(result));
  return result;
}

std::optional<std::string>
Hex::decode(const std::string &hex)
{
  if (hex.size() % 2 != 0)
    {
      return std::nullopt;
    }

  try
    {
      std::string result;
      result.reserve(hex.size() / 2);
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(result));
      return result;
    }
  catch (const boost::algorithm::hex_decode_error &)
    {
      return std::nullopt;
    }
}
