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

#include "CanonicalJson.hh"

#include <algorithm>
#include <vector>

#include "sigstore/SigstoreErrors.hh"

namespace attest::sigstore
{
  namespace
  {
    void append_string(std::string &out, boost::json::string_view str)
    {
      out += '"';
      for (char c: str)
        {
          if (c == '"' || c == '\\')
            {
              out += '\\';
            }
          out += c;
        }
      out += '"';
    }

    outcome::std_result<void> append_value(std::string &out, const boost::json::value &value)
    {
      switch (value.kind())
        {
        case boost::json::kind::null:
          out += "null";
          break;
        case boost::json::kind::bool_:
          out += value.get_bool() ? "true" : "false";
          break;
        case boost::json::kind::int64:
          out += std::to_string(value.get_int64());
          break;
        case boost::json::kind::uint64:
          out += std::to_string(value.get_uint64());
          break;
        case boost::json::kind::double_:
          return SigstoreError::InvalidTufMetadata;
        case boost::json::kind::string:
          append_string(out, value.get_string());
          break;
        case boost::json::kind::array:
          {
            out += '[';
            bool first = true;
            for (const auto &element: value.get_array())
              {
                if (!first)
                  {
                    out += ',';
                  }
                first = false;
                auto rc = append_value(out, element);
                if (!rc)
                  {
                    return rc;
                  }
              }
            out += ']';
            break;
          }
        case boost::json::kind::object:
          {
            const auto &obj = value.get_object();
            std::vector<const boost::json::key_value_pair *> members;
            members.reserve(obj.size());
            for (const auto &member: obj)
              {
                members.push_back(&member);
              }
            std::sort(members.begin(), members.end(), [](const auto *a, const auto *b) { return a->key() < b->key(); });

            out += '{';
            bool first = true;
            for (const auto *member: members)
              {
                if (!first)
                  {
                    out += ',';
                  }
                first = false;
                append_string(out, member->key());
                out += ':';
                auto rc = append_value(out, member->value());
                if (!rc)
                  {
                    return rc;
                  }
              }
            out += '}';
            break;
          }
        }
      return outcome::success();
    }
  } // namespace

  outcome::std_result<std::string> canonical_json(const boost::json::value &value)
  {
    std::string out;
    auto rc = append_value(out, value);
    if (!rc)
      {
        return rc.as_failure();
      }
    return out;
  }
} // namespace attest::sigstore
