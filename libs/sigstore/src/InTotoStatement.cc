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

#include "InTotoStatement.hh"

#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/json.hpp>

#include "sigstore/SigstoreErrors.hh"

namespace attest::sigstore
{
  outcome::std_result<InTotoStatement> InTotoStatement::from_json(const std::string &json)
  {
    boost::system::error_code ec;
    auto value = boost::json::parse(json, ec);
    if (ec || !value.is_object())
      {
        return SigstoreError::JsonParseError;
      }
    const auto &obj = value.as_object();

    InTotoStatement statement;
    if (const auto *type = obj.if_contains("_type"); type != nullptr && type->is_string())
      {
        statement.type = std::string(type->as_string());
      }
    if (const auto *predicate_type = obj.if_contains("predicateType"); predicate_type != nullptr && predicate_type->is_string())
      {
        statement.predicate_type = std::string(predicate_type->as_string());
      }

    const auto *subjects = obj.if_contains("subject");
    if (subjects == nullptr || !subjects->is_array())
      {
        return SigstoreError::InvalidEnvelope;
      }

    for (const auto &subject_value: subjects->as_array())
      {
        if (!subject_value.is_object())
          {
            return SigstoreError::InvalidEnvelope;
          }
        const auto &subject_obj = subject_value.as_object();

        InTotoSubject subject;
        if (const auto *name = subject_obj.if_contains("name"); name != nullptr && name->is_string())
          {
            subject.name = std::string(name->as_string());
          }
        if (const auto *digest = subject_obj.if_contains("digest"); digest != nullptr && digest->is_object())
          {
            for (const auto &[algorithm, digest_value]: digest->as_object())
              {
                if (digest_value.is_string())
                  {
                    subject.digest[std::string(algorithm)] = boost::algorithm::to_lower_copy(std::string(digest_value.as_string()));
                  }
              }
          }
        statement.subjects.push_back(std::move(subject));
      }

    return statement;
  }

  bool InTotoStatement::has_subject_digest(const std::string &sha256) const
  {
    const auto expected = boost::algorithm::to_lower_copy(sha256);
    return std::ranges::any_of(subjects, [&](const InTotoSubject &subject) {
      auto it = subject.digest.find("sha256");
      return it != subject.digest.end() && it->second == expected;
    });
  }

} // namespace attest::sigstore
