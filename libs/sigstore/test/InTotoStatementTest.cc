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

#include <gtest/gtest.h>

#include "InTotoStatement.hh"
#include "sigstore/SigstoreErrors.hh"

#include "TestCrypto.hh"

namespace attest::sigstore::test
{
  TEST(InTotoStatementTest, ParseStatement)
  {
    const std::string sha256(64, 'b');
    auto result = InTotoStatement::from_json(attest::test::in_toto_statement(sha256));
    ASSERT_TRUE(result);

    const auto &statement = result.value();
    EXPECT_EQ(statement.type, "https://in-toto.io/Statement/v1");
    ASSERT_EQ(statement.subjects.size(), 1U);
    EXPECT_EQ(statement.subjects[0].digest.at("sha256"), sha256);
    EXPECT_TRUE(statement.has_subject_digest(sha256));
    EXPECT_FALSE(statement.has_subject_digest(std::string(64, 'c')));
  }

  TEST(InTotoStatementTest, DigestComparisonIgnoresCase)
  {
    auto result = InTotoStatement::from_json(R"({"_type":"https://in-toto.io/Statement/v1","predicateType":"https://slsa.dev/provenance/v1",)"
                                             R"("subject":[{"name":"a","digest":{"sha512":"00"}},{"name":"b","digest":{"sha256":"ABCDEF"}}]})");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().predicate_type, "https://slsa.dev/provenance/v1");
    EXPECT_EQ(result.value().subjects.size(), 2U);
    EXPECT_TRUE(result.value().has_subject_digest("abcdef"));
    EXPECT_TRUE(result.value().has_subject_digest("AbCdEf"));
    EXPECT_FALSE(result.value().has_subject_digest("00"));
  }

  TEST(InTotoStatementTest, MissingSubject)
  {
    auto result = InTotoStatement::from_json(R"({"_type":"https://in-toto.io/Statement/v1"})");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InvalidEnvelope);

    EXPECT_FALSE(InTotoStatement::from_json(R"({"subject":["not-an-object"]})"));
  }

  TEST(InTotoStatementTest, InvalidJson)
  {
    auto result = InTotoStatement::from_json("{");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::JsonParseError);
  }
} // namespace attest::sigstore::test
