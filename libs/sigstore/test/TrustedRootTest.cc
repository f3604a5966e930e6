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

#include <chrono>

#include "sigstore/SigstoreErrors.hh"
#include "sigstore/TrustedRoot.hh"
#include "utils/DateUtils.hh"
#include "utils/TempDirectory.hh"
#include "utils/TestUtils.hh"

#include "TestCrypto.hh"

using namespace attest::sigstore;

class TrustedRootTest : public ::testing::Test
{
protected:
  attest::test::TestSigstore sigstore;
};

TEST_F(TrustedRootTest, LoadGeneratedTrustedRoot)
{
  auto result = TrustedRoot::from_json(sigstore.trusted_root_json());
  ASSERT_TRUE(result);

  const auto &root = result.value();
  ASSERT_EQ(root->tlogs().size(), 1U);
  EXPECT_EQ(root->tlogs()[0].base_url, "https://rekor.test");
  EXPECT_EQ(root->tlogs()[0].log_id, sigstore.get_log_id());
  ASSERT_NE(root->tlogs()[0].public_key, nullptr);
  ASSERT_TRUE(root->tlogs()[0].valid_for.start.has_value());
  EXPECT_FALSE(root->tlogs()[0].valid_for.end.has_value());

  ASSERT_EQ(root->certificate_authorities().size(), 1U);
  EXPECT_EQ(root->certificate_authorities()[0].uri, "https://fulcio.test");
  EXPECT_EQ(root->certificate_authorities()[0].chain.size(), 1U);

  EXPECT_TRUE(root->ctlogs().empty());
  EXPECT_TRUE(root->timestamp_authorities().empty());
}

TEST_F(TrustedRootTest, FindTransparencyLog)
{
  auto result = TrustedRoot::from_json(sigstore.trusted_root_json());
  ASSERT_TRUE(result);

  EXPECT_NE(result.value()->find_tlog(sigstore.get_log_id()), nullptr);
  EXPECT_EQ(result.value()->find_tlog("unknown"), nullptr);
  EXPECT_EQ(result.value()->find_ctlog(sigstore.get_log_id()), nullptr);
}

TEST_F(TrustedRootTest, ValidityPeriod)
{
  using attest::utils::DateUtils;

  ValidityPeriod period{.start = DateUtils::parse_time_point("2022-01-01T00:00:00Z"),
                        .end = DateUtils::parse_time_point("2023-01-01T00:00:00Z")};

  EXPECT_TRUE(period.contains(DateUtils::parse_time_point("2022-06-01T00:00:00Z")));
  EXPECT_FALSE(period.contains(DateUtils::parse_time_point("2021-12-31T23:59:59Z")));
  EXPECT_FALSE(period.contains(DateUtils::parse_time_point("2023-01-01T00:00:01Z")));

  ValidityPeriod open_ended{.start = DateUtils::parse_time_point("2022-01-01T00:00:00Z"), .end = std::nullopt};
  EXPECT_TRUE(open_ended.contains(std::chrono::system_clock::now()));
}

TEST_F(TrustedRootTest, UnsupportedLogKeyIsSkipped)
{
  auto result = TrustedRoot::from_json(R"({"tlogs":[{"baseUrl":"https://rekor.test","publicKey":{"rawBytes":"AAAA"},"logId":{"keyId":"AAAA"}}]})");
  ASSERT_TRUE(result);
  EXPECT_TRUE(result.value()->tlogs().empty());
}

TEST_F(TrustedRootTest, InvalidTrustedRoot)
{
  auto not_object = TrustedRoot::from_json("[]");
  ASSERT_FALSE(not_object);
  EXPECT_EQ(not_object.error(), SigstoreError::InvalidTrustedRoot);

  EXPECT_FALSE(TrustedRoot::from_json("{ not json"));
  EXPECT_FALSE(TrustedRoot::from_json(R"({"tlogs":[{"baseUrl":"https://rekor.test"}]})"));
  EXPECT_FALSE(TrustedRoot::from_json(R"({"certificateAuthorities":[{"uri":"https://fulcio.test","certChain":{"certificates":[]}}]})"));
  EXPECT_FALSE(TrustedRoot::from_json(R"({"certificateAuthorities":[{"uri":"https://fulcio.test","certChain":{"certificates":[{"rawBytes":"AAAA"}]}}]})"));
}

TEST_F(TrustedRootTest, LoadFromFile)
{
  attest::utils::TempDirectory temp_dir;
  auto path = temp_dir.get_path() / "trusted_root.json";
  write_file(path, sigstore.trusted_root_json());

  auto result = TrustedRoot::from_file(path);
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value()->tlogs().size(), 1U);

  auto missing = TrustedRoot::from_file(temp_dir.get_path() / "missing.json");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error(), SigstoreError::TrustedRootUnavailable);
}
