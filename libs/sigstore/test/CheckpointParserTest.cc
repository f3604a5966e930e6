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

#include <string>

#include "CheckpointParser.hh"
#include "utils/Base64.hh"

using namespace attest::sigstore;

class CheckpointParserTest : public ::testing::Test
{
protected:
  CheckpointParser parser;
};

TEST_F(CheckpointParserTest, ParseRekorCheckpoint)
{
  const std::string root_hash(32, '\x11');
  const std::string signature = "\x01\x02\x03\x04signature-bytes";
  const std::string checkpoint_data = "rekor.sigstore.dev - 1193050959916656506\n"
                                      "10756292\n"
                                      + attest::utils::Base64::encode(root_hash) + "\n"
                                      + "\n"
                                      + "— rekor.sigstore.dev " + attest::utils::Base64::encode(signature) + "\n";

  auto result = parser.parse(checkpoint_data);
  ASSERT_TRUE(result);

  const auto &checkpoint = result.value();
  EXPECT_EQ(checkpoint.origin, "rekor.sigstore.dev - 1193050959916656506");
  EXPECT_EQ(checkpoint.tree_size, 10756292U);
  EXPECT_EQ(checkpoint.root_hash, root_hash);
  EXPECT_TRUE(checkpoint.extensions.empty());
  ASSERT_EQ(checkpoint.signatures.size(), 1U);
  EXPECT_EQ(checkpoint.signatures[0].signer, "rekor.sigstore.dev");
  EXPECT_EQ(checkpoint.signatures[0].key_hint, "\x01\x02\x03\x04");
  EXPECT_EQ(checkpoint.signatures[0].signature, "signature-bytes");
  EXPECT_EQ(checkpoint.body,
            "rekor.sigstore.dev - 1193050959916656506\n10756292\n" + attest::utils::Base64::encode(root_hash) + "\n");
}

TEST_F(CheckpointParserTest, ParseExtensionsAndMultipleSignatures)
{
  const std::string checkpoint_data = "log.example - 42\n"
                                      "1337\n"
                                      "q83v\n"
                                      "Timestamp: 1689748607742585419\n"
                                      "\n"
                                      "— log.example AAAAAWZpcnN0\n"
                                      "- witness AAAAAnNlY29uZA==\n";

  auto result = parser.parse(checkpoint_data);
  ASSERT_TRUE(result);

  const auto &checkpoint = result.value();
  EXPECT_EQ(checkpoint.tree_size, 1337U);
  ASSERT_EQ(checkpoint.extensions.size(), 1U);
  EXPECT_EQ(checkpoint.extensions[0], "Timestamp: 1689748607742585419");
  ASSERT_EQ(checkpoint.signatures.size(), 2U);
  EXPECT_EQ(checkpoint.signatures[0].signature, "first");
  EXPECT_EQ(checkpoint.signatures[1].signer, "witness");
  EXPECT_EQ(checkpoint.signatures[1].signature, "second");
}

TEST_F(CheckpointParserTest, MissingSeparator)
{
  EXPECT_FALSE(parser.parse("log.example - 42\n1337\nq83v\n— log.example AAAAAWZpcnN0\n"));
}

TEST_F(CheckpointParserTest, TooFewBodyLines)
{
  EXPECT_FALSE(parser.parse("log.example - 42\n1337\n\n— log.example AAAAAWZpcnN0\n"));
}

TEST_F(CheckpointParserTest, NonNumericTreeSize)
{
  EXPECT_FALSE(parser.parse("log.example - 42\nabc\nq83v\n\n— log.example AAAAAWZpcnN0\n"));
}

TEST_F(CheckpointParserTest, SignatureWithoutDash)
{
  EXPECT_FALSE(parser.parse("log.example - 42\n1337\nq83v\n\nlog.example AAAAAWZpcnN0\n"));
}

TEST_F(CheckpointParserTest, SignatureTooShort)
{
  EXPECT_FALSE(parser.parse("log.example - 42\n1337\nq83v\n\n— log.example AAAA\n"));
}

TEST_F(CheckpointParserTest, EmptyCheckpoint)
{
  EXPECT_FALSE(parser.parse(""));
}
