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
#include <vector>

#include "MerkleTreeValidator.hh"
#include "RFC6962Hasher.hh"
#include "utils/Hex.hh"

using namespace attest::sigstore;

class MerkleTreeValidatorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    for (int i = 0; i < 5; i++)
      {
        leaves.push_back(hasher.hash_leaf("leaf-" + std::to_string(i)));
      }
    h01 = hasher.hash_children(leaves[0], leaves[1]);
    h23 = hasher.hash_children(leaves[2], leaves[3]);
    h0123 = hasher.hash_children(h01, h23);
    root = hasher.hash_children(h0123, leaves[4]);
  }

  RFC6962Hasher hasher;
  MerkleTreeValidator validator;
  std::vector<std::string> leaves;
  std::string h01;
  std::string h23;
  std::string h0123;
  std::string root;
};

TEST_F(MerkleTreeValidatorTest, EmptyTreeHashes)
{
  EXPECT_EQ(attest::utils::Hex::encode(hasher.hash_leaf("")), "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

TEST_F(MerkleTreeValidatorTest, SingleLeafTree)
{
  auto valid = validator.verify_inclusion_proof({}, 0, 1, leaves[0], leaves[0]);
  ASSERT_TRUE(valid);
  EXPECT_TRUE(valid.value());
}

TEST_F(MerkleTreeValidatorTest, InnerLeafProof)
{
  auto valid = validator.verify_inclusion_proof({leaves[3], h01, leaves[4]}, 2, 5, leaves[2], root);
  ASSERT_TRUE(valid);
  EXPECT_TRUE(valid.value());
}

TEST_F(MerkleTreeValidatorTest, BorderLeafProof)
{
  auto valid = validator.verify_inclusion_proof({h0123}, 4, 5, leaves[4], root);
  ASSERT_TRUE(valid);
  EXPECT_TRUE(valid.value());
}

TEST_F(MerkleTreeValidatorTest, FirstLeafProof)
{
  auto computed = validator.compute_merkle_root({leaves[1], h23, leaves[4]}, 0, 5, leaves[0]);
  ASSERT_TRUE(computed);
  EXPECT_EQ(computed.value(), root);
}

TEST_F(MerkleTreeValidatorTest, WrongLeafDoesNotVerify)
{
  auto valid = validator.verify_inclusion_proof({leaves[3], h01, leaves[4]}, 2, 5, leaves[1], root);
  ASSERT_TRUE(valid);
  EXPECT_FALSE(valid.value());
}

TEST_F(MerkleTreeValidatorTest, ProofSizeMismatch)
{
  EXPECT_FALSE(validator.verify_inclusion_proof({leaves[3], h01}, 2, 5, leaves[2], root));
  EXPECT_FALSE(validator.verify_inclusion_proof({h0123, h01}, 4, 5, leaves[4], root));
}

TEST_F(MerkleTreeValidatorTest, IndexOutOfRange)
{
  EXPECT_FALSE(validator.verify_inclusion_proof({}, 5, 5, leaves[0], root));
  EXPECT_FALSE(validator.verify_inclusion_proof({}, -1, 5, leaves[0], root));
  EXPECT_FALSE(validator.verify_inclusion_proof({}, 0, 0, leaves[0], root));
}
