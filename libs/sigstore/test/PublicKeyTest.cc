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

#include "sigstore/PublicKey.hh"
#include "sigstore/SigstoreErrors.hh"
#include "utils/Hex.hh"
#include "TestCrypto.hh"

using namespace attest::sigstore;

class PublicKeyTest : public ::testing::Test
{
protected:
  attest::test::TestKey key{attest::test::TestKey::generate()};

  // RFC 8032 test vector 1.
  const std::string ed25519_pem =
    "-----BEGIN PUBLIC KEY-----\n"
    "MCowBQYDK2VwAyEA11qYAYKxCrfVS/7TyWQHOg7hcvPapiMlrwIaaPcHURo=\n"
    "-----END PUBLIC KEY-----\n";
};

TEST_F(PublicKeyTest, LoadEcdsaFromPem)
{
  auto public_key = PublicKey::from_pem(key.public_key_pem());
  ASSERT_TRUE(public_key);

  EXPECT_EQ(public_key.value().get_algorithm(), KeyAlgorithm::ECDSA);
  EXPECT_EQ(public_key.value().to_der(), key.public_key_der());
  ASSERT_TRUE(public_key.value().default_digest().has_value());
  EXPECT_EQ(public_key.value().default_digest().value(), DigestAlgorithm::SHA256);
}

TEST_F(PublicKeyTest, LoadEd25519FromPem)
{
  auto public_key = PublicKey::from_pem(ed25519_pem);
  ASSERT_TRUE(public_key);

  EXPECT_EQ(public_key.value().get_algorithm(), KeyAlgorithm::EdDSA);
  EXPECT_FALSE(public_key.value().default_digest().has_value());
}

TEST_F(PublicKeyTest, LoadRawEd25519)
{
  // RFC 8032 test vector 2.
  auto raw_key = attest::utils::Hex::decode("3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c");
  auto signature = attest::utils::Hex::decode(
    "92a009a9f0d4cab8720e820b5f642540a2b27b5416503f8fb3762223ebdb69da"
    "085ac1e43e15996e458f3613d0f11d8c387b2eaeb4302aeeb00d291612bb0c00");
  ASSERT_TRUE(raw_key.has_value());
  ASSERT_TRUE(signature.has_value());

  auto public_key = PublicKey::from_ed25519(raw_key.value());
  ASSERT_TRUE(public_key);
  EXPECT_EQ(public_key.value().get_algorithm(), KeyAlgorithm::EdDSA);

  auto valid = public_key.value().verify_signature(std::string("\x72"), signature.value());
  ASSERT_TRUE(valid);
  EXPECT_TRUE(valid.value());

  auto tampered = public_key.value().verify_signature(std::string("\x73"), signature.value());
  ASSERT_TRUE(tampered);
  EXPECT_FALSE(tampered.value());

  auto short_key = PublicKey::from_ed25519(raw_key.value().substr(0, 16));
  ASSERT_FALSE(short_key);
  EXPECT_EQ(short_key.error(), SigstoreError::InvalidPublicKey);
}

TEST_F(PublicKeyTest, PemAndDerAgree)
{
  auto from_pem = PublicKey::from_pem(key.public_key_pem());
  auto from_der = PublicKey::from_der(key.public_key_der());
  ASSERT_TRUE(from_pem);
  ASSERT_TRUE(from_der);

  EXPECT_EQ(from_pem.value().fingerprint(), from_der.value().fingerprint());
  EXPECT_EQ(from_pem.value().fingerprint().size(), 64);
}

TEST_F(PublicKeyTest, InvalidPem)
{
  auto result = PublicKey::from_pem("-----BEGIN PUBLIC KEY-----\nINVALID_DATA\n-----END PUBLIC KEY-----");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), SigstoreError::InvalidPublicKey);
}

TEST_F(PublicKeyTest, EmptyPem)
{
  EXPECT_FALSE(PublicKey::from_pem(""));
}

TEST_F(PublicKeyTest, VerifySignature)
{
  auto public_key = PublicKey::from_pem(key.public_key_pem());
  ASSERT_TRUE(public_key);

  auto signature = key.sign("hello world");

  auto valid = public_key.value().verify_signature("hello world", signature);
  ASSERT_TRUE(valid);
  EXPECT_TRUE(valid.value());

  auto tampered = public_key.value().verify_signature("hello world!", signature);
  ASSERT_TRUE(tampered);
  EXPECT_FALSE(tampered.value());
}

TEST_F(PublicKeyTest, VerifySignatureWithOtherKey)
{
  auto other = attest::test::TestKey::generate();
  auto public_key = PublicKey::from_pem(other.public_key_pem());
  ASSERT_TRUE(public_key);

  auto valid = public_key.value().verify_signature("hello world", key.sign("hello world"));
  ASSERT_TRUE(valid);
  EXPECT_FALSE(valid.value());
}

TEST_F(PublicKeyTest, VerifyDigest)
{
  auto public_key = PublicKey::from_pem(key.public_key_pem());
  ASSERT_TRUE(public_key);

  auto digest = compute_digest(DigestAlgorithm::SHA256, "artifact");
  ASSERT_TRUE(digest);

  auto valid = public_key.value().verify_digest(digest.value(), key.sign("artifact"), DigestAlgorithm::SHA256);
  ASSERT_TRUE(valid);
  EXPECT_TRUE(valid.value());
}

TEST_F(PublicKeyTest, VerifyDigestNotSupportedForEd25519)
{
  auto public_key = PublicKey::from_pem(ed25519_pem);
  ASSERT_TRUE(public_key);

  auto result = public_key.value().verify_digest(std::string(32, 'x'), std::string(64, 'y'), DigestAlgorithm::SHA256);
  EXPECT_FALSE(result);
}
