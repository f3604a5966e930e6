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
#include <gmock/gmock.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "attest/AttestErrors.hh"
#include "attest/Model.hh"
#include "DsseVerifier.hh"
#include "SigningKeyResolver.hh"
#include "sigstore/Dsse.hh"
#include "sigstore/PublicKey.hh"
#include "utils/TempDirectory.hh"
#include "utils/TestUtils.hh"

#include "TestCrypto.hh"
#include "VerifierMocks.hh"

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

using namespace attest;

namespace
{
  const std::string SUBJECT_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
  const std::string PAYLOAD_TYPE = "application/vnd.in-toto+json";

  std::string
  fingerprint_of(const test::TestKey &key)
  {
    auto public_key = sigstore::PublicKey::from_pem(key.public_key_pem());
    EXPECT_TRUE(public_key);
    return public_key.value().fingerprint();
  }

  PublicKeys
  public_keys_of(const test::TestKey &key)
  {
    auto public_key = sigstore::PublicKey::from_pem(key.public_key_pem());
    EXPECT_TRUE(public_key);
    return PublicKeys{std::make_shared<const sigstore::PublicKey>(std::move(public_key.value()))};
  }
} // namespace

class DsseVerifierTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    metadata.download_path = "evidence-repo/build/evidence.json";
    metadata.subject.sha256 = SUBJECT_SHA256;
    sign_with(signer);
  }

  void sign_with(const test::TestKey &key)
  {
    sigstore::DsseEnvelope envelope{.payload = test::in_toto_statement(SUBJECT_SHA256), .payload_type = PAYLOAD_TYPE, .signatures = {}};
    envelope.signatures.push_back({.keyid = "", .sig = key.sign(sigstore::pae(envelope.payload_type, envelope.payload))});

    result = EvidenceVerification{};
    result.media_type = MediaType::SimpleDSSE;
    result.evidence = DsseEvidence{.envelope = std::move(envelope)};
  }

  std::string write_key(const std::string &name, const std::string &content)
  {
    auto path = temp_dir.get_path() / name;
    write_file(path, content);
    return path.string();
  }

  test::TestKey signer{test::TestKey::generate()};
  test::TestKey other{test::TestKey::generate()};
  utils::TempDirectory temp_dir;
  EvidenceMetadata metadata;
  EvidenceVerification result;
  std::shared_ptr<NiceMock<SigningKeyResolverMock>> resolver{std::make_shared<NiceMock<SigningKeyResolverMock>>()};
};

TEST_F(DsseVerifierTest, LocalKeyMatches)
{
  EXPECT_CALL(*resolver, resolve(_)).Times(0);

  DsseSignatureVerifier verifier({write_key("signer.pem", signer.public_key_pem())}, true, resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_TRUE(rc) << rc.error().message();

  EXPECT_EQ(result.result.signatures_status, VerificationStatus::Success);
  EXPECT_EQ(result.result.key_source, LOCAL_KEY_SOURCE);
  EXPECT_EQ(result.result.key_fingerprint, fingerprint_of(signer));
  EXPECT_TRUE(result.result.failure_reason.empty());
}

TEST_F(DsseVerifierTest, SecondLocalKeyMatches)
{
  DsseSignatureVerifier verifier({write_key("other.pem", other.public_key_pem()), write_key("signer.pem", signer.public_key_pem())},
                                 false,
                                 resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_TRUE(rc) << rc.error().message();

  EXPECT_EQ(result.result.signatures_status, VerificationStatus::Success);
  EXPECT_EQ(result.result.key_source, LOCAL_KEY_SOURCE);
  EXPECT_EQ(result.result.key_fingerprint, fingerprint_of(signer));
}

TEST_F(DsseVerifierTest, EmptyKeyPathsAreSkipped)
{
  DsseSignatureVerifier verifier({"", write_key("signer.pem", signer.public_key_pem())}, false, resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_TRUE(rc) << rc.error().message();
  EXPECT_EQ(result.result.signatures_status, VerificationStatus::Success);
}

TEST_F(DsseVerifierTest, RepositoryKeyMatches)
{
  EXPECT_CALL(*resolver, resolve(_)).Times(1).WillOnce(Return(outcome::success(public_keys_of(signer))));

  DsseSignatureVerifier verifier({write_key("other.pem", other.public_key_pem())}, true, resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_TRUE(rc) << rc.error().message();

  EXPECT_EQ(result.result.signatures_status, VerificationStatus::Success);
  EXPECT_EQ(result.result.key_source, ARTIFACTORY_KEY_SOURCE);
  EXPECT_EQ(result.result.key_fingerprint, fingerprint_of(signer));
}

TEST_F(DsseVerifierTest, RepositoryKeysDisabled)
{
  EXPECT_CALL(*resolver, resolve(_)).Times(0);

  DsseSignatureVerifier verifier({write_key("other.pem", other.public_key_pem())}, false, resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_TRUE(rc) << rc.error().message();

  EXPECT_EQ(result.result.signatures_status, VerificationStatus::Failed);
  EXPECT_EQ(result.result.failure_reason, "no matching key found for envelope signatures");
  EXPECT_TRUE(result.result.key_source.empty());
}

TEST_F(DsseVerifierTest, NoKeyMatches)
{
  EXPECT_CALL(*resolver, resolve(_)).Times(1).WillOnce(Return(outcome::success(PublicKeys{})));

  DsseSignatureVerifier verifier({}, true, resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_TRUE(rc) << rc.error().message();

  EXPECT_EQ(result.result.signatures_status, VerificationStatus::Failed);
  EXPECT_EQ(result.result.failure_reason, "no matching key found for envelope signatures");
}

TEST_F(DsseVerifierTest, ResolverErrorIsPropagated)
{
  EXPECT_CALL(*resolver, resolve(_)).Times(1).WillOnce(Return(outcome::failure(AttestErrc::ArtifactoryKeyLoadFailed)));

  DsseSignatureVerifier verifier({}, true, resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::ArtifactoryKeyLoadFailed);
}

TEST_F(DsseVerifierTest, UnreadableKeyFile)
{
  DsseSignatureVerifier verifier({(temp_dir.get_path() / "missing.pem").string()}, true, resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::KeyReadFailed);
}

TEST_F(DsseVerifierTest, InvalidKeyFile)
{
  DsseSignatureVerifier verifier({write_key("garbage.pem", "not a key")}, true, resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::KeyLoadFailed);

  // The failure is remembered.
  rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::KeyLoadFailed);
}

TEST_F(DsseVerifierTest, LocalKeysAreLoadedOnce)
{
  auto key_path = write_key("signer.pem", signer.public_key_pem());
  DsseSignatureVerifier verifier({key_path}, false, resolver);

  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_TRUE(rc);

  std::filesystem::remove(key_path);

  sign_with(signer);
  rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_TRUE(rc) << rc.error().message();
  EXPECT_EQ(result.result.signatures_status, VerificationStatus::Success);
}

TEST_F(DsseVerifierTest, TamperedPayload)
{
  std::get<DsseEvidence>(result.evidence).envelope.payload = test::in_toto_statement(std::string(64, '0'));

  DsseSignatureVerifier verifier({write_key("signer.pem", signer.public_key_pem())}, false, resolver);
  auto rc = verifier.verify(SUBJECT_SHA256, &metadata, &result);
  ASSERT_TRUE(rc);
  EXPECT_EQ(result.result.signatures_status, VerificationStatus::Failed);
}

TEST_F(DsseVerifierTest, InvalidInput)
{
  DsseSignatureVerifier verifier({}, true, resolver);

  auto rc = verifier.verify(SUBJECT_SHA256, nullptr, &result);
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::InvalidInput);

  rc = verifier.verify(SUBJECT_SHA256, &metadata, nullptr);
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::InvalidInput);

  EvidenceVerification bundle_result;
  bundle_result.evidence = SigstoreEvidence{};
  rc = verifier.verify(SUBJECT_SHA256, &metadata, &bundle_result);
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::InvalidInput);
}

TEST(SigningKeyResolverTest, ResolveRepositoryKey)
{
  auto key = test::TestKey::generate();

  EvidenceMetadata metadata;
  metadata.signing_key = SigningKey{.alias = "release-key", .public_key = key.public_key_pem()};

  RepositorySigningKeyResolver resolver;
  auto keys = resolver.resolve(metadata);
  ASSERT_TRUE(keys) << keys.error().message();
  ASSERT_EQ(keys.value().size(), 1U);
  EXPECT_EQ(keys.value()[0]->fingerprint(), fingerprint_of(key));
}

TEST(SigningKeyResolverTest, EmptyRepositoryKey)
{
  EvidenceMetadata metadata;

  RepositorySigningKeyResolver resolver;
  auto keys = resolver.resolve(metadata);
  ASSERT_TRUE(keys);
  EXPECT_TRUE(keys.value().empty());
}

TEST(SigningKeyResolverTest, InvalidRepositoryKey)
{
  EvidenceMetadata metadata;
  metadata.signing_key = SigningKey{.alias = "broken", .public_key = "-----BEGIN PUBLIC KEY-----\nAAAA\n-----END PUBLIC KEY-----\n"};

  RepositorySigningKeyResolver resolver;
  auto keys = resolver.resolve(metadata);
  ASSERT_FALSE(keys);
  EXPECT_EQ(keys.error(), AttestErrc::ArtifactoryKeyLoadFailed);
}
