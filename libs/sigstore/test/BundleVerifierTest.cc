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

#include <boost/algorithm/string/case_conv.hpp>

#include "sigstore/BundleVerifier.hh"
#include "sigstore/CryptographicAlgorithms.hh"
#include "sigstore/PublicKey.hh"
#include "sigstore/SigstoreErrors.hh"
#include "sigstore/TrustedRoot.hh"

#include "TestCrypto.hh"
#include "sigstore_bundle.pb.h"

namespace attest::sigstore::test
{
  using attest::test::LeafOptions;
  using attest::test::TestSigstore;

  namespace
  {
    const std::string SUBJECT_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    VerificationPolicy test_policy(const std::string &digest)
    {
      return VerificationPolicy{.artifact_digest_sha256 = digest,
                                .required_signed_certificate_timestamps = 0,
                                .required_observer_timestamps = 1,
                                .required_transparency_log_entries = 1};
    }
  } // namespace

  class BundleVerifierTest : public ::testing::Test
  {
  protected:
    BundleVerifier create_verifier(const TestSigstore &sigstore)
    {
      auto trusted_root = TrustedRoot::from_json(sigstore.trusted_root_json());
      EXPECT_TRUE(trusted_root);
      return BundleVerifier(trusted_root.value());
    }

    TestSigstore sigstore;
  };

  TEST_F(BundleVerifierTest, VerifyDsseBundle)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);

    auto result = verifier.verify(*bundle, test_policy(SUBJECT_SHA256));
    ASSERT_TRUE(result) << result.error().message();

    const auto &verified = result.value();
    EXPECT_EQ(verified.certificate_subject, "signer@example.com");
    ASSERT_EQ(verified.log_entries.size(), 1U);
    EXPECT_TRUE(verified.log_entries[0].inclusion_proof_verified);
    EXPECT_TRUE(verified.log_entries[0].inclusion_promise_verified);
    EXPECT_EQ(verified.log_entries[0].log_index, 42);
    EXPECT_EQ(verified.timestamps.size(), 1U);
    EXPECT_EQ(verified.signed_certificate_timestamps, 0U);

    auto leaf_key = PublicKey::from_pem(sigstore.get_leaf_key().public_key_pem());
    ASSERT_TRUE(leaf_key);
    EXPECT_EQ(verified.key_fingerprint, leaf_key.value().fingerprint());
  }

  TEST_F(BundleVerifierTest, VerifyMessageSignatureBundle)
  {
    const std::string artifact = "release artifact contents";
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_message_signature_bundle(artifact);

    auto result = verifier.verify(*bundle, test_policy(sha256_hex(artifact)));
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result.value().log_entries.size(), 1U);
  }

  TEST_F(BundleVerifierTest, DigestComparisonIgnoresCase)
  {
    const std::string artifact = "release artifact contents";
    auto verifier = create_verifier(sigstore);

    auto message_bundle = sigstore.create_message_signature_bundle(artifact);
    auto result = verifier.verify(*message_bundle, test_policy(boost::algorithm::to_upper_copy(sha256_hex(artifact))));
    ASSERT_TRUE(result) << result.error().message();

    auto dsse_bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);
    result = verifier.verify(*dsse_bundle, test_policy(boost::algorithm::to_upper_copy(SUBJECT_SHA256)));
    ASSERT_TRUE(result) << result.error().message();
  }

  TEST_F(BundleVerifierTest, SubjectDigestMismatch)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);

    auto result = verifier.verify(*bundle, test_policy(std::string(64, '0')));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::ArtifactDigestMismatch);
  }

  TEST_F(BundleVerifierTest, MessageDigestMismatch)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_message_signature_bundle("artifact");

    auto result = verifier.verify(*bundle, test_policy(sha256_hex("other artifact")));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::ArtifactDigestMismatch);
  }

  TEST_F(BundleVerifierTest, TamperedPayload)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);
    bundle->mutable_dsse_envelope()->set_payload(attest::test::in_toto_statement(std::string(64, 'f')));

    auto result = verifier.verify(*bundle, test_policy(std::string(64, 'f')));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InvalidSignature);
  }

  TEST_F(BundleVerifierTest, InsufficientTransparencyLogEntries)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);

    auto policy = test_policy(SUBJECT_SHA256);
    policy.required_transparency_log_entries = 2;

    auto result = verifier.verify(*bundle, policy);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InsufficientTransparencyLogEntries);
  }

  TEST_F(BundleVerifierTest, UntrustedLogIsIgnored)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);
    bundle->mutable_verification_material()->mutable_tlog_entries(0)->mutable_log_id()->set_key_id("untrusted-log");

    auto result = verifier.verify(*bundle, test_policy(SUBJECT_SHA256));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InsufficientTransparencyLogEntries);
  }

  TEST_F(BundleVerifierTest, UnverifiableLogEntry)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);
    auto *entry = bundle->mutable_verification_material()->mutable_tlog_entries(0);
    entry->clear_inclusion_proof();
    entry->mutable_inclusion_promise()->set_signed_entry_timestamp("not a signature");

    auto result = verifier.verify(*bundle, test_policy(SUBJECT_SHA256));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InvalidTransparencyLog);
  }

  TEST_F(BundleVerifierTest, InclusionProofWithoutPromiseGivesNoTimestamp)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);
    bundle->mutable_verification_material()->mutable_tlog_entries(0)->clear_inclusion_promise();

    auto result = verifier.verify(*bundle, test_policy(SUBJECT_SHA256));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InsufficientObserverTimestamps);

    auto policy = test_policy(SUBJECT_SHA256);
    policy.required_observer_timestamps = 0;
    auto relaxed = verifier.verify(*bundle, policy);
    ASSERT_TRUE(relaxed);
    EXPECT_TRUE(relaxed.value().log_entries[0].inclusion_proof_verified);
    EXPECT_FALSE(relaxed.value().log_entries[0].inclusion_promise_verified);
  }

  TEST_F(BundleVerifierTest, SignedCertificateTimestampRequired)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);

    auto policy = test_policy(SUBJECT_SHA256);
    policy.required_signed_certificate_timestamps = 1;

    auto result = verifier.verify(*bundle, policy);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InsufficientSignedCertificateTimestamps);
  }

  TEST_F(BundleVerifierTest, CertificateWithoutCodeSigningUsage)
  {
    TestSigstore server_sigstore(LeafOptions{.code_signing = false});
    auto verifier = create_verifier(server_sigstore);
    auto bundle = server_sigstore.create_dsse_bundle(SUBJECT_SHA256);

    auto result = verifier.verify(*bundle, test_policy(SUBJECT_SHA256));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InvalidCertificate);
  }

  TEST_F(BundleVerifierTest, CertificateExpiredAtIntegratedTime)
  {
    TestSigstore expired_sigstore(LeafOptions{.not_before = std::chrono::seconds{-7200}, .not_after = std::chrono::seconds{-3600}});
    auto verifier = create_verifier(expired_sigstore);
    auto bundle = expired_sigstore.create_dsse_bundle(SUBJECT_SHA256);

    auto result = verifier.verify(*bundle, test_policy(SUBJECT_SHA256));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InvalidTransparencyLog);
  }

  TEST_F(BundleVerifierTest, BundleFromUnknownDeployment)
  {
    TestSigstore other_sigstore;
    auto verifier = create_verifier(sigstore);
    auto bundle = other_sigstore.create_dsse_bundle(SUBJECT_SHA256);

    auto result = verifier.verify(*bundle, test_policy(SUBJECT_SHA256));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InsufficientTransparencyLogEntries);
  }

  TEST_F(BundleVerifierTest, MissingCertificate)
  {
    auto verifier = create_verifier(sigstore);
    auto bundle = sigstore.create_dsse_bundle(SUBJECT_SHA256);
    bundle->mutable_verification_material()->clear_certificate();

    auto result = verifier.verify(*bundle, test_policy(SUBJECT_SHA256));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), SigstoreError::InvalidCertificate);
  }
} // namespace attest::sigstore::test
