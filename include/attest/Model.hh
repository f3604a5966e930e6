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

#ifndef ATTEST_MODEL_HH
#define ATTEST_MODEL_HH

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sigstore/BundleVerifier.hh"
#include "sigstore/Dsse.hh"
#include "utils/Enum.hh"

namespace attest
{
  inline constexpr const char *SCHEMA_VERSION = "1.0";

  inline constexpr const char *LOCAL_KEY_SOURCE = "User Provided Key";
  inline constexpr const char *ARTIFACTORY_KEY_SOURCE = "Artifactory Key";
  inline constexpr const char *SIGSTORE_KEY_SOURCE = "Sigstore Bundle Key";

  enum class VerificationStatus
  {
    NotEvaluated,
    Success,
    Failed,
  };

  enum class MediaType
  {
    Unknown,
    SimpleDSSE,
    SigstoreBundle,
  };

  struct EvidenceSubject
  {
    std::string sha256;
    std::string repository_key;
    std::string path;
    std::string name;
  };

  struct SigningKey
  {
    std::string alias;
    std::string public_key;
  };

  // One evidence record as returned by the evidence search.
  struct EvidenceMetadata
  {
    std::string download_path;
    std::string name;
    std::string sha256;
    std::string repository_key;
    std::string path;
    std::string predicate_type;
    std::string predicate_category;
    std::string predicate_slug;
    std::string created_at;
    std::string created_by;
    EvidenceSubject subject;
    SigningKey signing_key;
  };

  struct DsseEvidence
  {
    sigstore::DsseEnvelope envelope;
  };

  struct SigstoreEvidence
  {
    std::shared_ptr<const sigstore::v1::Bundle> bundle;
  };

  using DecodedEvidence = std::variant<std::monostate, DsseEvidence, SigstoreEvidence>;

  struct VerificationResult
  {
    VerificationStatus sha256_status = VerificationStatus::NotEvaluated;
    VerificationStatus signatures_status = VerificationStatus::NotEvaluated;
    VerificationStatus sigstore_status = VerificationStatus::NotEvaluated;
    std::string key_source;
    std::string key_fingerprint;
    std::string failure_reason;
    std::optional<sigstore::BundleVerificationResult> sigstore_result;
  };

  struct EvidenceVerification
  {
    std::string download_path;
    std::string subject_checksum;
    std::string predicate_type;
    std::string created_by;
    std::string created_at;
    MediaType media_type = MediaType::Unknown;
    DecodedEvidence evidence;
    VerificationResult result;
  };

  struct VerificationSubject
  {
    std::string path;
    std::string sha256;
  };

  struct VerificationResponse
  {
    std::string schema_version{SCHEMA_VERSION};
    VerificationSubject subject;
    std::vector<EvidenceVerification> evidence_verifications;
    VerificationStatus overall_status = VerificationStatus::Success;
  };

  // Checksum matches and either the DSSE signatures or the Sigstore bundle verified.
  bool is_verification_succeeded(const EvidenceVerification &verification);

} // namespace attest

template<>
struct attest::utils::enum_traits<attest::VerificationStatus>
{
  static constexpr std::array<std::pair<std::string_view, attest::VerificationStatus>, 2> names{
    {{"success", attest::VerificationStatus::Success}, {"failed", attest::VerificationStatus::Failed}}};
};

template<>
struct attest::utils::enum_traits<attest::MediaType>
{
  static constexpr std::array<std::pair<std::string_view, attest::MediaType>, 2> names{
    {{"evidence.dsse", attest::MediaType::SimpleDSSE}, {"sigstore.bundle", attest::MediaType::SigstoreBundle}}};
};

#endif // ATTEST_MODEL_HH
