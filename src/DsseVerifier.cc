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

#include "DsseVerifier.hh"

#include <fstream>
#include <sstream>
#include <utility>

#include "attest/AttestErrors.hh"
#include "sigstore/Dsse.hh"

using namespace attest;

DsseSignatureVerifier::DsseSignatureVerifier(std::vector<std::string> key_paths,
                                             bool use_artifactory_keys,
                                             std::shared_ptr<SigningKeyResolver> key_resolver)
  : key_paths(std::move(key_paths))
  , use_artifactory_keys(use_artifactory_keys)
  , key_resolver(std::move(key_resolver))
{
}

outcome::std_result<void>
DsseSignatureVerifier::verify(const std::string &subject_sha256, const EvidenceMetadata *evidence, EvidenceVerification *result)
{
  if (evidence == nullptr || result == nullptr)
    {
      logger->error("empty evidence or result provided for DSSE verification");
      return AttestErrc::InvalidInput;
    }

  const auto *dsse = std::get_if<DsseEvidence>(&result->evidence);
  if (dsse == nullptr)
    {
      logger->error("evidence {} does not hold a DSSE envelope", evidence->download_path);
      return AttestErrc::InvalidInput;
    }

  logger->debug("verifying DSSE evidence {} for subject {}", evidence->download_path, subject_sha256);

  auto local = get_local_keys();
  if (!local)
    {
      return local.error();
    }

  if (!local.value()->empty() && verify_envelope(*local.value(), dsse->envelope, result->result))
    {
      result->result.key_source = LOCAL_KEY_SOURCE;
      return outcome::success();
    }

  if (!use_artifactory_keys)
    {
      result->result.signatures_status = VerificationStatus::Failed;
      result->result.failure_reason = NO_MATCHING_KEY;
      return outcome::success();
    }

  auto repository_keys = key_resolver->resolve(*evidence);
  if (!repository_keys)
    {
      return repository_keys.error();
    }

  if (verify_envelope(repository_keys.value(), dsse->envelope, result->result))
    {
      result->result.key_source = ARTIFACTORY_KEY_SOURCE;
      return outcome::success();
    }

  result->result.signatures_status = VerificationStatus::Failed;
  result->result.failure_reason = NO_MATCHING_KEY;
  return outcome::success();
}

outcome::std_result<const PublicKeys *>
DsseSignatureVerifier::get_local_keys()
{
  std::call_once(local_keys_once, [this]() {
    auto keys = load_local_keys();
    if (keys)
      {
        local_keys = std::move(keys.value());
      }
    else
      {
        local_keys_error = keys.error();
      }
  });

  if (local_keys_error)
    {
      return local_keys_error;
    }
  return &local_keys;
}

outcome::std_result<PublicKeys>
DsseSignatureVerifier::load_local_keys() const
{
  PublicKeys keys;
  for (const auto &key_path: key_paths)
    {
      if (key_path.empty())
        {
          continue;
        }

      std::ifstream file(key_path, std::ios::binary);
      if (!file.is_open())
        {
          logger->error("failed to read key {}", key_path);
          return AttestErrc::KeyReadFailed;
        }
      std::stringstream buffer;
      buffer << file.rdbuf();

      auto key = sigstore::PublicKey::from_pem(buffer.str());
      if (!key)
        {
          logger->error("failed to load key {} ({})", key_path, key.error().message());
          return AttestErrc::KeyLoadFailed;
        }
      logger->debug("loaded {} key {}", key.value().get_algorithm_name(), key_path);
      keys.push_back(std::make_shared<const sigstore::PublicKey>(std::move(key.value())));
    }
  return keys;
}

bool
DsseSignatureVerifier::verify_envelope(const PublicKeys &keys, const sigstore::DsseEnvelope &envelope, VerificationResult &result) const
{
  for (const auto &key: keys)
    {
      auto valid = sigstore::verify_envelope(envelope, *key);
      if (!valid)
        {
          logger->warn("signature verification with {} key failed ({})", key->get_algorithm_name(), valid.error().message());
          continue;
        }
      if (valid.value())
        {
          result.signatures_status = VerificationStatus::Success;
          result.key_fingerprint = key->fingerprint();
          return true;
        }
    }
  result.signatures_status = VerificationStatus::Failed;
  return false;
}
