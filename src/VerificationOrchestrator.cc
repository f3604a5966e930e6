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

#include "VerificationOrchestrator.hh"

#include <algorithm>
#include <cctype>
#include <utility>

#include "attest/AttestErrors.hh"
#include "ChecksumVerifier.hh"
#include "SigningKeyResolver.hh"

using namespace attest;

namespace
{
  bool
  is_sha256_hex(const std::string &digest)
  {
    return digest.size() == 64 && std::ranges::all_of(digest, [](unsigned char c) { return std::isxdigit(c) != 0; });
  }
} // namespace

std::shared_ptr<EvidenceVerifier>
EvidenceVerifier::create(VerifierConfig config,
                         std::shared_ptr<BlobFetcher> blob_fetcher,
                         std::shared_ptr<sigstore::TrustedRootProvider> trusted_root_provider)
{
  auto parser = std::make_shared<RemoteEvidenceParser>(std::move(blob_fetcher));
  auto dsse_verifier = std::make_shared<DsseSignatureVerifier>(config.key_paths,
                                                               config.use_artifactory_keys,
                                                               std::make_shared<RepositorySigningKeyResolver>());
  auto sigstore_verifier = std::make_shared<SigstoreBundleVerifier>(config, std::move(trusted_root_provider));
  return std::make_shared<VerificationOrchestrator>(parser, dsse_verifier, sigstore_verifier);
}

VerificationOrchestrator::VerificationOrchestrator(std::shared_ptr<EvidenceParser> parser,
                                                   std::shared_ptr<DsseVerifier> dsse_verifier,
                                                   std::shared_ptr<SigstoreVerifier> sigstore_verifier)
  : parser(std::move(parser))
  , dsse_verifier(std::move(dsse_verifier))
  , sigstore_verifier(std::move(sigstore_verifier))
{
}

void
VerificationOrchestrator::set_progress_sink(std::shared_ptr<ProgressSink> progress_sink)
{
  this->progress_sink = std::move(progress_sink);
}

outcome::std_result<VerificationResponse>
VerificationOrchestrator::verify(const std::string &subject_sha256,
                                 const std::vector<EvidenceMetadata> &evidence_metadata,
                                 const std::string &subject_path)
{
  if (!is_sha256_hex(subject_sha256))
    {
      logger->error("subject digest '{}' is not a hex encoded sha256", subject_sha256);
      return AttestErrc::InvalidInput;
    }

  if (evidence_metadata.empty())
    {
      logger->error("no evidence metadata provided");
      return AttestErrc::NoEvidence;
    }

  VerificationResponse response;
  response.subject = VerificationSubject{.path = subject_path, .sha256 = subject_sha256};
  response.evidence_verifications.reserve(evidence_metadata.size());

  if (progress_sink)
    {
      progress_sink->start(evidence_metadata.size());
    }

  for (const auto &evidence: evidence_metadata)
    {
      EvidenceVerification result{
        .download_path = evidence.download_path,
        .subject_checksum = evidence.subject.sha256,
        .predicate_type = evidence.predicate_type,
        .created_by = evidence.created_by,
        .created_at = evidence.created_at,
      };

      auto rc = verify_evidence(subject_sha256, evidence, result);
      if (!rc)
        {
          return rc.error();
        }

      const auto &status = result.result;
      if (status.sha256_status == VerificationStatus::Failed || status.signatures_status == VerificationStatus::Failed
          || status.sigstore_status == VerificationStatus::Failed)
        {
          response.overall_status = VerificationStatus::Failed;
        }

      response.evidence_verifications.push_back(std::move(result));

      if (progress_sink)
        {
          progress_sink->increment();
        }
    }

  logger->info("verified {} evidence for subject {}: {}",
               response.evidence_verifications.size(),
               subject_sha256,
               response.overall_status == VerificationStatus::Success ? "success" : "failed");
  return response;
}

outcome::std_result<void>
VerificationOrchestrator::verify_evidence(const std::string &subject_sha256, const EvidenceMetadata &evidence, EvidenceVerification &result)
{
  auto parsed = parser->parse_evidence(&evidence, &result);
  if (!parsed)
    {
      logger->error("failed to read envelope: {}", parsed.error().message());
      return AttestErrc::EnvelopeReadFailed;
    }

  result.result.sha256_status = verify_checksum(subject_sha256, result.subject_checksum);

  switch (result.media_type)
    {
    case MediaType::SimpleDSSE:
      return dsse_verifier->verify(subject_sha256, &evidence, &result);

    case MediaType::SigstoreBundle:
      return sigstore_verifier->verify(subject_sha256, &result);

    case MediaType::Unknown:
      break;
    }

  logger->error("unsupported verification mode for {}", evidence.download_path);
  return AttestErrc::UnsupportedMediaType;
}
