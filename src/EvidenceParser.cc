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

#include "EvidenceParser.hh"

#include <utility>

#include "attest/AttestErrors.hh"

using namespace attest;

RemoteEvidenceParser::RemoteEvidenceParser(std::shared_ptr<BlobFetcher> blob_fetcher)
  : blob_fetcher(std::move(blob_fetcher))
{
}

outcome::std_result<void>
RemoteEvidenceParser::parse_evidence(const EvidenceMetadata *evidence, EvidenceVerification *result)
{
  if (evidence == nullptr || result == nullptr)
    {
      logger->error("empty evidence or result provided for parsing");
      return AttestErrc::InvalidInput;
    }

  if (evidence->download_path.empty())
    {
      logger->error("evidence has no download path");
      return AttestErrc::InvalidEvidenceMetadata;
    }

  auto content = blob_fetcher->read_remote_file(evidence->download_path);
  if (!content)
    {
      logger->error("failed to read remote file {} ({})", evidence->download_path, content.error().message());
      return AttestErrc::RemoteReadFailed;
    }

  if (!decode(content.value(), *result))
    {
      logger->error("unsupported evidence file for client-side verification: {}", evidence->download_path);
      return AttestErrc::UnsupportedEvidence;
    }
  return outcome::success();
}

bool
RemoteEvidenceParser::decode(const std::string &content, EvidenceVerification &result) const
{
  return try_parse_sigstore_bundle(content, result) || try_parse_dsse_envelope(content, result);
}

bool
RemoteEvidenceParser::try_parse_sigstore_bundle(const std::string &content, EvidenceVerification &result) const
{
  auto bundle = loader.load_bundle(content);
  if (!bundle)
    {
      logger->debug("not a Sigstore bundle ({})", bundle.error().message());
      return false;
    }
  result.evidence = SigstoreEvidence{.bundle = bundle.value()};
  result.media_type = MediaType::SigstoreBundle;
  return true;
}

bool
RemoteEvidenceParser::try_parse_dsse_envelope(const std::string &content, EvidenceVerification &result) const
{
  auto envelope = loader.load_envelope(content);
  if (!envelope)
    {
      logger->debug("not a DSSE envelope ({})", envelope.error().message());
      return false;
    }
  result.evidence = DsseEvidence{.envelope = std::move(envelope.value())};
  result.media_type = MediaType::SimpleDSSE;
  return true;
}
