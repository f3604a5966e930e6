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

#include "ReportPrinters.hh"

#include <string>

#include <spdlog/spdlog.h>

#include "attest/AttestErrors.hh"
#include "sigstore/BundleLoader.hh"
#include "utils/Base64.hh"
#include "utils/DateUtils.hh"
#include "utils/Enum.hh"
#include "utils/Logging.hh"

using namespace attest;

namespace
{
  std::shared_ptr<spdlog::logger>
  logger()
  {
    static auto logger = utils::Logging::create("attest:report:json");
    return logger;
  }

  void
  add_status(boost::json::object &obj, const char *key, VerificationStatus status)
  {
    if (status != VerificationStatus::NotEvaluated)
      {
        obj[key] = std::string(utils::enum_to_string(status));
      }
  }

  void
  add_string(boost::json::object &obj, const char *key, const std::string &value)
  {
    if (!value.empty())
      {
        obj[key] = value;
      }
  }

  boost::json::value
  envelope_to_json(const sigstore::DsseEnvelope &envelope)
  {
    boost::json::array signatures;
    for (const auto &signature: envelope.signatures)
      {
        boost::json::object sig;
        add_string(sig, "keyid", signature.keyid);
        sig["sig"] = utils::Base64::encode(signature.sig);
        signatures.push_back(std::move(sig));
      }
    return boost::json::object{{"payload", utils::Base64::encode(envelope.payload)},
                               {"payloadType", envelope.payload_type},
                               {"signatures", std::move(signatures)}};
  }

  boost::json::value
  sigstore_result_to_json(const sigstore::BundleVerificationResult &verified)
  {
    boost::json::array entries;
    for (const auto &entry: verified.log_entries)
      {
        entries.push_back(boost::json::object{{"logIndex", entry.log_index},
                                              {"logId", entry.log_id},
                                              {"integratedTime", utils::DateUtils::format_rfc3339(entry.integrated_time)}});
      }

    boost::json::object obj;
    add_string(obj, "signerIdentity", verified.certificate_subject);
    add_string(obj, "issuer", verified.certificate_issuer);
    obj["transparencyLogEntries"] = std::move(entries);
    return obj;
  }

  void
  add_evidence(boost::json::object &obj, const DecodedEvidence &evidence)
  {
    if (const auto *dsse = std::get_if<DsseEvidence>(&evidence))
      {
        obj["dsseEnvelope"] = envelope_to_json(dsse->envelope);
      }
    else if (const auto *sigstore_evidence = std::get_if<SigstoreEvidence>(&evidence); sigstore_evidence != nullptr && sigstore_evidence->bundle)
      {
        auto json = sigstore::BundleLoader::to_json(*sigstore_evidence->bundle);
        if (!json)
          {
            logger()->warn("failed to serialize Sigstore bundle ({})", json.error().message());
            return;
          }
        boost::json::error_code ec;
        auto bundle = boost::json::parse(json.value(), ec);
        if (ec)
          {
            logger()->warn("failed to serialize Sigstore bundle ({})", ec.message());
            return;
          }
        obj["sigstoreBundle"] = std::move(bundle);
      }
  }

  void
  pretty_print(std::ostream &os, const boost::json::value &jv, std::string &indent)
  {
    switch (jv.kind())
      {
      case boost::json::kind::object:
        {
          const auto &obj = jv.get_object();
          if (obj.empty())
            {
              os << "{}";
              break;
            }
          os << "{\n";
          indent.append(2, ' ');
          auto it = obj.begin();
          for (;;)
            {
              os << indent << boost::json::serialize(boost::json::value(it->key())) << ": ";
              pretty_print(os, it->value(), indent);
              if (++it == obj.end())
                {
                  break;
                }
              os << ",\n";
            }
          os << "\n";
          indent.resize(indent.size() - 2);
          os << indent << "}";
          break;
        }

      case boost::json::kind::array:
        {
          const auto &arr = jv.get_array();
          if (arr.empty())
            {
              os << "[]";
              break;
            }
          os << "[\n";
          indent.append(2, ' ');
          auto it = arr.begin();
          for (;;)
            {
              os << indent;
              pretty_print(os, *it, indent);
              if (++it == arr.end())
                {
                  break;
                }
              os << ",\n";
            }
          os << "\n";
          indent.resize(indent.size() - 2);
          os << indent << "]";
          break;
        }

      default:
        os << boost::json::serialize(jv);
        break;
      }
  }
} // namespace

JsonReportPrinter::JsonReportPrinter(std::ostream &out)
  : out(out)
{
}

boost::json::value
JsonReportPrinter::to_json(const VerificationResponse &response)
{
  boost::json::array verifications;
  for (const auto &verification: response.evidence_verifications)
    {
      boost::json::object obj;
      add_evidence(obj, verification.evidence);
      add_string(obj, "downloadPath", verification.download_path);
      add_string(obj, "evidenceSubjectSha256", verification.subject_checksum);
      add_string(obj, "predicateType", verification.predicate_type);
      add_string(obj, "createdBy", verification.created_by);
      add_string(obj, "createdAt", verification.created_at);
      add_string(obj, "mediaType", std::string(utils::enum_to_string(verification.media_type)));

      boost::json::object result;
      add_status(result, "sha256VerificationStatus", verification.result.sha256_status);
      add_status(result, "signaturesVerificationStatus", verification.result.signatures_status);
      add_status(result, "sigstoreBundleVerificationStatus", verification.result.sigstore_status);
      add_string(result, "keySource", verification.result.key_source);
      add_string(result, "keyFingerprint", verification.result.key_fingerprint);
      add_string(result, "failureReason", verification.result.failure_reason);
      if (verification.result.sigstore_result)
        {
          result["sigstoreVerification"] = sigstore_result_to_json(*verification.result.sigstore_result);
        }
      obj["verificationResult"] = std::move(result);

      verifications.push_back(std::move(obj));
    }

  return boost::json::object{{"schemaVersion", response.schema_version},
                             {"subject", boost::json::object{{"path", response.subject.path}, {"sha256", response.subject.sha256}}},
                             {"evidenceVerifications", std::move(verifications)},
                             {"overallVerificationStatus", std::string(utils::enum_to_string(response.overall_status))}};
}

outcome::std_result<void>
JsonReportPrinter::print(const VerificationResponse &response)
{
  std::string indent;
  pretty_print(out, to_json(response), indent);
  out << "\n";
  out.flush();

  if (response.overall_status == VerificationStatus::Failed)
    {
      return AttestErrc::VerificationFailed;
    }
  return outcome::success();
}
