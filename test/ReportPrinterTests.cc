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

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

#include <boost/json.hpp>

#include "attest/AttestErrors.hh"
#include "attest/Model.hh"
#include "attest/ReportPrinter.hh"
#include "ReportPrinters.hh"
#include "sigstore/Dsse.hh"

using namespace attest;

namespace
{
  const std::string SUBJECT_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
  const std::string FINGERPRINT = "0f6bd2b7e5a5bca1bc5dd9a1ec3a31d2e4a7f5d0ad0d3d2c9e6c3f7a1b2c3d4e";

  EvidenceVerification
  dsse_verification(VerificationStatus sha256_status, VerificationStatus signatures_status)
  {
    EvidenceVerification verification{
      .download_path = "example-repo-local/.evidence/app.bin/provenance.json",
      .subject_checksum = SUBJECT_SHA256,
      .predicate_type = "https://slsa.dev/provenance/v1",
      .created_by = "ci-user",
      .created_at = "2025-01-01T10:00:00.000Z",
      .media_type = MediaType::SimpleDSSE,
    };
    verification.evidence = DsseEvidence{.envelope = sigstore::DsseEnvelope{.payload = "{}",
                                                                            .payload_type = "application/vnd.in-toto+json",
                                                                            .signatures = {{.keyid = "key-1", .sig = "sig"}}}};
    verification.result.sha256_status = sha256_status;
    verification.result.signatures_status = signatures_status;
    if (signatures_status == VerificationStatus::Success)
      {
        verification.result.key_source = LOCAL_KEY_SOURCE;
        verification.result.key_fingerprint = FINGERPRINT;
      }
    else
      {
        verification.result.failure_reason = "no matching key found for envelope signatures";
      }
    return verification;
  }

  EvidenceVerification
  sigstore_verification()
  {
    EvidenceVerification verification{
      .download_path = "example-repo-local/.evidence/app.bin/provenance.sigstore.json",
      .subject_checksum = SUBJECT_SHA256,
      .predicate_type = "https://slsa.dev/provenance/v1",
      .media_type = MediaType::SigstoreBundle,
    };
    verification.result.sha256_status = VerificationStatus::Success;
    verification.result.sigstore_status = VerificationStatus::Success;
    verification.result.key_source = SIGSTORE_KEY_SOURCE;
    verification.result.sigstore_result = sigstore::BundleVerificationResult{
      .certificate_subject = "signer@example.com",
      .certificate_issuer = "https://accounts.example.com",
      .log_entries = {{.log_index = 42,
                       .log_id = "c0d23d6ad406973f",
                       .integrated_time = std::chrono::system_clock::time_point(std::chrono::seconds(1735725600))}},
    };
    return verification;
  }

  VerificationResponse
  make_response(bool failed)
  {
    VerificationResponse response;
    response.subject = VerificationSubject{.path = "example-repo-local/app.bin", .sha256 = SUBJECT_SHA256};
    response.evidence_verifications.push_back(dsse_verification(VerificationStatus::Success, VerificationStatus::Success));
    if (failed)
      {
        response.evidence_verifications.push_back(dsse_verification(VerificationStatus::Success, VerificationStatus::Failed));
        response.overall_status = VerificationStatus::Failed;
      }
    return response;
  }
} // namespace

TEST(ReportPrinterTest, TextReport)
{
  std::ostringstream out;
  auto printer = ReportPrinter::create(ReportFormat::Text, out);

  auto rc = printer->print(make_response(false));
  ASSERT_TRUE(rc) << rc.error().message();

  auto text = out.str();
  EXPECT_NE(text.find("Subject sha256:        " + SUBJECT_SHA256), std::string::npos);
  EXPECT_NE(text.find("Subject:               example-repo-local/app.bin"), std::string::npos);
  EXPECT_NE(text.find("Loaded 1 evidence"), std::string::npos);
  EXPECT_NE(text.find("Verification passed for 1 out of 1 evidence"), std::string::npos);
  EXPECT_NE(text.find("- Evidence 1:"), std::string::npos);
  EXPECT_NE(text.find("- Media type:                     evidence.dsse"), std::string::npos);
  EXPECT_NE(text.find("- Key source:                     User Provided Key"), std::string::npos);
  EXPECT_NE(text.find("- Key fingerprint:                " + FINGERPRINT), std::string::npos);
  EXPECT_NE(text.find("- Signatures verification status: success"), std::string::npos);
  EXPECT_EQ(text.find("Sigstore verification status"), std::string::npos);
  EXPECT_EQ(text.find("\x1b["), std::string::npos);
}

TEST(ReportPrinterTest, TextReportWithFailure)
{
  std::ostringstream out;
  auto printer = ReportPrinter::create(ReportFormat::Text, out);

  auto rc = printer->print(make_response(true));
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::VerificationFailed);

  auto text = out.str();
  EXPECT_NE(text.find("Verification passed for 1 out of 2 evidence"), std::string::npos);
  EXPECT_NE(text.find("- Evidence 2:"), std::string::npos);
  EXPECT_NE(text.find("- Signatures verification status: failed"), std::string::npos);
  EXPECT_NE(text.find("- Failure reason:                 no matching key found for envelope signatures"), std::string::npos);
}

TEST(ReportPrinterTest, ColoredTextReport)
{
  std::ostringstream out;
  auto printer = ReportPrinter::create(ReportFormat::Text, out, true);

  auto rc = printer->print(make_response(true));
  ASSERT_FALSE(rc);
  EXPECT_NE(out.str().find("\x1b["), std::string::npos);
}

TEST(ReportPrinterTest, JsonReport)
{
  std::ostringstream out;
  auto printer = ReportPrinter::create(ReportFormat::Json, out);

  auto rc = printer->print(make_response(true));
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::VerificationFailed);

  auto report = boost::json::parse(out.str()).as_object();
  EXPECT_EQ(report.at("schemaVersion").as_string(), "1.0");
  EXPECT_EQ(report.at("subject").at("path").as_string(), "example-repo-local/app.bin");
  EXPECT_EQ(report.at("subject").at("sha256").as_string(), SUBJECT_SHA256);
  EXPECT_EQ(report.at("overallVerificationStatus").as_string(), "failed");

  const auto &verifications = report.at("evidenceVerifications").as_array();
  ASSERT_EQ(verifications.size(), 2U);

  const auto &first = verifications[0].as_object();
  EXPECT_EQ(first.at("downloadPath").as_string(), "example-repo-local/.evidence/app.bin/provenance.json");
  EXPECT_EQ(first.at("evidenceSubjectSha256").as_string(), SUBJECT_SHA256);
  EXPECT_EQ(first.at("predicateType").as_string(), "https://slsa.dev/provenance/v1");
  EXPECT_EQ(first.at("mediaType").as_string(), "evidence.dsse");
  EXPECT_EQ(first.at("dsseEnvelope").at("payload").as_string(), "e30=");
  EXPECT_EQ(first.at("dsseEnvelope").at("payloadType").as_string(), "application/vnd.in-toto+json");
  EXPECT_FALSE(first.contains("sigstoreBundle"));

  const auto &result = first.at("verificationResult").as_object();
  EXPECT_EQ(result.at("sha256VerificationStatus").as_string(), "success");
  EXPECT_EQ(result.at("signaturesVerificationStatus").as_string(), "success");
  EXPECT_FALSE(result.contains("sigstoreBundleVerificationStatus"));
  EXPECT_EQ(result.at("keySource").as_string(), "User Provided Key");
  EXPECT_EQ(result.at("keyFingerprint").as_string(), FINGERPRINT);

  const auto &second = verifications[1].at("verificationResult").as_object();
  EXPECT_EQ(second.at("signaturesVerificationStatus").as_string(), "failed");
  EXPECT_EQ(second.at("failureReason").as_string(), "no matching key found for envelope signatures");
  EXPECT_FALSE(second.contains("keySource"));
}

TEST(ReportPrinterTest, JsonReportSuccess)
{
  auto report = JsonReportPrinter::to_json(make_response(false));
  EXPECT_EQ(report.at("overallVerificationStatus").as_string(), "success");

  std::ostringstream out;
  auto printer = ReportPrinter::create(ReportFormat::Json, out);
  auto rc = printer->print(make_response(false));
  ASSERT_TRUE(rc) << rc.error().message();
  EXPECT_EQ(boost::json::parse(out.str()), report);
}

TEST(ReportPrinterTest, MarkdownReport)
{
  std::ostringstream out;
  auto printer = ReportPrinter::create(ReportFormat::Markdown, out);

  auto rc = printer->print(make_response(true));
  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error(), AttestErrc::VerificationFailed);

  auto text = out.str();
  EXPECT_NE(text.find("# Evidence Verification Result"), std::string::npos);
  EXPECT_NE(text.find("**Subject:** example-repo-local/app.bin"), std::string::npos);
  EXPECT_NE(text.find("| https://slsa.dev/provenance/v1 | success |"), std::string::npos);
  EXPECT_NE(text.find("| https://slsa.dev/provenance/v1 | failed |"), std::string::npos);
  EXPECT_NE(text.find("**Total loaded evidence:** 2"), std::string::npos);
  EXPECT_NE(text.find("**Successful verifications:** 1"), std::string::npos);
  EXPECT_NE(text.find("**Failed verifications:** 1"), std::string::npos);
  EXPECT_NE(text.find("**Overall verification status:** failed"), std::string::npos);
  EXPECT_NE(text.find("| evidence.dsse | User Provided Key | " + FINGERPRINT + " | success | - |"), std::string::npos);
  EXPECT_NE(text.find("| evidence.dsse | - | - | failed | no matching key found for envelope signatures |"), std::string::npos);
}

TEST(ReportPrinterTest, SigstoreSignerInReports)
{
  VerificationResponse response;
  response.subject = VerificationSubject{.path = "example-repo-local/app.bin", .sha256 = SUBJECT_SHA256};
  response.evidence_verifications.push_back(sigstore_verification());
  response.evidence_verifications.push_back(dsse_verification(VerificationStatus::Success, VerificationStatus::Success));

  std::ostringstream text_out;
  ASSERT_TRUE(ReportPrinter::create(ReportFormat::Text, text_out)->print(response));
  auto text = text_out.str();
  EXPECT_NE(text.find("- Sigstore verification status:   success"), std::string::npos);
  EXPECT_NE(text.find("- Signer identity:                signer@example.com"), std::string::npos);
  EXPECT_NE(text.find("- Signer issuer:                  https://accounts.example.com"), std::string::npos);
  EXPECT_NE(text.find("- Transparency log entries:       1"), std::string::npos);

  std::ostringstream markdown_out;
  ASSERT_TRUE(ReportPrinter::create(ReportFormat::Markdown, markdown_out)->print(response));
  auto markdown = markdown_out.str();
  EXPECT_NE(markdown.find("## Sigstore Signers"), std::string::npos);
  EXPECT_NE(markdown.find("| https://slsa.dev/provenance/v1 | signer@example.com | https://accounts.example.com | 1 |"),
            std::string::npos);

  auto report = JsonReportPrinter::to_json(response);
  const auto &verifications = report.at("evidenceVerifications").as_array();
  const auto &verified = verifications[0].at("verificationResult").at("sigstoreVerification").as_object();
  EXPECT_EQ(verified.at("signerIdentity").as_string(), "signer@example.com");
  EXPECT_EQ(verified.at("issuer").as_string(), "https://accounts.example.com");
  const auto &entries = verified.at("transparencyLogEntries").as_array();
  ASSERT_EQ(entries.size(), 1U);
  EXPECT_EQ(entries[0].at("logIndex").as_int64(), 42);
  EXPECT_EQ(entries[0].at("logId").as_string(), "c0d23d6ad406973f");
  EXPECT_EQ(entries[0].at("integratedTime").as_string(), "2025-01-01T10:00:00Z");
  EXPECT_FALSE(verifications[1].at("verificationResult").as_object().contains("sigstoreVerification"));
}

TEST(ReportPrinterTest, ReportFormatNames)
{
  EXPECT_EQ(utils::enum_from_string<ReportFormat>("markdown"), ReportFormat::Markdown);
  EXPECT_EQ(utils::enum_from_string<ReportFormat>("json"), ReportFormat::Json);
  EXPECT_FALSE(utils::enum_from_string<ReportFormat>("yaml").has_value());
}
