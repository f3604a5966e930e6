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

#ifndef REPORT_PRINTERS_HH
#define REPORT_PRINTERS_HH

#include <ostream>
#include <string>

#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>

#include "attest/Model.hh"
#include "attest/ReportPrinter.hh"

class TextReportPrinter : public attest::ReportPrinter
{
public:
  TextReportPrinter(std::ostream &out, bool use_color);

  outcome::std_result<void> print(const attest::VerificationResponse &response) override;

private:
  void print_verification(const attest::EvidenceVerification &verification, std::size_t index);
  std::string status_text(attest::VerificationStatus status) const;
  std::string summary_text(std::size_t succeeded, std::size_t total) const;

private:
  std::ostream &out;
  bool use_color;
};

class JsonReportPrinter : public attest::ReportPrinter
{
public:
  explicit JsonReportPrinter(std::ostream &out);

  outcome::std_result<void> print(const attest::VerificationResponse &response) override;

  static boost::json::value to_json(const attest::VerificationResponse &response);

private:
  std::ostream &out;
};

class MarkdownReportPrinter : public attest::ReportPrinter
{
public:
  explicit MarkdownReportPrinter(std::ostream &out);

  outcome::std_result<void> print(const attest::VerificationResponse &response) override;

private:
  std::ostream &out;
};

#endif // REPORT_PRINTERS_HH
