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

#ifndef ATTEST_REPORT_PRINTER_HH
#define ATTEST_REPORT_PRINTER_HH

#include <array>
#include <memory>
#include <ostream>
#include <string_view>
#include <utility>

#include <boost/outcome/std_result.hpp>

#include "attest/Model.hh"
#include "utils/Enum.hh"

namespace attest
{
  namespace outcome = boost::outcome_v2;

  enum class ReportFormat
  {
    Text,
    Json,
    Markdown,
  };

  class ReportPrinter
  {
  public:
    virtual ~ReportPrinter() = default;

    static std::unique_ptr<ReportPrinter> create(ReportFormat format, std::ostream &out, bool use_color = false);

    // Prints the report. Returns AttestErrc::VerificationFailed when the overall status is failed.
    virtual outcome::std_result<void> print(const VerificationResponse &response) = 0;
  };
} // namespace attest

template<>
struct attest::utils::enum_traits<attest::ReportFormat>
{
  static constexpr std::array<std::pair<std::string_view, attest::ReportFormat>, 3> names{
    {{"text", attest::ReportFormat::Text}, {"json", attest::ReportFormat::Json}, {"markdown", attest::ReportFormat::Markdown}}};
};

#endif // ATTEST_REPORT_PRINTER_HH
