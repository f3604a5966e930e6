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

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include "attest/ReportPrinter.hh"
#include "utils/Enum.hh"
#include "utils/Logging.hh"
#include "VerifyCommand.hh"

namespace po = boost::program_options;

int
main(int argc, char *argv[])
{
  VerifyOptions options;
  std::string format;

  po::options_description desc("Usage: attest-verify [options]");
  // clang-format off
  desc.add_options()
    ("help,h", "show this help")
    ("subject-sha256", po::value(&options.subject_sha256), "sha256 of the subject")
    ("subject-file", po::value(&options.subject_file), "subject file to compute the sha256 of")
    ("subject-path", po::value(&options.subject_path), "repository path of the subject, used in the report")
    ("evidence-metadata", po::value(&options.evidence_metadata), "evidence search result (JSON)")
    ("evidence-dir", po::value(&options.evidence_dir), "read evidence files from this directory instead of the server")
    ("url", po::value(&options.url), "server URL (overrides ATTEST_URL)")
    ("access-token", po::value(&options.access_token), "access token (overrides ATTEST_ACCESS_TOKEN)")
    ("keys", po::value(&options.keys)->multitoken(), "PEM public key files")
    ("use-artifactory-keys", po::value<bool>(), "fall back to the signing key stored with the evidence")
    ("format", po::value(&format)->default_value("text"), "report format: text, json or markdown")
    ("trusted-root", po::value(&options.trusted_root), "pinned Sigstore trusted_root.json")
    ("tuf-root", po::value(&options.tuf_root), "initial Sigstore TUF root.json")
    ("home", po::value(&options.home), "configuration directory (default $ATTEST_HOME or ~/.attest)")
    ("log-level", po::value(&options.log_level)->default_value("warn"), "log level")
    ("log-file", po::value(&options.log_file), "also log to this file")
    ("save-settings", po::bool_switch(&options.save_settings), "store url, access token, trusted root, TUF root and key options");
  // clang-format on

  po::variables_map vm;
  try
    {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    }
  catch (const po::error &e)
    {
      std::cerr << "Error: " << e.what() << std::endl << desc << std::endl;
      return VerifyCommand::EXIT_ERROR;
    }

  if (vm.count("help") != 0U)
    {
      std::cout << desc << std::endl;
      return EXIT_SUCCESS;
    }

  if (options.subject_sha256.empty() && options.subject_file.empty())
    {
      std::cerr << "Error: one of --subject-sha256 or --subject-file is required" << std::endl;
      return VerifyCommand::EXIT_ERROR;
    }
  if (options.evidence_metadata.empty())
    {
      std::cerr << "Error: --evidence-metadata is required" << std::endl;
      return VerifyCommand::EXIT_ERROR;
    }

  auto report_format = attest::utils::enum_from_string<attest::ReportFormat>(format);
  if (!report_format)
    {
      std::cerr << "Error: unsupported format " << format << std::endl;
      return VerifyCommand::EXIT_ERROR;
    }
  options.format = *report_format;

  if (vm.count("use-artifactory-keys") != 0U)
    {
      options.use_artifactory_keys = vm["use-artifactory-keys"].as<bool>();
    }

  try
    {
      attest::utils::Logging::init(options.log_level, options.log_file);
    }
  catch (const std::exception &e)
    {
      std::cerr << "Error: failed to initialize logging (" << e.what() << ")" << std::endl;
      return VerifyCommand::EXIT_ERROR;
    }

  VerifyCommand command(std::move(options));
  return command.run();
}
