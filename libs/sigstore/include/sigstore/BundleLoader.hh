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

#ifndef ATTEST_SIGSTORE_BUNDLE_LOADER_HH
#define ATTEST_SIGSTORE_BUNDLE_LOADER_HH

#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "sigstore/Dsse.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore::v1
{
  class Bundle;
  class Envelope;
} // namespace attest::sigstore::v1

namespace attest::sigstore
{
  // Decodes the JSON forms of Sigstore bundles and DSSE envelopes.
  class BundleLoader
  {
  public:
    // Fails unless the media type is a Sigstore bundle type and verification material is present.
    outcome::std_result<std::shared_ptr<const v1::Bundle>> load_bundle(const std::string &json) const;

    // Fails unless payload, payloadType and signatures are all present.
    outcome::std_result<DsseEnvelope> load_envelope(const std::string &json) const;

    static DsseEnvelope to_envelope(const v1::Envelope &envelope);
    static outcome::std_result<std::string> to_json(const v1::Bundle &bundle);

  private:
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:bundle_loader")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_BUNDLE_LOADER_HH
