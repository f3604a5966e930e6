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

#include "sigstore/BundleLoader.hh"

#include <algorithm>
#include <array>

#include <google/protobuf/util/json_util.h>

#include "sigstore/SigstoreErrors.hh"

#include "envelope.pb.h"
#include "sigstore_bundle.pb.h"

namespace attest::sigstore
{
  namespace
  {
    constexpr std::array<const char *, 4> BUNDLE_MEDIA_TYPES{
      "application/vnd.dev.sigstore.bundle+json;version=0.1",
      "application/vnd.dev.sigstore.bundle+json;version=0.2",
      "application/vnd.dev.sigstore.bundle+json;version=0.3",
      "application/vnd.dev.sigstore.bundle.v0.3+json",
    };

    google::protobuf::util::JsonParseOptions parse_options()
    {
      google::protobuf::util::JsonParseOptions options;
      options.ignore_unknown_fields = true;
      options.case_insensitive_enum_parsing = true;
      return options;
    }

    bool is_bundle_media_type(const std::string &media_type)
    {
      return std::find(BUNDLE_MEDIA_TYPES.begin(), BUNDLE_MEDIA_TYPES.end(), media_type) != BUNDLE_MEDIA_TYPES.end();
    }
  } // namespace

  outcome::std_result<std::shared_ptr<const v1::Bundle>> BundleLoader::load_bundle(const std::string &json) const
  {
    auto bundle = std::make_shared<v1::Bundle>();

    auto status = google::protobuf::util::JsonStringToMessage(json, bundle.get(), parse_options());
    if (!status.ok())
      {
        logger_->debug("Content is not a Sigstore bundle: {}", std::string(status.message()));
        return SigstoreError::InvalidBundle;
      }

    if (!is_bundle_media_type(bundle->media_type()))
      {
        logger_->debug("Content has no Sigstore bundle media type: '{}'", bundle->media_type());
        return SigstoreError::InvalidBundle;
      }
    if (!bundle->has_verification_material())
      {
        logger_->error("Bundle does not contain verification material");
        return SigstoreError::InvalidBundle;
      }
    if (bundle->content_case() == v1::Bundle::CONTENT_NOT_SET)
      {
        logger_->error("Bundle contains neither a DSSE envelope nor a message signature");
        return SigstoreError::InvalidBundle;
      }

    return std::shared_ptr<const v1::Bundle>(std::move(bundle));
  }

  outcome::std_result<DsseEnvelope> BundleLoader::load_envelope(const std::string &json) const
  {
    v1::Envelope envelope;

    auto status = google::protobuf::util::JsonStringToMessage(json, &envelope, parse_options());
    if (!status.ok())
      {
        logger_->debug("Content is not a DSSE envelope: {}", std::string(status.message()));
        return SigstoreError::InvalidEnvelope;
      }

    if (envelope.payload().empty() || envelope.payload_type().empty() || envelope.signatures().empty())
      {
        logger_->debug("DSSE envelope lacks payload, payloadType or signatures");
        return SigstoreError::InvalidEnvelope;
      }

    return to_envelope(envelope);
  }

  DsseEnvelope BundleLoader::to_envelope(const v1::Envelope &envelope)
  {
    DsseEnvelope result{.payload = envelope.payload(), .payload_type = envelope.payload_type(), .signatures = {}};
    for (const auto &signature: envelope.signatures())
      {
        result.signatures.push_back({.keyid = signature.keyid(), .sig = signature.sig()});
      }
    return result;
  }

  outcome::std_result<std::string> BundleLoader::to_json(const v1::Bundle &bundle)
  {
    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = false;

    auto status = google::protobuf::util::MessageToJsonString(bundle, &json, options);
    if (!status.ok())
      {
        return SigstoreError::InvalidBundle;
      }
    return json;
  }

} // namespace attest::sigstore
