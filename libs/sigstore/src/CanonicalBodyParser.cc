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

#include "CanonicalBodyParser.hh"

#include <boost/json.hpp>

#include "sigstore/SigstoreErrors.hh"
#include "utils/Base64.hh"

namespace attest::sigstore
{
  namespace
  {
    // Walks a path of object keys and returns the string at its end, or nullptr.
    const boost::json::string *find_string(const boost::json::object &obj, std::initializer_list<const char *> path)
    {
      const boost::json::object *current = &obj;
      const boost::json::value *value = nullptr;
      for (const auto *key: path)
        {
          if (current == nullptr)
            {
              return nullptr;
            }
          value = current->if_contains(key);
          if (value == nullptr)
            {
              return nullptr;
            }
          current = value->if_object();
        }
      return value != nullptr ? value->if_string() : nullptr;
    }
  } // namespace

  outcome::std_result<LogEntry> CanonicalBodyParser::parse(const std::string &json_body) const
  {
    try
      {
        boost::json::value json_val = boost::json::parse(json_body);
        const auto *obj = json_val.if_object();
        if (obj == nullptr)
          {
            logger_->error("Canonicalized body is not a JSON object");
            return SigstoreError::InvalidTransparencyLog;
          }

        const auto *kind = find_string(*obj, {"kind"});
        const auto *api_version = find_string(*obj, {"apiVersion"});
        const auto *spec_val = obj->if_contains("spec");
        if (kind == nullptr || api_version == nullptr || spec_val == nullptr || !spec_val->is_object())
          {
            logger_->error("Canonicalized body lacks kind, apiVersion or spec");
            return SigstoreError::InvalidTransparencyLog;
          }

        LogEntry entry{.kind = std::string(*kind), .api_version = std::string(*api_version), .spec = {}};
        const auto &spec = spec_val->as_object();

        if (entry.kind == "hashedrekord" && entry.api_version == "0.0.1")
          {
            auto result = parse_hashed_rekord(spec);
            if (!result)
              {
                return result.error();
              }
            entry.spec = std::move(result.value());
          }
        else if (entry.kind == "dsse" && entry.api_version == "0.0.1")
          {
            auto result = parse_dsse(spec);
            if (!result)
              {
                return result.error();
              }
            entry.spec = std::move(result.value());
          }
        else if (entry.kind == "intoto" && entry.api_version == "0.0.2")
          {
            auto result = parse_intoto(spec);
            if (!result)
              {
                return result.error();
              }
            entry.spec = std::move(result.value());
          }
        else
          {
            logger_->error("Unsupported entry kind {} {} in canonicalized body", entry.kind, entry.api_version);
            return SigstoreError::InvalidTransparencyLog;
          }
        return entry;
      }
    catch (const std::exception &e)
      {
        logger_->error("Exception while parsing canonicalized body: {}", e.what());
        return SigstoreError::InvalidTransparencyLog;
      }
  }

  outcome::std_result<HashedRekord> CanonicalBodyParser::parse_hashed_rekord(const boost::json::object &spec) const
  {
    const auto *algorithm = find_string(spec, {"data", "hash", "algorithm"});
    const auto *value = find_string(spec, {"data", "hash", "value"});
    const auto *content = find_string(spec, {"signature", "content"});
    const auto *public_key = find_string(spec, {"signature", "publicKey", "content"});
    if (algorithm == nullptr || value == nullptr || content == nullptr || public_key == nullptr)
      {
        logger_->error("hashedrekord spec is incomplete");
        return SigstoreError::InvalidTransparencyLog;
      }

    return HashedRekord{.hash_algorithm = std::string(*algorithm),
                        .hash_value = std::string(*value),
                        .signature = attest::utils::Base64::decode(std::string(*content)),
                        .public_key = attest::utils::Base64::decode(std::string(*public_key))};
  }

  outcome::std_result<DsseRekord> CanonicalBodyParser::parse_dsse(const boost::json::object &spec) const
  {
    const auto *algorithm = find_string(spec, {"payloadHash", "algorithm"});
    const auto *value = find_string(spec, {"payloadHash", "value"});
    const auto *signatures = spec.if_contains("signatures");
    if (algorithm == nullptr || value == nullptr || signatures == nullptr || !signatures->is_array())
      {
        logger_->error("dsse spec is incomplete");
        return SigstoreError::InvalidTransparencyLog;
      }

    DsseRekord rekord{.payload_hash_algorithm = std::string(*algorithm), .payload_hash = std::string(*value), .signatures = {}};
    for (const auto &signature: signatures->as_array())
      {
        const auto *sig_obj = signature.if_object();
        const auto *sig = sig_obj != nullptr ? find_string(*sig_obj, {"signature"}) : nullptr;
        const auto *verifier = sig_obj != nullptr ? find_string(*sig_obj, {"verifier"}) : nullptr;
        if (sig == nullptr || verifier == nullptr)
          {
            logger_->error("dsse spec signature is incomplete");
            return SigstoreError::InvalidTransparencyLog;
          }
        rekord.signatures.push_back({.signature = attest::utils::Base64::decode(std::string(*sig)),
                                     .verifier = attest::utils::Base64::decode(std::string(*verifier))});
      }
    return rekord;
  }

  outcome::std_result<IntotoRekord> CanonicalBodyParser::parse_intoto(const boost::json::object &spec) const
  {
    const auto *algorithm = find_string(spec, {"content", "payloadHash", "algorithm"});
    const auto *value = find_string(spec, {"content", "payloadHash", "value"});
    const auto *content = spec.if_contains("content");
    const auto *envelope = (content != nullptr && content->is_object()) ? content->as_object().if_contains("envelope") : nullptr;
    const auto *signatures = (envelope != nullptr && envelope->is_object()) ? envelope->as_object().if_contains("signatures") : nullptr;
    if (algorithm == nullptr || value == nullptr || signatures == nullptr || !signatures->is_array())
      {
        logger_->error("intoto spec is incomplete");
        return SigstoreError::InvalidTransparencyLog;
      }

    IntotoRekord rekord{.payload_hash_algorithm = std::string(*algorithm), .payload_hash = std::string(*value), .signatures = {}};
    for (const auto &signature: signatures->as_array())
      {
        const auto *sig_obj = signature.if_object();
        const auto *sig = sig_obj != nullptr ? find_string(*sig_obj, {"sig"}) : nullptr;
        const auto *public_key = sig_obj != nullptr ? find_string(*sig_obj, {"publicKey"}) : nullptr;
        if (sig == nullptr || public_key == nullptr)
          {
            logger_->error("intoto spec signature is incomplete");
            return SigstoreError::InvalidTransparencyLog;
          }
        // intoto 0.0.2 stores the base64 signature base64 encoded once more.
        rekord.signatures.push_back(
          {.signature = attest::utils::Base64::decode(attest::utils::Base64::decode(std::string(*sig))),
           .verifier = attest::utils::Base64::decode(std::string(*public_key))});
      }
    return rekord;
  }

} // namespace attest::sigstore
