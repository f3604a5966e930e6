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

#include "TufMetadata.hh"

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

#include <boost/json.hpp>

#include "CanonicalJson.hh"
#include "sigstore/SigstoreErrors.hh"
#include "utils/DateUtils.hh"
#include "utils/Hex.hh"

namespace attest::sigstore
{
  namespace
  {
    std::shared_ptr<spdlog::logger> logger()
    {
      static auto logger = attest::utils::Logging::create("attest:sigstore:tuf");
      return logger;
    }

    const boost::json::object *get_object(const boost::json::object &obj, std::string_view key)
    {
      const auto *value = obj.if_contains(key);
      if (value == nullptr || !value->is_object())
        {
          return nullptr;
        }
      return &value->as_object();
    }

    std::optional<std::string> get_string(const boost::json::object &obj, std::string_view key)
    {
      const auto *value = obj.if_contains(key);
      if (value == nullptr || !value->is_string())
        {
          return std::nullopt;
        }
      return std::string(value->as_string());
    }

    std::optional<std::int64_t> get_int(const boost::json::object &obj, std::string_view key)
    {
      const auto *value = obj.if_contains(key);
      if (value == nullptr || !value->is_int64())
        {
          return std::nullopt;
        }
      return value->as_int64();
    }

    std::optional<std::string> get_sha256(const boost::json::object &obj)
    {
      const auto *hashes = get_object(obj, "hashes");
      if (hashes == nullptr)
        {
          return std::nullopt;
        }
      return get_string(*hashes, "sha256");
    }

    outcome::std_result<std::shared_ptr<const PublicKey>> load_key(const boost::json::object &key)
    {
      auto keytype = get_string(key, "keytype");
      const auto *keyval = get_object(key, "keyval");
      auto public_key = keyval != nullptr ? get_string(*keyval, "public") : std::nullopt;
      if (!keytype || !public_key)
        {
          return SigstoreError::InvalidTufMetadata;
        }

      outcome::std_result<PublicKey> result = SigstoreError::InvalidPublicKey;
      if (*keytype == "ed25519")
        {
          auto raw_key = attest::utils::Hex::decode(*public_key);
          if (!raw_key)
            {
              return SigstoreError::InvalidPublicKey;
            }
          result = PublicKey::from_ed25519(*raw_key);
        }
      else if (*keytype == "ecdsa" || *keytype == "ecdsa-sha2-nistp256" || *keytype == "rsa")
        {
          result = PublicKey::from_pem(*public_key);
        }
      else
        {
          logger()->debug("ignoring unsupported TUF key type {}", *keytype);
          return SigstoreError::InvalidPublicKey;
        }

      if (!result)
        {
          return result.as_failure();
        }
      return std::make_shared<const PublicKey>(std::move(result.value()));
    }
  } // namespace

  outcome::std_result<TufMetadata> TufMetadata::parse(const std::string &content, const std::string &expected_type)
  {
    boost::system::error_code ec;
    auto value = boost::json::parse(content, ec);
    if (ec || !value.is_object())
      {
        logger()->error("{} metadata is not a JSON object", expected_type);
        return SigstoreError::InvalidTufMetadata;
      }

    TufMetadata metadata;
    metadata.content = content;
    metadata.document = std::move(value.as_object());

    const auto *signed_part = get_object(metadata.document, "signed");
    const auto *signatures = metadata.document.if_contains("signatures");
    if (signed_part == nullptr || signatures == nullptr || !signatures->is_array())
      {
        logger()->error("{} metadata lacks signed or signatures", expected_type);
        return SigstoreError::InvalidTufMetadata;
      }

    auto type = get_string(*signed_part, "_type");
    auto version = get_int(*signed_part, "version");
    auto expires = get_string(*signed_part, "expires");
    if (!type || *type != expected_type || !version || *version < 1 || !expires)
      {
        logger()->error("{} metadata has an invalid _type, version or expires", expected_type);
        return SigstoreError::InvalidTufMetadata;
      }

    try
      {
        metadata.expires = attest::utils::DateUtils::parse_time_point(*expires);
      }
    catch (const std::exception &e)
      {
        logger()->error("{} metadata has an invalid expiry '{}' ({})", expected_type, *expires, e.what());
        return SigstoreError::InvalidTufMetadata;
      }

    metadata.type = *type;
    metadata.version = *version;
    return metadata;
  }

  const std::string &TufMetadata::get_type() const
  {
    return type;
  }

  std::int64_t TufMetadata::get_version() const
  {
    return version;
  }

  std::chrono::system_clock::time_point TufMetadata::get_expires() const
  {
    return expires;
  }

  bool TufMetadata::is_expired(std::chrono::system_clock::time_point now) const
  {
    return now >= expires;
  }

  const boost::json::object &TufMetadata::get_signed() const
  {
    return document.at("signed").as_object();
  }

  const boost::json::array &TufMetadata::get_signatures() const
  {
    return document.at("signatures").as_array();
  }

  const std::string &TufMetadata::get_content() const
  {
    return content;
  }

  outcome::std_result<TufMetadata::MetaFile> TufMetadata::get_meta(const std::string &file) const
  {
    const auto *meta = get_object(get_signed(), "meta");
    const auto *entry = meta != nullptr ? get_object(*meta, file) : nullptr;
    auto meta_version = entry != nullptr ? get_int(*entry, "version") : std::nullopt;
    if (!meta_version)
      {
        logger()->error("{} metadata does not list {}", type, file);
        return SigstoreError::InvalidTufMetadata;
      }
    return MetaFile{.version = *meta_version, .length = get_int(*entry, "length"), .sha256 = get_sha256(*entry)};
  }

  outcome::std_result<TufMetadata::Target> TufMetadata::get_target(const std::string &name) const
  {
    const auto *targets = get_object(get_signed(), "targets");
    const auto *entry = targets != nullptr ? get_object(*targets, name) : nullptr;
    auto length = entry != nullptr ? get_int(*entry, "length") : std::nullopt;
    auto sha256 = entry != nullptr ? get_sha256(*entry) : std::nullopt;
    if (!length || !sha256)
      {
        logger()->error("targets metadata does not describe {}", name);
        return SigstoreError::InvalidTufMetadata;
      }
    return Target{.length = *length, .sha256 = *sha256};
  }

  TufRoot::TufRoot(TufMetadata metadata)
    : metadata(std::move(metadata))
  {
  }

  outcome::std_result<TufRoot> TufRoot::from_metadata(TufMetadata metadata)
  {
    if (metadata.get_type() != "root")
      {
        return SigstoreError::InvalidTufMetadata;
      }

    TufRoot root(std::move(metadata));
    const auto &signed_part = root.metadata.get_signed();

    const auto *keys = get_object(signed_part, "keys");
    const auto *roles = get_object(signed_part, "roles");
    if (keys == nullptr || roles == nullptr)
      {
        root.logger->error("root metadata lacks keys or roles");
        return SigstoreError::InvalidTufMetadata;
      }

    for (const auto &key: *keys)
      {
        const std::string keyid(key.key());
        if (!key.value().is_object())
          {
            return SigstoreError::InvalidTufMetadata;
          }
        auto public_key = load_key(key.value().as_object());
        if (!public_key)
          {
            root.logger->warn("skipping TUF key {} ({})", keyid, public_key.error().message());
            continue;
          }
        root.keys[keyid] = public_key.value();
      }

    for (const auto *name: {"root", "timestamp", "snapshot", "targets"})
      {
        const auto *role = get_object(*roles, name);
        const auto *keyids = role != nullptr ? role->if_contains("keyids") : nullptr;
        auto threshold = role != nullptr ? get_int(*role, "threshold") : std::nullopt;
        if (keyids == nullptr || !keyids->is_array() || !threshold || *threshold < 1)
          {
            root.logger->error("root metadata has no valid {} role", name);
            return SigstoreError::InvalidTufMetadata;
          }

        Role entry{.keyids = {}, .threshold = static_cast<std::size_t>(*threshold)};
        for (const auto &keyid: keyids->as_array())
          {
            if (keyid.is_string())
              {
                entry.keyids.emplace_back(keyid.as_string());
              }
          }
        root.roles[name] = std::move(entry);
      }

    return root;
  }

  outcome::std_result<void> TufRoot::verify_role(const std::string &role, const TufMetadata &signed_metadata) const
  {
    auto it = roles.find(role);
    if (it == roles.end())
      {
        return SigstoreError::InvalidTufMetadata;
      }
    const auto &[keyids, threshold] = it->second;

    auto signed_data = canonical_json(signed_metadata.get_signed());
    if (!signed_data)
      {
        logger->error("{} metadata cannot be canonicalized", role);
        return signed_data.as_failure();
      }

    std::set<std::string> verified_keys;
    for (const auto &entry: signed_metadata.get_signatures())
      {
        if (!entry.is_object())
          {
            continue;
          }
        auto keyid = get_string(entry.as_object(), "keyid");
        auto sig = get_string(entry.as_object(), "sig");
        if (!keyid || !sig || verified_keys.contains(*keyid)
            || std::find(keyids.begin(), keyids.end(), *keyid) == keyids.end())
          {
            continue;
          }

        auto key = keys.find(*keyid);
        auto signature = attest::utils::Hex::decode(*sig);
        if (key == keys.end() || !signature)
          {
            continue;
          }

        auto valid = key->second->verify_signature(signed_data.value(), *signature);
        if (valid && valid.value())
          {
            verified_keys.insert(*keyid);
          }
      }

    if (verified_keys.size() < threshold)
      {
        logger->error("{} metadata version {} has {} valid signatures, {} required",
                      role,
                      signed_metadata.get_version(),
                      verified_keys.size(),
                      threshold);
        return SigstoreError::TufSignatureThresholdNotMet;
      }
    return outcome::success();
  }

  outcome::std_result<TufRoot> TufRoot::update(const std::string &content) const
  {
    auto next_metadata = TufMetadata::parse(content, "root");
    if (!next_metadata)
      {
        return next_metadata.as_failure();
      }

    if (next_metadata.value().get_version() != get_version() + 1)
      {
        logger->error("expected root version {}, got {}", get_version() + 1, next_metadata.value().get_version());
        return SigstoreError::TufVersionMismatch;
      }

    auto rc = verify_role("root", next_metadata.value());
    if (!rc)
      {
        return rc.as_failure();
      }

    auto next = from_metadata(std::move(next_metadata.value()));
    if (!next)
      {
        return next.as_failure();
      }

    rc = next.value().verify_role("root", next.value().metadata);
    if (!rc)
      {
        return rc.as_failure();
      }

    logger->info("updated TUF root to version {}", next.value().get_version());
    return next;
  }

  std::int64_t TufRoot::get_version() const
  {
    return metadata.get_version();
  }

  bool TufRoot::is_expired(std::chrono::system_clock::time_point now) const
  {
    return metadata.is_expired(now);
  }

  const std::string &TufRoot::get_content() const
  {
    return metadata.get_content();
  }
} // namespace attest::sigstore
