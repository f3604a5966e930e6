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

#include "sigstore/TrustedRoot.hh"

#include <fstream>
#include <sstream>

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "sigstore/SigstoreErrors.hh"
#include "utils/Base64.hh"
#include "utils/DateUtils.hh"
#include "utils/Logging.hh"

namespace attest::sigstore
{
  namespace
  {
    std::shared_ptr<spdlog::logger> logger()
    {
      static auto logger = attest::utils::Logging::create("attest:sigstore:trusted_root");
      return logger;
    }

    std::string get_string(const boost::json::object &obj, const char *key)
    {
      const auto *value = obj.if_contains(key);
      if (value == nullptr || !value->is_string())
        {
          return {};
        }
      return std::string(value->as_string());
    }

    const boost::json::object *get_object(const boost::json::object &obj, const char *key)
    {
      const auto *value = obj.if_contains(key);
      if (value == nullptr || !value->is_object())
        {
          return nullptr;
        }
      return &value->as_object();
    }

    const boost::json::array *get_array(const boost::json::object &obj, const char *key)
    {
      const auto *value = obj.if_contains(key);
      if (value == nullptr || !value->is_array())
        {
          return nullptr;
        }
      return &value->as_array();
    }

    ValidityPeriod parse_validity(const boost::json::object *valid_for)
    {
      ValidityPeriod period;
      if (valid_for == nullptr)
        {
          return period;
        }

      if (auto start = get_string(*valid_for, "start"); !start.empty())
        {
          period.start = attest::utils::DateUtils::parse_time_point(start);
        }
      if (auto end = get_string(*valid_for, "end"); !end.empty())
        {
          period.end = attest::utils::DateUtils::parse_time_point(end);
        }
      return period;
    }

    outcome::std_result<std::vector<TransparencyLogInstance>> parse_logs(const boost::json::object &root, const char *key)
    {
      std::vector<TransparencyLogInstance> logs;

      const auto *entries = get_array(root, key);
      if (entries == nullptr)
        {
          return logs;
        }

      for (const auto &entry: *entries)
        {
          if (!entry.is_object())
            {
              logger()->error("{} entry is not an object", key);
              return SigstoreError::InvalidTrustedRoot;
            }
          const auto &obj = entry.as_object();

          const auto *public_key = get_object(obj, "publicKey");
          const auto *log_id = get_object(obj, "logId");
          if (public_key == nullptr || log_id == nullptr)
            {
              logger()->error("{} entry lacks publicKey or logId", key);
              return SigstoreError::InvalidTrustedRoot;
            }

          auto key_result = PublicKey::from_der(attest::utils::Base64::decode(get_string(*public_key, "rawBytes")));
          if (!key_result)
            {
              logger()->warn("skipping {} entry {} with unsupported public key", key, get_string(obj, "baseUrl"));
              continue;
            }

          TransparencyLogInstance instance;
          instance.base_url = get_string(obj, "baseUrl");
          instance.log_id = attest::utils::Base64::decode(get_string(*log_id, "keyId"));
          instance.public_key = std::make_shared<const PublicKey>(std::move(key_result.value()));
          instance.valid_for = parse_validity(get_object(*public_key, "validFor"));
          logs.push_back(std::move(instance));
        }
      return logs;
    }

    outcome::std_result<std::vector<CertificateAuthority>> parse_authorities(const boost::json::object &root, const char *key)
    {
      std::vector<CertificateAuthority> authorities;

      const auto *entries = get_array(root, key);
      if (entries == nullptr)
        {
          return authorities;
        }

      for (const auto &entry: *entries)
        {
          if (!entry.is_object())
            {
              logger()->error("{} entry is not an object", key);
              return SigstoreError::InvalidTrustedRoot;
            }
          const auto &obj = entry.as_object();

          const auto *cert_chain = get_object(obj, "certChain");
          const auto *certificates = cert_chain != nullptr ? get_array(*cert_chain, "certificates") : nullptr;
          if (certificates == nullptr || certificates->empty())
            {
              logger()->error("{} entry has no certificate chain", key);
              return SigstoreError::InvalidTrustedRoot;
            }

          CertificateAuthority authority;
          authority.uri = get_string(obj, "uri");
          authority.valid_for = parse_validity(get_object(obj, "validFor"));

          for (const auto &certificate: *certificates)
            {
              if (!certificate.is_object())
                {
                  return SigstoreError::InvalidTrustedRoot;
                }
              auto cert_result = Certificate::from_der(attest::utils::Base64::decode(get_string(certificate.as_object(), "rawBytes")));
              if (!cert_result)
                {
                  logger()->error("invalid certificate in {} entry {}", key, authority.uri);
                  return SigstoreError::InvalidTrustedRoot;
                }
              authority.chain.push_back(std::make_shared<const Certificate>(std::move(cert_result.value())));
            }
          authorities.push_back(std::move(authority));
        }
      return authorities;
    }

    const TransparencyLogInstance *find_log(const std::vector<TransparencyLogInstance> &logs, const std::string &log_id)
    {
      for (const auto &log: logs)
        {
          if (log.log_id == log_id)
            {
              return &log;
            }
        }
      return nullptr;
    }
  } // namespace

  bool ValidityPeriod::contains(std::chrono::system_clock::time_point tp) const
  {
    if (start && tp < *start)
      {
        return false;
      }
    if (end && tp > *end)
      {
        return false;
      }
    return true;
  }

  outcome::std_result<std::shared_ptr<const TrustedRoot>> TrustedRoot::from_json(const std::string &json)
  {
    try
      {
        boost::json::value root = boost::json::parse(json);
        if (!root.is_object())
          {
            logger()->error("trusted root is not a JSON object");
            return SigstoreError::InvalidTrustedRoot;
          }
        const auto &obj = root.as_object();

        auto trusted_root = std::make_shared<TrustedRoot>();

        auto tlogs = parse_logs(obj, "tlogs");
        if (!tlogs)
          {
            return tlogs.error();
          }
        auto ctlogs = parse_logs(obj, "ctlogs");
        if (!ctlogs)
          {
            return ctlogs.error();
          }
        auto cas = parse_authorities(obj, "certificateAuthorities");
        if (!cas)
          {
            return cas.error();
          }
        auto tsas = parse_authorities(obj, "timestampAuthorities");
        if (!tsas)
          {
            return tsas.error();
          }

        trusted_root->tlogs_ = std::move(tlogs.value());
        trusted_root->ctlogs_ = std::move(ctlogs.value());
        trusted_root->certificate_authorities_ = std::move(cas.value());
        trusted_root->timestamp_authorities_ = std::move(tsas.value());

        logger()->debug("loaded trusted root: {} tlogs, {} ctlogs, {} CAs, {} TSAs",
                        trusted_root->tlogs_.size(),
                        trusted_root->ctlogs_.size(),
                        trusted_root->certificate_authorities_.size(),
                        trusted_root->timestamp_authorities_.size());

        return std::shared_ptr<const TrustedRoot>(std::move(trusted_root));
      }
    catch (const std::exception &e)
      {
        logger()->error("failed to parse trusted root: {}", e.what());
        return SigstoreError::InvalidTrustedRoot;
      }
  }

  outcome::std_result<std::shared_ptr<const TrustedRoot>> TrustedRoot::from_file(const std::filesystem::path &path)
  {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
      {
        logger()->error("failed to open trusted root {}", path.string());
        return SigstoreError::TrustedRootUnavailable;
      }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
  }

  const std::vector<TransparencyLogInstance> &TrustedRoot::tlogs() const
  {
    return tlogs_;
  }

  const std::vector<TransparencyLogInstance> &TrustedRoot::ctlogs() const
  {
    return ctlogs_;
  }

  const std::vector<CertificateAuthority> &TrustedRoot::certificate_authorities() const
  {
    return certificate_authorities_;
  }

  const std::vector<CertificateAuthority> &TrustedRoot::timestamp_authorities() const
  {
    return timestamp_authorities_;
  }

  const TransparencyLogInstance *TrustedRoot::find_tlog(const std::string &log_id) const
  {
    return find_log(tlogs_, log_id);
  }

  const TransparencyLogInstance *TrustedRoot::find_ctlog(const std::string &log_id) const
  {
    return find_log(ctlogs_, log_id);
  }

} // namespace attest::sigstore
