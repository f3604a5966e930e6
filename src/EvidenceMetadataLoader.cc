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

#include "attest/EvidenceMetadataLoader.hh"

#include <fstream>
#include <sstream>

#include <boost/json.hpp>

#include "attest/AttestErrors.hh"

using namespace attest;

namespace
{
  std::string
  get_string(const boost::json::object &obj, const char *key)
  {
    const auto *value = obj.if_contains(key);
    if (value == nullptr || !value->is_string())
      {
        return {};
      }
    return std::string(value->get_string());
  }

  const boost::json::object *
  get_object(const boost::json::object &obj, const char *key)
  {
    const auto *value = obj.if_contains(key);
    return value != nullptr ? value->if_object() : nullptr;
  }

  EvidenceMetadata
  to_evidence_metadata(const boost::json::object &node)
  {
    EvidenceMetadata evidence{
      .download_path = get_string(node, "downloadPath"),
      .name = get_string(node, "name"),
      .sha256 = get_string(node, "sha256"),
      .repository_key = get_string(node, "repositoryKey"),
      .path = get_string(node, "path"),
      .predicate_type = get_string(node, "predicateType"),
      .predicate_category = get_string(node, "predicateCategory"),
      .predicate_slug = get_string(node, "predicateSlug"),
      .created_at = get_string(node, "createdAt"),
      .created_by = get_string(node, "createdBy"),
    };

    if (const auto *subject = get_object(node, "subject"))
      {
        evidence.subject = EvidenceSubject{
          .sha256 = get_string(*subject, "sha256"),
          .repository_key = get_string(*subject, "repositoryKey"),
          .path = get_string(*subject, "path"),
          .name = get_string(*subject, "name"),
        };
      }
    if (const auto *key = get_object(node, "signingKey"))
      {
        evidence.signing_key = SigningKey{.alias = get_string(*key, "alias"), .public_key = get_string(*key, "publicKey")};
      }
    return evidence;
  }
} // namespace

outcome::std_result<std::vector<EvidenceMetadata>>
EvidenceMetadataLoader::parse(const std::string &json) const
{
  boost::json::value root;
  try
    {
      root = boost::json::parse(json);
    }
  catch (const std::exception &e)
    {
      logger->error("failed to parse evidence metadata ({})", e.what());
      return AttestErrc::InvalidEvidenceMetadata;
    }

  std::vector<EvidenceMetadata> evidence;

  if (const auto *nodes = root.if_array())
    {
      for (const auto &node: *nodes)
        {
          if (!node.is_object())
            {
              logger->error("evidence metadata entry is not an object");
              return AttestErrc::InvalidEvidenceMetadata;
            }
          evidence.push_back(to_evidence_metadata(node.get_object()));
        }
    }
  else if (const auto *obj = root.if_object())
    {
      const boost::json::object *search = nullptr;
      if (const auto *data = get_object(*obj, "data"))
        {
          if (const auto *evidence_obj = get_object(*data, "evidence"))
            {
              search = get_object(*evidence_obj, "searchEvidence");
            }
        }
      const auto *edges = search != nullptr ? search->if_contains("edges") : nullptr;
      if (edges == nullptr || !edges->is_array())
        {
          logger->error("evidence metadata has no data.evidence.searchEvidence.edges");
          return AttestErrc::InvalidEvidenceMetadata;
        }

      for (const auto &edge: edges->get_array())
        {
          const auto *node = edge.is_object() ? get_object(edge.get_object(), "node") : nullptr;
          if (node == nullptr)
            {
              logger->error("evidence edge has no node");
              return AttestErrc::InvalidEvidenceMetadata;
            }
          evidence.push_back(to_evidence_metadata(*node));
        }
    }
  else
    {
      logger->error("evidence metadata is neither an object nor an array");
      return AttestErrc::InvalidEvidenceMetadata;
    }

  if (evidence.empty())
    {
      logger->error("no evidence found for the given subject");
      return AttestErrc::NoEvidenceFound;
    }
  return evidence;
}

outcome::std_result<std::vector<EvidenceMetadata>>
EvidenceMetadataLoader::load_file(const std::filesystem::path &path) const
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    {
      logger->error("failed to open evidence metadata {}", path.string());
      return AttestErrc::InvalidEvidenceMetadata;
    }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse(ss.str());
}
