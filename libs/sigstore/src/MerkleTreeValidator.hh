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

#ifndef ATTEST_SIGSTORE_MERKLE_TREE_VALIDATOR_HH
#define ATTEST_SIGSTORE_MERKLE_TREE_VALIDATOR_HH

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>
#include <boost/outcome/std_result.hpp>

#include "RFC6962Hasher.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::sigstore
{
  class MerkleTreeValidator
  {
  public:
    MerkleTreeValidator() = default;

    // All hashes are raw SHA-256 digests. Returns false when the proof
    // yields a different root, an error when the proof is malformed.
    outcome::std_result<bool> verify_inclusion_proof(const std::vector<std::string> &proof,
                                                     int64_t leaf_index,
                                                     int64_t tree_size,
                                                     const std::string &leaf_hash,
                                                     const std::string &root_hash) const;

    outcome::std_result<std::string> compute_merkle_root(const std::vector<std::string> &proof,
                                                         int64_t leaf_index,
                                                         int64_t tree_size,
                                                         const std::string &leaf_hash) const;

  private:
    static std::pair<std::size_t, std::size_t> split_inclusion_proof(std::uint64_t index, std::uint64_t size);

  private:
    RFC6962Hasher hasher_;
    std::shared_ptr<spdlog::logger> logger_{attest::utils::Logging::create("attest:sigstore:merkletree")};
  };

} // namespace attest::sigstore

#endif // ATTEST_SIGSTORE_MERKLE_TREE_VALIDATOR_HH
