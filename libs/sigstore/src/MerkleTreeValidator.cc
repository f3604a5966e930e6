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

#include "MerkleTreeValidator.hh"

#include <bit>

#include "sigstore/SigstoreErrors.hh"
#include "utils/Hex.hh"

namespace attest::sigstore
{
  outcome::std_result<bool> MerkleTreeValidator::verify_inclusion_proof(const std::vector<std::string> &proof,
                                                                        int64_t leaf_index,
                                                                        int64_t tree_size,
                                                                        const std::string &leaf_hash,
                                                                        const std::string &root_hash) const
  {
    auto computed_root = compute_merkle_root(proof, leaf_index, tree_size, leaf_hash);
    if (!computed_root)
      {
        return computed_root.error();
      }

    logger_->debug("Merkle root for index {} of {}: computed {} expected {}",
                   leaf_index,
                   tree_size,
                   attest::utils::Hex::encode(computed_root.value()),
                   attest::utils::Hex::encode(root_hash));

    if (computed_root.value() != root_hash)
      {
        logger_->warn("Inclusion proof verification failed: computed root doesn't match expected root");
        return false;
      }
    return true;
  }

  outcome::std_result<std::string> MerkleTreeValidator::compute_merkle_root(const std::vector<std::string> &proof,
                                                                            int64_t leaf_index,
                                                                            int64_t tree_size,
                                                                            const std::string &leaf_hash) const
  {
    if (leaf_index < 0 || tree_size <= 0 || leaf_index >= tree_size)
      {
        logger_->error("Leaf index {} is out of range for tree size {}", leaf_index, tree_size);
        return SigstoreError::InvalidTransparencyLog;
      }

    auto index = static_cast<std::uint64_t>(leaf_index);
    auto [inner, border] = split_inclusion_proof(index, static_cast<std::uint64_t>(tree_size));
    if (inner + border != proof.size())
      {
        logger_->error("Inclusion proof size mismatch: expected {} hashes, got {}", inner + border, proof.size());
        return SigstoreError::InvalidTransparencyLog;
      }

    std::string current_hash = leaf_hash;
    for (std::size_t i = 0; i < proof.size(); ++i)
      {
        if (index % 2 == 0 && i < inner)
          {
            current_hash = hasher_.hash_children(current_hash, proof[i]);
          }
        else
          {
            current_hash = hasher_.hash_children(proof[i], current_hash);
          }
        index /= 2;
      }

    return current_hash;
  }

  std::pair<std::size_t, std::size_t> MerkleTreeValidator::split_inclusion_proof(std::uint64_t index, std::uint64_t size)
  {
    const std::uint64_t diff = index ^ (size - 1);
    const std::size_t inner = std::bit_width(diff);
    const std::size_t border = std::popcount(index >> inner);
    return {inner, border};
  }

} // namespace attest::sigstore
