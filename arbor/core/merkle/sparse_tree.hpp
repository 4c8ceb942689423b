// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>
#include <intx/intx.hpp>

#include <arbor/core/common/bytes.hpp>
#include <arbor/core/common/error.hpp>
#include <arbor/core/crypto/hasher.hpp>
#include <arbor/core/merkle/proof.hpp>

namespace arbor::merkle {

inline constexpr size_t kMinSparseDepth{1};
inline constexpr size_t kMaxSparseDepth{64};

struct SparseTreeStats {
    size_t depth{0};
    size_t leaf_count{0};
    intx::uint128 max_leaves{0};  // 2^depth
    size_t cached_nodes{0};
    std::string hasher_name;
    std::string root_hash;  // hex, no prefix
};

//! \brief Fixed-depth Merkle tree over the index space [0, 2^depth)
//! \details Only populated slots are stored. An empty slot holds the default digest, i.e. output_size() zero
//! bytes. Level l has 2^(depth - l) nodes indexed from 0: node (i, l) has children (2i, l - 1) and (2i + 1, l - 1)
//! and the root is node (0, depth). Internal nodes are computed on demand and cached; a mutation evicts only the
//! cached ancestors of the touched slot.
//! \remarks Not thread-safe: root(), generate_proof(), verify_*() and stats() fill the node cache, hence
//! they are not const. Callers must serialize all access.
class SparseMerkleTree {
  public:
    //! \return kTreeConstructionError when depth is outside [kMinSparseDepth, kMaxSparseDepth]
    static Result<SparseMerkleTree> create(size_t depth, std::shared_ptr<const crypto::Hasher> hasher);

    //! \brief Stores hash(value) at index
    Result<void> update(uint64_t index, ByteView value);

    //! \brief Empties the slot at index
    //! \return true if the slot was populated
    Result<bool> remove(uint64_t index);

    //! \brief Stored leaf digest at index, std::nullopt for an empty slot
    std::optional<ByteView> get(uint64_t index) const;

    bool contains(uint64_t index) const { return leaves_.contains(index); }

    //! \brief Number of populated slots
    size_t size() const noexcept { return leaves_.size(); }
    bool empty() const noexcept { return leaves_.empty(); }

    size_t depth() const noexcept { return depth_; }

    //! \brief Number of addressable slots, 2^depth
    intx::uint128 capacity() const noexcept { return intx::uint128{1} << depth_; }

    //! \brief Populated slot indices in ascending order
    std::vector<uint64_t> leaf_indices() const;

    //! \brief Populated (index, digest) pairs in ascending index order
    std::vector<std::pair<uint64_t, Bytes>> leaves() const;

    void clear();

    size_t cached_node_count() const noexcept { return cache_.size(); }

    //! \brief Digest held by every empty slot
    ByteView default_hash() const noexcept { return empty_subtree_.front(); }

    const crypto::Hasher& hasher() const noexcept { return *hasher_; }

    //! \brief Current root digest
    //! \remarks The returned view is invalidated by the next mutation
    ByteView root();

    //! \brief Builds the depth-step authentication path of the slot, populated or not
    Result<MerkleProof> generate_proof(uint64_t index);

    //! \brief Checks that the slot at index holds value under the current root
    //! \details value equal to default_hash() is taken as the empty value and is not hashed, so
    //! verify_proof(generate_proof(i), i, default_hash()) holds for every empty slot i
    bool verify_proof(const MerkleProof& proof, uint64_t index, ByteView value);

    bool verify_leaf_hash(const MerkleProof& proof, uint64_t index, ByteView leaf_hash);

    //! \brief Checks that the slot at index is empty under the current root
    bool verify_non_membership(const MerkleProof& proof, uint64_t index);

    //! \brief Structural check of a proof against the depth and digest size of this tree
    Result<void> validate_proof(const MerkleProof& proof) const;

    SparseTreeStats stats();

  private:
    using NodeKey = std::pair<uint64_t, uint8_t>;  // (index at level, level)

    SparseMerkleTree(size_t depth, std::shared_ptr<const crypto::Hasher> hasher, std::vector<Bytes> empty_subtree)
        : depth_{depth}, hasher_{std::move(hasher)}, empty_subtree_{std::move(empty_subtree)} {}

    bool in_range(uint64_t index) const noexcept { return depth_ >= 64 || index < (uint64_t{1} << depth_); }

    //! \brief True when no populated slot lies below node (index, level)
    bool is_empty_subtree(uint64_t index, size_t level) const;

    Bytes node_hash(uint64_t index, size_t level);

    void invalidate_path(uint64_t index);

    size_t depth_;
    std::shared_ptr<const crypto::Hasher> hasher_;
    std::vector<Bytes> empty_subtree_;  // [l] is the digest of an empty subtree of height l, l in [0, depth]
    absl::btree_map<uint64_t, Bytes> leaves_;
    absl::flat_hash_map<NodeKey, Bytes> cache_;
    std::optional<Bytes> root_;
};

}  // namespace arbor::merkle
