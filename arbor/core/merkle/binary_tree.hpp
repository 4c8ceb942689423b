// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <arbor/core/common/bytes.hpp>
#include <arbor/core/common/error.hpp>
#include <arbor/core/crypto/hasher.hpp>
#include <arbor/core/merkle/proof.hpp>

namespace arbor::merkle {

template <class T>
concept MerkleItem = std::convertible_to<T, ByteView> || std::convertible_to<T, std::string_view>;

template <class R>
concept MerkleItemRange = std::ranges::input_range<R> && MerkleItem<std::ranges::range_reference_t<R>>;

struct TreeStats {
    size_t leaf_count{0};
    size_t tree_height{0};
    std::string hasher_name;
    std::string root_hash;  // hex, no prefix
};

//! \brief Dense binary Merkle tree over an ordered, non-empty collection of items
//! \details Levels are built bottom-up pairing nodes left-to-right. An odd last node is paired with itself.
//! The tree is immutable once built, so all member functions are safe to call concurrently.
class BinaryMerkleTree {
  public:
    //! \brief Hashes every item into a leaf digest and builds the tree on top of them
    //! \return kEmptyData when items is empty
    template <MerkleItemRange R>
    static Result<BinaryMerkleTree> build(const R& items, std::shared_ptr<const crypto::Hasher> hasher) {
        if (!hasher) {
            return tl::unexpected{Error::tree_construction("no hasher provided")};
        }
        std::vector<Bytes> leaves;
        if constexpr (std::ranges::sized_range<R>) {
            leaves.reserve(std::ranges::size(items));
        }
        for (const auto& item : items) {
            if constexpr (std::convertible_to<decltype(item), ByteView>) {
                leaves.push_back(hasher->hash(ByteView{item}));
            } else {
                leaves.push_back(hasher->hash(string_view_to_byte_view(std::string_view{item})));
            }
        }
        return from_leaves(std::move(leaves), std::move(hasher));
    }

    //! \brief Builds the tree from already hashed leaves
    //! \remarks Leaves are taken as they are: passing raw items here yields a different root than build()
    static Result<BinaryMerkleTree> from_leaves(std::vector<Bytes> leaves, std::shared_ptr<const crypto::Hasher> hasher);

    ByteView root() const noexcept { return levels_.back().front(); }

    size_t size() const noexcept { return levels_.front().size(); }

    //! \brief Always false for a successfully built tree
    bool empty() const noexcept { return levels_.front().empty(); }

    //! \brief Number of pairing rounds, i.e. ceil(log2(size())), 0 for a single leaf
    size_t height() const noexcept { return levels_.size() - 1; }

    Result<ByteView> leaf(uint64_t index) const;

    const std::vector<Bytes>& leaves() const noexcept { return levels_.front(); }

    const crypto::Hasher& hasher() const noexcept { return *hasher_; }

    Result<MerkleProof> generate_proof(uint64_t index) const;

    //! \brief Checks the proof for leaf_data against an externally supplied root
    bool verify_proof(const MerkleProof& proof, ByteView leaf_data, ByteView root) const;

    //! \brief Checks the proof for leaf_data against this tree's root
    bool verify_proof_against_root(const MerkleProof& proof, ByteView leaf_data) const;

    bool verify_leaf_hash(const MerkleProof& proof, ByteView leaf_hash, ByteView root) const;

    //! \brief Structural check of a proof against the shape of this tree, without hashing
    Result<void> validate_proof(const MerkleProof& proof) const;

    TreeStats stats() const;

  private:
    BinaryMerkleTree(std::vector<std::vector<Bytes>> levels, std::shared_ptr<const crypto::Hasher> hasher)
        : levels_{std::move(levels)}, hasher_{std::move(hasher)} {}

    void collect_proof_steps(size_t height, uint64_t node_index, uint64_t start, uint64_t count, uint64_t target,
                             std::vector<ProofStep>& steps) const;

    // levels_[0] are the leaf digests, levels_.back() holds the root alone
    std::vector<std::vector<Bytes>> levels_;
    std::shared_ptr<const crypto::Hasher> hasher_;
};

}  // namespace arbor::merkle
