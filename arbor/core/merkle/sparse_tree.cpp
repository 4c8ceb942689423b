// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "sparse_tree.hpp"

#include <limits>

#include <arbor/core/common/assert.hpp>
#include <arbor/core/common/empty_hashes.hpp>
#include <arbor/core/common/util.hpp>
#include <arbor/infra/common/log.hpp>

namespace arbor::merkle {

Result<SparseMerkleTree> SparseMerkleTree::create(size_t depth, std::shared_ptr<const crypto::Hasher> hasher) {
    if (depth < kMinSparseDepth || depth > kMaxSparseDepth) {
        return tl::unexpected{Error::tree_construction("Invalid depth: " + std::to_string(depth) +
                                                       ". Must be between 1 and 64")};
    }
    if (!hasher) {
        return tl::unexpected{Error::tree_construction("no hasher provided")};
    }

    std::vector<Bytes> empty_subtree;
    empty_subtree.reserve(depth + 1);
    empty_subtree.emplace_back(hasher->output_size(), uint8_t{0});
    if (hasher->output_size() == kHashLength) {
        ARBOR_ASSERT(ByteView{empty_subtree.front()} == ByteView{kDefaultHash});
    }
    for (size_t level{1}; level <= depth; ++level) {
        const Bytes& child{empty_subtree.back()};
        empty_subtree.push_back(hasher->hash_pair(child, child));
    }

    ARBOR_TRACE << "SparseMerkleTree: created"
                << log::Args{"depth", std::to_string(depth), "hasher", std::string{hasher->name()}};
    return SparseMerkleTree{depth, std::move(hasher), std::move(empty_subtree)};
}

Result<void> SparseMerkleTree::update(uint64_t index, ByteView value) {
    if (!in_range(index)) {
        ARBOR_DEBUG << "SparseMerkleTree: rejected update"
                    << log::Args{"index", std::to_string(index), "depth", std::to_string(depth_)};
        return tl::unexpected{Error::invalid_index(index, uint64_t{1} << depth_)};
    }
    leaves_.insert_or_assign(index, hasher_->hash(value));
    invalidate_path(index);
    return {};
}

Result<bool> SparseMerkleTree::remove(uint64_t index) {
    if (leaves_.erase(index) == 0) {
        return false;
    }
    invalidate_path(index);
    return true;
}

std::optional<ByteView> SparseMerkleTree::get(uint64_t index) const {
    const auto it{leaves_.find(index)};
    if (it == leaves_.end()) {
        return std::nullopt;
    }
    return ByteView{it->second};
}

std::vector<uint64_t> SparseMerkleTree::leaf_indices() const {
    std::vector<uint64_t> indices;
    indices.reserve(leaves_.size());
    for (const auto& [index, _] : leaves_) {
        indices.push_back(index);
    }
    return indices;
}

std::vector<std::pair<uint64_t, Bytes>> SparseMerkleTree::leaves() const {
    return std::vector<std::pair<uint64_t, Bytes>>(leaves_.begin(), leaves_.end());
}

void SparseMerkleTree::clear() {
    leaves_.clear();
    cache_.clear();
    root_.reset();
}

ByteView SparseMerkleTree::root() {
    if (!root_) {
        root_ = node_hash(0, depth_);
    }
    return *root_;
}

Result<MerkleProof> SparseMerkleTree::generate_proof(uint64_t index) {
    if (!in_range(index)) {
        return tl::unexpected{Error::invalid_index(index, uint64_t{1} << depth_)};
    }

    MerkleProof proof{.leaf_index = index};
    proof.steps.reserve(depth_);
    uint64_t current{index};
    for (size_t level{0}; level < depth_; ++level) {
        proof.steps.push_back(ProofStep{
            .hash = node_hash(current ^ 1, level),
            .direction = (current & 1) == 0 ? ProofDirection::kRight : ProofDirection::kLeft});
        current >>= 1;
    }
    return proof;
}

bool SparseMerkleTree::verify_proof(const MerkleProof& proof, uint64_t index, ByteView value) {
    if (value == default_hash()) {
        return verify_non_membership(proof, index);
    }
    return verify_leaf_hash(proof, index, hasher_->hash(value));
}

bool SparseMerkleTree::verify_leaf_hash(const MerkleProof& proof, uint64_t index, ByteView leaf_hash) {
    if (proof.leaf_index != index) {
        return false;
    }
    return proof.verify_with_leaf_hash(*hasher_, leaf_hash, root());
}

bool SparseMerkleTree::verify_non_membership(const MerkleProof& proof, uint64_t index) {
    return verify_leaf_hash(proof, index, default_hash());
}

Result<void> SparseMerkleTree::validate_proof(const MerkleProof& proof) const {
    if (!in_range(proof.leaf_index)) {
        return tl::unexpected{Error::invalid_proof("leaf index " + std::to_string(proof.leaf_index) +
                                                   " out of range for depth " + std::to_string(depth_))};
    }
    if (proof.size() != depth_) {
        return tl::unexpected{Error::invalid_proof("expected " + std::to_string(depth_) + " steps, got " +
                                                   std::to_string(proof.size()))};
    }
    for (size_t i{0}; i < proof.steps.size(); ++i) {
        if (proof.steps[i].hash.size() != hasher_->output_size()) {
            return tl::unexpected{Error::invalid_proof("step " + std::to_string(i) + " has a " +
                                                       std::to_string(proof.steps[i].hash.size()) + "-byte digest")};
        }
    }
    return {};
}

SparseTreeStats SparseMerkleTree::stats() {
    const std::string root_hash{to_hex(root())};
    return SparseTreeStats{
        .depth = depth_,
        .leaf_count = leaves_.size(),
        .max_leaves = capacity(),
        .cached_nodes = cache_.size(),
        .hasher_name = std::string{hasher_->name()},
        .root_hash = root_hash};
}

bool SparseMerkleTree::is_empty_subtree(uint64_t index, size_t level) const {
    const uint64_t first{level >= 64 ? 0 : index << level};
    const uint64_t last{first + (level >= 64 ? std::numeric_limits<uint64_t>::max() : (uint64_t{1} << level) - 1)};
    const auto it{leaves_.lower_bound(first)};
    return it == leaves_.end() || it->first > last;
}

Bytes SparseMerkleTree::node_hash(uint64_t index, size_t level) {
    if (level == 0) {
        const auto it{leaves_.find(index)};
        return it == leaves_.end() ? empty_subtree_[0] : it->second;
    }
    if (is_empty_subtree(index, level)) {
        return empty_subtree_[level];
    }

    const NodeKey key{index, static_cast<uint8_t>(level)};
    if (const auto it{cache_.find(key)}; it != cache_.end()) {
        return it->second;
    }

    // Children are resolved before touching the cache again: inserting may rehash it
    const Bytes left{node_hash(index * 2, level - 1)};
    const Bytes right{node_hash(index * 2 + 1, level - 1)};
    Bytes hash{hasher_->hash_pair(left, right)};
    ARBOR_ASSERT(hash.size() == hasher_->output_size());
    cache_.emplace(key, hash);
    return hash;
}

void SparseMerkleTree::invalidate_path(uint64_t index) {
    root_.reset();
    size_t evicted{0};
    for (size_t level{1}; level <= depth_; ++level) {
        const uint64_t ancestor{level >= 64 ? 0 : index >> level};
        evicted += cache_.erase(NodeKey{ancestor, static_cast<uint8_t>(level)});
    }
    ARBOR_TRACE << "SparseMerkleTree: invalidated path"
                << log::Args{"index", std::to_string(index), "evicted", std::to_string(evicted)};
}

}  // namespace arbor::merkle
