// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "binary_tree.hpp"

#include <algorithm>

#include <arbor/core/common/assert.hpp>
#include <arbor/core/common/util.hpp>
#include <arbor/infra/common/log.hpp>

namespace arbor::merkle {

Result<BinaryMerkleTree> BinaryMerkleTree::from_leaves(std::vector<Bytes> leaves,
                                                       std::shared_ptr<const crypto::Hasher> hasher) {
    if (leaves.empty()) {
        ARBOR_DEBUG << "BinaryMerkleTree: rejected empty input";
        return tl::unexpected{Error::empty_data()};
    }
    if (!hasher) {
        return tl::unexpected{Error::tree_construction("no hasher provided")};
    }

    std::vector<std::vector<Bytes>> levels;
    levels.push_back(std::move(leaves));
    while (levels.back().size() > 1) {
        const auto& current = levels.back();
        std::vector<Bytes> parents;
        parents.reserve((current.size() + 1) / 2);
        for (size_t i{0}; i < current.size(); i += 2) {
            const Bytes& left{current[i]};
            const Bytes& right{i + 1 < current.size() ? current[i + 1] : left};
            parents.push_back(hasher->hash_pair(left, right));
        }
        levels.push_back(std::move(parents));
    }
    ARBOR_ASSERT(levels.back().size() == 1);

    BinaryMerkleTree tree{std::move(levels), std::move(hasher)};
    ARBOR_TRACE << "BinaryMerkleTree: built"
                << log::Args{"leaves", std::to_string(tree.size()),
                             "height", std::to_string(tree.height()),
                             "hasher", std::string{tree.hasher_->name()},
                             "root", to_hex(tree.root())};
    return tree;
}

Result<ByteView> BinaryMerkleTree::leaf(uint64_t index) const {
    if (index >= size()) {
        return tl::unexpected{Error::invalid_index(index, size())};
    }
    return ByteView{levels_.front()[index]};
}

Result<MerkleProof> BinaryMerkleTree::generate_proof(uint64_t index) const {
    if (index >= size()) {
        ARBOR_DEBUG << "BinaryMerkleTree: proof requested for out of range leaf"
                    << log::Args{"index", std::to_string(index), "size", std::to_string(size())};
        return tl::unexpected{Error::invalid_index(index, size())};
    }

    MerkleProof proof{.leaf_index = index};
    proof.steps.reserve(height());
    collect_proof_steps(height(), /*node_index=*/0, /*start=*/0, size(), index, proof.steps);
    std::reverse(proof.steps.begin(), proof.steps.end());
    ARBOR_ASSERT(proof.steps.size() == height());
    return proof;
}

// Walks from the node at (height, node_index) covering leaves [start, start + count) down to the target leaf.
// The left child of a node at height h always spans 2^(h-1) leaves, so the split point follows the bottom-up
// pairing even when the range is incomplete. A node whose range fits entirely in its left half was paired
// with itself: the recorded right sibling is then the left child's own digest.
void BinaryMerkleTree::collect_proof_steps(size_t height, uint64_t node_index, uint64_t start, uint64_t count,
                                           uint64_t target, std::vector<ProofStep>& steps) const {
    if (height == 0) {
        return;
    }
    const auto& children{levels_[height - 1]};
    const uint64_t left_index{node_index * 2};
    const uint64_t right_index{left_index + 1};
    const uint64_t span{uint64_t{1} << (height - 1)};
    const uint64_t mid{start + std::min(span, count)};

    if (target < mid) {
        const Bytes& sibling{right_index < children.size() ? children[right_index] : children[left_index]};
        steps.push_back(ProofStep{.hash = sibling, .direction = ProofDirection::kRight});
        collect_proof_steps(height - 1, left_index, start, mid - start, target, steps);
    } else {
        steps.push_back(ProofStep{.hash = children[left_index], .direction = ProofDirection::kLeft});
        collect_proof_steps(height - 1, right_index, mid, count - (mid - start), target, steps);
    }
}

bool BinaryMerkleTree::verify_proof(const MerkleProof& proof, ByteView leaf_data, ByteView root) const {
    return proof.verify(*hasher_, leaf_data, root);
}

bool BinaryMerkleTree::verify_proof_against_root(const MerkleProof& proof, ByteView leaf_data) const {
    return proof.verify(*hasher_, leaf_data, root());
}

bool BinaryMerkleTree::verify_leaf_hash(const MerkleProof& proof, ByteView leaf_hash, ByteView root) const {
    return proof.verify_with_leaf_hash(*hasher_, leaf_hash, root);
}

Result<void> BinaryMerkleTree::validate_proof(const MerkleProof& proof) const {
    if (proof.leaf_index >= size()) {
        return tl::unexpected{Error::invalid_proof("leaf index " + std::to_string(proof.leaf_index) +
                                                   " out of range for " + std::to_string(size()) + " leaves")};
    }
    if (proof.size() != height()) {
        return tl::unexpected{Error::invalid_proof("expected " + std::to_string(height()) + " steps, got " +
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

TreeStats BinaryMerkleTree::stats() const {
    return TreeStats{
        .leaf_count = size(),
        .tree_height = height(),
        .hasher_name = std::string{hasher_->name()},
        .root_hash = to_hex(root())};
}

}  // namespace arbor::merkle
