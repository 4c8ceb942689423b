// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <arbor/core/common/bytes.hpp>
#include <arbor/core/crypto/hasher.hpp>

namespace arbor::merkle {

//! Side on which the sibling sits relative to the node being proven
enum class ProofDirection : uint8_t {
    kLeft,
    kRight,
};

struct ProofStep {
    Bytes hash;  // sibling digest
    ProofDirection direction{ProofDirection::kLeft};

    friend bool operator==(const ProofStep&, const ProofStep&) = default;
};

//! \brief Authentication path for one leaf
//! \details Steps are ordered leaf-to-root: steps.front() is the leaf's immediate sibling
struct MerkleProof {
    uint64_t leaf_index{0};
    std::vector<ProofStep> steps;

    size_t size() const noexcept { return steps.size(); }

    //! \brief True only for the proof of a single-leaf binary tree
    bool empty() const noexcept { return steps.empty(); }

    //! \brief Folds the steps starting from leaf_hash and returns the implied root
    Bytes compute_root(const crypto::Hasher& hasher, ByteView leaf_hash) const;

    //! \brief Hashes leaf_data, then checks the implied root against root byte-wise
    bool verify(const crypto::Hasher& hasher, ByteView leaf_data, ByteView root) const;

    bool verify_with_leaf_hash(const crypto::Hasher& hasher, ByteView leaf_hash, ByteView root) const;

    //! \brief Debug rendering "index:<N>, steps:[<L|R>:<hex>, ...]", not a wire format
    std::string to_string() const;

    friend bool operator==(const MerkleProof&, const MerkleProof&) = default;
};

}  // namespace arbor::merkle
