// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof.hpp"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include <arbor/core/common/util.hpp>

namespace arbor::merkle {

Bytes MerkleProof::compute_root(const crypto::Hasher& hasher, ByteView leaf_hash) const {
    Bytes current{leaf_hash};
    for (const auto& step : steps) {
        switch (step.direction) {
            case ProofDirection::kLeft:
                current = hasher.hash_pair(step.hash, current);
                break;
            case ProofDirection::kRight:
                current = hasher.hash_pair(current, step.hash);
                break;
        }
    }
    return current;
}

bool MerkleProof::verify(const crypto::Hasher& hasher, ByteView leaf_data, ByteView root) const {
    return verify_with_leaf_hash(hasher, hasher.hash(leaf_data), root);
}

bool MerkleProof::verify_with_leaf_hash(const crypto::Hasher& hasher, ByteView leaf_hash, ByteView root) const {
    return ByteView{compute_root(hasher, leaf_hash)} == root;
}

std::string MerkleProof::to_string() const {
    const auto format_step = [](std::string* out, const ProofStep& step) {
        absl::StrAppend(out, step.direction == ProofDirection::kLeft ? "L:" : "R:", to_hex(step.hash));
    };
    return absl::StrCat("index:", leaf_index, ", steps:[", absl::StrJoin(steps, ", ", format_step), "]");
}

}  // namespace arbor::merkle
