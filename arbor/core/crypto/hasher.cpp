// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "hasher.hpp"

#include <arbor/core/common/util.hpp>
#include <arbor/core/crypto/blake3.hpp>
#include <arbor/core/crypto/keccak.hpp>
#include <arbor/core/crypto/sha256.hpp>
#include <arbor/core/crypto/sha3.hpp>

namespace arbor::crypto {

Bytes Hasher::hash_pair(ByteView left, ByteView right) const {
    Bytes combined;
    combined.reserve(left.size() + right.size());
    combined.append(left.data(), left.size());
    combined.append(right.data(), right.size());
    return hash(combined);
}

std::unique_ptr<Hasher> make_hasher(std::string_view name) {
    if (iequals(name, Sha256Hasher::kName)) {
        return std::make_unique<Sha256Hasher>();
    }
    if (iequals(name, Sha3Hasher::kName)) {
        return std::make_unique<Sha3Hasher>();
    }
    if (iequals(name, Keccak256Hasher::kName)) {
        return std::make_unique<Keccak256Hasher>();
    }
    if (iequals(name, Blake3Hasher::kName)) {
        return std::make_unique<Blake3Hasher>();
    }
    return nullptr;
}

std::vector<std::string_view> supported_hashers() {
    return {Sha256Hasher::kName, Sha3Hasher::kName, Keccak256Hasher::kName, Blake3Hasher::kName};
}

}  // namespace arbor::crypto
