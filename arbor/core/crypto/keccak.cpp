// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "keccak.hpp"

#include <ethash/keccak.hpp>

#include <arbor/core/common/empty_hashes.hpp>

namespace arbor::crypto {

Bytes Keccak256Hasher::hash(ByteView data) const {
    const ethash::hash256 h{ethash::keccak256(data.data(), data.size())};
    return Bytes{h.bytes, sizeof(h.bytes)};
}

size_t Keccak256Hasher::output_size() const { return kHashLength; }

}  // namespace arbor::crypto
