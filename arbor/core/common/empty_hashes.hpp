// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace arbor {

// Digest length of every hasher shipped with arbor
inline constexpr size_t kHashLength{32};

// Digest of an empty sparse slot for 32-byte hashers: a hardcoded all-zero sentinel, not the hash of anything.
// SparseMerkleTree sizes its own empty digest by Hasher::output_size() and matches this value whenever the
// output size is kHashLength. Callers pass it to SparseMerkleTree::verify_proof to claim an empty slot.
inline constexpr std::array<uint8_t, kHashLength> kDefaultHash{};

}  // namespace arbor
