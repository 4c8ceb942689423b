// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "blake3.hpp"

#include <blake3.h>

#include <arbor/core/common/empty_hashes.hpp>

namespace arbor::crypto {

static_assert(BLAKE3_OUT_LEN == kHashLength);

Bytes Blake3Hasher::hash(ByteView data) const {
    blake3_hasher state;
    blake3_hasher_init(&state);
    blake3_hasher_update(&state, data.data(), data.size());
    Bytes out(kHashLength, '\0');
    blake3_hasher_finalize(&state, out.data(), out.size());
    return out;
}

size_t Blake3Hasher::output_size() const { return kHashLength; }

}  // namespace arbor::crypto
