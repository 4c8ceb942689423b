// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "sha256.hpp"

#include <openssl/evp.h>

#include <arbor/core/common/assert.hpp>
#include <arbor/core/common/empty_hashes.hpp>

namespace arbor::crypto {

Bytes Sha256Hasher::hash(ByteView data) const {
    Bytes out(kHashLength, '\0');
    unsigned int out_len{0};
    const int ok{EVP_Digest(data.data(), data.size(), out.data(), &out_len, EVP_sha256(), nullptr)};
    ARBOR_ASSERT(ok == 1 && out_len == kHashLength);
    return out;
}

size_t Sha256Hasher::output_size() const { return kHashLength; }

}  // namespace arbor::crypto
