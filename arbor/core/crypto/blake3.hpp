// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <arbor/core/crypto/hasher.hpp>

namespace arbor::crypto {

//! BLAKE3 with the default 32-byte output, on top of the reference C implementation
class Blake3Hasher : public Hasher {
  public:
    static constexpr std::string_view kName{"BLAKE3"};

    Bytes hash(ByteView data) const override;
    size_t output_size() const override;
    std::string_view name() const override { return kName; }
};

}  // namespace arbor::crypto
