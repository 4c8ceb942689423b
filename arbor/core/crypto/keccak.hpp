// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <arbor/core/crypto/hasher.hpp>

namespace arbor::crypto {

//! Original Keccak-256 (pre-FIPS padding, as used by Ethereum) on top of ethash
class Keccak256Hasher : public Hasher {
  public:
    static constexpr std::string_view kName{"KECCAK-256"};

    Bytes hash(ByteView data) const override;
    size_t output_size() const override;
    std::string_view name() const override { return kName; }
};

}  // namespace arbor::crypto
