// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <arbor/core/crypto/hasher.hpp>

namespace arbor::crypto {

//! SHA-256 (FIPS 180-4) on top of OpenSSL libcrypto
class Sha256Hasher : public Hasher {
  public:
    static constexpr std::string_view kName{"SHA-256"};

    Bytes hash(ByteView data) const override;
    size_t output_size() const override;
    std::string_view name() const override { return kName; }
};

}  // namespace arbor::crypto
