// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <arbor/core/common/bytes.hpp>

namespace arbor {

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Decodes a hex string, with or without the 0x prefix
//! \return std::nullopt on odd length or non-hex characters
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

// Compares two strings for equality with case insensitivity
bool iequals(std::string_view a, std::string_view b);

inline std::ostream& operator<<(std::ostream& out, ByteView bytes) {
    out << to_hex(bytes);
    return out;
}

}  // namespace arbor
