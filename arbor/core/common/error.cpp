// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <magic_enum.hpp>

namespace arbor {

std::string Error::to_string() const {
    switch (code) {
        case ErrorCode::kEmptyData:
            return "Empty data provided";
        case ErrorCode::kInvalidIndex:
            return "Invalid index: " + std::to_string(index) + ", tree size: " + std::to_string(size);
        case ErrorCode::kInvalidProof:
            return "Invalid proof: " + message;
        case ErrorCode::kHashError:
            return "Hash function error: " + message;
        case ErrorCode::kSerializationError:
            return "Serialization error: " + message;
        case ErrorCode::kTreeConstructionError:
            return "Tree construction failed: " + message;
    }
    return std::string{magic_enum::enum_name(code)};
}

std::ostream& operator<<(std::ostream& out, const Error& error) {
    out << magic_enum::enum_name(error.code) << " (" << error.to_string() << ")";
    return out;
}

}  // namespace arbor
