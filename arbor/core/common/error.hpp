// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace arbor {

// Error kinds for tree construction, indexing, proofs and the serialized form
enum class [[nodiscard]] ErrorCode {
    kEmptyData,              // construction with no items
    kInvalidIndex,           // out-of-range leaf/slot access or proof target
    kInvalidProof,           // structurally malformed proof (wrong step count, digest length, ...)
    kHashError,              // hash capability failure
    kSerializationError,     // persisted form cannot be decoded
    kTreeConstructionError,  // invalid sparse depth or broken build invariant
};

struct Error {
    ErrorCode code{ErrorCode::kEmptyData};
    uint64_t index{0};  // kInvalidIndex only
    uint64_t size{0};   // kInvalidIndex only
    std::string message;

    static Error empty_data() { return Error{.code = ErrorCode::kEmptyData}; }
    static Error invalid_index(uint64_t index, uint64_t size) {
        return Error{.code = ErrorCode::kInvalidIndex, .index = index, .size = size};
    }
    static Error invalid_proof(std::string reason) {
        return Error{.code = ErrorCode::kInvalidProof, .message = std::move(reason)};
    }
    static Error hash_error(std::string message) {
        return Error{.code = ErrorCode::kHashError, .message = std::move(message)};
    }
    static Error serialization_error(std::string message) {
        return Error{.code = ErrorCode::kSerializationError, .message = std::move(message)};
    }
    static Error tree_construction(std::string reason) {
        return Error{.code = ErrorCode::kTreeConstructionError, .message = std::move(reason)};
    }

    //! \brief Human-readable description, e.g. "Invalid index: 5, tree size: 4"
    std::string to_string() const;

    friend bool operator==(const Error&, const Error&) = default;
};

std::ostream& operator<<(std::ostream& out, const Error& error);

// TODO(C++23) Switch to std::expected
template <class T>
using Result = tl::expected<T, Error>;

}  // namespace arbor
