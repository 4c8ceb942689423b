// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include <arbor/core/common/bytes.hpp>

namespace arbor::crypto {

//! \brief One-way function with a fixed output size, as consumed by the Merkle trees
//! \remarks Implementations must be stateless (or internally synchronized): trees share one instance
//! across copies and across reader threads.
class Hasher {
  public:
    virtual ~Hasher() = default;

    //! \brief Digest of a single input
    virtual Bytes hash(ByteView data) const = 0;

    //! \brief Digest of left || right, used for internal nodes
    //! \remarks Plain concatenation with no leaf/internal domain separation. Overrides must keep these exact
    //! semantics or roots will not match other implementations.
    virtual Bytes hash_pair(ByteView left, ByteView right) const;

    //! \brief Length in bytes of every digest returned by hash() and hash_pair()
    virtual size_t output_size() const = 0;

    //! \brief Primitive name for diagnostics, e.g. "SHA-256"
    virtual std::string_view name() const = 0;
};

//! \brief Creates a hasher by primitive name (case-insensitive), nullptr when the name is unknown
std::unique_ptr<Hasher> make_hasher(std::string_view name);

//! \brief Names accepted by make_hasher
std::vector<std::string_view> supported_hashers();

}  // namespace arbor::crypto
