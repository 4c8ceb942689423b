// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <source_location>

namespace arbor {

//! \brief Reports a broken internal invariant through the log and aborts
[[noreturn]] void abort_on_broken_invariant(const char* expr,
                                            const std::source_location& where = std::source_location::current());

}  // namespace arbor

// ARBOR_ASSERT aborts even when NDEBUG is defined. It guards internal invariants only (hash adapter failures,
// tree arena shape): bad caller input is reported through Result values.
#define ARBOR_ASSERT(expr)    \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::arbor::abort_on_broken_invariant(#expr)
