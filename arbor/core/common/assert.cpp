// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdlib>
#include <string>

#include <arbor/infra/common/log.hpp>

namespace arbor {

void abort_on_broken_invariant(const char* expr, const std::source_location& where) {
    // kNone lines are printed at any verbosity
    log::LogBuffer<log::Level::kNone>{"Invariant violated",
                                      {"expr", expr,
                                       "function", where.function_name(),
                                       "at", std::string{where.file_name()} + ":" + std::to_string(where.line())}};
    std::abort();
}

}  // namespace arbor
