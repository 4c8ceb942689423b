// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <cstdio>

#include <unistd.h>

namespace arbor {

bool is_terminal_stdout() { return isatty(fileno(stdout)) != 0; }

bool is_terminal_stderr() { return isatty(fileno(stderr)) != 0; }

}  // namespace arbor
