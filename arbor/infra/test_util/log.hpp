// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include <arbor/infra/common/log.hpp>

namespace arbor::test_util {

//! \brief Captures log output at the given verbosity for the lifetime of the object
//! \details Redirects std::cout and std::cerr into in-memory buffers and disables colors. On destruction the
//! streams are given back and the previous verbosity is restored, so tests can run in any order.
class LogCapture {
  public:
    explicit LogCapture(log::Level level, bool std_out = false)
        : previous_level_{log::get_verbosity()},
          cout_buffer_{std::cout.rdbuf(out_.rdbuf())},
          cerr_buffer_{std::cerr.rdbuf(err_.rdbuf())} {
        log::init(log::Settings{.log_std_out = std_out, .log_nocolor = true, .log_verbosity = level});
    }
    ~LogCapture() {
        std::cout.rdbuf(cout_buffer_);
        std::cerr.rdbuf(cerr_buffer_);
        log::init(log::Settings{.log_verbosity = previous_level_});
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string out() const { return out_.str(); }
    std::string err() const { return err_.str(); }

  private:
    log::Level previous_level_;
    std::stringstream out_;
    std::stringstream err_;
    std::streambuf* cout_buffer_;
    std::streambuf* cerr_buffer_;
};

}  // namespace arbor::test_util
