// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace arbor::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Rejected input and other diagnostics
    kTrace      // Tree construction and cache activity
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps are in UTC or in the local timezone
    bool log_utc{true};
    //! Whether to disable colorized output (always disabled when the stream is not a terminal)
    bool log_nocolor{false};
    //! Log verbosity level; the library stays silent by default
    Level log_verbosity{Level::kNone};
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe, same as init()
void set_verbosity(Level level);

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! Alternating keys and values, e.g. {"leaves", "4", "height", "2"}
using Args = std::vector<std::string>;

//! \brief Accumulates one log line and writes it out on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& t) {
        if (should_print_) ss_ << t;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    void append_args(const Args& args);
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Info = LogBuffer<Level::kInfo>;

}  // namespace arbor::log

// Streaming is skipped entirely when the level is filtered out
#define ARBOR_LOGBUFFER(level_)                \
    if (!arbor::log::test_verbosity(level_)) { \
    } else                                     \
        arbor::log::LogBuffer<level_>()

#define ARBOR_TRACE ARBOR_LOGBUFFER(arbor::log::Level::kTrace)
#define ARBOR_DEBUG ARBOR_LOGBUFFER(arbor::log::Level::kDebug)
#define ARBOR_INFO ARBOR_LOGBUFFER(arbor::log::Level::kInfo)
