// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iostream>
#include <mutex>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <arbor/infra/common/terminal.hpp>

namespace arbor::log {

static Settings settings_{};
static std::mutex out_mtx{};

void init(const Settings& settings) {
    settings_ = settings;
    const bool is_terminal{settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    settings_.log_nocolor = settings_.log_nocolor || !is_terminal;
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

static std::pair<std::string_view, std::string_view> level_tag(Level level) {
    switch (level) {
        case Level::kTrace:
            return {"TRACE", kColorCoal};
        case Level::kDebug:
            return {"DEBUG", kBackgroundPurple};
        case Level::kInfo:
            return {" INFO", kColorGreen};
        case Level::kWarning:
            return {" WARN", kColorOrangeHigh};
        case Level::kError:
            return {"ERROR", kColorRed};
        case Level::kCritical:
            return {" CRIT", kBackgroundRed};
        default:
            return {"     ", kColorReset};
    }
}

// Writes color escapes only when colorized output is enabled
static std::string_view color(std::string_view code) { return settings_.log_nocolor ? std::string_view{} : code; }

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    const auto [tag, tag_color] = level_tag(level);
    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << color(tag_color) << tag << color(kColorReset) << ' '
        << color(kColorWhite) << '[' << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz) << ' ' << tz.name()
        << "] " << color(kColorReset);
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    if (!should_print_) return;
    ss_ << msg;
    append_args(args);
}

void BufferBase::append_args(const Args& args) {
    if (!should_print_) return;
    for (size_t i{0}; i < args.size(); ++i) {
        const bool is_key{i % 2 == 0};
        if (is_key) {
            ss_ << ' ' << color(kColorGreen) << args[i] << color(kColorReset) << '=';
        } else {
            ss_ << args[i];
        }
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
}

}  // namespace arbor::log
