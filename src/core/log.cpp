// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "include/log.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

#include <fmt/chrono.h>
#include <unistd.h>

#include "include/color.hpp"

namespace spindle::log {

namespace {

std::mutex write_mutex;

std::string_view level_tag(Level level) {
    switch (level) {
        case Level::Info:
            return "INFO ";
        case Level::Warn:
            return "WARN ";
        case Level::Error:
            return "ERROR";
    }
    return "?????";
}

std::string_view level_color(Level level) {
    switch (level) {
        case Level::Info:
            return Color::CYAN;
        case Level::Warn:
            return Color::YELLOW;
        case Level::Error:
            return Color::RED;
    }
    return Color::RESET;
}

}  // namespace

void write(Level level, std::string_view message) {
    static const bool use_color = ::isatty(STDERR_FILENO) == 1;

    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::lock_guard<std::mutex> lock(write_mutex);
    fmt::print(stderr,
               "{:%Y-%m-%dT%H:%M:%S}Z {} {}\n",
               fmt::gmtime(now),
               Color::colorize_if(use_color, level_tag(level), level_color(level)),
               message);
    std::fflush(stderr);
}

}  // namespace spindle::log
