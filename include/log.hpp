/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace spindle::log {

enum class Level { Info, Warn, Error };

// One timestamped line on stderr. Safe to call from any thread.
void write(Level level, std::string_view message);

template <typename... Args>
void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
    write(Level::Info, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> fmt_str, Args&&... args) {
    write(Level::Warn, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
    write(Level::Error, fmt::format(fmt_str, std::forward<Args>(args)...));
}

}  // namespace spindle::log
