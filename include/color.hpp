/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string>
#include <string_view>

#include <fmt/core.h>

namespace Color {
constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view RED = "\033[31m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view CYAN = "\033[36m";

inline std::string colorize(std::string_view text, std::string_view color) {
    return fmt::format("{}{}{}", color, text, RESET);
}

// Plain text when the stream is not a terminal.
inline std::string colorize_if(bool enabled, std::string_view text, std::string_view color) {
    return enabled ? colorize(text, color) : std::string(text);
}
}  // namespace Color
