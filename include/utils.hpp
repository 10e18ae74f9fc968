/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/core.h>

namespace spindle {

[[nodiscard]] constexpr std::string_view trim_sv(std::string_view str) noexcept {
    auto first = str.find_first_not_of(" \t\n\r\v\f");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t\n\r\v\f");
    return str.substr(first, last - first + 1);
}

inline std::string format_bytes(std::uint64_t bytes) {
    if (bytes == 0)
        return "0 B";

    static constexpr std::array units = {"B", "KB", "MB", "GB", "TB"};

    std::size_t i = 0;
    double d = static_cast<double>(bytes);
    while (d >= 1024 && i < units.size() - 1) {
        d /= 1024;
        i++;
    }
    return fmt::format("{:.1f} {}", d, units[i]);
}

struct DiskSpace {
    std::uint64_t total = 0;
    std::uint64_t available = 0;
};

inline std::expected<DiskSpace, std::error_code> disk_space(const std::filesystem::path& path) {
    std::error_code ec;
    auto info = std::filesystem::space(path, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return DiskSpace{info.capacity, info.available};
}

}  // namespace spindle
