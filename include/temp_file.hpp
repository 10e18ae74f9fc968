/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string_view>

#include "file_descriptor.hpp"

namespace spindle {

struct TempFile {
    FileDescriptor fd;
    std::filesystem::path path;
};

// Creates `<dir>/<prefix>XXXXXX` exclusively and opens it read-write. Error is errno.
std::expected<TempFile, int> create_temp_file(const std::filesystem::path& dir,
                                              std::string_view prefix);

// unlink(2) wrapper. Error is errno.
std::expected<void, int> remove_file(const std::filesystem::path& path) noexcept;

}  // namespace spindle
