/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace spindle {

std::expected<TempFile, int> create_temp_file(const std::filesystem::path& dir,
                                              std::string_view prefix) {
    std::string name = (dir / prefix).string();
    name.append("XXXXXX");

    std::vector<char> templ(name.begin(), name.end());
    templ.push_back('\0');

    int fd_raw = ::mkostemp(templ.data(), O_CLOEXEC);
    if (fd_raw < 0) {
        return std::unexpected(errno);
    }

    return TempFile{FileDescriptor(fd_raw), std::filesystem::path(templ.data())};
}

std::expected<void, int> remove_file(const std::filesystem::path& path) noexcept {
    if (::unlink(path.c_str()) != 0) {
        return std::unexpected(errno);
    }
    return {};
}

}  // namespace spindle
