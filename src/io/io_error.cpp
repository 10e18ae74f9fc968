/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/io_error.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace spindle {

namespace {

std::string explain_errno(int err, IoPhase phase) {
    switch (err) {
        case 0:
            return "Unknown failure";
        case ENOSPC:
            return "Storage capacity limit reached (Disk Full)";
        case EDQUOT:
            return "User disk quota exceeded";
        case EIO:
            return "Critical I/O error (Hardware failure suspected)";
        case EROFS:
            return "File system is Read-Only";
        case EACCES:
        case EPERM:
            if (phase == IoPhase::CreateSource || phase == IoPhase::CreateDestination)
                return "Permission denied. Cannot create file in this directory.";
            return "Permission denied";
        case ENOENT:
            return "No such file or directory";
        default:
            return std::system_category().message(err);
    }
}

}  // namespace

IoError IoError::from_code(IoPhase phase, int code, const std::filesystem::path& path) {
    return IoError{phase, code, path, {}};
}

IoError IoError::invalid(std::string detail) {
    return IoError{IoPhase::InvalidArgument, EINVAL, {}, std::move(detail)};
}

std::string IoError::message() const {
    if (!detail.empty()) {
        return fmt::format("{}: {}", phase_name(phase), detail);
    }
    if (path.empty()) {
        return fmt::format("{}: {}", phase_name(phase), explain_errno(code, phase));
    }
    return fmt::format(
        "{} '{}': {} (Code: {})", phase_name(phase), path.string(), explain_errno(code, phase), code);
}

std::string_view phase_name(IoPhase phase) {
    switch (phase) {
        case IoPhase::InvalidArgument:
            return "invalid argument";
        case IoPhase::CreateSource:
            return "create source file";
        case IoPhase::RandomBytes:
            return "random bytes";
        case IoPhase::WriteSource:
            return "write source file";
        case IoPhase::OpenSource:
            return "open source file";
        case IoPhase::CreateDestination:
            return "create destination file";
        case IoPhase::ReadSource:
            return "read source file";
        case IoPhase::WriteDestination:
            return "write destination file";
        case IoPhase::RemoveDestination:
            return "remove destination file";
        case IoPhase::RemoveSource:
            return "remove source file";
    }
    return "unknown";
}

}  // namespace spindle
