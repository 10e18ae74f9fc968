/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace spindle {

enum class IoPhase {
    InvalidArgument,
    CreateSource,
    RandomBytes,
    WriteSource,
    OpenSource,
    CreateDestination,
    ReadSource,
    WriteDestination,
    RemoveDestination,
    RemoveSource
};

struct IoError {
    IoPhase phase = IoPhase::InvalidArgument;
    int code = 0;
    std::filesystem::path path;
    std::string detail;

    static IoError from_code(IoPhase phase, int code, const std::filesystem::path& path);
    static IoError invalid(std::string detail);

    [[nodiscard]] std::string message() const;
};

std::string_view phase_name(IoPhase phase);

}  // namespace spindle
