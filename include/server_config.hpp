/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "copy_executor.hpp"

namespace spindle {

struct BenchTarget {
    std::string route;
    std::filesystem::path directory;
};

struct ServerConfig {
    std::vector<BenchTarget> targets;
    CopyOptions copy;
    std::uint16_t port = Config::SERVER_PORT;
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

std::optional<std::string> system_env(std::string_view name);

/**
 * Builds the startup configuration.
 *
 * Single-directory mode serves /persistent-storage against the system temp
 * directory. Otherwise BM_PERSISTENT_DIR and BM_EPHEMERAL_DIR must both name
 * existing directories; /persistent-storage stays available alongside
 * /persistent-disk and /ephemeral-disk.
 */
std::expected<ServerConfig, std::string> load_server_config(bool single_directory,
                                                            CopyOptions copy,
                                                            const EnvLookup& env = system_env);

}  // namespace spindle
