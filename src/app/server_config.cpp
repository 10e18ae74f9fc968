/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/server_config.hpp"

#include <cstdlib>
#include <system_error>

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace spindle {

namespace {

std::expected<fs::path, std::string> require_directory(std::string_view name, const EnvLookup& env) {
    auto value = env(name);
    if (!value || value->empty()) {
        return std::unexpected(fmt::format("Environment variable {} must be set", name));
    }

    std::error_code ec;
    if (!fs::is_directory(*value, ec)) {
        return std::unexpected(
            fmt::format("{}='{}' is not an existing directory{}",
                        name,
                        *value,
                        ec ? fmt::format(" ({})", ec.message()) : std::string()));
    }
    return fs::path(*value);
}

std::expected<fs::path, std::string> temp_directory() {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    if (ec) {
        return std::unexpected(fmt::format("No usable temporary directory: {}", ec.message()));
    }
    return dir;
}

}  // namespace

std::optional<std::string> system_env(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::expected<ServerConfig, std::string> load_server_config(bool single_directory,
                                                            CopyOptions copy,
                                                            const EnvLookup& env) {
    ServerConfig config;
    config.copy = copy;

    auto tmp = temp_directory();
    if (!tmp) {
        return std::unexpected(tmp.error());
    }
    config.targets.push_back(BenchTarget{"/persistent-storage", *tmp});

    if (single_directory) {
        return config;
    }

    auto persistent = require_directory(Config::ENV_PERSISTENT_DIR, env);
    if (!persistent) {
        return std::unexpected(persistent.error());
    }
    auto ephemeral = require_directory(Config::ENV_EPHEMERAL_DIR, env);
    if (!ephemeral) {
        return std::unexpected(ephemeral.error());
    }

    config.targets.push_back(BenchTarget{"/persistent-disk", *persistent});
    config.targets.push_back(BenchTarget{"/ephemeral-disk", *ephemeral});
    return config;
}

}  // namespace spindle
