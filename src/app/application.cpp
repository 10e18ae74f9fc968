/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <exception>
#include <filesystem>
#include <memory>
#include <string>

#include <fmt/core.h>

#include "include/benchmark_routes.hpp"
#include "include/bucket_benchmark.hpp"
#include "include/color.hpp"
#include "include/config.hpp"
#include "include/crypto_random.hpp"
#include "include/http_server.hpp"
#include "include/interrupts.hpp"
#include "include/log.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;

namespace spindle {

void Application::show_help(const std::string& app_name) const {
    fmt::print("Usage: {} [options]\n", app_name);
    fmt::print("\n");
    fmt::print("Serves a bucketed disk-copy benchmark on port {}.\n", Config::SERVER_PORT);
    fmt::print("\n");
    fmt::print("Options:\n");
    fmt::print("  --single-directory      Serve only /persistent-storage (system temp dir)\n");
    fmt::print("  --sequential            Run copies one at a time instead of {} in parallel\n",
               Config::COPY_CONCURRENCY);
    fmt::print("  --strict-cleanup        Abort the process if a copied file cannot be removed\n");
    fmt::print("  -h, --help              Show this help message\n");
    fmt::print("  -v, --version           Show version information\n");
    fmt::print("\n");
    fmt::print("Environment (required unless --single-directory):\n");
    fmt::print("  {:<22}  Directory benchmarked by /persistent-disk\n", Config::ENV_PERSISTENT_DIR);
    fmt::print("  {:<22}  Directory benchmarked by /ephemeral-disk\n", Config::ENV_EPHEMERAL_DIR);
}

void Application::show_version() const {
    fmt::print("{} v{}\n", Config::APP_NAME, Config::APP_VERSION);
    fmt::print("Licensed under the Mozilla Public License 2.0\n");
}

void Application::show_banner(const ServerConfig& config) const {
    log::info("{} v{} listening on port {} ({} copy workers{})",
              Config::APP_NAME,
              Config::APP_VERSION,
              config.port,
              config.copy.concurrency,
              config.copy.abort_on_cleanup_failure ? ", strict cleanup" : "");

    for (const auto& target : config.targets) {
        auto space = disk_space(target.directory);
        if (space) {
            log::info("  GET {:<20} -> {} ({} free of {})",
                      target.route,
                      target.directory.string(),
                      format_bytes(space->available),
                      format_bytes(space->total));
        } else {
            log::warn("  GET {:<20} -> {} (free space unknown: {})",
                      target.route,
                      target.directory.string(),
                      space.error().message());
        }
    }
}

int Application::run(int argc, char* argv[]) {
    try {
        std::string app_name{Config::APP_NAME};
        if (argc > 0) {
            app_name = fs::path(argv[0]).filename().string();
            if (app_name.empty())
                app_name = Config::APP_NAME;
        }

        bool single_directory = false;
        CopyOptions copy;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                show_help(app_name);
                return 0;
            } else if (arg == "-v" || arg == "--version") {
                show_version();
                return 0;
            } else if (arg == "--single-directory") {
                single_directory = true;
            } else if (arg == "--sequential") {
                copy.concurrency = 1;
            } else if (arg == "--strict-cleanup") {
                copy.abort_on_cleanup_failure = true;
            } else {
                fmt::print(stderr, "{}Error: Unknown option '{}'{}\n", Color::RED, arg, Color::RESET);
                show_help(app_name);
                return 1;
            }
        }

        auto config = load_server_config(single_directory, copy);
        if (!config) {
            fmt::print(stderr, "{}Configuration Error: {}{}\n", Color::RED, config.error(), Color::RESET);
            return 1;
        }

        SignalGuard signal_guard;
        init_crypto();

        HttpServer server(config->port);
        register_benchmark_routes(
            server, config->targets, std::make_shared<const BucketBenchmark>(config->copy));

        show_banner(*config);
        server.serve();
        log::info("shutting down");

    } catch (const std::exception& e) {
        fmt::print(stderr, "\n{}Fatal Error: {}{}\n", Color::RED, e.what(), Color::RESET);
        return 1;
    }

    return 0;
}

}  // namespace spindle
