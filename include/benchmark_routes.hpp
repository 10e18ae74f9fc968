/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "bucket_benchmark.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "server_config.hpp"

namespace spindle {

// Shared by every benchmark route. One run at a time; `max_admitted` bounds
// the running request plus those waiting for it.
struct RunGate {
    std::mutex run_mutex;
    std::atomic<int> admitted{0};
    int max_admitted = Config::MAX_QUEUED_RUNS + 1;
};

// Answers with the suite as JSON, an empty 500 if any bucket fails, or an
// empty 503 when the gate is full.
RouteHandler make_benchmark_handler(std::filesystem::path dir,
                                    std::shared_ptr<const BucketBenchmark> benchmark,
                                    std::shared_ptr<RunGate> gate);

void register_benchmark_routes(HttpServer& server,
                               const std::vector<BenchTarget>& targets,
                               std::shared_ptr<const BucketBenchmark> benchmark);

}  // namespace spindle
