/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/benchmark_routes.hpp"

#include <chrono>
#include <utility>

#include <nlohmann/json.hpp>

#include "include/log.hpp"
#include "include/results.hpp"

using json = nlohmann::json;
using namespace std::chrono;

namespace spindle {

namespace {

class Admission {
    RunGate& gate_;

   public:
    explicit Admission(RunGate& gate) : gate_(gate) {}
    ~Admission() { gate_.admitted.fetch_sub(1); }

    Admission(const Admission&) = delete;
    Admission& operator=(const Admission&) = delete;
};

}  // namespace

RouteHandler make_benchmark_handler(std::filesystem::path dir,
                                    std::shared_ptr<const BucketBenchmark> benchmark,
                                    std::shared_ptr<RunGate> gate) {
    return [dir = std::move(dir), benchmark = std::move(benchmark),
            gate = std::move(gate)](const HttpRequest& request) {
        HttpResponse response;

        if (gate->admitted.fetch_add(1) >= gate->max_admitted) {
            gate->admitted.fetch_sub(1);
            log::warn("{} rejected: a benchmark is already queued", request.target);
            response.status = 503;
            return response;
        }
        Admission admission(*gate);

        std::lock_guard<std::mutex> lock(gate->run_mutex);
        auto start = steady_clock::now();
        auto suite = benchmark->run_all(dir);
        double elapsed = duration<double>(steady_clock::now() - start).count();

        if (!suite) {
            log::error("{} aborted after {:.1f}s: {}", request.target, elapsed, suite.error().message());
            response.status = 500;
            return response;
        }

        log::info("{} completed {} buckets in {:.1f}s", request.target, suite->runs.size(), elapsed);
        response.content_type = "application/json";
        response.body = json(*suite).dump();
        return response;
    };
}

void register_benchmark_routes(HttpServer& server,
                               const std::vector<BenchTarget>& targets,
                               std::shared_ptr<const BucketBenchmark> benchmark) {
    auto gate = std::make_shared<RunGate>();
    for (const auto& target : targets) {
        server.route(target.route, make_benchmark_handler(target.directory, benchmark, gate));
    }
}

}  // namespace spindle
