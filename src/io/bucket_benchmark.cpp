/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/bucket_benchmark.hpp"

#include <string>
#include <utility>

#include "include/log.hpp"
#include "include/source_pool.hpp"
#include "include/utils.hpp"

namespace spindle {

BucketBenchmark::BucketBenchmark(CopyOptions options)
    : buckets_(DEFAULT_BUCKETS.begin(), DEFAULT_BUCKETS.end()), runner_(make_runner(options)) {}

BucketBenchmark::BucketBenchmark(std::vector<BucketSpec> buckets, BucketRunner runner)
    : buckets_(std::move(buckets)), runner_(std::move(runner)) {}

std::expected<DiskResult, IoError> BucketBenchmark::run_bucket(const std::filesystem::path& dir,
                                                               const BucketSpec& bucket,
                                                               const CopyExecutor& executor) {
    auto pool = SourcePool::generate(dir, bucket.range);
    if (!pool) {
        return std::unexpected(pool.error());
    }
    return executor.run(dir, bucket.repetitions, *pool);
}

BucketRunner BucketBenchmark::make_runner(CopyOptions options) {
    return [executor = CopyExecutor(options)](const std::filesystem::path& dir,
                                              const BucketSpec& bucket) {
        return run_bucket(dir, bucket, executor);
    };
}

std::expected<BucketSuiteResult, IoError> BucketBenchmark::run_all(
    const std::filesystem::path& dir) const {
    BucketSuiteResult suite;
    suite.runs.reserve(buckets_.size());

    for (const auto& bucket : buckets_) {
        auto result = runner_(dir, bucket);
        if (!result) {
            log::error("bucket '{}' failed in {}: {}", bucket.name, dir.string(),
                       result.error().message());
            return std::unexpected(result.error());
        }

        log::info("bucket '{}': {} copies, {} in {:.3f}s ({}/s)",
                  bucket.name,
                  result->count,
                  format_bytes(result->bytes),
                  result->seconds,
                  format_bytes(static_cast<std::uint64_t>(result->bytes_per_second())));

        suite.runs.push_back(BucketRunResult{std::string(bucket.key), *result});
    }

    return suite;
}

}  // namespace spindle
