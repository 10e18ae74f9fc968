/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string_view>
#include <vector>

#include "copy_executor.hpp"
#include "io_error.hpp"
#include "results.hpp"

namespace spindle {

struct BucketSpec {
    std::string_view name;
    std::string_view key;  // field name in the JSON response
    SizeRange range;
    std::uint64_t repetitions = 0;
};

inline constexpr std::uint64_t KiB = 1024;
inline constexpr std::uint64_t MiB = 1024 * KiB;
inline constexpr std::uint64_t GiB = 1024 * MiB;

inline constexpr std::array<BucketSpec, 5> DEFAULT_BUCKETS = {{
    {"tiny", "TinyRWPerSecond", {128, KiB}, 100000},
    {"small", "SmallRWPerSecond", {KiB, MiB}, 10000},
    {"medium", "MediumRWPerSecond", {MiB, 16 * MiB}, 1000},
    {"large", "LargeRWPerSecond", {16 * MiB, 128 * MiB}, 100},
    {"huge", "HugeRWPerSecond", {128 * MiB, 2 * GiB}, 10},
}};

using BucketRunner = std::function<std::expected<DiskResult, IoError>(
    const std::filesystem::path& dir, const BucketSpec& bucket)>;

/**
 * Runs every bucket in table order against one directory.
 *
 * Each bucket gets its own source pool and timing window. The first bucket
 * that fails ends the run; later buckets are not attempted.
 */
class BucketBenchmark {
    std::vector<BucketSpec> buckets_;
    BucketRunner runner_;

   public:
    explicit BucketBenchmark(CopyOptions options = {});
    BucketBenchmark(std::vector<BucketSpec> buckets, BucketRunner runner);

    std::expected<BucketSuiteResult, IoError> run_all(const std::filesystem::path& dir) const;

    [[nodiscard]] const std::vector<BucketSpec>& buckets() const noexcept { return buckets_; }

    // Generates a pool for `bucket` and runs the copy batch over it.
    static std::expected<DiskResult, IoError> run_bucket(const std::filesystem::path& dir,
                                                         const BucketSpec& bucket,
                                                         const CopyExecutor& executor);

    static BucketRunner make_runner(CopyOptions options);
};

}  // namespace spindle
