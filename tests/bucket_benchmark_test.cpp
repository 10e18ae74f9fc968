/**
 * @file bucket_benchmark_test.cpp
 * @brief Unit tests for spindle::BucketBenchmark.
 *
 * Notes:
 *  - Ordering and abort tests use an instrumented fake runner.
 *  - FullTinyBucket runs the real 100000-copy tiny bucket and takes a while.
 */

#include "include/bucket_benchmark.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <expected>
#include <string>
#include <vector>

#include "include/config.hpp"
#include "include/source_pool.hpp"
#include "tests/support/scratch_dir.hpp"

using spindle::BucketBenchmark;
using spindle::BucketRunner;
using spindle::BucketSpec;
using spindle::CopyOptions;
using spindle::DEFAULT_BUCKETS;
using spindle::DiskResult;
using spindle::IoError;
using spindle::IoPhase;
using spindle::SizeRange;
using spindle::SourcePool;
using spindle::testing::ScratchDir;

namespace fs = std::filesystem;

namespace {

std::uint64_t round_robin_sum(const SizeRange& range, std::uint64_t repetitions) {
    std::uint64_t sum = 0;
    for (std::uint64_t i = 0; i < repetitions; ++i) {
        sum += SourcePool::target_size(range, i % Config::POOL_SIZE, Config::POOL_SIZE);
    }
    return sum;
}

// Records every bucket it is asked to run; fails the one named `fail_on`.
struct RecordingRunner {
    std::vector<std::string>* calls;
    std::string fail_on;

    std::expected<DiskResult, IoError> operator()(const fs::path&, const BucketSpec& bucket) const {
        calls->emplace_back(bucket.name);
        if (bucket.name == fail_on) {
            return std::unexpected(IoError::from_code(IoPhase::WriteDestination, ENOSPC, "/x"));
        }
        return DiskResult{0.5, bucket.repetitions, bucket.repetitions * 3};
    }
};

std::vector<BucketSpec> default_table() {
    return {DEFAULT_BUCKETS.begin(), DEFAULT_BUCKETS.end()};
}

}  // namespace

/* ----------------------------- Bucket table ----------------------------- */

/** @test The fixed table matches the published bucket sizes and counts. */
TEST(BucketTable, FixedConstants) {
    ASSERT_EQ(DEFAULT_BUCKETS.size(), 5u);

    EXPECT_EQ(DEFAULT_BUCKETS[0].name, "tiny");
    EXPECT_EQ(DEFAULT_BUCKETS[0].range.min, 128u);
    EXPECT_EQ(DEFAULT_BUCKETS[0].range.max, 1024u);
    EXPECT_EQ(DEFAULT_BUCKETS[0].repetitions, 100000u);

    EXPECT_EQ(DEFAULT_BUCKETS[1].name, "small");
    EXPECT_EQ(DEFAULT_BUCKETS[1].range.min, 1024u);
    EXPECT_EQ(DEFAULT_BUCKETS[1].range.max, 1048576u);
    EXPECT_EQ(DEFAULT_BUCKETS[1].repetitions, 10000u);

    EXPECT_EQ(DEFAULT_BUCKETS[2].name, "medium");
    EXPECT_EQ(DEFAULT_BUCKETS[2].range.min, 1048576u);
    EXPECT_EQ(DEFAULT_BUCKETS[2].range.max, 16777216u);
    EXPECT_EQ(DEFAULT_BUCKETS[2].repetitions, 1000u);

    EXPECT_EQ(DEFAULT_BUCKETS[3].name, "large");
    EXPECT_EQ(DEFAULT_BUCKETS[3].range.min, 16777216u);
    EXPECT_EQ(DEFAULT_BUCKETS[3].range.max, 134217728u);
    EXPECT_EQ(DEFAULT_BUCKETS[3].repetitions, 100u);

    EXPECT_EQ(DEFAULT_BUCKETS[4].name, "huge");
    EXPECT_EQ(DEFAULT_BUCKETS[4].range.min, 134217728u);
    EXPECT_EQ(DEFAULT_BUCKETS[4].range.max, 2147483648u);
    EXPECT_EQ(DEFAULT_BUCKETS[4].repetitions, 10u);
}

/** @test The default constructor serves the fixed table. */
TEST(BucketTable, DefaultBenchmarkUsesFixedTable) {
    BucketBenchmark benchmark;
    ASSERT_EQ(benchmark.buckets().size(), DEFAULT_BUCKETS.size());
    EXPECT_EQ(benchmark.buckets().front().key, "TinyRWPerSecond");
    EXPECT_EQ(benchmark.buckets().back().key, "HugeRWPerSecond");
}

/* ----------------------------- Orchestration ----------------------------- */

/** @test Buckets run once each, in table order, and all results are kept. */
TEST(BucketBenchmarkRunAll, RunsInOrder) {
    std::vector<std::string> calls;
    BucketBenchmark benchmark(default_table(), RecordingRunner{&calls, ""});

    auto suite = benchmark.run_all("/unused");
    ASSERT_TRUE(suite) << suite.error().message();

    EXPECT_EQ(calls, (std::vector<std::string>{"tiny", "small", "medium", "large", "huge"}));
    ASSERT_EQ(suite->runs.size(), 5u);
    EXPECT_EQ(suite->runs[2].key, "MediumRWPerSecond");
    EXPECT_EQ(suite->runs[2].result.count, 1000u);
    EXPECT_EQ(suite->runs[2].result.bytes, 3000u);
}

/** @test A failing medium bucket means large and huge never run. */
TEST(BucketBenchmarkRunAll, FailureStopsLaterBuckets) {
    std::vector<std::string> calls;
    BucketBenchmark benchmark(default_table(), RecordingRunner{&calls, "medium"});

    auto suite = benchmark.run_all("/unused");
    ASSERT_FALSE(suite);
    EXPECT_EQ(suite.error().phase, IoPhase::WriteDestination);
    EXPECT_EQ(suite.error().code, ENOSPC);
    EXPECT_EQ(calls, (std::vector<std::string>{"tiny", "small", "medium"}));
}

/** @test A failure in the first bucket runs nothing else. */
TEST(BucketBenchmarkRunAll, FirstBucketFailure) {
    std::vector<std::string> calls;
    BucketBenchmark benchmark(default_table(), RecordingRunner{&calls, "tiny"});

    EXPECT_FALSE(benchmark.run_all("/unused"));
    EXPECT_EQ(calls.size(), 1u);
}

/* ----------------------------- Real runner ----------------------------- */

/** @test The real runner reports round-robin totals and cleans up. */
TEST(BucketBenchmarkRealRunner, SmallTable) {
    ScratchDir dir;
    const std::vector<BucketSpec> table = {
        {"a", "A", {128, 1024}, 50},
        {"b", "B", {1024, 8192}, 25},
    };
    BucketBenchmark benchmark(table, BucketBenchmark::make_runner(CopyOptions{}));

    auto suite = benchmark.run_all(dir.path());
    ASSERT_TRUE(suite) << suite.error().message();

    const DiskResult* a = suite->find("A");
    const DiskResult* b = suite->find("B");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(a->count, 50u);
    EXPECT_EQ(a->bytes, round_robin_sum(table[0].range, 50));
    EXPECT_EQ(b->count, 25u);
    EXPECT_EQ(b->bytes, round_robin_sum(table[1].range, 25));
    EXPECT_EQ(dir.count_entries(), 0u);
}

/** @test Pool generation errors surface from the real runner. */
TEST(BucketBenchmarkRealRunner, MissingDirectory) {
    ScratchDir dir;
    const std::vector<BucketSpec> table = {{"a", "A", {128, 1024}, 5}};
    BucketBenchmark benchmark(table, BucketBenchmark::make_runner(CopyOptions{}));

    auto suite = benchmark.run_all(dir.path() / "absent");
    ASSERT_FALSE(suite);
    EXPECT_EQ(suite.error().phase, IoPhase::CreateSource);
}

/** @test The full tiny bucket completes with round-robin totals. */
TEST(BucketBenchmarkRealRunner, FullTinyBucket) {
    ScratchDir dir;
    const BucketSpec& tiny = DEFAULT_BUCKETS[0];
    auto executor = spindle::CopyExecutor(CopyOptions{});

    auto result = BucketBenchmark::run_bucket(dir.path(), tiny, executor);
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result->count, 100000u);
    EXPECT_EQ(result->bytes, round_robin_sum(tiny.range, 100000));
    EXPECT_GT(result->seconds, 0.0);
    EXPECT_EQ(dir.count_entries(), 0u);
}
