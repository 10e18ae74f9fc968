/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <span>

#include "config.hpp"
#include "io_error.hpp"
#include "results.hpp"
#include "source_pool.hpp"
#include "temp_file.hpp"

namespace spindle {

// Copies `source` into a new file under `dir` and removes it again.
// Returns the number of bytes copied. `index` is the repetition number.
using CopyOperation = std::function<std::expected<std::uint64_t, IoError>(
    std::uint64_t index,
    const SourceFile& source,
    const std::filesystem::path& dir,
    std::span<std::byte> buffer)>;

// Unlinks a finished destination file. Error is errno.
using FileRemover = std::function<std::expected<void, int>(const std::filesystem::path& path)>;

struct CopyOptions {
    std::size_t concurrency = Config::COPY_CONCURRENCY;  // 1 runs on the calling thread
    bool abort_on_cleanup_failure = false;
};

/**
 * Runs a timed batch of round-robin copies from a source pool.
 *
 * Repetition i copies pool[i % pool.size()]. The first failing repetition
 * stops the batch: no new repetitions start, results still in flight are
 * dropped, and run() returns that error. On success the pool's files are
 * removed before the result is returned; only the copy phase is timed.
 */
class CopyExecutor {
    CopyOptions options_;
    CopyOperation copy_;

   public:
    explicit CopyExecutor(CopyOptions options = {}, CopyOperation copy = {});

    std::expected<DiskResult, IoError> run(const std::filesystem::path& dir,
                                           std::uint64_t repetitions,
                                           SourcePool& pool) const;

    // The default copy operation. A failed unlink is a RemoveDestination
    // error unless `abort_on_cleanup_failure` is set, which aborts instead.
    static std::expected<std::uint64_t, IoError> copy_to_fresh_file(
        const SourceFile& source,
        const std::filesystem::path& dir,
        std::span<std::byte> buffer,
        bool abort_on_cleanup_failure,
        const FileRemover& remove = remove_file);
};

}  // namespace spindle
