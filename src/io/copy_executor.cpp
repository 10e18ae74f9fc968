/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/copy_executor.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>

#include "include/file_descriptor.hpp"
#include "include/log.hpp"
#include "include/temp_file.hpp"

using namespace std::chrono;

namespace spindle {

namespace {

std::expected<std::uint64_t, IoError> pump(const FileDescriptor& src,
                                           const FileDescriptor& dst,
                                           std::span<std::byte> buffer,
                                           const std::filesystem::path& src_path,
                                           const std::filesystem::path& dst_path) {
    std::uint64_t copied = 0;
    for (;;) {
        auto n = src.read_some(buffer);
        if (!n) {
            return std::unexpected(IoError::from_code(IoPhase::ReadSource, n.error(), src_path));
        }
        if (*n == 0) {
            return copied;
        }
        if (auto res = dst.write_all(buffer.first(*n)); !res) {
            return std::unexpected(
                IoError::from_code(IoPhase::WriteDestination, res.error(), dst_path));
        }
        copied += *n;
    }
}

}  // namespace

CopyExecutor::CopyExecutor(CopyOptions options, CopyOperation copy)
    : options_(options), copy_(std::move(copy)) {
    if (options_.concurrency == 0) {
        options_.concurrency = 1;
    }
    if (!copy_) {
        copy_ = [strict = options_.abort_on_cleanup_failure](std::uint64_t,
                                                             const SourceFile& source,
                                                             const std::filesystem::path& dir,
                                                             std::span<std::byte> buffer) {
            return copy_to_fresh_file(source, dir, buffer, strict);
        };
    }
}

std::expected<std::uint64_t, IoError> CopyExecutor::copy_to_fresh_file(
    const SourceFile& source,
    const std::filesystem::path& dir,
    std::span<std::byte> buffer,
    bool abort_on_cleanup_failure,
    const FileRemover& remove) {
    int src_raw = ::open(source.path.c_str(), O_RDONLY | O_CLOEXEC);
    if (src_raw < 0) {
        return std::unexpected(IoError::from_code(IoPhase::OpenSource, errno, source.path));
    }
    FileDescriptor src(src_raw);

    auto dest = create_temp_file(dir, Config::DEST_PREFIX);
    if (!dest) {
        return std::unexpected(IoError::from_code(IoPhase::CreateDestination, dest.error(), dir));
    }

    auto result = pump(src, dest->fd, buffer, source.path, dest->path);

    auto closed = dest->fd.close();
    if (!closed && result) {
        result = std::unexpected(
            IoError::from_code(IoPhase::WriteDestination, closed.error(), dest->path));
    }
    src.reset();

    if (auto removed = remove(dest->path); !removed) {
        auto err = IoError::from_code(IoPhase::RemoveDestination, removed.error(), dest->path);
        if (abort_on_cleanup_failure) {
            log::error("{}; aborting because strict cleanup is enabled", err.message());
            std::abort();
        }
        // Keep the earlier copy error if there was one.
        if (result) {
            return std::unexpected(std::move(err));
        }
    }

    return result;
}

std::expected<DiskResult, IoError> CopyExecutor::run(const std::filesystem::path& dir,
                                                     std::uint64_t repetitions,
                                                     SourcePool& pool) const {
    if (repetitions > 0 && pool.empty()) {
        return std::unexpected(IoError::invalid("cannot copy from an empty source pool"));
    }

    const auto workers = static_cast<std::size_t>(
        std::clamp<std::uint64_t>(repetitions, 1, options_.concurrency));

    std::atomic<std::uint64_t> next_index{0};
    std::atomic<std::uint64_t> total_bytes{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::optional<IoError> first_error;

    auto worker = [&] {
        std::vector<std::byte> buffer(Config::COPY_BUFFER_SIZE);
        while (!failed.load(std::memory_order_acquire)) {
            const std::uint64_t i = next_index.fetch_add(1, std::memory_order_relaxed);
            if (i >= repetitions) {
                break;
            }

            auto copied = copy_(i, pool[static_cast<std::size_t>(i % pool.size())], dir, buffer);
            if (!copied) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::move(copied.error());
                }
                failed.store(true, std::memory_order_release);
                break;
            }
            total_bytes.fetch_add(*copied, std::memory_order_relaxed);
        }
    };

    auto start = steady_clock::now();
    if (workers == 1) {
        worker();
    } else {
        std::vector<std::jthread> group;
        group.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            group.emplace_back(worker);
        }
    }
    auto end = steady_clock::now();

    if (first_error) {
        return std::unexpected(std::move(*first_error));
    }

    if (auto removed = pool.remove_all(); !removed) {
        return std::unexpected(removed.error());
    }

    return DiskResult{duration<double>(end - start).count(), repetitions, total_bytes.load()};
}

}  // namespace spindle
