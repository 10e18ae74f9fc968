/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/source_pool.hpp"

#include <algorithm>
#include <span>
#include <utility>

#include <fmt/core.h>

#include "include/crypto_random.hpp"
#include "include/temp_file.hpp"

namespace spindle {

SourcePool::~SourcePool() {
    for (const auto& file : files_) {
        [[maybe_unused]] auto removed = remove_file(file.path);
    }
}

SourcePool::SourcePool(SourcePool&& other) noexcept : files_(std::exchange(other.files_, {})) {}

SourcePool& SourcePool::operator=(SourcePool&& other) noexcept {
    if (this != &other) {
        SourcePool discarded(std::move(*this));
        files_ = std::exchange(other.files_, {});
    }
    return *this;
}

std::uint64_t SourcePool::target_size(const SizeRange& range,
                                      std::size_t index,
                                      std::size_t pool_size) noexcept {
    if (pool_size == 0 || range.max <= range.min) {
        return range.min;
    }
    const std::uint64_t span = range.max - range.min;
    const std::uint64_t n = pool_size;
    const std::uint64_t i = index;
    // floor(span * i / n) without overflowing span * i
    return range.min + (span / n) * i + ((span % n) * i) / n;
}

std::expected<SourcePool, IoError> SourcePool::generate(const std::filesystem::path& dir,
                                                        const SizeRange& range,
                                                        std::size_t pool_size) {
    if (!range.valid()) {
        return std::unexpected(
            IoError::invalid(fmt::format("size range min {} exceeds max {}", range.min, range.max)));
    }
    if (pool_size == 0) {
        return std::unexpected(IoError::invalid("source pool size must be positive"));
    }

    SourcePool pool;
    pool.files_.reserve(pool_size);

    std::vector<std::byte> buffer(Config::FILL_BUFFER_SIZE);

    for (std::size_t i = 0; i < pool_size; ++i) {
        const std::uint64_t target = target_size(range, i, pool_size);

        auto temp = create_temp_file(dir, Config::SOURCE_PREFIX);
        if (!temp) {
            return std::unexpected(IoError::from_code(IoPhase::CreateSource, temp.error(), dir));
        }
        pool.files_.push_back(SourceFile{temp->path, target});

        std::uint64_t written = 0;
        while (written < target) {
            const auto chunk =
                static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), target - written));
            std::span<std::byte> view(buffer.data(), chunk);

            if (auto filled = fill_random(view); !filled) {
                return std::unexpected(filled.error());
            }
            if (auto res = temp->fd.write_all(view); !res) {
                return std::unexpected(IoError::from_code(IoPhase::WriteSource, res.error(), temp->path));
            }
            written += chunk;
        }

        if (auto closed = temp->fd.close(); !closed) {
            return std::unexpected(IoError::from_code(IoPhase::WriteSource, closed.error(), temp->path));
        }
    }

    return pool;
}

std::expected<void, IoError> SourcePool::remove_all() {
    while (!files_.empty()) {
        const auto& file = files_.back();
        if (auto res = remove_file(file.path); !res) {
            return std::unexpected(IoError::from_code(IoPhase::RemoveSource, res.error(), file.path));
        }
        files_.pop_back();
    }
    return {};
}

}  // namespace spindle
