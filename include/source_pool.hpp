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
#include <vector>

#include "config.hpp"
#include "io_error.hpp"
#include "results.hpp"

namespace spindle {

struct SourceFile {
    std::filesystem::path path;
    std::uint64_t size = 0;
};

/**
 * Ordered set of random-content files that a copy batch reads from.
 *
 * The pool owns its files. remove_all() deletes them and reports the first
 * failure; if the pool is destroyed while files remain (generation or the
 * batch failed), the destructor unlinks them and ignores errors.
 */
class SourcePool {
    std::vector<SourceFile> files_;

   public:
    SourcePool() = default;
    ~SourcePool();

    SourcePool(SourcePool&& other) noexcept;
    SourcePool& operator=(SourcePool&& other) noexcept;

    SourcePool(const SourcePool&) = delete;
    SourcePool& operator=(const SourcePool&) = delete;

    // File i holds min + floor((max - min) * i / pool_size) bytes.
    static std::expected<SourcePool, IoError> generate(const std::filesystem::path& dir,
                                                       const SizeRange& range,
                                                       std::size_t pool_size = Config::POOL_SIZE);

    [[nodiscard]] static std::uint64_t target_size(const SizeRange& range,
                                                   std::size_t index,
                                                   std::size_t pool_size) noexcept;

    std::expected<void, IoError> remove_all();

    [[nodiscard]] std::size_t size() const noexcept { return files_.size(); }
    [[nodiscard]] bool empty() const noexcept { return files_.empty(); }
    [[nodiscard]] const SourceFile& operator[](std::size_t i) const { return files_[i]; }
};

}  // namespace spindle
