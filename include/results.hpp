// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace spindle {

struct SizeRange {
    std::uint64_t min = 0;
    std::uint64_t max = 0;

    [[nodiscard]] constexpr bool valid() const noexcept { return min <= max; }
};

struct DiskResult {
    double seconds = 0.0;  // copy phase only
    std::uint64_t count = 0;
    std::uint64_t bytes = 0;

    [[nodiscard]] double bytes_per_second() const noexcept {
        return seconds > 0.0 ? static_cast<double>(bytes) / seconds : 0.0;
    }
};

struct BucketRunResult {
    std::string key;
    DiskResult result;
};

// Ordered as the bucket table was run.
struct BucketSuiteResult {
    std::vector<BucketRunResult> runs;

    [[nodiscard]] const DiskResult* find(std::string_view key) const noexcept;
};

void to_json(nlohmann::json& j, const DiskResult& result);
void to_json(nlohmann::json& j, const BucketSuiteResult& suite);

}  // namespace spindle
