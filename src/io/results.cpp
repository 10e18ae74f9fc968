// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "include/results.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace spindle {

const DiskResult* BucketSuiteResult::find(std::string_view key) const noexcept {
    auto it = std::ranges::find(runs, key, &BucketRunResult::key);
    return it == runs.end() ? nullptr : &it->result;
}

void to_json(nlohmann::json& j, const DiskResult& result) {
    j = nlohmann::json{
        {"Seconds", result.seconds},
        {"Count", result.count},
        {"Bytes", result.bytes},
    };
}

void to_json(nlohmann::json& j, const BucketSuiteResult& suite) {
    j = nlohmann::json::object();
    for (const auto& run : suite.runs) {
        j[run.key] = run.result;
    }
}

}  // namespace spindle
