/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <span>

#include "io_error.hpp"

namespace spindle {

// Initialises libcrypto once per process and checks the CSPRNG is seeded.
// Throws std::runtime_error on failure; a later call retries.
void init_crypto();

// Fills the buffer from the OpenSSL CSPRNG.
std::expected<void, IoError> fill_random(std::span<std::byte> buffer);

}  // namespace spindle
