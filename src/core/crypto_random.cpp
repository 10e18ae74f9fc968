/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/crypto_random.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace spindle {

namespace {
    std::once_flag init_flag;

    std::string last_openssl_error() {
        unsigned long code = ERR_get_error();
        if (code == 0) {
            return "RAND_bytes failed";
        }
        std::array<char, 256> buf{};
        ERR_error_string_n(code, buf.data(), buf.size());
        return std::string(buf.data());
    }
}

void init_crypto() {
    std::call_once(init_flag, [] {
        if (OPENSSL_init_crypto(OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) == 0) {
            throw std::runtime_error("Failed to initialize OpenSSL crypto library");
        }
        if (RAND_status() != 1) {
            throw std::runtime_error("OpenSSL random generator is not seeded");
        }
    });
}

std::expected<void, IoError> fill_random(std::span<std::byte> buffer) {
    while (!buffer.empty()) {
        std::size_t chunk = std::min<std::size_t>(buffer.size(), INT_MAX);
        auto* out = reinterpret_cast<unsigned char*>(buffer.data());
        if (RAND_bytes(out, static_cast<int>(chunk)) != 1) {
            IoError err{IoPhase::RandomBytes, 0, {}, last_openssl_error()};
            return std::unexpected(std::move(err));
        }
        buffer = buffer.subspan(chunk);
    }
    return {};
}

}  // namespace spindle
