#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "spindle";
    constexpr std::string_view APP_VERSION = "1.0.0";

    constexpr std::uint16_t SERVER_PORT = 5555;
    constexpr int LISTEN_BACKLOG = 64;
    constexpr int ACCEPT_POLL_MS = 250;
    constexpr std::size_t HTTP_MAX_HEADER_BYTES = 16 * 1024;
    constexpr long HTTP_RECV_TIMEOUT_SEC = 10;
    constexpr std::size_t MAX_CONNECTIONS = 16;
    constexpr int MAX_QUEUED_RUNS = 1;

    constexpr std::string_view ENV_EPHEMERAL_DIR = "BM_EPHEMERAL_DIR";
    constexpr std::string_view ENV_PERSISTENT_DIR = "BM_PERSISTENT_DIR";

    constexpr std::size_t POOL_SIZE = 10;
    constexpr std::size_t FILL_BUFFER_SIZE = 32 * 1024;
    constexpr std::size_t COPY_BUFFER_SIZE = 32 * 1024;
    constexpr std::size_t COPY_CONCURRENCY = 10;

    constexpr std::string_view SOURCE_PREFIX = "spindle_src_";
    constexpr std::string_view DEST_PREFIX = "spindle_dst_";
}  // namespace Config
