/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "config.hpp"
#include "file_descriptor.hpp"

namespace spindle {

struct HttpRequest {
    std::string method;
    std::string target;  // path without the query string
    std::string version;
};

struct HttpResponse {
    int status = 200;
    std::string content_type;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
};

using RouteHandler = std::function<HttpResponse(const HttpRequest&)>;

// Parses the request line of a request head. The error is the status to answer with.
std::expected<HttpRequest, int> parse_request_head(std::string_view head);

std::string serialize_response(const HttpResponse& response);

std::string_view status_reason(int status);

/**
 * Minimal HTTP/1.1 server: one accept loop, one thread per connection,
 * one request per connection, GET routes matched on the exact path.
 */
class HttpServer {
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    FileDescriptor listen_fd_;
    std::uint16_t port_ = 0;
    std::size_t max_connections_;
    std::map<std::string, RouteHandler, std::less<>> routes_;
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;

    void handle_connection(const FileDescriptor& client) const;
    std::size_t reap_finished_workers();

   public:
    // Binds and listens immediately; port 0 picks an ephemeral port. At most
    // `max_connections` are handled at once, the rest wait in the backlog.
    explicit HttpServer(std::uint16_t port,
                        std::string_view bind_address = "0.0.0.0",
                        std::size_t max_connections = Config::MAX_CONNECTIONS);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void route(std::string path, RouteHandler handler);

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    [[nodiscard]] HttpResponse dispatch(const HttpRequest& request) const;

    // Accepts until `stop` is requested or g_interrupted is set, then waits
    // for in-flight connections.
    void serve(std::stop_token stop = {});
};

}  // namespace spindle
