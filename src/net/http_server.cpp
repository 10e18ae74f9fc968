/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/http_server.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <exception>
#include <span>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <fmt/core.h>

#include "include/config.hpp"
#include "include/interrupts.hpp"
#include "include/log.hpp"
#include "include/utils.hpp"

namespace spindle {

namespace {

HttpResponse empty_response(int status) {
    HttpResponse response;
    response.status = status;
    return response;
}

// Reads until the blank line that ends the head. Error is errno, or EMSGSIZE
// when the head does not fit.
std::expected<std::string, int> read_request_head(const FileDescriptor& client) {
    std::string head;
    std::array<std::byte, 4096> chunk{};

    while (head.find("\r\n\r\n") == std::string::npos) {
        if (head.size() >= Config::HTTP_MAX_HEADER_BYTES) {
            return std::unexpected(EMSGSIZE);
        }
        auto n = client.read_some(chunk);
        if (!n) {
            return std::unexpected(n.error());
        }
        if (*n == 0) {
            return std::unexpected(ECONNRESET);
        }
        head.append(reinterpret_cast<const char*>(chunk.data()), *n);
    }
    return head;
}

}  // namespace

std::expected<HttpRequest, int> parse_request_head(std::string_view head) {
    auto eol = head.find("\r\n");
    std::string_view line = trim_sv(head.substr(0, eol));

    auto first_sp = line.find(' ');
    auto last_sp = line.rfind(' ');
    if (first_sp == std::string_view::npos || first_sp == last_sp) {
        return std::unexpected(400);
    }

    HttpRequest request;
    request.method = std::string(line.substr(0, first_sp));
    std::string_view target = trim_sv(line.substr(first_sp + 1, last_sp - first_sp - 1));
    request.version = std::string(line.substr(last_sp + 1));

    if (request.method.empty() || target.empty() || target.front() != '/' ||
        !request.version.starts_with("HTTP/1.")) {
        return std::unexpected(400);
    }

    if (auto query = target.find('?'); query != std::string_view::npos) {
        target = target.substr(0, query);
    }
    request.target = std::string(target);
    return request;
}

std::string_view status_reason(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 431:
            return "Request Header Fields Too Large";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}

std::string serialize_response(const HttpResponse& response) {
    std::string out = fmt::format("HTTP/1.1 {} {}\r\n", response.status, status_reason(response.status));
    if (!response.content_type.empty()) {
        out += fmt::format("Content-Type: {}\r\n", response.content_type);
    }
    for (const auto& [name, value] : response.headers) {
        out += fmt::format("{}: {}\r\n", name, value);
    }
    out += fmt::format("Content-Length: {}\r\n", response.body.size());
    out += "Connection: close\r\n\r\n";
    out += response.body;
    return out;
}

HttpServer::HttpServer(std::uint16_t port, std::string_view bind_address, std::size_t max_connections)
    : max_connections_(std::max<std::size_t>(max_connections, 1)) {
    int fd_raw = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_raw < 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to create socket");
    }
    listen_fd_.reset(fd_raw);

    int reuse = 1;
    if (::setsockopt(listen_fd_.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to set SO_REUSEADDR");
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    const std::string address(bind_address);
    if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        throw std::invalid_argument(fmt::format("Invalid IPv4 bind address '{}'", address));
    }

    if (::bind(listen_fd_.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        throw std::system_error(
            errno, std::generic_category(), fmt::format("Failed to bind {}:{}", address, port));
    }
    if (::listen(listen_fd_.get(), Config::LISTEN_BACKLOG) != 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to listen");
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(listen_fd_.get(), reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to read bound address");
    }
    port_ = ntohs(addr.sin_port);
}

HttpServer::~HttpServer() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.clear();
}

void HttpServer::route(std::string path, RouteHandler handler) {
    routes_.insert_or_assign(std::move(path), std::move(handler));
}

HttpResponse HttpServer::dispatch(const HttpRequest& request) const {
    auto it = routes_.find(request.target);
    if (it == routes_.end()) {
        return empty_response(404);
    }
    if (request.method != "GET") {
        auto response = empty_response(405);
        response.headers.emplace_back("Allow", "GET");
        return response;
    }
    return it->second(request);
}

void HttpServer::handle_connection(const FileDescriptor& client) const {
    struct timeval tv{};
    tv.tv_sec = Config::HTTP_RECV_TIMEOUT_SEC;
    if (::setsockopt(client.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        log::warn("failed to set receive timeout: {}", std::system_category().message(errno));
    }

    HttpResponse response;
    auto head = read_request_head(client);
    if (!head) {
        if (head.error() != EMSGSIZE) {
            log::warn("dropping connection: {}", std::system_category().message(head.error()));
            return;
        }
        response = empty_response(431);
    } else if (auto request = parse_request_head(*head); !request) {
        response = empty_response(request.error());
    } else {
        try {
            response = dispatch(*request);
        } catch (const std::exception& e) {
            log::error("{} {} failed: {}", request->method, request->target, e.what());
            response = empty_response(500);
        }
        log::info("{} {} -> {}", request->method, request->target, response.status);
    }

    const std::string wire = serialize_response(response);
    auto bytes = std::as_bytes(std::span(wire.data(), wire.size()));
    if (auto sent = client.write_all(bytes); !sent) {
        log::warn("failed to send response: {}", std::system_category().message(sent.error()));
    }
}

std::size_t HttpServer::reap_finished_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    std::erase_if(workers_, [](const Worker& w) { return w.done->load(); });
    return workers_.size();
}

void HttpServer::serve(std::stop_token stop) {
    struct pollfd pfd{};
    pfd.fd = listen_fd_.get();
    pfd.events = POLLIN;

    while (!stop.stop_requested() && !g_interrupted) {
        if (reap_finished_workers() >= max_connections_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(Config::ACCEPT_POLL_MS / 5));
            continue;
        }

        int ready = ::poll(&pfd, 1, Config::ACCEPT_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "poll failed on listen socket");
        }
        if (ready == 0) {
            continue;
        }

        int client_raw = ::accept4(listen_fd_.get(), nullptr, nullptr, SOCK_CLOEXEC);
        if (client_raw < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                log::warn("accept failed: {}", std::system_category().message(errno));
            }
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::jthread thread([this, done, client = FileDescriptor(client_raw)] {
            handle_connection(client);
            done->store(true);
        });

        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{std::move(thread), std::move(done)});
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.clear();
}

}  // namespace spindle
