/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cerrno>
#include <cstddef>
#include <expected>
#include <span>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace spindle {

class FileDescriptor {
    int fd_ = -1;

   public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd) : fd_(fd) {
        if (fd_ < -1) [[unlikely]] {
            throw std::system_error(
                EBADF, std::generic_category(), "Failed to wrap invalid file descriptor");
        }
    }

    ~FileDescriptor() noexcept {
        reset();
    }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    void reset(int new_fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = new_fd;
    }

    // Closes now and reports the result, unlike the destructor.
    std::expected<void, int> close() noexcept {
        int fd = std::exchange(fd_, -1);
        if (fd >= 0 && ::close(fd) != 0) {
            return std::unexpected(errno);
        }
        return {};
    }

    // Writes the whole span, retrying on short writes and EINTR.
    std::expected<void, int> write_all(std::span<const std::byte> data) const noexcept {
        while (!data.empty()) {
            ssize_t n = ::write(fd_, data.data(), data.size());
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return std::unexpected(errno);
            }
            if (n == 0) {
                return std::unexpected(EIO);
            }
            data = data.subspan(static_cast<std::size_t>(n));
        }
        return {};
    }

    // Returns 0 at end of file.
    std::expected<std::size_t, int> read_some(std::span<std::byte> buffer) const noexcept {
        for (;;) {
            ssize_t n = ::read(fd_, buffer.data(), buffer.size());
            if (n >= 0) {
                return static_cast<std::size_t>(n);
            }
            if (errno != EINTR) {
                return std::unexpected(errno);
            }
        }
    }

    [[nodiscard]] int get() const {
        if (fd_ < 0) [[unlikely]] {
            throw std::logic_error("FATAL: Accessing invalid file descriptor (-1)");
        }
        return fd_;
    }

    explicit operator bool() const noexcept {
        return fd_ >= 0;
    }
};

}  // namespace spindle
