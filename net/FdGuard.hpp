#pragma once

#include <unistd.h>

#include <utility>

namespace sockbridge::net {

    // Sole owner of one socket descriptor. Listener, Dialer and Connection pass
    // descriptors between each other only through release() or a move.
    class FdGuard {
        public:
            explicit FdGuard(int fd = -1) : fd_(fd) {}
            ~FdGuard() { close_current(); }

            FdGuard(const FdGuard&) = delete;
            FdGuard& operator=(const FdGuard&) = delete;

            FdGuard(FdGuard&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
            FdGuard& operator=(FdGuard&& other) noexcept {
                if (this != &other) reset(std::exchange(other.fd_, -1));
                return *this;
            }

            int get() const { return fd_; }

            // Hands the descriptor to a new owner without closing it.
            int release() { return std::exchange(fd_, -1); }

            void reset(int new_fd = -1) {
                if (new_fd == fd_) return;
                close_current();
                fd_ = new_fd;
            }

            explicit operator bool() const { return fd_ >= 0; }

        private:
            // No EINTR retry: on Linux the descriptor is gone even when close fails.
            void close_current() {
                if (fd_ >= 0) ::close(fd_);
                fd_ = -1;
            }

            int fd_;
    };

} // namespace sockbridge::net
