#pragma once

#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>

#include <algorithm>
#include <climits>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "core/EndpointKind.hpp"
#include "net/FdGuard.hpp"

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace sockbridge::net {

    // A duplex byte stream. Reads and writes block the calling thread only;
    // one thread may read while another writes.
    class Connection {
        public:
            virtual ~Connection() = default;

            // Bytes read (> 0), 0 on end-of-stream, -1 on error with errno set.
            virtual ssize_t read_some(char* buf, size_t len) = 0;

            // Writes the whole buffer. false on error with errno set.
            virtual bool write_all(const char* data, size_t len) = 0;

            // Signals end-of-stream to the peer while reads keep working.
            virtual void shutdown_write() = 0;

            // Wakes any thread blocked on this connection without releasing
            // the descriptor.
            virtual void shutdown_both() = 0;

            // Idempotent.
            virtual void close() = 0;

            virtual bool is_open() const = 0;

            virtual const std::string& description() const = 0;

            // Descriptor that accepts TCP-level socket options, when the
            // transport has one. The tuner keys off this alone.
            virtual std::optional<int> tunable_fd() const { return std::nullopt; }
    };

    class SocketConnection : public Connection {
        public:
            SocketConnection(int fd, std::string description)
                : fd_(fd), description_(std::move(description)) {}

            ssize_t read_some(char* buf, size_t len) override {
                if (!fd_) { errno = EBADF; return -1; }
                len = std::min(len, static_cast<size_t>(INT_MAX));
                for (;;) {
                    ssize_t n = ::recv(fd_.get(), buf, len, 0);
                    if (n < 0 && errno == EINTR) continue;
                    return n;
                }
            }

            bool write_all(const char* data, size_t len) override {
                if (!fd_) { errno = EBADF; return false; }
                size_t sent = 0;
                while (sent < len) {
                    size_t slice = std::min(len - sent, static_cast<size_t>(INT_MAX));
                    ssize_t n = ::send(fd_.get(), data + sent, slice, MSG_NOSIGNAL);
                    if (n < 0) {
                        if (errno == EINTR) continue;
                        return false;
                    }
                    sent += static_cast<size_t>(n);
                }
                return true;
            }

            void shutdown_write() override {
                if (fd_) ::shutdown(fd_.get(), SHUT_WR);
            }

            void shutdown_both() override {
                if (fd_) ::shutdown(fd_.get(), SHUT_RDWR);
            }

            void close() override {
                fd_.reset();
            }

            bool is_open() const override {
                return static_cast<bool>(fd_);
            }

            const std::string& description() const override {
                return description_;
            }

            int native_handle() const { return fd_.get(); }

        private:
            FdGuard fd_;
            std::string description_;
    };

    class TcpConnection : public SocketConnection {
        public:
            using SocketConnection::SocketConnection;

            std::optional<int> tunable_fd() const override {
                if (!is_open()) return std::nullopt;
                return native_handle();
            }
    };

    class UnixConnection : public SocketConnection {
        public:
            using SocketConnection::SocketConnection;
    };

    // Takes ownership of fd.
    inline std::unique_ptr<Connection> make_connection(core::EndpointKind kind, int fd, std::string description) {
        if (kind == core::EndpointKind::Network) {
            return std::make_unique<TcpConnection>(fd, std::move(description));
        }
        return std::make_unique<UnixConnection>(fd, std::move(description));
    }

} // namespace sockbridge::net
