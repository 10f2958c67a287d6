#pragma once

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <errno.h>

#include "net/Connection.hpp"
#include "net/SocketError.hpp"

namespace sockbridge::net {

    class SocketTuner {
        public:
            static constexpr int kKeepAlivePeriodSec = 30;
            static constexpr int kSocketBufferBytes = 1024 * 1024;

            // Applies the throughput options in order, stopping at the first
            // failure. Connections without a tunable descriptor are left alone.
            static void tune(const Connection& conn) {
                auto fd = conn.tunable_fd();
                if (!fd) return;

                set_option(*fd, IPPROTO_TCP, TCP_NODELAY, 1, "TCP_NODELAY");
                set_option(*fd, SOL_SOCKET, SO_KEEPALIVE, 1, "SO_KEEPALIVE");
#ifdef TCP_KEEPIDLE
                set_option(*fd, IPPROTO_TCP, TCP_KEEPIDLE, kKeepAlivePeriodSec, "TCP_KEEPIDLE");
#elif defined(TCP_KEEPALIVE)
                set_option(*fd, IPPROTO_TCP, TCP_KEEPALIVE, kKeepAlivePeriodSec, "TCP_KEEPALIVE");
#endif
#ifdef TCP_KEEPINTVL
                set_option(*fd, IPPROTO_TCP, TCP_KEEPINTVL, kKeepAlivePeriodSec, "TCP_KEEPINTVL");
#endif
                set_option(*fd, SOL_SOCKET, SO_RCVBUF, kSocketBufferBytes, "SO_RCVBUF");
                set_option(*fd, SOL_SOCKET, SO_SNDBUF, kSocketBufferBytes, "SO_SNDBUF");
            }

        private:
            static void set_option(int fd, int level, int optname, int value, const char* what) {
                if (::setsockopt(fd, level, optname, &value, sizeof(value)) < 0) {
                    throw TuningError(what, errno, "setsockopt failed");
                }
            }
    };

} // namespace sockbridge::net
