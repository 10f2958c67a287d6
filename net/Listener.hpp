#pragma once

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/EndpointKind.hpp"
#include "net/Address.hpp"
#include "net/Connection.hpp"
#include "net/FdGuard.hpp"
#include "net/SocketError.hpp"
#include "security/SecurityAwareLogger.hpp"

#ifndef SOMAXCONN
#define SOMAXCONN 128
#endif

namespace sockbridge::net {

    inline std::string describe_peer(const sockaddr_storage& addr, socklen_t len) {
        char host[INET6_ADDRSTRLEN] = {};
        if (addr.ss_family == AF_INET) {
            auto* a = reinterpret_cast<const sockaddr_in*>(&addr);
            inet_ntop(AF_INET, &a->sin_addr, host, sizeof(host));
            return std::string(host) + ":" + std::to_string(ntohs(a->sin_port));
        }
        if (addr.ss_family == AF_INET6) {
            auto* a = reinterpret_cast<const sockaddr_in6*>(&addr);
            inet_ntop(AF_INET6, &a->sin6_addr, host, sizeof(host));
            return "[" + std::string(host) + "]:" + std::to_string(ntohs(a->sin6_port));
        }
        if (addr.ss_family == AF_UNIX) {
            auto* a = reinterpret_cast<const sockaddr_un*>(&addr);
            if (len > static_cast<socklen_t>(offsetof(sockaddr_un, sun_path)) && a->sun_path[0] != '\0') {
                return a->sun_path;
            }
            return "@unix";
        }
        return "unknown";
    }

    inline void set_cloexec(int fd) {
        int fd_flags = fcntl(fd, F_GETFD);
        if (fd_flags >= 0) fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);
    }

    // Listening endpoint on a TCP address or a Unix socket path. close() may be
    // called from any thread; a pending accept() observes it within one poll
    // interval and returns nullptr.
    class Listener {
        public:
            static constexpr int kAcceptPollMs = 100;

            static std::unique_ptr<Listener> open(core::EndpointKind kind, const std::string& address,
                                                  int backlog = SOMAXCONN) {
                if (kind == core::EndpointKind::UnixSocket) {
                    return std::unique_ptr<Listener>(new Listener(kind, address, listen_unix(address, backlog), true));
                }
                return std::unique_ptr<Listener>(new Listener(kind, address, listen_tcp(address, backlog), false));
            }

            ~Listener() {
                close();
            }

            Listener(const Listener&) = delete;
            Listener& operator=(const Listener&) = delete;

            // Next inbound connection, or nullptr once the listener is closed.
            // Throws AcceptError for an individual failed accept.
            std::unique_ptr<Connection> accept() {
                while (!closed()) {
                    struct pollfd pfd{fd_.get(), POLLIN, 0};
                    int pr = ::poll(&pfd, 1, kAcceptPollMs);
                    if (pr < 0) {
                        if (errno == EINTR) continue;
                        if (closed()) break;
                        throw AcceptError("poll", errno);
                    }
                    if (pr == 0) continue;
                    if (closed()) break;

                    sockaddr_storage peer{};
                    socklen_t peer_len = sizeof(peer);
                    int client_fd = ::accept4(fd_.get(), reinterpret_cast<sockaddr*>(&peer), &peer_len, SOCK_CLOEXEC);
                    if (client_fd < 0) {
                        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                        if (closed()) break;
                        throw AcceptError("accept", errno);
                    }
                    return make_connection(kind_, client_fd, describe_peer(peer, peer_len));
                }
                return nullptr;
            }

            void close() {
                if (closed_.exchange(true)) return;
                // The descriptor itself is released by the guard on destruction so a
                // concurrent poll() never sees a recycled fd number.
                ::shutdown(fd_.get(), SHUT_RDWR);
                if (unlink_on_close_) ::unlink(address_.c_str());
            }

            bool closed() const { return closed_.load(std::memory_order_acquire); }

            core::EndpointKind kind() const { return kind_; }
            const std::string& address() const { return address_; }

            // Bound TCP port, 0 for Unix listeners.
            uint16_t local_port() const {
                sockaddr_storage addr{};
                socklen_t len = sizeof(addr);
                if (::getsockname(fd_.get(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
                if (addr.ss_family == AF_INET) return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
                if (addr.ss_family == AF_INET6) return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
                return 0;
            }

        private:
            Listener(core::EndpointKind kind, std::string address, FdGuard fd, bool unlink_on_close)
                : kind_(kind), address_(std::move(address)), fd_(std::move(fd)), unlink_on_close_(unlink_on_close) {}

            static void set_nonblocking(int fd) {
                int flags = fcntl(fd, F_GETFL, 0);
                if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
            }

            // A leftover socket or an empty placeholder file may be replaced;
            // anything else at the path is somebody else's data.
            static void remove_stale_entry(const std::string& path) {
                struct stat st{};
                if (::lstat(path.c_str(), &st) != 0) return;
                if (S_ISSOCK(st.st_mode) || (S_ISREG(st.st_mode) && st.st_size == 0)) {
                    if (::unlink(path.c_str()) != 0) {
                        throw ListenError("unlink", errno, path);
                    }
                    return;
                }
                throw ListenError("bind", EADDRINUSE, path + " exists and is not a socket");
            }

            static FdGuard listen_unix(const std::string& path, int backlog) {
                sockaddr_un addr{};
                addr.sun_family = AF_UNIX;
                if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
                    throw ListenError("bind", ENAMETOOLONG, path);
                }
                std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

                remove_stale_entry(path);

                FdGuard fd(::socket(AF_UNIX, SOCK_STREAM, 0));
                if (!fd) throw ListenError("socket(unix)", errno);
                set_cloexec(fd.get());
                set_nonblocking(fd.get());

                if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
                    throw ListenError("bind", errno, path);
                }
                if (::listen(fd.get(), backlog) != 0) {
                    int listen_err = errno;
                    ::unlink(path.c_str());
                    throw ListenError("listen", listen_err, path);
                }
                SB_LOG(Info) << "Listening on unix socket " << path;
                return fd;
            }

            static FdGuard listen_tcp(const std::string& address, int backlog) {
                auto hp = split_host_port(address);
                if (!hp) throw ListenError("listen", 0, "malformed address " + address);

                addrinfo hints{}, *res = nullptr;
                hints.ai_family = AF_UNSPEC;
                hints.ai_socktype = SOCK_STREAM;
                hints.ai_flags = AI_PASSIVE;

                const char* host = hp->host.empty() ? nullptr : hp->host.c_str();
                int rc = getaddrinfo(host, hp->port.c_str(), &hints, &res);
                if (rc != 0) {
                    throw ListenError("getaddrinfo", 0, address + ": " + gai_strerror(rc));
                }
                std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> res_guard(res, &freeaddrinfo);

                // Prefer IPv6 so a wildcard host yields a dual-stack socket.
                std::vector<addrinfo*> candidates;
                for (auto p = res; p; p = p->ai_next) {
                    if (p->ai_family == AF_INET6) candidates.push_back(p);
                }
                for (auto p = res; p; p = p->ai_next) {
                    if (p->ai_family == AF_INET) candidates.push_back(p);
                }

                int last_err = EADDRNOTAVAIL;
                std::string last_op = "bind";
                for (auto* p : candidates) {
                    const char* family_str = (p->ai_family == AF_INET6) ? "IPv6" : "IPv4";
                    FdGuard fd(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
                    if (!fd) {
                        last_err = errno;
                        last_op = "socket";
                        SB_LOG(Debug) << "socket(" << family_str << "): " << categorize_errno(last_err);
                        continue;
                    }
                    set_cloexec(fd.get());
                    set_nonblocking(fd.get());

                    int yes = 1;
                    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
                    if (p->ai_family == AF_INET6) {
                        int v6only = 0;
                        ::setsockopt(fd.get(), IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
                    }

                    if (::bind(fd.get(), p->ai_addr, p->ai_addrlen) != 0) {
                        last_err = errno;
                        last_op = "bind";
                        SB_LOG(Debug) << "bind(" << family_str << ", " << address << "): " << categorize_errno(last_err);
                        continue;
                    }
                    if (::listen(fd.get(), backlog) != 0) {
                        last_err = errno;
                        last_op = "listen";
                        SB_LOG(Debug) << "listen(" << family_str << ", backlog " << backlog << "): "
                                      << categorize_errno(last_err);
                        continue;
                    }
                    SB_LOG(Info) << "Listening on " << address << " (" << family_str << ")";
                    return fd;
                }
                throw ListenError(last_op, last_err, address);
            }

            const core::EndpointKind kind_;
            const std::string address_;
            FdGuard fd_;
            const bool unlink_on_close_;
            std::atomic<bool> closed_{false};
    };

} // namespace sockbridge::net
