#pragma once

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>
#include <errno.h>

#include <cstring>
#include <memory>
#include <string>

#include "core/EndpointKind.hpp"
#include "net/Address.hpp"
#include "net/Connection.hpp"
#include "net/FdGuard.hpp"
#include "net/Listener.hpp"
#include "net/SocketError.hpp"
#include "security/SecurityAwareLogger.hpp"

namespace sockbridge::net {

    class Dialer {
        public:
            // Blocking connect; throws DialError. No retries.
            static std::unique_ptr<Connection> dial(core::EndpointKind kind, const std::string& address) {
                if (kind == core::EndpointKind::UnixSocket) {
                    return make_connection(kind, dial_unix(address).release(), address);
                }
                return make_connection(kind, dial_tcp(address).release(), address);
            }

        private:
            static FdGuard dial_unix(const std::string& path) {
                sockaddr_un addr{};
                addr.sun_family = AF_UNIX;
                if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
                    throw DialError("connect", ENAMETOOLONG, path);
                }
                std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

                FdGuard fd(::socket(AF_UNIX, SOCK_STREAM, 0));
                if (!fd) throw DialError("socket(unix)", errno);
                set_cloexec(fd.get());

                for (;;) {
                    if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) return fd;
                    if (errno != EINTR) break;
                }
                throw DialError("connect", errno, path);
            }

            // Empty host dials the local system.
            static FdGuard dial_tcp(const std::string& address) {
                auto hp = split_host_port(address);
                if (!hp) throw DialError("connect", 0, "malformed address " + address);

                addrinfo hints{}, *res = nullptr;
                hints.ai_family = AF_UNSPEC;
                hints.ai_socktype = SOCK_STREAM;

                const char* host = hp->host.empty() ? nullptr : hp->host.c_str();
                int rc = getaddrinfo(host, hp->port.c_str(), &hints, &res);
                if (rc != 0) {
                    throw DialError("getaddrinfo", 0, address + ": " + gai_strerror(rc));
                }
                std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> res_guard(res, &freeaddrinfo);

                int last_err = ECONNREFUSED;
                for (auto p = res; p; p = p->ai_next) {
                    FdGuard fd(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
                    if (!fd) {
                        last_err = errno;
                        continue;
                    }
                    set_cloexec(fd.get());

                    int cr;
                    do {
                        cr = ::connect(fd.get(), p->ai_addr, p->ai_addrlen);
                    } while (cr != 0 && errno == EINTR);
                    if (cr == 0) return fd;

                    last_err = errno;
                    SB_LOG(Debug) << "connect attempt to " << address << " failed: " << categorize_errno(last_err);
                }
                throw DialError("connect", last_err, address);
            }
    };

} // namespace sockbridge::net
