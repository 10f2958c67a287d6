#pragma once

#include <optional>
#include <string>

namespace sockbridge::net {

    struct HostPort {
        std::string host;   // empty means "unspecified"
        std::string port;   // numeric or service name
    };

    // Splits "host:port", ":port" and "[v6addr]:port". Returns nullopt when the
    // address has no port separator, an empty port, or unbalanced brackets.
    inline std::optional<HostPort> split_host_port(const std::string& address) {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) return std::nullopt;

        HostPort hp;
        hp.port = address.substr(colon + 1);
        if (hp.port.empty()) return std::nullopt;

        std::string host = address.substr(0, colon);
        if (!host.empty() && host.front() == '[') {
            if (host.size() < 2 || host.back() != ']') return std::nullopt;
            host = host.substr(1, host.size() - 2);
        } else if (host.find(':') != std::string::npos || host.find(']') != std::string::npos) {
            // bare IPv6 literals must be bracketed
            return std::nullopt;
        }
        hp.host = host;
        return hp;
    }

} // namespace sockbridge::net
