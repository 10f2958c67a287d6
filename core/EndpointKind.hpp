#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace sockbridge::core {

    enum class EndpointKind {
        UnixSocket,
        Network
    };

    inline const char* to_string(EndpointKind kind) {
        switch (kind) {
            case EndpointKind::UnixSocket: return "unix";
            case EndpointKind::Network: return "tcp";
        }
        return "tcp";
    }

    // An address names a Unix socket exactly when something already exists at
    // that path. Probe failures of any kind count as "absent".
    inline EndpointKind resolve_endpoint_kind(const std::string& address) {
        if (address.empty()) return EndpointKind::Network;
        std::error_code ec;
        bool present = std::filesystem::exists(std::filesystem::path(address), ec);
        return (!ec && present) ? EndpointKind::UnixSocket : EndpointKind::Network;
    }

} // namespace sockbridge::core
