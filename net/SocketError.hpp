#pragma once

#include <errno.h>

#include <cstring>
#include <stdexcept>
#include <string>

namespace sockbridge::net {

    // Error categorization for log lines
    inline const char* categorize_errno(int err) {
        switch (err) {
            case ECONNRESET: return "connection reset by peer";
            case ETIMEDOUT: return "network timeout";
            case EPIPE: return "write on closed socket";
            case ECONNREFUSED: return "connection refused";
            case EHOSTUNREACH: return "host unreachable";
            case ENETUNREACH: return "network unreachable";
            case EADDRINUSE: return "address already in use";
            case EADDRNOTAVAIL: return "address not available";
            case ENOENT: return "no such file or directory";
            case EACCES: return "permission denied";
            case EMFILE: case ENFILE: return "file descriptor limit reached";
            case ENOBUFS: case ENOMEM: return "insufficient memory/buffers";
            default: return std::strerror(err);
        }
    }

    // Base for every failure raised by the socket layer. Carries the failing
    // operation and the errno it observed (0 when the failure is not an OS error).
    class SocketError : public std::runtime_error {
        public:
            SocketError(const std::string& operation, int err, const std::string& detail = "")
                : std::runtime_error(compose(operation, err, detail)),
                  operation_(operation),
                  error_code_(err) {}

            const std::string& operation() const { return operation_; }
            int error_code() const { return error_code_; }

        private:
            static std::string compose(const std::string& operation, int err, const std::string& detail) {
                std::string msg = operation;
                if (!detail.empty()) msg += " " + detail;
                if (err != 0) msg += std::string(": ") + categorize_errno(err);
                return msg;
            }

            std::string operation_;
            int error_code_;
    };

    class ListenError : public SocketError {
        public:
            using SocketError::SocketError;
    };

    class AcceptError : public SocketError {
        public:
            using SocketError::SocketError;
    };

    class DialError : public SocketError {
        public:
            using SocketError::SocketError;
    };

    class TuningError : public SocketError {
        public:
            using SocketError::SocketError;
    };

} // namespace sockbridge::net
