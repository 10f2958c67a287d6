#pragma once

#include <errno.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "core/Forwarder.hpp"
#include "net/Connection.hpp"
#include "net/Dialer.hpp"
#include "net/SocketError.hpp"
#include "net/SocketTuner.hpp"
#include "security/SecurityAwareLogger.hpp"

namespace sockbridge::relay {

    inline constexpr size_t kRelayBufferBytes = 128 * 1024;

    enum class PumpResult { Eof, Error };

    // Copies from -> to until from reports end-of-stream or either side fails,
    // then half-closes to so its peer sees end-of-stream. Never touches the
    // opposite direction.
    inline PumpResult pump(net::Connection& from, net::Connection& to, const char* tag, uint64_t& bytes) {
        std::vector<char> buf(kRelayBufferBytes);
        PumpResult result = PumpResult::Eof;

        for (;;) {
            ssize_t n = from.read_some(buf.data(), buf.size());
            if (n == 0) {
                SB_LOG(Debug) << tag << " EOF from " << from.description();
                break;
            }
            if (n < 0) {
                int err = errno;
                SB_LOG(Warn) << tag << " read from " << from.description() << " failed: " << net::categorize_errno(err);
                result = PumpResult::Error;
                break;
            }
            if (!to.write_all(buf.data(), static_cast<size_t>(n))) {
                int err = errno;
                SB_LOG(Warn) << tag << " write to " << to.description() << " failed: " << net::categorize_errno(err);
                result = PumpResult::Error;
                break;
            }
            bytes += static_cast<uint64_t>(n);
        }

        to.shutdown_write();
        return result;
    }

    // One accepted client: dial, tune, pump both ways, close.
    class Relay {
        public:
            Relay(std::shared_ptr<const core::Forwarder> forwarder, std::unique_ptr<net::Connection> client)
                : forwarder_(std::move(forwarder)), client_(std::move(client)) {}

            // Fire-and-forget. The relay owns the client from here on.
            static void spawn(std::shared_ptr<const core::Forwarder> forwarder, std::unique_ptr<net::Connection> client) {
                try {
                    std::thread([forwarder = std::move(forwarder), client = std::move(client)]() mutable {
                        std::string peer = client->description();
                        try {
                            Relay relay(std::move(forwarder), std::move(client));
                            relay.run();
                        } catch (const std::exception& e) {
                            SB_LOG(Error) << "Relay for " << peer << " aborted: " << e.what();
                        }
                    }).detach();
                } catch (const std::system_error& e) {
                    SB_LOG(Error) << "Failed to start relay thread: " << e.what();
                }
            }

            void run() {
                std::unique_ptr<net::Connection> target;
                try {
                    target = net::Dialer::dial(forwarder_->target_kind(), forwarder_->target_addr());
                } catch (const net::DialError& e) {
                    SB_LOG(Error) << "Failed to connect to target for " << client_->description() << ": " << e.what();
                    client_->close();
                    return;
                }

                try {
                    net::SocketTuner::tune(*target);
                } catch (const net::TuningError& e) {
                    SB_LOG(Error) << "Failed to optimize target connection: " << e.what();
                    target->close();
                    client_->close();
                    return;
                }

                SB_LOG(Debug) << "Relaying " << client_->description() << " <-> " << target->description();

                uint64_t up_bytes = 0;
                uint64_t down_bytes = 0;
                PumpResult up_result = PumpResult::Eof;
                PumpResult down_result = PumpResult::Eof;

                std::thread t_up;
                std::thread t_down;
                try {
                    t_up = std::thread([&]() { up_result = pump(*client_, *target, "client->target", up_bytes); });
                    t_down = std::thread([&]() { down_result = pump(*target, *client_, "target->client", down_bytes); });
                } catch (const std::system_error& e) {
                    SB_LOG(Error) << "Failed to start pump thread: " << e.what();
                    client_->shutdown_both();
                    target->shutdown_both();
                }

                // Completion barrier: neither pump cuts the other short.
                if (t_up.joinable()) t_up.join();
                if (t_down.joinable()) t_down.join();

                target->close();
                client_->close();

                SB_LOG(Debug) << "Connection " << client_->description() << " closed: "
                              << up_bytes << " bytes to target"
                              << (up_result == PumpResult::Error ? " (error)" : "") << ", "
                              << down_bytes << " bytes to client"
                              << (down_result == PumpResult::Error ? " (error)" : "");
            }

        private:
            std::shared_ptr<const core::Forwarder> forwarder_;
            std::unique_ptr<net::Connection> client_;
    };

} // namespace sockbridge::relay
