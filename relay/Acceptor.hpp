#pragma once

#include <errno.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "core/EndpointKind.hpp"
#include "net/Connection.hpp"
#include "net/Listener.hpp"
#include "net/SocketError.hpp"
#include "net/SocketTuner.hpp"
#include "relay/ShutdownSignal.hpp"
#include "security/SecurityAwareLogger.hpp"

namespace sockbridge::relay {

    class Acceptor {
        public:
            using Handler = std::function<void(std::unique_ptr<net::Connection>)>;

            static constexpr auto kResourceBackoff = std::chrono::milliseconds(10);

            // Opens the listener immediately; throws net::ListenError.
            Acceptor(core::EndpointKind kind, const std::string& address, ShutdownSignal& shutdown, Handler handler)
                : listener_(net::Listener::open(kind, address)),
                  shutdown_(shutdown),
                  handler_(std::move(handler)) {
                subscription_ = shutdown_.subscribe([listener = listener_]() { listener->close(); });
            }

            ~Acceptor() {
                shutdown_.unsubscribe(subscription_);
                listener_->close();
            }

            Acceptor(const Acceptor&) = delete;
            Acceptor& operator=(const Acceptor&) = delete;

            // Returns only once the listener has been closed.
            void run() {
                for (;;) {
                    std::unique_ptr<net::Connection> conn;
                    try {
                        conn = listener_->accept();
                    } catch (const net::AcceptError& e) {
                        SB_LOG(Error) << "Error accepting connection: " << e.what();
                        if (is_resource_exhaustion(e.error_code())) {
                            std::this_thread::sleep_for(kResourceBackoff);
                        }
                        continue;
                    }
                    if (!conn) break;

                    try {
                        net::SocketTuner::tune(*conn);
                    } catch (const net::TuningError& e) {
                        SB_LOG(Error) << "Failed to optimize connection from " << conn->description() << ": " << e.what();
                        conn->close();
                        continue;
                    }

                    SB_LOG(Debug) << "Accepted connection from " << conn->description();
                    handler_(std::move(conn));
                }
                SB_LOG(Info) << "Listener on " << listener_->address() << " closed";
            }

            const net::Listener& listener() const { return *listener_; }

        private:
            static bool is_resource_exhaustion(int err) {
                return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM;
            }

            std::shared_ptr<net::Listener> listener_;
            ShutdownSignal& shutdown_;
            Handler handler_;
            ShutdownSignal::SubscriptionId subscription_ = 0;
    };

} // namespace sockbridge::relay
