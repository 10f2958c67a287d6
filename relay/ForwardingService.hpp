#pragma once

#include <memory>
#include <utility>

#include "core/EndpointKind.hpp"
#include "core/Forwarder.hpp"
#include "net/Listener.hpp"
#include "relay/Acceptor.hpp"
#include "relay/Relay.hpp"
#include "relay/ShutdownSignal.hpp"
#include "security/SecurityAwareLogger.hpp"

namespace sockbridge::relay {

    // Wires a Forwarder to its Acceptor and hands every accepted client to a
    // fresh Relay.
    class ForwardingService {
        public:
            // Throws net::ListenError when the source cannot be bound.
            ForwardingService(std::shared_ptr<const core::Forwarder> forwarder, ShutdownSignal& shutdown)
                : forwarder_(std::move(forwarder)),
                  acceptor_(forwarder_->endpoint_kind(), forwarder_->source_addr(), shutdown,
                            [forwarder = forwarder_](std::unique_ptr<net::Connection> client) {
                                Relay::spawn(forwarder, std::move(client));
                            }) {
                SB_LOG(Info) << "Forwarding from " << forwarder_->source_addr()
                             << " (" << core::to_string(forwarder_->endpoint_kind()) << ") to "
                             << forwarder_->target_addr()
                             << " (" << core::to_string(forwarder_->target_kind()) << ")";
            }

            void run() { acceptor_.run(); }

            const net::Listener& listener() const { return acceptor_.listener(); }
            const core::Forwarder& forwarder() const { return *forwarder_; }

        private:
            std::shared_ptr<const core::Forwarder> forwarder_;
            Acceptor acceptor_;
    };

} // namespace sockbridge::relay
