#pragma once

#include <string>
#include <utility>

#include "core/EndpointKind.hpp"

namespace sockbridge::core {

    // Process-wide forwarding relationship. Immutable once built, so relay
    // threads read it without locking.
    class Forwarder {
        public:
            enum class TargetResolution {
                Coupled,     // target is dialed with the kind resolved from the source
                Independent  // target kind is probed on its own, once, here
            };

            Forwarder(std::string source, std::string target,
                      TargetResolution resolution = TargetResolution::Coupled)
                : source_addr_(std::move(source)),
                  target_addr_(std::move(target)),
                  endpoint_kind_(resolve_endpoint_kind(source_addr_)),
                  target_kind_(resolution == TargetResolution::Independent
                                   ? resolve_endpoint_kind(target_addr_)
                                   : endpoint_kind_) {}

            const std::string& source_addr() const { return source_addr_; }
            const std::string& target_addr() const { return target_addr_; }

            // Governs how the listener is opened.
            EndpointKind endpoint_kind() const { return endpoint_kind_; }

            // Governs how each target dial is made.
            EndpointKind target_kind() const { return target_kind_; }

        private:
            const std::string source_addr_;
            const std::string target_addr_;
            const EndpointKind endpoint_kind_;
            const EndpointKind target_kind_;
    };

} // namespace sockbridge::core
