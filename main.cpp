#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "core/Forwarder.hpp"
#include "core/ForwarderConfig.hpp"
#include "net/SocketError.hpp"
#include "relay/ForwardingService.hpp"
#include "relay/ShutdownController.hpp"
#include "relay/ShutdownSignal.hpp"
#include "security/SecurityAwareLogger.hpp"
#include "utils/Panic.hpp"

using namespace sockbridge;

void verify_build_flags() {
#if !defined(__OPTIMIZE__)
    SB_LOG(Warn) << "Built without optimizations (-O2); relay throughput will suffer";
#endif
#ifdef __SANITIZE_ADDRESS__
    SB_LOG(Info) << "AddressSanitizer is enabled.";
#endif
}

int main(int argc, char** argv) {
    core::ForwarderConfig cfg;
    if (!core::parse_args(argc, argv, cfg)) {
        core::usage(argv[0]);
        return 2;
    }
    if (cfg.show_help) {
        core::usage(argv[0], std::cout);
        return 0;
    }

    try {
        core::validate(cfg);
    } catch (const std::invalid_argument& e) {
        PANIC(e.what());
    }

    if (cfg.verbose) {
        security::SecurityAwareLogger::instance().set_min_level(security::SecurityAwareLogger::Level::Debug);
    }
    verify_build_flags();

    relay::ShutdownSignal shutdown;
    relay::ShutdownController controller(shutdown);
    try {
        controller.install();
    } catch (const std::exception& e) {
        PANIC(std::string("Failed to install signal handling: ") + e.what());
    }

    auto forwarder = std::make_shared<const core::Forwarder>(
        cfg.source, cfg.target,
        cfg.independent_target ? core::Forwarder::TargetResolution::Independent
                               : core::Forwarder::TargetResolution::Coupled);

    std::unique_ptr<relay::ForwardingService> service;
    try {
        service = std::make_unique<relay::ForwardingService>(forwarder, shutdown);
    } catch (const net::ListenError& e) {
        PANIC(std::string("failed to start listener: ") + e.what());
    }

    service->run();

    // In-flight relays are abandoned, not drained.
    std::cerr << std::flush;
    std::_Exit(EXIT_SUCCESS);
}
