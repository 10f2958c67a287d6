#pragma once

#include <pthread.h>
#include <signal.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>

#include "relay/ShutdownSignal.hpp"
#include "security/SecurityAwareLogger.hpp"

namespace sockbridge::relay {

    // Bridges SIGINT/SIGTERM to a ShutdownSignal. install() must run before any
    // other thread is started so that every thread inherits the blocked mask and
    // only the watcher thread receives the signals.
    class ShutdownController {
        public:
            explicit ShutdownController(ShutdownSignal& shutdown) : shutdown_(shutdown) {}

            ShutdownController(const ShutdownController&) = delete;
            ShutdownController& operator=(const ShutdownController&) = delete;

            void install() {
                ::signal(SIGPIPE, SIG_IGN);

                sigset_t set;
                sigemptyset(&set);
                sigaddset(&set, SIGINT);
                sigaddset(&set, SIGTERM);
                int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
                if (rc != 0) {
                    throw std::runtime_error(std::string("pthread_sigmask: ") + std::strerror(rc));
                }

                // Lives for the rest of the process; never joined.
                std::thread([this, set]() {
                    int sig = 0;
                    while (sigwait(&set, &sig) != 0) {}
                    SB_LOG(Info) << "Received " << (sig == SIGINT ? "SIGINT" : "SIGTERM") << ", shutting down...";
                    shutdown_.trigger();
                }).detach();
            }

        private:
            ShutdownSignal& shutdown_;
    };

} // namespace sockbridge::relay
