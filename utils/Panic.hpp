#pragma once

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "security/SecurityAwareLogger.hpp"

namespace sockbridge::utils {
    inline std::string panic_message(const std::string& msg, const char* file, int line) {
        std::ostringstream oss;
        oss << msg << " at " << file << ':' << line;
        return oss.str();
    }
} // namespace sockbridge::utils

// Fatal startup conditions only. Per-connection failures are logged and
// contained by the relay instead.
#if defined(PANIC_THROWS_IN_TESTS)
#define PANIC(msg) do {                                                                         \
    std::string __panic_msg = ::sockbridge::utils::panic_message((msg), __FILE__, __LINE__);    \
    SB_LOG(Fatal) << __panic_msg;                                                               \
    throw std::runtime_error(std::string("PANIC: ") + (msg));                                   \
} while (0)
#else
#define PANIC(msg) do {                                                                         \
    std::string __panic_msg = ::sockbridge::utils::panic_message((msg), __FILE__, __LINE__);    \
    SB_LOG(Fatal) << __panic_msg;                                                               \
    std::cerr << std::flush;                                                                    \
    std::exit(EXIT_FAILURE);                                                                    \
} while (0)
#endif
