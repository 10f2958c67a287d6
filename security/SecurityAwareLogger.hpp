#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include <openssl/evp.h>

namespace sockbridge::security {

    class CryptoHasher {
        public:
            static std::string sha256(const std::string &input) {
                unsigned char hash[EVP_MAX_MD_SIZE];
                unsigned int hash_len = 0;
                if (EVP_Digest(input.data(), input.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
                    return "unavailable";
                }
                std::ostringstream oss;
                for (unsigned int i = 0; i < hash_len; ++i) {
                    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
                }
                return oss.str();
            }
    };

    // Every line carries a sequence number and a SHA-256 over its metadata so
    // that gaps or edits in a captured log can be detected afterwards.
    class SecurityAwareLogger {
        public:
            enum class Level { Debug, Info, Warn, Error, Fatal };

            static SecurityAwareLogger &instance() {
                static SecurityAwareLogger inst;
                return inst;
            }

            void log(Level level, const std::string &message) {
                if (!enabled(level)) return;

                auto now = std::chrono::system_clock::now();
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
                auto tid = std::this_thread::get_id();
                uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed);

                std::ostringstream meta;
                meta << seq << '|' << ms << '|' << tid << '|' << static_cast<int>(level) << '|' << message;
                std::string hash = CryptoHasher::sha256(meta.str());

                std::lock_guard<std::mutex> lock(mutex_);
                *sink_ << '[' << level_to_string(level) << "] " << message
                       << " seq=" << seq << " hash=" << hash << '\n';
                sink_->flush();
            }

            bool enabled(Level level) const {
                return static_cast<int>(level) >= min_level_.load(std::memory_order_relaxed);
            }

            void set_min_level(Level level) {
                min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
            }

            Level min_level() const {
                return static_cast<Level>(min_level_.load(std::memory_order_relaxed));
            }

            void set_sink(std::ostream &sink) {
                std::lock_guard<std::mutex> lock(mutex_);
                sink_ = &sink;
            }

            void reset_sink() {
                set_sink(std::cerr);
            }

            static const char *level_to_string(Level level) {
                switch (level) {
                case Level::Debug:
                    return "DEBUG";
                case Level::Info:
                    return "INFO";
                case Level::Warn:
                    return "WARN";
                case Level::Error:
                    return "ERROR";
                case Level::Fatal:
                    return "FATAL";
                }
                return "INFO";
            }

        private:
            SecurityAwareLogger() = default;

            std::atomic<uint64_t> sequence_{0};
            std::atomic<int> min_level_{static_cast<int>(Level::Info)};
            std::ostream *sink_ = &std::cerr;
            std::mutex mutex_;
    };

    // Collects one streamed message and hands it to the logger when the
    // statement ends.
    class LogLine {
        public:
            explicit LogLine(SecurityAwareLogger::Level level) : level_(level) {}
            ~LogLine() { SecurityAwareLogger::instance().log(level_, stream_.str()); }

            LogLine(const LogLine &) = delete;
            LogLine &operator=(const LogLine &) = delete;

            template <typename T>
            LogLine &operator<<(const T &value) {
                stream_ << value;
                return *this;
            }

        private:
            SecurityAwareLogger::Level level_;
            std::ostringstream stream_;
    };

} // namespace sockbridge::security

#define SB_LOG(level)                                                                              \
    if (!::sockbridge::security::SecurityAwareLogger::instance().enabled(                          \
            ::sockbridge::security::SecurityAwareLogger::Level::level)) {                          \
    } else                                                                                         \
        ::sockbridge::security::LogLine(::sockbridge::security::SecurityAwareLogger::Level::level)
