#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace sockbridge::relay {

    // One-shot cancellation trigger. Components subscribe a callback; the first
    // trigger() runs every subscribed callback exactly once.
    class ShutdownSignal {
        public:
            using Callback = std::function<void()>;
            using SubscriptionId = size_t;

            ShutdownSignal() = default;
            ShutdownSignal(const ShutdownSignal&) = delete;
            ShutdownSignal& operator=(const ShutdownSignal&) = delete;

            void trigger() {
                std::vector<Callback> pending;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (triggered_.exchange(true, std::memory_order_acq_rel)) return;
                    for (auto& entry : callbacks_) pending.push_back(std::move(entry.second));
                    callbacks_.clear();
                }
                cv_.notify_all();
                for (auto& cb : pending) cb();
            }

            bool triggered() const {
                return triggered_.load(std::memory_order_acquire);
            }

            // Runs cb immediately when already triggered.
            SubscriptionId subscribe(Callback cb) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!triggered_.load(std::memory_order_acquire)) {
                        SubscriptionId id = next_id_++;
                        callbacks_.emplace(id, std::move(cb));
                        return id;
                    }
                }
                cb();
                return 0;
            }

            void unsubscribe(SubscriptionId id) {
                std::lock_guard<std::mutex> lock(mutex_);
                callbacks_.erase(id);
            }

            template <typename Rep, typename Period>
            bool wait_for(std::chrono::duration<Rep, Period> timeout) {
                std::unique_lock<std::mutex> lock(mutex_);
                return cv_.wait_for(lock, timeout, [this] { return triggered(); });
            }

        private:
            std::atomic<bool> triggered_{false};
            std::mutex mutex_;
            std::condition_variable cv_;
            std::map<SubscriptionId, Callback> callbacks_;
            SubscriptionId next_id_ = 1;
    };

} // namespace sockbridge::relay
