#pragma once
// Background warm-up: waits out the grace period (the query server usually
// starts after the gateway), then calls ConnectionManager::open() once.
// Failures are logged and swallowed; the first request retries the open.
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "connection_manager.hpp"

namespace phxgw {

class WarmupInitializer {
public:
    WarmupInitializer(ConnectionManager& manager, std::chrono::milliseconds grace_period);
    ~WarmupInitializer();

    WarmupInitializer(const WarmupInitializer&) = delete;
    WarmupInitializer& operator=(const WarmupInitializer&) = delete;

    void start();

    // Interrupts the grace period; an open already in progress runs to completion
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] bool open_attempted() const { return attempted_.load(); }
    [[nodiscard]] bool succeeded() const { return succeeded_.load(); }

private:
    ConnectionManager& manager_;
    std::chrono::milliseconds grace_period_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> attempted_{false};
    std::atomic<bool> succeeded_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;

    void run();
};

} // namespace phxgw
