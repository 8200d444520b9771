#include "warmup_initializer.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

namespace phxgw {

WarmupInitializer::WarmupInitializer(ConnectionManager& manager,
                                     std::chrono::milliseconds grace_period)
    : manager_(manager), grace_period_(grace_period) {}

WarmupInitializer::~WarmupInitializer() {
    stop();
}

void WarmupInitializer::start() {
    if (running_.load()) return;
    if (thread_.joinable()) thread_.join();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    thread_ = std::thread(&WarmupInitializer::run, this);
    LOG_INF("[warmup] Started (grace period %lld ms)",
        static_cast<long long>(grace_period_.count()));
}

void WarmupInitializer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
}

void WarmupInitializer::run() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, grace_period_, [this] { return stop_requested_; })) {
            LOG_INF("[warmup] Stopped during grace period, connection not opened");
            running_.store(false);
            return;
        }
    }

    LOG_INF("[warmup] Grace period over, opening Phoenix connection");
    attempted_.store(true);
    Timer timer;
    try {
        manager_.open();
        succeeded_.store(true);
        LOG_INF("[warmup] Phoenix connection ready via %s transport (%lld ms)",
            transport_kind_str(manager_.active_transport()),
            static_cast<long long>(timer.elapsed_ms()));
    } catch (const std::exception& e) {
        LOG_WRN("[warmup] Phoenix connection not ready: %s "
                "(it will be opened on the first request)", e.what());
    }
    running_.store(false);
}

} // namespace phxgw
