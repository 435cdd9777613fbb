#include "session/session_reaper.hpp"

#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace xcdelta::session {

SessionReaper::SessionReaper(std::chrono::milliseconds interval, Sweep sweep)
    : interval_(interval), sweep_(std::move(sweep)) {}

SessionReaper::~SessionReaper() {
    stop();
}

void SessionReaper::start() {
    if (worker_.joinable() || interval_.count() <= 0 || !sweep_) {
        return;
    }
    exit_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this] { loop(); });
}

void SessionReaper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        exit_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false, std::memory_order_release);
}

bool SessionReaper::is_running() const noexcept {
    return running_.load(std::memory_order_acquire);
}

std::size_t SessionReaper::sweep_now() {
    if (!sweep_) {
        return 0;
    }
    const std::size_t removed = sweep_();
    sweep_count_.fetch_add(1, std::memory_order_relaxed);
    if (removed > 0) {
        XCDELTA_LOG_DEBUG("SessionReaper: removed " + std::to_string(removed) +
                          " expired sessions");
    }
    return removed;
}

std::size_t SessionReaper::sweep_count() const noexcept {
    return sweep_count_.load(std::memory_order_relaxed);
}

void SessionReaper::loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this] {
                return exit_requested_.load(std::memory_order_acquire);
            });
            if (exit_requested_.load(std::memory_order_acquire)) {
                break;
            }
        }
        sweep_now();
    }
    running_.store(false, std::memory_order_release);
}

}  // namespace xcdelta::session
