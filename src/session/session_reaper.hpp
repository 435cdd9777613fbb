#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace xcdelta::session {

// Periodically invokes a sweep callback on a background thread.
class SessionReaper {
public:
    using Sweep = std::function<std::size_t()>;

    SessionReaper(std::chrono::milliseconds interval, Sweep sweep);
    SessionReaper(const SessionReaper&) = delete;
    SessionReaper& operator=(const SessionReaper&) = delete;
    ~SessionReaper();

    void start();
    void stop();
    bool is_running() const noexcept;

    // Runs one sweep on the calling thread.
    std::size_t sweep_now();

    std::size_t sweep_count() const noexcept;

private:
    void loop();

    const std::chrono::milliseconds interval_;
    Sweep sweep_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> exit_requested_{false};
    std::atomic<std::size_t> sweep_count_{0};
};

}  // namespace xcdelta::session
