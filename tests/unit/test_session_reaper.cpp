#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <gtest/gtest.h>
#include "session/session_reaper.hpp"

namespace {

using xcdelta::session::SessionReaper;

bool wait_until(const std::function<bool()>& predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return false;
}

TEST(SessionReaperTest, SweepsPeriodicallyUntilStopped) {
    std::atomic<int> sweeps{0};
    SessionReaper reaper(std::chrono::milliseconds(5), [&sweeps]() {
        sweeps.fetch_add(1);
        return std::size_t{0};
    });
    reaper.start();
    EXPECT_TRUE(reaper.is_running());
    EXPECT_TRUE(wait_until([&sweeps]() { return sweeps.load() >= 3; }));

    reaper.stop();
    EXPECT_FALSE(reaper.is_running());
    const int after_stop = sweeps.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(sweeps.load(), after_stop);
}

TEST(SessionReaperTest, StopDoesNotWaitOutTheInterval) {
    SessionReaper reaper(std::chrono::hours(1), []() { return std::size_t{0}; });
    reaper.start();

    const auto started = std::chrono::steady_clock::now();
    reaper.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_EQ(reaper.sweep_count(), 0u);
}

TEST(SessionReaperTest, ZeroIntervalNeverStartsThread) {
    std::atomic<int> sweeps{0};
    SessionReaper reaper(std::chrono::milliseconds(0), [&sweeps]() {
        sweeps.fetch_add(1);
        return std::size_t{0};
    });
    reaper.start();
    EXPECT_FALSE(reaper.is_running());

    EXPECT_EQ(reaper.sweep_now(), 0u);
    EXPECT_EQ(sweeps.load(), 1);
    EXPECT_EQ(reaper.sweep_count(), 1u);
}

TEST(SessionReaperTest, SweepNowReturnsRemovedCount) {
    SessionReaper reaper(std::chrono::milliseconds(0), []() { return std::size_t{3}; });
    EXPECT_EQ(reaper.sweep_now(), 3u);
}

}  // namespace
