/// @file test_clock.cpp
/// Tests for the two-sided game clock.

#include <chessterm/clock.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <utility>

namespace chessterm {
namespace {

using namespace std::chrono_literals;

constexpr double kTolerance = 0.2;

ClockOptions fast_ticks() {
    ClockOptions options;
    options.tick = 10ms;
    return options;
}

// ── Configuration ───────────────────────────────────────────────────────────

TEST(GameClockTest, DefaultsToTenMinutesWhiteToMove) {
    GameClock clock;
    EXPECT_EQ(clock.times(), std::make_pair(600, 600));
    EXPECT_EQ(clock.active(), Side::White);
    EXPECT_FALSE(clock.running());
}

TEST(GameClockTest, ConfigureSetsBothBudgets) {
    GameClock clock;
    for (int minutes : {0, 1, 3, 5, 15, 90}) {
        for (int inc : {0, 2, 30}) {
            clock.configure(minutes, inc);
            EXPECT_EQ(clock.times(), std::make_pair(minutes * 60, minutes * 60));
            EXPECT_DOUBLE_EQ(clock.increment(), inc);
        }
    }
}

TEST(GameClockTest, ConfigureRejectsNegativeValues) {
    GameClock clock;
    EXPECT_THROW(clock.configure(-1, 0), std::invalid_argument);
    EXPECT_THROW(clock.configure(5, -2), std::invalid_argument);
    EXPECT_EQ(clock.times(), std::make_pair(600, 600));
}

TEST(GameClockTest, ConfigureKeepsRunningFlag) {
    GameClock clock(fast_ticks());
    clock.start();
    clock.configure(3, 0);
    EXPECT_TRUE(clock.running());
    clock.stop();
    EXPECT_FALSE(clock.running());
    clock.configure(4, 0);
    EXPECT_FALSE(clock.running());
}

// ── Countdown ───────────────────────────────────────────────────────────────

TEST(GameClockTest, StopChargesElapsedTimeToActiveSide) {
    GameClock clock;
    clock.configure(1, 0);
    clock.start();
    std::this_thread::sleep_for(550ms);
    clock.stop();

    auto snap = clock.snapshot();
    EXPECT_FALSE(snap.running);
    EXPECT_NEAR(snap.white, 60.0 - 0.55, kTolerance);
    EXPECT_DOUBLE_EQ(snap.black, 60.0);
}

TEST(GameClockTest, StoppedClockDoesNotMove) {
    GameClock clock(fast_ticks());
    clock.configure(1, 0);
    clock.start();
    std::this_thread::sleep_for(100ms);
    clock.stop();
    const auto before = clock.snapshot();
    std::this_thread::sleep_for(200ms);
    const auto after = clock.snapshot();
    EXPECT_DOUBLE_EQ(before.white, after.white);
    EXPECT_DOUBLE_EQ(before.black, after.black);
}

TEST(GameClockTest, StartIsIdempotent) {
    GameClock clock(fast_ticks());
    clock.configure(1, 0);
    clock.start();
    clock.start();
    std::this_thread::sleep_for(300ms);
    clock.stop();
    // A second worker would double the charge.
    EXPECT_NEAR(clock.snapshot().white, 60.0 - 0.3, kTolerance);
}

TEST(GameClockTest, StopWithoutStartIsNoop) {
    GameClock clock;
    clock.stop();
    EXPECT_EQ(clock.times(), std::make_pair(600, 600));
}

TEST(GameClockTest, ResumeAfterStop) {
    GameClock clock(fast_ticks());
    clock.configure(1, 0);
    clock.start();
    std::this_thread::sleep_for(200ms);
    clock.stop();
    std::this_thread::sleep_for(200ms);
    clock.start();
    std::this_thread::sleep_for(200ms);
    clock.stop();
    EXPECT_NEAR(clock.snapshot().white, 60.0 - 0.4, kTolerance);
}

// ── Switching ───────────────────────────────────────────────────────────────

TEST(GameClockTest, SwitchWhileStoppedAddsIncrementToMover) {
    GameClock clock;
    clock.configure(5, 2);
    clock.switch_side();
    auto snap = clock.snapshot();
    EXPECT_EQ(snap.active, Side::Black);
    EXPECT_DOUBLE_EQ(snap.white, 302.0);
    EXPECT_DOUBLE_EQ(snap.black, 300.0);
    EXPECT_FALSE(snap.running);

    clock.switch_side();
    snap = clock.snapshot();
    EXPECT_EQ(snap.active, Side::White);
    EXPECT_DOUBLE_EQ(snap.white, 302.0);
    EXPECT_DOUBLE_EQ(snap.black, 302.0);
}

TEST(GameClockTest, SwitchWhileRunningChargesThenIncrements) {
    GameClock clock(fast_ticks());
    clock.configure(1, 3);
    clock.start();
    std::this_thread::sleep_for(500ms);
    clock.switch_side();
    auto snap = clock.snapshot();
    EXPECT_EQ(snap.active, Side::Black);
    EXPECT_NEAR(snap.white, 60.0 - 0.5 + 3.0, kTolerance);
    EXPECT_NEAR(snap.black, 60.0, kTolerance);

    std::this_thread::sleep_for(300ms);
    clock.stop();
    snap = clock.snapshot();
    EXPECT_NEAR(snap.white, 62.5, kTolerance);
    EXPECT_NEAR(snap.black, 60.0 - 0.3, kTolerance);
}

TEST(GameClockTest, OnlyActiveSideRunsDown) {
    GameClock clock(fast_ticks());
    clock.configure(1, 0);
    clock.switch_side();
    clock.start();
    std::this_thread::sleep_for(300ms);
    const auto snap = clock.snapshot();
    EXPECT_DOUBLE_EQ(snap.white, 60.0);
    EXPECT_LT(snap.black, 60.0);
    clock.stop();
}

// ── Expiry ──────────────────────────────────────────────────────────────────

TEST(GameClockTest, ExpiryStopsClampsAndNotifies) {
    std::promise<Side> flagged;
    std::atomic<int> calls{0};
    GameClock clock(fast_ticks());
    clock.set_time_control({0.3, 0.0});
    clock.on_expiry([&](Side loser) {
        if (calls.fetch_add(1) == 0)
            flagged.set_value(loser);
    });

    auto future = flagged.get_future();
    clock.start();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get(), Side::White);

    auto snap = clock.snapshot();
    EXPECT_FALSE(snap.running);
    EXPECT_DOUBLE_EQ(snap.white, 0.0);
    EXPECT_DOUBLE_EQ(snap.black, 0.3);
    ASSERT_TRUE(snap.flagged.has_value());
    EXPECT_EQ(*snap.flagged, Side::White);

    std::this_thread::sleep_for(100ms);
    EXPECT_DOUBLE_EQ(clock.snapshot().white, 0.0);
    EXPECT_EQ(calls.load(), 1);
}

TEST(GameClockTest, StopAfterExpiryReapsWorker) {
    std::promise<void> done;
    GameClock clock(fast_ticks());
    clock.set_time_control({0.05, 0.0});
    clock.on_expiry([&](Side) { done.set_value(); });
    clock.start();
    ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);

    const auto begin = std::chrono::steady_clock::now();
    clock.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 500ms);
    EXPECT_FALSE(clock.running());
    EXPECT_DOUBLE_EQ(clock.snapshot().white, 0.0);
}

TEST(GameClockTest, FlaggedClockIgnoresStartAndSwitch) {
    std::promise<void> done;
    GameClock clock(fast_ticks());
    clock.set_time_control({0.05, 5.0});
    clock.on_expiry([&](Side) { done.set_value(); });
    clock.start();
    ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);

    clock.start();
    EXPECT_FALSE(clock.running());
    clock.switch_side();
    EXPECT_EQ(clock.active(), Side::White);
    EXPECT_DOUBLE_EQ(clock.snapshot().white, 0.0);
}

TEST(GameClockTest, ConfigureClearsFlag) {
    std::promise<void> done;
    GameClock clock(fast_ticks());
    clock.set_time_control({0.05, 0.0});
    clock.on_expiry([&](Side) { done.set_value(); });
    clock.start();
    ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);

    clock.on_expiry(nullptr);
    clock.configure(1, 0);
    EXPECT_FALSE(clock.snapshot().flagged.has_value());
    clock.start();
    EXPECT_TRUE(clock.running());
    clock.stop();
    EXPECT_NEAR(clock.snapshot().white, 60.0, kTolerance);
}

TEST(GameClockTest, SwitchThatExhaustsBudgetFlags) {
    std::atomic<int> calls{0};
    GameClock clock;  // 100 ms ticks, so the switch sees the overrun first
    clock.set_time_control({0.05, 10.0});
    clock.on_expiry([&](Side) { calls.fetch_add(1); });
    clock.start();
    std::this_thread::sleep_for(80ms);
    clock.switch_side();

    auto snap = clock.snapshot();
    EXPECT_FALSE(snap.running);
    EXPECT_EQ(snap.active, Side::White);
    EXPECT_DOUBLE_EQ(snap.white, 0.0);
    ASSERT_TRUE(snap.flagged.has_value());
    EXPECT_EQ(calls.load(), 1);
}

TEST(GameClockTest, DestroyWhileRunning) {
    auto clock = std::make_unique<GameClock>(fast_ticks());
    clock->start();
    std::this_thread::sleep_for(30ms);
    clock.reset();
    SUCCEED();
}

// ── format_clock ────────────────────────────────────────────────────────────

TEST(FormatClockTest, MinutesAndSeconds) {
    EXPECT_EQ(format_clock(300.0), "05:00");
    EXPECT_EQ(format_clock(299.9), "04:59");
    EXPECT_EQ(format_clock(59.99), "00:59");
    EXPECT_EQ(format_clock(3725.0), "62:05");
    EXPECT_EQ(format_clock(0.0), "00:00");
    EXPECT_EQ(format_clock(-4.0), "00:00");
}

}  // namespace
}  // namespace chessterm
