#pragma once

/// @file clock.hpp
/// Two-sided countdown clock with increment and expiry.
///
/// While running, a clock-owned worker thread charges the active side every
/// tick. Budgets are kept in fractional seconds and never go below zero; the
/// side whose budget reaches zero flags, the clock stops itself and the
/// expiry callback runs on the worker thread.

#include <chessterm/options.hpp>
#include <chessterm/types.hpp>

#include <array>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

namespace chessterm {

struct TimeControl {
    double base_seconds = 600.0;
    double increment_seconds = 0.0;
};

/// Consistent view of the clock at one instant.
struct ClockSnapshot {
    double white = 0.0;
    double black = 0.0;
    Side active = Side::White;
    bool running = false;
    std::optional<Side> flagged;

    [[nodiscard]] double remaining(Side s) const noexcept {
        return s == Side::White ? white : black;
    }
};

/// `MM:SS`, truncated to whole seconds.
[[nodiscard]] std::string format_clock(double seconds);

class GameClock {
   public:
    using ExpiryCallback = std::function<void(Side loser)>;

    explicit GameClock(ClockOptions options = {});
    ~GameClock();

    GameClock(const GameClock&) = delete;
    GameClock& operator=(const GameClock&) = delete;

    /// Reset both budgets to minutes*60 and set the increment.
    /// Throws std::invalid_argument on negative input.
    void configure(int minutes, int increment_seconds);
    void set_time_control(TimeControl tc);

    /// Begin counting down the active side. No-op if running or flagged.
    void start();

    /// Halt the countdown, charging the time since the last tick.
    void stop();

    /// Credit the increment to the side that just moved and hand over the turn.
    void switch_side();

    /// Registered callback is invoked once per expiry, on the clock thread
    /// or on the thread whose stop()/switch_side() ran the budget out. It
    /// must not call start(), stop() or switch_side().
    void on_expiry(ExpiryCallback callback);

    /// Whole seconds remaining: (white, black).
    [[nodiscard]] std::pair<int, int> times() const;
    [[nodiscard]] ClockSnapshot snapshot() const;

    [[nodiscard]] bool running() const;
    [[nodiscard]] Side active() const;
    [[nodiscard]] double increment() const;

   private:
    using SteadyClock = std::chrono::steady_clock;

    void run(std::stop_token stop);

    /// Charge the active side for time since `last_tick_`. Returns the
    /// flagged side if the budget ran out. Caller holds state_mutex_.
    std::optional<Side> charge_locked(SteadyClock::time_point now);

    void notify_expiry(Side loser);

    ClockOptions options_;

    mutable std::mutex state_mutex_;
    std::array<double, 2> remaining_{};
    double increment_ = 0.0;
    Side active_ = Side::White;
    bool running_ = false;
    std::optional<Side> flagged_;
    SteadyClock::time_point last_tick_{};

    std::mutex control_mutex_;  ///< Serializes start/stop/switch.
    std::condition_variable_any wake_;
    std::jthread worker_;

    std::mutex callback_mutex_;
    ExpiryCallback on_expiry_;
};

}  // namespace chessterm
