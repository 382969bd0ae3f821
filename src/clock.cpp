/// @file clock.cpp
/// Game clock worker and budget arithmetic.

#include <chessterm/clock.hpp>

#include <chessterm/log.hpp>

#include <cstdio>
#include <stdexcept>

namespace chessterm {

std::string format_clock(double seconds) {
    const long total = seconds > 0.0 ? static_cast<long>(seconds) : 0L;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld", total / 60, total % 60);
    return buf;
}

// ── Construction ────────────────────────────────────────────────────────────

GameClock::GameClock(ClockOptions options) : options_(options) {
    configure(options_.minutes, options_.increment_seconds);
}

GameClock::~GameClock() {
    std::lock_guard control(control_mutex_);
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

// ── Configuration ───────────────────────────────────────────────────────────

void GameClock::configure(int minutes, int increment_seconds) {
    if (minutes < 0 || increment_seconds < 0) {
        throw std::invalid_argument("Time control must be non-negative: " +
                                    std::to_string(minutes) + " min + " +
                                    std::to_string(increment_seconds) + " s");
    }
    set_time_control({minutes * 60.0, static_cast<double>(increment_seconds)});
}

void GameClock::set_time_control(TimeControl tc) {
    if (tc.base_seconds < 0.0 || tc.increment_seconds < 0.0) {
        throw std::invalid_argument("Time control must be non-negative");
    }
    std::lock_guard lock(state_mutex_);
    remaining_ = {tc.base_seconds, tc.base_seconds};
    increment_ = tc.increment_seconds;
    flagged_.reset();
    // Time already elapsed belongs to the old budgets.
    last_tick_ = SteadyClock::now();
}

void GameClock::on_expiry(ExpiryCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_expiry_ = std::move(callback);
}

// ── Countdown ───────────────────────────────────────────────────────────────

std::optional<Side> GameClock::charge_locked(SteadyClock::time_point now) {
    if (!running_)
        return std::nullopt;
    const double elapsed = std::chrono::duration<double>(now - last_tick_).count();
    last_tick_ = now;

    double& budget = remaining_[side_index(active_)];
    budget -= elapsed;
    if (budget > 0.0)
        return std::nullopt;

    budget = 0.0;
    running_ = false;
    flagged_ = active_;
    return active_;
}

void GameClock::notify_expiry(Side loser) {
    log::logger()->info("{} flagged", side_name(loser));
    ExpiryCallback callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = on_expiry_;
    }
    if (callback)
        callback(loser);
}

void GameClock::run(std::stop_token stop) {
    std::unique_lock lock(state_mutex_);
    while (!stop.stop_requested() && running_) {
        // Sleeps one tick with the lock released; returns early on stop.
        wake_.wait_for(lock, stop, options_.tick, [] { return false; });
        if (stop.stop_requested())
            return;
        if (auto loser = charge_locked(SteadyClock::now())) {
            lock.unlock();
            notify_expiry(*loser);
            return;
        }
    }
}

void GameClock::start() {
    std::lock_guard control(control_mutex_);
    {
        std::lock_guard lock(state_mutex_);
        if (running_ || flagged_)
            return;
    }
    // A worker left over from an expiry or a switch that flagged has exited
    // or is about to; reap it before starting another.
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    {
        std::lock_guard lock(state_mutex_);
        running_ = true;
        last_tick_ = SteadyClock::now();
    }
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void GameClock::stop() {
    std::lock_guard control(control_mutex_);
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }

    std::optional<Side> loser;
    {
        std::lock_guard lock(state_mutex_);
        if (!running_)
            return;
        loser = charge_locked(SteadyClock::now());
        running_ = false;
    }
    if (loser)
        notify_expiry(*loser);
}

void GameClock::switch_side() {
    std::lock_guard control(control_mutex_);
    std::optional<Side> loser;
    {
        std::lock_guard lock(state_mutex_);
        if (flagged_)
            return;
        if (running_)
            loser = charge_locked(SteadyClock::now());
        if (!loser) {
            remaining_[side_index(active_)] += increment_;
            active_ = opposite(active_);
        }
    }
    if (loser)
        notify_expiry(*loser);
}

// ── Queries ─────────────────────────────────────────────────────────────────

std::pair<int, int> GameClock::times() const {
    std::lock_guard lock(state_mutex_);
    return {static_cast<int>(remaining_[side_index(Side::White)]),
            static_cast<int>(remaining_[side_index(Side::Black)])};
}

ClockSnapshot GameClock::snapshot() const {
    std::lock_guard lock(state_mutex_);
    ClockSnapshot snap;
    snap.white = remaining_[side_index(Side::White)];
    snap.black = remaining_[side_index(Side::Black)];
    snap.active = active_;
    snap.running = running_;
    snap.flagged = flagged_;
    return snap;
}

bool GameClock::running() const {
    std::lock_guard lock(state_mutex_);
    return running_;
}

Side GameClock::active() const {
    std::lock_guard lock(state_mutex_);
    return active_;
}

double GameClock::increment() const {
    std::lock_guard lock(state_mutex_);
    return increment_;
}

}  // namespace chessterm
