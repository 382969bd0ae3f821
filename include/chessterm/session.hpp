#pragma once

/// @file session.hpp
/// Session façade: one engine channel, one UCI driver, one game clock.

#include <chessterm/channel.hpp>
#include <chessterm/clock.hpp>
#include <chessterm/options.hpp>
#include <chessterm/position.hpp>
#include <chessterm/search_types.hpp>
#include <chessterm/uci_driver.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chessterm {

class Session {
   public:
    /// Spawn the engine at options.engine_path and complete the handshake.
    /// Throws ProcessSpawnError or HandshakeError.
    [[nodiscard]] static std::unique_ptr<Session> create(const SessionOptions& options);

    /// Drive an already-connected channel. Performs the handshake.
    explicit Session(std::unique_ptr<Channel> channel, const SessionOptions& options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ── Engine ──────────────────────────────────────────────────────────

    /// Throws SessionBusyError while a search is in flight.
    void set_position(const Position& position);

    /// Starting position (or `fen` if given) with `moves` on top.
    void set_position(std::vector<std::string> moves,
                      const std::optional<std::string>& fen = std::nullopt);

    /// Blocking search. Throws SessionBusyError if another search is in
    /// flight; never waits for it.
    SearchResult best_move(const SearchRequest& request);

    /// Depth defaults to SessionOptions::default_depth. Returns nullopt when
    /// the engine has no legal move.
    std::optional<std::string> best_move(std::optional<int> depth,
                                         std::optional<std::int64_t> movetime_ms);

    /// Request with the session's default depth filled in when `depth` is absent.
    [[nodiscard]] SearchRequest request(std::optional<int> depth,
                                        std::optional<std::int64_t> movetime_ms) const;

    [[nodiscard]] const EngineId& engine_id() const noexcept { return driver_.engine_id(); }
    [[nodiscard]] const UciDriver& driver() const noexcept { return driver_; }

    // ── Clock ───────────────────────────────────────────────────────────

    void configure_clock(int minutes, int increment_seconds);
    void start_clock();
    void stop_clock();
    void switch_side();
    void on_time_expired(GameClock::ExpiryCallback callback);

    /// Whole seconds: (white, black).
    [[nodiscard]] std::pair<int, int> times() const;
    [[nodiscard]] ClockSnapshot clock_snapshot() const;

    // ── Lifetime ────────────────────────────────────────────────────────

    /// Stop the clock and close the engine. Safe while a search is running
    /// on another thread; that search fails with ChannelClosedError.
    void shutdown();

   private:
    SessionOptions options_;
    std::unique_ptr<Channel> channel_;
    UciDriver driver_;
    GameClock clock_;
    std::mutex search_mutex_;
};

}  // namespace chessterm
