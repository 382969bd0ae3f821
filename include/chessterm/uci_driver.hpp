#pragma once

/// @file uci_driver.hpp
/// UCI protocol driver: handshake, position, search, shutdown.
///
/// State machine over a Channel's lines:
///   Uninitialized -> Handshaking -> Ready <-> Searching -> Closed
///
/// The driver does no locking of its own around search(); the Session makes
/// sure only one thread drives it at a time. close() may be called from any
/// thread.

#include <chessterm/channel.hpp>
#include <chessterm/position.hpp>
#include <chessterm/search_types.hpp>
#include <chessterm/types.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace chessterm {

// ── Wire format ─────────────────────────────────────────────────────────────

/// Parse a progress line. nullopt if it is not an `info ... pv` line or if
/// any of depth / score / pv is missing or malformed.
[[nodiscard]] std::optional<InfoLine> parse_info_line(std::string_view line);

/// Parse `bestmove <tok>|(none) [ponder <tok>]`. nullopt if the line is not a
/// bestmove line.
[[nodiscard]] std::optional<BestMove> parse_bestmove(std::string_view line);

/// `go [depth <n>] [movetime <ms>]`
[[nodiscard]] std::string go_command(const SearchRequest& request);

// ── Driver ──────────────────────────────────────────────────────────────────

struct EngineId {
    std::string name;
    std::string author;
};

struct DriverOptions {
    std::optional<std::chrono::milliseconds> handshake_timeout;
    std::optional<std::chrono::milliseconds> search_timeout;
    std::chrono::milliseconds terminate_grace{500};
};

class UciDriver {
   public:
    /// `channel` must outlive the driver.
    explicit UciDriver(Channel& channel, DriverOptions options = {});

    UciDriver(const UciDriver&) = delete;
    UciDriver& operator=(const UciDriver&) = delete;

    /// uci/uciok then isready/readyok. Throws HandshakeError.
    void initialize();

    /// Send a position command. No response is awaited.
    void set_position(const Position& position);

    /// Blocking search. See SearchTimeoutError for the watchdog path.
    SearchResult search(const SearchRequest& request);

    /// Send quit and terminate the channel. Idempotent, thread-safe.
    void close();

    [[nodiscard]] DriverState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] const EngineId& engine_id() const noexcept { return engine_id_; }

    /// The last position command sent, empty before the first.
    [[nodiscard]] std::string last_position_command() const;

   private:
    void send(std::string_view line);

    /// Read until a line equal to `marker`. nullopt deadline = no bound.
    /// Returns false if the deadline passed first.
    [[nodiscard]] bool wait_for(std::string_view marker,
                                std::optional<std::chrono::steady_clock::time_point> deadline);

    /// Read until bestmove, collecting progress lines. Returns nullopt if the
    /// deadline passed first.
    [[nodiscard]] std::optional<BestMove> collect(
        SearchResult& result, std::optional<std::chrono::steady_clock::time_point> deadline);

    /// After a watchdog timeout: stop, drain to bestmove, isready/readyok.
    /// Throws ChannelClosedError (and terminates the channel) if the engine
    /// stays silent.
    void resync(bool go_sent);

    void require_state(DriverState expected, std::string_view operation) const;

    Channel& channel_;
    DriverOptions options_;
    std::atomic<DriverState> state_{DriverState::Uninitialized};
    EngineId engine_id_;

    mutable std::mutex position_mutex_;
    std::string last_position_;
};

}  // namespace chessterm
