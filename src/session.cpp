/// @file session.cpp
/// Session façade: ties the channel, driver and clock together.

#include <chessterm/session.hpp>

#include <chessterm/errors.hpp>
#include <chessterm/log.hpp>

#include <utility>

namespace chessterm {

namespace {

DriverOptions driver_options(const SessionOptions& options) {
    DriverOptions out;
    out.handshake_timeout = options.handshake_timeout;
    out.search_timeout = options.search_timeout;
    out.terminate_grace = options.terminate_grace;
    return out;
}

}  // namespace

std::unique_ptr<Session> Session::create(const SessionOptions& options) {
    auto channel = std::make_unique<ProcessChannel>();
    channel->start(options.engine_path, options.engine_args);
    return std::make_unique<Session>(std::move(channel), options);
}

Session::Session(std::unique_ptr<Channel> channel, const SessionOptions& options)
    : options_(options),
      channel_(std::move(channel)),
      driver_(*channel_, driver_options(options)),
      clock_(options.clock) {
    driver_.initialize();
}

Session::~Session() {
    shutdown();
}

// ── Engine ──────────────────────────────────────────────────────────────────

void Session::set_position(const Position& position) {
    std::unique_lock lock(search_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        throw SessionBusyError("set_position", "a search is in progress");
    }
    driver_.set_position(position);
}

void Session::set_position(std::vector<std::string> moves, const std::optional<std::string>& fen) {
    set_position(fen ? Position::from_fen(*fen, std::move(moves))
                     : Position::initial(std::move(moves)));
}

SearchResult Session::best_move(const SearchRequest& request) {
    std::unique_lock lock(search_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        throw SessionBusyError("best_move", "another search is in progress");
    }
    return driver_.search(request);
}

SearchRequest Session::request(std::optional<int> depth,
                               std::optional<std::int64_t> movetime_ms) const {
    SearchRequest req;
    req.depth = depth.value_or(options_.default_depth);
    req.movetime_ms = movetime_ms;
    return req;
}

std::optional<std::string> Session::best_move(std::optional<int> depth,
                                              std::optional<std::int64_t> movetime_ms) {
    return best_move(request(depth, movetime_ms)).best_move;
}

// ── Clock ───────────────────────────────────────────────────────────────────

void Session::configure_clock(int minutes, int increment_seconds) {
    clock_.configure(minutes, increment_seconds);
}

void Session::start_clock() {
    clock_.start();
}

void Session::stop_clock() {
    clock_.stop();
}

void Session::switch_side() {
    clock_.switch_side();
}

void Session::on_time_expired(GameClock::ExpiryCallback callback) {
    clock_.on_expiry(std::move(callback));
}

std::pair<int, int> Session::times() const {
    return clock_.times();
}

ClockSnapshot Session::clock_snapshot() const {
    return clock_.snapshot();
}

// ── Lifetime ────────────────────────────────────────────────────────────────

void Session::shutdown() {
    clock_.stop();
    driver_.close();
}

}  // namespace chessterm
