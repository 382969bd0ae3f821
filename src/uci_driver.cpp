/// @file uci_driver.cpp
/// UCI handshake, position and search exchange.

#include <chessterm/uci_driver.hpp>

#include <chessterm/errors.hpp>
#include <chessterm/log.hpp>

#include <algorithm>
#include <charconv>
#include <utility>
#include <vector>

namespace chessterm {

namespace {

using TimePoint = std::chrono::steady_clock::time_point;

/// Split on spaces and tabs.
std::vector<std::string_view> split_tokens(std::string_view sv) {
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && (sv[i] == ' ' || sv[i] == '\t')) ++i;
        if (i >= sv.size()) break;
        std::size_t start = i;
        while (i < sv.size() && sv[i] != ' ' && sv[i] != '\t') ++i;
        parts.push_back(sv.substr(start, i - start));
    }
    return parts;
}

std::string_view trim(std::string_view sv) {
    const auto first = sv.find_first_not_of(" \t\r");
    if (first == std::string_view::npos)
        return {};
    const auto last = sv.find_last_not_of(" \t\r");
    return sv.substr(first, last - first + 1);
}

std::optional<int> parse_int(std::string_view sv) {
    int val = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
        return std::nullopt;
    return val;
}

/// Index of the first token equal to `key`, or tokens.size().
std::size_t find_token(const std::vector<std::string_view>& tokens, std::string_view key) {
    return static_cast<std::size_t>(std::find(tokens.begin(), tokens.end(), key) - tokens.begin());
}

/// Time left until `deadline`; nullopt means unbounded. Never negative.
std::optional<std::chrono::milliseconds> time_left(std::optional<TimePoint> deadline) {
    if (!deadline)
        return std::nullopt;
    auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline -
                                                             std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

std::optional<TimePoint> deadline_after(std::optional<std::chrono::milliseconds> bound) {
    if (!bound)
        return std::nullopt;
    return std::chrono::steady_clock::now() + *bound;
}

bool is_null_move(std::string_view tok) {
    return tok == "(none)" || tok == "0000";
}

}  // namespace

// ── Wire format ─────────────────────────────────────────────────────────────

std::optional<InfoLine> parse_info_line(std::string_view line) {
    const auto tokens = split_tokens(line);
    if (tokens.empty() || tokens[0] != "info")
        return std::nullopt;

    const std::size_t n = tokens.size();
    const std::size_t pv_at = find_token(tokens, "pv");
    const std::size_t depth_at = find_token(tokens, "depth");
    const std::size_t score_at = find_token(tokens, "score");
    if (pv_at == n || depth_at + 1 >= n || score_at + 2 >= n)
        return std::nullopt;

    InfoLine info;
    auto depth = parse_int(tokens[depth_at + 1]);
    if (!depth)
        return std::nullopt;
    info.depth = *depth;

    const auto kind = tokens[score_at + 1];
    if (kind == "cp") {
        info.score_kind = ScoreKind::Centipawns;
    } else if (kind == "mate") {
        info.score_kind = ScoreKind::Mate;
    } else {
        return std::nullopt;
    }
    auto score = parse_int(tokens[score_at + 2]);
    if (!score)
        return std::nullopt;
    info.score = *score;

    for (std::size_t i = pv_at + 1; i < n; ++i) {
        info.pv.emplace_back(tokens[i]);
    }
    info.raw = std::string(line);
    return info;
}

std::optional<BestMove> parse_bestmove(std::string_view line) {
    const auto tokens = split_tokens(line);
    if (tokens.empty() || tokens[0] != "bestmove")
        return std::nullopt;

    BestMove best;
    if (tokens.size() >= 2 && !is_null_move(tokens[1])) {
        best.move = std::string(tokens[1]);
    }
    if (tokens.size() >= 4 && tokens[2] == "ponder" && !is_null_move(tokens[3])) {
        best.ponder = std::string(tokens[3]);
    }
    return best;
}

std::string go_command(const SearchRequest& request) {
    std::string cmd = "go";
    if (request.depth) {
        cmd += " depth " + std::to_string(*request.depth);
    }
    if (request.movetime_ms) {
        cmd += " movetime " + std::to_string(*request.movetime_ms);
    }
    return cmd;
}

// ── Driver ──────────────────────────────────────────────────────────────────

UciDriver::UciDriver(Channel& channel, DriverOptions options)
    : channel_(channel), options_(options) {}

void UciDriver::send(std::string_view line) {
    log::logger()->debug(">> {}", line);
    channel_.write_line(line);
}

void UciDriver::require_state(DriverState expected, std::string_view operation) const {
    const DriverState s = state();
    if (s != expected) {
        throw InvalidStateError(operation, "driver is " + std::string(state_name(s)) +
                                               ", expected " + std::string(state_name(expected)));
    }
}

std::string UciDriver::last_position_command() const {
    std::lock_guard lock(position_mutex_);
    return last_position_;
}

bool UciDriver::wait_for(std::string_view marker, std::optional<TimePoint> deadline) {
    auto logger = log::logger();
    while (true) {
        const auto left = time_left(deadline);
        if (left && left->count() == 0)
            return false;
        auto line = channel_.read_line(left);
        if (!line)
            continue;
        logger->debug("<< {}", *line);
        const auto text = trim(*line);
        if (text == marker)
            return true;

        if (state() == DriverState::Handshaking) {
            const auto tokens = split_tokens(text);
            if (tokens.size() >= 3 && tokens[0] == "id") {
                const auto value =
                    text.substr(static_cast<std::size_t>(tokens[2].data() - text.data()));
                if (tokens[1] == "name") {
                    engine_id_.name = std::string(value);
                } else if (tokens[1] == "author") {
                    engine_id_.author = std::string(value);
                }
            }
        }
    }
}

std::optional<BestMove> UciDriver::collect(SearchResult& result,
                                           std::optional<TimePoint> deadline) {
    auto logger = log::logger();
    while (true) {
        const auto left = time_left(deadline);
        if (left && left->count() == 0)
            return std::nullopt;
        auto line = channel_.read_line(left);
        if (!line)
            continue;
        logger->debug("<< {}", *line);

        if (line->starts_with("bestmove")) {
            auto best = parse_bestmove(*line);
            return best ? std::move(*best) : BestMove{};
        }
        if (line->starts_with("info")) {
            if (auto info = parse_info_line(*line)) {
                result.info.push_back(std::move(*info));
            } else {
                logger->trace("ignoring info line: {}", *line);
            }
        }
    }
}

// ── Handshake ───────────────────────────────────────────────────────────────

void UciDriver::initialize() {
    DriverState expected = DriverState::Uninitialized;
    if (!state_.compare_exchange_strong(expected, DriverState::Handshaking)) {
        throw InvalidStateError("initialize", "driver is " + std::string(state_name(expected)));
    }

    const auto deadline = deadline_after(options_.handshake_timeout);
    try {
        send("uci");
        if (!wait_for("uciok", deadline)) {
            throw HandshakeError("initialize", "timed out waiting for uciok");
        }
        send("isready");
        if (!wait_for("readyok", deadline)) {
            throw HandshakeError("initialize", "timed out waiting for readyok");
        }
    } catch (const ChannelClosedError& e) {
        state_.store(DriverState::Closed);
        throw HandshakeError("initialize", std::string("engine closed the channel (") + e.what() +
                                               ")");
    } catch (const HandshakeError&) {
        state_.store(DriverState::Closed);
        throw;
    }

    expected = DriverState::Handshaking;
    state_.compare_exchange_strong(expected, DriverState::Ready);
    log::logger()->info("engine ready: {} by {}",
                        engine_id_.name.empty() ? "<unnamed>" : engine_id_.name,
                        engine_id_.author.empty() ? "<unknown>" : engine_id_.author);
}

// ── Position ────────────────────────────────────────────────────────────────

void UciDriver::set_position(const Position& position) {
    require_state(DriverState::Ready, "set_position");
    std::string cmd = position.command();
    send(cmd);
    std::lock_guard lock(position_mutex_);
    last_position_ = std::move(cmd);
}

// ── Search ──────────────────────────────────────────────────────────────────

SearchResult UciDriver::search(const SearchRequest& request) {
    request.validate();
    DriverState expected = DriverState::Ready;
    if (!state_.compare_exchange_strong(expected, DriverState::Searching)) {
        throw InvalidStateError("search", "driver is " + std::string(state_name(expected)) +
                                              ", expected ready");
    }

    const auto deadline = deadline_after(options_.search_timeout);
    SearchResult result;
    bool completed = false;
    try {
        // Re-sync first so stray output from an earlier search cannot leak in.
        send("isready");
        bool go_sent = false;
        if (wait_for("readyok", deadline)) {
            send(go_command(request));
            go_sent = true;
            if (auto best = collect(result, deadline)) {
                result.best_move = std::move(best->move);
                result.ponder = std::move(best->ponder);
                completed = true;
            }
        }
        if (!completed) {
            log::logger()->warn("search watchdog fired after {} ms, re-syncing engine",
                                options_.search_timeout->count());
            resync(go_sent);
        }
    } catch (const ChannelClosedError&) {
        state_.store(DriverState::Closed);
        throw;
    }

    expected = DriverState::Searching;
    state_.compare_exchange_strong(expected, DriverState::Ready);

    if (!completed) {
        throw SearchTimeoutError("search", "no bestmove within " +
                                               std::to_string(options_.search_timeout->count()) +
                                               " ms");
    }
    log::logger()->debug("bestmove {} after {} info lines", result.best_move.value_or("(none)"),
                         result.info.size());
    return result;
}

void UciDriver::resync(bool go_sent) {
    const auto deadline = deadline_after(options_.search_timeout);
    bool synced = true;
    if (go_sent) {
        send("stop");
        SearchResult discarded;
        synced = collect(discarded, deadline).has_value();
        if (synced)
            send("isready");
    }
    // Without a go the earlier isready is still outstanding.
    if (synced)
        synced = wait_for("readyok", deadline);
    if (!synced) {
        channel_.terminate(options_.terminate_grace);
        throw ChannelClosedError("search", "engine unresponsive after stop");
    }
}

// ── Shutdown ────────────────────────────────────────────────────────────────

void UciDriver::close() {
    if (state_.exchange(DriverState::Closed) == DriverState::Closed)
        return;
    try {
        send("quit");
    } catch (const ChannelClosedError& e) {
        log::logger()->debug("quit not delivered: {}", e.what());
    }
    channel_.terminate(options_.terminate_grace);
    log::logger()->info("engine session closed");
}

}  // namespace chessterm
