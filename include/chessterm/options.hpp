#pragma once

/// @file options.hpp
/// Configuration for a session and its clock.

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace chessterm {

inline constexpr int kDefaultSearchDepth = 15;

struct ClockOptions {
    int minutes = 10;
    int increment_seconds = 0;
    std::chrono::milliseconds tick{100};
};

struct SessionOptions {
    std::string engine_path = "stockfish";
    std::vector<std::string> engine_args;

    /// Bound on the uci/isready start-up exchange. nullopt = wait forever.
    std::optional<std::chrono::milliseconds> handshake_timeout;

    /// Local watchdog for a single search. nullopt = no watchdog.
    std::optional<std::chrono::milliseconds> search_timeout;

    /// How long the engine gets to exit on its own after `quit`.
    std::chrono::milliseconds terminate_grace{500};

    int default_depth = kDefaultSearchDepth;
    ClockOptions clock;
};

}  // namespace chessterm
