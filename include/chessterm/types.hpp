#pragma once

/// @file types.hpp
/// Core enumerations shared by the driver and the clock.

#include <cstdint>
#include <string_view>

namespace chessterm {

// ── Side ────────────────────────────────────────────────────────────────────
enum class Side : std::uint8_t { White = 0, Black = 1 };

[[nodiscard]] constexpr Side opposite(Side s) noexcept {
    return static_cast<Side>(static_cast<int>(s) ^ 1);
}
[[nodiscard]] constexpr int side_index(Side s) noexcept {
    return static_cast<int>(s);
}

[[nodiscard]] constexpr std::string_view side_name(Side s) noexcept {
    return s == Side::White ? "White" : "Black";
}

// ── Driver state ────────────────────────────────────────────────────────────
enum class DriverState : std::uint8_t {
    Uninitialized = 0,
    Handshaking = 1,
    Ready = 2,
    Searching = 3,
    Closed = 4,
};

[[nodiscard]] constexpr std::string_view state_name(DriverState s) noexcept {
    switch (s) {
        case DriverState::Uninitialized:
            return "uninitialized";
        case DriverState::Handshaking:
            return "handshaking";
        case DriverState::Ready:
            return "ready";
        case DriverState::Searching:
            return "searching";
        case DriverState::Closed:
            return "closed";
    }
    return "unknown";
}

// ── ScoreKind ───────────────────────────────────────────────────────────────
enum class ScoreKind : std::uint8_t {
    Centipawns = 0,  ///< `score cp <v>`
    Mate = 1,        ///< `score mate <moves>`
};

}  // namespace chessterm
