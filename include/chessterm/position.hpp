#pragma once

/// @file position.hpp
/// Position descriptor sent to the engine: startpos or FEN, plus moves.
///
/// Move tokens are opaque; no legality checking happens here.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chessterm {

class Position {
   public:
    /// Standard starting position with no moves.
    Position();

    // ── Factory ─────────────────────────────────────────────────────────

    /// Starting position with `moves` applied on top.
    /// Throws std::invalid_argument on an empty or whitespace-bearing token.
    [[nodiscard]] static Position initial(std::vector<std::string> moves = {});

    /// Explicit board state. Throws std::invalid_argument on an empty FEN.
    [[nodiscard]] static Position from_fen(std::string_view fen,
                                           std::vector<std::string> moves = {});

    // ── Serialization ───────────────────────────────────────────────────

    /// `position startpos|fen <fen> [moves <tok> ...]`
    [[nodiscard]] std::string command() const;

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] bool is_initial() const noexcept { return !fen_.has_value(); }
    [[nodiscard]] const std::optional<std::string>& fen() const noexcept { return fen_; }
    [[nodiscard]] const std::vector<std::string>& moves() const noexcept { return moves_; }

    bool operator==(const Position&) const = default;

   private:
    Position(std::optional<std::string> fen, std::vector<std::string> moves);

    std::optional<std::string> fen_;
    std::vector<std::string> moves_;
};

}  // namespace chessterm
