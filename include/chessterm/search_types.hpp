#pragma once

/// @file search_types.hpp
/// Search request, progress notifications and the terminal result.

#include <chessterm/options.hpp>
#include <chessterm/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chessterm {

// ── Search request ──────────────────────────────────────────────────────────

struct SearchRequest {
    std::optional<int> depth = kDefaultSearchDepth;
    std::optional<std::int64_t> movetime_ms;  ///< Advisory to the engine.

    /// Throws std::invalid_argument if neither bound is set or one is not positive.
    void validate() const;
};

// ── Progress notification ───────────────────────────────────────────────────

/// One parsed `info ... depth ... score ... pv ...` line.
struct InfoLine {
    int depth = 0;
    ScoreKind score_kind = ScoreKind::Centipawns;
    int score = 0;
    std::vector<std::string> pv;
    std::string raw;
};

// ── Terminal result ─────────────────────────────────────────────────────────

struct BestMove {
    std::optional<std::string> move;  ///< nullopt = engine reported no legal move.
    std::optional<std::string> ponder;
};

struct SearchResult {
    std::vector<InfoLine> info;
    std::optional<std::string> best_move;
    std::optional<std::string> ponder;

    /// Deepest progress line observed, if any.
    [[nodiscard]] const InfoLine* last_info() const noexcept {
        return info.empty() ? nullptr : &info.back();
    }
};

}  // namespace chessterm
