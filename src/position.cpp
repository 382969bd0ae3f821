/// @file position.cpp
/// Position descriptor construction and serialization.

#include <chessterm/position.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace chessterm {

namespace {

bool has_space(std::string_view sv) {
    return std::any_of(sv.begin(), sv.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

void check_moves(const std::vector<std::string>& moves) {
    for (const auto& m : moves) {
        if (m.empty() || has_space(m)) {
            throw std::invalid_argument("Invalid move token: '" + m + "'");
        }
    }
}

}  // namespace

Position::Position() = default;

Position::Position(std::optional<std::string> fen, std::vector<std::string> moves)
    : fen_(std::move(fen)), moves_(std::move(moves)) {
    check_moves(moves_);
}

// ── Factory ─────────────────────────────────────────────────────────────────

Position Position::initial(std::vector<std::string> moves) {
    return Position(std::nullopt, std::move(moves));
}

Position Position::from_fen(std::string_view fen, std::vector<std::string> moves) {
    auto first = fen.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        throw std::invalid_argument("Empty FEN");
    }
    auto last = fen.find_last_not_of(" \t\r\n");
    auto body = fen.substr(first, last - first + 1);
    // One command per line on the wire.
    if (body.find_first_of("\r\n") != std::string_view::npos) {
        throw std::invalid_argument("FEN contains a line break");
    }
    return Position(std::string(body), std::move(moves));
}

// ── Serialization ───────────────────────────────────────────────────────────

std::string Position::command() const {
    std::string cmd = "position ";
    if (fen_) {
        cmd += "fen ";
        cmd += *fen_;
    } else {
        cmd += "startpos";
    }
    if (!moves_.empty()) {
        cmd += " moves";
        for (const auto& m : moves_) {
            cmd += ' ';
            cmd += m;
        }
    }
    return cmd;
}

}  // namespace chessterm
