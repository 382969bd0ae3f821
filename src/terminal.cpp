/// @file terminal.cpp
/// Command dispatch for the interactive front end.

#include <chessterm/terminal.hpp>

#include <chessterm/clock.hpp>

#include <charconv>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace chessterm {

namespace {

std::vector<std::string> tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    std::istringstream iss{std::string(line)};
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

std::string lowercase(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

template <typename T>
T parse_number(const std::string& s) {
    T val{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), val);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        throw std::invalid_argument("not a number: '" + s + "'");
    }
    return val;
}

std::string join(const std::vector<std::string>& tokens, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < tokens.size(); ++i) {
        if (!out.empty())
            out += ' ';
        out += tokens[i];
    }
    return out;
}

constexpr const char* kHelpText =
    "\nAvailable commands:\n"
    "--------------------------------------------------\n"
    "help                           - Show this help message\n"
    "set position [moves]           - Start position plus moves (e.g. 'set position e2e4 e7e5')\n"
    "set fen <fen>                  - Set position from a FEN string\n"
    "set time <minutes> [increment] - Time control (e.g. 'set time 5 2')\n"
    "best [depth]                   - Best move at depth (default 15)\n"
    "go [movetime_ms]               - Best move with a time limit in milliseconds\n"
    "start                          - Start the clock\n"
    "stop                           - Stop the clock\n"
    "switch                         - Switch the active side and apply the increment\n"
    "times                          - Show remaining times\n"
    "quit                           - Exit\n"
    "--------------------------------------------------";

}  // namespace

Terminal::Terminal(Session& session, std::ostream& out) : session_(session), out_(out) {
    session_.on_time_expired([this](Side loser) {
        print("\n" + std::string(side_name(loser)) + "'s time has expired! " +
              std::string(side_name(opposite(loser))) + " wins on time.");
    });
}

Terminal::~Terminal() {
    // Joins the clock thread, so a notice already being printed finishes first.
    session_.stop_clock();
    session_.on_time_expired(nullptr);
}

void Terminal::print(const std::string& text) {
    std::lock_guard lock(out_mutex_);
    out_ << text << '\n';
    out_.flush();
}

void Terminal::print_help() {
    print(kHelpText);
}

void Terminal::print_times() {
    const auto snap = session_.clock_snapshot();
    print("White: " + format_clock(snap.white) + " | Black: " + format_clock(snap.black));
}

void Terminal::run(std::istream& in) {
    std::string line;
    while (true) {
        {
            std::lock_guard lock(out_mutex_);
            out_ << "\n> ";
            out_.flush();
        }
        if (!std::getline(in, line))
            break;
        if (!process_command(line))
            break;
    }
}

bool Terminal::process_command(std::string_view line) {
    const auto tokens = tokenize(line);
    if (tokens.empty())
        return true;

    const std::string cmd = lowercase(tokens[0]);
    try {
        if (cmd == "quit" || cmd == "exit") {
            return false;
        } else if (cmd == "help") {
            print_help();
        } else if (cmd == "set") {
            handle_set(tokens);
        } else if (cmd == "best") {
            std::optional<int> depth;
            if (tokens.size() > 1)
                depth = parse_number<int>(tokens[1]);
            handle_search(depth, std::nullopt);
        } else if (cmd == "go") {
            std::optional<std::int64_t> movetime;
            if (tokens.size() > 1)
                movetime = parse_number<std::int64_t>(tokens[1]);
            handle_search(std::nullopt, movetime);
        } else if (cmd == "start") {
            session_.start_clock();
            print("Timer started. " + std::string(side_name(session_.clock_snapshot().active)) +
                  "'s move.");
        } else if (cmd == "stop") {
            session_.stop_clock();
            print("Timer stopped.");
        } else if (cmd == "switch") {
            session_.switch_side();
            print("Now " + std::string(side_name(session_.clock_snapshot().active)) + "'s turn.");
            print_times();
        } else if (cmd == "times") {
            print_times();
        } else {
            print("Unknown command: '" + tokens[0] + "'. Type 'help' for available commands.");
        }
    } catch (const std::exception& e) {
        print(std::string("Error: ") + e.what());
    }
    return true;
}

void Terminal::handle_set(const std::vector<std::string>& tokens) {
    if (tokens.size() < 2) {
        print("Error: Invalid set command. Try 'set position', 'set fen', or 'set time'.");
        return;
    }
    const std::string what = lowercase(tokens[1]);
    if (what == "position") {
        std::vector<std::string> moves(tokens.begin() + 2, tokens.end());
        const Position pos = Position::initial(std::move(moves));
        session_.set_position(pos);
        print("Position set: " + pos.command());
    } else if (what == "fen") {
        if (tokens.size() < 3) {
            print("Error: FEN string required.");
            return;
        }
        const Position pos = Position::from_fen(join(tokens, 2));
        session_.set_position(pos);
        print("Position set: " + pos.command());
    } else if (what == "time") {
        if (tokens.size() < 3) {
            print("Error: Time in minutes required.");
            return;
        }
        int minutes = 0;
        int increment = 0;
        try {
            minutes = parse_number<int>(tokens[2]);
            if (tokens.size() > 3)
                increment = parse_number<int>(tokens[3]);
        } catch (const std::invalid_argument&) {
            print("Error: Invalid time values.");
            return;
        }
        session_.configure_clock(minutes, increment);
        print("Time control set to " + std::to_string(minutes) + " minutes with " +
              std::to_string(increment) + " second increment.");
        print_times();
    } else {
        print("Error: Unknown set command '" + tokens[1] + "'.");
    }
}

void Terminal::handle_search(std::optional<int> depth, std::optional<std::int64_t> movetime_ms) {
    const SearchResult result = session_.best_move(session_.request(depth, movetime_ms));
    for (const auto& info : result.info) {
        std::string line = "Depth " + std::to_string(info.depth) + " | Score " +
                           (info.score_kind == ScoreKind::Mate ? "mate " : "cp ") +
                           std::to_string(info.score) + " | Line:";
        for (const auto& m : info.pv) {
            line += ' ';
            line += m;
        }
        print(line);
    }
    print("Best move: " + result.best_move.value_or("(none)"));
}

}  // namespace chessterm
