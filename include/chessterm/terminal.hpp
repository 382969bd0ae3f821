#pragma once

/// @file terminal.hpp
/// Line-command front end over a Session (the `chessterm` executable's loop).

#include <chessterm/session.hpp>

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chessterm {

class Terminal {
   public:
    /// Registers a time-expired notice on `session`. Both must outlive the terminal.
    Terminal(Session& session, std::ostream& out);
    /// Stops the clock so no expiry notice outlives the terminal.
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    /// Read commands from `in` until quit or end of input.
    void run(std::istream& in);

    /// Execute one command line. Returns false on quit/exit.
    bool process_command(std::string_view line);

    void print_help();

   private:
    void handle_set(const std::vector<std::string>& tokens);
    void handle_search(std::optional<int> depth, std::optional<std::int64_t> movetime_ms);
    void print_times();
    void print(const std::string& text);

    Session& session_;
    std::ostream& out_;
    std::mutex out_mutex_;  ///< The clock thread prints expiry notices.
};

}  // namespace chessterm
