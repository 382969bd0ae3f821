/// @file main.cpp
/// `chessterm [engine-path] [--depth N] [--handshake-timeout MS]
///            [--search-timeout MS] [--verbose]`

#include <chessterm/errors.hpp>
#include <chessterm/log.hpp>
#include <chessterm/session.hpp>
#include <chessterm/terminal.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [engine-path] [--depth N] [--handshake-timeout MS] [--search-timeout MS]"
                 " [--verbose]\n";
}

chessterm::SessionOptions parse_args(int argc, char** argv) {
    chessterm::SessionOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + std::string(arg));
            return argv[++i];
        };
        if (arg == "--depth") {
            options.default_depth = std::stoi(next());
        } else if (arg == "--handshake-timeout") {
            options.handshake_timeout = std::chrono::milliseconds(std::stoll(next()));
        } else if (arg == "--search-timeout") {
            options.search_timeout = std::chrono::milliseconds(std::stoll(next()));
        } else if (arg == "--verbose" || arg == "-v") {
            chessterm::log::set_level(spdlog::level::debug);
        } else if (arg.starts_with("-")) {
            throw std::invalid_argument("unknown option " + std::string(arg));
        } else {
            options.engine_path = std::string(arg);
        }
    }
    return options;
}

}  // namespace

int main(int argc, char** argv) {
    chessterm::SessionOptions options;
    try {
        options = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        usage(argv[0]);
        return 2;
    }

    std::unique_ptr<chessterm::Session> session;
    try {
        session = chessterm::Session::create(options);
    } catch (const chessterm::Error& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }

    std::cout << "Engine: "
              << (session->engine_id().name.empty() ? options.engine_path
                                                    : session->engine_id().name)
              << "\nType 'help' for available commands\n";

    {
        chessterm::Terminal terminal(*session, std::cout);
        terminal.run(std::cin);
    }

    session->shutdown();
    std::cout << "Goodbye!\n";
    return 0;
}
