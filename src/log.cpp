/// @file log.cpp
/// spdlog logger setup.

#include <chessterm/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace chessterm::log {

namespace {

constexpr const char* kLoggerName = "chessterm";

std::once_flag g_logger_init_flag;

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(g_logger_init_flag, [] {
        if (spdlog::get(kLoggerName) == nullptr) {
            auto created = spdlog::stderr_color_mt(kLoggerName);
            created->set_level(spdlog::level::warn);
            created->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        }
    });
    return spdlog::get(kLoggerName);
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace chessterm::log
