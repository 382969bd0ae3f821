#pragma once

/// @file log.hpp
/// Access to the library's spdlog logger.

#include <spdlog/spdlog.h>

#include <memory>

namespace chessterm::log {

/// The shared "chessterm" logger (stderr, colored). Created on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

}  // namespace chessterm::log
