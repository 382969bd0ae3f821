/// @file errors.cpp

#include <chessterm/errors.hpp>

namespace chessterm {

Error::Error(std::string_view operation, const std::string& detail)
    : std::runtime_error(std::string(operation) + ": " + detail), operation_(operation) {}

}  // namespace chessterm
