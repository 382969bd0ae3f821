/// @file search_types.cpp

#include <chessterm/search_types.hpp>

#include <stdexcept>
#include <string>

namespace chessterm {

void SearchRequest::validate() const {
    if (!depth && !movetime_ms) {
        throw std::invalid_argument("Search request needs a depth or a movetime");
    }
    if (depth && *depth <= 0) {
        throw std::invalid_argument("Search depth must be positive: " + std::to_string(*depth));
    }
    if (movetime_ms && *movetime_ms <= 0) {
        throw std::invalid_argument("Search movetime must be positive: " +
                                    std::to_string(*movetime_ms));
    }
}

}  // namespace chessterm
