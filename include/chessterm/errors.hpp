#pragma once

/// @file errors.hpp
/// Exception hierarchy for the engine session.
///
/// Every error carries the name of the operation that failed; `what()` reads
/// "<operation>: <detail>".

#include <stdexcept>
#include <string>
#include <string_view>

namespace chessterm {

class Error : public std::runtime_error {
   public:
    Error(std::string_view operation, const std::string& detail);

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }

   private:
    std::string operation_;
};

/// The engine executable could not be launched.
class ProcessSpawnError : public Error {
   public:
    using Error::Error;
};

/// The engine exited or a pipe broke. The session must be recreated.
class ChannelClosedError : public Error {
   public:
    using Error::Error;
};

/// `uciok` / `readyok` never observed during start-up.
class HandshakeError : public Error {
   public:
    using Error::Error;
};

/// A search was requested while another one is in flight.
class SessionBusyError : public Error {
   public:
    using Error::Error;
};

/// The local search watchdog fired. The driver is Ready again when thrown.
class SearchTimeoutError : public Error {
   public:
    using Error::Error;
};

/// A driver operation was called in a state that does not allow it.
class InvalidStateError : public Error {
   public:
    using Error::Error;
};

}  // namespace chessterm
