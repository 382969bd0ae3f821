/// @file pybind_module.cpp
/// pybind11 bindings for the engine session.
///
/// Exposes the `_chessterm` Python module with a `Session` class. Positions
/// travel as move-token lists and FEN strings, results as plain tuples.

#include <chessterm/errors.hpp>
#include <chessterm/session.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

/// Destroying a Session joins the clock thread, which may be waiting for the
/// GIL inside an expiry callback.
struct ReleaseGilDeleter {
    void operator()(chessterm::Session* session) const {
        py::gil_scoped_release release;
        delete session;
    }
};

using SessionHolder = std::unique_ptr<chessterm::Session, ReleaseGilDeleter>;

}  // namespace

PYBIND11_MODULE(_chessterm, m) {
    m.doc() = "UCI engine session with a game clock (pybind11)";

    // ── Errors ──────────────────────────────────────────────────────────
    auto base = py::register_exception<chessterm::Error>(m, "Error", PyExc_RuntimeError);
    py::register_exception<chessterm::ProcessSpawnError>(m, "ProcessSpawnError", base.ptr());
    py::register_exception<chessterm::ChannelClosedError>(m, "ChannelClosedError", base.ptr());
    py::register_exception<chessterm::HandshakeError>(m, "HandshakeError", base.ptr());
    py::register_exception<chessterm::SessionBusyError>(m, "SessionBusyError", base.ptr());
    py::register_exception<chessterm::SearchTimeoutError>(m, "SearchTimeoutError", base.ptr());
    py::register_exception<chessterm::InvalidStateError>(m, "InvalidStateError", base.ptr());

    // ── Session class ───────────────────────────────────────────────────
    py::class_<chessterm::Session, SessionHolder>(m, "Session")
        .def(py::init([](const std::string& path, std::vector<std::string> args,
                         std::optional<std::int64_t> handshake_timeout_ms,
                         std::optional<std::int64_t> search_timeout_ms) {
                 chessterm::SessionOptions options;
                 options.engine_path = path;
                 options.engine_args = std::move(args);
                 if (handshake_timeout_ms)
                     options.handshake_timeout = std::chrono::milliseconds(*handshake_timeout_ms);
                 if (search_timeout_ms)
                     options.search_timeout = std::chrono::milliseconds(*search_timeout_ms);
                 py::gil_scoped_release release;
                 return SessionHolder(chessterm::Session::create(options).release());
             }),
             py::arg("path") = "stockfish", py::arg("args") = std::vector<std::string>{},
             py::arg("handshake_timeout_ms") = py::none(),
             py::arg("search_timeout_ms") = py::none(),
             "Spawn the engine at *path* and complete the UCI handshake.")

        .def(
            "set_position",
            [](chessterm::Session& self, std::vector<std::string> moves,
               std::optional<std::string> fen) { self.set_position(std::move(moves), fen); },
            py::arg("moves") = std::vector<std::string>{}, py::arg("fen") = py::none(),
            "Send a position: start position (or *fen*) plus *moves*.")

        .def(
            "best_move",
            [](chessterm::Session& self, std::optional<int> depth,
               std::optional<std::int64_t> movetime_ms) -> py::tuple {
                chessterm::SearchResult result;
                {
                    // Release the GIL so the clock and other Python threads keep running.
                    py::gil_scoped_release release;
                    result = self.best_move(self.request(depth, movetime_ms));
                }
                py::list lines;
                for (const auto& info : result.info) {
                    lines.append(py::make_tuple(
                        info.depth,
                        info.score_kind == chessterm::ScoreKind::Mate ? "mate" : "cp",
                        info.score, info.pv));
                }
                return py::make_tuple(result.best_move, lines);
            },
            py::arg("depth") = py::none(), py::arg("movetime_ms") = py::none(),
            R"doc(Search the current position.

Returns ``(best_move, info)`` where *best_move* is ``None`` when the engine
has no legal move and *info* is a list of ``(depth, kind, score, pv)``.)doc")

        // Clock calls may join the clock thread or run the expiry callback,
        // both of which need the GIL free.
        .def("configure_clock", &chessterm::Session::configure_clock, py::arg("minutes"),
             py::arg("increment_seconds") = 0, py::call_guard<py::gil_scoped_release>())
        .def("start_clock", &chessterm::Session::start_clock,
             py::call_guard<py::gil_scoped_release>())
        .def("stop_clock", &chessterm::Session::stop_clock,
             py::call_guard<py::gil_scoped_release>())
        .def("switch_side", &chessterm::Session::switch_side,
             py::call_guard<py::gil_scoped_release>())
        .def("times", &chessterm::Session::times, "Whole seconds left: (white, black).")
        .def(
            "on_time_expired",
            [](chessterm::Session& self, std::function<void(std::string)> callback) {
                chessterm::GameClock::ExpiryCallback expiry =
                    [callback = std::move(callback)](chessterm::Side loser) {
                        py::gil_scoped_acquire acquire;
                        callback(std::string(chessterm::side_name(loser)));
                    };
                // The clock thread takes the GIL while holding its callback lock.
                py::gil_scoped_release release;
                self.on_time_expired(std::move(expiry));
            },
            py::arg("callback"), "Called from the clock thread with the side that flagged.")
        .def("close", &chessterm::Session::shutdown, py::call_guard<py::gil_scoped_release>(),
             "Stop the clock and close the engine.");
}
