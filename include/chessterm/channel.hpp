#pragma once

/// @file channel.hpp
/// Line-oriented byte channel to the engine process.
///
/// `Channel` is the seam the driver talks through; `ProcessChannel` is the
/// POSIX implementation backed by a forked child and three pipes.

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace chessterm {

class Channel {
   public:
    virtual ~Channel() = default;

    /// Append '\n' and write the line in one piece.
    /// Throws ChannelClosedError once the peer is gone.
    virtual void write_line(std::string_view line) = 0;

    /// Next full line without its terminator. nullopt on timeout.
    /// Throws ChannelClosedError when the stream ends or the channel is terminated.
    virtual std::optional<std::string> read_line(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    /// Shut the peer down; wakes any blocked read_line. Idempotent.
    virtual void terminate(std::chrono::milliseconds grace) = 0;

    [[nodiscard]] virtual bool is_alive() = 0;
};

// ── POSIX process channel ───────────────────────────────────────────────────

class ProcessChannel : public Channel {
   public:
    ProcessChannel() = default;
    ~ProcessChannel() override;

    ProcessChannel(const ProcessChannel&) = delete;
    ProcessChannel& operator=(const ProcessChannel&) = delete;

    /// Spawn `executable` (looked up on PATH) with `args`.
    /// Throws ProcessSpawnError if it cannot be launched.
    void start(const std::string& executable, const std::vector<std::string>& args = {});

    void write_line(std::string_view line) override;
    std::optional<std::string> read_line(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;
    void terminate(std::chrono::milliseconds grace) override;
    [[nodiscard]] bool is_alive() override;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

   private:
    [[nodiscard]] std::optional<std::string> take_buffered_line();
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
    void drain_stderr();
    void close_fds() noexcept;

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int wake_fds_[2] = {-1, -1};  ///< Self-pipe: terminate() unblocks read_line.

    std::string read_buffer_;
    bool eof_ = false;

    std::mutex write_mutex_;
    std::mutex process_mutex_;  ///< Guards pid_ reaping.
    std::atomic<bool> closed_{false};
    bool reaped_ = false;

    std::thread stderr_thread_;
};

}  // namespace chessterm
