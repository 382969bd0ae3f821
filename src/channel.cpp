/// @file channel.cpp
/// POSIX process channel: fork/exec with stdin, stdout and stderr pipes.

#include <chessterm/channel.hpp>

#include <chessterm/errors.hpp>
#include <chessterm/log.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace chessterm {

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr auto kReapPollInterval = std::chrono::milliseconds(10);
constexpr auto kDestructorGrace = std::chrono::milliseconds(200);

std::once_flag g_sigpipe_flag;

/// Writes to a dead engine must surface as EPIPE, not kill the host.
void ignore_sigpipe() {
    std::call_once(g_sigpipe_flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string errno_text(int err) {
    return std::strerror(err);
}

}  // namespace

ProcessChannel::~ProcessChannel() {
    terminate(kDestructorGrace);
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
    close_fds();
}

// ── Spawn ───────────────────────────────────────────────────────────────────

void ProcessChannel::start(const std::string& executable, const std::vector<std::string>& args) {
    if (pid_ != -1) {
        throw ProcessSpawnError("start", "channel already started");
    }
    ignore_sigpipe();

    // argv is built before fork(): the child may only call async-signal-safe functions.
    std::vector<std::string> owned;
    owned.reserve(args.size() + 1);
    owned.push_back(executable);
    owned.insert(owned.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(owned.size() + 1);
    for (auto& s : owned) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(status_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(wake_fds_, O_CLOEXEC) != 0) {
        const int err = errno;
        close_all();
        close_fd(wake_fds_[0]);
        close_fd(wake_fds_[1]);
        throw ProcessSpawnError("start", "pipe: " + errno_text(err));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        close_all();
        close_fd(wake_fds_[0]);
        close_fd(wake_fds_[1]);
        throw ProcessSpawnError("start", "fork: " + errno_text(err));
    }

    if (pid == 0) {
        // Child. dup2 clears O_CLOEXEC on the standard descriptors.
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        const int err = errno;
        [[maybe_unused]] auto n = ::write(status_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Parent.
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        ::waitpid(pid, nullptr, 0);
        close_all();
        close_fd(wake_fds_[0]);
        close_fd(wake_fds_[1]);
        throw ProcessSpawnError("start", executable + ": " + errno_text(exec_errno));
    }

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    stderr_thread_ = std::thread(&ProcessChannel::drain_stderr, this);

    log::logger()->info("started engine {} (pid {})", executable, pid_);
}

// ── Line I/O ────────────────────────────────────────────────────────────────

void ProcessChannel::write_line(std::string_view line) {
    std::string data(line);
    data += '\n';

    std::lock_guard lock(write_mutex_);
    if (closed_.load() || stdin_fd_ < 0) {
        throw ChannelClosedError("write_line", "channel is closed");
    }
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t n = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw ChannelClosedError("write_line", errno_text(errno));
        }
        offset += static_cast<std::size_t>(n);
    }
}

std::optional<std::string> ProcessChannel::take_buffered_line() {
    const auto pos = read_buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;
    std::string line = read_buffer_.substr(0, pos);
    read_buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

std::optional<std::string> ProcessChannel::read_line(
    std::optional<std::chrono::milliseconds> timeout) {
    using Clock = std::chrono::steady_clock;
    std::optional<Clock::time_point> deadline;
    if (timeout)
        deadline = Clock::now() + *timeout;

    while (true) {
        if (closed_.load()) {
            throw ChannelClosedError("read_line", "channel terminated");
        }
        if (auto line = take_buffered_line())
            return line;
        if (eof_ || stdout_fd_ < 0) {
            throw ChannelClosedError("read_line", "engine closed its output");
        }

        int wait_ms = -1;
        if (deadline) {
            const auto left =
                std::chrono::ceil<std::chrono::milliseconds>(*deadline - Clock::now());
            if (left.count() <= 0)
                return std::nullopt;
            wait_ms = static_cast<int>(left.count());
        }

        pollfd fds[2] = {{stdout_fd_, POLLIN, 0}, {wake_fds_[0], POLLIN, 0}};
        const int rc = ::poll(fds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            throw ChannelClosedError("read_line", "poll: " + errno_text(errno));
        }
        if (rc == 0)
            continue;
        if (fds[1].revents != 0) {
            throw ChannelClosedError("read_line", "channel terminated");
        }
        if (fds[0].revents != 0) {
            char buf[kReadChunk];
            const ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                throw ChannelClosedError("read_line", errno_text(errno));
            }
            if (n == 0) {
                eof_ = true;
                // A final unterminated line is still a line.
                if (!read_buffer_.empty())
                    read_buffer_ += '\n';
                continue;
            }
            read_buffer_.append(buf, static_cast<std::size_t>(n));
        }
    }
}

void ProcessChannel::drain_stderr() {
    auto logger = log::logger();
    std::string pending;
    char buf[kReadChunk];
    while (true) {
        pollfd fds[2] = {{stderr_fd_, POLLIN, 0}, {wake_fds_[0], POLLIN, 0}};
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR)
                continue;
            return;
        }
        if (fds[1].revents != 0)
            return;
        const ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return;
        pending.append(buf, static_cast<std::size_t>(n));
        for (auto pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n')) {
            logger->debug("engine stderr: {}", pending.substr(0, pos));
            pending.erase(0, pos + 1);
        }
    }
}

// ── Lifetime ────────────────────────────────────────────────────────────────

bool ProcessChannel::wait_for_exit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const pid_t rc = ::waitpid(pid_, nullptr, WNOHANG);
        if (rc == pid_ || (rc < 0 && errno == ECHILD)) {
            reaped_ = true;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

void ProcessChannel::terminate(std::chrono::milliseconds grace) {
    if (closed_.exchange(true))
        return;

    if (wake_fds_[1] >= 0) {
        const char byte = 'x';
        [[maybe_unused]] auto n = ::write(wake_fds_[1], &byte, 1);
    }
    {
        // EOF on the engine's stdin is itself a shutdown request for most engines.
        std::lock_guard lock(write_mutex_);
        close_fd(stdin_fd_);
    }

    std::lock_guard lock(process_mutex_);
    if (pid_ <= 0 || reaped_)
        return;
    if (wait_for_exit(grace))
        return;
    log::logger()->debug("engine pid {} did not exit, sending SIGTERM", pid_);
    ::kill(pid_, SIGTERM);
    if (wait_for_exit(grace))
        return;
    log::logger()->warn("engine pid {} ignored SIGTERM, killing", pid_);
    ::kill(pid_, SIGKILL);
    ::waitpid(pid_, nullptr, 0);
    reaped_ = true;
}

bool ProcessChannel::is_alive() {
    if (closed_.load() || pid_ <= 0)
        return false;
    std::lock_guard lock(process_mutex_);
    if (reaped_)
        return false;
    const pid_t rc = ::waitpid(pid_, nullptr, WNOHANG);
    if (rc == pid_ || (rc < 0 && errno == ECHILD)) {
        reaped_ = true;
        return false;
    }
    return true;
}

void ProcessChannel::close_fds() noexcept {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(wake_fds_[0]);
    close_fd(wake_fds_[1]);
}

}  // namespace chessterm
