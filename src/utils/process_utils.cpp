/**
 * @file process_utils.cpp
 * @brief posix_spawn based subprocess runner with watchdog timeout
 *
 * **Pipe Handling**:
 * Both pipes are created O_CLOEXEC and dup'ed onto fd 1/2 in the child, so
 * the only copies of the write ends live in the child and its descendants.
 * The parent reads both read ends non-blocking from a single poll loop and
 * stops at EOF on both, or once the deadline fired and the child is gone
 * (a detached descendant may keep the pipes open forever).
 *
 * **Process Group**:
 * The child becomes the leader of a new process group, so the deadline kill
 * reaches anything it forked as well.
 *
 * @date 2025
 */

#include "codebox/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace codebox {
namespace utils {

namespace {

constexpr int kPollIntervalMs = 250;

// ============================================================================
// RAII HELPERS
// ============================================================================

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { Close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            Close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int Get() const { return fd_; }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

void MakePipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read_end = FileDescriptor(fds[0]);
    write_end = FileDescriptor(fds[1]);
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::system_error(errno, std::generic_category(), "fcntl(O_NONBLOCK)");
    }
}

/**
 * @brief Kills and reaps the child if RunProcess unwinds before reaping it
 */
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard() {
        if (pid_ <= 0) {
            return;
        }
        ::kill(-pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    void Release() { pid_ = -1; }

private:
    pid_t pid_;
};

// ============================================================================
// WATCHDOG
// ============================================================================
// Deadline timer racing the child. Cancel() is the "loser is cancelled"
// half of the race and always joins the thread.

class Watchdog {
public:
    Watchdog(pid_t pgid,
             std::chrono::steady_clock::time_point deadline,
             std::function<void()> on_fire)
        : on_fire_(std::move(on_fire)),
          thread_([this, pgid, deadline]() { Run(pgid, deadline); }) {}

    ~Watchdog() { Cancel(); }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool Fired() const { return fired_.load(); }

private:
    void Run(pid_t pgid, std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_until(lock, deadline, [this] { return cancelled_; })) {
            return;
        }
        fired_.store(true);
        lock.unlock();

        spdlog::debug("Deadline reached, killing process group {}", pgid);
        ::kill(-pgid, SIGKILL);

        if (on_fire_) {
            try {
                on_fire_();
            }
            catch (const std::exception& e) {
                spdlog::warn("Timeout handler failed: {}", e.what());
            }
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
    std::atomic<bool> fired_{false};
    std::function<void()> on_fire_;
    std::thread thread_;  ///< Declared last: starts after the state above exists
};

// ============================================================================
// OUTPUT CAPTURE
// ============================================================================

/**
 * @brief Read everything currently available from a non-blocking pipe
 * @return true while the pipe stays open, false at EOF or on error
 */
bool DrainPipe(int fd, std::string& sink, std::size_t cap, bool& truncated) {
    std::array<char, 4096> buffer;

    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            std::size_t count = static_cast<std::size_t>(n);
            std::size_t room = sink.size() < cap ? cap - sink.size() : 0;
            std::size_t take = std::min(room, count);
            sink.append(buffer.data(), take);
            if (take < count) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        spdlog::warn("Reading child output failed: {}", std::strerror(errno));
        return false;
    }
}

bool HasExited(pid_t pid) {
    siginfo_t info{};
    info.si_pid = 0;
    return ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
           info.si_pid == pid;
}

} // anonymous namespace

// ============================================================================
// RUN PROCESS
// ============================================================================

ProcessResult RunProcess(const ProcessOptions& options) {
    if (options.argv.empty()) {
        throw std::invalid_argument("RunProcess: empty argv");
    }

    FileDescriptor out_read, out_write, err_read, err_write;
    MakePipe(out_read, out_write);
    MakePipe(err_read, err_write);

    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, out_write.Get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_write.Get(), STDERR_FILENO);

    // New process group, default SIGPIPE disposition, nothing blocked
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    posix_spawnattr_setsigmask(&attr, &empty_mask);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF |
                                    POSIX_SPAWN_SETSIGMASK);

    spdlog::debug("Spawning: {}", options.argv[0]);

    auto start_time = std::chrono::steady_clock::now();
    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(),
                                "Failed to spawn " + options.argv[0]);
    }

    ChildGuard child_guard(pid);

    out_write.Close();
    err_write.Close();
    SetNonBlocking(out_read.Get());
    SetNonBlocking(err_read.Get());

    std::unique_ptr<Watchdog> watchdog;
    if (options.timeout) {
        watchdog = std::make_unique<Watchdog>(pid, start_time + *options.timeout,
                                              options.on_timeout);
    }

    ProcessResult result;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = pollfd{out_read.Get(), POLLIN, 0};
        if (err_open) fds[nfds++] = pollfd{err_read.Get(), POLLIN, 0};

        int ready = ::poll(fds, nfds, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (ready == 0) {
            if (watchdog && watchdog->Fired() && HasExited(pid)) {
                break;
            }
            continue;
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            if (fds[i].fd == out_read.Get()) {
                out_open = DrainPipe(fds[i].fd, result.stdout_output,
                                     options.max_output_bytes, result.output_truncated);
            } else {
                err_open = DrainPipe(fds[i].fd, result.stderr_output,
                                     options.max_output_bytes, result.output_truncated);
            }
        }
    }

    // Observe the exit without reaping so the pid stays ours until the
    // watchdog has been joined
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitid");
        }
    }

    if (watchdog) {
        watchdog->Cancel();
        result.timed_out = watchdog->Fired();
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    child_guard.Release();

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    if (result.timed_out) {
        result.exit_code = std::nullopt;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + result.term_signal;
    }

    if (result.output_truncated) {
        spdlog::warn("Output of {} exceeded {} bytes and was truncated",
                     options.argv[0], options.max_output_bytes);
    }

    return result;
}

} // namespace utils
} // namespace codebox
