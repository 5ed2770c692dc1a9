/**
 * @file child_process.cpp
 * @brief posix_spawnp-based child launch with non-blocking pipe capture.
 * @author Dimitris Kafetzis
 */

#include "supervisor/child_process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace exec_profiler {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string errno_text(int err) {
    return std::string{std::strerror(err)};
}

/// RAII for the spawn attribute and file-action objects.
struct SpawnSetup {
    posix_spawnattr_t attr{};
    posix_spawn_file_actions_t actions{};

    SpawnSetup() {
        posix_spawnattr_init(&attr);
        posix_spawn_file_actions_init(&actions);
    }
    ~SpawnSetup() {
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
    }

    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;
};

/// Parent environment with the command's overrides applied.
std::vector<std::string> build_environment(const Command& command) {
    std::vector<std::string> entries;
    for (char** env = environ; env && *env; ++env) {
        std::string entry{*env};
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        bool overridden = false;
        for (const auto& [k, v] : command.env) {
            if (k == key) { overridden = true; break; }
        }
        if (!overridden) entries.push_back(std::move(entry));
    }
    for (const auto& [k, v] : command.env) {
        entries.push_back(k + "=" + v);
    }
    return entries;
}

}  // anonymous namespace

std::string Command::display() const {
    std::string text = program;
    for (const auto& arg : args) {
        text += ' ';
        text += arg;
    }
    return text;
}

int exit_status_from_wait(int wait_status) noexcept {
    if (WIFEXITED(wait_status)) return WEXITSTATUS(wait_status);
    if (WIFSIGNALED(wait_status)) return 128 + WTERMSIG(wait_status);
    return wait_status;
}

// ─────────────────────────────────────────────
// Spawn
// ─────────────────────────────────────────────

Result<ChildProcess> ChildProcess::spawn(const Command& command) {
    if (command.program.empty()) {
        return Error{ErrorCode::SpawnFailure, "Empty command"};
    }

    std::array<int, 2> out_pipe{-1, -1};
    std::array<int, 2> err_pipe{-1, -1};
    if (::pipe2(out_pipe.data(), O_CLOEXEC) != 0) {
        return Error{ErrorCode::SpawnFailure, "pipe failed: " + errno_text(errno)};
    }
    if (::pipe2(err_pipe.data(), O_CLOEXEC) != 0) {
        int err = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return Error{ErrorCode::SpawnFailure, "pipe failed: " + errno_text(err)};
    }

    auto close_all = [&]() noexcept {
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
    };

    // argv / envp views over owned strings
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.program.c_str()));
    for (const auto& arg : command.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    auto env_storage = build_environment(command);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    SpawnSetup setup;

    // Own process group so a timeout can kill everything the child started;
    // clear the signal mask inherited from the supervising thread.
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK);
    posix_spawnattr_setpgroup(&setup.attr, 0);
    posix_spawnattr_setsigmask(&setup.attr, &empty_mask);

    posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&setup.actions, out_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&setup.actions, err_pipe[1], STDERR_FILENO);
    if (!command.working_dir.empty()) {
        posix_spawn_file_actions_addchdir_np(&setup.actions, command.working_dir.c_str());
    }

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, command.program.c_str(), &setup.actions, &setup.attr,
                            argv.data(), envp.data());
    if (rc != 0) {
        close_all();
        return Error{ErrorCode::SpawnFailure,
                     "Cannot start '" + command.program + "': " + errno_text(rc)};
    }

    // Parent never writes; only the child holds the write ends now.
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL, 0) | O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, ::fcntl(err_pipe[0], F_GETFL, 0) | O_NONBLOCK);

    ProcessHandle handle{pid, std::chrono::steady_clock::now()};
    return ChildProcess(handle, out_pipe[0], err_pipe[0]);
}

// ─────────────────────────────────────────────
// Lifetime
// ─────────────────────────────────────────────

ChildProcess::ChildProcess(ProcessHandle handle, int stdout_fd, int stderr_fd) noexcept
    : handle_(handle), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : handle_(std::exchange(other.handle_, ProcessHandle{}))
    , stdout_fd_(std::exchange(other.stdout_fd_, -1))
    , stderr_fd_(std::exchange(other.stderr_fd_, -1))
    , reaped_(std::exchange(other.reaped_, true))
    , status_known_(other.status_known_)
    , stdout_(std::move(other.stdout_))
    , stderr_(std::move(other.stderr_)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        release();
        handle_ = std::exchange(other.handle_, ProcessHandle{});
        stdout_fd_ = std::exchange(other.stdout_fd_, -1);
        stderr_fd_ = std::exchange(other.stderr_fd_, -1);
        reaped_ = std::exchange(other.reaped_, true);
        status_known_ = other.status_known_;
        stdout_ = std::move(other.stdout_);
        stderr_ = std::move(other.stderr_);
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    release();
}

void ChildProcess::release() noexcept {
    close_pipes();
    if (handle_.valid() && !reaped_) {
        kill_group(SIGKILL);
        int status = 0;
        while (::waitpid(handle_.pid, &status, 0) < 0 && errno == EINTR) {}
        reaped_ = true;
    }
}

void ChildProcess::close_pipes() noexcept {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

// ─────────────────────────────────────────────
// Output capture
// ─────────────────────────────────────────────

bool ChildProcess::read_available(int& fd, std::string& into) {
    std::array<char, kReadChunk> buffer;
    while (fd >= 0) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            into.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            close_fd(fd);   // EOF
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        close_fd(fd);       // read error: treat as closed
        return false;
    }
    return false;
}

void ChildProcess::pump_output(std::chrono::milliseconds timeout) {
    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (stdout_fd_ >= 0) fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
    if (stderr_fd_ >= 0) fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
    if (count == 0) return;

    int ready = ::poll(fds.data(), count, static_cast<int>(timeout.count()));
    if (ready <= 0) return;     // timeout or EINTR; caller loops

    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents == 0) continue;
        if (fds[i].fd == stdout_fd_) {
            read_available(stdout_fd_, stdout_);
        } else if (fds[i].fd == stderr_fd_) {
            read_available(stderr_fd_, stderr_);
        }
    }
}

void ChildProcess::drain_and_close() {
    read_available(stdout_fd_, stdout_);
    read_available(stderr_fd_, stderr_);
    close_pipes();
}

// ─────────────────────────────────────────────
// Reaping and signals
// ─────────────────────────────────────────────

std::optional<int> ChildProcess::try_wait() {
    if (reaped_ || !handle_.valid()) return std::nullopt;

    int status = 0;
    pid_t ret = ::waitpid(handle_.pid, &status, WNOHANG);
    if (ret == handle_.pid) {
        reaped_ = true;
        return status;
    }
    if (ret < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more can be learned about its status.
        reaped_ = true;
        status_known_ = false;
        return 0;
    }
    return std::nullopt;
}

void ChildProcess::kill_group(int signal) noexcept {
    if (!handle_.valid() || reaped_) return;
    if (::kill(-handle_.pid, signal) != 0) {
        ::kill(handle_.pid, signal);
    }
}

}  // namespace exec_profiler
