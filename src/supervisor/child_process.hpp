/**
 * @file child_process.hpp
 * @brief RAII handle for a spawned child with captured stdout/stderr.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace exec_profiler {

/**
 * @brief A command line to run under supervision.
 *
 * The program is resolved through PATH like execvp. Environment entries
 * are added to (or override) the parent's environment.
 */
struct Command {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;
    std::filesystem::path working_dir;

    [[nodiscard]] std::string display() const;
};

/**
 * @brief A running child process in its own process group.
 *
 * stdin is /dev/null; stdout and stderr are pipes drained by pump_output().
 * Destroying an unreaped ChildProcess kills its process group and reaps it,
 * so no code path can leak a running child.
 */
class ChildProcess {
public:
    /// Spawn @p command. Fails with ErrorCode::SpawnFailure.
    static Result<ChildProcess> spawn(const Command& command);

    ~ChildProcess();

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] const ProcessHandle& handle() const noexcept { return handle_; }

    /**
     * @brief Wait up to @p timeout for output and read everything available.
     *
     * Returns immediately once both pipes have reached EOF.
     */
    void pump_output(std::chrono::milliseconds timeout);

    /// Read whatever is buffered without waiting, then close both pipes.
    void drain_and_close();

    [[nodiscard]] bool output_open() const noexcept { return stdout_fd_ >= 0 || stderr_fd_ >= 0; }

    /**
     * @brief Non-blocking reap. Returns the raw wait status once the child
     *        has exited.
     *
     * If the child was reaped by someone else (ECHILD) its status is lost:
     * the call still returns, and status_known() turns false.
     */
    std::optional<int> try_wait();

    [[nodiscard]] bool status_known() const noexcept { return status_known_; }

    /// Send @p signal to the child's whole process group.
    void kill_group(int signal) noexcept;

    [[nodiscard]] bool reaped() const noexcept { return reaped_; }

    std::string take_stdout() { return std::move(stdout_); }
    std::string take_stderr() { return std::move(stderr_); }

private:
    ChildProcess(ProcessHandle handle, int stdout_fd, int stderr_fd) noexcept;

    bool read_available(int& fd, std::string& into);
    void close_pipes() noexcept;
    void release() noexcept;

    ProcessHandle handle_;
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    bool reaped_{false};
    bool status_known_{true};
    std::string stdout_;
    std::string stderr_;
};

/// Reported exit status when the child's wait status could not be collected.
inline constexpr int kUnknownExitStatus = -1;

/// Shell-convention exit status: the exit code, or 128 + signal number.
[[nodiscard]] int exit_status_from_wait(int wait_status) noexcept;

}  // namespace exec_profiler
