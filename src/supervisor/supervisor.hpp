/**
 * @file supervisor.hpp
 * @brief Runs one command under memory profiling.
 * @author Dimitris Kafetzis
 *
 * Pipeline per execution:
 *   create log → spawn child → start sampler → drain output until exit
 *   → stop + join sampler → close log → analyze → ExecutionResult
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "supervisor/child_process.hpp"

#include <chrono>
#include <filesystem>
#include <stop_token>

namespace exec_profiler {

struct SupervisorOptions {
    Microseconds sample_interval{10};
    uint32_t flush_every = 4096;
    std::chrono::milliseconds timeout{0};       ///< 0 = none
    uint64_t memory_limit_kb = 0;               ///< 0 = none
    IntegrationRule integration_rule = IntegrationRule::Trapezoid;
    bool keep_log = true;
    bool collect_samples = true;                ///< Copy samples into the result
    std::filesystem::path proc_root = "/proc";
};

/// Derive supervisor options from the loaded configuration.
[[nodiscard]] SupervisorOptions options_from(const Config& config);

/**
 * @brief Owns the full lifecycle of one child at a time.
 *
 * Stateless between calls; separate Supervisor instances (or one instance
 * used from several threads) may run executions in parallel as long as
 * each uses its own log path.
 */
class Supervisor {
public:
    Supervisor(SupervisorOptions options, Logger& logger);

    /**
     * @brief Run @p command to completion while sampling its RSS into
     *        @p log_path.
     *
     * Only a failure to create the log or to start the command is an
     * error; a non-zero exit, a timeout, a cancellation or an exceeded
     * memory limit are all reported inside the ExecutionResult.
     */
    Result<ExecutionResult> execute(const Command& command,
                                    const std::filesystem::path& log_path,
                                    std::stop_token cancel = {});

    [[nodiscard]] const SupervisorOptions& options() const noexcept { return options_; }

private:
    SupervisorOptions options_;
    Logger& logger_;
};

}  // namespace exec_profiler
