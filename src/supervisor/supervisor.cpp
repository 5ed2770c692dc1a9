/**
 * @file supervisor.cpp
 * @brief Supervisor implementation: spawn, sample, reap, analyze.
 * @author Dimitris Kafetzis
 */

#include "supervisor/supervisor.hpp"

#include "analyzer/analyzer.hpp"
#include "log_store/sample_log.hpp"
#include "sampler/memory_probe.hpp"
#include "sampler/sampler.hpp"

#include <csignal>
#include <sys/wait.h>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace exec_profiler {

namespace {

/// Exit status reported when the memory limit kills the child (128 + SIGKILL).
constexpr int kMemoryLimitExitStatus = 137;

/// Longest the supervising thread blocks before re-checking timeout,
/// cancellation and the memory limit.
constexpr std::chrono::milliseconds kPollSlice{5};

std::string describe(Termination termination, int exit_status) {
    return std::string{to_string(termination)} + ", status " + std::to_string(exit_status);
}

}  // anonymous namespace

SupervisorOptions options_from(const Config& config) {
    SupervisorOptions options;
    options.sample_interval = Microseconds{config.sampler.interval_us};
    options.flush_every = config.sampler.flush_every;
    options.timeout = std::chrono::milliseconds{config.supervisor.timeout_ms};
    options.memory_limit_kb = config.supervisor.memory_limit_kb;
    options.integration_rule = config.analyzer.integration_rule;
    options.keep_log = config.log_store.keep_logs;
    return options;
}

Supervisor::Supervisor(SupervisorOptions options, Logger& logger)
    : options_(std::move(options)), logger_(logger) {}

Result<ExecutionResult> Supervisor::execute(const Command& command,
                                            const std::filesystem::path& log_path,
                                            std::stop_token cancel) {
    // ── Log first: refuse to launch untrusted code we cannot record ──
    auto writer_result = SampleLogWriter::create(log_path);
    if (!writer_result) {
        logger_.error("supervisor", writer_result.error().message);
        return writer_result.error();
    }
    auto& writer = *writer_result;

    auto child_result = ChildProcess::spawn(command);
    if (!child_result) {
        if (auto closed = writer.close(); !closed) {
            logger_.error("log_store", closed.error().message);
        }
        std::error_code ec;
        std::filesystem::remove(log_path, ec);
        if (ec) {
            logger_.warn("log_store", "Could not remove " + log_path.string()
                         + ": " + ec.message());
        }
        logger_.error("supervisor", child_result.error().message);
        return child_result.error();
    }
    auto& child = *child_result;
    const auto& handle = child.handle();

    logger_.info("supervisor", "pid " + std::to_string(handle.pid) + " started: "
                 + command.display());

    Sampler<ProcMemoryProbe, SampleLogWriter> sampler(
        ProcMemoryProbe{options_.proc_root}, writer,
        SamplerOptions{options_.sample_interval, options_.flush_every}, logger_);
    sampler.start(handle);

    // ── Wait for exit, draining output and enforcing limits ──
    const auto deadline = handle.started_at + options_.timeout;
    std::optional<Termination> forced;
    std::optional<int> wait_status;

    while (!wait_status) {
        if (!forced) {
            if (cancel.stop_requested()) {
                forced = Termination::Cancelled;
            } else if (options_.timeout.count() > 0
                       && std::chrono::steady_clock::now() >= deadline) {
                forced = Termination::TimedOut;
            } else if (options_.memory_limit_kb > 0
                       && sampler.latest_kb() > options_.memory_limit_kb) {
                forced = Termination::MemoryLimitExceeded;
            }
            if (forced) {
                logger_.warn("supervisor", "pid " + std::to_string(handle.pid)
                             + " killed: " + std::string{to_string(*forced)});
                child.kill_group(SIGKILL);
            }
        }

        if (child.output_open()) {
            child.pump_output(kPollSlice);
            wait_status = child.try_wait();
        } else {
            wait_status = child.try_wait();
            if (!wait_status) {
                std::this_thread::sleep_for(std::chrono::milliseconds{1});
            }
        }
    }
    auto wall_time = std::chrono::duration_cast<Nanoseconds>(
        std::chrono::steady_clock::now() - handle.started_at);
    child.drain_and_close();

    // ── Two-way join: child reaped, now the sampler ──
    sampler.request_stop();
    auto report = sampler.join();
    if (auto closed = writer.close(); !closed) {
        logger_.error("log_store", closed.error().message);
    }

    ExecutionResult result;
    result.stdout_text = child.take_stdout();
    result.stderr_text = child.take_stderr();
    result.exit_status = exit_status_from_wait(*wait_status);
    if (!child.status_known()) {
        result.exit_status = kUnknownExitStatus;
        logger_.warn("supervisor", "pid " + std::to_string(handle.pid)
                     + " was reaped elsewhere; exit status unknown");
    }
    if (forced) {
        result.termination = *forced;
        if (*forced == Termination::MemoryLimitExceeded) {
            result.exit_status = kMemoryLimitExitStatus;
        }
    } else if (child.status_known() && WIFSIGNALED(*wait_status)) {
        result.termination = Termination::Signaled;
    } else {
        result.termination = Termination::Exited;
    }
    result.sampler_stop = report.stop_reason;
    result.log_path = log_path;
    result.wall_time = wall_time;

    logger_.info("supervisor", "pid " + std::to_string(handle.pid) + " finished ("
                 + describe(result.termination, result.exit_status) + "), "
                 + std::to_string(report.ticks) + " samples");

    // ── Analysis over the closed log ──
    auto analysis = analyze_log(log_path, options_.integration_rule);
    if (analysis) {
        result.summary = analysis->summary;
        if (options_.collect_samples) {
            result.samples = std::move(analysis->samples);
        }
        if (result.summary.skipped_entries > 0) {
            logger_.warn("analyzer", std::to_string(result.summary.skipped_entries)
                         + " corrupt entries skipped in " + log_path.string());
        }
    } else {
        logger_.error("analyzer", analysis.error().message);
    }

    if (!options_.keep_log) {
        std::error_code ec;
        std::filesystem::remove(log_path, ec);
        if (ec) {
            logger_.warn("log_store", "Could not remove " + log_path.string()
                         + ": " + ec.message());
        }
    }

    return result;
}

}  // namespace exec_profiler
