/**
 * @file types.hpp
 * @brief Fundamental types used throughout ExecProfiler.
 * @author Dimitris Kafetzis
 *
 * Defines Sample, ProcessHandle, ProfileSummary, ExecutionResult and the
 * enums describing how a child process and its sampler came to an end.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace exec_profiler {

// ─────────────────────────────────────────────
// Time Types
// ─────────────────────────────────────────────

using SteadyTime = std::chrono::steady_clock::time_point;
using Nanoseconds = std::chrono::nanoseconds;
using Microseconds = std::chrono::microseconds;

inline constexpr double kNanosPerSecond = 1e9;

/// Monotonic clock reading in nanoseconds, the timestamp unit of every Sample.
[[nodiscard]] inline int64_t monotonic_now_ns() noexcept {
    return std::chrono::duration_cast<Nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

// ─────────────────────────────────────────────
// Sample
// ─────────────────────────────────────────────

/**
 * @brief One memory reading of a supervised process.
 *
 * Produced only by the Sampler. Immutable once written to the log.
 */
struct Sample {
    int64_t timestamp_ns{0};            ///< steady_clock, nanoseconds
    uint64_t resident_memory_kb{0};     ///< VmRSS at that instant

    auto operator<=>(const Sample&) const = default;
};

// ─────────────────────────────────────────────
// Process Handle
// ─────────────────────────────────────────────

/**
 * @brief Identifies a running child. Owned by the Supervisor; the Sampler
 *        only ever reads the pid.
 */
struct ProcessHandle {
    pid_t pid{-1};
    SteadyTime started_at{};

    [[nodiscard]] constexpr bool valid() const noexcept { return pid > 0; }
};

// ─────────────────────────────────────────────
// Probe / Sampler outcomes
// ─────────────────────────────────────────────

enum class ProbeFailure : uint8_t {
    ProcessGone,        ///< /proc entry missing, or process is a zombie
    PermissionDenied,   ///< status file exists but cannot be read
    ReadError           ///< any other I/O or parse failure
};

[[nodiscard]] constexpr std::string_view to_string(ProbeFailure failure) noexcept {
    switch (failure) {
        case ProbeFailure::ProcessGone:      return "process_gone";
        case ProbeFailure::PermissionDenied: return "permission_denied";
        case ProbeFailure::ReadError:        return "read_error";
    }
    return "unknown";
}

enum class SamplerStopReason : uint8_t {
    NotStarted,
    Requested,          ///< Explicit stop from the Supervisor
    ProcessGone,
    PermissionDenied,
    ReadError,
    SinkFailure         ///< Log could not be appended to
};

[[nodiscard]] constexpr std::string_view to_string(SamplerStopReason reason) noexcept {
    switch (reason) {
        case SamplerStopReason::NotStarted:       return "not_started";
        case SamplerStopReason::Requested:        return "requested";
        case SamplerStopReason::ProcessGone:      return "process_gone";
        case SamplerStopReason::PermissionDenied: return "permission_denied";
        case SamplerStopReason::ReadError:        return "read_error";
        case SamplerStopReason::SinkFailure:      return "sink_failure";
    }
    return "unknown";
}

[[nodiscard]] constexpr SamplerStopReason stop_reason_for(ProbeFailure failure) noexcept {
    switch (failure) {
        case ProbeFailure::ProcessGone:      return SamplerStopReason::ProcessGone;
        case ProbeFailure::PermissionDenied: return SamplerStopReason::PermissionDenied;
        case ProbeFailure::ReadError:        return SamplerStopReason::ReadError;
    }
    return SamplerStopReason::ReadError;
}

/**
 * @brief How the supervised child came to an end.
 */
enum class Termination : uint8_t {
    Exited,                 ///< Normal exit, any status
    Signaled,               ///< Killed by a signal not sent by us
    TimedOut,               ///< Killed after timeout_ms elapsed
    Cancelled,              ///< Killed after an external stop request
    MemoryLimitExceeded     ///< Killed after RSS exceeded memory_limit_kb
};

[[nodiscard]] constexpr std::string_view to_string(Termination termination) noexcept {
    switch (termination) {
        case Termination::Exited:              return "exited";
        case Termination::Signaled:            return "signaled";
        case Termination::TimedOut:            return "timed_out";
        case Termination::Cancelled:           return "cancelled";
        case Termination::MemoryLimitExceeded: return "memory_limit_exceeded";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Profile Summary
// ─────────────────────────────────────────────

/**
 * @brief Statistics derived from a closed sample log.
 *
 * The integral is stored in kilobyte-nanoseconds; use the helpers for
 * second-based units.
 */
struct ProfileSummary {
    uint64_t peak_memory_kb{0};
    double integral_kb_ns{0.0};
    int64_t duration_ns{0};
    uint64_t sample_count{0};
    uint64_t skipped_entries{0};        ///< Corrupt log lines ignored

    [[nodiscard]] constexpr double duration_seconds() const noexcept {
        return static_cast<double>(duration_ns) / kNanosPerSecond;
    }

    [[nodiscard]] constexpr double integral_kb_seconds() const noexcept {
        return integral_kb_ns / kNanosPerSecond;
    }

    /// Time-weighted mean RSS; 0 when the log spans no time.
    [[nodiscard]] constexpr double mean_memory_kb() const noexcept {
        if (duration_ns <= 0) return 0.0;
        return integral_kb_ns / static_cast<double>(duration_ns);
    }
};

// ─────────────────────────────────────────────
// Execution Result
// ─────────────────────────────────────────────

/**
 * @brief Everything returned to the caller for one supervised execution.
 */
struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_status{0};
    Termination termination{Termination::Exited};
    SamplerStopReason sampler_stop{SamplerStopReason::NotStarted};
    ProfileSummary summary;
    std::vector<Sample> samples;
    std::filesystem::path log_path;
    Nanoseconds wall_time{0};           ///< Spawn to reap, measured by the Supervisor
};

}  // namespace exec_profiler
