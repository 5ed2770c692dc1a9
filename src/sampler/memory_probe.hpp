/**
 * @file memory_probe.hpp
 * @brief Resident-memory probes for a single process.
 * @author Dimitris Kafetzis
 *
 * Provides ProcMemoryProbe (reads VmRSS from /proc/<pid>/status) and
 * MockMemoryProbe (scripted readings for tests). Both satisfy the
 * MemoryProbeLike concept for zero-cost static dispatch.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace exec_profiler {

/**
 * @brief Extract the VmRSS value (kB) from the text of a /proc status file.
 *
 * A status file without a VmRSS line belongs to a zombie or kernel thread;
 * zombies ("State: Z" / "State: X") report ProcessGone, anything else
 * ReadError.
 */
[[nodiscard]] ProbeResult parse_status_rss(std::string_view status_text);

// ─────────────────────────────────────────────
// ProcMemoryProbe
// ─────────────────────────────────────────────

/**
 * @brief Reads a process's resident memory from the proc filesystem.
 *
 * Failure mapping:
 *   ENOENT / ESRCH  -> ProcessGone
 *   EACCES / EPERM  -> PermissionDenied
 *   anything else   -> ReadError
 */
class ProcMemoryProbe {
public:
    explicit ProcMemoryProbe(std::filesystem::path proc_root = "/proc");

    ProbeResult read_rss_kb(pid_t pid);

    [[nodiscard]] const std::filesystem::path& proc_root() const noexcept { return proc_root_; }

private:
    std::filesystem::path proc_root_;
};

// ─────────────────────────────────────────────
// MockMemoryProbe
// ─────────────────────────────────────────────

/**
 * @brief Mock probe returning a predetermined sequence of readings.
 *
 * Once the sequence is exhausted every read reports ProcessGone, which is
 * how a scripted "process" ends.
 */
class MockMemoryProbe {
public:
    MockMemoryProbe() = default;

    ProbeResult read_rss_kb(pid_t pid);

    // Test helpers
    void push_reading(uint64_t kb);
    void push_failure(ProbeFailure failure);
    void push_ramp(uint64_t from_kb, uint64_t to_kb, size_t steps);

    [[nodiscard]] size_t call_count() const noexcept { return calls_; }
    [[nodiscard]] pid_t last_pid() const noexcept { return last_pid_; }

private:
    std::vector<ProbeResult> sequence_;
    size_t index_{0};
    size_t calls_{0};
    pid_t last_pid_{-1};
};

static_assert(MemoryProbeLike<ProcMemoryProbe>);
static_assert(MemoryProbeLike<MockMemoryProbe>);

}  // namespace exec_profiler
