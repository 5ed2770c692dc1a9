/**
 * @file sample_log.hpp
 * @brief Append-only on-disk time series of (timestamp, RSS) samples.
 * @author Dimitris Kafetzis
 *
 * Format: one sample per line, "<timestamp_ns> <resident_memory_kb>\n".
 * Lines are only ever appended; the reader tolerates a torn final line and
 * skips (and counts) malformed entries instead of failing.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string_view>
#include <vector>

namespace exec_profiler {

// ─────────────────────────────────────────────
// SampleLogWriter
// ─────────────────────────────────────────────

/**
 * @brief Sole writer of one execution's sample log.
 *
 * Satisfies SampleSinkLike. Move-only; closing is idempotent and also
 * happens on destruction.
 */
class SampleLogWriter {
public:
    /// Create (or truncate) the log at @p path. Parent directories are created.
    static Result<SampleLogWriter> create(const std::filesystem::path& path);

    ~SampleLogWriter();

    SampleLogWriter(SampleLogWriter&&) noexcept = default;
    SampleLogWriter& operator=(SampleLogWriter&&) noexcept = default;
    SampleLogWriter(const SampleLogWriter&) = delete;
    SampleLogWriter& operator=(const SampleLogWriter&) = delete;

    Result<void> append(const Sample& sample);
    void flush();
    Result<void> close();

    [[nodiscard]] bool is_open() const noexcept { return file_.is_open(); }
    [[nodiscard]] uint64_t appended() const noexcept { return appended_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    SampleLogWriter(std::filesystem::path path, std::ofstream file);

    std::filesystem::path path_;
    std::ofstream file_;
    uint64_t appended_{0};
};

// ─────────────────────────────────────────────
// SampleBuffer
// ─────────────────────────────────────────────

/**
 * @brief In-memory sample sink, used where no file is wanted (tests, benchmarks).
 */
class SampleBuffer {
public:
    Result<void> append(const Sample& sample);
    void flush() {}

    [[nodiscard]] const std::vector<Sample>& samples() const noexcept { return samples_; }
    void clear() noexcept { samples_.clear(); }

private:
    std::vector<Sample> samples_;
};

static_assert(SampleSinkLike<SampleLogWriter>);
static_assert(SampleSinkLike<SampleBuffer>);

// ─────────────────────────────────────────────
// Reading
// ─────────────────────────────────────────────

/**
 * @brief Parse one log line. Returns nullopt for anything but exactly two
 *        non-negative integers separated by whitespace.
 */
[[nodiscard]] std::optional<Sample> parse_sample_line(std::string_view line);

/// Render a sample the way the writer does (without the newline).
[[nodiscard]] std::string format_sample_line(const Sample& sample);

struct LogContents {
    std::vector<Sample> samples;
    uint64_t skipped_entries{0};
};

/**
 * @brief Read a sample log in file order.
 *
 * Blank lines are ignored. Fails only if the file cannot be opened.
 */
Result<LogContents> read_sample_log(const std::filesystem::path& path);

/**
 * @brief Build a per-execution log path under @p dir that will not collide
 *        with any other execution in this process or a concurrent one.
 */
[[nodiscard]] std::filesystem::path make_log_path(const std::filesystem::path& dir,
                                                  std::string_view tag = "exec");

}  // namespace exec_profiler
