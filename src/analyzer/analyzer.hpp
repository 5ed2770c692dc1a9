/**
 * @file analyzer.hpp
 * @brief Summary statistics over a closed sample log.
 * @author Dimitris Kafetzis
 *
 * Everything here is a pure function of the samples: no I/O except the
 * read-only analyze_log(), and safe to re-run any number of times.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <span>
#include <vector>

namespace exec_profiler {

/**
 * @brief Area under the RSS-vs-time curve in kB·ns.
 *
 * Consecutive pairs contribute Δt·(m0+m1)/2 (Trapezoid) or Δt·m0
 * (LeftRectangle). A negative Δt, only possible in a corrupted log,
 * contributes nothing, so the result never decreases as samples are added.
 */
[[nodiscard]] double integrate_memory(std::span<const Sample> samples,
                                      IntegrationRule rule = IntegrationRule::Trapezoid) noexcept;

/**
 * @brief Peak, duration, integral and count for a sample sequence.
 *
 * Zero samples give all zeros; a single sample gives its value as the peak
 * and zero duration and integral.
 */
[[nodiscard]] ProfileSummary summarize(std::span<const Sample> samples,
                                       IntegrationRule rule = IntegrationRule::Trapezoid) noexcept;

struct Analysis {
    std::vector<Sample> samples;
    ProfileSummary summary;
};

/**
 * @brief Read a closed log from disk and summarize it.
 *
 * Malformed lines are skipped and reported in summary.skipped_entries.
 */
Result<Analysis> analyze_log(const std::filesystem::path& path,
                             IntegrationRule rule = IntegrationRule::Trapezoid);

}  // namespace exec_profiler
