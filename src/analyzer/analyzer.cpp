/**
 * @file analyzer.cpp
 * @brief Peak / duration / integral computation.
 * @author Dimitris Kafetzis
 */

#include "analyzer/analyzer.hpp"

#include "log_store/sample_log.hpp"

#include <algorithm>
#include <utility>

namespace exec_profiler {

double integrate_memory(std::span<const Sample> samples, IntegrationRule rule) noexcept {
    if (samples.size() < 2) return 0.0;

    double area = 0.0;
    for (size_t i = 1; i < samples.size(); ++i) {
        const auto& prev = samples[i - 1];
        const auto& curr = samples[i];

        auto delta = curr.timestamp_ns - prev.timestamp_ns;
        if (delta <= 0) continue;

        auto dt = static_cast<double>(delta);
        auto m0 = static_cast<double>(prev.resident_memory_kb);
        switch (rule) {
            case IntegrationRule::Trapezoid:
                area += dt * (m0 + static_cast<double>(curr.resident_memory_kb)) / 2.0;
                break;
            case IntegrationRule::LeftRectangle:
                area += dt * m0;
                break;
        }
    }
    return area;
}

ProfileSummary summarize(std::span<const Sample> samples, IntegrationRule rule) noexcept {
    ProfileSummary summary;
    summary.sample_count = samples.size();
    if (samples.empty()) return summary;

    summary.peak_memory_kb = std::max_element(
        samples.begin(), samples.end(),
        [](const Sample& a, const Sample& b) {
            return a.resident_memory_kb < b.resident_memory_kb;
        })->resident_memory_kb;

    if (samples.size() >= 2) {
        summary.duration_ns = std::max<int64_t>(
            0, samples.back().timestamp_ns - samples.front().timestamp_ns);
        summary.integral_kb_ns = integrate_memory(samples, rule);
    }
    return summary;
}

Result<Analysis> analyze_log(const std::filesystem::path& path, IntegrationRule rule) {
    auto contents = read_sample_log(path);
    if (!contents) {
        return contents.error();
    }

    Analysis analysis;
    analysis.samples = std::move(contents->samples);
    analysis.summary = summarize(analysis.samples, rule);
    analysis.summary.skipped_entries = contents->skipped_entries;
    return analysis;
}

}  // namespace exec_profiler
