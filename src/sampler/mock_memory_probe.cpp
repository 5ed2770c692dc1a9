/**
 * @file mock_memory_probe.cpp
 * @brief MockMemoryProbe implementation, scripted readings for testing.
 * @author Dimitris Kafetzis
 */

#include "sampler/memory_probe.hpp"

namespace exec_profiler {

ProbeResult MockMemoryProbe::read_rss_kb(pid_t pid) {
    ++calls_;
    last_pid_ = pid;
    if (index_ >= sequence_.size()) {
        return ProbeFailure::ProcessGone;
    }
    return sequence_[index_++];
}

void MockMemoryProbe::push_reading(uint64_t kb) {
    sequence_.emplace_back(kb);
}

void MockMemoryProbe::push_failure(ProbeFailure failure) {
    sequence_.emplace_back(failure);
}

void MockMemoryProbe::push_ramp(uint64_t from_kb, uint64_t to_kb, size_t steps) {
    if (steps == 0) return;
    if (steps == 1) {
        push_reading(to_kb);
        return;
    }
    for (size_t i = 0; i < steps; ++i) {
        // Linear interpolation, exact at both ends
        auto span = static_cast<double>(to_kb) - static_cast<double>(from_kb);
        auto value = static_cast<double>(from_kb)
                   + span * static_cast<double>(i) / static_cast<double>(steps - 1);
        push_reading(static_cast<uint64_t>(value + 0.5));
    }
}

}  // namespace exec_profiler
