/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ExecProfiler interfaces.
 * @author Dimitris Kafetzis
 *
 * Defines compile-time interface constraints for the sampling hot path.
 * The sampler calls its probe and its sink once per tick (every few
 * microseconds), so these seams use static polymorphism instead of
 * virtual dispatch.
 */

#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <concepts>
#include <cstdint>
#include <sys/types.h>

namespace exec_profiler {

/// Outcome of a single memory probe: RSS in kB, or why it could not be read.
using ProbeResult = Result<uint64_t, ProbeFailure>;

// ─────────────────────────────────────────────
// MemoryProbeLike
// ─────────────────────────────────────────────

/**
 * @concept MemoryProbeLike
 * @brief Constrains types that can read a process's resident memory.
 */
template <typename T>
concept MemoryProbeLike = requires(T probe, pid_t pid) {
    { probe.read_rss_kb(pid) } -> std::same_as<ProbeResult>;
};

// ─────────────────────────────────────────────
// SampleSinkLike
// ─────────────────────────────────────────────

/**
 * @concept SampleSinkLike
 * @brief Constrains append-only destinations for samples.
 *
 * The sampler is the only writer; implementations need no locking.
 */
template <typename T>
concept SampleSinkLike = requires(T sink, const Sample& sample) {
    { sink.append(sample) } -> std::same_as<Result<void>>;
    { sink.flush() } -> std::same_as<void>;
};

}  // namespace exec_profiler
