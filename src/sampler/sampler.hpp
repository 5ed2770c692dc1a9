/**
 * @file sampler.hpp
 * @brief Background RSS sampler for one supervised process.
 * @author Dimitris Kafetzis
 *
 * The sampler runs on its own std::jthread, reads the target's resident
 * memory every interval and appends one Sample per tick to its sink. It
 * stops on its own when the target can no longer be probed, or when the
 * supervisor requests a stop through the thread's stop_token.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

namespace exec_profiler {

struct SamplerOptions {
    Microseconds interval{10};
    uint32_t flush_every = 4096;        ///< 0 = flush only when the loop ends
};

/**
 * @brief What happened during one sampling run.
 */
struct SamplerReport {
    SamplerStopReason stop_reason{SamplerStopReason::NotStarted};
    uint64_t ticks{0};
    uint64_t peak_kb{0};
    std::optional<ProbeFailure> last_failure;
};

/**
 * @brief Polls a process's RSS at a fixed cadence into a sample sink.
 *
 * The sampler never signals, waits on, or otherwise touches the child; it
 * only reads its pid. The sink must outlive the sampler.
 */
template <MemoryProbeLike Probe, SampleSinkLike Sink>
class Sampler {
public:
    Sampler(Probe probe, Sink& sink, SamplerOptions options, Logger& logger)
        : probe_(std::move(probe)), sink_(sink), options_(options), logger_(logger) {}

    ~Sampler() {
        request_stop();
    }

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    /// Launch the sampling thread against @p handle.
    void start(const ProcessHandle& handle) {
        thread_ = std::jthread([this, pid = handle.pid](std::stop_token stop) {
            report_ = run(pid, stop);
        });
    }

    void request_stop() noexcept {
        if (thread_.joinable()) {
            thread_.request_stop();
        }
    }

    /// Wait for the sampling thread; the sink has been flushed on return.
    SamplerReport join() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return report_;
    }

    /**
     * @brief Run the sampling loop on the calling thread until the target
     *        disappears or @p stop is requested.
     */
    SamplerReport run(pid_t pid, std::stop_token stop) {
        SamplerReport report;
        auto next_tick = std::chrono::steady_clock::now();

        while (true) {
            if (stop.stop_requested()) {
                report.stop_reason = SamplerStopReason::Requested;
                break;
            }

            auto timestamp = monotonic_now_ns();
            auto reading = probe_.read_rss_kb(pid);
            uint64_t kb = reading.has_value() ? *reading : 0;

            auto appended = sink_.append(Sample{timestamp, kb});
            ++report.ticks;
            if (!appended) {
                report.stop_reason = SamplerStopReason::SinkFailure;
                logger_.error("sampler", "pid " + std::to_string(pid)
                              + ": " + appended.error().message);
                break;
            }

            if (!reading) {
                report.last_failure = reading.error();
                report.stop_reason = stop_reason_for(reading.error());
                log_probe_failure(pid, reading.error());
                break;
            }

            latest_kb_.store(kb, std::memory_order_relaxed);
            if (kb > report.peak_kb) {
                report.peak_kb = kb;
                peak_kb_.store(kb, std::memory_order_relaxed);
            }

            if (options_.flush_every != 0 && report.ticks % options_.flush_every == 0) {
                sink_.flush();
            }

            // Absolute deadlines keep the cadence from drifting with probe cost;
            // an overrun reschedules from now instead of bursting to catch up.
            next_tick += options_.interval;
            auto now = std::chrono::steady_clock::now();
            if (next_tick < now) {
                next_tick = now;
                continue;
            }
            std::unique_lock lock(wait_mutex_);
            wake_.wait_until(lock, stop, next_tick, [] { return false; });
        }

        sink_.flush();
        logger_.debug("sampler", "pid " + std::to_string(pid) + " stopped ("
                      + std::string{to_string(report.stop_reason)} + ") after "
                      + std::to_string(report.ticks) + " ticks");
        return report;
    }

    /// Most recent successful reading, readable from any thread.
    [[nodiscard]] uint64_t latest_kb() const noexcept {
        return latest_kb_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t peak_kb() const noexcept {
        return peak_kb_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const Probe& probe() const noexcept { return probe_; }

private:
    void log_probe_failure(pid_t pid, ProbeFailure failure) {
        auto message = "pid " + std::to_string(pid) + ": "
                     + std::string{to_string(failure)} + ", recorded zero sample";
        if (failure == ProbeFailure::ProcessGone) {
            logger_.debug("sampler", message);
        } else {
            logger_.warn("sampler", message);
        }
    }

    Probe probe_;
    Sink& sink_;
    SamplerOptions options_;
    Logger& logger_;

    std::atomic<uint64_t> latest_kb_{0};
    std::atomic<uint64_t> peak_kb_{0};

    std::mutex wait_mutex_;
    std::condition_variable_any wake_;
    SamplerReport report_;
    std::jthread thread_;
};

}  // namespace exec_profiler
