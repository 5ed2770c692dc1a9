/**
 * @file bench_profiler.cpp
 * @brief Performance benchmarks for the profiling hot paths.
 * @author Dimitris Kafetzis
 *
 * Measures the per-tick cost of the RSS probe and log append (which bounds
 * the smallest useful sampling interval) and analyzer throughput over
 * large logs.
 *
 * Usage: ./bench_profiler [--csv]
 */

#include "analyzer/analyzer.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "log_store/sample_log.hpp"
#include "sampler/memory_probe.hpp"
#include "sampler/sampler.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace exec_profiler;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Benchmarks
// ─────────────────────────────────────────────

std::vector<Sample> synthetic_samples(size_t count) {
    std::vector<Sample> samples;
    samples.reserve(count);
    int64_t ts = 1'000'000;
    for (size_t i = 0; i < count; ++i) {
        ts += 10'000 + static_cast<int64_t>(i % 7) * 100;
        samples.push_back(Sample{ts, 1024 + (i / 1000)});
    }
    return samples;
}

std::vector<BenchResult> bench_probe() {
    std::vector<BenchResult> R;
    ProcMemoryProbe probe;
    pid_t self = ::getpid();

    R.push_back(run_bench("proc_status_read_self", "Probe", 5000,
        [&]{ auto r = probe.read_rss_kb(self); (void)r; }, "VmRSS"));

    R.push_back(run_bench("proc_status_read_missing", "Probe", 5000,
        [&]{ auto r = probe.read_rss_kb(0x7ffffff0); (void)r; }, "ENOENT"));

    std::string status(1400, 'x');
    status += "\nState:\tS (sleeping)\nVmRSS:\t   123456 kB\n";
    R.push_back(run_bench("parse_status_rss", "Probe", 20000,
        [&]{ auto r = parse_status_rss(status); (void)r; }, "1.4 KB text"));

    return R;
}

std::vector<BenchResult> bench_log_store() {
    std::vector<BenchResult> R;
    auto dir = std::filesystem::temp_directory_path() / "exec_profiler_bench";
    auto samples = synthetic_samples(100'000);

    R.push_back(run_bench("log_append_100k", "LogStore", 10, [&]{
        auto writer = SampleLogWriter::create(make_log_path(dir, "bench"));
        if (!writer) return;
        for (const auto& s : samples) {
            if (!writer->append(s)) break;
        }
        auto closed = writer->close();
        (void)closed;
    }, "100k lines"));

    auto path = make_log_path(dir, "bench_read");
    {
        auto writer = SampleLogWriter::create(path);
        if (writer) {
            for (const auto& s : samples) {
                if (!writer->append(s)) break;
            }
            auto closed = writer->close();
            (void)closed;
        }
    }
    R.push_back(run_bench("log_read_100k", "LogStore", 10, [&]{
        auto contents = read_sample_log(path);
        (void)contents;
    }, "100k lines"));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return R;
}

std::vector<BenchResult> bench_analyzer() {
    std::vector<BenchResult> R;
    for (size_t n : {1'000u, 100'000u, 1'000'000u}) {
        auto samples = synthetic_samples(n);
        R.push_back(run_bench("summarize_trapezoid_" + std::to_string(n), "Analyzer", 20,
            [&]{ auto s = summarize(samples, IntegrationRule::Trapezoid); (void)s; },
            std::to_string(n) + " samples"));
        R.push_back(run_bench("summarize_left_" + std::to_string(n), "Analyzer", 20,
            [&]{ auto s = summarize(samples, IntegrationRule::LeftRectangle); (void)s; },
            std::to_string(n) + " samples"));
    }
    return R;
}

std::vector<BenchResult> bench_sampler() {
    std::vector<BenchResult> R;
    Logger logger(std::make_unique<NullSink>());

    // Scripted probe and in-memory sink with no interval: the loop's own
    // per-tick overhead, excluding /proc.
    R.push_back(run_bench("sampler_loop_10k_ticks", "Sampler", 20, [&]{
        MockMemoryProbe probe;
        probe.push_ramp(0, 4096, 10'000);
        SampleBuffer buffer;
        Sampler<MockMemoryProbe, SampleBuffer> sampler(
            std::move(probe), buffer, SamplerOptions{Microseconds{0}, 0}, logger);
        auto report = sampler.run(1, std::stop_token{});
        (void)report;
    }, "mock probe"));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  ExecProfiler Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_probe());
    append(bench_log_store());
    append(bench_analyzer());
    append(bench_sampler());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
