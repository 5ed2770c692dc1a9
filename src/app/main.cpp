/**
 * @file main.cpp
 * @brief ExecProfiler command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one profiling run:
 *   Config → Logger → Supervisor (Sampler + Log Store) → Analyzer → ResultWriter
 */

#include "analyzer/analyzer.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "log_store/sample_log.hpp"
#include "supervisor/supervisor.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/result_writer.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace exec_profiler;

namespace {

constexpr int kExitUsage = 2;
constexpr int kExitSpawnFailure = 3;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    std::optional<uint32_t> interval_us;
    std::optional<uint32_t> timeout_ms;
    std::optional<uint64_t> memory_limit_kb;
    std::optional<std::string> log_dir;
    std::optional<bool> keep_log;
    std::optional<std::string> rule;
    std::optional<std::filesystem::path> analyze_path;
    bool include_samples = false;
    bool verbose = false;
    uint32_t repeat = 1;
    uint32_t jobs = 1;
    Command command;
};

void print_usage() {
    std::cout << "Usage: exec_profiler [OPTIONS] -- <command> [args...]\n"
              << "       exec_profiler [OPTIONS] --analyze <log>\n"
              << "  --config <path>        Configuration file (default: config/default.toml)\n"
              << "  --interval-us <n>      Sampling interval in microseconds\n"
              << "  --timeout-ms <n>       Kill the command after n ms (0 = never)\n"
              << "  --memory-limit-kb <n>  Kill the command above n kB RSS (0 = no limit)\n"
              << "  --log-dir <path>       Directory for per-execution sample logs\n"
              << "  --keep-log             Keep sample logs after analysis\n"
              << "  --no-keep-log          Delete sample logs after analysis\n"
              << "  --rule <name>          Integration rule: trapezoid | left\n"
              << "  --samples              Include every sample in the JSON result\n"
              << "  --repeat <n>           Run the command n times\n"
              << "  --jobs <n>             Run up to n repetitions in parallel\n"
              << "  --analyze <log>        Summarize an existing sample log and exit\n"
              << "  --verbose              Debug-level diagnostics\n"
              << "  --help, -h             Show this help message\n";
}

template <typename Int>
std::optional<Int> parse_number(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        auto value = std::stoull(text, &used);
        if (used != text.size() || value > std::numeric_limits<Int>::max()) {
            return std::nullopt;
        }
        return static_cast<Int>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    int i = 1;
    auto next = [&](const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        return std::string{argv[++i]};
    };
    auto number = [&]<typename Int>(const std::string& flag, std::optional<Int>& out) {
        auto text = next(flag);
        if (!text) return false;
        out = parse_number<Int>(*text);
        if (!out) {
            std::cerr << "Invalid number for " << flag << ": " << *text << "\n";
            return false;
        }
        return true;
    };

    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "--config") {
            auto value = next(arg);
            if (!value) return std::nullopt;
            args.config_path = *value;
            args.config_given = true;
        } else if (arg == "--interval-us") {
            if (!number(arg, args.interval_us)) return std::nullopt;
        } else if (arg == "--timeout-ms") {
            if (!number(arg, args.timeout_ms)) return std::nullopt;
        } else if (arg == "--memory-limit-kb") {
            if (!number(arg, args.memory_limit_kb)) return std::nullopt;
        } else if (arg == "--log-dir") {
            args.log_dir = next(arg);
            if (!args.log_dir) return std::nullopt;
        } else if (arg == "--keep-log") {
            args.keep_log = true;
        } else if (arg == "--no-keep-log") {
            args.keep_log = false;
        } else if (arg == "--rule") {
            args.rule = next(arg);
            if (!args.rule) return std::nullopt;
        } else if (arg == "--samples") {
            args.include_samples = true;
        } else if (arg == "--repeat" || arg == "--jobs") {
            std::optional<uint32_t> value;
            if (!number(arg, value) || *value == 0) return std::nullopt;
            (arg == "--repeat" ? args.repeat : args.jobs) = *value;
        } else if (arg == "--analyze") {
            auto value = next(arg);
            if (!value) return std::nullopt;
            args.analyze_path = *value;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (i < argc) {
        args.command.program = argv[i++];
        for (; i < argc; ++i) {
            args.command.args.emplace_back(argv[i]);
        }
    }

    if (!args.analyze_path && args.command.program.empty()) {
        std::cerr << "No command given\n";
        return std::nullopt;
    }
    return args;
}

/**
 * @brief Apply CLI overrides on top of the file configuration.
 */
bool apply_overrides(const CLIArgs& args, Config& config) {
    if (args.interval_us) {
        if (*args.interval_us == 0) {
            std::cerr << "--interval-us must be positive\n";
            return false;
        }
        config.sampler.interval_us = *args.interval_us;
    }
    if (args.timeout_ms) config.supervisor.timeout_ms = *args.timeout_ms;
    if (args.memory_limit_kb) config.supervisor.memory_limit_kb = *args.memory_limit_kb;
    if (args.log_dir) config.log_store.dir = *args.log_dir;
    if (args.keep_log) config.log_store.keep_logs = *args.keep_log;
    if (args.rule) {
        auto rule = parse_integration_rule(*args.rule);
        if (!rule) {
            std::cerr << "Unknown integration rule: " << *args.rule << "\n";
            return false;
        }
        config.analyzer.integration_rule = *rule;
    }
    if (args.verbose) config.telemetry.log_level = "debug";
    return true;
}

int run_analyze(const std::filesystem::path& path, const Config& config,
                ResultWriter& results, Logger& logger) {
    auto analysis = analyze_log(path, config.analyzer.integration_rule);
    if (!analysis) {
        logger.error("analyzer", analysis.error().message);
        results.record_error(analysis.error());
        return 1;
    }

    ExecutionResult result;
    result.summary = analysis->summary;
    result.samples = std::move(analysis->samples);
    result.log_path = path;
    results.record_execution(result);
    logger.info("analyzer", "Analyzed " + path.string() + ": "
                + std::to_string(result.summary.sample_count) + " samples, peak "
                + std::to_string(result.summary.peak_memory_kb) + " kB");
    return 0;
}

int run_profile(const CLIArgs& args, const Config& config,
                ResultWriter& results, Logger& logger) {
    auto options = options_from(config);
    options.collect_samples = args.include_samples;
    Supervisor supervisor(options, logger);

    Command command = args.command;
    if (command.working_dir.empty()) command.working_dir = config.supervisor.working_dir;

    // Ctrl+C is relayed to the running children as a cancellation.
    std::stop_source shutdown;
    std::jthread watcher([&shutdown](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                shutdown.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    });

    int exit_code = 0;

    if (args.repeat == 1) {
        auto result = supervisor.execute(command, make_log_path(config.log_store.dir),
                                         shutdown.get_token());
        if (!result) {
            results.record_error(result.error());
            return kExitSpawnFailure;
        }
        results.record_execution(*result);
        return result->exit_status;
    }

    ThreadPool pool(std::min(args.jobs, args.repeat));
    std::vector<std::future<Result<ExecutionResult>>> futures;
    futures.reserve(args.repeat);
    for (uint32_t run = 0; run < args.repeat; ++run) {
        futures.push_back(pool.submit_execution(
            supervisor, command,
            make_log_path(config.log_store.dir, "run" + std::to_string(run)),
            shutdown.get_token()));
    }

    for (uint32_t run = 0; run < args.repeat; ++run) {
        auto result = futures[run].get();
        if (!result) {
            results.record_error(result.error());
            exit_code = kExitSpawnFailure;
            continue;
        }
        results.record_execution(*result, run);
        if (result->exit_status != 0 && exit_code == 0) {
            exit_code = result->exit_status;
        }
    }
    logger.info("app", "Completed " + std::to_string(args.repeat) + " runs with "
                + std::to_string(pool.thread_count()) + " workers");
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return kExitUsage;
    }
    auto& args = *parsed;

    // Load configuration; a missing default file is not worth a warning.
    Config config = default_config();
    std::optional<std::string> config_warning;
    if (args.config_given || std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (config_result) {
            config = *config_result;
        } else {
            config_warning = config_result.error().message;
        }
    }
    if (!apply_overrides(args, config)) {
        return kExitUsage;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "exec_profiler",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StderrSink>();
    }
    Logger logger(std::move(log_sink),
                  parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    if (config_warning) {
        logger.warn("app", "Failed to load config: " + *config_warning
                    + "; using default configuration");
    }
    logger.debug("app", "Sampling every " + std::to_string(config.sampler.interval_us)
                 + "us, integration rule " + std::string{to_string(config.analyzer.integration_rule)});

    ResultWriter results(std::make_unique<StdoutSink>(), args.include_samples);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = args.analyze_path
        ? run_analyze(*args.analyze_path, config, results, logger)
        : run_profile(args, config, results, logger);

    results.flush();
    logger.flush();
    return exit_code;
}
