/**
 * @file config.hpp
 * @brief Profiler configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <optional>

#include "core/result.hpp"

namespace exec_profiler {

/**
 * @brief Rule used to integrate memory over time between two samples.
 */
enum class IntegrationRule : uint8_t {
    Trapezoid,      ///< Δt · (m0 + m1) / 2
    LeftRectangle   ///< Δt · m0
};

[[nodiscard]] constexpr std::string_view to_string(IntegrationRule rule) noexcept {
    switch (rule) {
        case IntegrationRule::Trapezoid:     return "trapezoid";
        case IntegrationRule::LeftRectangle: return "left";
    }
    return "unknown";
}

[[nodiscard]] std::optional<IntegrationRule> parse_integration_rule(std::string_view text) noexcept;

struct SamplerConfig {
    uint32_t interval_us = 10;
    uint32_t flush_every = 4096;        ///< Samples between explicit log flushes
};

struct SupervisorConfig {
    uint32_t timeout_ms = 0;            ///< 0 = no timeout
    uint64_t memory_limit_kb = 0;       ///< 0 = no limit
    std::filesystem::path working_dir;  ///< empty = inherit
};

struct AnalyzerConfig {
    IntegrationRule integration_rule = IntegrationRule::Trapezoid;
};

struct LogStoreConfig {
    std::filesystem::path dir = "./profiles";
    bool keep_logs = true;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< empty = stderr
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level profiler configuration.
 */
struct Config {
    SamplerConfig sampler;
    SupervisorConfig supervisor;
    AnalyzerConfig analyzer;
    LogStoreConfig log_store;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Fails with ErrorCode::ConfigError on a
 * missing file, a parse error, or an out-of-range value.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace exec_profiler
