/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <limits>

namespace exec_profiler {

namespace {

/**
 * @brief Read an optional integer key into @p out, keeping the default when
 *        the key is absent.
 *
 * @p qualified_key is "<section>.<key>"; the part after the dot is looked up
 * in @p table. Values below @p min or above what Field can hold are a
 * ConfigError rather than being wrapped.
 */
template <typename Field>
std::optional<Error> read_integer(toml::node_view<toml::node> table,
                                  std::string_view qualified_key,
                                  Field& out,
                                  int64_t min = 0) {
    auto key = qualified_key.substr(qualified_key.find('.') + 1);
    auto node = table[key];
    if (!node) return std::nullopt;

    auto value = node.value<int64_t>();
    if (!node.is_integer() || !value) {
        return Error{ErrorCode::ConfigError,
                     std::string{qualified_key} + " must be an integer"};
    }
    if (*value < min
        || static_cast<uint64_t>(*value) > std::numeric_limits<Field>::max()) {
        return Error{ErrorCode::ConfigError,
                     std::string{qualified_key} + " out of range: " + std::to_string(*value)};
    }
    out = static_cast<Field>(*value);
    return std::nullopt;
}

}  // anonymous namespace

std::optional<IntegrationRule> parse_integration_rule(std::string_view text) noexcept {
    if (text == "trapezoid" || text == "trapezoidal") return IntegrationRule::Trapezoid;
    if (text == "left" || text == "left_rectangle") return IntegrationRule::LeftRectangle;
    return std::nullopt;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [sampler]
        if (auto sampler = tbl["sampler"]; sampler.is_table()) {
            if (auto err = read_integer(sampler, "sampler.interval_us",
                                        config.sampler.interval_us, 1)) return *err;
            if (auto err = read_integer(sampler, "sampler.flush_every",
                                        config.sampler.flush_every)) return *err;
        }

        // [supervisor]
        if (auto supervisor = tbl["supervisor"]; supervisor.is_table()) {
            if (auto err = read_integer(supervisor, "supervisor.timeout_ms",
                                        config.supervisor.timeout_ms)) return *err;
            if (auto err = read_integer(supervisor, "supervisor.memory_limit_kb",
                                        config.supervisor.memory_limit_kb)) return *err;
            config.supervisor.working_dir =
                supervisor["working_dir"].value_or(std::string{});
        }

        // [analyzer]
        if (auto analyzer = tbl["analyzer"]; analyzer.is_table()) {
            auto rule_text = analyzer["integration_rule"].value_or(std::string{"trapezoid"});
            auto rule = parse_integration_rule(rule_text);
            if (!rule) {
                return Error{ErrorCode::ConfigError,
                             "Unknown analyzer.integration_rule: " + rule_text};
            }
            config.analyzer.integration_rule = *rule;
        }

        // [log_store]
        if (auto store = tbl["log_store"]; store.is_table()) {
            config.log_store.dir = store["dir"].value_or(std::string{"./profiles"});
            config.log_store.keep_logs = store["keep_logs"].value_or(true);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            if (auto err = read_integer(telemetry, "telemetry.max_file_size_mb",
                                        config.telemetry.max_file_size_mb, 1)) return *err;
            if (auto err = read_integer(telemetry, "telemetry.rotate_count",
                                        config.telemetry.rotate_count)) return *err;
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            if (!parse_log_level(config.telemetry.log_level)) {
                return Error{ErrorCode::ConfigError,
                             "Unknown telemetry.log_level: " + config.telemetry.log_level};
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace exec_profiler
