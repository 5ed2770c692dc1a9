/**
 * @file json.hpp
 * @brief Minimal JSON string escaping for hand-built NDJSON lines.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <string>
#include <string_view>

namespace exec_profiler {

/**
 * @brief Escape a string for embedding between JSON double quotes.
 *
 * Control characters become \uXXXX; bytes >= 0x80 pass through untouched,
 * so valid UTF-8 output from the child stays valid.
 */
[[nodiscard]] std::string json_escape(std::string_view text);

}  // namespace exec_profiler
