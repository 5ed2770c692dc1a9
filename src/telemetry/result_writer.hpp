/**
 * @file result_writer.hpp
 * @brief Serializes execution results as NDJSON records for the caller.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace exec_profiler {

/**
 * @brief Render one ExecutionResult as a single-line JSON object.
 *
 * Samples are included as [[timestamp_ns, kb], ...] only when requested;
 * a three-second run at 10 µs produces hundreds of thousands of them.
 */
[[nodiscard]] std::string to_json(const ExecutionResult& result, bool include_samples = false);

/**
 * @brief Thread-safe emitter of result and error records.
 */
class ResultWriter {
public:
    explicit ResultWriter(std::unique_ptr<ILogSink> sink, bool include_samples = false);

    void record_execution(const ExecutionResult& result);
    void record_execution(const ExecutionResult& result, uint32_t run_index);
    void record_error(const Error& error);

    void flush();

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    bool include_samples_;
    std::mutex write_mutex_;
};

}  // namespace exec_profiler
