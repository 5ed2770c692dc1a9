/**
 * @file result_writer.cpp
 * @brief ResultWriter implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/result_writer.hpp"

#include "core/json.hpp"

#include <iomanip>
#include <sstream>

namespace exec_profiler {

namespace {

void write_body(std::ostringstream& oss, const ExecutionResult& result, bool include_samples) {
    const auto& s = result.summary;
    oss << R"(,"exit_status":)" << result.exit_status
        << R"(,"termination":")" << to_string(result.termination) << "\""
        << R"(,"sampler_stop":")" << to_string(result.sampler_stop) << "\""
        << R"(,"peak_memory_kb":)" << s.peak_memory_kb
        << std::setprecision(9)
        << R"(,"integral_kb_s":)" << s.integral_kb_seconds()
        << R"(,"duration_s":)" << s.duration_seconds()
        << R"(,"wall_time_s":)"
        << static_cast<double>(result.wall_time.count()) / kNanosPerSecond
        << R"(,"sample_count":)" << s.sample_count
        << R"(,"skipped_entries":)" << s.skipped_entries
        << R"(,"log":")" << json_escape(result.log_path.string()) << "\""
        << R"(,"stdout":")" << json_escape(result.stdout_text) << "\""
        << R"(,"stderr":")" << json_escape(result.stderr_text) << "\"";

    if (include_samples) {
        oss << R"(,"samples":[)";
        bool first = true;
        for (const auto& sample : result.samples) {
            if (!first) oss << ',';
            first = false;
            oss << '[' << sample.timestamp_ns << ',' << sample.resident_memory_kb << ']';
        }
        oss << ']';
    }
}

}  // anonymous namespace

std::string to_json(const ExecutionResult& result, bool include_samples) {
    std::ostringstream oss;
    oss << R"({"event":"execution")";
    write_body(oss, result, include_samples);
    oss << "}";
    return oss.str();
}

ResultWriter::ResultWriter(std::unique_ptr<ILogSink> sink, bool include_samples)
    : sink_(std::move(sink)), include_samples_(include_samples) {}

void ResultWriter::record_execution(const ExecutionResult& result) {
    emit(to_json(result, include_samples_));
}

void ResultWriter::record_execution(const ExecutionResult& result, uint32_t run_index) {
    std::ostringstream oss;
    oss << R"({"event":"execution","run":)" << run_index;
    write_body(oss, result, include_samples_);
    oss << "}";
    emit(oss.str());
}

void ResultWriter::record_error(const Error& error) {
    std::ostringstream oss;
    oss << R"({"event":"error")"
        << R"(,"code":")" << to_string(error.code) << "\""
        << R"(,"message":")" << json_escape(error.message) << "\""
        << "}";
    emit(oss.str());
}

void ResultWriter::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void ResultWriter::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace exec_profiler
