/**
 * @file sample_log.cpp
 * @brief Sample log writer and tolerant line-by-line reader.
 * @author Dimitris Kafetzis
 */

#include "log_store/sample_log.hpp"

#include <atomic>
#include <cctype>
#include <charconv>
#include <string>
#include <system_error>
#include <unistd.h>

namespace exec_profiler {

namespace {

std::string_view skip_space(std::string_view text) noexcept {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    return text.substr(i);
}

template <typename Int>
bool consume_integer(std::string_view& text, Int& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || ptr == text.data()) return false;
    text.remove_prefix(static_cast<size_t>(ptr - text.data()));
    return true;
}

}  // anonymous namespace

// ── SampleLogWriter ──────────────────────────

SampleLogWriter::SampleLogWriter(std::filesystem::path path, std::ofstream file)
    : path_(std::move(path)), file_(std::move(file)) {}

SampleLogWriter::~SampleLogWriter() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

Result<SampleLogWriter> SampleLogWriter::create(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::LogIoFailure,
                         "Cannot create log directory " + path.parent_path().string()
                         + ": " + ec.message()};
        }
    }

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return Error{ErrorCode::LogIoFailure, "Cannot open sample log " + path.string()};
    }
    return SampleLogWriter(path, std::move(file));
}

Result<void> SampleLogWriter::append(const Sample& sample) {
    if (!file_.is_open()) {
        return Error{ErrorCode::LogIoFailure, "Sample log is closed: " + path_.string()};
    }
    file_ << sample.timestamp_ns << ' ' << sample.resident_memory_kb << '\n';
    if (file_.fail()) {
        return Error{ErrorCode::LogIoFailure, "Write failed on sample log " + path_.string()};
    }
    ++appended_;
    return {};
}

void SampleLogWriter::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

Result<void> SampleLogWriter::close() {
    if (!file_.is_open()) return {};
    file_.flush();
    bool failed = file_.fail();
    file_.close();
    if (failed || file_.fail()) {
        return Error{ErrorCode::LogIoFailure, "Failed to close sample log " + path_.string()};
    }
    return {};
}

// ── SampleBuffer ─────────────────────────────

Result<void> SampleBuffer::append(const Sample& sample) {
    samples_.push_back(sample);
    return {};
}

// ── Reading ──────────────────────────────────

std::optional<Sample> parse_sample_line(std::string_view line) {
    Sample sample;
    auto rest = skip_space(line);
    if (!consume_integer(rest, sample.timestamp_ns) || sample.timestamp_ns < 0) {
        return std::nullopt;
    }

    // The two fields must be separated by at least one blank
    if (rest.empty() || !std::isspace(static_cast<unsigned char>(rest.front()))) {
        return std::nullopt;
    }
    rest = skip_space(rest);
    if (!consume_integer(rest, sample.resident_memory_kb)) return std::nullopt;

    if (!skip_space(rest).empty()) return std::nullopt;
    return sample;
}

std::string format_sample_line(const Sample& sample) {
    return std::to_string(sample.timestamp_ns) + ' '
         + std::to_string(sample.resident_memory_kb);
}

Result<LogContents> read_sample_log(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return Error{ErrorCode::LogIoFailure, "Cannot open sample log " + path.string()};
    }

    LogContents contents;
    std::string line;
    while (std::getline(ifs, line)) {
        if (skip_space(line).empty()) continue;
        if (auto sample = parse_sample_line(line)) {
            contents.samples.push_back(*sample);
        } else {
            ++contents.skipped_entries;
        }
    }
    return contents;
}

std::filesystem::path make_log_path(const std::filesystem::path& dir, std::string_view tag) {
    static std::atomic<uint64_t> sequence{0};
    auto seq = sequence.fetch_add(1, std::memory_order_relaxed);
    auto name = std::string{tag} + '-' + std::to_string(::getpid()) + '-'
              + std::to_string(monotonic_now_ns()) + '-' + std::to_string(seq) + ".log";
    return dir / name;
}

}  // namespace exec_profiler
