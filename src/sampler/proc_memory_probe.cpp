/**
 * @file proc_memory_probe.cpp
 * @brief ProcMemoryProbe: reads VmRSS from /proc/<pid>/status.
 * @author Dimitris Kafetzis
 *
 * Uses raw open()/read() rather than iostreams so the errno of a failed
 * open survives; it is what separates "process gone" from "permission
 * denied".
 */

#include "sampler/memory_probe.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <fcntl.h>
#include <string>
#include <unistd.h>

namespace exec_profiler {

namespace {

constexpr std::string_view kRssKey = "VmRSS:";
constexpr std::string_view kStateKey = "State:";

ProbeFailure failure_from_errno(int err) noexcept {
    switch (err) {
        case ENOENT:
        case ESRCH:
            return ProbeFailure::ProcessGone;
        case EACCES:
        case EPERM:
            return ProbeFailure::PermissionDenied;
        default:
            return ProbeFailure::ReadError;
    }
}

std::string_view trim_leading(std::string_view text) noexcept {
    auto start = text.find_first_not_of(" \t");
    return start == std::string_view::npos ? std::string_view{} : text.substr(start);
}

/// RAII wrapper so every early return closes the descriptor.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

private:
    int fd_;
};

}  // anonymous namespace

ProbeResult parse_status_rss(std::string_view status_text) {
    bool zombie = false;

    while (!status_text.empty()) {
        auto eol = status_text.find('\n');
        auto line = status_text.substr(0, eol);
        status_text = eol == std::string_view::npos ? std::string_view{}
                                                    : status_text.substr(eol + 1);

        if (line.starts_with(kRssKey)) {
            auto value = trim_leading(line.substr(kRssKey.size()));
            uint64_t kb = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), kb);
            if (ec != std::errc{} || ptr == value.data()) {
                return ProbeFailure::ReadError;
            }
            return kb;
        }
        if (line.starts_with(kStateKey)) {
            auto state = trim_leading(line.substr(kStateKey.size()));
            zombie = !state.empty() && (state.front() == 'Z' || state.front() == 'X');
        }
    }

    return zombie ? ProbeFailure::ProcessGone : ProbeFailure::ReadError;
}

ProcMemoryProbe::ProcMemoryProbe(std::filesystem::path proc_root)
    : proc_root_(std::move(proc_root)) {}

ProbeResult ProcMemoryProbe::read_rss_kb(pid_t pid) {
    if (pid <= 0) {
        return ProbeFailure::ProcessGone;
    }

    auto path = proc_root_ / std::to_string(pid) / "status";
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return failure_from_errno(errno);
    }

    // A status file is ~1.5 KB; read until EOF in case it grows.
    std::array<char, 4096> buffer{};
    std::string text;
    while (true) {
        ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            text.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR) continue;
        return failure_from_errno(errno);
    }

    return parse_status_rss(text);
}

}  // namespace exec_profiler
