#include "rtufetch/progress.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace rtufetch {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Idle:       return "Idle";
        case SessionState::Running:    return "Running";
        case SessionState::Paused:     return "Paused";
        case SessionState::Cancelling: return "Cancelling";
        case SessionState::Cancelled:  return "Cancelled";
        case SessionState::Completed:  return "Completed";
        case SessionState::Failed:     return "Failed";
        default:                       return "Unknown";
    }
}

bool isTerminal(SessionState state) {
    return state == SessionState::Cancelled || state == SessionState::Completed ||
           state == SessionState::Failed;
}

const char* toString(EventKind kind) {
    switch (kind) {
        case EventKind::SessionStateChanged: return "SessionStateChanged";
        case EventKind::DirectoryProbed:     return "DirectoryProbed";
        case EventKind::FileSkippedExisting: return "FileSkippedExisting";
        case EventKind::FileDownloaded:      return "FileDownloaded";
        case EventKind::FileFailed:          return "FileFailed";
        case EventKind::DateCompleted:       return "DateCompleted";
        case EventKind::SessionCompleted:    return "SessionCompleted";
        case EventKind::SessionError:        return "SessionError";
        default:                             return "Unknown";
    }
}

std::string describe(const ProgressEvent& event) {
    const std::string date = formatDate(event.date);
    switch (event.kind) {
        case EventKind::SessionStateChanged:
            return fmt::format("{}: state -> {}", event.server_id, toString(event.state));
        case EventKind::DirectoryProbed:
            switch (event.probe) {
                case ProbeOutcome::Found:
                    return fmt::format("{}: {} found {} ({} entries)",
                                       event.server_id, date, event.remote_path, event.entries);
                case ProbeOutcome::NotFound:
                    return fmt::format("{}: {} no directory at {}", event.server_id, date, event.remote_path);
                default:
                    return fmt::format("{}: {} listing {} failed: {}",
                                       event.server_id, date, event.remote_path, event.detail);
            }
        case EventKind::FileSkippedExisting:
            return fmt::format("{}: {} already present at {}", event.server_id, event.filename, event.local_path);
        case EventKind::FileDownloaded:
            return fmt::format("{}: downloaded {} ({} bytes) -> {}",
                               event.server_id, event.filename, event.bytes, event.local_path);
        case EventKind::FileFailed:
            return fmt::format("{}: failed {}: {}", event.server_id, event.remote_path, event.detail);
        case EventKind::DateCompleted:
            if (!event.detail.empty()) {
                return fmt::format("{}: {} aborted: {}", event.server_id, date, event.detail);
            }
            return fmt::format("{}: {} done: {} ok, {} skipped, {} failed",
                               event.server_id, date, event.downloaded, event.skipped, event.failed);
        case EventKind::SessionCompleted:
            return fmt::format("{}: {}: {} ok, {} skipped, {} failed",
                               event.server_id, toString(event.state), event.downloaded, event.skipped, event.failed);
        case EventKind::SessionError:
            return fmt::format("{}: error: {}", event.server_id, event.detail);
        default:
            return fmt::format("{}: {}", event.server_id, toString(event.kind));
    }
}

std::string formatSize(std::uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr std::size_t unit_count = sizeof(units) / sizeof(units[0]);

    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < unit_count) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

namespace {

constexpr std::size_t kBarWidth = 20;

std::string dateBar(std::size_t done, std::size_t total) {
    const std::size_t filled = total == 0 ? 0 : std::min(kBarWidth, done * kBarWidth / total);
    std::string bar;
    for (std::size_t i = 0; i < kBarWidth; ++i) {
        bar += i < filled ? "#" : ".";
    }
    return bar;
}

std::string fileProgress(const SessionProgress& progress) {
    if (progress.current_file.empty()) {
        return {};
    }
    if (progress.file_total > 0) {
        return fmt::format("  <- {} {}/{}", progress.current_file,
                           formatSize(progress.file_received), formatSize(progress.file_total));
    }
    return fmt::format("  <- {} {}", progress.current_file, formatSize(progress.file_received));
}

} // namespace

std::string formatProgressLine(const SessionProgress& progress) {
    std::string name = progress.server_id.empty() ? "(unnamed)" : progress.server_id.substr(0, 20);

    if (progress.dates_total == 0) {
        return fmt::format("{:<20} [{}]", name, toString(progress.state));
    }

    const std::size_t percent = std::min<std::size_t>(100, progress.dates_done * 100 / progress.dates_total);
    std::string line = fmt::format("{:<20} [{}] {:>3}% {:<10} {:<10} ok {} / skip {} / fail {} ({})",
                                   name,
                                   dateBar(progress.dates_done, progress.dates_total),
                                   percent,
                                   toString(progress.state),
                                   progress.current_date,
                                   progress.downloaded,
                                   progress.skipped,
                                   progress.failed,
                                   formatSize(progress.bytes));

    switch (progress.state) {
        case SessionState::Failed:
            line += fmt::format("  FAILED: {}", progress.error_message);
            break;
        case SessionState::Completed:
            line += "  done";
            break;
        default:
            line += fileProgress(progress);
            break;
    }
    return line;
}

} // namespace rtufetch
