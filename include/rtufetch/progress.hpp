#pragma once

#include "calendar.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace rtufetch {

enum class SessionState {
    Idle,
    Running,
    Paused,
    Cancelling,
    Cancelled,
    Completed,
    Failed
};

[[nodiscard]] const char* toString(SessionState state);
[[nodiscard]] bool isTerminal(SessionState state);

enum class EventKind {
    SessionStateChanged,
    DirectoryProbed,
    FileSkippedExisting,
    FileDownloaded,
    FileFailed,
    DateCompleted,
    SessionCompleted,
    SessionError
};

[[nodiscard]] const char* toString(EventKind kind);

enum class ProbeOutcome {
    Found,
    NotFound,
    TransportError
};

// One outcome during a session. Fields not relevant to the kind stay empty.
struct ProgressEvent {
    EventKind kind{EventKind::SessionStateChanged};
    std::string server_id;
    Date date;
    std::string station;
    std::string filename;
    std::string remote_path;
    std::string local_path;
    std::string detail;
    ProbeOutcome probe{ProbeOutcome::NotFound};
    SessionState state{SessionState::Idle};
    std::uint64_t bytes{0};
    std::size_t entries{0};
    std::size_t downloaded{0};
    std::size_t skipped{0};
    std::size_t failed{0};
};

using EventSink = std::function<void(const ProgressEvent&)>;

// One log line per event, self-describing with the server id.
[[nodiscard]] std::string describe(const ProgressEvent& event);

// Display snapshot of one server's session.
struct SessionProgress {
    std::string server_id;
    SessionState state{SessionState::Idle};
    std::string current_date;
    std::size_t dates_done{0};
    std::size_t dates_total{0};
    std::size_t downloaded{0};
    std::size_t skipped{0};
    std::size_t failed{0};
    std::uint64_t bytes{0};
    // File being received right now; empty between transfers.
    std::string current_file;
    std::uint64_t file_received{0};
    std::uint64_t file_total{0};
    std::string error_message;
};

// Human-readable byte count: "512 B", "1.5 KB", "2.0 MB".
[[nodiscard]] std::string formatSize(std::uint64_t bytes);

// One status panel row: date bar, counters, and the file in flight if any.
[[nodiscard]] std::string formatProgressLine(const SessionProgress& progress);

} // namespace rtufetch
