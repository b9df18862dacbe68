#pragma once

#include "calendar.hpp"
#include "config.hpp"
#include "event_queue.hpp"
#include "progress.hpp"
#include "remote_transport.hpp"
#include "server_session.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace rtufetch {

using EventListener = std::function<void(const ProgressEvent&)>;

struct ConnectionCheck {
    bool ok{false};
    std::string message;
};

struct RemotePreview {
    bool ok{false};
    std::string directory;
    std::vector<std::string> entries;
    std::string error_message;
};

// Owns one session slot per configured server. Each started session runs on its
// own worker thread; sessions share nothing and report exclusively through the
// event queue, which a dispatcher thread drains into the registered listeners.
class DownloadManager {
public:
    explicit DownloadManager(AppConfig config);
    DownloadManager(AppConfig config, TransportFactory factory);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    void addListener(EventListener listener);

    // Throws FetchError: UnknownServer, InvalidState while the server's previous
    // session is still active, InvalidInput for an empty station set or bad range.
    void startOne(const std::string& server_id, const DateRange& range);
    // Starts every server with stations; returns how many sessions started.
    std::size_t startAll(const DateRange& range);
    // Scheduled trigger: yesterday relative to now, one day, all eligible servers.
    std::size_t runAllNow(std::chrono::system_clock::time_point now);

    bool pause(const std::string& server_id);
    bool resume(const std::string& server_id);
    bool cancel(const std::string& server_id);
    std::size_t pauseAll();
    std::size_t resumeAll();
    std::size_t cancelAll();

    [[nodiscard]] SessionState state(const std::string& server_id) const;
    [[nodiscard]] std::vector<SessionProgress> status() const;
    [[nodiscard]] bool hasActiveSessions() const;
    [[nodiscard]] std::vector<std::string> serverIds() const;

    [[nodiscard]] ConnectionCheck testConnection(const std::string& server_id);
    [[nodiscard]] RemotePreview previewRemote(const std::string& server_id, std::size_t limit = 1000);

    // Joins finished workers and returns once every emitted event was delivered.
    void waitAll();

    // Redraws the status panel until no session is active. poll runs between redraws.
    void renderProgressLoop(std::ostream& out, const std::function<void()>& poll = {});

private:
    struct Slot {
        ServerEntry entry;
        ServerSessionPtr session;
        std::thread worker;
    };

    Slot& slotFor(const std::string& server_id);
    const Slot& slotFor(const std::string& server_id) const;
    ServerSessionPtr sessionFor(const std::string& server_id) const;
    void publish(const ProgressEvent& event);
    void dispatchLoop();

    std::string buildProgressPanel() const;
    void redrawPanel(std::ostream& out, const std::string& panel);

    AppConfig config_;
    TransportFactory factory_;
    std::vector<Slot> slots_;
    mutable std::mutex mutex_;

    EventQueue events_;
    std::thread dispatcher_;
    std::mutex listeners_mutex_;
    std::vector<EventListener> listeners_;

    std::mutex delivery_mutex_;
    std::condition_variable delivery_cv_;
    std::uint64_t published_{0};
    std::uint64_t delivered_{0};

    // Rows of the last panel frame, erased before the next one.
    std::size_t panel_lines_{0};
};

} // namespace rtufetch
