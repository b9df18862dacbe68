#include "rtufetch/download_manager.hpp"
#include "rtufetch/error.hpp"
#include "rtufetch/ftp_transport.hpp"
#include "rtufetch/remote_lister.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rtufetch {

namespace {

TransportFactory ftpFactory(const TransportOptions& options) {
    return [options](const ServerConfig& server) { return makeFtpTransport(server, options); };
}

} // namespace

DownloadManager::DownloadManager(AppConfig config)
    : DownloadManager(config, ftpFactory(config.transport)) {}

DownloadManager::DownloadManager(AppConfig config, TransportFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
    slots_.reserve(config_.servers.size());
    for (const auto& entry : config_.servers) {
        Slot slot;
        slot.entry = entry;
        if (slot.entry.server.id.empty()) {
            slot.entry.server.id = slot.entry.server.identity();
        }
        slots_.push_back(std::move(slot));
    }

    dispatcher_ = std::thread([this]() { dispatchLoop(); });
}

DownloadManager::~DownloadManager() {
    cancelAll();
    waitAll();
    events_.close();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

void DownloadManager::addListener(EventListener listener) {
    if (listener) {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_.push_back(std::move(listener));
    }
}

void DownloadManager::startOne(const std::string& server_id, const DateRange& range) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot& slot = slotFor(server_id);

    if (slot.session && !isTerminal(slot.session->state())) {
        throw FetchError(ErrorCode::InvalidState, server_id,
                         fmt::format("Session is still {}", toString(slot.session->state())));
    }
    if (slot.worker.joinable()) {
        slot.worker.join();
    }

    SessionRequest request{slot.entry.server, slot.entry.stations, range,
                           slot.entry.local_base, slot.entry.state_label};
    auto session = std::make_shared<ServerSession>(
        std::move(request),
        factory_(slot.entry.server),
        [this](const ProgressEvent& event) { publish(event); });

    session->start();

    slot.session = session;
    slot.worker = std::thread([session]() {
        try {
            session->run();
        } catch (const std::exception& e) {
            spdlog::error("[{}] session aborted: {}", session->serverId(), e.what());
        }
    });
}

std::size_t DownloadManager::startAll(const DateRange& range) {
    std::size_t started = 0;
    for (const auto& id : serverIds()) {
        try {
            startOne(id, range);
            ++started;
        } catch (const FetchError& e) {
            spdlog::warn("[{}] not started: {}", id, e.what());
        }
    }
    return started;
}

std::size_t DownloadManager::runAllNow(std::chrono::system_clock::time_point now) {
    const Date yesterday = yesterdayOf(now);
    const DateRange range = DateRange::singleDay(yesterday);
    spdlog::info("Scheduled run for {}", formatDate(yesterday));

    std::vector<std::string> eligible;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& slot : slots_) {
            const auto& id = slot.entry.server.id;
            if (slot.entry.stations.empty()) {
                spdlog::info("[{}] scheduled: no stations configured", id);
                continue;
            }
            if (!slot.entry.auto_midnight) {
                spdlog::info("[{}] scheduled: auto download disabled", id);
                continue;
            }
            if (slot.session && !isTerminal(slot.session->state())) {
                spdlog::info("[{}] scheduled: previous session still {}", id,
                             toString(slot.session->state()));
                continue;
            }
            eligible.push_back(id);
        }
    }

    std::size_t started = 0;
    for (const auto& id : eligible) {
        try {
            startOne(id, range);
            ++started;
        } catch (const FetchError& e) {
            spdlog::warn("[{}] scheduled run not started: {}", id, e.what());
        }
    }
    return started;
}

bool DownloadManager::pause(const std::string& server_id) {
    auto session = sessionFor(server_id);
    return session && session->pause();
}

bool DownloadManager::resume(const std::string& server_id) {
    auto session = sessionFor(server_id);
    return session && session->resume();
}

bool DownloadManager::cancel(const std::string& server_id) {
    auto session = sessionFor(server_id);
    return session && session->cancel();
}

std::size_t DownloadManager::pauseAll() {
    std::size_t count = 0;
    for (const auto& id : serverIds()) {
        count += pause(id) ? 1 : 0;
    }
    return count;
}

std::size_t DownloadManager::resumeAll() {
    std::size_t count = 0;
    for (const auto& id : serverIds()) {
        count += resume(id) ? 1 : 0;
    }
    return count;
}

std::size_t DownloadManager::cancelAll() {
    std::size_t count = 0;
    for (const auto& id : serverIds()) {
        count += cancel(id) ? 1 : 0;
    }
    return count;
}

SessionState DownloadManager::state(const std::string& server_id) const {
    auto session = sessionFor(server_id);
    return session ? session->state() : SessionState::Idle;
}

std::vector<SessionProgress> DownloadManager::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionProgress> result;
    result.reserve(slots_.size());
    for (const auto& slot : slots_) {
        if (slot.session) {
            result.push_back(slot.session->getProgress());
        } else {
            SessionProgress idle;
            idle.server_id = slot.entry.server.id;
            result.push_back(idle);
        }
    }
    return result;
}

bool DownloadManager::hasActiveSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& slot : slots_) {
        if (slot.session && slot.session->isRunning()) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> DownloadManager::serverIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(slots_.size());
    for (const auto& slot : slots_) {
        ids.push_back(slot.entry.server.id);
    }
    return ids;
}

ConnectionCheck DownloadManager::testConnection(const std::string& server_id) {
    ServerConfig server;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = slotFor(server_id).entry.server;
    }

    ConnectionCheck check;
    try {
        auto transport = factory_(server);
        transport->connect();
        transport->disconnect();
        check.ok = true;
        check.message = fmt::format("Connected to {}:{}", server.host, server.port);
        spdlog::info("[{}] {}", server_id, check.message);
    } catch (const std::exception& e) {
        check.message = fmt::format("Connect failed to {}:{} -> {}", server.host, server.port, e.what());
        spdlog::warn("[{}] {}", server_id, check.message);
    }
    return check;
}

RemotePreview DownloadManager::previewRemote(const std::string& server_id, std::size_t limit) {
    ServerConfig server;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = slotFor(server_id).entry.server;
    }

    RemotePreview preview;
    try {
        auto transport = factory_(server);
        transport->connect();

        preview.directory = server.remote_base;
        ListResult listing = listRemoteDirectory(*transport, preview.directory);
        if (listing.status == ListStatus::NotFound) {
            preview.directory = "/";
            listing = listRemoteDirectory(*transport, preview.directory);
        }
        transport->disconnect();

        if (listing.status == ListStatus::Listed) {
            preview.ok = true;
            preview.entries = std::move(listing.entries);
            if (preview.entries.size() > limit) {
                preview.entries.resize(limit);
            }
            spdlog::info("[{}] previewed {} ({} entries)", server_id, preview.directory, preview.entries.size());
        } else {
            preview.error_message = listing.status == ListStatus::NotFound
                ? "Remote directory not found"
                : listing.error_message;
        }
    } catch (const std::exception& e) {
        preview.error_message = e.what();
    }

    if (!preview.ok) {
        spdlog::warn("[{}] preview failed for {}: {}", server_id, server.remote_base, preview.error_message);
    }
    return preview;
}

void DownloadManager::waitAll() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& slot : slots_) {
            if (slot.worker.joinable()) {
                workers.push_back(std::move(slot.worker));
            }
        }
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::unique_lock<std::mutex> lock(delivery_mutex_);
    delivery_cv_.wait(lock, [this] { return delivered_ == published_; });
}

void DownloadManager::renderProgressLoop(std::ostream& out, const std::function<void()>& poll) {
    panel_lines_ = 0;
    while (true) {
        redrawPanel(out, buildProgressPanel());

        if (!hasActiveSessions()) {
            break;
        }

        if (poll) {
            poll();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    out << std::flush;
}

DownloadManager::Slot& DownloadManager::slotFor(const std::string& server_id) {
    auto it = std::find_if(slots_.begin(), slots_.end(),
                           [&](const Slot& slot) { return slot.entry.server.id == server_id; });
    if (it == slots_.end()) {
        throw FetchError(ErrorCode::UnknownServer, server_id, "No server configured with this id");
    }
    return *it;
}

const DownloadManager::Slot& DownloadManager::slotFor(const std::string& server_id) const {
    return const_cast<DownloadManager*>(this)->slotFor(server_id);
}

ServerSessionPtr DownloadManager::sessionFor(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slotFor(server_id).session;
}

void DownloadManager::publish(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(delivery_mutex_);
        ++published_;
    }
    events_.push(event);
}

void DownloadManager::dispatchLoop() {
    ProgressEvent event;
    while (events_.pop(event)) {
        std::vector<EventListener> listeners;
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            listeners = listeners_;
        }

        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                spdlog::error("Event listener failed on {}: {}", toString(event.kind), e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(delivery_mutex_);
            ++delivered_;
        }
        delivery_cv_.notify_all();
    }
}

std::string DownloadManager::buildProgressPanel() const {
    const auto sessions = status();

    std::string panel;
    panel.reserve(sessions.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("rtufetch ({} servers)\n", sessions.size());
    panel.append("--------------------------------------------------\n");

    std::size_t downloaded_all = 0;
    std::size_t skipped_all = 0;
    std::size_t failed_all = 0;

    for (const auto& progress : sessions) {
        panel += formatProgressLine(progress);
        panel.push_back('\n');

        downloaded_all += progress.downloaded;
        skipped_all += progress.skipped;
        failed_all += progress.failed;
    }

    panel.append("--------------------------------------------------\n");
    panel += fmt::format("Overall: {} downloaded, {} skipped, {} failed\n",
                         downloaded_all, skipped_all, failed_all);
    panel.append("==================================================\n");

    return panel;
}

void DownloadManager::redrawPanel(std::ostream& out, const std::string& panel) {
    // Move the cursor back over the previous frame and clear to the end of screen.
    if (panel_lines_ > 0) {
        out << fmt::format("\x1b[{}F\x1b[J", panel_lines_);
    }
    out << panel << std::flush;
    panel_lines_ = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

} // namespace rtufetch
