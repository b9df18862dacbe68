#include "rtufetch/server_session.hpp"
#include "rtufetch/error.hpp"
#include "rtufetch/control_token.hpp"
#include "rtufetch/file_matcher.hpp"
#include "rtufetch/path_resolver.hpp"
#include "rtufetch/remote_lister.hpp"
#include "rtufetch/transfer_engine.hpp"

#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rtufetch {

class ServerSession::Impl {
public:
    Impl(SessionRequest request, RemoteTransportPtr transport, EventSink sink)
        : request_(std::move(request)),
        transport_(std::move(transport)),
        sink_(std::move(sink)) {
        server_id_ = request_.server.id.empty() ? request_.server.identity() : request_.server.id;
    }

    ~Impl() {
        if (transport_) {
            transport_->disconnect();
        }
    }

    void start() {
        std::lock_guard<std::mutex> transition(transition_mutex_);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Idle) {
                throw FetchError(ErrorCode::InvalidState, server_id_,
                                 fmt::format("Cannot start a session that is {}", toString(state_)));
            }
            if (!transport_) {
                throw FetchError(ErrorCode::InvalidInput, server_id_, "Session has no transport");
            }

            validateStations(request_.stations);
            request_.range.validate();

            state_ = SessionState::Running;
            dates_total_ = request_.range.dayCount();
        }

        spdlog::info("[{}] session started for {} station(s), {} .. {}",
                     server_id_, request_.stations.size(),
                     formatDate(request_.range.firstDay()), formatDate(request_.range.lastDay()));
        emitState(SessionState::Running);
    }

    void run() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == SessionState::Idle || isTerminal(state_)) {
                throw FetchError(ErrorCode::InvalidState, server_id_,
                                 fmt::format("Cannot run a session that is {}", toString(state_)));
            }
        }

        if (!token_.checkpoint()) {
            finish();
            return;
        }

        try {
            transport_->connect();
        } catch (const std::exception& e) {
            if (token_.cancelRequested()) {
                finish();
            } else {
                registerFatalError(e.what());
            }
            return;
        }

        TransferEngine engine(*transport_);
        const Date last = request_.range.lastDay();
        for (Date day = request_.range.firstDay(); day <= last; day = day.next()) {
            if (!token_.checkpoint()) {
                break;
            }

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                current_date_ = day;
                has_current_date_ = true;
            }

            if (!processDate(day, engine)) {
                break;
            }

            std::lock_guard<std::mutex> lock(state_mutex_);
            ++dates_done_;
        }

        transport_->disconnect();
        finish();
    }

    bool pause() {
        std::lock_guard<std::mutex> transition(transition_mutex_);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Running) {
                return false;
            }
            state_ = SessionState::Paused;
            token_.requestPause();
        }
        spdlog::info("[{}] paused", server_id_);
        emitState(SessionState::Paused);
        return true;
    }

    bool resume() {
        std::lock_guard<std::mutex> transition(transition_mutex_);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Paused) {
                return false;
            }
            state_ = SessionState::Running;
            token_.requestResume();
        }
        spdlog::info("[{}] resumed", server_id_);
        emitState(SessionState::Running);
        return true;
    }

    bool cancel() {
        std::lock_guard<std::mutex> transition(transition_mutex_);
        SessionState next;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == SessionState::Idle) {
                next = SessionState::Cancelled;
            } else if (state_ == SessionState::Running || state_ == SessionState::Paused) {
                next = SessionState::Cancelling;
            } else {
                return false;
            }
            state_ = next;
            token_.requestCancel();
        }
        spdlog::info("[{}] cancel requested", server_id_);
        emitState(next);
        return true;
    }

    [[nodiscard]] SessionState state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    [[nodiscard]] SessionProgress getProgress() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        SessionProgress progress;
        progress.server_id = server_id_;
        progress.state = state_;
        progress.current_date = has_current_date_ ? formatDate(current_date_) : std::string{};
        progress.dates_done = dates_done_;
        progress.dates_total = dates_total_;
        progress.downloaded = downloaded_;
        progress.skipped = skipped_;
        progress.failed = failed_;
        progress.bytes = bytes_;
        progress.current_file = current_file_;
        progress.file_received = file_received_;
        progress.file_total = file_total_;
        progress.error_message = error_message_;
        return progress;
    }

    [[nodiscard]] bool isRunning() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_ == SessionState::Running || state_ == SessionState::Paused ||
               state_ == SessionState::Cancelling;
    }

    [[nodiscard]] bool hasError() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_ == SessionState::Failed;
    }

    [[nodiscard]] const std::string& serverId() const { return server_id_; }

private:
    struct DateTally {
        std::size_t downloaded{0};
        std::size_t skipped{0};
        std::size_t failed{0};
    };

    // Returns false when cancellation interrupted the date.
    bool processDate(const Date& day, TransferEngine& engine) {
        const auto candidates = candidatePaths(request_.server.remote_base, day,
                                               transport_->trailingSlashSensitive());

        std::string directory;
        std::vector<std::string> entries;
        bool found = false;
        for (const auto& candidate : candidates) {
            ListResult listing = listRemoteDirectory(*transport_, candidate);

            ProgressEvent probe = makeEvent(EventKind::DirectoryProbed, day);
            probe.remote_path = candidate;
            if (listing.status == ListStatus::Listed) {
                probe.probe = ProbeOutcome::Found;
                probe.entries = listing.entries.size();
                emit(probe);
                directory = candidate;
                entries = std::move(listing.entries);
                found = true;
                break;
            }
            if (listing.status == ListStatus::NotFound) {
                probe.probe = ProbeOutcome::NotFound;
                emit(probe);
                continue;
            }

            probe.probe = ProbeOutcome::TransportError;
            probe.detail = listing.error_message;
            emit(probe);

            spdlog::warn("[{}] {}: listing {} failed: {}", server_id_, formatDate(day),
                         candidate, listing.error_message);
            ProgressEvent aborted = makeEvent(EventKind::DateCompleted, day);
            aborted.detail = "listing " + candidate + " failed: " + listing.error_message;
            emit(aborted);
            return true;
        }

        DateTally tally;
        if (!found) {
            spdlog::debug("[{}] {}: no remote directory", server_id_, formatDate(day));
            emitDateCompleted(day, tally);
            return true;
        }

        for (const auto& station : request_.stations) {
            DateTally station_tally;
            for (const auto& name : entries) {
                if (!matchesStation(station, name)) {
                    continue;
                }
                if (!token_.checkpoint()) {
                    return false;
                }
                fetchOne(day, station, directory, name, engine, station_tally);
            }

            if (station_tally.downloaded + station_tally.skipped + station_tally.failed > 0) {
                spdlog::info("[{}] {} station {}: {} ok, {} skipped, {} failed",
                             server_id_, formatDate(day), station,
                             station_tally.downloaded, station_tally.skipped, station_tally.failed);
            }
            tally.downloaded += station_tally.downloaded;
            tally.skipped += station_tally.skipped;
            tally.failed += station_tally.failed;
        }

        emitDateCompleted(day, tally);
        return true;
    }

    void fetchOne(const Date& day, const std::string& station, const std::string& directory,
                  const std::string& name, TransferEngine& engine, DateTally& tally) {
        const std::string remote_path = joinRemotePath(directory, name);
        const auto local_path = localFilePath(request_.local_base, request_.state_label,
                                              station, day, name);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            current_file_ = name;
            file_received_ = 0;
            file_total_ = 0;
        }
        const FetchResult result = engine.fetch(remote_path, local_path,
                                                [this](std::uint64_t received, std::uint64_t total) {
                                                    std::lock_guard<std::mutex> lock(state_mutex_);
                                                    file_received_ = received;
                                                    file_total_ = total;
                                                });

        ProgressEvent event = makeEvent(EventKind::FileDownloaded, day);
        event.station = station;
        event.filename = name;
        event.remote_path = remote_path;
        event.local_path = local_path.string();

        switch (result.status) {
            case FetchStatus::Fetched:
                event.bytes = result.bytes;
                ++tally.downloaded;
                break;
            case FetchStatus::SkippedExisting:
                event.kind = EventKind::FileSkippedExisting;
                ++tally.skipped;
                break;
            case FetchStatus::Failed:
                event.kind = EventKind::FileFailed;
                event.detail = result.reason;
                ++tally.failed;
                spdlog::warn("[{}] {} failed: {}", server_id_, remote_path, result.reason);
                break;
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            current_file_.clear();
            file_received_ = 0;
            file_total_ = 0;
            switch (result.status) {
                case FetchStatus::Fetched:
                    ++downloaded_;
                    bytes_ += result.bytes;
                    break;
                case FetchStatus::SkippedExisting:
                    ++skipped_;
                    break;
                case FetchStatus::Failed:
                    ++failed_;
                    break;
            }
        }
        emit(event);
    }

    void emitDateCompleted(const Date& day, const DateTally& tally) {
        ProgressEvent event = makeEvent(EventKind::DateCompleted, day);
        event.downloaded = tally.downloaded;
        event.skipped = tally.skipped;
        event.failed = tally.failed;
        emit(event);
    }

    void finish() {
        std::lock_guard<std::mutex> transition(transition_mutex_);
        SessionState final_state;
        ProgressEvent summary = makeEvent(EventKind::SessionCompleted, Date{});
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            final_state = token_.cancelRequested() ? SessionState::Cancelled : SessionState::Completed;
            state_ = final_state;
            summary.state = final_state;
            summary.downloaded = downloaded_;
            summary.skipped = skipped_;
            summary.failed = failed_;
            summary.bytes = bytes_;
        }

        spdlog::info("[{}] {}: {} downloaded, {} skipped, {} failed",
                     server_id_, toString(final_state), summary.downloaded, summary.skipped, summary.failed);
        emitState(final_state);
        emit(summary);
    }

    void registerFatalError(const std::string& message) {
        std::lock_guard<std::mutex> transition(transition_mutex_);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = SessionState::Failed;
            if (error_message_.empty()) {
                error_message_ = message;
            }
        }

        spdlog::error("[{}] session failed: {}", server_id_, message);
        ProgressEvent event = makeEvent(EventKind::SessionError, Date{});
        event.detail = message;
        emit(event);
        emitState(SessionState::Failed);
    }

    ProgressEvent makeEvent(EventKind kind, const Date& day) const {
        ProgressEvent event;
        event.kind = kind;
        event.server_id = server_id_;
        event.date = day;
        return event;
    }

    void emitState(SessionState state) {
        ProgressEvent event = makeEvent(EventKind::SessionStateChanged, Date{});
        event.state = state;
        emit(event);
    }

    void emit(const ProgressEvent& event) {
        if (sink_) {
            sink_(event);
        }
    }

    SessionRequest request_;
    RemoteTransportPtr transport_;
    EventSink sink_;
    std::string server_id_;
    ControlToken token_;

    // Held across a state change and its SessionStateChanged event so listeners
    // see transitions in the order they happened. Taken before state_mutex_.
    std::mutex transition_mutex_;
    mutable std::mutex state_mutex_;
    SessionState state_{SessionState::Idle};
    Date current_date_;
    bool has_current_date_{false};
    std::size_t dates_done_{0};
    std::size_t dates_total_{0};
    std::size_t downloaded_{0};
    std::size_t skipped_{0};
    std::size_t failed_{0};
    std::uint64_t bytes_{0};
    std::string current_file_;
    std::uint64_t file_received_{0};
    std::uint64_t file_total_{0};
    std::string error_message_;
};

ServerSession::ServerSession(SessionRequest request, RemoteTransportPtr transport, EventSink sink)
    : impl_(std::make_unique<Impl>(std::move(request), std::move(transport), std::move(sink))) {}

ServerSession::~ServerSession() = default;

void ServerSession::start() { impl_->start(); }

void ServerSession::run() { impl_->run(); }

bool ServerSession::pause() { return impl_->pause(); }

bool ServerSession::resume() { return impl_->resume(); }

bool ServerSession::cancel() { return impl_->cancel(); }

SessionState ServerSession::state() const { return impl_->state(); }

SessionProgress ServerSession::getProgress() const { return impl_->getProgress(); }

bool ServerSession::isRunning() const { return impl_->isRunning(); }

bool ServerSession::hasError() const { return impl_->hasError(); }

const std::string& ServerSession::serverId() const { return impl_->serverId(); }

} // namespace rtufetch
