#include "rtufetch/server_session.hpp"
#include "rtufetch/error.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fake_transport.hpp"

using namespace rtufetch;
namespace fs = std::filesystem;

namespace {

class EventLog {
public:
    EventSink sink() {
        return [this](const ProgressEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        };
    }

    std::vector<ProgressEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<ProgressEvent> ofKind(EventKind kind) const {
        std::vector<ProgressEvent> result;
        for (const auto& event : events()) {
            if (event.kind == kind) {
                result.push_back(event);
            }
        }
        return result;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ProgressEvent> events_;
};

std::set<std::string> filesUnder(const fs::path& root) {
    std::set<std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files.insert(fs::relative(entry.path(), root).generic_string());
        }
    }
    return files;
}

void populateTwoDays(test::FakeServer& server) {
    server.addFile("/data/2024/12/15", "A1_1500.txt", "a1-15");
    server.addFile("/data/2024/12/15", "A2_1500.txt", "a2-15");
    server.addFile("/data/2024/12/15", "B1_1500.txt", "b1-15");
    server.addFile("/data/2024/12/16122024", "A1_1600.txt", "a1-16");
    server.addFile("/data/2024/12/16122024", "A2_1600.TXT", "a2-16");
    server.addFile("/data/2024/12/16122024", "A2_1600.log", "log");
}

} // namespace

class ServerSessionTest : public ::testing::Test {
protected:
    ServerSessionTest()
        : dir_("server_session"),
          remote_(std::make_shared<test::FakeServer>()) {}

    std::shared_ptr<ServerSession> makeSession(std::vector<std::string> stations, DateRange range,
                                               const fs::path& local_base,
                                               const std::shared_ptr<test::FakeServer>& remote) {
        ServerConfig server;
        server.id = "kerala";
        server.host = "ftp.example.org";
        server.remote_base = "/data";

        SessionRequest request{server, std::move(stations), range, local_base.string(), "Kerala"};
        return std::make_shared<ServerSession>(std::move(request),
                                               std::make_unique<test::FakeTransport>(remote),
                                               log_.sink());
    }

    std::shared_ptr<ServerSession> makeSession(std::vector<std::string> stations, DateRange range) {
        return makeSession(std::move(stations), range, dir_.path(), remote_);
    }

    static DateRange day(int d) {
        return DateRange::singleDay(Date{2024, 12, d});
    }

    test::TempDir dir_;
    std::shared_ptr<test::FakeServer> remote_;
    EventLog log_;
};

TEST_F(ServerSessionTest, FallsBackToSecondLayout) {
    remote_->addFile("/data/2024/12/15122024", "STAT01_2412150000.txt", "payload");
    remote_->addFile("/data/2024/12/15122024", "OTHER_1.txt", "other");

    auto session = makeSession({"STAT01"}, day(15));
    session->start();
    session->run();

    EXPECT_EQ(session->state(), SessionState::Completed);
    EXPECT_EQ(remote_->listedPaths(),
              (std::vector<std::string>{"/data/2024/12/15/", "/data/2024/12/15122024/"}));
    EXPECT_EQ(remote_->retrievedPaths(),
              (std::vector<std::string>{"/data/2024/12/15122024/STAT01_2412150000.txt"}));
    EXPECT_EQ(test::readFile(dir_.path() / "Kerala/STAT01/2024/12/15/STAT01_2412150000.txt"), "payload");

    const auto probes = log_.ofKind(EventKind::DirectoryProbed);
    ASSERT_EQ(probes.size(), 2u);
    EXPECT_EQ(probes[0].probe, ProbeOutcome::NotFound);
    EXPECT_EQ(probes[1].probe, ProbeOutcome::Found);
    EXPECT_EQ(probes[1].entries, 2u);
}

TEST_F(ServerSessionTest, FetchesInConfiguredStationOrder) {
    remote_->directories["/data/2024/12/15"] = {"B1_z.txt", "A2_y.txt", "A1_x.txt"};
    remote_->files["/data/2024/12/15/A1_x.txt"] = "x";
    remote_->files["/data/2024/12/15/A2_y.txt"] = "y";
    remote_->files["/data/2024/12/15/B1_z.txt"] = "z";

    auto session = makeSession({"A1", "A2"}, day(15));
    session->start();
    session->run();

    EXPECT_EQ(remote_->retrievedPaths(),
              (std::vector<std::string>{"/data/2024/12/15/A1_x.txt", "/data/2024/12/15/A2_y.txt"}));

    const auto downloads = log_.ofKind(EventKind::FileDownloaded);
    ASSERT_EQ(downloads.size(), 2u);
    EXPECT_EQ(downloads[0].station, "A1");
    EXPECT_EQ(downloads[1].station, "A2");
    EXPECT_EQ(downloads[0].server_id, "kerala");

    const auto progress = session->getProgress();
    EXPECT_EQ(progress.downloaded, 2u);
    EXPECT_EQ(progress.skipped, 0u);
    EXPECT_EQ(progress.failed, 0u);
    EXPECT_EQ(progress.bytes, 2u);
}

TEST_F(ServerSessionTest, ProcessesDatesInAscendingOrder) {
    populateTwoDays(*remote_);

    auto session = makeSession({"A1", "A2"}, DateRange::days(Date{2024, 12, 15}, Date{2024, 12, 16}));
    session->start();
    session->run();

    EXPECT_EQ(session->state(), SessionState::Completed);
    const auto dates = log_.ofKind(EventKind::DateCompleted);
    ASSERT_EQ(dates.size(), 2u);
    EXPECT_EQ(dates[0].date, (Date{2024, 12, 15}));
    EXPECT_EQ(dates[0].downloaded, 2u);
    EXPECT_EQ(dates[1].date, (Date{2024, 12, 16}));
    EXPECT_EQ(dates[1].downloaded, 2u);

    EXPECT_EQ(filesUnder(dir_.path()),
              (std::set<std::string>{"Kerala/A1/2024/12/15/A1_1500.txt",
                                     "Kerala/A2/2024/12/15/A2_1500.txt",
                                     "Kerala/A1/2024/12/16/A1_1600.txt",
                                     "Kerala/A2/2024/12/16/A2_1600.TXT"}));

    const auto summary = log_.ofKind(EventKind::SessionCompleted);
    ASSERT_EQ(summary.size(), 1u);
    EXPECT_EQ(summary[0].state, SessionState::Completed);
    EXPECT_EQ(summary[0].downloaded, 4u);
    EXPECT_EQ(log_.events().back().kind, EventKind::SessionCompleted);
}

TEST_F(ServerSessionTest, MissingDirectoryCompletesDateWithZeroFiles) {
    auto session = makeSession({"A1"}, day(20));
    session->start();
    session->run();

    EXPECT_EQ(session->state(), SessionState::Completed);
    const auto dates = log_.ofKind(EventKind::DateCompleted);
    ASSERT_EQ(dates.size(), 1u);
    EXPECT_EQ(dates[0].downloaded + dates[0].skipped + dates[0].failed, 0u);
    EXPECT_TRUE(dates[0].detail.empty());
}

TEST_F(ServerSessionTest, ExistingFilesAreSkipped) {
    populateTwoDays(*remote_);
    const fs::path existing = dir_.path() / "Kerala/A1/2024/12/15/A1_1500.txt";
    fs::create_directories(existing.parent_path());
    {
        std::ofstream out(existing);
        out << "kept";
    }

    auto session = makeSession({"A1", "A2"}, day(15));
    session->start();
    session->run();

    EXPECT_EQ(remote_->retrievedPaths(), (std::vector<std::string>{"/data/2024/12/15/A2_1500.txt"}));
    EXPECT_EQ(test::readFile(existing), "kept");
    ASSERT_EQ(log_.ofKind(EventKind::FileSkippedExisting).size(), 1u);
    EXPECT_EQ(session->getProgress().skipped, 1u);
}

TEST_F(ServerSessionTest, FileFailureDoesNotStopSession) {
    populateTwoDays(*remote_);
    remote_->failing_files.insert("/data/2024/12/15/A1_1500.txt");

    auto session = makeSession({"A1", "A2"}, day(15));
    session->start();
    session->run();

    EXPECT_EQ(session->state(), SessionState::Completed);
    EXPECT_FALSE(session->hasError());
    const auto failures = log_.ofKind(EventKind::FileFailed);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].filename, "A1_1500.txt");
    EXPECT_FALSE(failures[0].detail.empty());
    EXPECT_FALSE(fs::exists(dir_.path() / "Kerala/A1/2024/12/15/A1_1500.txt"));
    EXPECT_TRUE(fs::exists(dir_.path() / "Kerala/A2/2024/12/15/A2_1500.txt"));
}

TEST_F(ServerSessionTest, ListingErrorAbortsOnlyThatDate) {
    populateTwoDays(*remote_);
    remote_->broken_directories.insert("/data/2024/12/15");

    auto session = makeSession({"A1", "A2"}, DateRange::days(Date{2024, 12, 15}, Date{2024, 12, 16}));
    session->start();
    session->run();

    EXPECT_EQ(session->state(), SessionState::Completed);
    const auto listed = remote_->listedPaths();
    EXPECT_EQ(std::count(listed.begin(), listed.end(), "/data/2024/12/15122024/"), 0);

    const auto dates = log_.ofKind(EventKind::DateCompleted);
    ASSERT_EQ(dates.size(), 2u);
    EXPECT_FALSE(dates[0].detail.empty());
    EXPECT_EQ(dates[1].downloaded, 2u);
}

TEST_F(ServerSessionTest, BareFormsProbedForSlashSensitiveTransport) {
    remote_->slash_sensitive = true;
    remote_->addFile("/data/2024/12/15", "A1_x.txt", "x");

    auto session = makeSession({"A1"}, day(15));
    session->start();
    session->run();

    EXPECT_EQ(remote_->listedPaths(),
              (std::vector<std::string>{"/data/2024/12/15/", "/data/2024/12/15122024/", "/data/2024/12/15"}));
    EXPECT_EQ(session->getProgress().downloaded, 1u);
}

TEST_F(ServerSessionTest, ReversedRangeRejectedBeforeNetwork) {
    auto session = makeSession({"A1"}, DateRange::days(Date{2024, 12, 16}, Date{2024, 12, 15}));

    try {
        session->start();
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidInput);
    }
    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_EQ(remote_->connectCount(), 0);
    EXPECT_TRUE(remote_->listedPaths().empty());
    EXPECT_TRUE(log_.events().empty());
}

TEST_F(ServerSessionTest, EmptyStationSetRejected) {
    auto session = makeSession({}, day(15));
    EXPECT_THROW(session->start(), FetchError);
    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_EQ(remote_->connectCount(), 0);
}

TEST_F(ServerSessionTest, RunRequiresStart) {
    auto session = makeSession({"A1"}, day(15));
    EXPECT_THROW(session->run(), FetchError);
    EXPECT_EQ(remote_->connectCount(), 0);
}

TEST_F(ServerSessionTest, ConnectionFailureFailsSession) {
    remote_->refuse_connect = true;

    auto session = makeSession({"A1"}, day(15));
    session->start();
    session->run();

    EXPECT_EQ(session->state(), SessionState::Failed);
    EXPECT_TRUE(session->hasError());
    EXPECT_FALSE(session->getProgress().error_message.empty());
    EXPECT_TRUE(remote_->listedPaths().empty());
    EXPECT_EQ(log_.ofKind(EventKind::SessionError).size(), 1u);
    EXPECT_EQ(log_.events().back().state, SessionState::Failed);
}

TEST_F(ServerSessionTest, PauseAndResumeYieldSameFiles) {
    const auto range = DateRange::days(Date{2024, 12, 15}, Date{2024, 12, 16});

    test::TempDir reference_dir("server_session_reference");
    auto reference_remote = std::make_shared<test::FakeServer>();
    populateTwoDays(*reference_remote);
    auto reference = makeSession({"A1", "A2"}, range, reference_dir.path(), reference_remote);
    reference->start();
    reference->run();

    populateTwoDays(*remote_);
    auto session = makeSession({"A1", "A2"}, range);

    std::promise<void> paused;
    bool first = true;
    remote_->on_retrieve = [&](const std::string&) {
        if (first) {
            first = false;
            EXPECT_TRUE(session->pause());
            paused.set_value();
        }
    };

    session->start();
    std::thread worker([&] { session->run(); });

    paused.get_future().wait();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(session->state(), SessionState::Paused);
    EXPECT_EQ(remote_->retrievedPaths().size(), 1u);

    EXPECT_TRUE(session->resume());
    worker.join();

    EXPECT_EQ(session->state(), SessionState::Completed);
    EXPECT_EQ(filesUnder(dir_.path()), filesUnder(reference_dir.path()));
}

TEST_F(ServerSessionTest, CancelIsTerminal) {
    populateTwoDays(*remote_);
    auto session = makeSession({"A1", "A2"}, DateRange::days(Date{2024, 12, 15}, Date{2024, 12, 16}));

    remote_->on_retrieve = [&](const std::string&) { session->cancel(); };

    session->start();
    session->run();

    EXPECT_EQ(session->state(), SessionState::Cancelled);
    EXPECT_EQ(remote_->retrievedPaths().size(), 1u);

    const auto summary = log_.ofKind(EventKind::SessionCompleted);
    ASSERT_EQ(summary.size(), 1u);
    EXPECT_EQ(summary[0].state, SessionState::Cancelled);

    EXPECT_THROW(session->start(), FetchError);
    EXPECT_FALSE(session->resume());
    EXPECT_FALSE(session->pause());
    EXPECT_FALSE(session->cancel());
    EXPECT_THROW(session->run(), FetchError);
}

TEST_F(ServerSessionTest, CancelWhilePausedWins) {
    populateTwoDays(*remote_);
    auto session = makeSession({"A1", "A2"}, day(15));

    session->start();
    EXPECT_TRUE(session->pause());
    std::thread worker([&] { session->run(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(remote_->retrievedPaths().empty());
    EXPECT_TRUE(session->cancel());
    worker.join();

    EXPECT_EQ(session->state(), SessionState::Cancelled);
    EXPECT_TRUE(remote_->retrievedPaths().empty());
}

TEST_F(ServerSessionTest, CancelBeforeStart) {
    auto session = makeSession({"A1"}, day(15));
    EXPECT_TRUE(session->cancel());
    EXPECT_EQ(session->state(), SessionState::Cancelled);
    EXPECT_THROW(session->start(), FetchError);
}

TEST_F(ServerSessionTest, StateChangesAreReported) {
    auto session = makeSession({"A1"}, day(20));
    session->start();
    session->run();

    std::vector<SessionState> states;
    for (const auto& event : log_.ofKind(EventKind::SessionStateChanged)) {
        states.push_back(event.state);
    }
    EXPECT_EQ(states, (std::vector<SessionState>{SessionState::Running, SessionState::Completed}));
}

TEST_F(ServerSessionTest, LastReportedStateMatchesStateUnderConcurrentControl) {
    ServerConfig server;
    server.id = "kerala";
    server.host = "ftp.example.org";
    server.remote_base = "/data";

    for (int i = 0; i < 300; ++i) {
        auto remote = std::make_shared<test::FakeServer>();
        remote->addFile("/data/2024/12/15", "A1_1500.txt", "a1-15");
        EventLog log;

        SessionRequest request{server, {"A1"}, day(15), (dir_.path() / std::to_string(i)).string(), "Kerala"};
        auto session = std::make_shared<ServerSession>(std::move(request),
                                                       std::make_unique<test::FakeTransport>(remote),
                                                       log.sink());
        session->start();
        session->pause();
        std::thread worker([&] { session->run(); });
        session->resume();
        session->cancel();
        worker.join();

        const auto changes = log.ofKind(EventKind::SessionStateChanged);
        ASSERT_FALSE(changes.empty());
        ASSERT_EQ(changes.back().state, session->state()) << "iteration " << i;
        ASSERT_TRUE(isTerminal(session->state())) << "iteration " << i;
    }
}

TEST_F(ServerSessionTest, ProgressShowsFileInFlight) {
    remote_->addFile("/data/2024/12/15", "A1_1500.txt", "0123456789");
    auto session = makeSession({"A1"}, day(15));

    SessionProgress during;
    remote_->on_chunk = [&](const std::string&, std::uint64_t) { during = session->getProgress(); };

    session->start();
    session->run();

    EXPECT_EQ(during.current_file, "A1_1500.txt");
    EXPECT_EQ(during.file_received, 5u);
    EXPECT_EQ(during.file_total, 10u);

    const auto after = session->getProgress();
    EXPECT_EQ(session->state(), SessionState::Completed);
    EXPECT_TRUE(after.current_file.empty());
    EXPECT_EQ(after.file_received, 0u);
    EXPECT_EQ(after.bytes, 10u);
}
