#include "rtufetch/calendar.hpp"
#include "rtufetch/config.hpp"
#include "rtufetch/download_manager.hpp"
#include "rtufetch/error.hpp"
#include "rtufetch/history_log.hpp"
#include "rtufetch/scheduler.hpp"
#include "rtufetch/detail/curl_utils.hpp"

#include <chrono>
#include <csignal>
#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

volatile std::sig_atomic_t gPauseRequested = 0;
volatile std::sig_atomic_t gResumeRequested = 0;
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int signal) {
    switch (signal) {
        case SIGUSR1:
            gPauseRequested = 1;
            break;
        case SIGUSR2:
            gResumeRequested = 1;
            break;
        default:
            gStopRequested = 1;
            break;
    }
}

void installSignalHandlers() {
    std::signal(SIGUSR1, handleSignal);
    std::signal(SIGUSR2, handleSignal);
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
}

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " -c <config.yaml> [-s <server-id>] [--from YYYY-MM-DD] [--to YYYY-MM-DD]\n"
              << "       [--at YYMMDDHHMM] [--yesterday] [--daily] [--test] [--preview] [-q] [-v]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -c <file>          Configuration file (required)\n"
              << "  -s <server-id>     Only act on this server (default: all servers)\n"
              << "  --from <date>      First day to download\n"
              << "  --to <date>        Last day to download (default: --from)\n"
              << "  --at <timestamp>   Download the day of a single YYMMDDHHMM instant\n"
              << "  --yesterday        Download yesterday (default)\n"
              << "  --daily            Stay running and download yesterday every day at schedule_time\n"
              << "  --test             Test the connection to the selected servers\n"
              << "  --preview          List the remote base directory of the selected servers\n"
              << "  -q                 No status panel\n"
              << "  -v                 Debug logging\n"
              << "  -h, --help         Show this message\n"
              << "Signals: SIGUSR1 pauses, SIGUSR2 resumes, SIGINT/SIGTERM cancel." << std::endl;
}

struct Options {
    std::string config_path;
    std::string server_id;
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<std::string> at;
    bool daily{false};
    bool test{false};
    bool preview{false};
    bool quiet{false};
    bool verbose{false};
};

// Applies pending signal requests to the manager. Returns false once a stop was requested.
bool pollSignals(rtufetch::DownloadManager& manager) {
    if (gPauseRequested) {
        gPauseRequested = 0;
        manager.pauseAll();
    }
    if (gResumeRequested) {
        gResumeRequested = 0;
        manager.resumeAll();
    }
    if (gStopRequested) {
        manager.cancelAll();
        return false;
    }
    return true;
}

rtufetch::DateRange requestedRange(const Options& options) {
    using namespace rtufetch;
    if (options.at) {
        if (options.from || options.to) {
            throw FetchError(ErrorCode::InvalidInput, "--at cannot be combined with --from/--to");
        }
        return DateRange::singleInstant(parseSingleTimestamp(*options.at));
    }
    if (options.from) {
        const Date first = parseDate(*options.from);
        const Date last = options.to ? parseDate(*options.to) : first;
        return DateRange::days(first, last);
    }
    if (options.to) {
        throw FetchError(ErrorCode::InvalidInput, "--to requires --from");
    }
    return DateRange::singleDay(yesterdayOf(std::chrono::system_clock::now()));
}

std::vector<std::string> selectedServers(const rtufetch::DownloadManager& manager, const Options& options) {
    if (options.server_id.empty()) {
        return manager.serverIds();
    }
    return {options.server_id};
}

int runChecks(rtufetch::DownloadManager& manager, const Options& options) {
    int failures = 0;
    for (const auto& id : selectedServers(manager, options)) {
        if (options.test) {
            const auto check = manager.testConnection(id);
            std::cout << id << ": " << (check.ok ? "OK " : "FAILED ") << check.message << std::endl;
            failures += check.ok ? 0 : 1;
        }
        if (options.preview) {
            const auto preview = manager.previewRemote(id);
            if (!preview.ok) {
                std::cout << id << ": preview failed: " << preview.error_message << std::endl;
                ++failures;
                continue;
            }
            std::cout << id << ": " << preview.directory << " (" << preview.entries.size() << " entries)\n";
            for (const auto& entry : preview.entries) {
                std::cout << "  " << entry << '\n';
            }
            std::cout << std::flush;
        }
    }
    return failures == 0 ? 0 : 1;
}

void superviseUntilIdle(rtufetch::DownloadManager& manager, bool quiet) {
    if (quiet) {
        while (manager.hasActiveSessions()) {
            pollSignals(manager);
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } else {
        manager.renderProgressLoop(std::cout, [&manager]() { pollSignals(manager); });
    }
    manager.waitAll();
}

int runDaily(rtufetch::DownloadManager& manager, const rtufetch::AppConfig& config) {
    if (!config.auto_midnight) {
        throw rtufetch::FetchError(rtufetch::ErrorCode::ConfigError,
                                   "--daily requires auto_midnight: true in the configuration");
    }

    rtufetch::DailyScheduler scheduler(config.schedule_hour, config.schedule_minute,
                                       [&manager](std::chrono::system_clock::time_point now) {
                                           manager.runAllNow(now);
                                       });
    scheduler.start();

    while (pollSignals(manager)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Stopping scheduler");
    scheduler.stop();
    manager.waitAll();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        rtufetch::detail::ensureCurlInitialized();

        Options options;
        int arg_index = 1;
        while (arg_index < argc) {
            const std::string option = argv[arg_index];
            const bool has_value = arg_index + 1 < argc;

            if (option == "-c" || option == "-s" || option == "--from" || option == "--to" || option == "--at") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                const std::string value = argv[arg_index + 1];
                if (option == "-c") {
                    options.config_path = value;
                } else if (option == "-s") {
                    options.server_id = value;
                } else if (option == "--from") {
                    options.from = value;
                } else if (option == "--to") {
                    options.to = value;
                } else {
                    options.at = value;
                }
                arg_index += 2;
                continue;
            }

            if (option == "--yesterday") {
                options.from.reset();
                options.to.reset();
                options.at.reset();
            } else if (option == "--daily") {
                options.daily = true;
            } else if (option == "--test") {
                options.test = true;
            } else if (option == "--preview") {
                options.preview = true;
            } else if (option == "-q") {
                options.quiet = true;
            } else if (option == "-v") {
                options.verbose = true;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            ++arg_index;
        }

        if (options.config_path.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        rtufetch::initLogging(options.verbose);
        const rtufetch::AppConfig config = rtufetch::loadConfig(options.config_path);

        rtufetch::DownloadManager manager(config);
        manager.addListener(rtufetch::historyListener(rtufetch::openHistoryLog(config.history_log)));
        installSignalHandlers();

        if (options.test || options.preview) {
            return runChecks(manager, options);
        }

        if (!options.quiet && !options.verbose && !options.daily) {
            // Console lines would tear the in-place panel.
            spdlog::set_level(spdlog::level::warn);
        }

        if (options.daily) {
            return runDaily(manager, config);
        }

        const rtufetch::DateRange range = requestedRange(options);
        std::size_t started = 0;
        if (options.server_id.empty()) {
            started = manager.startAll(range);
        } else {
            manager.startOne(options.server_id, range);
            started = 1;
        }

        if (started == 0) {
            std::cerr << "No download session started." << std::endl;
            return 1;
        }

        superviseUntilIdle(manager, options.quiet);

        for (const auto& progress : manager.status()) {
            if (progress.state == rtufetch::SessionState::Failed) {
                return 1;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
