#include "rtufetch/history_log.hpp"
#include "rtufetch/error.hpp"

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rtufetch {

void initLogging(bool verbose) {
    auto logger = spdlog::get("rtufetch");
    if (!logger) {
        logger = spdlog::stderr_color_mt("rtufetch");
    }
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> openHistoryLog(const std::string& path) {
    if (auto existing = spdlog::get("history")) {
        const auto& sinks = existing->sinks();
        auto file = sinks.empty() ? nullptr
                                  : std::dynamic_pointer_cast<spdlog::sinks::basic_file_sink_mt>(sinks.front());
        if (file && file->filename() == path) {
            return existing;
        }
        // Another file was opened under the same name; loggers already handed out keep writing there.
        existing->flush();
        spdlog::drop("history");
    }

    try {
        auto history = spdlog::basic_logger_mt("history", path);
        history->set_pattern("[%Y-%m-%d %H:%M:%S] %v");
        history->set_level(spdlog::level::info);
        history->flush_on(spdlog::level::info);
        return history;
    } catch (const spdlog::spdlog_ex& e) {
        throw FetchError(ErrorCode::IOError, path, e.what());
    }
}

std::function<void(const ProgressEvent&)> historyListener(std::shared_ptr<spdlog::logger> history) {
    return [history = std::move(history)](const ProgressEvent& event) {
        // Probes that found nothing are noise in the history file.
        if (event.kind == EventKind::DirectoryProbed && event.probe == ProbeOutcome::NotFound) {
            return;
        }
        if (event.kind == EventKind::FileFailed || event.kind == EventKind::SessionError) {
            history->warn("{}", describe(event));
        } else {
            history->info("{}", describe(event));
        }
    };
}

} // namespace rtufetch
