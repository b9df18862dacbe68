#pragma once

#include "progress.hpp"

#include <functional>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace rtufetch {

// Installs the default "rtufetch" console logger. verbose lowers the level to debug.
void initLogging(bool verbose);

// Opens (appending) the download history file; one timestamped line per event.
// Calling it again with the same path returns the same logger; a different path
// replaces the registered one. Throws FetchError(IOError) when the file cannot be opened.
[[nodiscard]] std::shared_ptr<spdlog::logger> openHistoryLog(const std::string& path);

// Listener writing describe(event) to the given history logger.
[[nodiscard]] std::function<void(const ProgressEvent&)> historyListener(std::shared_ptr<spdlog::logger> history);

} // namespace rtufetch
