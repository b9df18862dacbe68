#pragma once

#include "progress.hpp"

#include <memory>

namespace rtufetch {

class DownloadTask {
public:
    virtual ~DownloadTask() = default;

    // Validates the request and leaves Idle. Throws FetchError; on failure the
    // task stays Idle and nothing touched the network.
    virtual void start() = 0;
    // Blocking body of the task, run on its own worker thread after start().
    virtual void run() = 0;

    virtual bool pause() = 0;
    virtual bool resume() = 0;
    virtual bool cancel() = 0;

    [[nodiscard]] virtual SessionState state() const = 0;
    [[nodiscard]] virtual SessionProgress getProgress() const = 0;
    [[nodiscard]] virtual bool isRunning() const = 0;
    [[nodiscard]] virtual bool hasError() const = 0;
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace rtufetch
