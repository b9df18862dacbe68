#pragma once

#include "calendar.hpp"
#include "config.hpp"
#include "download_task.hpp"
#include "remote_transport.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rtufetch {

struct SessionRequest {
    ServerConfig server;
    std::vector<std::string> stations;
    DateRange range;
    std::string local_base;
    std::string state_label;
};

// One download run against one server: every date of the range in ascending
// order, every station in configured order. A session is used for a single run;
// once it reached a terminal state a new one has to be created.
class ServerSession final : public DownloadTask {
public:
    ServerSession(SessionRequest request, RemoteTransportPtr transport, EventSink sink);
    ~ServerSession() override;

    void start() override;
    void run() override;

    bool pause() override;
    bool resume() override;
    bool cancel() override;

    [[nodiscard]] SessionState state() const override;
    [[nodiscard]] SessionProgress getProgress() const override;
    [[nodiscard]] bool isRunning() const override;
    [[nodiscard]] bool hasError() const override;

    [[nodiscard]] const std::string& serverId() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

using ServerSessionPtr = std::shared_ptr<ServerSession>;

} // namespace rtufetch
