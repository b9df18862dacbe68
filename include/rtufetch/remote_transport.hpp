#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rtufetch {

enum class ListStatus {
    Listed,        // Directory exists; entries holds its contents
    NotFound,      // Directory does not exist; not an error
    TransportError // Connection or protocol failure, including timeouts
};

struct ListResult {
    ListStatus status{ListStatus::NotFound};
    std::vector<std::string> entries;
    std::string error_message;
};

// Called while a file is received: bytes written so far and the announced size
// (0 when the server did not report one).
using TransferObserver = std::function<void(std::uint64_t received, std::uint64_t total)>;

// File listing / retrieval capability of a remote server. One instance serves a
// single session and is never used by two threads at once.
class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    // Opens the connection and authenticates. Throws FetchError(ConnectionFailed).
    virtual void connect() = 0;

    // Lists one remote directory. Never throws for a missing directory.
    [[nodiscard]] virtual ListResult listDirectory(const std::string& path) = 0;

    // Writes the remote file to destination, reporting progress to observer when
    // set. Throws FetchError(TransferFailed); destination may hold partial data
    // afterwards.
    virtual void retrieveFile(const std::string& remote_path,
                              const std::filesystem::path& destination,
                              const TransferObserver& observer) = 0;

    virtual void disconnect() noexcept = 0;

    // Whether "dir/" and "dir" must both be probed when looking for a directory.
    [[nodiscard]] virtual bool trailingSlashSensitive() const { return false; }
};

using RemoteTransportPtr = std::unique_ptr<RemoteTransport>;
using TransportFactory = std::function<RemoteTransportPtr(const ServerConfig&)>;

} // namespace rtufetch
