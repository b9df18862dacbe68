#pragma once

#include "config.hpp"
#include "remote_transport.hpp"

#include <memory>
#include <string>

namespace rtufetch {

// RemoteTransport over FTP (passive mode) implemented with libcurl. A single
// easy handle is kept for the lifetime of the connection so consecutive
// listings and retrievals reuse the control connection.
class FtpTransport final : public RemoteTransport {
public:
    FtpTransport(ServerConfig server, TransportOptions options);
    ~FtpTransport() override;

    void connect() override;
    [[nodiscard]] ListResult listDirectory(const std::string& path) override;
    void retrieveFile(const std::string& remote_path,
                      const std::filesystem::path& destination,
                      const TransferObserver& observer) override;
    void disconnect() noexcept override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

[[nodiscard]] RemoteTransportPtr makeFtpTransport(const ServerConfig& server,
                                                  const TransportOptions& options);

} // namespace rtufetch
