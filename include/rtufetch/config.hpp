#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace rtufetch {

// Connection parameters for one remote file server.
struct ServerConfig {
    std::string id;
    std::string host;
    int port{21};
    std::string username;
    std::string password;
    std::string remote_base{"/"};

    // Identity used when no explicit id is configured.
    [[nodiscard]] std::string identity() const;
};

// Everything a session needs to know about one configured server.
struct ServerEntry {
    ServerConfig server;
    std::vector<std::string> stations;
    std::string state_label;
    std::string local_base{"downloads"};
    bool auto_midnight{true};
};

struct TransportOptions {
    std::chrono::seconds timeout{30};
    int connect_retries{3};
    std::chrono::seconds retry_delay{2};
};

struct AppConfig {
    std::vector<ServerEntry> servers;
    TransportOptions transport;
    std::string history_log{"download_history.log"};
    bool auto_midnight{false};
    int schedule_hour{0};
    int schedule_minute{10};
};

// Rejects empty and duplicate station ids. Throws FetchError(InvalidInput).
void validateStations(const std::vector<std::string>& stations);

// Checks host, port, station set and id uniqueness. Throws FetchError(ConfigError).
void validateConfig(const AppConfig& config);

// Reads a YAML configuration file. Throws FetchError(ConfigError).
AppConfig loadConfig(const std::string& path);
AppConfig parseConfig(const std::string& yaml_text);

} // namespace rtufetch
