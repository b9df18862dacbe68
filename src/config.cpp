#include "rtufetch/config.hpp"
#include "rtufetch/error.hpp"

#include <exception>
#include <set>
#include <string>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace rtufetch {

namespace {

void parseScheduleTime(const std::string& text, AppConfig& out) {
    const auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        throw FetchError(ErrorCode::ConfigError, text, "schedule_time must be HH:MM");
    }

    int hour = -1;
    int minute = -1;
    try {
        hour = std::stoi(text.substr(0, colon));
        minute = std::stoi(text.substr(colon + 1));
    } catch (const std::exception&) {
        throw FetchError(ErrorCode::ConfigError, text, "schedule_time must be HH:MM");
    }

    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        throw FetchError(ErrorCode::ConfigError, text, "schedule_time is out of range");
    }
    out.schedule_hour = hour;
    out.schedule_minute = minute;
}

ServerEntry parseServer(const YAML::Node& node) {
    ServerEntry entry;
    ServerConfig& server = entry.server;

    server.host = node["host"].as<std::string>("");
    server.port = node["port"].as<int>(21);
    server.username = node["username"].as<std::string>("");
    server.password = node["password"].as<std::string>("");
    server.remote_base = node["remote"].as<std::string>("/");
    server.id = node["id"].as<std::string>("");
    if (server.id.empty()) {
        server.id = server.identity();
    }

    entry.state_label = node["state"].as<std::string>("");
    entry.local_base = node["local_folder"].as<std::string>("downloads");
    entry.auto_midnight = node["auto_midnight"].as<bool>(true);

    if (const auto stations = node["stations"]) {
        if (!stations.IsSequence()) {
            throw FetchError(ErrorCode::ConfigError, server.id, "stations must be a list");
        }
        for (const auto& station : stations) {
            entry.stations.push_back(station.as<std::string>());
        }
    }

    return entry;
}

} // namespace

std::string ServerConfig::identity() const {
    return fmt::format("{}:{}:{}", host, port, username);
}

void validateStations(const std::vector<std::string>& stations) {
    if (stations.empty()) {
        throw FetchError(ErrorCode::InvalidInput, "Station set is empty");
    }

    std::set<std::string> seen;
    for (const auto& station : stations) {
        if (station.empty()) {
            throw FetchError(ErrorCode::InvalidInput, "Station id is empty");
        }
        if (!seen.insert(station).second) {
            throw FetchError(ErrorCode::InvalidInput, station, "Duplicate station id");
        }
    }
}

void validateConfig(const AppConfig& config) {
    std::set<std::string> ids;
    for (const auto& entry : config.servers) {
        const auto& server = entry.server;
        if (server.host.empty()) {
            throw FetchError(ErrorCode::ConfigError, server.id, "Server host is empty");
        }
        if (server.port <= 0 || server.port > 65535) {
            throw FetchError(ErrorCode::ConfigError, server.id,
                             fmt::format("Invalid port {}", server.port));
        }
        if (!ids.insert(server.id).second) {
            throw FetchError(ErrorCode::ConfigError, server.id, "Duplicate server id");
        }
        if (!entry.stations.empty()) {
            try {
                validateStations(entry.stations);
            } catch (const FetchError& e) {
                throw FetchError(ErrorCode::ConfigError, server.id, e.message());
            }
        }
    }

    if (config.transport.timeout.count() <= 0) {
        throw FetchError(ErrorCode::ConfigError, "timeout_seconds must be positive");
    }
    if (config.transport.connect_retries < 1) {
        throw FetchError(ErrorCode::ConfigError, "connect_retries must be at least 1");
    }
}

namespace {

AppConfig configFromNode(const YAML::Node& root) {
    AppConfig config;
    try {
        config.history_log = root["history_log"].as<std::string>(config.history_log);
        config.auto_midnight = root["auto_midnight"].as<bool>(false);
        config.transport.timeout = std::chrono::seconds(root["timeout_seconds"].as<long>(30));
        config.transport.connect_retries = root["connect_retries"].as<int>(3);
        config.transport.retry_delay = std::chrono::seconds(root["retry_delay_seconds"].as<long>(2));

        if (const auto schedule = root["schedule_time"]) {
            parseScheduleTime(schedule.as<std::string>(), config);
        }

        if (const auto servers = root["servers"]) {
            if (!servers.IsSequence()) {
                throw FetchError(ErrorCode::ConfigError, "servers must be a list");
            }
            for (const auto& node : servers) {
                config.servers.push_back(parseServer(node));
            }
        }
    } catch (const YAML::Exception& e) {
        throw FetchError(ErrorCode::ConfigError, std::string("Invalid config value: ") + e.what());
    }

    validateConfig(config);
    return config;
}

} // namespace

AppConfig parseConfig(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw FetchError(ErrorCode::ConfigError, std::string("Failed to parse config: ") + e.what());
    }
    return configFromNode(root);
}

AppConfig loadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw FetchError(ErrorCode::ConfigError, path, std::string("Failed to load config: ") + e.what());
    }
    return configFromNode(root);
}

} // namespace rtufetch
