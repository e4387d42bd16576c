#include "backup/node_config.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "storage/backup_models.hpp"
#include "storage/relationship_store.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

std::optional<NodeConfig> parseNodeConfig(const json& j) {
    try {
        NodeConfig config;
        config.dataDir = j.value("data_dir", "");
        config.callsign = utils::toUpper(j.value("callsign", ""));
        if (config.dataDir.empty() || config.callsign.empty()) {
            Logger::error("Config requires data_dir and callsign");
            return std::nullopt;
        }
        if (!isValidCallsign(config.callsign)) {
            Logger::error("Invalid callsign in config: " + config.callsign);
            return std::nullopt;
        }

        config.identityFile = j.value("identity_file",
            (std::filesystem::path(config.dataDir) / "backup-config" / "identity.json").string());
        config.stationUrl = j.value("station_url", "");
        config.logFile = j.value("log_file", config.logFile);
        config.logLevel = j.value("log_level", config.logLevel);
        config.inviteTimeoutSeconds = j.value("invite_timeout_seconds", config.inviteTimeoutSeconds);
        config.freshnessWindowSeconds = j.value("freshness_window_seconds", config.freshnessWindowSeconds);
        config.discoveryTimeoutSeconds = j.value("discovery_timeout_seconds", config.discoveryTimeoutSeconds);
        config.workerThreads = j.value("worker_threads", config.workerThreads);
        config.schedulerIntervalSeconds = j.value("scheduler_interval_seconds", config.schedulerIntervalSeconds);
        config.requestTimeoutSeconds = j.value("request_timeout_seconds", config.requestTimeoutSeconds);
        config.excludedDirectories = j.value("excluded_directories", std::vector<std::string>{});
        config.peers = j.value("peers", std::vector<PeerInfo>{});

        if (config.workerThreads < 1) {
            Logger::warning("worker_threads must be positive, using 4");
            config.workerThreads = 4;
        }
        return config;
    } catch (const json::exception& e) {
        Logger::error("Invalid config: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<NodeConfig> loadNodeConfig(const std::string& path) {
    auto j = readJsonFile(path);
    if (!j) {
        Logger::error("Failed to read config file: " + path);
        return std::nullopt;
    }
    return parseNodeConfig(*j);
}

void to_json(json& j, const NodeConfig& config) {
    j = json{
        {"data_dir", config.dataDir},
        {"callsign", config.callsign},
        {"identity_file", config.identityFile},
        {"station_url", config.stationUrl},
        {"log_file", config.logFile},
        {"log_level", config.logLevel},
        {"invite_timeout_seconds", config.inviteTimeoutSeconds},
        {"freshness_window_seconds", config.freshnessWindowSeconds},
        {"discovery_timeout_seconds", config.discoveryTimeoutSeconds},
        {"worker_threads", config.workerThreads},
        {"scheduler_interval_seconds", config.schedulerIntervalSeconds},
        {"request_timeout_seconds", config.requestTimeoutSeconds},
        {"excluded_directories", config.excludedDirectories},
        {"peers", config.peers}
    };
}

bool saveNodeConfig(const NodeConfig& config, const std::string& path) {
    return writeJsonFile(path, config);
}
