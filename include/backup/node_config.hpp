#pragma once

#include "transport/peer_transport.hpp"
#include <optional>
#include <string>
#include <vector>

struct NodeConfig {
    std::string dataDir;
    std::string callsign;
    std::string identityFile;   // defaults to {dataDir}/backup-config/identity.json
    std::string stationUrl;
    std::string logFile = "/tmp/peervault.log";
    std::string logLevel = "info";
    int inviteTimeoutSeconds = 60;
    int freshnessWindowSeconds = 300;
    int discoveryTimeoutSeconds = 10;
    int workerThreads = 4;
    int schedulerIntervalSeconds = 3600;
    int requestTimeoutSeconds = 30;
    std::vector<std::string> excludedDirectories;
    std::vector<PeerInfo> peers;
};

// Reads a JSON config file; missing keys keep their defaults. nullopt when the
// file is unreadable, malformed, or lacks data_dir/callsign.
std::optional<NodeConfig> loadNodeConfig(const std::string& path);
std::optional<NodeConfig> parseNodeConfig(const nlohmann::json& j);
bool saveNodeConfig(const NodeConfig& config, const std::string& path);

void to_json(nlohmann::json& j, const NodeConfig& config);
