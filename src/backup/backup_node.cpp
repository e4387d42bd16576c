#include "backup/backup_node.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

using json = nlohmann::json;

BackupNode::BackupNode(const NodeConfig& config,
                       std::shared_ptr<Identity> identity,
                       std::shared_ptr<PeerTransport> transport)
    : config_(config)
    , identity_(std::move(identity))
    , transport_(std::move(transport))
    , relationshipStore_(config.dataDir)
    , snapshotStore_(relationshipStore_)
    , peerDirectory_(config.peers)
    , relationshipManager_(relationshipStore_, *identity_, *transport_, peerDirectory_,
                           config.callsign, std::chrono::seconds(config.inviteTimeoutSeconds))
    , requestHandler_(relationshipStore_, snapshotStore_)
    , backupExecutor_(relationshipStore_, *identity_, *transport_, taskManager_,
                      config.dataDir, config.callsign, config.excludedDirectories)
    , restoreExecutor_(relationshipStore_, *identity_, *transport_, taskManager_,
                       config.dataDir, config.callsign)
    , discovery_(relationshipStore_, snapshotStore_, *identity_, *transport_, peerDirectory_,
                 taskManager_, config.callsign)
    , router_(*identity_, relationshipStore_, snapshotStore_, relationshipManager_, discovery_,
              config.freshnessWindowSeconds)
    , scheduler_(relationshipStore_, backupExecutor_, restoreExecutor_,
                 std::chrono::seconds(config.schedulerIntervalSeconds))
    , taskManager_(static_cast<size_t>(config.workerThreads)) {
}

BackupNode::~BackupNode() {
    scheduler_.stop();
    discovery_.shutdown();
    taskManager_.shutdown();
}

bool BackupNode::initialize() {
    if (!identity_->isAvailable()) {
        Logger::warning("Node " + config_.callsign + " has no identity; backup and restore are disabled");
    }
    return relationshipStore_.load();
}

bool BackupNode::handleMessage(const json& message) {
    return router_.handleMessage(message);
}

ApiResponse BackupNode::handleApiRequest(const std::string& fromCallsign,
                                         const std::string& method,
                                         const std::string& path,
                                         const std::string& body) {
    if (path == "/api/backup/message") {
        if (method != "POST") {
            return makeErrorResponse(405, "Method not allowed");
        }
        json message;
        try {
            message = json::parse(body);
        } catch (const json::exception& e) {
            return makeErrorResponse(400, "Malformed message: " + std::string(e.what()));
        }
        if (!message.is_object()) {
            return makeErrorResponse(400, "Malformed message");
        }
        message["from"] = utils::toUpper(fromCallsign);
        if (!router_.handleMessage(message)) {
            return makeErrorResponse(400, "Message rejected");
        }
        return makeJsonResponse(200, json{{"success", true}});
    }

    if (BackupRequestHandler::handles(path)) {
        return requestHandler_.handleRequest(fromCallsign, method, path, body);
    }
    return makeErrorResponse(404, "Not found");
}
