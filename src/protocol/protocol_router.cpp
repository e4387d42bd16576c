#include "protocol/protocol_router.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

ProtocolRouter::ProtocolRouter(const Identity& identity,
                               RelationshipStore& store,
                               SnapshotStore& snapshots,
                               RelationshipManager& relationships,
                               DiscoveryCoordinator& discovery,
                               int64_t freshnessWindowSeconds)
    : identity_(identity)
    , store_(store)
    , snapshots_(snapshots)
    , relationships_(relationships)
    , discovery_(discovery)
    , freshnessWindowSeconds_(freshnessWindowSeconds) {
}

bool ProtocolRouter::handleMessage(const nlohmann::json& message) {
    auto inbound = parseControlMessage(message);
    if (!inbound) {
        return false;
    }
    return dispatch(*inbound);
}

BackupErrorCode ProtocolRouter::validate(const ControlMessage& message) const {
    const SignedEvent* event = signedEventOf(message);
    if (!event) {
        return BackupErrorCode::None;
    }
    if (!identity_.verify(*event)) {
        return BackupErrorCode::SignatureInvalid;
    }
    // Bounds are compared directly; created_at comes from the peer and may be extreme
    int64_t now = utils::nowSeconds();
    if (event->createdAt < now - freshnessWindowSeconds_ || event->createdAt > now + freshnessWindowSeconds_) {
        return BackupErrorCode::EventStale;
    }
    return BackupErrorCode::None;
}

bool ProtocolRouter::dispatch(const InboundMessage& inbound) {
    std::string type = messageType(inbound.message);
    BackupErrorCode result = validate(inbound.message);
    if (result != BackupErrorCode::None) {
        Logger::warning("Dropping " + type + " from " + inbound.from + ": " + toString(result));
        return false;
    }
    Logger::debug("Dispatching " + type + " from " + inbound.from);

    const std::string& from = inbound.from;
    struct Dispatcher {
        ProtocolRouter& router;
        const std::string& from;

        void operator()(const BackupInvite& m) { router.relationships_.handleInvite(from, m); }
        void operator()(const BackupInviteResponse& m) { router.relationships_.handleInviteResponse(from, m); }
        void operator()(const BackupStart& m) { router.handleBackupStart(from, m); }
        void operator()(const BackupComplete& m) { router.handleBackupComplete(from, m); }
        void operator()(const DiscoveryChallenge& m) { router.discovery_.handleChallenge(from, m); }
        void operator()(const DiscoveryResponse& m) { router.discovery_.handleResponse(from, m); }
        void operator()(const StatusChange& m) { router.relationships_.handleStatusChange(from, m); }
    };
    std::visit(Dispatcher{*this, from}, inbound.message);
    return true;
}

bool ProtocolRouter::isActiveClient(const std::string& callsign) const {
    auto client = store_.getClient(callsign);
    return client && client->status == RelationshipStatus::Active;
}

void ProtocolRouter::handleBackupStart(const std::string& from, const BackupStart& start) {
    if (!isActiveClient(from)) {
        Logger::warning("Ignoring backup start from " + from + ": not an active client");
        return;
    }

    Snapshot snapshot;
    snapshot.snapshotId = start.snapshotId;
    snapshot.status = SnapshotState::InProgress;
    snapshot.startedAt = utils::nowSeconds();
    if (snapshots_.updateSnapshotStatus(from, snapshot)) {
        Logger::info("Backup " + start.snapshotId + " started by " + from);
    }
}

void ProtocolRouter::handleBackupComplete(const std::string& from, const BackupComplete& complete) {
    if (!isActiveClient(from)) {
        Logger::warning("Ignoring backup completion from " + from + ": not an active client");
        return;
    }

    auto existing = snapshots_.getSnapshot(from, complete.snapshotId);
    Snapshot snapshot;
    snapshot.snapshotId = complete.snapshotId;
    snapshot.status = SnapshotState::Complete;
    snapshot.totalFiles = complete.totalFiles;
    snapshot.totalBytes = complete.totalBytes;
    snapshot.startedAt = existing ? existing->startedAt : utils::nowSeconds();
    snapshot.completedAt = utils::nowSeconds();
    if (snapshots_.updateSnapshotStatus(from, snapshot)) {
        Logger::info("Backup " + complete.snapshotId + " from " + from + " complete: " +
                     std::to_string(complete.totalFiles) + " files, " +
                     std::to_string(complete.totalBytes) + " bytes");
    }
}
