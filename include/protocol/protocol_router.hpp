#pragma once

#include "backup/relationship_manager.hpp"
#include "common/backup_error.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "identity/identity.hpp"
#include "protocol/control_message.hpp"
#include "storage/relationship_store.hpp"
#include "storage/snapshot_store.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>

// Entry point for every inbound control message. Signed kinds must carry a
// valid signature and a created_at within the freshness window; anything
// else is logged and dropped.
class ProtocolRouter {
public:
    ProtocolRouter(const Identity& identity,
                   RelationshipStore& store,
                   SnapshotStore& snapshots,
                   RelationshipManager& relationships,
                   DiscoveryCoordinator& discovery,
                   int64_t freshnessWindowSeconds = 300);

    // True if the message was valid and dispatched
    bool handleMessage(const nlohmann::json& message);
    bool dispatch(const InboundMessage& inbound);

    // Signature and freshness check for signed kinds; other kinds pass
    BackupErrorCode validate(const ControlMessage& message) const;

private:
    void handleBackupStart(const std::string& from, const BackupStart& start);
    void handleBackupComplete(const std::string& from, const BackupComplete& complete);
    bool isActiveClient(const std::string& callsign) const;

    const Identity& identity_;
    RelationshipStore& store_;
    SnapshotStore& snapshots_;
    RelationshipManager& relationships_;
    DiscoveryCoordinator& discovery_;
    int64_t freshnessWindowSeconds_;
};
