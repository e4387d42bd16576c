#pragma once

#include "backup/backup_executor.hpp"
#include "backup/backup_request_handler.hpp"
#include "backup/backup_scheduler.hpp"
#include "backup/node_config.hpp"
#include "backup/relationship_manager.hpp"
#include "common/parallel_task_manager.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "identity/identity.hpp"
#include "protocol/protocol_router.hpp"
#include "restore/restore_executor.hpp"
#include "storage/relationship_store.hpp"
#include "storage/snapshot_store.hpp"
#include "transport/configured_peer_directory.hpp"
#include "transport/peer_transport.hpp"
#include <memory>
#include <string>

// One backup participant: owns the stores, the worker pool and every
// protocol component, wired together by reference.
class BackupNode {
public:
    BackupNode(const NodeConfig& config,
               std::shared_ptr<Identity> identity,
               std::shared_ptr<PeerTransport> transport);
    ~BackupNode();

    BackupNode(const BackupNode&) = delete;
    BackupNode& operator=(const BackupNode&) = delete;

    // Loads persisted relationships
    bool initialize();

    // Inbound control message as delivered by the transport
    bool handleMessage(const nlohmann::json& message);

    // Inbound API request; POST /api/backup/message carries a control message
    ApiResponse handleApiRequest(const std::string& fromCallsign,
                                 const std::string& method,
                                 const std::string& path,
                                 const std::string& body);

    const NodeConfig& config() const { return config_; }
    const std::string& callsign() const { return config_.callsign; }
    const Identity& identity() const { return *identity_; }

    RelationshipStore& relationshipStore() { return relationshipStore_; }
    SnapshotStore& snapshotStore() { return snapshotStore_; }
    ConfiguredPeerDirectory& peerDirectory() { return peerDirectory_; }
    RelationshipManager& relationships() { return relationshipManager_; }
    BackupExecutor& backupExecutor() { return backupExecutor_; }
    RestoreExecutor& restoreExecutor() { return restoreExecutor_; }
    DiscoveryCoordinator& discovery() { return discovery_; }
    ProtocolRouter& router() { return router_; }
    BackupScheduler& scheduler() { return scheduler_; }

private:
    NodeConfig config_;
    std::shared_ptr<Identity> identity_;
    std::shared_ptr<PeerTransport> transport_;

    RelationshipStore relationshipStore_;
    SnapshotStore snapshotStore_;
    ConfiguredPeerDirectory peerDirectory_;
    RelationshipManager relationshipManager_;
    BackupRequestHandler requestHandler_;
    BackupExecutor backupExecutor_;
    RestoreExecutor restoreExecutor_;
    DiscoveryCoordinator discovery_;
    ProtocolRouter router_;
    BackupScheduler scheduler_;

    // Declared last so it is destroyed first: workers are joined while every
    // component a task can touch is still alive
    ParallelTaskManager taskManager_;
};
