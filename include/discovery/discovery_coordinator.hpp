#pragma once

#include "common/parallel_task_manager.hpp"
#include "identity/identity.hpp"
#include "protocol/control_message.hpp"
#include "storage/relationship_store.hpp"
#include "storage/snapshot_store.hpp"
#include "transport/peer_transport.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

struct DiscoveredProvider {
    std::string callsign;
    std::string publicKey;
    int64_t maxStorageBytes{0};
    int snapshotCount{0};
    std::optional<std::string> latestSnapshotId;
};

enum class DiscoveryState {
    InProgress,
    Complete
};

struct DiscoveryStatus {
    std::string discoveryId;
    DiscoveryState state{DiscoveryState::InProgress};
    int devicesToQuery{0};
    int devicesQueried{0};
    int devicesResponded{0};
    std::vector<DiscoveredProvider> providersFound;
};

void to_json(nlohmann::json& j, const DiscoveredProvider& provider);
void to_json(nlohmann::json& j, const DiscoveryStatus& status);

// Finds the providers holding backups for our public key after device loss.
//
// Broadcaster: signs a challenge for every online peer and collects signed
// answers until the timeout. Challenges go out on a short worker task; one
// deadline thread completes every run, so overlapping runs hold no workers. Responder: every peer answers every valid
// challenge, so a has_backups=false reply is indistinguishable in shape from
// a positive one apart from the flag and its details.
class DiscoveryCoordinator {
public:
    DiscoveryCoordinator(RelationshipStore& store,
                         SnapshotStore& snapshots,
                         const Identity& identity,
                         PeerTransport& transport,
                         const PeerDirectory& peers,
                         ParallelTaskManager& taskManager,
                         const std::string& ownCallsign,
                         std::chrono::seconds runRetention = std::chrono::hours(1));
    ~DiscoveryCoordinator();

    // Does not block; poll getDiscoveryStatus with the returned id
    std::string startDiscovery(int timeoutSeconds);
    std::optional<DiscoveryStatus> getDiscoveryStatus(const std::string& discoveryId) const;
    bool waitForDiscovery(const std::string& discoveryId, std::chrono::milliseconds timeout) const;

    // Records a discovered provider as an active relationship so its
    // snapshots can be restored
    bool adoptProvider(const DiscoveredProvider& provider, int intervalDays = kDefaultBackupIntervalDays);

    void handleChallenge(const std::string& from, const DiscoveryChallenge& challenge);
    void handleResponse(const std::string& from, const DiscoveryResponse& response);

    // Completes every open run and stops the deadline thread
    void shutdown();

private:
    struct DiscoveryRun {
        DiscoveryStatus status;
        std::string challenge;
        std::set<std::string> responders;
        std::chrono::steady_clock::time_point deadline;
        std::chrono::steady_clock::time_point completedAt;
    };

    void sendChallenges(const std::string& discoveryId, const std::string& challenge);
    void markComplete(const std::string& discoveryId);
    void deadlineLoop();
    // Completes expired runs and drops runs finished more than the retention
    // ago; returns the runs it completed
    std::vector<DiscoveryStatus> expireRunsLocked(std::chrono::steady_clock::time_point now);

    RelationshipStore& store_;
    SnapshotStore& snapshots_;
    const Identity& identity_;
    PeerTransport& transport_;
    const PeerDirectory& peers_;
    ParallelTaskManager& taskManager_;
    std::string ownCallsign_;
    std::chrono::seconds runRetention_;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::map<std::string, DiscoveryRun> runs_;
    bool shuttingDown_{false};
    std::thread deadlineThread_;
};
