#include "discovery/discovery_coordinator.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>

using json = nlohmann::json;

void to_json(json& j, const DiscoveredProvider& provider) {
    j = json{
        {"callsign", provider.callsign},
        {"npub", provider.publicKey},
        {"max_storage_bytes", provider.maxStorageBytes},
        {"snapshot_count", provider.snapshotCount}
    };
    if (provider.latestSnapshotId) {
        j["latest_snapshot"] = *provider.latestSnapshotId;
    }
}

void to_json(json& j, const DiscoveryStatus& status) {
    j = json{
        {"discovery_id", status.discoveryId},
        {"status", status.state == DiscoveryState::Complete ? "complete" : "in_progress"},
        {"devices_to_query", status.devicesToQuery},
        {"devices_queried", status.devicesQueried},
        {"devices_responded", status.devicesResponded},
        {"providers_found", status.providersFound}
    };
}

DiscoveryCoordinator::DiscoveryCoordinator(RelationshipStore& store,
                                           SnapshotStore& snapshots,
                                           const Identity& identity,
                                           PeerTransport& transport,
                                           const PeerDirectory& peers,
                                           ParallelTaskManager& taskManager,
                                           const std::string& ownCallsign,
                                           std::chrono::seconds runRetention)
    : store_(store)
    , snapshots_(snapshots)
    , identity_(identity)
    , transport_(transport)
    , peers_(peers)
    , taskManager_(taskManager)
    , ownCallsign_(utils::toUpper(ownCallsign))
    , runRetention_(runRetention) {
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    shutdown();
}

void DiscoveryCoordinator::shutdown() {
    std::vector<std::string> open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shuttingDown_ = true;
        for (const auto& entry : runs_) {
            if (entry.second.status.state == DiscoveryState::InProgress) {
                open.push_back(entry.first);
            }
        }
    }
    changed_.notify_all();
    if (deadlineThread_.joinable()) {
        deadlineThread_.join();
    }
    for (const auto& discoveryId : open) {
        markComplete(discoveryId);
    }
}

std::string DiscoveryCoordinator::startDiscovery(int timeoutSeconds) {
    std::string discoveryId = utils::randomHex(16);
    std::string challenge = utils::randomHex(32);
    bool refused = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        DiscoveryRun run;
        run.status.discoveryId = discoveryId;
        run.challenge = challenge;
        run.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(0, timeoutSeconds));
        refused = shuttingDown_ || !identity_.isAvailable();
        if (refused) {
            run.status.state = DiscoveryState::Complete;
            run.completedAt = std::chrono::steady_clock::now();
        }
        runs_[discoveryId] = run;
        if (!shuttingDown_ && !deadlineThread_.joinable()) {
            deadlineThread_ = std::thread(&DiscoveryCoordinator::deadlineLoop, this);
        }
    }
    changed_.notify_all();

    if (!identity_.isAvailable()) {
        Logger::error("Cannot start discovery: no identity");
        return discoveryId;
    }
    if (refused) {
        return discoveryId;
    }

    try {
        taskManager_.addTask([this, discoveryId, challenge]() {
            sendChallenges(discoveryId, challenge);
        }, TaskPriority::LOW);
    } catch (const std::exception& e) {
        Logger::error("Failed to schedule discovery: " + std::string(e.what()));
        markComplete(discoveryId);
    }
    return discoveryId;
}

void DiscoveryCoordinator::sendChallenges(const std::string& discoveryId, const std::string& challenge) {
    std::vector<PeerInfo> targets;
    for (const auto& peer : peers_.knownPeers()) {
        if (peer.online && peer.callsign != ownCallsign_) {
            targets.push_back(peer);
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(discoveryId);
        if (it == runs_.end() || it->second.status.state != DiscoveryState::InProgress) {
            return;
        }
        it->second.status.devicesToQuery = static_cast<int>(targets.size());
    }
    Logger::info("Starting discovery " + discoveryId + " across " + std::to_string(targets.size()) + " devices");

    for (const auto& peer : targets) {
        auto event = identity_.sign(kBackupEventKind, {
            {"action", "discovery_query"},
            {"target", identity_.publicKey()},
            {"challenge", challenge},
            {"callsign", ownCallsign_},
            {"target_callsign", peer.callsign}
        }, "");
        if (!event) {
            continue;
        }

        // Counted before sending; the answer may arrive inside sendMessage
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = runs_.find(discoveryId);
            if (it == runs_.end() || it->second.status.state != DiscoveryState::InProgress) {
                return;
            }
            it->second.status.devicesQueried++;
        }
        if (!transport_.sendMessage(peer.callsign, encodeControlMessage(DiscoveryChallenge{*event, discoveryId}))) {
            Logger::warning("Failed to send discovery challenge to " + peer.callsign);
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = runs_.find(discoveryId);
            if (it != runs_.end()) {
                it->second.status.devicesQueried--;
            }
        }
    }
}

namespace {

void logCompletion(const DiscoveryStatus& status) {
    Logger::info("Discovery " + status.discoveryId + " complete: " + std::to_string(status.devicesResponded) +
                 " responses, " + std::to_string(status.providersFound.size()) + " providers");
}

} // namespace

void DiscoveryCoordinator::markComplete(const std::string& discoveryId) {
    DiscoveryStatus finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(discoveryId);
        if (it == runs_.end() || it->second.status.state == DiscoveryState::Complete) {
            return;
        }
        it->second.status.state = DiscoveryState::Complete;
        it->second.completedAt = std::chrono::steady_clock::now();
        finished = it->second.status;
    }
    changed_.notify_all();
    logCompletion(finished);
}

std::vector<DiscoveryStatus> DiscoveryCoordinator::expireRunsLocked(std::chrono::steady_clock::time_point now) {
    std::vector<DiscoveryStatus> finished;
    for (auto it = runs_.begin(); it != runs_.end();) {
        DiscoveryRun& run = it->second;
        if (run.status.state == DiscoveryState::InProgress && run.deadline <= now) {
            run.status.state = DiscoveryState::Complete;
            run.completedAt = now;
            finished.push_back(run.status);
        }
        if (run.status.state == DiscoveryState::Complete && run.completedAt + runRetention_ <= now) {
            Logger::debug("Dropping finished discovery " + it->first);
            it = runs_.erase(it);
        } else {
            ++it;
        }
    }
    return finished;
}

void DiscoveryCoordinator::deadlineLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shuttingDown_) {
        auto now = std::chrono::steady_clock::now();
        std::vector<DiscoveryStatus> finished = expireRunsLocked(now);
        if (!finished.empty()) {
            lock.unlock();
            changed_.notify_all();
            for (const auto& status : finished) {
                logCompletion(status);
            }
            lock.lock();
            continue;
        }

        // Sleep until the next deadline or the next run due for removal
        std::optional<std::chrono::steady_clock::time_point> wake;
        for (const auto& entry : runs_) {
            const DiscoveryRun& run = entry.second;
            auto due = run.status.state == DiscoveryState::InProgress ? run.deadline
                                                                      : run.completedAt + runRetention_;
            if (!wake || due < *wake) {
                wake = due;
            }
        }
        if (wake) {
            changed_.wait_until(lock, *wake);
        } else {
            changed_.wait(lock);
        }
    }
}

std::optional<DiscoveryStatus> DiscoveryCoordinator::getDiscoveryStatus(const std::string& discoveryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(discoveryId);
    if (it == runs_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

bool DiscoveryCoordinator::waitForDiscovery(const std::string& discoveryId,
                                            std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, timeout, [&] {
        auto it = runs_.find(discoveryId);
        return it == runs_.end() || it->second.status.state == DiscoveryState::Complete;
    });
}

bool DiscoveryCoordinator::adoptProvider(const DiscoveredProvider& provider, int intervalDays) {
    if (store_.getProvider(provider.callsign)) {
        Logger::warning("Provider " + provider.callsign + " is already known");
        return false;
    }

    ProviderRelationship relationship;
    relationship.providerCallsign = provider.callsign;
    relationship.providerPublicKey = provider.publicKey;
    relationship.status = RelationshipStatus::Active;
    relationship.maxStorageBytes = provider.maxStorageBytes;
    relationship.backupIntervalDays = intervalDays;
    relationship.createdAt = utils::nowSeconds();
    // The provider already holds our data; the next backup waits a full
    // interval so it cannot replace a snapshot still to be restored
    if (provider.latestSnapshotId) {
        relationship.lastSuccessfulBackup = relationship.createdAt;
    }
    relationship.nextScheduledBackup = relationship.createdAt + static_cast<int64_t>(intervalDays) * kSecondsPerDay;
    return store_.saveProvider(relationship);
}

void DiscoveryCoordinator::handleChallenge(const std::string& from, const DiscoveryChallenge& challenge) {
    auto target = challenge.event.getTagValue("target");
    auto nonce = challenge.event.getTagValue("challenge");
    std::string requester = from.empty() ? challenge.event.getTagValue("callsign").value_or("") : from;
    if (!target || !nonce || requester.empty()) {
        Logger::warning("Dropping incomplete discovery challenge");
        return;
    }

    std::optional<ClientRelationship> match;
    for (const auto& client : store_.getClients()) {
        if (client.clientPublicKey == *target && client.status == RelationshipStatus::Active) {
            match = client;
            break;
        }
    }

    DiscoveryResponse response;
    response.discoveryId = challenge.discoveryId;
    response.hasBackups = match.has_value();
    if (match) {
        auto snapshots = snapshots_.getSnapshots(match->clientCallsign);
        response.maxStorageBytes = match->maxStorageBytes;
        response.snapshotCount = static_cast<int>(snapshots.size());
        if (!snapshots.empty()) {
            response.latestSnapshot = snapshots.front().snapshotId;
        }
    }

    auto event = identity_.sign(kBackupEventKind, {
        {"action", "discovery_response"},
        {"challenge", *nonce},
        {"has_backups", response.hasBackups ? "true" : "false"},
        {"callsign", ownCallsign_}
    }, "");
    if (!event) {
        return;
    }
    response.event = *event;

    if (!transport_.sendMessage(requester, encodeControlMessage(response))) {
        Logger::warning("Failed to answer discovery challenge from " + requester);
    }
}

void DiscoveryCoordinator::handleResponse(const std::string& from, const DiscoveryResponse& response) {
    std::string responder = utils::toUpper(from.empty() ? response.event.getTagValue("callsign").value_or("")
                                                        : from);
    bool signedHasBackups = response.event.getTagValue("has_backups").value_or("false") == "true";

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(response.discoveryId);
    if (it == runs_.end()) {
        Logger::debug("Discovery response for unknown run " + response.discoveryId);
        return;
    }
    DiscoveryRun& run = it->second;
    if (run.status.state != DiscoveryState::InProgress || std::chrono::steady_clock::now() >= run.deadline) {
        Logger::debug("Late discovery response from " + responder);
        return;
    }
    if (response.event.getTagValue("challenge").value_or("") != run.challenge) {
        Logger::warning("Discovery response from " + responder + " does not answer our challenge");
        return;
    }
    if (responder.empty() || !run.responders.insert(responder).second) {
        return;
    }

    run.status.devicesResponded++;
    if (response.hasBackups && signedHasBackups) {
        DiscoveredProvider provider;
        provider.callsign = responder;
        provider.publicKey = response.event.pubkey;
        provider.maxStorageBytes = response.maxStorageBytes.value_or(0);
        provider.snapshotCount = response.snapshotCount.value_or(0);
        provider.latestSnapshotId = response.latestSnapshot;
        run.status.providersFound.push_back(provider);
        Logger::info("Discovered backup provider " + responder + " with " +
                     std::to_string(provider.snapshotCount) + " snapshots");
    }
}
