#include "backup/relationship_manager.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

RelationshipManager::RelationshipManager(RelationshipStore& store,
                                         const Identity& identity,
                                         PeerTransport& transport,
                                         const PeerDirectory& peers,
                                         const std::string& ownCallsign,
                                         std::chrono::seconds inviteTimeout)
    : store_(store)
    , identity_(identity)
    , transport_(transport)
    , peers_(peers)
    , ownCallsign_(utils::toUpper(ownCallsign))
    , inviteTimeout_(inviteTimeout) {
}

std::optional<ProviderRelationship> RelationshipManager::sendInvite(const std::string& providerCallsign,
                                                                    int intervalDays) {
    std::string callsign = utils::toUpper(providerCallsign);
    if (!identity_.isAvailable()) {
        Logger::error("Cannot send backup invite: no identity");
        return std::nullopt;
    }
    if (intervalDays < 1) {
        intervalDays = kDefaultBackupIntervalDays;
    }

    auto existing = store_.getProvider(callsign);
    if (existing) {
        if (existing->status == RelationshipStatus::Active) {
            return existing;
        }
        if (existing->status != RelationshipStatus::Pending) {
            Logger::warning("Relationship with " + callsign + " is " + toString(existing->status) +
                            " and cannot be re-invited");
            return std::nullopt;
        }
    }

    ProviderRelationship provider = existing.value_or(ProviderRelationship{});
    provider.providerCallsign = callsign;
    provider.backupIntervalDays = intervalDays;
    if (!existing) {
        provider.createdAt = utils::nowSeconds();
    }
    if (!store_.saveProvider(provider)) {
        return std::nullopt;
    }

    auto event = identity_.sign(kBackupEventKind, {
        {"action", "backup_invite"},
        {"target", callsign},
        {"callsign", ownCallsign_},
        {"interval_days", std::to_string(intervalDays)}
    }, "");
    if (!event) {
        return std::nullopt;
    }

    // Registered before sending; the answer may arrive on this very call
    auto promise = std::make_shared<InvitePromise>();
    std::future<ProviderRelationship> answer = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pendingInvites_[callsign] = promise;
    }

    Logger::info("Sending backup invite to " + callsign);
    if (!transport_.sendMessage(callsign, encodeControlMessage(BackupInvite{*event}))) {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pendingInvites_.erase(callsign);
        Logger::error("Failed to send backup invite to " + callsign);
        return std::nullopt;
    }

    if (answer.wait_for(inviteTimeout_) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            auto it = pendingInvites_.find(callsign);
            if (it != pendingInvites_.end() && it->second == promise) {
                pendingInvites_.erase(it);
            }
        }
        // A response may have raced the timeout check
        if (answer.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            Logger::warning("Backup invite to " + callsign + " timed out");
            return std::nullopt;
        }
    }
    return answer.get();
}

void RelationshipManager::resolveInvite(const std::string& providerCallsign,
                                        const ProviderRelationship& provider) {
    std::shared_ptr<InvitePromise> promise;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        auto it = pendingInvites_.find(providerCallsign);
        if (it == pendingInvites_.end()) {
            return;
        }
        promise = it->second;
        pendingInvites_.erase(it);
    }
    promise->set_value(provider);
}

bool RelationshipManager::removeProvider(const std::string& providerCallsign) {
    std::string callsign = utils::toUpper(providerCallsign);
    auto provider = store_.getProvider(callsign);
    if (!provider) {
        return false;
    }
    if (!store_.updateProvider(callsign, [](ProviderRelationship& p) {
            p.status = RelationshipStatus::Terminated;
        })) {
        return false;
    }
    Logger::info("Terminated backup relationship with provider " + callsign);
    sendStatusChange(callsign, RelationshipStatus::Terminated);
    return true;
}

bool RelationshipManager::enableProvider(const ProviderSettings& settings) {
    ProviderSettings updated = settings;
    updated.enabled = true;
    if (!store_.saveSettings(updated)) {
        return false;
    }
    Logger::info("Backup provider mode enabled");
    return true;
}

bool RelationshipManager::disableProvider() {
    ProviderSettings settings = store_.getSettings();
    settings.enabled = false;
    if (!store_.saveSettings(settings)) {
        return false;
    }
    Logger::info("Backup provider mode disabled");
    return true;
}

bool RelationshipManager::acceptInvite(const std::string& clientCallsign,
                                       std::optional<int64_t> maxStorageBytes,
                                       std::optional<int> maxSnapshots) {
    std::string callsign = utils::toUpper(clientCallsign);
    auto client = store_.getClient(callsign);
    if (!client || client->status != RelationshipStatus::Pending) {
        Logger::warning("No pending backup invite from " + callsign);
        return false;
    }

    ProviderSettings settings = store_.getSettings();
    int64_t storage = maxStorageBytes.value_or(settings.defaultMaxClientStorageBytes);
    int snapshots = maxSnapshots.value_or(settings.defaultMaxSnapshots);
    if (!store_.updateClient(callsign, [&](ClientRelationship& c) {
            c.status = RelationshipStatus::Active;
            c.maxStorageBytes = storage;
            c.maxSnapshots = snapshots;
        })) {
        return false;
    }

    auto updated = store_.getClient(callsign);
    Logger::info("Accepted backup invite from " + callsign);
    sendInviteResponse(callsign, true, updated ? &*updated : nullptr);
    return true;
}

bool RelationshipManager::declineInvite(const std::string& clientCallsign) {
    std::string callsign = utils::toUpper(clientCallsign);
    auto client = store_.getClient(callsign);
    if (!client || client->status != RelationshipStatus::Pending) {
        Logger::warning("No pending backup invite from " + callsign);
        return false;
    }
    if (!store_.updateClient(callsign, [](ClientRelationship& c) {
            c.status = RelationshipStatus::Declined;
        })) {
        return false;
    }
    Logger::info("Declined backup invite from " + callsign);
    sendInviteResponse(callsign, false, nullptr);
    return true;
}

bool RelationshipManager::removeClient(const std::string& clientCallsign, bool eraseData) {
    std::string callsign = utils::toUpper(clientCallsign);
    auto client = store_.getClient(callsign);
    if (!client) {
        return false;
    }
    if (!store_.removeClient(callsign, eraseData)) {
        return false;
    }
    if (client->status == RelationshipStatus::Active) {
        sendStatusChange(callsign, RelationshipStatus::Terminated);
    }
    return true;
}

void RelationshipManager::handleInvite(const std::string& from, const BackupInvite& invite) {
    std::string callsign = utils::toUpper(from.empty() ? invite.event.getTagValue("callsign").value_or("")
                                                       : from);
    if (callsign.empty()) {
        Logger::warning("Dropping backup invite without a sender");
        return;
    }
    auto target = invite.event.getTagValue("target");
    if (target && utils::toUpper(*target) != ownCallsign_) {
        Logger::warning("Dropping backup invite from " + callsign + " addressed to " + *target);
        return;
    }

    ProviderSettings settings = store_.getSettings();
    if (!settings.enabled) {
        Logger::info("Declining backup invite from " + callsign + ": provider mode disabled");
        sendInviteResponse(callsign, false, nullptr);
        return;
    }

    auto existing = store_.getClient(callsign);
    if (existing) {
        switch (existing->status) {
            case RelationshipStatus::Active:
                // Lost response; answer again
                sendInviteResponse(callsign, true, &*existing);
                return;
            case RelationshipStatus::Declined:
            case RelationshipStatus::Terminated:
                Logger::warning("Ignoring backup invite from " + callsign + ": relationship is " +
                                toString(existing->status));
                return;
            case RelationshipStatus::Pending:
                break;
        }
    }

    ClientRelationship client = existing.value_or(ClientRelationship{});
    client.clientCallsign = callsign;
    client.clientPublicKey = invite.event.pubkey;
    client.maxStorageBytes = settings.defaultMaxClientStorageBytes;
    client.maxSnapshots = settings.defaultMaxSnapshots;
    if (!existing) {
        client.createdAt = utils::nowSeconds();
    }
    if (!store_.saveClient(client)) {
        return;
    }
    Logger::info("Received backup invite from " + callsign);

    if (settings.autoAcceptFromContacts && peers_.isKnown(callsign)) {
        acceptInvite(callsign);
    }
}

void RelationshipManager::handleInviteResponse(const std::string& from,
                                               const BackupInviteResponse& response) {
    std::string callsign = utils::toUpper(from);
    auto provider = store_.getProvider(callsign);
    if (!provider) {
        Logger::warning("Ignoring unsolicited invite response from " + callsign);
        return;
    }

    bool updated = store_.updateProvider(callsign, [&](ProviderRelationship& p) {
        if (response.accepted) {
            p.status = RelationshipStatus::Active;
            p.providerPublicKey = response.providerPublicKey;
            p.maxStorageBytes = response.maxStorageBytes;
            p.maxSnapshots = response.maxSnapshots;
        } else {
            p.status = RelationshipStatus::Declined;
        }
    });
    if (!updated) {
        return;
    }

    auto stored = store_.getProvider(callsign);
    if (!stored) {
        return;
    }
    Logger::info("Backup provider " + callsign + (response.accepted ? " accepted" : " declined") +
                 " the invite");
    resolveInvite(callsign, *stored);
}

void RelationshipManager::handleStatusChange(const std::string& from, const StatusChange& change) {
    std::string callsign = utils::toUpper(from);
    bool applied = false;

    if (store_.getClient(callsign)) {
        applied |= store_.updateClient(callsign, [&](ClientRelationship& c) { c.status = change.status; });
    }
    if (store_.getProvider(callsign)) {
        applied |= store_.updateProvider(callsign, [&](ProviderRelationship& p) { p.status = change.status; });
    }

    if (applied) {
        Logger::info("Backup relationship with " + callsign + " is now " + toString(change.status));
    } else {
        Logger::warning("Ignored status change to " + toString(change.status) + " from " + callsign);
    }
}

bool RelationshipManager::sendInviteResponse(const std::string& clientCallsign, bool accepted,
                                             const ClientRelationship* client) {
    BackupInviteResponse response;
    response.accepted = accepted;
    if (accepted && client) {
        response.providerPublicKey = identity_.publicKey();
        response.maxStorageBytes = client->maxStorageBytes;
        response.maxSnapshots = client->maxSnapshots;
    }
    return transport_.sendMessage(clientCallsign, encodeControlMessage(response));
}

bool RelationshipManager::sendStatusChange(const std::string& callsign, RelationshipStatus status) {
    return transport_.sendMessage(callsign, encodeControlMessage(StatusChange{status}));
}
