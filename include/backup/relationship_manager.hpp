#pragma once

#include "identity/identity.hpp"
#include "protocol/control_message.hpp"
#include "storage/relationship_store.hpp"
#include "transport/peer_transport.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Both sides of the invite handshake and relationship teardown.
// Records are persisted before the peer is told about the change.
class RelationshipManager {
public:
    RelationshipManager(RelationshipStore& store,
                        const Identity& identity,
                        PeerTransport& transport,
                        const PeerDirectory& peers,
                        const std::string& ownCallsign,
                        std::chrono::seconds inviteTimeout = std::chrono::seconds(60));

    // Client role. Blocks until the provider answers or the timeout passes.
    // Returns the provider record on an answer (active or declined); nullopt on
    // timeout or send failure, leaving the record pending.
    std::optional<ProviderRelationship> sendInvite(const std::string& providerCallsign,
                                                   int intervalDays = kDefaultBackupIntervalDays);
    bool removeProvider(const std::string& providerCallsign);

    // Provider role
    bool enableProvider(const ProviderSettings& settings);
    bool disableProvider();
    bool acceptInvite(const std::string& clientCallsign,
                      std::optional<int64_t> maxStorageBytes = std::nullopt,
                      std::optional<int> maxSnapshots = std::nullopt);
    bool declineInvite(const std::string& clientCallsign);
    bool removeClient(const std::string& clientCallsign, bool eraseData);

    // Inbound handlers, called by the protocol router
    void handleInvite(const std::string& from, const BackupInvite& invite);
    void handleInviteResponse(const std::string& from, const BackupInviteResponse& response);
    void handleStatusChange(const std::string& from, const StatusChange& change);

    void setInviteTimeout(std::chrono::seconds timeout) { inviteTimeout_ = timeout; }

private:
    using InvitePromise = std::promise<ProviderRelationship>;

    bool sendInviteResponse(const std::string& clientCallsign, bool accepted,
                            const ClientRelationship* client);
    bool sendStatusChange(const std::string& callsign, RelationshipStatus status);
    void resolveInvite(const std::string& providerCallsign, const ProviderRelationship& provider);

    RelationshipStore& store_;
    const Identity& identity_;
    PeerTransport& transport_;
    const PeerDirectory& peers_;
    std::string ownCallsign_;
    std::chrono::seconds inviteTimeout_;

    std::mutex pendingMutex_;
    std::map<std::string, std::shared_ptr<InvitePromise>> pendingInvites_;
};
