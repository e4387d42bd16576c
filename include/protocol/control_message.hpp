#pragma once

#include "identity/identity.hpp"
#include "storage/backup_models.hpp"
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

struct BackupInvite {
    SignedEvent event;
};

struct BackupInviteResponse {
    bool accepted{false};
    std::string providerPublicKey;
    int64_t maxStorageBytes{0};
    int maxSnapshots{0};
};

struct BackupStart {
    std::string snapshotId;
};

struct BackupComplete {
    std::string snapshotId;
    int totalFiles{0};
    int64_t totalBytes{0};
};

struct DiscoveryChallenge {
    SignedEvent event;
    std::string discoveryId;
};

struct DiscoveryResponse {
    SignedEvent event;
    std::string discoveryId;
    bool hasBackups{false};
    std::optional<int64_t> maxStorageBytes;
    std::optional<int> snapshotCount;
    std::optional<std::string> latestSnapshot;
};

struct StatusChange {
    RelationshipStatus status{RelationshipStatus::Terminated};
};

using ControlMessage = std::variant<BackupInvite,
                                    BackupInviteResponse,
                                    BackupStart,
                                    BackupComplete,
                                    DiscoveryChallenge,
                                    DiscoveryResponse,
                                    StatusChange>;

// A control message together with the sender callsign the transport stamped on it
struct InboundMessage {
    std::string from;
    ControlMessage message;
};

std::string messageType(const ControlMessage& message);

// Serializes with "type"; the sender adds "target"
nlohmann::json encodeControlMessage(const ControlMessage& message);

// nullopt for unknown types or missing fields
std::optional<InboundMessage> parseControlMessage(const nlohmann::json& j);

// Signed kinds carry an event that must verify and be fresh before dispatch
const SignedEvent* signedEventOf(const ControlMessage& message);
