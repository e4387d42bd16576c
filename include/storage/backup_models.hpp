#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class RelationshipStatus {
    Pending,
    Active,
    Declined,
    Terminated
};

std::string toString(RelationshipStatus status);
// Unknown names load as Pending
RelationshipStatus relationshipStatusFromString(const std::string& name);

// Allowed: pending -> active, pending -> declined, active -> terminated.
// Keeping the current status is not a transition and is always allowed.
bool isAllowedTransition(RelationshipStatus from, RelationshipStatus to);

constexpr int64_t kDefaultMaxTotalStorageBytes = 10737418240LL;  // 10 GiB
constexpr int64_t kDefaultMaxClientStorageBytes = 1073741824LL;  // 1 GiB
constexpr int kDefaultMaxSnapshots = 10;
constexpr int kDefaultBackupIntervalDays = 3;
constexpr int64_t kSecondsPerDay = 86400;

struct ProviderSettings {
    bool enabled{false};
    int64_t maxTotalStorageBytes{kDefaultMaxTotalStorageBytes};
    int64_t defaultMaxClientStorageBytes{kDefaultMaxClientStorageBytes};
    int defaultMaxSnapshots{kDefaultMaxSnapshots};
    bool autoAcceptFromContacts{false};
    int64_t updatedAt{0};
};

// Provider-side record of a device that backs up here
struct ClientRelationship {
    std::string clientPublicKey;
    std::string clientCallsign;
    int64_t maxStorageBytes{kDefaultMaxClientStorageBytes};
    int maxSnapshots{kDefaultMaxSnapshots};
    int64_t currentStorageBytes{0};
    int snapshotCount{0};
    RelationshipStatus status{RelationshipStatus::Pending};
    int64_t createdAt{0};
    std::optional<int64_t> lastBackupAt;
    std::optional<std::string> lastBackupStatus;
};

// Client-side record of a device that stores our backups
struct ProviderRelationship {
    std::string providerPublicKey;
    std::string providerCallsign;
    int backupIntervalDays{kDefaultBackupIntervalDays};
    RelationshipStatus status{RelationshipStatus::Pending};
    int64_t maxStorageBytes{0};
    int maxSnapshots{0};
    std::optional<int64_t> lastSuccessfulBackup;
    std::optional<int64_t> nextScheduledBackup;
    int64_t createdAt{0};
};

enum class SnapshotState {
    InProgress,
    Complete,
    Failed
};

std::string toString(SnapshotState state);
SnapshotState snapshotStateFromString(const std::string& name);

struct Snapshot {
    std::string snapshotId;
    SnapshotState status{SnapshotState::InProgress};
    int totalFiles{0};
    int64_t totalBytes{0};
    int64_t startedAt{0};
    std::optional<int64_t> completedAt;
};

struct FileEntry {
    std::string relativePath;
    std::string contentHash;
    int64_t plaintextSize{0};
    int64_t encryptedSize{0};
    std::string encryptedBlobName;
    int64_t modifiedAt{0};
};

struct Manifest {
    std::string version{"1.0"};
    std::string snapshotId;
    std::string clientPublicKey;
    std::string clientCallsign;
    std::vector<FileEntry> files;
    int totalFiles{0};
    int64_t totalBytes{0};
    int64_t startedAt{0};
    std::optional<int64_t> completedAt;
};

// YYYY-MM-DD
bool isValidSnapshotId(const std::string& snapshotId);
// 32 hex characters followed by ".enc"
bool isValidBlobName(const std::string& blobName);
// Upper-case letters, digits and '-'; rejects anything usable as a path
bool isValidCallsign(const std::string& callsign);

void to_json(nlohmann::json& j, const ProviderSettings& settings);
void from_json(const nlohmann::json& j, ProviderSettings& settings);
void to_json(nlohmann::json& j, const ClientRelationship& client);
void from_json(const nlohmann::json& j, ClientRelationship& client);
void to_json(nlohmann::json& j, const ProviderRelationship& provider);
void from_json(const nlohmann::json& j, ProviderRelationship& provider);
void to_json(nlohmann::json& j, const Snapshot& snapshot);
void from_json(const nlohmann::json& j, Snapshot& snapshot);
void to_json(nlohmann::json& j, const FileEntry& entry);
void from_json(const nlohmann::json& j, FileEntry& entry);
void to_json(nlohmann::json& j, const Manifest& manifest);
void from_json(const nlohmann::json& j, Manifest& manifest);
