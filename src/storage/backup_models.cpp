#include "storage/backup_models.hpp"
#include "common/utils.hpp"
#include <cctype>

using json = nlohmann::json;

namespace {

int64_t readTimestamp(const json& j, const char* key, int64_t fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    if (j[key].is_number_integer()) {
        return j[key].get<int64_t>();
    }
    return utils::fromIso8601(j[key].get<std::string>()).value_or(fallback);
}

std::optional<int64_t> readOptionalTimestamp(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    if (j[key].is_number_integer()) {
        return j[key].get<int64_t>();
    }
    return utils::fromIso8601(j[key].get<std::string>());
}

} // namespace

std::string toString(RelationshipStatus status) {
    switch (status) {
        case RelationshipStatus::Pending:    return "pending";
        case RelationshipStatus::Active:     return "active";
        case RelationshipStatus::Declined:   return "declined";
        case RelationshipStatus::Terminated: return "terminated";
    }
    return "pending";
}

RelationshipStatus relationshipStatusFromString(const std::string& name) {
    if (name == "active") return RelationshipStatus::Active;
    if (name == "declined") return RelationshipStatus::Declined;
    if (name == "terminated") return RelationshipStatus::Terminated;
    return RelationshipStatus::Pending;
}

bool isAllowedTransition(RelationshipStatus from, RelationshipStatus to) {
    if (from == to) {
        return true;
    }
    switch (from) {
        case RelationshipStatus::Pending:
            return to == RelationshipStatus::Active || to == RelationshipStatus::Declined;
        case RelationshipStatus::Active:
            return to == RelationshipStatus::Terminated;
        case RelationshipStatus::Declined:
        case RelationshipStatus::Terminated:
            return false;
    }
    return false;
}

std::string toString(SnapshotState state) {
    switch (state) {
        case SnapshotState::InProgress: return "in_progress";
        case SnapshotState::Complete:   return "complete";
        case SnapshotState::Failed:     return "failed";
    }
    return "in_progress";
}

SnapshotState snapshotStateFromString(const std::string& name) {
    if (name == "complete") return SnapshotState::Complete;
    if (name == "failed") return SnapshotState::Failed;
    return SnapshotState::InProgress;
}

bool isValidSnapshotId(const std::string& snapshotId) {
    if (snapshotId.size() != 10 || snapshotId[4] != '-' || snapshotId[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < snapshotId.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(snapshotId[i]))) {
            return false;
        }
    }
    return true;
}

bool isValidBlobName(const std::string& blobName) {
    const std::string suffix = ".enc";
    if (blobName.size() != 32 + suffix.size() ||
        blobName.compare(32, suffix.size(), suffix) != 0) {
        return false;
    }
    for (size_t i = 0; i < 32; ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(blobName[i]))) {
            return false;
        }
    }
    return true;
}

bool isValidCallsign(const std::string& callsign) {
    if (callsign.empty() || callsign.size() > 32) {
        return false;
    }
    for (char c : callsign) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
    }
    return true;
}

void to_json(json& j, const ProviderSettings& settings) {
    j = json{
        {"enabled", settings.enabled},
        {"max_total_storage_bytes", settings.maxTotalStorageBytes},
        {"default_max_client_storage_bytes", settings.defaultMaxClientStorageBytes},
        {"default_max_snapshots", settings.defaultMaxSnapshots},
        {"auto_accept_from_contacts", settings.autoAcceptFromContacts},
        {"updated_at", utils::toIso8601(settings.updatedAt)}
    };
}

void from_json(const json& j, ProviderSettings& settings) {
    settings.enabled = j.value("enabled", false);
    settings.maxTotalStorageBytes = j.value("max_total_storage_bytes", kDefaultMaxTotalStorageBytes);
    settings.defaultMaxClientStorageBytes =
        j.value("default_max_client_storage_bytes", kDefaultMaxClientStorageBytes);
    settings.defaultMaxSnapshots = j.value("default_max_snapshots", kDefaultMaxSnapshots);
    settings.autoAcceptFromContacts = j.value("auto_accept_from_contacts", false);
    settings.updatedAt = readTimestamp(j, "updated_at", utils::nowSeconds());
}

void to_json(json& j, const ClientRelationship& client) {
    j = json{
        {"client_npub", client.clientPublicKey},
        {"client_callsign", client.clientCallsign},
        {"max_storage_bytes", client.maxStorageBytes},
        {"max_snapshots", client.maxSnapshots},
        {"current_storage_bytes", client.currentStorageBytes},
        {"snapshot_count", client.snapshotCount},
        {"status", toString(client.status)},
        {"created_at", utils::toIso8601(client.createdAt)}
    };
    if (client.lastBackupAt) {
        j["last_backup_at"] = utils::toIso8601(*client.lastBackupAt);
    }
    if (client.lastBackupStatus) {
        j["last_backup_status"] = *client.lastBackupStatus;
    }
}

void from_json(const json& j, ClientRelationship& client) {
    client.clientPublicKey = j.at("client_npub").get<std::string>();
    client.clientCallsign = utils::toUpper(j.at("client_callsign").get<std::string>());
    client.maxStorageBytes = j.value("max_storage_bytes", kDefaultMaxClientStorageBytes);
    client.maxSnapshots = j.value("max_snapshots", kDefaultMaxSnapshots);
    client.currentStorageBytes = j.value("current_storage_bytes", static_cast<int64_t>(0));
    client.snapshotCount = j.value("snapshot_count", 0);
    client.status = relationshipStatusFromString(j.value("status", "pending"));
    client.createdAt = readTimestamp(j, "created_at", utils::nowSeconds());
    client.lastBackupAt = readOptionalTimestamp(j, "last_backup_at");
    if (j.contains("last_backup_status") && j["last_backup_status"].is_string()) {
        client.lastBackupStatus = j["last_backup_status"].get<std::string>();
    } else {
        client.lastBackupStatus.reset();
    }
}

void to_json(json& j, const ProviderRelationship& provider) {
    j = json{
        {"provider_npub", provider.providerPublicKey},
        {"provider_callsign", provider.providerCallsign},
        {"backup_interval_days", provider.backupIntervalDays},
        {"status", toString(provider.status)},
        {"max_storage_bytes", provider.maxStorageBytes},
        {"max_snapshots", provider.maxSnapshots},
        {"created_at", utils::toIso8601(provider.createdAt)}
    };
    if (provider.lastSuccessfulBackup) {
        j["last_successful_backup"] = utils::toIso8601(*provider.lastSuccessfulBackup);
    }
    if (provider.nextScheduledBackup) {
        j["next_scheduled_backup"] = utils::toIso8601(*provider.nextScheduledBackup);
    }
}

void from_json(const json& j, ProviderRelationship& provider) {
    provider.providerPublicKey = j.value("provider_npub", "");
    provider.providerCallsign = utils::toUpper(j.at("provider_callsign").get<std::string>());
    provider.backupIntervalDays = j.value("backup_interval_days", kDefaultBackupIntervalDays);
    provider.status = relationshipStatusFromString(j.value("status", "pending"));
    provider.maxStorageBytes = j.value("max_storage_bytes", static_cast<int64_t>(0));
    provider.maxSnapshots = j.value("max_snapshots", 0);
    provider.lastSuccessfulBackup = readOptionalTimestamp(j, "last_successful_backup");
    provider.nextScheduledBackup = readOptionalTimestamp(j, "next_scheduled_backup");
    provider.createdAt = readTimestamp(j, "created_at", utils::nowSeconds());
}

void to_json(json& j, const Snapshot& snapshot) {
    j = json{
        {"snapshot_id", snapshot.snapshotId},
        {"status", toString(snapshot.status)},
        {"total_files", snapshot.totalFiles},
        {"total_bytes", snapshot.totalBytes},
        {"started_at", utils::toIso8601(snapshot.startedAt)}
    };
    if (snapshot.completedAt) {
        j["completed_at"] = utils::toIso8601(*snapshot.completedAt);
    }
}

void from_json(const json& j, Snapshot& snapshot) {
    snapshot.snapshotId = j.at("snapshot_id").get<std::string>();
    snapshot.status = snapshotStateFromString(j.value("status", "in_progress"));
    snapshot.totalFiles = j.value("total_files", 0);
    snapshot.totalBytes = j.value("total_bytes", static_cast<int64_t>(0));
    snapshot.startedAt = readTimestamp(j, "started_at", utils::nowSeconds());
    snapshot.completedAt = readOptionalTimestamp(j, "completed_at");
}

void to_json(json& j, const FileEntry& entry) {
    j = json{
        {"path", entry.relativePath},
        {"sha256", entry.contentHash},
        {"size", entry.plaintextSize},
        {"encrypted_size", entry.encryptedSize},
        {"encrypted_name", entry.encryptedBlobName},
        {"modified_at", utils::toIso8601(entry.modifiedAt)}
    };
}

void from_json(const json& j, FileEntry& entry) {
    entry.relativePath = j.at("path").get<std::string>();
    entry.contentHash = j.at("sha256").get<std::string>();
    entry.plaintextSize = j.at("size").get<int64_t>();
    entry.encryptedSize = j.at("encrypted_size").get<int64_t>();
    entry.encryptedBlobName = j.at("encrypted_name").get<std::string>();
    entry.modifiedAt = readTimestamp(j, "modified_at", 0);
}

void to_json(json& j, const Manifest& manifest) {
    j = json{
        {"version", manifest.version},
        {"snapshot_id", manifest.snapshotId},
        {"client_npub", manifest.clientPublicKey},
        {"client_callsign", manifest.clientCallsign},
        {"started_at", utils::toIso8601(manifest.startedAt)},
        {"total_files", manifest.totalFiles},
        {"total_bytes", manifest.totalBytes},
        {"files", manifest.files}
    };
    if (manifest.completedAt) {
        j["completed_at"] = utils::toIso8601(*manifest.completedAt);
    }
}

void from_json(const json& j, Manifest& manifest) {
    manifest.version = j.value("version", "1.0");
    manifest.snapshotId = j.at("snapshot_id").get<std::string>();
    manifest.clientPublicKey = j.at("client_npub").get<std::string>();
    manifest.clientCallsign = j.at("client_callsign").get<std::string>();
    manifest.startedAt = readTimestamp(j, "started_at", 0);
    manifest.completedAt = readOptionalTimestamp(j, "completed_at");
    manifest.totalFiles = j.value("total_files", 0);
    manifest.totalBytes = j.value("total_bytes", static_cast<int64_t>(0));
    manifest.files = j.value("files", std::vector<FileEntry>{});
}
