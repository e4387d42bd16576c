#include "restore/restore_executor.hpp"
#include "backup/backup_executor.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

std::optional<Bytes> decodeDataEnvelope(const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.is_object() || !j.contains("data") || !j["data"].is_string()) {
            return std::nullopt;
        }
        return utils::base64Decode(j["data"].get<std::string>());
    } catch (const json::exception& e) {
        Logger::debug("Malformed data envelope: " + std::string(e.what()));
        return std::nullopt;
    }
}

RestoreExecutor::RestoreExecutor(RelationshipStore& store,
                                 const Identity& identity,
                                 PeerTransport& transport,
                                 ParallelTaskManager& taskManager,
                                 const std::string& dataDir,
                                 const std::string& ownCallsign)
    : TransferJob(taskManager, "Restore", BackupErrorCode::DownloadFailed)
    , store_(store)
    , identity_(identity)
    , transport_(transport)
    , dataDir_(dataDir)
    , ownCallsign_(utils::toUpper(ownCallsign)) {
}

RestoreStatus RestoreExecutor::startRestore(const std::string& providerCallsign,
                                            const std::string& snapshotId) {
    std::string callsign = utils::toUpper(providerCallsign);

    if (isRunning()) {
        TransferStatus current = getStatus();
        current.errorCode = BackupErrorCode::AlreadyInProgress;
        current.error = "A restore is already in progress";
        Logger::warning("Restore already in progress, ignoring request for " + callsign);
        return current;
    }

    if (!identity_.isAvailable()) {
        return reject(callsign, BackupErrorCode::IdentityUnavailable, "No identity available for restore");
    }
    // Any status will do: restoring after termination is allowed
    if (!store_.getProvider(callsign)) {
        return reject(callsign, BackupErrorCode::ProviderNotFound, "Unknown backup provider " + callsign);
    }
    if (!isValidSnapshotId(snapshotId)) {
        return reject(callsign, BackupErrorCode::InvalidManifest, "Invalid snapshot id " + snapshotId);
    }

    TransferStatus initial;
    initial.peerCallsign = callsign;
    initial.snapshotId = snapshotId;

    TransferStatus current;
    if (!tryBegin(initial, current)) {
        return current;
    }

    Logger::info("Starting restore of " + snapshotId + " from " + callsign);
    // Ahead of any queued backup that would read the directory being restored
    launch([this, callsign, snapshotId]() {
        executeRestore(callsign, snapshotId);
    }, TaskPriority::HIGH);
    return current;
}

std::optional<std::vector<Snapshot>> RestoreExecutor::listRemoteSnapshots(const std::string& providerCallsign) {
    std::string callsign = utils::toUpper(providerCallsign);
    ApiResponse response = transport_.apiRequest(callsign, "GET",
        "/api/backup/clients/" + ownCallsign_ + "/snapshots");
    if (!response.success) {
        Logger::error("Failed to list snapshots on " + callsign + ": " + response.error);
        return std::nullopt;
    }

    try {
        json j = json::parse(response.body);
        return j.at("snapshots").get<std::vector<Snapshot>>();
    } catch (const json::exception& e) {
        Logger::error("Malformed snapshot list from " + callsign + ": " + e.what());
        return std::nullopt;
    }
}

void RestoreExecutor::executeRestore(const std::string& providerCallsign, const std::string& snapshotId) {
    Manifest manifest = fetchManifest(providerCallsign, snapshotId);

    int64_t totalBytes = 0;
    for (const auto& entry : manifest.files) {
        totalBytes += entry.plaintextSize;
    }
    updateStatus([&](TransferStatus& status) {
        status.filesTotal = static_cast<int>(manifest.files.size());
        status.bytesTotal = totalBytes;
    });

    for (const auto& entry : manifest.files) {
        restoreFile(providerCallsign, snapshotId, entry);
        updateStatus([&](TransferStatus& status) {
            status.filesTransferred++;
            status.bytesTransferred += entry.plaintextSize;
        });
    }

    setComplete();
}

Manifest RestoreExecutor::fetchManifest(const std::string& providerCallsign, const std::string& snapshotId) {
    ApiResponse response = transport_.apiRequest(providerCallsign, "GET",
                                                 snapshotApiPath(ownCallsign_, snapshotId));
    if (!response.success) {
        throw BackupError(BackupErrorCode::ManifestDownloadFailed,
                          "Failed to download manifest: " + response.error);
    }

    auto encrypted = decodeDataEnvelope(response.body);
    if (!encrypted) {
        throw BackupError(BackupErrorCode::ManifestDownloadFailed, "Malformed manifest response");
    }

    auto plaintext = identity_.decryptManifest(*encrypted);
    if (!plaintext) {
        throw BackupError(BackupErrorCode::ManifestDecryptFailed, "Failed to decrypt manifest");
    }

    Manifest manifest;
    try {
        manifest = json::parse(plaintext->begin(), plaintext->end()).get<Manifest>();
    } catch (const json::exception& e) {
        throw BackupError(BackupErrorCode::InvalidManifest, "Failed to parse manifest: " + std::string(e.what()));
    }

    for (const auto& entry : manifest.files) {
        if (!isValidBlobName(entry.encryptedBlobName)) {
            throw BackupError(BackupErrorCode::InvalidManifest,
                              "Invalid blob name in manifest: " + entry.encryptedBlobName);
        }
        resolveTarget(entry.relativePath);
    }
    return manifest;
}

fs::path RestoreExecutor::resolveTarget(const std::string& relativePath) const {
    fs::path relative(relativePath);
    if (relativePath.empty() || relative.is_absolute() || relative.has_root_name()) {
        throw BackupError(BackupErrorCode::InvalidManifest, "Refusing to restore to " + relativePath);
    }
    for (const auto& component : relative) {
        if (component == "..") {
            throw BackupError(BackupErrorCode::InvalidManifest, "Refusing to restore to " + relativePath);
        }
    }
    return dataDir_ / relative;
}

void RestoreExecutor::restoreFile(const std::string& providerCallsign, const std::string& snapshotId,
                                  const FileEntry& entry) {
    ApiResponse response = transport_.apiRequest(providerCallsign, "GET",
        blobApiPath(ownCallsign_, snapshotId, entry.encryptedBlobName));
    if (!response.success) {
        throw BackupError(BackupErrorCode::DownloadFailed,
                          "Failed to download " + entry.relativePath + ": " + response.error);
    }

    auto encrypted = decodeDataEnvelope(response.body);
    if (!encrypted) {
        throw BackupError(BackupErrorCode::DownloadFailed, "Malformed response for " + entry.relativePath);
    }

    // A tampered blob fails authentication before the hash is ever computed
    auto plaintext = identity_.decrypt(*encrypted);
    if (!plaintext) {
        throw BackupError(BackupErrorCode::HashMismatch, "Integrity check failed for " + entry.relativePath);
    }

    if (utils::sha256Hex(*plaintext) != entry.contentHash) {
        throw BackupError(BackupErrorCode::HashMismatch, "Hash mismatch for " + entry.relativePath);
    }

    fs::path target = resolveTarget(entry.relativePath);
    if (!utils::writeFile(target.string(), *plaintext)) {
        throw BackupError(BackupErrorCode::DownloadFailed, "Failed to write " + target.string());
    }
    Logger::debug("Restored " + entry.relativePath);
}
