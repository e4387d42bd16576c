#include "backup/backup_executor.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "protocol/control_message.hpp"
#include <algorithm>
#include <chrono>

namespace fs = std::filesystem;

namespace {

const char* kDefaultExcluded[] = {"backups", "backup-config", "updates"};

int64_t modificationTime(const fs::path& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        return utils::nowSeconds();
    }
    auto systemTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(systemTime.time_since_epoch()).count();
}

} // namespace

std::string snapshotApiPath(const std::string& clientCallsign, const std::string& snapshotId) {
    return "/api/backup/clients/" + utils::toUpper(clientCallsign) + "/snapshots/" + snapshotId;
}

std::string blobApiPath(const std::string& clientCallsign, const std::string& snapshotId,
                        const std::string& blobName) {
    return snapshotApiPath(clientCallsign, snapshotId) + "/files/" + blobName;
}

BackupExecutor::BackupExecutor(RelationshipStore& store,
                               const Identity& identity,
                               PeerTransport& transport,
                               ParallelTaskManager& taskManager,
                               const std::string& dataDir,
                               const std::string& ownCallsign,
                               const std::vector<std::string>& extraExcludedDirectories)
    : TransferJob(taskManager, "Backup", BackupErrorCode::UploadFailed)
    , store_(store)
    , identity_(identity)
    , transport_(transport)
    , dataDir_(dataDir)
    , ownCallsign_(utils::toUpper(ownCallsign)) {
    for (const char* name : kDefaultExcluded) {
        excludedDirectories_.insert(name);
    }
    excludedDirectories_.insert(extraExcludedDirectories.begin(), extraExcludedDirectories.end());
}

BackupStatus BackupExecutor::startBackup(const std::string& providerCallsign) {
    std::string callsign = utils::toUpper(providerCallsign);

    if (isRunning()) {
        TransferStatus current = getStatus();
        current.errorCode = BackupErrorCode::AlreadyInProgress;
        current.error = "A backup is already in progress";
        Logger::warning("Backup already in progress, ignoring request for " + callsign);
        return current;
    }

    if (!identity_.isAvailable()) {
        return reject(callsign, BackupErrorCode::IdentityUnavailable, "No identity available for backup");
    }

    auto provider = store_.getProvider(callsign);
    if (!provider) {
        return reject(callsign, BackupErrorCode::ProviderNotFound, "Unknown backup provider " + callsign);
    }
    if (provider->status != RelationshipStatus::Active) {
        return reject(callsign, BackupErrorCode::ProviderNotActive,
                      "Backup provider " + callsign + " is " + toString(provider->status));
    }

    TransferStatus initial;
    initial.peerCallsign = callsign;
    initial.snapshotId = utils::localDateString(utils::nowSeconds());

    TransferStatus current;
    if (!tryBegin(initial, current)) {
        Logger::warning("Backup already in progress, ignoring request for " + callsign);
        return current;
    }

    Logger::info("Starting backup " + initial.snapshotId + " to " + callsign);
    ProviderRelationship target = *provider;
    std::string snapshotId = initial.snapshotId;
    launch([this, target, snapshotId]() {
        executeBackup(target, snapshotId);
    });
    return current;
}

bool BackupExecutor::isExcluded(const fs::path& relativePath) const {
    for (const auto& component : relativePath) {
        if (excludedDirectories_.count(component.string()) > 0) {
            return true;
        }
    }
    return false;
}

std::vector<fs::path> BackupExecutor::enumerateFiles() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dataDir_, ec)) {
        return files;
    }

    fs::recursive_directory_iterator it(dataDir_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw BackupError(BackupErrorCode::UploadFailed,
                          "Failed to scan " + dataDir_.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw BackupError(BackupErrorCode::UploadFailed,
                              "Failed to scan " + dataDir_.string() + ": " + ec.message());
        }
        fs::path relative = it->path().lexically_relative(dataDir_);
        if (it->is_directory()) {
            if (isExcluded(relative)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file() && !isExcluded(relative)) {
            files.push_back(relative);
        }
    }

    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    });
    return files;
}

void BackupExecutor::executeBackup(const ProviderRelationship& provider, const std::string& snapshotId) {
    const std::string& providerCallsign = provider.providerCallsign;

    if (!transport_.sendMessage(providerCallsign, encodeControlMessage(BackupStart{snapshotId}))) {
        Logger::warning("Failed to notify " + providerCallsign + " of backup start");
    }

    std::vector<fs::path> files = enumerateFiles();
    int64_t totalBytes = 0;
    for (const auto& file : files) {
        std::error_code ec;
        auto size = fs::file_size(dataDir_ / file, ec);
        if (!ec) {
            totalBytes += static_cast<int64_t>(size);
        }
    }

    updateStatus([&](TransferStatus& status) {
        status.filesTotal = static_cast<int>(files.size());
        status.bytesTotal = totalBytes;
    });
    Logger::info("Backing up " + std::to_string(files.size()) + " files (" +
                 std::to_string(totalBytes) + " bytes) to " + providerCallsign);

    Manifest manifest;
    manifest.snapshotId = snapshotId;
    manifest.clientPublicKey = identity_.publicKey();
    manifest.clientCallsign = ownCallsign_;
    manifest.startedAt = getStatus().startedAt;

    for (const auto& file : files) {
        FileEntry entry = uploadFile(providerCallsign, snapshotId, file);
        manifest.files.push_back(entry);
        manifest.totalBytes += entry.plaintextSize;

        updateStatus([&](TransferStatus& status) {
            status.filesTransferred++;
            status.bytesTransferred += entry.plaintextSize;
        });
    }

    manifest.totalFiles = static_cast<int>(manifest.files.size());
    manifest.completedAt = utils::nowSeconds();
    uploadManifest(providerCallsign, manifest);

    BackupComplete complete{snapshotId, manifest.totalFiles, manifest.totalBytes};
    if (!transport_.sendMessage(providerCallsign, encodeControlMessage(complete))) {
        Logger::warning("Failed to notify " + providerCallsign + " of backup completion");
    }

    int64_t now = utils::nowSeconds();
    store_.updateProvider(providerCallsign, [now](ProviderRelationship& p) {
        p.lastSuccessfulBackup = now;
        p.nextScheduledBackup = now + static_cast<int64_t>(p.backupIntervalDays) * kSecondsPerDay;
    });

    setComplete();
}

FileEntry BackupExecutor::uploadFile(const std::string& providerCallsign, const std::string& snapshotId,
                                     const fs::path& relativePath) {
    fs::path fullPath = dataDir_ / relativePath;
    auto data = utils::readFile(fullPath.string());
    if (!data) {
        throw BackupError(BackupErrorCode::UploadFailed, "Failed to read " + fullPath.string());
    }

    FileEntry entry;
    entry.relativePath = relativePath.generic_string();
    entry.contentHash = utils::sha256Hex(*data);
    entry.plaintextSize = static_cast<int64_t>(data->size());
    entry.modifiedAt = modificationTime(fullPath);

    // Only the owner's private key can open the blob again
    auto encrypted = identity_.encryptFor(identity_.publicKey(), *data);
    if (!encrypted) {
        throw BackupError(BackupErrorCode::UploadFailed, "Failed to encrypt " + entry.relativePath);
    }
    entry.encryptedSize = static_cast<int64_t>(encrypted->size());
    entry.encryptedBlobName = utils::randomHex(16) + ".enc";

    ApiResponse response = transport_.apiRequest(providerCallsign, "PUT",
        blobApiPath(ownCallsign_, snapshotId, entry.encryptedBlobName),
        utils::base64Encode(*encrypted));
    if (!response.success) {
        throw BackupError(BackupErrorCode::UploadFailed,
                          "Failed to upload " + entry.relativePath + ": " + response.error);
    }

    Logger::debug("Uploaded " + entry.relativePath + " as " + entry.encryptedBlobName);
    return entry;
}

void BackupExecutor::uploadManifest(const std::string& providerCallsign, const Manifest& manifest) {
    nlohmann::json j = manifest;
    std::string text = j.dump();
    auto encrypted = identity_.encryptManifest(Bytes(text.begin(), text.end()));
    if (!encrypted) {
        throw BackupError(BackupErrorCode::UploadFailed, "Failed to encrypt manifest");
    }

    ApiResponse response = transport_.apiRequest(providerCallsign, "PUT",
        snapshotApiPath(ownCallsign_, manifest.snapshotId),
        utils::base64Encode(*encrypted));
    if (!response.success) {
        throw BackupError(BackupErrorCode::UploadFailed, "Failed to upload manifest: " + response.error);
    }
}
