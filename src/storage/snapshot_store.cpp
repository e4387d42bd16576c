#include "storage/snapshot_store.hpp"
#include "common/logger.hpp"
#include <algorithm>

namespace fs = std::filesystem;

SnapshotStore::SnapshotStore(RelationshipStore& relationships)
    : relationships_(relationships) {
}

fs::path SnapshotStore::snapshotDirectory(const std::string& clientCallsign,
                                          const std::string& snapshotId) const {
    return relationships_.clientDirectory(clientCallsign) / snapshotId;
}

bool SnapshotStore::isKnownClient(const std::string& clientCallsign) const {
    return relationships_.getClient(clientCallsign).has_value();
}

int SnapshotStore::countSnapshots(const std::string& clientCallsign) const {
    fs::path clientDir = relationships_.clientDirectory(clientCallsign);
    std::error_code ec;
    if (!fs::is_directory(clientDir, ec)) {
        return 0;
    }
    int count = 0;
    for (const auto& entry : fs::directory_iterator(clientDir, ec)) {
        if (entry.is_directory() && isValidSnapshotId(entry.path().filename().string())) {
            count++;
        }
    }
    return count;
}

std::vector<Snapshot> SnapshotStore::getSnapshots(const std::string& clientCallsign) const {
    std::vector<Snapshot> snapshots;
    if (!isKnownClient(clientCallsign)) {
        return snapshots;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fs::path clientDir = relationships_.clientDirectory(clientCallsign);
    std::error_code ec;
    if (!fs::is_directory(clientDir, ec)) {
        return snapshots;
    }

    for (const auto& entry : fs::directory_iterator(clientDir, ec)) {
        std::string snapshotId = entry.path().filename().string();
        if (!entry.is_directory() || !isValidSnapshotId(snapshotId)) {
            continue;
        }
        auto j = readJsonFile(entry.path() / "status.json");
        if (!j) {
            continue;
        }
        try {
            snapshots.push_back(j->get<Snapshot>());
        } catch (const std::exception& e) {
            Logger::warning("Skipping unreadable snapshot status " + snapshotId + ": " + e.what());
        }
    }

    std::sort(snapshots.begin(), snapshots.end(), [](const Snapshot& a, const Snapshot& b) {
        return a.snapshotId > b.snapshotId;
    });
    return snapshots;
}

std::optional<Snapshot> SnapshotStore::getSnapshot(const std::string& clientCallsign,
                                                   const std::string& snapshotId) const {
    if (!isValidSnapshotId(snapshotId) || !isKnownClient(clientCallsign)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto j = readJsonFile(snapshotDirectory(clientCallsign, snapshotId) / "status.json");
    if (!j) {
        return std::nullopt;
    }
    try {
        return j->get<Snapshot>();
    } catch (const std::exception& e) {
        Logger::error("Invalid snapshot status " + snapshotId + ": " + e.what());
        return std::nullopt;
    }
}

bool SnapshotStore::updateSnapshotStatus(const std::string& clientCallsign, const Snapshot& snapshot) {
    if (!isValidSnapshotId(snapshot.snapshotId)) {
        Logger::warning("Rejected snapshot status with invalid id: " + snapshot.snapshotId);
        return false;
    }
    if (!isKnownClient(clientCallsign)) {
        Logger::warning("Snapshot status for unknown client " + clientCallsign);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!writeJsonFile(snapshotDirectory(clientCallsign, snapshot.snapshotId) / "status.json", snapshot)) {
        return false;
    }

    int count = countSnapshots(clientCallsign);
    std::string status = toString(snapshot.status);
    return relationships_.updateClient(clientCallsign, [&](ClientRelationship& client) {
        client.snapshotCount = count;
        client.lastBackupAt = utils::nowSeconds();
        client.lastBackupStatus = status;
    });
}

std::optional<Bytes> SnapshotStore::getManifest(const std::string& clientCallsign,
                                                const std::string& snapshotId) const {
    if (!isValidSnapshotId(snapshotId) || !isKnownClient(clientCallsign)) {
        return std::nullopt;
    }
    return utils::readFile((snapshotDirectory(clientCallsign, snapshotId) / "manifest.json").string());
}

bool SnapshotStore::saveManifest(const std::string& clientCallsign, const std::string& snapshotId,
                                 const Bytes& data) {
    if (!isValidSnapshotId(snapshotId) || !isKnownClient(clientCallsign)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return utils::writeFile((snapshotDirectory(clientCallsign, snapshotId) / "manifest.json").string(), data);
}

std::optional<Bytes> SnapshotStore::getEncryptedFile(const std::string& clientCallsign,
                                                     const std::string& snapshotId,
                                                     const std::string& blobName) const {
    if (!isValidSnapshotId(snapshotId) || !isValidBlobName(blobName) || !isKnownClient(clientCallsign)) {
        return std::nullopt;
    }
    return utils::readFile((snapshotDirectory(clientCallsign, snapshotId) / "files" / blobName).string());
}

bool SnapshotStore::saveEncryptedFile(const std::string& clientCallsign, const std::string& snapshotId,
                                      const std::string& blobName, const Bytes& data) {
    if (!isValidSnapshotId(snapshotId) || !isValidBlobName(blobName) || !isKnownClient(clientCallsign)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fs::path path = snapshotDirectory(clientCallsign, snapshotId) / "files" / blobName;
    std::error_code ec;
    int64_t previousSize = fs::exists(path, ec) ? static_cast<int64_t>(fs::file_size(path, ec)) : 0;
    if (ec) {
        previousSize = 0;
    }

    if (!utils::writeFile(path.string(), data)) {
        return false;
    }

    int64_t delta = static_cast<int64_t>(data.size()) - previousSize;
    if (!relationships_.hasQuotaAvailable(clientCallsign, delta)) {
        Logger::warning("Client " + clientCallsign + " is over its storage quota");
    }
    return relationships_.updateClient(clientCallsign, [delta](ClientRelationship& client) {
        client.currentStorageBytes += delta;
    });
}

bool SnapshotStore::deleteSnapshot(const std::string& clientCallsign, const std::string& snapshotId) {
    if (!isValidSnapshotId(snapshotId) || !isKnownClient(clientCallsign)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fs::path dir = snapshotDirectory(clientCallsign, snapshotId);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return false;
    }

    int64_t freed = 0;
    fs::path filesDir = dir / "files";
    if (fs::is_directory(filesDir, ec)) {
        for (const auto& entry : fs::directory_iterator(filesDir, ec)) {
            if (entry.is_regular_file()) {
                freed += static_cast<int64_t>(entry.file_size());
            }
        }
    }

    fs::remove_all(dir, ec);
    if (ec) {
        Logger::error("Failed to delete snapshot " + snapshotId + " of " + clientCallsign + ": " + ec.message());
        return false;
    }

    int count = countSnapshots(clientCallsign);
    Logger::info("Deleted snapshot " + snapshotId + " of " + clientCallsign);
    return relationships_.updateClient(clientCallsign, [&](ClientRelationship& client) {
        client.currentStorageBytes = std::max<int64_t>(0, client.currentStorageBytes - freed);
        client.snapshotCount = count;
    });
}
