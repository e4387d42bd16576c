#pragma once

#include "common/utils.hpp"
#include "storage/backup_models.hpp"
#include "storage/relationship_store.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Provider-side storage of client snapshots:
//   backups/{CLIENT}/{snapshotId}/manifest.json   (opaque encrypted bytes)
//   backups/{CLIENT}/{snapshotId}/status.json
//   backups/{CLIENT}/{snapshotId}/files/{blobName}
//
// Keeps currentStorageBytes, snapshotCount and the last backup fields of the
// owning ClientRelationship in step with what is on disk. Unknown clients and
// malformed ids are refused without touching the filesystem.
class SnapshotStore {
public:
    explicit SnapshotStore(RelationshipStore& relationships);

    // Newest first
    std::vector<Snapshot> getSnapshots(const std::string& clientCallsign) const;
    std::optional<Snapshot> getSnapshot(const std::string& clientCallsign,
                                        const std::string& snapshotId) const;

    // Writes status.json, then recounts snapshots and records lastBackupAt/Status
    bool updateSnapshotStatus(const std::string& clientCallsign, const Snapshot& snapshot);

    std::optional<Bytes> getManifest(const std::string& clientCallsign,
                                     const std::string& snapshotId) const;
    bool saveManifest(const std::string& clientCallsign, const std::string& snapshotId,
                      const Bytes& data);

    std::optional<Bytes> getEncryptedFile(const std::string& clientCallsign,
                                          const std::string& snapshotId,
                                          const std::string& blobName) const;
    // Adds the stored size to currentStorageBytes (replacing a blob counts the difference)
    bool saveEncryptedFile(const std::string& clientCallsign, const std::string& snapshotId,
                           const std::string& blobName, const Bytes& data);

    bool deleteSnapshot(const std::string& clientCallsign, const std::string& snapshotId);

private:
    std::filesystem::path snapshotDirectory(const std::string& clientCallsign,
                                            const std::string& snapshotId) const;
    bool isKnownClient(const std::string& clientCallsign) const;
    int countSnapshots(const std::string& clientCallsign) const;

    RelationshipStore& relationships_;
    mutable std::mutex mutex_;
};
