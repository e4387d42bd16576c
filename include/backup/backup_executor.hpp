#pragma once

#include "common/transfer_job.hpp"
#include "identity/identity.hpp"
#include "storage/backup_models.hpp"
#include "storage/relationship_store.hpp"
#include "transport/peer_transport.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

// Client side of a backup run. Encrypts every file under the data directory
// to our own public identity, uploads the blobs and then the encrypted
// manifest to the provider. One run at a time per node.
class BackupExecutor : public TransferJob {
public:
    BackupExecutor(RelationshipStore& store,
                   const Identity& identity,
                   PeerTransport& transport,
                   ParallelTaskManager& taskManager,
                   const std::string& dataDir,
                   const std::string& ownCallsign,
                   const std::vector<std::string>& extraExcludedDirectories = {});

    // Returns immediately with the status of the new run, or of the rejection
    BackupStatus startBackup(const std::string& providerCallsign);

    // Regular files under the data directory, sorted by relative path
    std::vector<std::filesystem::path> enumerateFiles() const;

private:
    void executeBackup(const ProviderRelationship& provider, const std::string& snapshotId);
    FileEntry uploadFile(const std::string& providerCallsign, const std::string& snapshotId,
                         const std::filesystem::path& relativePath);
    void uploadManifest(const std::string& providerCallsign, const Manifest& manifest);
    bool isExcluded(const std::filesystem::path& relativePath) const;

    RelationshipStore& store_;
    const Identity& identity_;
    PeerTransport& transport_;
    std::filesystem::path dataDir_;
    std::string ownCallsign_;
    std::set<std::string> excludedDirectories_;
};

// /api/backup/clients/{client}/snapshots/{snapshotId}
std::string snapshotApiPath(const std::string& clientCallsign, const std::string& snapshotId);
// /api/backup/clients/{client}/snapshots/{snapshotId}/files/{blobName}
std::string blobApiPath(const std::string& clientCallsign, const std::string& snapshotId,
                        const std::string& blobName);
