#pragma once

#include "common/transfer_job.hpp"
#include "identity/identity.hpp"
#include "storage/backup_models.hpp"
#include "storage/relationship_store.hpp"
#include "transport/peer_transport.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Client side of a restore run. Downloads and decrypts the manifest, then
// fetches, decrypts and verifies each file in manifest order, writing it back
// under the data directory. A hash mismatch stops the run; files already
// written stay on disk.
class RestoreExecutor : public TransferJob {
public:
    RestoreExecutor(RelationshipStore& store,
                    const Identity& identity,
                    PeerTransport& transport,
                    ParallelTaskManager& taskManager,
                    const std::string& dataDir,
                    const std::string& ownCallsign);

    RestoreStatus startRestore(const std::string& providerCallsign, const std::string& snapshotId);

    // Snapshot list the provider holds for us, newest first; nullopt on failure
    std::optional<std::vector<Snapshot>> listRemoteSnapshots(const std::string& providerCallsign);

private:
    void executeRestore(const std::string& providerCallsign, const std::string& snapshotId);
    Manifest fetchManifest(const std::string& providerCallsign, const std::string& snapshotId);
    void restoreFile(const std::string& providerCallsign, const std::string& snapshotId,
                     const FileEntry& entry);
    std::filesystem::path resolveTarget(const std::string& relativePath) const;

    RelationshipStore& store_;
    const Identity& identity_;
    PeerTransport& transport_;
    std::filesystem::path dataDir_;
    std::string ownCallsign_;
};

// Decodes the {"data": base64} envelope used by GET responses
std::optional<Bytes> decodeDataEnvelope(const std::string& body);
