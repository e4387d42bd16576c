#pragma once

#include "storage/relationship_store.hpp"
#include "storage/snapshot_store.hpp"
#include "transport/peer_transport.hpp"
#include <string>
#include <vector>

// Provider side of the file-transfer API:
//
//   GET    /api/backup/clients/{c}/snapshots
//   PUT    /api/backup/clients/{c}/snapshots/{id}                 manifest
//   GET    /api/backup/clients/{c}/snapshots/{id}
//   DELETE /api/backup/clients/{c}/snapshots/{id}
//   PUT    /api/backup/clients/{c}/snapshots/{id}/files/{blob}    encrypted file
//   GET    /api/backup/clients/{c}/snapshots/{id}/files/{blob}
//
// PUT bodies are base64; GET answers {"data": base64}. Only an active client
// may touch its own tree.
class BackupRequestHandler {
public:
    BackupRequestHandler(RelationshipStore& store, SnapshotStore& snapshots);

    ApiResponse handleRequest(const std::string& fromCallsign,
                              const std::string& method,
                              const std::string& path,
                              const std::string& body);

    static bool handles(const std::string& path);

private:
    ApiResponse handleSnapshotList(const std::string& client);
    ApiResponse handleManifest(const std::string& client, const std::string& method,
                               const std::string& snapshotId, const std::string& body);
    ApiResponse handleBlob(const std::string& client, const std::string& method,
                           const std::string& snapshotId, const std::string& blobName,
                           const std::string& body);

    RelationshipStore& store_;
    SnapshotStore& snapshots_;
};

ApiResponse makeJsonResponse(int statusCode, const nlohmann::json& body);
ApiResponse makeErrorResponse(int statusCode, const std::string& message);
