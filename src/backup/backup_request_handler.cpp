#include "backup/backup_request_handler.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <sstream>

using json = nlohmann::json;

namespace {

const std::string kClientsPrefix = "/api/backup/clients/";

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace

ApiResponse makeJsonResponse(int statusCode, const json& body) {
    ApiResponse response;
    response.statusCode = statusCode;
    response.success = statusCode >= 200 && statusCode < 300;
    response.body = body.dump();
    if (!response.success) {
        response.error = body.value("error", "HTTP " + std::to_string(statusCode));
    }
    return response;
}

ApiResponse makeErrorResponse(int statusCode, const std::string& message) {
    return makeJsonResponse(statusCode, json{{"error", message}});
}

BackupRequestHandler::BackupRequestHandler(RelationshipStore& store, SnapshotStore& snapshots)
    : store_(store)
    , snapshots_(snapshots) {
}

bool BackupRequestHandler::handles(const std::string& path) {
    return path.compare(0, kClientsPrefix.size(), kClientsPrefix) == 0;
}

ApiResponse BackupRequestHandler::handleRequest(const std::string& fromCallsign,
                                                const std::string& method,
                                                const std::string& path,
                                                const std::string& body) {
    // api backup clients {c} snapshots [{id} [files {blob}]]
    std::vector<std::string> parts = splitPath(path);
    if (parts.size() < 5 || parts[0] != "api" || parts[1] != "backup" ||
        parts[2] != "clients" || parts[4] != "snapshots") {
        return makeErrorResponse(404, "Not found");
    }

    std::string client = utils::toUpper(parts[3]);
    std::string requester = utils::toUpper(fromCallsign);
    if (requester != client) {
        Logger::warning("Rejected " + method + " " + path + " from " + requester);
        return makeErrorResponse(403, "Forbidden");
    }
    auto relationship = store_.getClient(client);
    if (!relationship || relationship->status != RelationshipStatus::Active) {
        Logger::warning("Rejected " + method + " " + path + ": " + client + " is not an active client");
        return makeErrorResponse(403, "Forbidden");
    }

    if (parts.size() == 5) {
        if (method != "GET") {
            return makeErrorResponse(405, "Method not allowed");
        }
        return handleSnapshotList(client);
    }

    const std::string& snapshotId = parts[5];
    if (!isValidSnapshotId(snapshotId)) {
        return makeErrorResponse(400, "Invalid snapshot id");
    }
    if (parts.size() == 6) {
        return handleManifest(client, method, snapshotId, body);
    }
    if (parts.size() == 8 && parts[6] == "files") {
        if (!isValidBlobName(parts[7])) {
            return makeErrorResponse(400, "Invalid file name");
        }
        return handleBlob(client, method, snapshotId, parts[7], body);
    }
    return makeErrorResponse(404, "Not found");
}

ApiResponse BackupRequestHandler::handleSnapshotList(const std::string& client) {
    return makeJsonResponse(200, json{{"snapshots", snapshots_.getSnapshots(client)}});
}

ApiResponse BackupRequestHandler::handleManifest(const std::string& client, const std::string& method,
                                                 const std::string& snapshotId, const std::string& body) {
    if (method == "GET") {
        auto data = snapshots_.getManifest(client, snapshotId);
        if (!data) {
            return makeErrorResponse(404, "Manifest not found");
        }
        return makeJsonResponse(200, json{{"data", utils::base64Encode(*data)}});
    }
    if (method == "PUT") {
        auto data = utils::base64Decode(body);
        if (!data) {
            return makeErrorResponse(400, "Invalid base64 payload");
        }
        if (!snapshots_.saveManifest(client, snapshotId, *data)) {
            return makeErrorResponse(500, "Failed to store manifest");
        }
        Logger::debug("Stored manifest " + snapshotId + " for " + client);
        return makeJsonResponse(200, json{{"success", true}});
    }
    if (method == "DELETE") {
        if (!snapshots_.deleteSnapshot(client, snapshotId)) {
            return makeErrorResponse(404, "Snapshot not found");
        }
        return makeJsonResponse(200, json{{"success", true}});
    }
    return makeErrorResponse(405, "Method not allowed");
}

ApiResponse BackupRequestHandler::handleBlob(const std::string& client, const std::string& method,
                                             const std::string& snapshotId, const std::string& blobName,
                                             const std::string& body) {
    if (method == "GET") {
        auto data = snapshots_.getEncryptedFile(client, snapshotId, blobName);
        if (!data) {
            return makeErrorResponse(404, "File not found");
        }
        return makeJsonResponse(200, json{{"data", utils::base64Encode(*data)}});
    }
    if (method == "PUT") {
        auto data = utils::base64Decode(body);
        if (!data) {
            return makeErrorResponse(400, "Invalid base64 payload");
        }
        if (!snapshots_.saveEncryptedFile(client, snapshotId, blobName, *data)) {
            return makeErrorResponse(500, "Failed to store file");
        }
        return makeJsonResponse(200, json{{"success", true}});
    }
    return makeErrorResponse(405, "Method not allowed");
}
