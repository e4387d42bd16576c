#include "protocol/control_message.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

using json = nlohmann::json;

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string messageType(const ControlMessage& message) {
    return std::visit(overloaded{
        [](const BackupInvite&) { return std::string("backup_invite"); },
        [](const BackupInviteResponse&) { return std::string("backup_invite_response"); },
        [](const BackupStart&) { return std::string("backup_start"); },
        [](const BackupComplete&) { return std::string("backup_complete"); },
        [](const DiscoveryChallenge&) { return std::string("backup_discovery_challenge"); },
        [](const DiscoveryResponse&) { return std::string("backup_discovery_response"); },
        [](const StatusChange&) { return std::string("backup_status_change"); }
    }, message);
}

json encodeControlMessage(const ControlMessage& message) {
    json j = std::visit(overloaded{
        [](const BackupInvite& m) {
            return json{{"event", m.event}};
        },
        [](const BackupInviteResponse& m) {
            json body{{"accepted", m.accepted}};
            if (m.accepted) {
                body["provider_npub"] = m.providerPublicKey;
                body["max_storage_bytes"] = m.maxStorageBytes;
                body["max_snapshots"] = m.maxSnapshots;
            }
            return body;
        },
        [](const BackupStart& m) {
            return json{{"snapshot_id", m.snapshotId}};
        },
        [](const BackupComplete& m) {
            return json{{"snapshot_id", m.snapshotId},
                        {"total_files", m.totalFiles},
                        {"total_bytes", m.totalBytes}};
        },
        [](const DiscoveryChallenge& m) {
            return json{{"event", m.event}, {"discovery_id", m.discoveryId}};
        },
        [](const DiscoveryResponse& m) {
            json body{{"event", m.event},
                      {"discovery_id", m.discoveryId},
                      {"has_backups", m.hasBackups}};
            if (m.maxStorageBytes) body["max_storage_bytes"] = *m.maxStorageBytes;
            if (m.snapshotCount) body["snapshot_count"] = *m.snapshotCount;
            if (m.latestSnapshot) body["latest_snapshot"] = *m.latestSnapshot;
            return body;
        },
        [](const StatusChange& m) {
            return json{{"status", toString(m.status)}};
        }
    }, message);
    j["type"] = messageType(message);
    return j;
}

std::optional<InboundMessage> parseControlMessage(const json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        Logger::warning("Dropping message without a type");
        return std::nullopt;
    }

    std::string type = j["type"].get<std::string>();
    InboundMessage inbound;

    try {
        inbound.from = utils::toUpper(j.value("from", ""));
        if (type == "backup_invite") {
            inbound.message = BackupInvite{j.at("event").get<SignedEvent>()};
        } else if (type == "backup_invite_response") {
            BackupInviteResponse m;
            m.accepted = j.at("accepted").get<bool>();
            m.providerPublicKey = j.value("provider_npub", "");
            m.maxStorageBytes = j.value("max_storage_bytes", static_cast<int64_t>(0));
            m.maxSnapshots = j.value("max_snapshots", 0);
            inbound.message = m;
        } else if (type == "backup_start") {
            inbound.message = BackupStart{j.at("snapshot_id").get<std::string>()};
        } else if (type == "backup_complete") {
            BackupComplete m;
            m.snapshotId = j.at("snapshot_id").get<std::string>();
            m.totalFiles = j.value("total_files", 0);
            m.totalBytes = j.value("total_bytes", static_cast<int64_t>(0));
            inbound.message = m;
        } else if (type == "backup_discovery_challenge") {
            DiscoveryChallenge m;
            m.event = j.at("event").get<SignedEvent>();
            m.discoveryId = j.at("discovery_id").get<std::string>();
            inbound.message = m;
        } else if (type == "backup_discovery_response") {
            DiscoveryResponse m;
            m.event = j.at("event").get<SignedEvent>();
            m.discoveryId = j.at("discovery_id").get<std::string>();
            m.hasBackups = j.value("has_backups", false);
            if (j.contains("max_storage_bytes")) m.maxStorageBytes = j["max_storage_bytes"].get<int64_t>();
            if (j.contains("snapshot_count")) m.snapshotCount = j["snapshot_count"].get<int>();
            if (j.contains("latest_snapshot") && j["latest_snapshot"].is_string()) {
                m.latestSnapshot = j["latest_snapshot"].get<std::string>();
            }
            inbound.message = m;
        } else if (type == "backup_status_change") {
            std::string status = j.at("status").get<std::string>();
            if (status != "pending" && status != "active" &&
                status != "declined" && status != "terminated") {
                Logger::warning("Dropping status change with unknown status: " + status);
                return std::nullopt;
            }
            inbound.message = StatusChange{relationshipStatusFromString(status)};
        } else {
            Logger::warning("Dropping message of unknown type: " + type);
            return std::nullopt;
        }
    } catch (const std::exception& e) {
        Logger::warning("Dropping malformed " + type + " message: " + e.what());
        return std::nullopt;
    }
    return inbound;
}

const SignedEvent* signedEventOf(const ControlMessage& message) {
    if (auto* invite = std::get_if<BackupInvite>(&message)) {
        return &invite->event;
    }
    if (auto* challenge = std::get_if<DiscoveryChallenge>(&message)) {
        return &challenge->event;
    }
    if (auto* response = std::get_if<DiscoveryResponse>(&message)) {
        return &response->event;
    }
    return nullptr;
}
