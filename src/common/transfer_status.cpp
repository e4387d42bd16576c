#include "common/transfer_status.hpp"
#include <algorithm>

void TransferStatus::recomputeProgress() {
    if (state == TransferState::Complete) {
        progressPercent = 100;
        return;
    }
    if (filesTotal <= 0) {
        progressPercent = 0;
        return;
    }
    int percent = static_cast<int>((static_cast<int64_t>(filesTransferred) * 100) / filesTotal);
    progressPercent = std::clamp(percent, 0, 100);
}

std::string toString(TransferState state) {
    switch (state) {
        case TransferState::Idle:       return "idle";
        case TransferState::InProgress: return "in_progress";
        case TransferState::Complete:   return "complete";
        case TransferState::Failed:     return "failed";
    }
    return "idle";
}

TransferState transferStateFromString(const std::string& name) {
    if (name == "in_progress") return TransferState::InProgress;
    if (name == "complete") return TransferState::Complete;
    if (name == "failed") return TransferState::Failed;
    return TransferState::Idle;
}

void to_json(nlohmann::json& j, const TransferStatus& status) {
    j = nlohmann::json{
        {"peer_callsign", status.peerCallsign},
        {"snapshot_id", status.snapshotId},
        {"state", toString(status.state)},
        {"files_total", status.filesTotal},
        {"files_transferred", status.filesTransferred},
        {"bytes_total", status.bytesTotal},
        {"bytes_transferred", status.bytesTransferred},
        {"progress_percent", status.progressPercent},
        {"started_at", status.startedAt}
    };
    if (!status.error.empty()) {
        j["error"] = status.error;
    }
    if (status.errorCode != BackupErrorCode::None) {
        j["error_code"] = toString(status.errorCode);
    }
}

void from_json(const nlohmann::json& j, TransferStatus& status) {
    status.peerCallsign = j.value("peer_callsign", "");
    status.snapshotId = j.value("snapshot_id", "");
    status.state = transferStateFromString(j.value("state", "idle"));
    status.filesTotal = j.value("files_total", 0);
    status.filesTransferred = j.value("files_transferred", 0);
    status.bytesTotal = j.value("bytes_total", static_cast<int64_t>(0));
    status.bytesTransferred = j.value("bytes_transferred", static_cast<int64_t>(0));
    status.progressPercent = j.value("progress_percent", 0);
    status.startedAt = j.value("started_at", static_cast<int64_t>(0));
    status.error = j.value("error", "");
    status.errorCode = backupErrorCodeFromString(j.value("error_code", "none"));
}
