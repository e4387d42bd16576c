#pragma once

#include "common/backup_error.hpp"
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

enum class TransferState {
    Idle,
    InProgress,
    Complete,
    Failed
};

// Progress of one backup or restore run. Published after every file.
struct TransferStatus {
    std::string peerCallsign;
    std::string snapshotId;
    TransferState state{TransferState::Idle};
    int filesTotal{0};
    int filesTransferred{0};
    int64_t bytesTotal{0};
    int64_t bytesTransferred{0};
    int progressPercent{0};
    std::string error;
    BackupErrorCode errorCode{BackupErrorCode::None};
    int64_t startedAt{0};

    bool isRunning() const { return state == TransferState::InProgress; }

    // filesTransferred * 100 / filesTotal, clamped to [0, 100]; 100 once complete.
    void recomputeProgress();
};

using BackupStatus = TransferStatus;
using RestoreStatus = TransferStatus;

std::string toString(TransferState state);
TransferState transferStateFromString(const std::string& name);

void to_json(nlohmann::json& j, const TransferStatus& status);
void from_json(const nlohmann::json& j, TransferStatus& status);
