#pragma once

#include <stdexcept>
#include <string>

enum class BackupErrorCode {
    None,
    IdentityUnavailable,
    ProviderNotFound,
    ProviderNotActive,
    SignatureInvalid,
    EventStale,
    Timeout,
    UploadFailed,
    ManifestDownloadFailed,
    ManifestDecryptFailed,
    DownloadFailed,
    HashMismatch,
    InvalidManifest,
    AlreadyInProgress
};

std::string toString(BackupErrorCode code);
BackupErrorCode backupErrorCodeFromString(const std::string& name);

// Raised inside executor tasks and converted to TransferStatus::error at the
// task boundary.
class BackupError : public std::runtime_error {
public:
    BackupError(BackupErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    BackupErrorCode code() const { return code_; }

private:
    BackupErrorCode code_;
};
