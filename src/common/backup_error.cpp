#include "common/backup_error.hpp"

std::string toString(BackupErrorCode code) {
    switch (code) {
        case BackupErrorCode::None:                   return "none";
        case BackupErrorCode::IdentityUnavailable:    return "identity_unavailable";
        case BackupErrorCode::ProviderNotFound:       return "provider_not_found";
        case BackupErrorCode::ProviderNotActive:      return "provider_not_active";
        case BackupErrorCode::SignatureInvalid:       return "signature_invalid";
        case BackupErrorCode::EventStale:             return "event_stale";
        case BackupErrorCode::Timeout:                return "timeout";
        case BackupErrorCode::UploadFailed:           return "upload_failed";
        case BackupErrorCode::ManifestDownloadFailed: return "manifest_download_failed";
        case BackupErrorCode::ManifestDecryptFailed:  return "manifest_decrypt_failed";
        case BackupErrorCode::DownloadFailed:         return "download_failed";
        case BackupErrorCode::HashMismatch:           return "hash_mismatch";
        case BackupErrorCode::InvalidManifest:        return "invalid_manifest";
        case BackupErrorCode::AlreadyInProgress:      return "already_in_progress";
    }
    return "unknown";
}

BackupErrorCode backupErrorCodeFromString(const std::string& name) {
    static const BackupErrorCode all[] = {
        BackupErrorCode::None, BackupErrorCode::IdentityUnavailable,
        BackupErrorCode::ProviderNotFound, BackupErrorCode::ProviderNotActive,
        BackupErrorCode::SignatureInvalid, BackupErrorCode::EventStale,
        BackupErrorCode::Timeout, BackupErrorCode::UploadFailed,
        BackupErrorCode::ManifestDownloadFailed, BackupErrorCode::ManifestDecryptFailed,
        BackupErrorCode::DownloadFailed,
        BackupErrorCode::HashMismatch, BackupErrorCode::InvalidManifest,
        BackupErrorCode::AlreadyInProgress
    };
    for (auto code : all) {
        if (toString(code) == name) {
            return code;
        }
    }
    return BackupErrorCode::None;
}
