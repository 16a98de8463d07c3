#include "backup_error.hpp"

std::string toString(BackupErrorCode code) {
    switch (code) {
        case BackupErrorCode::ConfigInvalid:     return "ConfigInvalid";
        case BackupErrorCode::SourceUnavailable: return "SourceUnavailable";
        case BackupErrorCode::IOFailure:         return "IOFailure";
        case BackupErrorCode::ChecksumMismatch:  return "ChecksumMismatch";
        case BackupErrorCode::CorruptArchive:    return "CorruptArchive";
        case BackupErrorCode::NotFound:          return "NotFound";
        case BackupErrorCode::Empty:             return "Empty";
        case BackupErrorCode::AlreadyRunning:    return "AlreadyRunning";
        case BackupErrorCode::RestoreConflict:   return "RestoreConflict";
        case BackupErrorCode::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

std::string BackupError::describe() const {
    std::string text = toString(code) + ": " + message;
    text += rolledBack ? " (partial output removed; " : " (partial output may remain; ";
    text += storeConsistent ? "data store consistent)" : "data store may be inconsistent)";
    return text;
}

BackupError makeError(BackupErrorCode code, const std::string& message,
                      bool rolledBack, bool storeConsistent) {
    return BackupError{code, message, rolledBack, storeConsistent};
}
