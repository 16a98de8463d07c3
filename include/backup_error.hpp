/**
 * @file backup_error.hpp
 * @brief Error taxonomy shared by every VaultKeeper component.
 *
 * Operations that can fail return std::expected<T, BackupError>. The error carries a
 * machine-readable code plus the facts an operator needs: what failed, whether the
 * partial work was rolled back, and whether the live data store is still usable.
 */

#ifndef BACKUP_ERROR_HPP
#define BACKUP_ERROR_HPP

#include <string>
#include <stdexcept>

/**
 * @brief Classification of backup engine failures.
 */
enum class BackupErrorCode {
    ConfigInvalid,      ///< Invalid configuration, fatal at startup.
    SourceUnavailable,  ///< Source directory or database missing.
    IOFailure,          ///< Disk full, permission denied, lock timeout.
    ChecksumMismatch,   ///< Sidecar checksum disagrees with the artifact.
    CorruptArchive,     ///< Archive cannot be opened or enumerated.
    NotFound,           ///< Artifact does not exist.
    Empty,              ///< Artifact is zero bytes.
    AlreadyRunning,     ///< Duplicate job invocation, dropped.
    RestoreConflict,    ///< Operation lock for the artifact type is held.
    Cancelled           ///< Host requested cancellation.
};

/**
 * @brief Returns the stable name of an error code (e.g. "ChecksumMismatch").
 */
std::string toString(BackupErrorCode code);

/**
 * @brief Failure report returned by engine operations.
 */
struct BackupError {
    BackupErrorCode code = BackupErrorCode::IOFailure; ///< Failure class.
    std::string message;                               ///< What failed.
    bool rolledBack = true;                            ///< Partial output was removed.
    bool storeConsistent = true;                       ///< Live store is untouched and usable.

    /**
     * @brief Renders the error for logs and operator-facing messages.
     *
     * @return std::string e.g. "IOFailure: cannot write archive (partial output removed; data store consistent)".
     */
    std::string describe() const;
};

/**
 * @brief Convenience constructor for BackupError.
 */
BackupError makeError(BackupErrorCode code, const std::string& message,
                      bool rolledBack = true, bool storeConsistent = true);

/**
 * @brief Exception thrown when the configuration cannot be loaded or validated.
 *
 * Configuration problems must stop process startup, so unlike the per-operation
 * errors they are thrown rather than returned.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("ConfigInvalid: " + message) {}
};

#endif // BACKUP_ERROR_HPP
