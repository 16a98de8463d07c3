/**
 * @file backup_verifier.hpp
 * @brief Integrity checks for backup artifacts.
 *
 * An artifact is verified in two steps: its bytes are compared against the checksum
 * recorded in the sidecar, then its structure is validated (every zip entry decodes,
 * or a raw snapshot carries the SQLite header). An artifact without a sidecar passes on
 * structure alone.
 */

#ifndef BACKUP_VERIFIER_HPP
#define BACKUP_VERIFIER_HPP

#include <string>
#include <optional>
#include <cstdint>
#include "backup_config.hpp"
#include "backup_error.hpp"

/**
 * @brief Outcome of verifying one artifact.
 */
struct VerificationResult {
    bool valid = false;                 ///< Artifact can be restored.
    std::optional<bool> checksumMatch;  ///< Unset when the artifact has no sidecar.
    uint64_t fileCount = 0;             ///< File entries found in the archive.
    std::optional<BackupError> error;   ///< NotFound, Empty, ChecksumMismatch or CorruptArchive.
};

/**
 * @brief Verifies an artifact.
 *
 * @param backupPath Artifact path.
 * @param type Artifact type, selecting the structural check.
 * @return VerificationResult Never throws; failures are reported in the result.
 */
VerificationResult verifyBackup(const std::string& backupPath, BackupType type);

/**
 * @brief Returns true if the file starts with the SQLite 3 database header.
 */
bool hasSQLiteHeader(const std::string& path);

#endif // BACKUP_VERIFIER_HPP
