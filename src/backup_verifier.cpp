#include "backup_verifier.hpp"
#include "archive_io.hpp"
#include "backup_metadata.hpp"
#include "checksum.hpp"
#include <fstream>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr char SQLiteMagic[] = "SQLite format 3";

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

VerificationResult failed(BackupError error) {
    VerificationResult result;
    result.error = std::move(error);
    return result;
}

} // namespace

bool hasSQLiteHeader(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    char header[sizeof(SQLiteMagic)] = {};
    in.read(header, sizeof(header));
    return in.gcount() == static_cast<std::streamsize>(sizeof(header)) &&
           std::memcmp(header, SQLiteMagic, sizeof(SQLiteMagic)) == 0;
}

VerificationResult verifyBackup(const std::string& backupPath, BackupType type) {
    std::error_code ec;
    if (!fs::is_regular_file(backupPath, ec)) {
        return failed(makeError(BackupErrorCode::NotFound, "Backup file not found: " + backupPath));
    }
    auto size = fs::file_size(backupPath, ec);
    if (ec || size == 0) {
        return failed(makeError(BackupErrorCode::Empty, "Backup file is empty: " + backupPath));
    }

    VerificationResult result;
    auto metadata = readSidecar(backupPath);
    if (metadata) {
        auto checksum = sha256File(backupPath);
        if (!checksum) {
            result.error = checksum.error();
            return result;
        }
        result.checksumMatch = *checksum == metadata->checksum;
        if (!*result.checksumMatch) {
            result.error = makeError(BackupErrorCode::ChecksumMismatch,
                "Checksum mismatch for " + backupPath + ": expected " + metadata->checksum + ", got " + *checksum);
            return result;
        }
        if (metadata->type != type) {
            result.error = makeError(BackupErrorCode::CorruptArchive,
                "Backup " + backupPath + " is a " + toString(metadata->type) + " backup, not " + toString(type));
            return result;
        }
    } else if (metadata.error().code != BackupErrorCode::NotFound) {
        // A sidecar exists but cannot vouch for the artifact.
        result.checksumMatch = false;
        result.error = metadata.error();
        return result;
    }

    if (type == BackupType::Database && !endsWith(backupPath, ".zip")) {
        if (!hasSQLiteHeader(backupPath)) {
            result.error = makeError(BackupErrorCode::CorruptArchive, "Not a SQLite database: " + backupPath);
            return result;
        }
        result.valid = true;
        result.fileCount = 1;
        return result;
    }

    auto entries = scanArchive(backupPath);
    if (!entries) {
        result.error = entries.error();
        return result;
    }
    for (const auto& entry : *entries) {
        if (!entry.directory) {
            ++result.fileCount;
        }
    }
    if (type == BackupType::Database && result.fileCount == 0) {
        result.error = makeError(BackupErrorCode::CorruptArchive, "Database archive contains no snapshot: " + backupPath);
        return result;
    }
    result.valid = true;
    return result;
}
