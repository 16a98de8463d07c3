#include "restore.hpp"
#include "archive_io.hpp"
#include "backup_metadata.hpp"
#include "checksum.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <sqlite3.h>
#include <fstream>
#include <memory>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

struct SqliteCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using SqliteHandle = std::unique_ptr<sqlite3, SqliteCloser>;

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void removeQuietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

std::expected<SqliteHandle, BackupError> openDatabase(const std::string& path, int flags) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    SqliteHandle db(raw);
    if (rc != SQLITE_OK) {
        std::string message = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to open database " + path + ": " + message));
    }
    sqlite3_busy_timeout(db.get(), 5000);
    return db;
}

std::expected<void, BackupError> quickCheck(const std::string& path) {
    auto db = openDatabase(path, SQLITE_OPEN_READONLY);
    if (!db) {
        return std::unexpected(makeError(BackupErrorCode::CorruptArchive, db.error().message));
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db->get(), "PRAGMA quick_check", -1, &stmt, nullptr) != SQLITE_OK) {
        return std::unexpected(makeError(BackupErrorCode::CorruptArchive,
            std::string("Snapshot is not a valid database: ") + sqlite3_errmsg(db->get())));
    }
    std::string verdict;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_text(stmt, 0)) {
        verdict = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    } else {
        verdict = sqlite3_errmsg(db->get());
    }
    sqlite3_finalize(stmt);
    if (verdict != "ok") {
        return std::unexpected(makeError(BackupErrorCode::CorruptArchive, "Snapshot failed integrity check: " + verdict));
    }
    return {};
}

} // namespace

bool isSafeEntryPath(const std::string& entryName) {
    if (entryName.empty()) {
        return false;
    }
    fs::path path(entryName);
    if (path.is_absolute() || path.has_root_name() || entryName[0] == '/' || entryName[0] == '\\') {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

RestoreService::RestoreService(const BackupConfig& config, const BackupLog& log, OperationLocks& locks)
    : config(config), log(log), locks(locks) {}

std::expected<void, BackupError> RestoreService::checkArtifact(const std::string& backupPath) const {
    std::error_code ec;
    if (!fs::is_regular_file(backupPath, ec)) {
        return std::unexpected(makeError(BackupErrorCode::NotFound, "Backup file not found: " + backupPath));
    }
    if (fs::file_size(backupPath, ec) == 0 || ec) {
        return std::unexpected(makeError(BackupErrorCode::Empty, "Backup file is empty: " + backupPath));
    }

    auto metadata = readSidecar(backupPath);
    if (!metadata) {
        if (metadata.error().code == BackupErrorCode::NotFound) {
            log.logWarning("No metadata for " + backupPath + ", restoring without checksum verification");
            return {};
        }
        return std::unexpected(metadata.error());
    }
    auto checksum = sha256File(backupPath);
    if (!checksum) {
        return std::unexpected(checksum.error());
    }
    if (*checksum != metadata->checksum) {
        return std::unexpected(makeError(BackupErrorCode::ChecksumMismatch,
            "Checksum mismatch for " + backupPath + ": expected " + metadata->checksum + ", got " + *checksum));
    }
    return {};
}

std::expected<DatabaseRestoreResult, BackupError> RestoreService::restoreDatabase(const std::string& backupPath) {
    auto guard = locks.tryAcquire(BackupType::Database, OperationKind::Restore, "database restore");
    if (!guard) {
        log.logError("Database restore refused: " + guard.error().message);
        return std::unexpected(guard.error());
    }

    log.logMessage("Starting database restore from " + backupPath);
    auto fail = [&](const BackupError& error) -> std::expected<DatabaseRestoreResult, BackupError> {
        log.logError("Database restore failed: " + error.describe());
        return std::unexpected(error);
    };

    auto checked = checkArtifact(backupPath);
    if (!checked) {
        return fail(checked.error());
    }

    std::string snapshotPath = backupPath;
    std::string tempPath;
    if (endsWith(backupPath, ".zip")) {
        tempPath = (fs::path(config.storage.localPath) / (fs::path(backupPath).filename().string() + ".restore")).string();
        auto extracted = extractFirstEntry(backupPath, tempPath);
        if (!extracted) {
            return fail(extracted.error());
        }
        log.logDebug("Extracted snapshot " + *extracted + " to " + tempPath);
        snapshotPath = tempPath;
    }

    auto restore = [&]() -> std::expected<void, BackupError> {
        auto healthy = quickCheck(snapshotPath);
        if (!healthy) {
            return healthy;
        }
        auto source = openDatabase(snapshotPath, SQLITE_OPEN_READONLY);
        if (!source) {
            return std::unexpected(source.error());
        }
        std::error_code ec;
        fs::path livePath(config.database.path);
        if (livePath.has_parent_path()) {
            fs::create_directories(livePath.parent_path(), ec);
        }
        auto target = openDatabase(config.database.path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        if (!target) {
            return std::unexpected(target.error());
        }

        sqlite3_backup* backup = sqlite3_backup_init(target->get(), "main", source->get(), "main");
        if (!backup) {
            return std::unexpected(makeError(BackupErrorCode::IOFailure,
                std::string("Failed to start database restore: ") + sqlite3_errmsg(target->get())));
        }
        // A single step copies every page inside one write transaction on the live store.
        int rc = sqlite3_backup_step(backup, -1);
        int finishRc = sqlite3_backup_finish(backup);
        if (rc != SQLITE_DONE || finishRc != SQLITE_OK) {
            int code = rc != SQLITE_DONE ? rc : finishRc;
            return std::unexpected(makeError(BackupErrorCode::IOFailure,
                std::string("Failed to write live database: ") + sqlite3_errstr(code)));
        }
        return {};
    };

    auto restored = restore();
    if (!tempPath.empty()) {
        removeQuietly(tempPath);
    }
    if (!restored) {
        return fail(restored.error());
    }

    DatabaseRestoreResult result;
    result.success = true;
    result.requiresProcessRestart = true;
    log.logMessage("Database restored from " + backupPath + " into " + config.database.path +
                   "; restart the application to reopen the store");
    return result;
}

std::expected<FilesRestoreResult, BackupError> RestoreService::restoreFiles(const std::string& backupPath,
                                                                            const std::optional<std::string>& targetDir) {
    auto guard = locks.tryAcquire(BackupType::Files, OperationKind::Restore, "files restore");
    if (!guard) {
        log.logError("Files restore refused: " + guard.error().message);
        return std::unexpected(guard.error());
    }

    std::string target = targetDir.value_or(config.filesRoot());
    log.logMessage("Starting files restore from " + backupPath + " into " + target);
    auto fail = [&](const BackupError& error) -> std::expected<FilesRestoreResult, BackupError> {
        log.logError("Files restore failed: " + error.describe());
        return std::unexpected(error);
    };

    auto checked = checkArtifact(backupPath);
    if (!checked) {
        return fail(checked.error());
    }

    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        return fail(makeError(BackupErrorCode::IOFailure, "Cannot create target directory " + target + ": " + ec.message()));
    }

    struct archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, backupPath.c_str(), 10240) != ARCHIVE_OK) {
        const char* reason = archive_error_string(a);
        std::string errorMsg = "Failed to open archive: " + backupPath + " (error: " + (reason ? reason : "unknown") + ")";
        archive_read_free(a);
        return fail(makeError(BackupErrorCode::CorruptArchive, errorMsg));
    }

    FilesRestoreResult result;
    struct archive_entry* entry;
    char buf[64 * 1024];
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        std::string name = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        if (!isSafeEntryPath(name)) {
            log.logWarning("Rejected unsafe archive entry: " + name);
            result.skippedEntries.push_back(name);
            archive_read_data_skip(a);
            continue;
        }

        fs::path destination = fs::path(target) / fs::path(name).relative_path();
        if (archive_entry_filetype(entry) == AE_IFDIR) {
            fs::create_directories(destination, ec);
            if (ec) {
                log.logWarning("Failed to create directory " + destination.string() + ": " + ec.message());
                result.skippedEntries.push_back(name);
            }
            continue;
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(a);
            continue;
        }

        fs::create_directories(destination.parent_path(), ec);
        fs::path temp = destination.parent_path() / ("." + destination.filename().string() + ".restore-tmp");
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            log.logWarning("Failed to open " + temp.string() + " for writing");
            result.skippedEntries.push_back(name);
            archive_read_data_skip(a);
            continue;
        }
        la_ssize_t got;
        while ((got = archive_read_data(a, buf, sizeof(buf))) > 0) {
            out.write(buf, got);
        }
        out.close();
        if (got < 0) {
            const char* reason = archive_error_string(a);
            log.logWarning("Corrupt archive entry " + name + ": " + (reason ? reason : "unknown") + ", skipping");
            result.skippedEntries.push_back(name);
            removeQuietly(temp.string());
            continue;
        }
        if (!out) {
            log.logWarning("Failed to write " + temp.string());
            result.skippedEntries.push_back(name);
            removeQuietly(temp.string());
            continue;
        }
        fs::rename(temp, destination, ec);
        if (ec) {
            log.logWarning("Failed to move " + name + " into place: " + ec.message());
            result.skippedEntries.push_back(name);
            removeQuietly(temp.string());
            continue;
        }
        ++result.extractedFileCount;
        log.logDebug("Restored: " + destination.string());
    }

    if (r != ARCHIVE_EOF) {
        const char* reason = archive_error_string(a);
        std::string errorMsg = "Archive " + backupPath + " is truncated or corrupt after " +
                               std::to_string(result.extractedFileCount) + " file(s): " + (reason ? reason : "unknown");
        archive_read_free(a);
        // Files written so far are complete; nothing is rolled back.
        return fail(makeError(BackupErrorCode::CorruptArchive, errorMsg, false, true));
    }
    archive_read_close(a);
    archive_read_free(a);

    result.success = true;
    log.logMessage("Files restored from " + backupPath + ": " + std::to_string(result.extractedFileCount) +
                   " file(s), " + std::to_string(result.skippedEntries.size()) + " skipped");
    return result;
}
