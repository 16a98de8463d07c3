#include "database_backup.hpp"
#include "archive_io.hpp"
#include "checksum.hpp"
#include <sqlite3.h>
#include <thread>
#include <numeric>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

struct SqliteCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using SqliteHandle = std::unique_ptr<sqlite3, SqliteCloser>;

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

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

std::string quoteIdentifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    return quoted + "\"";
}

void removeQuietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

SQLiteBackupStrategy::SQLiteBackupStrategy(const std::string& databasePath, const BackupLog& log)
    : databasePath(databasePath), log(log) {}

std::expected<DatabaseDetails, BackupError> SQLiteBackupStrategy::snapshot(const std::string& outputPath,
                                                                           const std::atomic<bool>* cancel) {
    if (!fs::exists(databasePath)) {
        return std::unexpected(makeError(BackupErrorCode::SourceUnavailable, "Database file not found: " + databasePath));
    }

    auto source = openDatabase(databasePath, SQLITE_OPEN_READONLY);
    if (!source) {
        return std::unexpected(source.error());
    }
    removeQuietly(outputPath);
    auto target = openDatabase(outputPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    if (!target) {
        return std::unexpected(target.error());
    }

    sqlite3_backup* backup = sqlite3_backup_init(target->get(), "main", source->get(), "main");
    if (!backup) {
        std::string message = sqlite3_errmsg(target->get());
        target->reset();
        removeQuietly(outputPath);
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to start database snapshot: " + message));
    }

    int rc = SQLITE_OK;
    int busyRetries = 0;
    bool cancelled = false;
    while (true) {
        if (cancel && cancel->load()) {
            cancelled = true;
            break;
        }
        rc = sqlite3_backup_step(backup, PagesPerStep);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc == SQLITE_OK) {
            continue;
        }
        if ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && busyRetries < MaxBusyRetries) {
            ++busyRetries;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        break;
    }
    int finishRc = sqlite3_backup_finish(backup);
    target->reset();

    if (cancelled) {
        removeQuietly(outputPath);
        return std::unexpected(makeError(BackupErrorCode::Cancelled, "Database snapshot cancelled"));
    }
    if (rc != SQLITE_DONE || finishRc != SQLITE_OK) {
        removeQuietly(outputPath);
        int code = rc != SQLITE_DONE ? rc : finishRc;
        std::string reason = (code == SQLITE_BUSY || code == SQLITE_LOCKED)
            ? "database is locked by a conflicting write transaction"
            : sqlite3_errstr(code);
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Database snapshot failed: " + reason));
    }
    if (busyRetries > 0) {
        log.logDebug("Database snapshot waited on " + std::to_string(busyRetries) + " busy source step(s)");
    }

    auto details = inspectSQLiteDatabase(outputPath, log);
    if (!details) {
        removeQuietly(outputPath);
        return std::unexpected(details.error());
    }
    return *details;
}

std::expected<DatabaseDetails, BackupError> inspectSQLiteDatabase(const std::string& databasePath, const BackupLog& log) {
    auto db = openDatabase(databasePath, SQLITE_OPEN_READONLY);
    if (!db) {
        return std::unexpected(db.error());
    }

    sqlite3_stmt* raw = nullptr;
    const char* listSql = "SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' ORDER BY name";
    if (sqlite3_prepare_v2(db->get(), listSql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(makeError(BackupErrorCode::IOFailure,
            std::string("Failed to enumerate tables: ") + sqlite3_errmsg(db->get())));
    }
    Statement list(raw);

    DatabaseDetails details;
    int rc;
    while ((rc = sqlite3_step(list.get())) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(list.get(), 0);
        if (text) {
            details.tables.emplace_back(reinterpret_cast<const char*>(text));
        }
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(makeError(BackupErrorCode::IOFailure,
            std::string("Failed to enumerate tables: ") + sqlite3_errmsg(db->get())));
    }

    for (const auto& table : details.tables) {
        std::string countSql = "SELECT COUNT(*) FROM " + quoteIdentifier(table);
        sqlite3_stmt* countRaw = nullptr;
        if (sqlite3_prepare_v2(db->get(), countSql.c_str(), -1, &countRaw, nullptr) != SQLITE_OK) {
            log.logWarning("Failed to count records in table " + table + ": " + sqlite3_errmsg(db->get()));
            details.recordCounts[table] = 0;
            continue;
        }
        Statement count(countRaw);
        if (sqlite3_step(count.get()) == SQLITE_ROW) {
            details.recordCounts[table] = sqlite3_column_int64(count.get(), 0);
        } else {
            log.logWarning("Failed to count records in table " + table + ": " + sqlite3_errmsg(db->get()));
            details.recordCounts[table] = 0;
        }
    }
    return details;
}

DatabaseBackupService::DatabaseBackupService(const BackupConfig& config, const BackupLog& log, OperationLocks& locks,
                                             std::unique_ptr<DatabaseBackupStrategy> strategy)
    : config(config), log(log), locks(locks), strategy(std::move(strategy)) {
    if (!this->strategy) {
        this->strategy = std::make_unique<SQLiteBackupStrategy>(config.database.path, log);
    }
}

std::expected<DatabaseBackupResult, BackupError> DatabaseBackupService::createBackup(const std::atomic<bool>* cancel) {
    auto startTime = std::chrono::steady_clock::now();
    auto timestamp = std::chrono::system_clock::now();

    auto guard = locks.tryAcquire(BackupType::Database, OperationKind::Backup, "database backup");
    if (!guard) {
        if (guard.error().code == BackupErrorCode::AlreadyRunning) {
            log.logWarning("Database backup skipped: " + guard.error().message);
        } else {
            log.logError("Database backup refused: " + guard.error().message);
        }
        return std::unexpected(guard.error());
    }

    log.logMessage("Starting database backup of " + config.database.path);

    std::error_code ec;
    fs::create_directories(config.storage.localPath, ec);
    if (ec) {
        auto error = makeError(BackupErrorCode::IOFailure, "Cannot create backup directory " + config.storage.localPath + ": " + ec.message());
        log.logError("Database backup failed: " + error.describe());
        return std::unexpected(error);
    }

    std::string fileName = getBackupFileName(BackupType::Database, timestamp);
    std::string finalPath = getBackupFilePath(config, fileName, getBackupExtension(BackupType::Database, config.database.compression));
    std::string snapshotPath = config.database.compression ? finalPath + ".snapshot" : finalPath;

    auto fail = [&](const BackupError& error) -> std::expected<DatabaseBackupResult, BackupError> {
        removeQuietly(snapshotPath);
        removeQuietly(finalPath);
        removeQuietly(getSidecarPath(finalPath));
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
        log.logError("Database backup failed after " + std::to_string(duration.count()) + "ms: " + error.describe());
        return std::unexpected(error);
    };

    auto details = strategy->snapshot(snapshotPath, cancel);
    if (!details) {
        return fail(details.error());
    }
    log.logDebug("Database snapshot written: " + snapshotPath);

    if (config.database.compression) {
        // Entry is named like the uncompressed artifact would be, e.g. database_backup_..._02-00-00.db
        std::string entryName = fs::path(finalPath).filename().string();
        entryName = entryName.substr(0, entryName.size() - 4);
        auto originalSize = fs::file_size(snapshotPath, ec);
        auto compressed = compressSingleFile(snapshotPath, finalPath, entryName, cancel);
        removeQuietly(snapshotPath);
        if (!compressed) {
            return fail(compressed.error());
        }
        log.logDebug("Database snapshot compressed from " + formatBackupSize(ec ? 0 : originalSize) +
                     " to " + formatBackupSize(fs::file_size(finalPath, ec)));
    }

    auto checksum = sha256File(finalPath);
    if (!checksum) {
        return fail(checksum.error());
    }

    BackupMetadata metadata;
    metadata.timestamp = timestamp;
    metadata.type = BackupType::Database;
    metadata.backupPath = finalPath;
    metadata.checksum = *checksum;
    metadata.details = *details;

    auto written = writeSidecar(metadata);
    if (!written) {
        return fail(written.error());
    }

    DatabaseBackupResult result;
    result.backupPath = finalPath;
    result.size = fs::file_size(finalPath, ec);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    result.metadata = metadata;

    int64_t records = 0;
    for (const auto& [table, count] : details->recordCounts) {
        records += count;
    }
    log.logMessage("Database backup completed: " + finalPath + " (" + formatBackupSize(result.size) + ", " +
                   std::to_string(details->tables.size()) + " tables, " + std::to_string(records) + " records, " +
                   std::to_string(result.duration.count()) + "ms)");
    return result;
}
