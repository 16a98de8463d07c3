/**
 * @file database_backup.hpp
 * @brief Database snapshot producer for VaultKeeper.
 *
 * Captures a point-in-time, internally consistent copy of the live SQLite store,
 * records its tables and row counts, compresses it and seals it with a checksummed
 * sidecar.
 *
 * @note Requires SQLite 3 and libarchive.
 */

#ifndef DATABASE_BACKUP_HPP
#define DATABASE_BACKUP_HPP

#include <string>
#include <atomic>
#include <chrono>
#include <memory>
#include <expected>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "backup_log.hpp"
#include "backup_metadata.hpp"
#include "operation_lock.hpp"

/**
 * @brief Interface for database snapshot strategies.
 *
 * Defines the contract for copying a live database into a standalone file.
 */
class DatabaseBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~DatabaseBackupStrategy() = default;

    /**
     * @brief Copies the live database into a snapshot file.
     *
     * @param outputPath Snapshot file to create.
     * @param cancel Optional cancellation flag.
     * @return std::expected<DatabaseDetails, BackupError> Tables and row counts of the
     *         snapshot, or an error. The snapshot file is removed on failure.
     */
    virtual std::expected<DatabaseDetails, BackupError> snapshot(const std::string& outputPath,
                                                                 const std::atomic<bool>* cancel) = 0;
};

/**
 * @brief Snapshot strategy for file-based SQLite stores using the online backup API.
 *
 * The copy runs in page batches. If another connection writes to the source while the
 * copy is in progress SQLite restarts it, so the snapshot is never a torn file. A
 * source held busy by a writer is retried for a bounded time and then reported as an
 * IOFailure.
 */
class SQLiteBackupStrategy : public DatabaseBackupStrategy {
public:
    /**
     * @brief Constructs a SQLite snapshot strategy.
     *
     * @param databasePath Live database file.
     * @param log Log sink.
     */
    SQLiteBackupStrategy(const std::string& databasePath, const BackupLog& log);

    std::expected<DatabaseDetails, BackupError> snapshot(const std::string& outputPath,
                                                         const std::atomic<bool>* cancel) override;

    static constexpr int PagesPerStep = 256;  ///< Pages copied per backup step.
    static constexpr int MaxBusyRetries = 100; ///< Busy retries before giving up.

private:
    std::string databasePath; ///< Live database file.
    const BackupLog& log;     ///< Log sink.
};

/**
 * @brief Counts rows of every user table in a SQLite database file.
 *
 * Tables whose count fails are reported with 0 rows and a warning.
 *
 * @return std::expected<DatabaseDetails, BackupError> Tables sorted by name with row counts.
 */
std::expected<DatabaseDetails, BackupError> inspectSQLiteDatabase(const std::string& databasePath, const BackupLog& log);

/**
 * @brief Summary of a successful database backup.
 */
struct DatabaseBackupResult {
    std::string backupPath;             ///< Artifact path.
    std::uintmax_t size = 0;            ///< Artifact size in bytes.
    std::chrono::milliseconds duration{0}; ///< Wall time of the backup.
    BackupMetadata metadata;            ///< Sidecar contents.
};

/**
 * @brief Produces database artifacts.
 */
class DatabaseBackupService {
public:
    /**
     * @brief Constructs the producer.
     *
     * @param config Engine configuration.
     * @param log Log sink.
     * @param locks Per-type operation locks shared with the restore engine.
     * @param strategy Snapshot strategy; a SQLiteBackupStrategy on config.database.path when null.
     */
    DatabaseBackupService(const BackupConfig& config, const BackupLog& log, OperationLocks& locks,
                          std::unique_ptr<DatabaseBackupStrategy> strategy = nullptr);

    /**
     * @brief Creates a database artifact and its sidecar.
     *
     * No retry is attempted; the scheduler decides what to do with failures.
     *
     * @param cancel Optional cancellation flag.
     * @return std::expected<DatabaseBackupResult, BackupError> Summary, or the failure with
     *         partial output removed.
     */
    std::expected<DatabaseBackupResult, BackupError> createBackup(const std::atomic<bool>* cancel = nullptr);

private:
    const BackupConfig& config;
    const BackupLog& log;
    OperationLocks& locks;
    std::unique_ptr<DatabaseBackupStrategy> strategy;
};

#endif // DATABASE_BACKUP_HPP
