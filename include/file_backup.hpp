/**
 * @file file_backup.hpp
 * @brief Defines file tree backup strategies for VaultKeeper.
 *
 * Provides interfaces and implementations for archiving the configured upload and
 * operational directories into a single zip artifact, with glob exclusions and
 * per-file fault tolerance. Uses std::filesystem for enumeration.
 *
 * @note Requires libarchive for zip output.
 */

#ifndef FILE_BACKUP_HPP
#define FILE_BACKUP_HPP

#include <vector>
#include <string>
#include <expected>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <istream>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "backup_log.hpp"
#include "backup_metadata.hpp"
#include "operation_lock.hpp"

/**
 * @brief Outcome of writing one archive.
 */
struct ArchiveStats {
    uint64_t fileCount = 0;                 ///< Entries written.
    uint64_t totalSize = 0;                 ///< Uncompressed bytes written.
    std::vector<std::string> skippedFiles;  ///< Files that vanished or could not be read.
};

/**
 * @brief Interface for file backup strategies.
 *
 * Defines the contract for writing a set of files to a single output archive.
 */
class FileBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~FileBackupStrategy() = default;

    /**
     * @brief Writes the given files to an archive.
     *
     * @param files Absolute paths of the files to archive, in archive order.
     * @param outputFile Archive to create.
     * @param cancel Optional cancellation flag.
     * @return std::expected<ArchiveStats, BackupError> Statistics, or IOFailure / Cancelled.
     */
    virtual std::expected<ArchiveStats, BackupError> execute(const std::vector<std::string>& files,
                                                             const std::string& outputFile,
                                                             const std::atomic<bool>* cancel) = 0;
};

/**
 * @brief Zip file backup strategy.
 *
 * Each file is streamed into an entry named by its path relative to the archive root.
 * Entries are deflated, or stored when compression is disabled. A file that cannot be
 * opened or read is recorded as skipped and the archive carries on.
 */
class ZipFileBackupStrategy : public FileBackupStrategy {
public:
    /**
     * @brief Constructs a zip backup strategy.
     *
     * @param root Directory entry names are made relative to.
     * @param compression Deflate entries when true, store them when false.
     * @param log Log sink.
     */
    ZipFileBackupStrategy(const std::string& root, bool compression, const BackupLog& log);

    /**
     * @brief Writes the files to a zip archive.
     *
     * The partial archive is removed when the call fails or is cancelled. A file that
     * cannot be opened is skipped; a file that yields fewer bytes than its size at the time
     * its entry header was written fails the whole archive with IOFailure.
     */
    std::expected<ArchiveStats, BackupError> execute(const std::vector<std::string>& files,
                                                     const std::string& outputFile,
                                                     const std::atomic<bool>* cancel) override;

protected:
    /**
     * @brief Opens a file for reading; a null or failed stream marks the file as skipped.
     */
    virtual std::unique_ptr<std::istream> openSource(const std::string& path) const;

private:
    std::string root;     ///< Entry name base.
    bool compression;     ///< Deflate or store.
    const BackupLog& log; ///< Log sink.

    /**
     * @brief Entry name of a file: its path relative to the root, with '/' separators.
     */
    std::string entryName(const std::string& file) const;
};

/**
 * @brief Tests whether a path is excluded by any of the glob patterns.
 *
 * A pattern matches if it matches the file name, any component of the path, or the
 * whole path relative to the include directory.
 *
 * @param relativePath Path relative to the include directory.
 * @param exclusions Glob patterns (fnmatch syntax).
 */
bool isExcluded(const std::string& relativePath, const std::vector<std::string>& exclusions);

/**
 * @brief Enumerates the files to back up.
 *
 * Walks every configured directory (resolved against config.filesRoot()) recursively.
 * Only regular files are kept; hidden files, hidden directories and excluded paths are
 * skipped. Missing directories are logged and skipped. The result is de-duplicated and
 * sorted.
 *
 * @return std::vector<std::string> Absolute file paths.
 */
std::vector<std::string> collectFiles(const BackupConfig& config, const BackupLog& log);

/**
 * @brief Summary of a successful files backup.
 */
struct FilesBackupResult {
    std::string backupPath;                 ///< Artifact path.
    std::uintmax_t size = 0;                ///< Artifact size in bytes.
    uint64_t fileCount = 0;                 ///< Entries archived.
    std::chrono::milliseconds duration{0};  ///< Wall time of the backup.
    BackupMetadata metadata;                ///< Sidecar contents.
};

/**
 * @brief Produces file tree artifacts.
 */
class FilesBackupService {
public:
    /**
     * @brief Constructs the producer.
     *
     * @param strategy Archive strategy; a ZipFileBackupStrategy on config.filesRoot() when null.
     */
    FilesBackupService(const BackupConfig& config, const BackupLog& log, OperationLocks& locks,
                       std::unique_ptr<FileBackupStrategy> strategy = nullptr);

    /**
     * @brief Creates a files artifact and its sidecar.
     *
     * @param cancel Optional cancellation flag.
     * @return std::expected<FilesBackupResult, BackupError> Summary, or IOFailure when the
     *         artifact cannot be written, Cancelled, or RestoreConflict.
     */
    std::expected<FilesBackupResult, BackupError> createBackup(const std::atomic<bool>* cancel = nullptr);

private:
    const BackupConfig& config;
    const BackupLog& log;
    OperationLocks& locks;
    std::unique_ptr<FileBackupStrategy> strategy;
};

#endif // FILE_BACKUP_HPP
