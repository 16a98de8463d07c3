/**
 * @file file_backup.cpp
 * @brief File tree backup strategy implementation for VaultKeeper.
 *
 * Implements zip backups of the configured directories with glob exclusions,
 * skipped-file accounting and cooperative cancellation.
 */

#include "file_backup.hpp"
#include "checksum.hpp"
#include <filesystem>
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <algorithm>
#include <cstring>
#include <cerrno>
#include <fnmatch.h>

namespace fs = std::filesystem;

namespace {

bool matchesGlob(const std::string& pattern, const std::string& value) {
    return fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

bool isHidden(const fs::path& relative) {
    for (const auto& part : relative) {
        std::string name = part.string();
        if (name.size() > 1 && name[0] == '.' && name != "..") {
            return true;
        }
    }
    return false;
}

fs::path resolveAgainst(const std::string& root, const std::string& dir) {
    fs::path path(dir);
    if (path.is_relative()) {
        path = fs::path(root) / path;
    }
    return fs::absolute(path).lexically_normal();
}

void removeQuietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

bool isExcluded(const std::string& relativePath, const std::vector<std::string>& exclusions) {
    fs::path path(relativePath);
    std::string generic = path.generic_string();
    for (const auto& pattern : exclusions) {
        if (matchesGlob(pattern, path.filename().string()) || matchesGlob(pattern, generic)) {
            return true;
        }
        for (const auto& part : path) {
            if (matchesGlob(pattern, part.string())) {
                return true;
            }
        }
    }
    return false;
}

std::vector<std::string> collectFiles(const BackupConfig& config, const BackupLog& log) {
    std::vector<std::string> files;
    std::string root = config.filesRoot();

    for (const auto& dir : config.files.directories) {
        fs::path base = resolveAgainst(root, dir);
        std::error_code ec;
        if (!fs::is_directory(base, ec)) {
            log.logWarning("Directory does not exist, skipping: " + base.string());
            continue;
        }

        fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            log.logWarning("Failed to access directory " + base.string() + ": " + ec.message() + ", skipping.");
            continue;
        }
        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                log.logWarning("Failed to walk " + base.string() + ": " + ec.message());
                break;
            }
            fs::path relative = it->path().lexically_relative(base);
            if (isHidden(relative.filename()) || isExcluded(relative.string(), config.files.exclusions)) {
                if (it->is_directory(ec)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!it->is_regular_file(ec) || it->is_symlink(ec)) {
                continue;
            }
            files.push_back(it->path().lexically_normal().string());
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

ZipFileBackupStrategy::ZipFileBackupStrategy(const std::string& root, bool compression, const BackupLog& log)
    : root(root), compression(compression), log(log) {}

std::string ZipFileBackupStrategy::entryName(const std::string& file) const {
    fs::path absoluteRoot = fs::absolute(root).lexically_normal();
    fs::path relative = fs::path(file).lexically_relative(absoluteRoot);
    if (relative.empty() || *relative.begin() == "..") {
        // Outside the root: keep the full path minus its root name.
        relative = fs::path(file).relative_path();
    }
    return relative.generic_string();
}

std::unique_ptr<std::istream> ZipFileBackupStrategy::openSource(const std::string& path) const {
    return std::make_unique<std::ifstream>(path, std::ios::binary);
}

std::expected<ArchiveStats, BackupError> ZipFileBackupStrategy::execute(const std::vector<std::string>& files,
                                                                         const std::string& outputFile,
                                                                         const std::atomic<bool>* cancel) {
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    archive_write_set_format_option(a, "zip", "compression", compression ? "deflate" : "store");
    if (archive_write_open_filename(a, outputFile.c_str()) != ARCHIVE_OK) {
        const char* reason = archive_error_string(a);
        std::string errorMsg = "Failed to open archive file: " + outputFile + " (error: " + (reason ? reason : "unknown") + ")";
        archive_write_free(a);
        removeQuietly(outputFile);
        return std::unexpected(makeError(BackupErrorCode::IOFailure, errorMsg));
    }

    auto fail = [&](BackupErrorCode code, const std::string& message) -> std::expected<ArchiveStats, BackupError> {
        archive_write_close(a);
        archive_write_free(a);
        removeQuietly(outputFile);
        return std::unexpected(makeError(code, message));
    };

    ArchiveStats stats;
    std::vector<char> buf(64 * 1024);
    for (const auto& path : files) {
        if (cancel && cancel->load()) {
            log.logWarning("Files backup interrupted, removing partial archive " + outputFile);
            return fail(BackupErrorCode::Cancelled, "Files backup cancelled");
        }

        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (ec) {
            log.logWarning("Skipping vanished file " + path + ": " + ec.message());
            stats.skippedFiles.push_back(path);
            continue;
        }
        auto file = openSource(path);
        if (!file || !*file) {
            log.logWarning("Failed to open file: " + path + " (error: " + std::strerror(errno) + ")");
            stats.skippedFiles.push_back(path);
            continue;
        }

        auto mtime = fs::last_write_time(path, ec);
        std::string name = entryName(path);
        struct archive_entry* ae = archive_entry_new();
        archive_entry_set_pathname(ae, name.c_str());
        archive_entry_set_size(ae, static_cast<la_int64_t>(size));
        archive_entry_set_filetype(ae, AE_IFREG);
        archive_entry_set_perm(ae, 0644);
        if (!ec) {
            auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(mtime));
            archive_entry_set_mtime(ae, std::chrono::system_clock::to_time_t(sys), 0);
        }
        if (archive_write_header(a, ae) != ARCHIVE_OK) {
            archive_entry_free(ae);
            return fail(BackupErrorCode::IOFailure, std::string("Failed to write archive header: ") + archive_error_string(a));
        }
        archive_entry_free(ae);

        // The header promises exactly `size` bytes.
        uint64_t written = 0;
        while (written < size) {
            auto want = static_cast<std::streamsize>(std::min<uint64_t>(buf.size(), size - written));
            file->read(buf.data(), want);
            std::streamsize got = file->gcount();
            if (got > 0) {
                if (archive_write_data(a, buf.data(), static_cast<size_t>(got)) < 0) {
                    return fail(BackupErrorCode::IOFailure, std::string("Failed to write archive data: ") + archive_error_string(a));
                }
                written += static_cast<uint64_t>(got);
            }
            if (got < want) {
                log.logError("Read of " + path + " stopped after " + std::to_string(written) + " of " +
                             std::to_string(size) + " bytes");
                return fail(BackupErrorCode::IOFailure, "File changed or became unreadable while being archived: " + path);
            }
        }

        ++stats.fileCount;
        stats.totalSize += written;
        log.logDebug("Backed up: " + name);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        const char* reason = archive_error_string(a);
        std::string errorMsg = std::string("Failed to finalize archive: ") + (reason ? reason : "unknown");
        archive_write_free(a);
        removeQuietly(outputFile);
        return std::unexpected(makeError(BackupErrorCode::IOFailure, errorMsg));
    }
    archive_write_free(a);
    return stats;
}

FilesBackupService::FilesBackupService(const BackupConfig& config, const BackupLog& log, OperationLocks& locks,
                                       std::unique_ptr<FileBackupStrategy> strategy)
    : config(config), log(log), locks(locks), strategy(std::move(strategy)) {
    if (!this->strategy) {
        this->strategy = std::make_unique<ZipFileBackupStrategy>(config.filesRoot(), config.files.compression, log);
    }
}

std::expected<FilesBackupResult, BackupError> FilesBackupService::createBackup(const std::atomic<bool>* cancel) {
    auto startTime = std::chrono::steady_clock::now();
    auto timestamp = std::chrono::system_clock::now();

    auto guard = locks.tryAcquire(BackupType::Files, OperationKind::Backup, "files backup");
    if (!guard) {
        if (guard.error().code == BackupErrorCode::AlreadyRunning) {
            log.logWarning("Files backup skipped: " + guard.error().message);
        } else {
            log.logError("Files backup refused: " + guard.error().message);
        }
        return std::unexpected(guard.error());
    }

    log.logMessage("Starting files backup of " + std::to_string(config.files.directories.size()) + " director(ies)");

    std::error_code ec;
    fs::create_directories(config.storage.localPath, ec);
    if (ec) {
        auto error = makeError(BackupErrorCode::IOFailure, "Cannot create backup directory " + config.storage.localPath + ": " + ec.message());
        log.logError("Files backup failed: " + error.describe());
        return std::unexpected(error);
    }

    std::vector<std::string> files = collectFiles(config, log);
    if (files.empty()) {
        log.logWarning("No files to back up; writing an empty archive");
    } else {
        log.logMessage("Found " + std::to_string(files.size()) + " file(s) to back up");
    }

    std::string fileName = getBackupFileName(BackupType::Files, timestamp);
    std::string finalPath = getBackupFilePath(config, fileName, getBackupExtension(BackupType::Files, config.files.compression));

    auto fail = [&](const BackupError& error) -> std::expected<FilesBackupResult, BackupError> {
        removeQuietly(finalPath);
        removeQuietly(getSidecarPath(finalPath));
        log.logError("Files backup failed: " + error.describe());
        return std::unexpected(error);
    };

    auto stats = strategy->execute(files, finalPath, cancel);
    if (!stats) {
        return fail(stats.error());
    }
    if (!stats->skippedFiles.empty()) {
        log.logWarning(std::to_string(stats->skippedFiles.size()) + " file(s) could not be read and were skipped");
    }

    auto checksum = sha256File(finalPath);
    if (!checksum) {
        return fail(checksum.error());
    }

    FilesDetails details;
    details.directories = config.files.directories;
    details.exclusions = config.files.exclusions;
    details.fileCount = stats->fileCount;
    details.totalSize = stats->totalSize;
    details.skippedFiles = stats->skippedFiles;

    BackupMetadata metadata;
    metadata.timestamp = timestamp;
    metadata.type = BackupType::Files;
    metadata.backupPath = finalPath;
    metadata.checksum = *checksum;
    metadata.details = details;

    auto written = writeSidecar(metadata);
    if (!written) {
        return fail(written.error());
    }

    FilesBackupResult result;
    result.backupPath = finalPath;
    result.size = fs::file_size(finalPath, ec);
    result.fileCount = stats->fileCount;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    result.metadata = metadata;

    log.logMessage("Files backup completed: " + finalPath + " (" + formatBackupSize(result.size) + ", " +
                   std::to_string(result.fileCount) + " files, " + formatBackupSize(stats->totalSize) +
                   " uncompressed, " + std::to_string(result.duration.count()) + "ms)");
    return result;
}
