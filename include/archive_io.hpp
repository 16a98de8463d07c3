/**
 * @file archive_io.hpp
 * @brief Zip archive helpers built on libarchive.
 *
 * Shared by the database producer (single-entry archives), the verifier and the
 * restore engine. The file tree archiver streams its entries itself.
 *
 * @note Requires libarchive.
 */

#ifndef ARCHIVE_IO_HPP
#define ARCHIVE_IO_HPP

#include <string>
#include <vector>
#include <atomic>
#include <cstdint>
#include <expected>
#include "backup_error.hpp"

/**
 * @brief Entry found while scanning an archive.
 */
struct ArchiveEntryInfo {
    std::string path;      ///< Entry name inside the archive.
    bool directory;        ///< Directory entry.
    int64_t size;          ///< Uncompressed size.
};

/**
 * @brief Writes one file into a new zip archive.
 *
 * @param sourceFile File to compress.
 * @param zipFile Archive to create (overwritten).
 * @param entryName Name of the entry inside the archive.
 * @param cancel Optional cancellation flag polled between blocks.
 * @return std::expected<void, BackupError> Success, IOFailure or Cancelled. The partial
 *         archive is removed on failure.
 */
std::expected<void, BackupError> compressSingleFile(const std::string& sourceFile,
                                                    const std::string& zipFile,
                                                    const std::string& entryName,
                                                    const std::atomic<bool>* cancel = nullptr);

/**
 * @brief Extracts the first regular-file entry of a zip archive to a path.
 *
 * @return std::expected<std::string, BackupError> The entry name, or CorruptArchive /
 *         IOFailure. The destination is removed on failure.
 */
std::expected<std::string, BackupError> extractFirstEntry(const std::string& zipFile,
                                                          const std::string& destination);

/**
 * @brief Reads every entry of an archive, decompressing the data to validate it.
 *
 * @param zipFile Archive to scan.
 * @return std::expected<std::vector<ArchiveEntryInfo>, BackupError> Entries in archive
 *         order, or CorruptArchive if the archive cannot be opened or an entry fails to decode.
 */
std::expected<std::vector<ArchiveEntryInfo>, BackupError> scanArchive(const std::string& zipFile);

#endif // ARCHIVE_IO_HPP
