#include "archive_io.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <vector>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

struct archive* openZipReader(const std::string& zipFile, std::string& error) {
    struct archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, zipFile.c_str(), 10240) != ARCHIVE_OK) {
        error = std::string("Failed to open archive: ") + zipFile + " (error: " +
                (archive_error_string(a) ? archive_error_string(a) : "unknown") + ")";
        archive_read_free(a);
        return nullptr;
    }
    return a;
}

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown";
}

} // namespace

std::expected<void, BackupError> compressSingleFile(const std::string& sourceFile,
                                                    const std::string& zipFile,
                                                    const std::string& entryName,
                                                    const std::atomic<bool>* cancel) {
    std::error_code ec;
    auto fileSize = fs::file_size(sourceFile, ec);
    if (ec) {
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Cannot stat " + sourceFile + ": " + ec.message()));
    }
    std::ifstream in(sourceFile, std::ios::binary);
    if (!in) {
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to open file: " + sourceFile));
    }

    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    archive_write_set_format_option(a, "zip", "compression", "deflate");
    if (archive_write_open_filename(a, zipFile.c_str()) != ARCHIVE_OK) {
        std::string errorMsg = "Failed to open archive file: " + zipFile + " (error: " + archiveError(a) + ")";
        archive_write_free(a);
        fs::remove(zipFile, ec);
        return std::unexpected(makeError(BackupErrorCode::IOFailure, errorMsg));
    }

    auto fail = [&](BackupErrorCode code, const std::string& message) -> std::expected<void, BackupError> {
        archive_write_close(a);
        archive_write_free(a);
        std::error_code removeEc;
        fs::remove(zipFile, removeEc);
        return std::unexpected(makeError(code, message));
    };

    struct archive_entry* ae = archive_entry_new();
    archive_entry_set_pathname(ae, entryName.c_str());
    archive_entry_set_size(ae, static_cast<la_int64_t>(fileSize));
    archive_entry_set_filetype(ae, AE_IFREG);
    archive_entry_set_perm(ae, 0644);
    archive_entry_set_mtime(ae, std::time(nullptr), 0);
    if (archive_write_header(a, ae) != ARCHIVE_OK) {
        archive_entry_free(ae);
        return fail(BackupErrorCode::IOFailure, "Failed to write archive header: " + archiveError(a));
    }
    archive_entry_free(ae);

    std::vector<char> buf(64 * 1024);
    while (in) {
        if (cancel && cancel->load()) {
            return fail(BackupErrorCode::Cancelled, "Compression of " + sourceFile + " cancelled");
        }
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got > 0 && archive_write_data(a, buf.data(), static_cast<size_t>(got)) < 0) {
            return fail(BackupErrorCode::IOFailure, "Failed to write archive data: " + archiveError(a));
        }
    }
    if (in.bad()) {
        return fail(BackupErrorCode::IOFailure, "Read error on " + sourceFile);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        std::string errorMsg = "Failed to finalize archive: " + archiveError(a);
        archive_write_free(a);
        fs::remove(zipFile, ec);
        return std::unexpected(makeError(BackupErrorCode::IOFailure, errorMsg));
    }
    archive_write_free(a);
    return {};
}

std::expected<std::string, BackupError> extractFirstEntry(const std::string& zipFile,
                                                          const std::string& destination) {
    std::string openError;
    struct archive* a = openZipReader(zipFile, openError);
    if (!a) {
        return std::unexpected(makeError(BackupErrorCode::CorruptArchive, openError));
    }

    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(a);
            continue;
        }
        std::string name = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        if (!out) {
            archive_read_free(a);
            return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to open " + destination + " for writing"));
        }

        char buf[64 * 1024];
        la_ssize_t got;
        while ((got = archive_read_data(a, buf, sizeof(buf))) > 0) {
            out.write(buf, got);
        }
        out.close();
        std::error_code ec;
        if (got < 0) {
            std::string errorMsg = "Corrupt entry " + name + " in " + zipFile + ": " + archiveError(a);
            archive_read_free(a);
            fs::remove(destination, ec);
            return std::unexpected(makeError(BackupErrorCode::CorruptArchive, errorMsg));
        }
        if (!out) {
            archive_read_free(a);
            fs::remove(destination, ec);
            return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to write " + destination));
        }
        archive_read_free(a);
        return name;
    }

    std::string errorMsg = r == ARCHIVE_EOF
        ? "Archive contains no file entry: " + zipFile
        : "Failed to read archive " + zipFile + ": " + archiveError(a);
    archive_read_free(a);
    return std::unexpected(makeError(BackupErrorCode::CorruptArchive, errorMsg));
}

std::expected<std::vector<ArchiveEntryInfo>, BackupError> scanArchive(const std::string& zipFile) {
    std::string openError;
    struct archive* a = openZipReader(zipFile, openError);
    if (!a) {
        return std::unexpected(makeError(BackupErrorCode::CorruptArchive, openError));
    }

    std::vector<ArchiveEntryInfo> entries;
    struct archive_entry* entry;
    char buf[64 * 1024];
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        ArchiveEntryInfo info;
        info.path = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        info.directory = archive_entry_filetype(entry) == AE_IFDIR;
        info.size = archive_entry_size(entry);
        // Reading the data makes libarchive check each entry's CRC.
        la_ssize_t got;
        while ((got = archive_read_data(a, buf, sizeof(buf))) > 0) {
        }
        if (got < 0) {
            std::string errorMsg = "Corrupt entry " + info.path + " in " + zipFile + ": " + archiveError(a);
            archive_read_free(a);
            return std::unexpected(makeError(BackupErrorCode::CorruptArchive, errorMsg));
        }
        entries.push_back(info);
    }
    if (r != ARCHIVE_EOF) {
        std::string errorMsg = "Failed to enumerate archive " + zipFile + ": " + archiveError(a);
        archive_read_free(a);
        return std::unexpected(makeError(BackupErrorCode::CorruptArchive, errorMsg));
    }
    archive_read_close(a);
    archive_read_free(a);
    return entries;
}
