#include "retention.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<BackupType> artifactType(const std::string& name) {
    for (BackupType type : {BackupType::Database, BackupType::Files}) {
        std::string prefix = toString(type) + "_backup_";
        if (name.rfind(prefix, 0) != 0) {
            continue;
        }
        bool extensionMatches = type == BackupType::Database
            ? endsWith(name, ".db.zip") || endsWith(name, ".db")
            : endsWith(name, ".zip");
        if (extensionMatches) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace

std::chrono::system_clock::time_point retentionCutoff(const RetentionPolicy& policy, RetentionTier tier,
                                                      std::chrono::system_clock::time_point now) {
    int days = policy.daily;
    switch (tier) {
    case RetentionTier::Daily:
        days = policy.daily;
        break;
    case RetentionTier::Weekly:
        days = policy.weekly * 7;
        break;
    case RetentionTier::Monthly:
        days = policy.monthly * 30;
        break;
    }
    return now - std::chrono::hours(24 * days);
}

std::vector<BackupEntry> listBackups(const BackupConfig& config, std::optional<BackupType> type) {
    std::vector<BackupEntry> entries;
    std::error_code ec;
    if (!fs::is_directory(config.storage.localPath, ec)) {
        return entries;
    }

    for (const auto& item : fs::directory_iterator(config.storage.localPath, ec)) {
        std::error_code itemEc;
        if (!item.is_regular_file(itemEc)) {
            continue;
        }
        auto found = artifactType(item.path().filename().string());
        if (!found || (type && *found != *type)) {
            continue;
        }

        BackupEntry entry;
        entry.path = item.path().string();
        entry.type = *found;
        entry.size = item.file_size(itemEc);
        auto lastWrite = item.last_write_time(itemEc);
        if (itemEc) {
            continue;
        }
        entry.modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(lastWrite));
        auto metadata = readSidecar(entry.path);
        if (metadata) {
            entry.metadata = *metadata;
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [](const BackupEntry& a, const BackupEntry& b) {
        return a.modified != b.modified ? a.modified > b.modified : a.path > b.path;
    });
    return entries;
}

std::expected<CleanupResult, BackupError> cleanupBackups(const BackupConfig& config, BackupType type, const BackupLog& log,
                                                         OperationLocks& locks, std::chrono::system_clock::time_point now) {
    auto guard = locks.tryAcquire(type, OperationKind::Cleanup, toString(type) + " cleanup");
    if (!guard) {
        log.logWarning("Cleanup of " + toString(type) + " backups skipped: " + guard.error().message);
        return std::unexpected(guard.error());
    }

    CleanupResult result;
    auto threshold = retentionCutoff(config.retentionFor(type), RetentionTier::Daily, now);

    for (const auto& entry : listBackups(config, type)) {
        if (entry.modified >= threshold) {
            continue;
        }
        std::error_code ec;
        fs::remove(entry.path, ec);
        if (ec) {
            std::string message = "Failed to remove old backup: " + entry.path + " (error: " + ec.message() + ")";
            log.logError(message);
            result.errors.push_back(message);
            continue;
        }
        fs::remove(getSidecarPath(entry.path), ec);
        if (ec) {
            log.logWarning("Failed to remove sidecar of " + entry.path + ": " + ec.message());
        }
        ++result.deletedCount;
        log.logMessage("Removed old backup: " + entry.path);
    }

    log.logMessage("Cleanup of " + toString(type) + " backups finished: " + std::to_string(result.deletedCount) +
                   " deleted, " + std::to_string(result.errors.size()) + " error(s)");
    return result;
}
