/**
 * @file operation_lock.hpp
 * @brief Exclusive locks per artifact type.
 *
 * Backups, cleanups and restores of the same artifact type must never overlap. Each
 * operation tries to take the lock of its type without waiting. A conflict involving a
 * restore is reported as RestoreConflict; two non-restore operations meeting (a manual
 * backup and a scheduled one, say) are reported as AlreadyRunning so the later one can
 * be dropped.
 */

#ifndef OPERATION_LOCK_HPP
#define OPERATION_LOCK_HPP

#include <string>
#include <mutex>
#include <expected>
#include "backup_config.hpp"
#include "backup_error.hpp"

class OperationLocks;

/**
 * @brief What an operation does with the artifacts of its type.
 */
enum class OperationKind {
    Backup,  ///< Writes a new artifact.
    Cleanup, ///< Deletes old artifacts.
    Restore  ///< Reads an artifact into the live store.
};

/**
 * @brief RAII ownership of one artifact type's lock.
 */
class OperationGuard {
public:
    OperationGuard(OperationGuard&& other) noexcept;
    OperationGuard& operator=(OperationGuard&&) = delete;
    OperationGuard(const OperationGuard&) = delete;
    OperationGuard& operator=(const OperationGuard&) = delete;
    ~OperationGuard();

private:
    friend class OperationLocks;
    OperationGuard(OperationLocks* owner, BackupType type);

    OperationLocks* owner;
    BackupType type;
};

/**
 * @brief The two per-type locks shared by producers, cleanup and the restore engine.
 */
class OperationLocks {
public:
    /**
     * @brief Attempts to take the lock for an artifact type without blocking.
     *
     * @param type Artifact type.
     * @param kind What the caller is about to do.
     * @param operation Description of the caller, reported to conflicting callers (e.g. "files restore").
     * @return std::expected<OperationGuard, BackupError> The guard, RestoreConflict when either
     *         side is a restore, or AlreadyRunning otherwise.
     */
    std::expected<OperationGuard, BackupError> tryAcquire(BackupType type, OperationKind kind,
                                                          const std::string& operation);

    /**
     * @brief Returns true while an operation on the type is in progress.
     */
    bool isHeld(BackupType type) const;

private:
    friend class OperationGuard;
    void release(BackupType type);

    struct Slot {
        bool held = false;
        OperationKind kind = OperationKind::Backup;
        std::string holder;
    };

    Slot& slot(BackupType type) { return type == BackupType::Database ? database : files; }
    const Slot& slot(BackupType type) const { return type == BackupType::Database ? database : files; }

    mutable std::mutex mutex;
    Slot database;
    Slot files;
};

#endif // OPERATION_LOCK_HPP
