#include "operation_lock.hpp"

OperationGuard::OperationGuard(OperationLocks* owner, BackupType type)
    : owner(owner), type(type) {}

OperationGuard::OperationGuard(OperationGuard&& other) noexcept
    : owner(other.owner), type(other.type) {
    other.owner = nullptr;
}

OperationGuard::~OperationGuard() {
    if (owner) {
        owner->release(type);
    }
}

std::expected<OperationGuard, BackupError> OperationLocks::tryAcquire(BackupType type, OperationKind kind,
                                                                    const std::string& operation) {
    std::lock_guard<std::mutex> lock(mutex);
    Slot& s = slot(type);
    if (s.held) {
        bool restoreInvolved = kind == OperationKind::Restore || s.kind == OperationKind::Restore;
        return std::unexpected(makeError(restoreInvolved ? BackupErrorCode::RestoreConflict : BackupErrorCode::AlreadyRunning,
            "Cannot start " + operation + ": " + s.holder + " is in progress"));
    }
    s.held = true;
    s.kind = kind;
    s.holder = operation;
    return OperationGuard(this, type);
}

bool OperationLocks::isHeld(BackupType type) const {
    std::lock_guard<std::mutex> lock(mutex);
    return slot(type).held;
}

void OperationLocks::release(BackupType type) {
    std::lock_guard<std::mutex> lock(mutex);
    Slot& s = slot(type);
    s.held = false;
    s.holder.clear();
}
