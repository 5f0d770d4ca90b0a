#include "storage/UploadLocks.hpp"

namespace chunkd {

UploadLocks::UploadGuard::UploadGuard(std::shared_ptr<std::shared_mutex> fileLock, std::shared_mutex& gate)
    : fileLock_(std::move(fileLock)),
      fileHold_(*fileLock_),
      gateHold_(gate) {}

UploadLocks::MergeGuard::MergeGuard(std::shared_ptr<std::shared_mutex> fileLock)
    : fileLock_(std::move(fileLock)),
      fileHold_(*fileLock_) {}

std::shared_ptr<std::shared_mutex> UploadLocks::acquire(const std::string& fileName) {
    std::lock_guard<std::mutex> lock(mapMutex_);

    // Drop locks that only the registry still references
    for (auto it = fileLocks_.begin(); it != fileLocks_.end();) {
        if (it->second.use_count() == 1 && it->first != fileName) {
            it = fileLocks_.erase(it);
        } else {
            ++it;
        }
    }

    auto& slot = fileLocks_[fileName];
    if (!slot) {
        slot = std::make_shared<std::shared_mutex>();
    }
    return slot;
}

UploadLocks::UploadGuard UploadLocks::lockForUpload(const std::string& fileName) {
    return UploadGuard(acquire(fileName), sweepGate_);
}

UploadLocks::MergeGuard UploadLocks::lockForMerge(const std::string& fileName) {
    return MergeGuard(acquire(fileName));
}

std::unique_lock<std::shared_mutex> UploadLocks::lockForSweep() {
    return std::unique_lock<std::shared_mutex>(sweepGate_);
}

size_t UploadLocks::heldFiles() {
    std::lock_guard<std::mutex> lock(mapMutex_);
    size_t held = 0;
    for (const auto& entry : fileLocks_) {
        if (entry.second.use_count() > 1) ++held;
    }
    return held;
}

} // namespace chunkd
