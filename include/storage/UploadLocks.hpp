#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace chunkd {

/**
 * Coordinates chunk writes with merges and sweeps.
 *
 * Every logical filename has a shared/exclusive lock: uploads hold it shared,
 * a merge of that file holds it exclusive. A process-wide sweep gate is held
 * shared by every upload and exclusive by the sweep, so the sweep never
 * unlinks a chunk that is still being written.
 * Acquisition order is always filename lock first, gate second.
 */
class UploadLocks {
public:
    // Held for the duration of one chunk write
    class UploadGuard {
    public:
        UploadGuard(std::shared_ptr<std::shared_mutex> fileLock, std::shared_mutex& gate);
    private:
        std::shared_ptr<std::shared_mutex> fileLock_;
        std::shared_lock<std::shared_mutex> fileHold_;
        std::shared_lock<std::shared_mutex> gateHold_;
    };

    // Held for the duration of one merge
    class MergeGuard {
    public:
        explicit MergeGuard(std::shared_ptr<std::shared_mutex> fileLock);
    private:
        std::shared_ptr<std::shared_mutex> fileLock_;
        std::unique_lock<std::shared_mutex> fileHold_;
    };

    UploadLocks() = default;
    UploadLocks(const UploadLocks&) = delete;
    UploadLocks& operator=(const UploadLocks&) = delete;

    UploadGuard lockForUpload(const std::string& fileName);
    MergeGuard lockForMerge(const std::string& fileName);
    std::unique_lock<std::shared_mutex> lockForSweep();

    // Number of filenames whose lock is currently held by a guard
    size_t heldFiles();

private:
    std::mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> fileLocks_;
    std::shared_mutex sweepGate_;

    std::shared_ptr<std::shared_mutex> acquire(const std::string& fileName);
};

} // namespace chunkd
