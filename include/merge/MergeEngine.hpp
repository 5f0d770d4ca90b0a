#pragma once

#include <boost/asio/thread_pool.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "storage/UploadLocks.hpp"

namespace chunkd {

// Inclusive run of chunk indices
struct ChunkRange {
    long long first;
    long long last;

    bool operator==(const ChunkRange& other) const {
        return first == other.first && last == other.last;
    }
};

struct MergeReport {
    std::string fileName;
    long long totalChunks = 0;
    std::vector<long long> mergedChunks;
    std::vector<ChunkRange> missingChunks;  // absent indices, coalesced into ranges
    std::vector<long long> failedChunks;
    std::uintmax_t bytesWritten = 0;
    size_t sweptArtifacts = 0;

    // Indices must arrive in ascending order; extends the last range when adjacent
    void addMissing(long long chunkIndex);
    long long missingCount() const;
};

/**
 * Reassembles the chunk artifacts of one logical file.
 *
 * Chunk reads run on a shared worker pool; the calling thread is the only
 * writer of the output file and consumes read results strictly in index
 * order. At most `window` chunk buffers are in memory per merge.
 */
class MergeEngine {
public:
    MergeEngine(const std::filesystem::path& tempDir,
                const std::filesystem::path& finalDir,
                UploadLocks& locks,
                size_t workers,
                size_t window = 0);
    ~MergeEngine();

    MergeEngine(const MergeEngine&) = delete;
    MergeEngine& operator=(const MergeEngine&) = delete;

    // Merges chunks [0, totalChunks) of fileName into <finalDir>/<fileName>,
    // then sweeps every "*.part*" artifact from the temp directory.
    // Missing or unreadable chunks are skipped and reported, not thrown.
    // Throws UploadError on invalid input, output creation or sweep failure.
    MergeReport mergeChunks(const std::string& fileName, long long totalChunks);

    // Removes every chunk artifact in the temp directory, returns the count.
    // Throws UploadError if any of them cannot be removed.
    size_t sweepTempArtifacts();

    size_t workers() const { return workers_; }
    size_t window() const { return window_; }

private:
    struct MergeState;

    std::filesystem::path tempDir_;
    std::filesystem::path finalDir_;
    UploadLocks& locks_;
    size_t workers_;
    size_t window_;
    boost::asio::thread_pool pool_;

    void scheduleRead(const std::shared_ptr<MergeState>& state, long long chunkIndex);
    static void readChunk(MergeState& state, long long chunkIndex);
};

} // namespace chunkd
