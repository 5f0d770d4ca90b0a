#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include "storage/UploadLocks.hpp"

namespace chunkd {

class ChunkStore {
public:
    static constexpr size_t DEFAULT_COPY_BUFFER = 1024 * 1024; // 1 MiB

    ChunkStore(const std::filesystem::path& tempDir,
               const std::filesystem::path& finalDir,
               UploadLocks& locks,
               size_t copyBufferBytes = DEFAULT_COPY_BUFFER);

    // Streams one chunk into <tempDir>/<filename>.part<chunkIndex>, overwriting
    // any earlier upload of the same index. Returns the filename it was given.
    // Throws UploadError.
    std::string storeChunk(const std::string& filename, long long chunkIndex, std::istream& data);

    // Creates both storage directories if needed; safe to call repeatedly
    void ensureStorageDirectories() const;

    std::filesystem::path getChunkPath(const std::string& filename, long long chunkIndex) const;

    const std::filesystem::path& tempDir() const { return tempDir_; }
    const std::filesystem::path& finalDir() const { return finalDir_; }

private:
    std::filesystem::path tempDir_;
    std::filesystem::path finalDir_;
    UploadLocks& locks_;
    size_t copyBufferBytes_;

    // Copies data to target through the bounded buffer, returns bytes written
    std::uintmax_t copyStream(std::istream& data, const std::filesystem::path& target) const;
};

} // namespace chunkd
