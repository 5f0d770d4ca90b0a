#include "storage/ChunkStore.hpp"
#include "common/log.hpp"
#include "storage/ChunkNaming.hpp"
#include "storage/UploadError.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

namespace chunkd {

ChunkStore::ChunkStore(const std::filesystem::path& tempDir,
                       const std::filesystem::path& finalDir,
                       UploadLocks& locks,
                       size_t copyBufferBytes)
    : tempDir_(tempDir),
      finalDir_(finalDir),
      locks_(locks),
      copyBufferBytes_(copyBufferBytes == 0 ? DEFAULT_COPY_BUFFER : copyBufferBytes) {}

void ChunkStore::ensureStorageDirectories() const {
    for (const auto& dir : {tempDir_, finalDir_}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw UploadError(ErrorKind::IoFailure,
                              "Failed to create directory",
                              dir.string() + ": " + ec.message());
        }
    }
}

std::filesystem::path ChunkStore::getChunkPath(const std::string& filename, long long chunkIndex) const {
    return chunkPath(tempDir_, filename, chunkIndex);
}

std::string ChunkStore::storeChunk(const std::string& filename, long long chunkIndex, std::istream& data) {
    if (filename.empty()) {
        throw UploadError(ErrorKind::InvalidRequest, "Invalid request data", "filename must not be empty");
    }
    if (chunkIndex < 0) {
        throw UploadError(ErrorKind::InvalidRequest, "Invalid request data",
                          "chunk index must be non-negative, got " + std::to_string(chunkIndex));
    }

    ensureStorageDirectories();

    auto guard = locks_.lockForUpload(filename);
    std::filesystem::path target = getChunkPath(filename, chunkIndex);
    std::uintmax_t written = copyStream(data, target);

    logLine(std::cout, "Stored chunk " + std::to_string(chunkIndex) + " of '" + filename + "' (" +
                       std::to_string(written) + " bytes) at " + target.string());
    return filename;
}

std::uintmax_t ChunkStore::copyStream(std::istream& data, const std::filesystem::path& target) const {
    std::ofstream outFile(target, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        throw UploadError(ErrorKind::IoFailure,
                          "Failed to create temporary file",
                          target.string() + " (" + std::strerror(errno) + ")");
    }

    std::vector<char> buffer(copyBufferBytes_);
    std::uintmax_t total = 0;
    std::string failure;

    while (true) {
        data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = data.gcount();
        if (got > 0) {
            outFile.write(buffer.data(), got);
            if (!outFile) {
                failure = "write to " + target.string() + " failed (" + std::strerror(errno) + ")";
                break;
            }
            total += static_cast<std::uintmax_t>(got);
        }
        if (data.eof()) break;
        if (data.fail()) {
            failure = "source stream error after " + std::to_string(total) + " bytes";
            break;
        }
    }

    if (failure.empty()) {
        outFile.flush();
        if (!outFile) {
            failure = "flush of " + target.string() + " failed (" + std::strerror(errno) + ")";
        }
    }

    if (!failure.empty()) {
        outFile.close();
        std::error_code ec;
        std::filesystem::remove(target, ec);
        if (ec) {
            logLine(std::cerr, "Failed to remove partial chunk " + target.string() + ": " + ec.message());
        }
        throw UploadError(ErrorKind::IoFailure, "Failed to write file chunk", failure);
    }

    return total;
}

} // namespace chunkd
