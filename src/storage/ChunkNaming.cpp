#include "storage/ChunkNaming.hpp"

namespace chunkd {

std::filesystem::path chunkPath(const std::filesystem::path& tempDir,
                                const std::string& fileName,
                                long long chunkIndex) {
    return tempDir / (fileName + kChunkMarker + std::to_string(chunkIndex));
}

std::filesystem::path outputPath(const std::filesystem::path& finalDir,
                                 const std::string& fileName) {
    return finalDir / fileName;
}

bool isChunkArtifact(const std::string& entryName) {
    // Glob "*" also matches leading dots, so any occurrence qualifies
    return entryName.find(kChunkMarker) != std::string::npos;
}

} // namespace chunkd
