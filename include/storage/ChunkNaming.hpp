#pragma once

#include <filesystem>
#include <string>

namespace chunkd {

// Marker between the logical filename and the chunk index: "<name>.part<index>"
inline constexpr const char* kChunkMarker = ".part";

// <tempDir>/<fileName>.part<chunkIndex>, index in plain decimal
std::filesystem::path chunkPath(const std::filesystem::path& tempDir,
                                const std::string& fileName,
                                long long chunkIndex);

// <finalDir>/<fileName>, the name is used as given
std::filesystem::path outputPath(const std::filesystem::path& finalDir,
                                 const std::string& fileName);

// True when a directory entry name matches the sweep glob "*.part*"
bool isChunkArtifact(const std::string& entryName);

} // namespace chunkd
