#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace chunkd {

struct ServerConfig {
    std::string bindAddress;
    uint16_t port;
    std::string tempDir;
    std::string finalDir;
    size_t copyBufferBytes;
    size_t mergeWorkers;
    size_t mergeWindow;
    size_t serverThreads;
    size_t maxBodyBytes;
    size_t maxTotalChunks;
    unsigned rateLimitMax;
    unsigned rateLimitWindowSeconds;

    // Compiled-in defaults, merge workers follow hardware concurrency
    static ServerConfig defaults();

    // Overrides fields present in a JSON object; unknown keys are ignored.
    // Throws std::invalid_argument on wrong types or out of range values.
    void applyJson(const nlohmann::json& j);

    // Reads a JSON config file and applies it. Throws std::runtime_error if
    // the file cannot be read, std::invalid_argument if it is malformed.
    void applyFile(const std::string& path);

    // Applies CHUNKD_* variables through the given lookup (getenv in main)
    void applyEnvironment(const std::function<const char*(const char*)>& lookup);

    // Checks cross-field constraints; throws std::invalid_argument
    void validate() const;

    nlohmann::json to_json() const;
};

// defaults < file (if path non-empty) < environment, then validated
ServerConfig loadServerConfig(const std::string& path);

} // namespace chunkd
