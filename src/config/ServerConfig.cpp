#include "config/ServerConfig.hpp"
#include "config.hpp"
#include "http/HttpUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <thread>

namespace chunkd {

namespace {

unsigned long long toUnsigned(const nlohmann::json& value, const char* key,
                              unsigned long long maxValue) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("config key '") + key + "' must be an integer");
    }
    if (!value.is_number_unsigned() && value.get<long long>() < 0) {
        throw std::invalid_argument(std::string("config key '") + key + "' must not be negative");
    }
    unsigned long long v = value.get<unsigned long long>();
    if (v > maxValue) {
        throw std::invalid_argument(std::string("config key '") + key + "' is out of range");
    }
    return v;
}

unsigned long long envUnsigned(const char* name, const char* raw, unsigned long long maxValue) {
    long long v = 0;
    if (!http::parseInteger(raw, v) || v < 0 || static_cast<unsigned long long>(v) > maxValue) {
        throw std::invalid_argument(std::string("environment variable ") + name +
                                    " must be an integer in [0, " + std::to_string(maxValue) +
                                    "], got '" + raw + "'");
    }
    return static_cast<unsigned long long>(v);
}

std::string toString(const nlohmann::json& value, const char* key) {
    if (!value.is_string()) {
        throw std::invalid_argument(std::string("config key '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

constexpr unsigned long long kMaxSize = std::numeric_limits<size_t>::max();
constexpr unsigned long long kMaxUnsigned = std::numeric_limits<unsigned>::max();
// One below the top so the merge handler can still represent "limit + 1"
constexpr unsigned long long kMaxChunkLimit = std::numeric_limits<long long>::max() - 1;

} // namespace

ServerConfig ServerConfig::defaults() {
    ServerConfig cfg;
    cfg.bindAddress = CHUNKD_DEFAULT_BIND;
    cfg.port = CHUNKD_DEFAULT_PORT;
    cfg.tempDir = CHUNKD_DEFAULT_TEMP_DIR;
    cfg.finalDir = CHUNKD_DEFAULT_FINAL_DIR;
    cfg.copyBufferBytes = 1024 * 1024;
    unsigned hw = std::thread::hardware_concurrency();
    cfg.mergeWorkers = hw == 0 ? 1 : hw;
    cfg.mergeWindow = 0;
    cfg.serverThreads = CHUNKD_DEFAULT_SERVER_THREADS;
    cfg.maxBodyBytes = static_cast<size_t>(CHUNKD_DEFAULT_MAX_BODY);
    cfg.maxTotalChunks = CHUNKD_DEFAULT_MAX_TOTAL_CHUNKS;
    cfg.rateLimitMax = CHUNKD_DEFAULT_RATE_LIMIT_MAX;
    cfg.rateLimitWindowSeconds = CHUNKD_DEFAULT_RATE_LIMIT_WINDOW;
    return cfg;
}

void ServerConfig::applyJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    if (j.contains("bind_address")) bindAddress = toString(j["bind_address"], "bind_address");
    if (j.contains("port")) port = static_cast<uint16_t>(toUnsigned(j["port"], "port", 65535));
    if (j.contains("temp_dir")) tempDir = toString(j["temp_dir"], "temp_dir");
    if (j.contains("final_dir")) finalDir = toString(j["final_dir"], "final_dir");
    if (j.contains("copy_buffer_bytes"))
        copyBufferBytes = toUnsigned(j["copy_buffer_bytes"], "copy_buffer_bytes", kMaxSize);
    if (j.contains("merge_workers"))
        mergeWorkers = toUnsigned(j["merge_workers"], "merge_workers", kMaxSize);
    if (j.contains("merge_window"))
        mergeWindow = toUnsigned(j["merge_window"], "merge_window", kMaxSize);
    if (j.contains("server_threads"))
        serverThreads = toUnsigned(j["server_threads"], "server_threads", kMaxSize);
    if (j.contains("max_body_bytes"))
        maxBodyBytes = toUnsigned(j["max_body_bytes"], "max_body_bytes", kMaxSize);
    if (j.contains("max_total_chunks"))
        maxTotalChunks = toUnsigned(j["max_total_chunks"], "max_total_chunks", std::min(kMaxSize, kMaxChunkLimit));
    if (j.contains("rate_limit_max"))
        rateLimitMax = static_cast<unsigned>(toUnsigned(j["rate_limit_max"], "rate_limit_max", kMaxUnsigned));
    if (j.contains("rate_limit_window_seconds"))
        rateLimitWindowSeconds = static_cast<unsigned>(
            toUnsigned(j["rate_limit_window_seconds"], "rate_limit_window_seconds", kMaxUnsigned));
}

void ServerConfig::applyFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Config file " + path + " is not valid JSON: " + e.what());
    }
    applyJson(j);
}

void ServerConfig::applyEnvironment(const std::function<const char*(const char*)>& lookup) {
    if (const char* v = lookup("CHUNKD_BIND")) bindAddress = v;
    if (const char* v = lookup("CHUNKD_PORT"))
        port = static_cast<uint16_t>(envUnsigned("CHUNKD_PORT", v, 65535));
    if (const char* v = lookup("CHUNKD_TEMP_DIR")) tempDir = v;
    if (const char* v = lookup("CHUNKD_FINAL_DIR")) finalDir = v;
    if (const char* v = lookup("CHUNKD_COPY_BUFFER"))
        copyBufferBytes = envUnsigned("CHUNKD_COPY_BUFFER", v, kMaxSize);
    if (const char* v = lookup("CHUNKD_MERGE_WORKERS"))
        mergeWorkers = envUnsigned("CHUNKD_MERGE_WORKERS", v, kMaxSize);
    if (const char* v = lookup("CHUNKD_MERGE_WINDOW"))
        mergeWindow = envUnsigned("CHUNKD_MERGE_WINDOW", v, kMaxSize);
    if (const char* v = lookup("CHUNKD_SERVER_THREADS"))
        serverThreads = envUnsigned("CHUNKD_SERVER_THREADS", v, kMaxSize);
    if (const char* v = lookup("CHUNKD_MAX_BODY"))
        maxBodyBytes = envUnsigned("CHUNKD_MAX_BODY", v, kMaxSize);
    if (const char* v = lookup("CHUNKD_MAX_TOTAL_CHUNKS"))
        maxTotalChunks = envUnsigned("CHUNKD_MAX_TOTAL_CHUNKS", v, std::min(kMaxSize, kMaxChunkLimit));
    if (const char* v = lookup("CHUNKD_RATE_LIMIT_MAX"))
        rateLimitMax = static_cast<unsigned>(envUnsigned("CHUNKD_RATE_LIMIT_MAX", v, kMaxUnsigned));
    if (const char* v = lookup("CHUNKD_RATE_LIMIT_WINDOW"))
        rateLimitWindowSeconds = static_cast<unsigned>(
            envUnsigned("CHUNKD_RATE_LIMIT_WINDOW", v, kMaxUnsigned));
}

void ServerConfig::validate() const {
    if (tempDir.empty()) throw std::invalid_argument("temp_dir must not be empty");
    if (finalDir.empty()) throw std::invalid_argument("final_dir must not be empty");
    if (port == 0) throw std::invalid_argument("port must not be 0");
    if (copyBufferBytes == 0) throw std::invalid_argument("copy_buffer_bytes must be positive");
    if (mergeWorkers == 0) throw std::invalid_argument("merge_workers must be positive");
    if (serverThreads == 0) throw std::invalid_argument("server_threads must be positive");
    if (maxBodyBytes == 0) throw std::invalid_argument("max_body_bytes must be positive");
    if (maxTotalChunks == 0) throw std::invalid_argument("max_total_chunks must be positive");
    if (rateLimitMax > 0 && rateLimitWindowSeconds == 0) {
        throw std::invalid_argument("rate_limit_window_seconds must be positive when rate limiting is on");
    }
}

nlohmann::json ServerConfig::to_json() const {
    return {
        {"bind_address", bindAddress},
        {"port", port},
        {"temp_dir", tempDir},
        {"final_dir", finalDir},
        {"copy_buffer_bytes", copyBufferBytes},
        {"merge_workers", mergeWorkers},
        {"merge_window", mergeWindow},
        {"server_threads", serverThreads},
        {"max_body_bytes", maxBodyBytes},
        {"max_total_chunks", maxTotalChunks},
        {"rate_limit_max", rateLimitMax},
        {"rate_limit_window_seconds", rateLimitWindowSeconds},
    };
}

ServerConfig loadServerConfig(const std::string& path) {
    ServerConfig cfg = ServerConfig::defaults();
    if (!path.empty()) {
        cfg.applyFile(path);
    }
    cfg.applyEnvironment([](const char* name) { return std::getenv(name); });
    cfg.validate();
    return cfg;
}

} // namespace chunkd
