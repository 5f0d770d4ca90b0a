#include <iostream>
#include <string>
#include <exception>

#include "config/ServerConfig.hpp"
#include "merge/MergeEngine.hpp"
#include "server/UploadHandler.hpp"
#include "server/endpoint.hpp"
#include "server/wserver.hpp"
#include "storage/ChunkStore.hpp"
#include "storage/UploadError.hpp"
#include "storage/UploadLocks.hpp"

using namespace chunkd;

int main(int argc, char** argv)
{
    ServerConfig cfg;
    try {
        cfg = loadServerConfig(argc > 1 ? argv[1] : "");
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Configuration: " << cfg.to_json().dump() << std::endl;

    UploadLocks locks;
    ChunkStore store(cfg.tempDir, cfg.finalDir, locks, cfg.copyBufferBytes);
    try {
        store.ensureStorageDirectories();
    } catch (const UploadError& e) {
        std::cerr << e.what() << ": " << e.detail() << std::endl;
        return 1;
    }

    MergeEngine engine(cfg.tempDir, cfg.finalDir, locks, cfg.mergeWorkers, cfg.mergeWindow);
    UploadHandler uploadHandler(store, engine, static_cast<long long>(cfg.maxTotalChunks));

    try {
        wServer server(cfg);

        server.add_endpoint(endpoint(
            [](const http::Request&) { return http::Response::text(200, "Hello, World!"); },
            HttpRequest::GET,
            "/"));

        server.add_endpoint(endpoint(
            [&uploadHandler](const http::Request& req) { return uploadHandler.handleUploadChunk(req); },
            HttpRequest::POST,
            "/upload-file"));

        server.add_endpoint(endpoint(
            [&uploadHandler](const http::Request& req) { return uploadHandler.handleMergeChunks(req); },
            HttpRequest::POST,
            "/merge-chunk"));

        server.run();
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
