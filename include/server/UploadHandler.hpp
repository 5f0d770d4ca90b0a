#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "http/Request.hpp"
#include "merge/MergeEngine.hpp"
#include "storage/ChunkStore.hpp"

namespace chunkd {

class UploadHandler {
public:
    UploadHandler(ChunkStore& store, MergeEngine& engine,
                  long long maxTotalChunks = CHUNKD_DEFAULT_MAX_TOTAL_CHUNKS);

    // POST /upload-file: multipart body with a "chunk_index" field and a "file" part.
    // The part's filename names the logical file.
    http::Response handleUploadChunk(const http::Request& req);

    // POST /merge-chunk: "file_name" and "total_chunks" from a JSON body,
    // a url-encoded body or the query string
    http::Response handleMergeChunks(const http::Request& req);

private:
    ChunkStore& store_;
    MergeEngine& engine_;
    long long maxTotalChunks_;

    // Reads an integer field from the form or the query string
    bool readIntegerField(const http::Request& req, const std::string& key,
                          long long& out, std::string& error) const;

    // Fills fileName/totalChunks from the request, throws UploadError(InvalidRequest),
    // also when totalChunks exceeds maxTotalChunks_
    void parseMergeRequest(const http::Request& req, std::string& fileName, long long& totalChunks) const;

    static nlohmann::json reportToJson(const MergeReport& report);
};

} // namespace chunkd
