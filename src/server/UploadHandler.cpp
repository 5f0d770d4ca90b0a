#include "server/UploadHandler.hpp"
#include "common/log.hpp"
#include "http/HttpUtils.hpp"
#include "storage/UploadError.hpp"
#include <iostream>
#include <sstream>

namespace chunkd {

namespace {

http::Response errorResponse(const UploadError& e) {
    return http::Response::failure(http_status(e.kind()), e.what(), e.detail(), to_string(e.kind()));
}

} // namespace

UploadHandler::UploadHandler(ChunkStore& store, MergeEngine& engine, long long maxTotalChunks)
    : store_(store), engine_(engine), maxTotalChunks_(maxTotalChunks) {}

bool UploadHandler::readIntegerField(const http::Request& req, const std::string& key,
                                     long long& out, std::string& error) const {
    if (!req.hasField(key)) {
        error = "missing field '" + key + "'";
        return false;
    }
    std::string raw = req.getField(key);
    if (!http::parseInteger(raw, out)) {
        error = "field '" + key + "' is not an integer: '" + raw + "'";
        return false;
    }
    return true;
}

http::Response UploadHandler::handleUploadChunk(const http::Request& req) {
    try {
        if (req.mediaType != "multipart/form-data") {
            throw UploadError(ErrorKind::InvalidRequest, "Invalid request data",
                              "expected multipart/form-data, got '" + req.mediaType + "'");
        }

        long long chunkIndex = 0;
        std::string error;
        if (!readIntegerField(req, "chunk_index", chunkIndex, error)) {
            throw UploadError(ErrorKind::InvalidRequest, "Invalid request data", error);
        }

        const http::MultipartPart* file = req.findFile("file");
        if (file == nullptr) {
            throw UploadError(ErrorKind::FileMissing, "File upload failed",
                              "there is no uploaded file associated with the given key 'file'");
        }

        std::istringstream data(file->data);
        std::string stored = store_.storeChunk(file->filename, chunkIndex, data);

        nlohmann::json response;
        response["error"] = false;
        response["message"] = "File uploaded successfully";
        response["file"] = stored;
        return http::Response::ok(response);
    } catch (const UploadError& e) {
        logLine(std::cerr, std::string("Upload rejected: ") + e.what() + " (" + e.detail() + ")");
        return errorResponse(e);
    } catch (const std::exception& e) {
        logLine(std::cerr, std::string("Upload failed: ") + e.what());
        return http::Response::failure(500, "Failed to write file chunk", e.what(),
                                       to_string(ErrorKind::IoFailure));
    }
}

void UploadHandler::parseMergeRequest(const http::Request& req,
                                      std::string& fileName, long long& totalChunks) const {
    if (req.mediaType == "application/json") {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.rawBody);
        } catch (const nlohmann::json::parse_error& e) {
            throw UploadError(ErrorKind::InvalidRequest, "Invalid request data", e.what());
        }
        if (!body.is_object()) {
            throw UploadError(ErrorKind::InvalidRequest, "Invalid request data", "body must be a JSON object");
        }
        if (!body.contains("file_name") || !body["file_name"].is_string()) {
            throw UploadError(ErrorKind::InvalidRequest, "Invalid request data",
                              "field 'file_name' must be a string");
        }
        if (!body.contains("total_chunks") || !body["total_chunks"].is_number_integer()) {
            throw UploadError(ErrorKind::InvalidRequest, "Invalid request data",
                              "field 'total_chunks' must be an integer");
        }
        const nlohmann::json& total = body["total_chunks"];
        // Unsigned values past the long long range must not wrap
        totalChunks = total.is_number_unsigned() &&
                              total.get<unsigned long long>() > static_cast<unsigned long long>(maxTotalChunks_)
                          ? maxTotalChunks_ + 1
                          : total.get<long long>();
        fileName = body["file_name"].get<std::string>();
    } else {
        std::string error;
        if (!readIntegerField(req, "total_chunks", totalChunks, error)) {
            throw UploadError(ErrorKind::InvalidRequest, "Invalid request data", error);
        }
        if (!req.hasField("file_name")) {
            throw UploadError(ErrorKind::InvalidRequest, "Invalid request data", "missing field 'file_name'");
        }
        fileName = req.getField("file_name");
    }

    if (totalChunks > maxTotalChunks_) {
        throw UploadError(ErrorKind::InvalidRequest, "Invalid request data",
                          "total_chunks must not exceed " + std::to_string(maxTotalChunks_));
    }
}

http::Response UploadHandler::handleMergeChunks(const http::Request& req) {
    try {
        std::string fileName;
        long long totalChunks = 0;
        parseMergeRequest(req, fileName, totalChunks);

        MergeReport report = engine_.mergeChunks(fileName, totalChunks);

        nlohmann::json response = reportToJson(report);
        response["error"] = false;
        response["message"] = "Chunks merged successfully";
        return http::Response::ok(response);
    } catch (const UploadError& e) {
        logLine(std::cerr, std::string("Merge failed: ") + e.what() + " (" + e.detail() + ")");
        return errorResponse(e);
    } catch (const std::exception& e) {
        logLine(std::cerr, std::string("Merge failed: ") + e.what());
        return http::Response::failure(500, "Failed to merge chunks", e.what(),
                                       to_string(ErrorKind::IoFailure));
    }
}

nlohmann::json UploadHandler::reportToJson(const MergeReport& report) {
    nlohmann::json j;
    j["file"] = report.fileName;
    j["total_chunks"] = report.totalChunks;
    j["chunks_merged"] = report.mergedChunks.size();
    nlohmann::json missing = nlohmann::json::array();
    for (const auto& range : report.missingChunks) {
        missing.push_back(nlohmann::json::array({range.first, range.last}));
    }
    j["missing_chunks"] = missing;
    j["failed_chunks"] = report.failedChunks;
    j["bytes_written"] = report.bytesWritten;
    j["swept_artifacts"] = report.sweptArtifacts;
    return j;
}

} // namespace chunkd
