#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <utility>
#include <nlohmann/json.hpp>
#include "http/MultipartParser.hpp"
#include "const/rest_enums.hpp"

namespace chunkd {
namespace http {

/**
 * HTTP Request object containing all request data
 */
struct Request {
    HttpRequest method = HttpRequest::GET;
    std::string path;                                      // Clean path without query string
    std::string remoteAddress;                             // Client IP, used as rate limit key
    std::unordered_map<std::string, std::string> query;    // Query parameters (?key=value)
    std::unordered_map<std::string, std::string> headers;  // Header names lowercased
    std::unordered_map<std::string, std::string> form;     // Non-file multipart fields and url-encoded body
    std::vector<MultipartPart> parts;                      // Multipart parts
    std::string mediaType;                                 // Content-Type without parameters, lowercased
    std::string rawBody;

    std::string getQuery(const std::string& key, const std::string& defaultValue = "") const {
        auto it = query.find(key);
        return it != query.end() ? it->second : defaultValue;
    }

    // Looks the key up in the form fields first, then in the query string
    std::string getField(const std::string& key, const std::string& defaultValue = "") const {
        auto it = form.find(key);
        if (it != form.end()) return it->second;
        return getQuery(key, defaultValue);
    }

    bool hasField(const std::string& key) const {
        return form.find(key) != form.end() || query.find(key) != query.end();
    }

    // First multipart part carrying a file under the given field name
    const MultipartPart* findFile(const std::string& fieldName) const {
        for (const auto& part : parts) {
            if (part.isFile() && part.name == fieldName) return &part;
        }
        return nullptr;
    }
};

/**
 * HTTP Response object
 */
struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;  // extra response headers

    static Response ok(const nlohmann::json& body) {
        return {200, "application/json", body.dump()};
    }

    static Response text(int status, const std::string& body) {
        return {status, "text/plain", body};
    }

    static Response noContent() {
        return {204, "text/plain", ""};
    }

    // {"error":true,"message":...,"details":...,"kind":...}
    static Response failure(int status, const std::string& message,
                            const std::string& details, const std::string& kind) {
        nlohmann::json j;
        j["error"] = true;
        j["message"] = message;
        j["details"] = details;
        j["kind"] = kind;
        return {status, "application/json", j.dump()};
    }

    static Response notFound() {
        return failure(404, "Not Found", "no route for request path", "invalid-request");
    }

    static Response methodNotAllowed() {
        return failure(405, "Method Not Allowed", "route does not accept this method", "invalid-request");
    }

    static Response tooManyRequests() {
        return failure(429, "Too Many Requests", "rate limit exceeded, retry later", "invalid-request");
    }
};

const char* status_text(int status);

} // namespace http
} // namespace chunkd
