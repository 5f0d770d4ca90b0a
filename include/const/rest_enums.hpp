#pragma once

#include <string>
#include <stdexcept>

namespace chunkd {

enum class HttpRequest {
    GET,
    POST,
    OPTIONS,
};


inline const char* to_string(HttpRequest method) {
    switch(method) {
        case HttpRequest::GET: return "GET";
        case HttpRequest::POST: return "POST";
        case HttpRequest::OPTIONS: return "OPTIONS";
        default: return "UNKNOWN";
    }
}


inline HttpRequest from_string(const std::string& method) {
    if (method == "GET") return HttpRequest::GET;
    else if (method == "POST") return HttpRequest::POST;
    else if (method == "OPTIONS") return HttpRequest::OPTIONS;
    else throw std::invalid_argument("Invalid HTTP method string: " + method);
}

// Failure categories reported to upload clients
enum class ErrorKind {
    InvalidRequest,
    FileMissing,
    IoFailure,
};

inline const char* to_string(ErrorKind kind) {
    switch(kind) {
        case ErrorKind::InvalidRequest: return "invalid-request";
        case ErrorKind::FileMissing: return "file-missing";
        case ErrorKind::IoFailure: return "io-failure";
        default: return "unknown";
    }
}

inline int http_status(ErrorKind kind) {
    return kind == ErrorKind::IoFailure ? 500 : 400;
}

} // namespace chunkd
