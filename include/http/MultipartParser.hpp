#pragma once

#include <string>
#include <vector>

namespace chunkd {
namespace http {

/**
 * Represents a single part of a multipart/form-data request
 */
struct MultipartPart {
    std::string name;           // form field name
    std::string filename;       // original filename (empty if not a file)
    std::string content_type;   // MIME type of the content
    std::string data;           // raw content bytes

    bool isFile() const { return !filename.empty(); }
};

/**
 * Parser for multipart/form-data HTTP requests
 */
class MultipartParser {
public:
    /**
     * Parse multipart body into structured parts
     * @param body Raw HTTP body
     * @param boundary Multipart boundary string (without --)
     * @return Vector of parsed parts, empty if the body has no boundary line
     */
    static std::vector<MultipartPart> parse(const std::string& body, const std::string& boundary);

    /**
     * Extract boundary from Content-Type header value
     * @param content_type Full Content-Type header value
     * @return Boundary string or empty if not found
     */
    static std::string extractBoundary(const std::string& content_type);

private:
    static void parseContentDisposition(const std::string& value, std::string& name, std::string& filename);
};

} // namespace http
} // namespace chunkd
