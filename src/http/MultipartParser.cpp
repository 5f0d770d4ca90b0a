#include "http/MultipartParser.hpp"
#include "http/HttpUtils.hpp"

namespace chunkd {
namespace http {

void MultipartParser::parseContentDisposition(const std::string& value,
                                               std::string& name,
                                               std::string& filename) {
    // "form-data; name="file"; filename="doc.txt"", the leading token has no '='
    auto params = parseHeaderParams(value);
    auto it = params.find("name");
    if (it != params.end()) name = it->second;
    it = params.find("filename");
    if (it != params.end()) filename = it->second;
}

std::string MultipartParser::extractBoundary(const std::string& content_type) {
    auto semicolon = content_type.find(';');
    if (semicolon == std::string::npos) {
        return "";
    }
    auto params = parseHeaderParams(content_type.substr(semicolon + 1));
    auto it = params.find("boundary");
    return it != params.end() ? it->second : "";
}

std::vector<MultipartPart> MultipartParser::parse(const std::string& body,
                                                   const std::string& boundary) {
    std::vector<MultipartPart> parts;
    if (boundary.empty()) return parts;

    const std::string dash = "--" + boundary;
    const std::string marker = "\r\n" + dash;

    // Find first boundary, a preamble before it is ignored
    size_t bline;
    if (body.compare(0, dash.size(), dash) == 0) {
        bline = 0;
    } else {
        size_t m = body.find(marker);
        if (m == std::string::npos) return parts;
        bline = m + 2;
    }

    while (true) {
        // Final boundary "--boundary--"
        const size_t after = bline + dash.size();
        if (after + 2 <= body.size() && body.compare(after, 2, "--") == 0) break;

        size_t line_end = body.find("\r\n", after);
        if (line_end == std::string::npos) break;

        size_t headers_start = line_end + 2;
        size_t headers_end;
        if (body.compare(headers_start, 2, "\r\n") == 0) {
            headers_end = headers_start;   // part without headers
        } else {
            headers_end = body.find("\r\n\r\n", headers_start);
            if (headers_end == std::string::npos) break;
            headers_end += 2;
        }

        MultipartPart part;

        size_t hpos = headers_start;
        while (hpos < headers_end) {
            size_t eol = body.find("\r\n", hpos);
            if (eol == std::string::npos || eol >= headers_end) break;

            std::string hline = body.substr(hpos, eol - hpos);
            hpos = eol + 2;

            auto colon = hline.find(':');
            if (colon == std::string::npos) continue;

            std::string hname = hline.substr(0, colon);
            std::string hvalue = hline.substr(colon + 1);
            trim(hname);
            trim(hvalue);
            toLower(hname);

            if (hname == "content-disposition") {
                parseContentDisposition(hvalue, part.name, part.filename);
            } else if (hname == "content-type") {
                part.content_type = hvalue;
            }
        }

        size_t content_start = headers_end + 2;
        size_t next_marker = body.find(marker, content_start);
        if (next_marker == std::string::npos) {
            // Truncated body: no closing boundary, the part is dropped
            break;
        }

        part.data = body.substr(content_start, next_marker - content_start);
        parts.push_back(std::move(part));

        bline = next_marker + 2;
    }

    return parts;
}

} // namespace http
} // namespace chunkd
