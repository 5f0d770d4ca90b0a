#include "http/HttpUtils.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace chunkd {
namespace http {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

void trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

std::string urlDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i] == '+' ? ' ' : s[i]);
    }
    return out;
}

std::unordered_map<std::string, std::string> parseUrlEncoded(const std::string& s) {
    std::unordered_map<std::string, std::string> result;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t amp = s.find('&', pos);
        std::string kv = s.substr(pos, (amp == std::string::npos ? s.size() : amp) - pos);
        pos = (amp == std::string::npos) ? s.size() + 1 : amp + 1;
        if (kv.empty()) continue;

        auto eq = kv.find('=');
        std::string key = urlDecode(eq == std::string::npos ? kv : kv.substr(0, eq));
        std::string value = (eq == std::string::npos) ? "" : urlDecode(kv.substr(eq + 1));
        if (!key.empty()) result[key] = value;
    }
    return result;
}

std::unordered_map<std::string, std::string> parseHeaderParams(const std::string& s) {
    std::unordered_map<std::string, std::string> result;
    size_t pos = 0;
    while (pos < s.size()) {
        size_t next = s.find(';', pos);
        std::string token = s.substr(pos, (next == std::string::npos ? s.size() : next) - pos);
        pos = (next == std::string::npos ? s.size() : next + 1);

        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }
        result[key] = val;
    }
    return result;
}

void splitTarget(const std::string& target,
                 std::string& path,
                 std::unordered_map<std::string, std::string>& query) {
    auto qm = target.find('?');
    path = (qm == std::string::npos) ? target : target.substr(0, qm);
    query = (qm == std::string::npos) ? std::unordered_map<std::string, std::string>()
                                      : parseUrlEncoded(target.substr(qm + 1));
}

bool parseInteger(const std::string& s, long long& out) {
    std::string v = s;
    trim(v);
    if (v.empty()) return false;

    size_t start = (v[0] == '-' || v[0] == '+') ? 1 : 0;
    if (start == v.size()) return false;
    for (size_t i = start; i < v.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(v[i]))) return false;
    }

    errno = 0;
    long long parsed = std::strtoll(v.c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    out = parsed;
    return true;
}

} // namespace http
} // namespace chunkd
