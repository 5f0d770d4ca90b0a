#pragma once

#include <string>
#include <unordered_map>

namespace chunkd {
namespace http {

// Strips spaces, tabs and trailing CR/LF
void trim(std::string& s);

void toLower(std::string& s);

// Decodes %XX escapes and '+' as space; malformed escapes are kept literally
std::string urlDecode(const std::string& s);

// Parses "a=1&b=2" into a map; later duplicates overwrite earlier ones
std::unordered_map<std::string, std::string> parseUrlEncoded(const std::string& s);

// Parses "; key=value; key2="value"" parameter lists from header values.
// Keys are lowercased, surrounding quotes are removed from values.
std::unordered_map<std::string, std::string> parseHeaderParams(const std::string& s);

// Splits "/path?query" into path and decoded query parameters
void splitTarget(const std::string& target,
                 std::string& path,
                 std::unordered_map<std::string, std::string>& query);

// Strict decimal parse of a whole string; false on junk, sign only or overflow
bool parseInteger(const std::string& s, long long& out);

} // namespace http
} // namespace chunkd
