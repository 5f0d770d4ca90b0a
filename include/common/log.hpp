#pragma once

#include <ostream>
#include <string>

namespace chunkd {

// Writes one line with a single insertion so lines from server and merge
// worker threads do not interleave
inline void logLine(std::ostream& out, const std::string& line) {
    out << (line + "\n") << std::flush;
}

} // namespace chunkd
