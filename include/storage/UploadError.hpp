#pragma once

#include <stdexcept>
#include <string>
#include "const/rest_enums.hpp"

namespace chunkd {

/**
 * Failure raised by the chunk store and the merge engine.
 * what() is the short summary shown to clients, detail() the underlying cause.
 */
class UploadError : public std::runtime_error {
public:
    UploadError(ErrorKind kind, const std::string& message, const std::string& detail = "")
        : std::runtime_error(message), kind_(kind), detail_(detail) {}

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace chunkd
