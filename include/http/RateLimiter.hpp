#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkd {
namespace http {

/**
 * Fixed-window request limiter keyed by client address.
 * A key may make `maxRequests` requests per window; the window starts with
 * the key's first request. maxRequests == 0 disables limiting.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(unsigned maxRequests, std::chrono::seconds window);

    // Records one request; false when the key is over its budget
    bool allow(const std::string& key);
    bool allow(const std::string& key, Clock::time_point now);

    // Time until the key's current window expires, zero when unlimited
    std::chrono::seconds retryAfter(const std::string& key, Clock::time_point now);

private:
    struct Window {
        Clock::time_point start;
        unsigned count = 0;
    };

    unsigned maxRequests_;
    std::chrono::seconds window_;
    std::mutex mutex_;
    std::unordered_map<std::string, Window> windows_;
    Clock::time_point lastPurge_;

    void purgeExpired(Clock::time_point now);
};

} // namespace http
} // namespace chunkd
