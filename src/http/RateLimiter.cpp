#include "http/RateLimiter.hpp"

namespace chunkd {
namespace http {

RateLimiter::RateLimiter(unsigned maxRequests, std::chrono::seconds window)
    : maxRequests_(maxRequests), window_(window), lastPurge_(Clock::now()) {}

bool RateLimiter::allow(const std::string& key) {
    return allow(key, Clock::now());
}

bool RateLimiter::allow(const std::string& key, Clock::time_point now) {
    if (maxRequests_ == 0) return true;

    std::lock_guard<std::mutex> lock(mutex_);
    purgeExpired(now);

    auto& w = windows_[key];
    if (w.count == 0 || now - w.start >= window_) {
        w.start = now;
        w.count = 0;
    }
    if (w.count >= maxRequests_) {
        return false;
    }
    ++w.count;
    return true;
}

std::chrono::seconds RateLimiter::retryAfter(const std::string& key, Clock::time_point now) {
    if (maxRequests_ == 0) return std::chrono::seconds(0);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(key);
    if (it == windows_.end() || now - it->second.start >= window_) {
        return std::chrono::seconds(0);
    }
    auto left = window_ - (now - it->second.start);
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(left);
    if (secs < left) ++secs;   // round up
    return secs;
}

void RateLimiter::purgeExpired(Clock::time_point now) {
    if (now - lastPurge_ < window_) return;
    lastPurge_ = now;
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (now - it->second.start >= window_) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace http
} // namespace chunkd
