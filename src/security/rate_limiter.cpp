#include "security/rate_limiter.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace gradebox::security {

RateLimiter::RateLimiter(std::size_t cleanup_threshold, Clock clock)
    : cleanup_threshold_(cleanup_threshold),
      clock_(clock ? std::move(clock) : Clock(&utils::NowMs)) {}

long long RateLimiter::Now() const {
    return clock_();
}

std::size_t RateLimiter::BucketCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

void RateLimiter::CleanupExpired(long long now_ms) {
    if (buckets_.size() < cleanup_threshold_) {
        return;
    }
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (it->second.reset_at_ms <= now_ms) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
}

RateLimitResult RateLimiter::Allow(const std::string& key, int limit, long long window_ms) {
    const auto now_ms = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    CleanupExpired(now_ms);

    auto it = buckets_.find(key);
    if (it == buckets_.end() || it->second.reset_at_ms <= now_ms) {
        const auto reset_at_ms = now_ms + window_ms;
        if (limit <= 0) {
            return RateLimitResult{false, limit, 0, reset_at_ms};
        }
        buckets_[key] = Bucket{1, reset_at_ms};
        return RateLimitResult{true, limit, std::max(limit - 1, 0), reset_at_ms};
    }

    auto& bucket = it->second;
    if (bucket.count >= limit) {
        return RateLimitResult{false, limit, 0, bucket.reset_at_ms};
    }
    ++bucket.count;
    return RateLimitResult{true, limit, std::max(limit - bucket.count, 0), bucket.reset_at_ms};
}

std::string RateLimitKey(const std::string& route, const std::string& identity, const std::string& origin) {
    return route + ":" + identity + ":" + origin;
}

std::map<std::string, std::string> RateLimitHeaders(const RateLimitResult& result, long long now_ms) {
    const auto remaining_ms = result.reset_at_ms - now_ms;
    // Ceiling division, never negative.
    const long long reset_seconds = remaining_ms <= 0 ? 0 : (remaining_ms + 999) / 1000;
    return {
        {"X-RateLimit-Limit", std::to_string(result.limit)},
        {"X-RateLimit-Remaining", std::to_string(result.remaining)},
        {"X-RateLimit-Reset", std::to_string(reset_seconds)}
    };
}

}  // namespace gradebox::security
