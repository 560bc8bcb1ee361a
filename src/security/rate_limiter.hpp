#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace gradebox::security {

struct RateLimitResult {
    bool allowed = false;
    int limit = 0;
    int remaining = 0;
    long long reset_at_ms = 0;
};

// Fixed-window counter per key. A burst of up to 2 x limit across a window
// boundary is accepted.
class RateLimiter {
public:
    using Clock = std::function<long long()>;

    explicit RateLimiter(std::size_t cleanup_threshold = 5000, Clock clock = Clock());

    RateLimitResult Allow(const std::string& key, int limit, long long window_ms);
    long long Now() const;
    std::size_t BucketCount() const;

private:
    struct Bucket {
        int count = 0;
        long long reset_at_ms = 0;
    };

    void CleanupExpired(long long now_ms);

    std::size_t cleanup_threshold_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
};

std::string RateLimitKey(const std::string& route, const std::string& identity, const std::string& origin);

std::map<std::string, std::string> RateLimitHeaders(const RateLimitResult& result, long long now_ms);

}  // namespace gradebox::security
