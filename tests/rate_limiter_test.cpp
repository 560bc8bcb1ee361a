#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "security/rate_limiter.hpp"

using gradebox::security::RateLimiter;
using gradebox::security::RateLimitHeaders;
using gradebox::security::RateLimitKey;

namespace {

struct FakeClock {
    long long now_ms = 1'000'000;
    RateLimiter::Clock AsClock() {
        return [this]() { return now_ms; };
    }
};

}  // namespace

TEST(RateLimiterTest, RejectsRequestAfterLimit) {
    FakeClock clock;
    RateLimiter limiter(5000, clock.AsClock());
    for (int i = 0; i < 3; ++i) {
        const auto result = limiter.Allow("run:ada:1.2.3.4", 3, 60000);
        EXPECT_TRUE(result.allowed);
        EXPECT_EQ(result.remaining, 2 - i);
    }
    const auto rejected = limiter.Allow("run:ada:1.2.3.4", 3, 60000);
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.remaining, 0);
    EXPECT_EQ(rejected.reset_at_ms, clock.now_ms + 60000);
}

TEST(RateLimiterTest, KeysAreIndependent) {
    FakeClock clock;
    RateLimiter limiter(5000, clock.AsClock());
    EXPECT_TRUE(limiter.Allow("a", 1, 1000).allowed);
    EXPECT_FALSE(limiter.Allow("a", 1, 1000).allowed);
    EXPECT_TRUE(limiter.Allow("b", 1, 1000).allowed);
}

TEST(RateLimiterTest, WindowExpiryStartsFreshBucket) {
    FakeClock clock;
    RateLimiter limiter(5000, clock.AsClock());
    EXPECT_TRUE(limiter.Allow("k", 1, 1000).allowed);
    EXPECT_FALSE(limiter.Allow("k", 1, 1000).allowed);
    clock.now_ms += 1000;
    const auto result = limiter.Allow("k", 1, 1000);
    EXPECT_TRUE(result.allowed);
    EXPECT_EQ(result.reset_at_ms, clock.now_ms + 1000);
}

TEST(RateLimiterTest, CleanupRemovesExpiredBucketsOnceThresholdReached) {
    FakeClock clock;
    RateLimiter limiter(3, clock.AsClock());
    limiter.Allow("a", 5, 100);
    limiter.Allow("b", 5, 100);
    limiter.Allow("c", 5, 100);
    EXPECT_EQ(limiter.BucketCount(), 3u);
    clock.now_ms += 200;
    limiter.Allow("d", 5, 100);
    EXPECT_EQ(limiter.BucketCount(), 1u);
}

TEST(RateLimiterTest, ConcurrentCallersNeverExceedLimit) {
    RateLimiter limiter;
    constexpr int kLimit = 50;
    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                if (limiter.Allow("shared", kLimit, 60000).allowed) {
                    ++allowed;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(allowed.load(), kLimit);
}

TEST(RateLimiterTest, HeadersReportCeilingSeconds) {
    gradebox::security::RateLimitResult result{true, 20, 7, 10'500};
    const auto headers = RateLimitHeaders(result, 9'000);
    EXPECT_EQ(headers.at("X-RateLimit-Limit"), "20");
    EXPECT_EQ(headers.at("X-RateLimit-Remaining"), "7");
    EXPECT_EQ(headers.at("X-RateLimit-Reset"), "2");
    EXPECT_EQ(RateLimitHeaders(result, 20'000).at("X-RateLimit-Reset"), "0");
}

TEST(RateLimiterTest, KeyCombinesRouteIdentityAndOrigin) {
    EXPECT_EQ(RateLimitKey("run", "ada", "10.0.0.1"), "run:ada:10.0.0.1");
}
