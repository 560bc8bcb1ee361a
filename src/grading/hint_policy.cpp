#include "grading/hint_policy.hpp"

#include <algorithm>

namespace gradebox::grading {

int UnlockedTier(int attempts, int interval, int total_hints) {
    if (attempts <= 0 || interval <= 0 || total_hints <= 0) {
        return 0;
    }
    return std::min(attempts / interval, total_hints);
}

std::optional<int> NextUnlockAttempt(int attempts, int interval, int total_hints) {
    if (interval <= 0 || total_hints <= 0) {
        return std::nullopt;
    }
    const int tier = UnlockedTier(attempts, interval, total_hints);
    if (tier >= total_hints) {
        return std::nullopt;
    }
    return (tier + 1) * interval;
}

}  // namespace gradebox::grading
