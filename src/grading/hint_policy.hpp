#pragma once

#include <optional>

namespace gradebox::grading {

// Highest hint tier visible after `attempts` attempts: one more tier every
// `interval` attempts, capped at `total_hints`.
int UnlockedTier(int attempts, int interval, int total_hints);

// Attempt number at which the next tier unlocks, or nullopt once every tier
// is visible.
std::optional<int> NextUnlockAttempt(int attempts, int interval, int total_hints);

}  // namespace gradebox::grading
