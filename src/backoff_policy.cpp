#include "backoff_policy.h"
#include <algorithm>

BackoffPolicy::BackoffPolicy(uint32_t baseDelayMs, float factor, uint32_t maxDelayMs, int maxAttempts)
    : baseDelayMs(baseDelayMs),
      factor(factor < 1.0f ? 1.0f : factor),
      maxDelayMs(maxDelayMs),
      maxAttempts(maxAttempts),
      currentDelayMs(std::min(baseDelayMs, maxDelayMs)) {}

bool BackoffPolicy::next(uint32_t& delayMs) {
    failures++;
    if (maxAttempts > 0 && failures >= static_cast<uint32_t>(maxAttempts)) {
        return false;
    }

    delayMs = currentDelayMs;

    // Grow in double to avoid overflow before clamping
    double grown = static_cast<double>(currentDelayMs) * factor;
    currentDelayMs = grown >= maxDelayMs ? maxDelayMs : static_cast<uint32_t>(grown);
    return true;
}

void BackoffPolicy::reset() {
    failures = 0;
    currentDelayMs = std::min(baseDelayMs, maxDelayMs);
}
