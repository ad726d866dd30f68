#ifndef BACKOFF_POLICY_H
#define BACKOFF_POLICY_H

#include <cstdint>

// Retry delay policy shared by every failure path of the supervisor.
//
// Each failed attempt cycle calls next(): the first delay is the base, every
// following one is multiplied by the factor and clamped to the ceiling. A
// successful connection calls reset(). With a positive attempt cap, next()
// refuses once that many consecutive failures have been recorded.
class BackoffPolicy {
public:
    BackoffPolicy(uint32_t baseDelayMs, float factor, uint32_t maxDelayMs, int maxAttempts = -1);

    // Record a failed attempt. Returns false when the attempt cap is reached,
    // otherwise stores the delay to wait before the next attempt.
    bool next(uint32_t& delayMs);

    // Back to the base delay and zero attempts
    void reset();

    uint32_t attempts() const { return failures; }

    // Delay the next call to next() would hand out
    uint32_t pendingDelayMs() const { return currentDelayMs; }

    bool unbounded() const { return maxAttempts <= 0; }
    int attemptCap() const { return maxAttempts; }

private:
    uint32_t baseDelayMs;
    float factor;
    uint32_t maxDelayMs;
    int maxAttempts;

    uint32_t currentDelayMs;
    uint32_t failures = 0;
};

#endif // BACKOFF_POLICY_H
