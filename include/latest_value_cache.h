#ifndef LATEST_VALUE_CACHE_H
#define LATEST_VALUE_CACHE_H

#include "state.h"
#include <cstdint>
#include <mutex>
#include <string>

// Most recent reading, last value wins.
//
// One writer (the supervisor's notification path), many readers (hub, web
// API). The whole Reading is swapped under a lock so readers never see a y
// from one frame and an x from another. update() raises a pending flag;
// takePending() consumes it, so any number of updates between two drains are
// delivered once, as the newest value.
class LatestValueCache {
public:
    void update(const std::string& deviceId, double y, double x);

    Reading snapshot() const;

    // Returns true and the current reading if an update arrived since the
    // last call, false otherwise
    bool takePending(Reading& out);

    bool hasPending() const;

    // Total number of update() calls
    uint32_t updateCount() const;

    // Back to the startup value (no device, zero angles, nothing pending)
    void reset();

private:
    mutable std::mutex mutex;
    Reading current;
    uint32_t sequence = 0;
    uint32_t drainedSequence = 0;
};

#endif // LATEST_VALUE_CACHE_H
