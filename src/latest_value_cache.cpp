#include "latest_value_cache.h"
#include <utility>

void LatestValueCache::update(const std::string& deviceId, double y, double x) {
    Reading next;
    next.deviceId = deviceId;
    next.y = y;
    next.x = x;

    std::lock_guard<std::mutex> lock(mutex);
    current = std::move(next);
    sequence++;
}

Reading LatestValueCache::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

bool LatestValueCache::takePending(Reading& out) {
    std::lock_guard<std::mutex> lock(mutex);
    if (sequence == drainedSequence) {
        return false;
    }
    drainedSequence = sequence;
    out = current;
    return true;
}

bool LatestValueCache::hasPending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sequence != drainedSequence;
}

uint32_t LatestValueCache::updateCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sequence;
}

void LatestValueCache::reset() {
    std::lock_guard<std::mutex> lock(mutex);
    current = Reading();
    sequence = 0;
    drainedSequence = 0;
}
