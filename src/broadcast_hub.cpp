#include "broadcast_hub.h"
#include "logger.h"
#include "telemetry_codec.h"
#include <exception>
#include <utility>
#include <vector>

BroadcastHub::BroadcastHub(LatestValueCache& cache) : cache(cache) {}

bool BroadcastHub::attach(uint32_t id, SendFn send) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = consumers.find(id);
    bool added = (it == consumers.end());
    consumers[id] = Consumer{std::move(send), nextGeneration++};
    return added;
}

bool BroadcastHub::detach(uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex);
    return consumers.erase(id) > 0;
}

void BroadcastHub::detachAll() {
    std::lock_guard<std::mutex> lock(mutex);
    consumers.clear();
}

size_t BroadcastHub::consumerCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return consumers.size();
}

bool BroadcastHub::pump() {
    if (consumerCount() == 0) {
        return false;
    }

    Reading reading;
    if (!cache.takePending(reading)) {
        return false;
    }

    broadcast(encodeReading(reading));
    return true;
}

size_t BroadcastHub::broadcast(const std::string& payload) {
    struct Target {
        uint32_t id;
        uint32_t generation;
        SendFn send;
    };

    // Snapshot the set so sends run without holding the lock
    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mutex);
        targets.reserve(consumers.size());
        for (const auto& entry : consumers) {
            targets.push_back(Target{entry.first, entry.second.generation, entry.second.send});
        }
        broadcasts++;
    }

    size_t delivered = 0;
    std::vector<Target> failed;
    for (Target& target : targets) {
        bool ok = false;
        try {
            ok = target.send(payload);
        } catch (const std::exception& e) {
            LOG_WARNF("[Hub] Consumer #%u send threw: %s", target.id, e.what());
        }
        if (ok) {
            delivered++;
        } else {
            failed.push_back(target);
        }
    }

    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const Target& target : failed) {
            auto it = consumers.find(target.id);
            // A consumer re-attached under the same id while we were sending
            // keeps its new sink
            if (it != consumers.end() && it->second.generation == target.generation) {
                consumers.erase(it);
                removed++;
                LOG_WARNF("[Hub] Consumer #%u send failed, removed", target.id);
            }
        }
    }
    return delivered;
}

uint32_t BroadcastHub::broadcastCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return broadcasts;
}

uint32_t BroadcastHub::removedCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return removed;
}
