#ifndef BROADCAST_HUB_H
#define BROADCAST_HUB_H

#include "latest_value_cache.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

// Fan-out of the latest reading to every attached consumer.
//
// Consumers are keyed by an id chosen by the transport (the WebSocket client
// number on the firmware). Each one is a send function returning false when
// its transport is closed or broken; such a consumer is dropped and nobody
// else notices. pump() is called from the transport task: it drains the
// cache, encodes the reading once and hands the same text to every consumer.
// Sends happen outside the consumer lock, so attach()/detach() from the
// transport's event handler never wait on a slow send. Sends run one after
// another on the calling task: a stalled send delays the consumers after it,
// up to the transport's own timeout.
class BroadcastHub {
public:
    using SendFn = std::function<bool(const std::string& payload)>;

    explicit BroadcastHub(LatestValueCache& cache);

    // Add a consumer, or replace the sink of an existing id.
    // Returns true if the id was not attached before.
    bool attach(uint32_t id, SendFn send);

    // Returns false if the id was not attached
    bool detach(uint32_t id);

    // Drop every consumer (shutdown)
    void detachAll();

    size_t consumerCount() const;

    // Deliver the pending reading, if any. Returns true when something was
    // broadcast. With no consumers the pending value is left in the cache.
    bool pump();

    // Send one payload to every consumer, removing those whose send fails.
    // Returns the number of successful deliveries.
    size_t broadcast(const std::string& payload);

    uint32_t broadcastCount() const;
    uint32_t removedCount() const;

private:
    struct Consumer {
        SendFn send;
        uint32_t generation;
    };

    LatestValueCache& cache;
    mutable std::mutex mutex;
    std::map<uint32_t, Consumer> consumers;
    uint32_t nextGeneration = 1;
    uint32_t broadcasts = 0;
    uint32_t removed = 0;
};

#endif // BROADCAST_HUB_H
