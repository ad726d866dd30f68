#ifndef TELEMETRY_CODEC_H
#define TELEMETRY_CODEC_H

#include "state.h"
#include <cstddef>
#include <cstdint>
#include <string>

// JSON encoding shared by the WebSocket stream and the HTTP API

// One outbound telemetry message: {"id":"<address>","y":12.34,"x":-5.67}
// An empty deviceId is sent as "id":null.
std::string encodeReading(const Reading& reading);

// Everything GET /api/status reports
struct BridgeStatus {
    ConnectionState state = ConnectionState::Disconnected;
    SupervisorStats stats;
    Reading reading;
    std::string deviceAddress;
    std::string deviceName;
    size_t consumers = 0;
    uint32_t nowMs = 0;
    uint32_t nextRetryDelayMs = 0;
};

std::string encodeStatus(const BridgeStatus& status);

#endif // TELEMETRY_CODEC_H
