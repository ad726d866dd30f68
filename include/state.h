#ifndef STATE_H
#define STATE_H

#include <cstdint>
#include <string>

// =============================================================================
// Bridge State - Data Model
// =============================================================================
// Value types shared by the supervisor, the cache, the hub and the web API.
// Nothing here is global: each owner (LatestValueCache, ConnectionSupervisor)
// holds its own instance and hands out copies.
// =============================================================================

// -----------------------------------------------------------------------------
// Sensor Reading
// -----------------------------------------------------------------------------
// Posture angles in degrees, decoded from centidegree integers on the wire.
// An empty deviceId means no device has produced a reading yet (JSON null).

struct Reading {
    std::string deviceId;
    double y = 0.0;   // forward/back
    double x = 0.0;   // left/right
};

// -----------------------------------------------------------------------------
// Connection Lifecycle
// -----------------------------------------------------------------------------

enum class ConnectionState : uint8_t {
    Disconnected,
    Scanning,
    Connecting,
    Discovering,
    Connected,
    Reconnecting,
    Failed        // Terminal: reconnect attempt cap exhausted
};

const char* connectionStateName(ConnectionState state);

// -----------------------------------------------------------------------------
// Supervisor Statistics
// -----------------------------------------------------------------------------
// Snapshot returned by ConnectionSupervisor::stats(). Times are millis().

struct SupervisorStats {
    uint32_t startMs = 0;              // When start() was called
    uint32_t totalConnections = 0;     // Successful Discovering -> Connected
    uint32_t totalDisconnections = 0;  // Detected link losses
    uint32_t notificationsReceived = 0;
    uint32_t framesDecoded = 0;
    uint32_t framesDropped = 0;        // Malformed / oversize input
    uint32_t keepalivesSent = 0;
    uint32_t startCommandsSent = 0;
    uint32_t staleWarnings = 0;
    uint32_t failedAttempts = 0;       // Consecutive failed cycles since last Connected
    uint32_t lastDataMs = 0;           // 0 = no frame decoded yet
    uint32_t sessionStartMs = 0;       // Start of the current Connected session
};

#endif // STATE_H
