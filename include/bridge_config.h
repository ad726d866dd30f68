#ifndef BRIDGE_CONFIG_H
#define BRIDGE_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

// Runtime configuration of the bridge. Defaults come from config.h; at boot
// the firmware applies /bridge.json on top (see applyConfigOverrides).

struct BridgeConfig {
    // Sensor selection
    std::vector<std::string> deviceNames;            // Accepted name substrings, most specific first
    std::string targetAddress;                       // "" = any matching device
    std::vector<std::string> startCommandDeviceNames;
    std::string notifyCapabilityId;
    std::string writeCapabilityId;

    // Discovery / connect
    uint32_t scanTimeoutSec = 0;
    uint32_t scanAttemptsPerCycle = 0;
    uint32_t scanRetryPauseMs = 0;
    uint32_t connectTimeoutSec = 0;
    uint32_t connectSettleMs = 0;

    // Reconnect backoff
    uint32_t reconnectBaseDelayMs = 0;
    float reconnectBackoffFactor = 1.0f;
    uint32_t reconnectMaxDelayMs = 0;
    int maxReconnectAttempts = -1;                   // -1 = unbounded

    // Commands
    std::vector<uint8_t> startCommand;
    bool keepaliveEnabled = false;
    uint32_t keepaliveIntervalMs = 0;
    std::vector<uint8_t> keepaliveCommand;

    // Supervision
    bool dataTimeoutEnabled = false;
    uint32_t dataTimeoutMs = 0;
    uint32_t statusReportIntervalMs = 0;
    bool frameReassembly = true;
    uint32_t frameBufferLimit = 0;

    // Transport front
    uint16_t wsPort = 0;
    bool wsLocalOnly = true;
    uint16_t httpPort = 0;
};

// Configuration built from the config.h defaults
BridgeConfig defaultBridgeConfig();

// Apply a JSON object of overrides (same field names as encodeConfig()).
// Unknown keys are ignored. On a parse or type error the config is left
// untouched, error describes the problem and false is returned.
bool applyConfigOverrides(const std::string& json, BridgeConfig& config, std::string& error);

// Effective configuration as JSON for GET /api/config
std::string encodeConfig(const BridgeConfig& config);

#endif // BRIDGE_CONFIG_H
