#include "bridge_config.h"
#include "config.h"
#include <ArduinoJson.h>

static std::vector<uint8_t> commandBytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

BridgeConfig defaultBridgeConfig() {
    BridgeConfig config;

    config.deviceNames = TARGET_DEVICE_NAMES;
    config.targetAddress = TARGET_DEVICE_ADDRESS;
    config.startCommandDeviceNames = START_COMMAND_DEVICE_NAMES;
    config.notifyCapabilityId = NOTIFY_CHARACTERISTIC_UUID;
    config.writeCapabilityId = WRITE_CHARACTERISTIC_UUID;

    config.scanTimeoutSec = SCAN_TIMEOUT_SEC;
    config.scanAttemptsPerCycle = SCAN_ATTEMPTS_PER_CYCLE;
    config.scanRetryPauseMs = SCAN_RETRY_PAUSE_MS;
    config.connectTimeoutSec = CONNECT_TIMEOUT_SEC;
    config.connectSettleMs = CONNECT_SETTLE_MS;

    config.reconnectBaseDelayMs = RECONNECT_BASE_DELAY_MS;
    config.reconnectBackoffFactor = RECONNECT_BACKOFF_FACTOR;
    config.reconnectMaxDelayMs = RECONNECT_MAX_DELAY_MS;
    config.maxReconnectAttempts = MAX_RECONNECT_ATTEMPTS;

    config.startCommand = commandBytes(START_COMMAND);
    config.keepaliveEnabled = KEEPALIVE_ENABLED;
    config.keepaliveIntervalMs = KEEPALIVE_INTERVAL_MS;
    config.keepaliveCommand = commandBytes(KEEPALIVE_COMMAND);

    config.dataTimeoutEnabled = DATA_TIMEOUT_ENABLED;
    config.dataTimeoutMs = DATA_TIMEOUT_MS;
    config.statusReportIntervalMs = STATUS_REPORT_INTERVAL_MS;
    config.frameReassembly = FRAME_REASSEMBLY_ENABLED;
    config.frameBufferLimit = FRAME_BUFFER_LIMIT;

    config.wsPort = WS_PORT;
    config.wsLocalOnly = WS_LOCAL_ONLY;
    config.httpPort = WEB_SERVER_PORT;
    return config;
}

// -----------------------------------------------------------------------------
// JSON overrides
// -----------------------------------------------------------------------------
// Each reader leaves the target alone when the key is absent and fails with a
// message when the key is present with the wrong type.

static bool readUint(JsonObjectConst obj, const char* key, uint32_t& out, std::string& error) {
    if (!obj.containsKey(key)) return true;
    if (!obj[key].is<uint32_t>()) {
        error = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = obj[key].as<uint32_t>();
    return true;
}

static bool readPort(JsonObjectConst obj, const char* key, uint16_t& out, std::string& error) {
    if (!obj.containsKey(key)) return true;
    if (!obj[key].is<uint16_t>() || obj[key].as<uint16_t>() == 0) {
        error = std::string(key) + " must be a port number (1-65535)";
        return false;
    }
    out = obj[key].as<uint16_t>();
    return true;
}

static bool readInt(JsonObjectConst obj, const char* key, int& out, std::string& error) {
    if (!obj.containsKey(key)) return true;
    if (!obj[key].is<int>()) {
        error = std::string(key) + " must be an integer";
        return false;
    }
    out = obj[key].as<int>();
    return true;
}

static bool readFloat(JsonObjectConst obj, const char* key, float& out, std::string& error) {
    if (!obj.containsKey(key)) return true;
    if (!obj[key].is<float>() && !obj[key].is<long>()) {
        error = std::string(key) + " must be a number";
        return false;
    }
    out = obj[key].as<float>();
    return true;
}

static bool readBool(JsonObjectConst obj, const char* key, bool& out, std::string& error) {
    if (!obj.containsKey(key)) return true;
    if (!obj[key].is<bool>()) {
        error = std::string(key) + " must be true or false";
        return false;
    }
    out = obj[key].as<bool>();
    return true;
}

static bool readString(JsonObjectConst obj, const char* key, std::string& out, std::string& error) {
    if (!obj.containsKey(key)) return true;
    if (!obj[key].is<const char*>()) {
        error = std::string(key) + " must be a string";
        return false;
    }
    out = obj[key].as<const char*>();
    return true;
}

static bool readCommand(JsonObjectConst obj, const char* key, std::vector<uint8_t>& out, std::string& error) {
    std::string text;
    if (!obj.containsKey(key)) return true;
    if (!readString(obj, key, text, error)) return false;
    if (text.empty()) {
        error = std::string(key) + " must not be empty";
        return false;
    }
    out = commandBytes(text);
    return true;
}

static bool readStringList(JsonObjectConst obj, const char* key, std::vector<std::string>& out, std::string& error) {
    if (!obj.containsKey(key)) return true;
    if (!obj[key].is<JsonArrayConst>()) {
        error = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (JsonVariantConst v : obj[key].as<JsonArrayConst>()) {
        if (!v.is<const char*>()) {
            error = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(v.as<const char*>());
    }
    out = values;
    return true;
}

bool applyConfigOverrides(const std::string& json, BridgeConfig& config, std::string& error) {
    DynamicJsonDocument doc(2048);
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        error = std::string("invalid JSON: ") + err.c_str();
        return false;
    }
    if (!doc.is<JsonObject>()) {
        error = "config must be a JSON object";
        return false;
    }
    JsonObjectConst obj = doc.as<JsonObjectConst>();

    // Work on a copy so a bad key leaves the caller's config untouched
    BridgeConfig next = config;
    bool ok = readStringList(obj, "deviceNames", next.deviceNames, error)
        && readString(obj, "targetAddress", next.targetAddress, error)
        && readStringList(obj, "startCommandDeviceNames", next.startCommandDeviceNames, error)
        && readString(obj, "notifyCapabilityId", next.notifyCapabilityId, error)
        && readString(obj, "writeCapabilityId", next.writeCapabilityId, error)
        && readUint(obj, "scanTimeoutSec", next.scanTimeoutSec, error)
        && readUint(obj, "scanAttemptsPerCycle", next.scanAttemptsPerCycle, error)
        && readUint(obj, "scanRetryPauseMs", next.scanRetryPauseMs, error)
        && readUint(obj, "connectTimeoutSec", next.connectTimeoutSec, error)
        && readUint(obj, "connectSettleMs", next.connectSettleMs, error)
        && readUint(obj, "reconnectBaseDelayMs", next.reconnectBaseDelayMs, error)
        && readFloat(obj, "reconnectBackoffFactor", next.reconnectBackoffFactor, error)
        && readUint(obj, "reconnectMaxDelayMs", next.reconnectMaxDelayMs, error)
        && readInt(obj, "maxReconnectAttempts", next.maxReconnectAttempts, error)
        && readCommand(obj, "startCommand", next.startCommand, error)
        && readBool(obj, "keepaliveEnabled", next.keepaliveEnabled, error)
        && readUint(obj, "keepaliveIntervalMs", next.keepaliveIntervalMs, error)
        && readCommand(obj, "keepaliveCommand", next.keepaliveCommand, error)
        && readBool(obj, "dataTimeoutEnabled", next.dataTimeoutEnabled, error)
        && readUint(obj, "dataTimeoutMs", next.dataTimeoutMs, error)
        && readUint(obj, "statusReportIntervalMs", next.statusReportIntervalMs, error)
        && readBool(obj, "frameReassembly", next.frameReassembly, error)
        && readUint(obj, "frameBufferLimit", next.frameBufferLimit, error)
        && readPort(obj, "wsPort", next.wsPort, error)
        && readBool(obj, "wsLocalOnly", next.wsLocalOnly, error)
        && readPort(obj, "httpPort", next.httpPort, error);
    if (!ok) {
        return false;
    }

    if (next.deviceNames.empty() && next.targetAddress.empty()) {
        error = "deviceNames must not be empty unless targetAddress is set";
        return false;
    }
    if (next.scanAttemptsPerCycle == 0) {
        error = "scanAttemptsPerCycle must be at least 1";
        return false;
    }
    if (next.keepaliveEnabled && next.keepaliveIntervalMs == 0) {
        error = "keepaliveIntervalMs must be positive when keepalive is enabled";
        return false;
    }

    config = next;
    return true;
}

std::string encodeConfig(const BridgeConfig& config) {
    DynamicJsonDocument doc(2048);

    JsonArray names = doc.createNestedArray("deviceNames");
    for (const std::string& name : config.deviceNames) {
        names.add(name);
    }
    doc["targetAddress"] = config.targetAddress;
    JsonArray startNames = doc.createNestedArray("startCommandDeviceNames");
    for (const std::string& name : config.startCommandDeviceNames) {
        startNames.add(name);
    }
    doc["notifyCapabilityId"] = config.notifyCapabilityId;
    doc["writeCapabilityId"] = config.writeCapabilityId;

    doc["scanTimeoutSec"] = config.scanTimeoutSec;
    doc["scanAttemptsPerCycle"] = config.scanAttemptsPerCycle;
    doc["scanRetryPauseMs"] = config.scanRetryPauseMs;
    doc["connectTimeoutSec"] = config.connectTimeoutSec;
    doc["connectSettleMs"] = config.connectSettleMs;

    doc["reconnectBaseDelayMs"] = config.reconnectBaseDelayMs;
    doc["reconnectBackoffFactor"] = config.reconnectBackoffFactor;
    doc["reconnectMaxDelayMs"] = config.reconnectMaxDelayMs;
    doc["maxReconnectAttempts"] = config.maxReconnectAttempts;

    doc["startCommand"] = std::string(config.startCommand.begin(), config.startCommand.end());
    doc["keepaliveEnabled"] = config.keepaliveEnabled;
    doc["keepaliveIntervalMs"] = config.keepaliveIntervalMs;
    doc["keepaliveCommand"] = std::string(config.keepaliveCommand.begin(), config.keepaliveCommand.end());

    doc["dataTimeoutEnabled"] = config.dataTimeoutEnabled;
    doc["dataTimeoutMs"] = config.dataTimeoutMs;
    doc["statusReportIntervalMs"] = config.statusReportIntervalMs;
    doc["frameReassembly"] = config.frameReassembly;
    doc["frameBufferLimit"] = config.frameBufferLimit;

    doc["wsPort"] = config.wsPort;
    doc["wsLocalOnly"] = config.wsLocalOnly;
    doc["httpPort"] = config.httpPort;

    std::string json;
    serializeJson(doc, json);
    return json;
}
