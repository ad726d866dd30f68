#include "telemetry_codec.h"
#include <ArduinoJson.h>

static void writeReading(JsonObject obj, const Reading& reading) {
    if (reading.deviceId.empty()) {
        obj["id"] = nullptr;
    } else {
        obj["id"] = reading.deviceId;
    }
    obj["y"] = reading.y;
    obj["x"] = reading.x;
}

std::string encodeReading(const Reading& reading) {
    StaticJsonDocument<128> doc;
    writeReading(doc.to<JsonObject>(), reading);

    std::string json;
    serializeJson(doc, json);
    return json;
}

std::string encodeStatus(const BridgeStatus& status) {
    DynamicJsonDocument doc(1024);
    const SupervisorStats& stats = status.stats;

    doc["state"] = connectionStateName(status.state);
    doc["uptimeMs"] = status.nowMs - stats.startMs;
    doc["consumers"] = status.consumers;

    JsonObject device = doc.createNestedObject("device");
    if (status.deviceAddress.empty()) {
        device["address"] = nullptr;
        device["name"] = nullptr;
    } else {
        device["address"] = status.deviceAddress;
        device["name"] = status.deviceName;
    }

    // Session uptime only makes sense while a session is up
    long sessionMs = -1;
    if (status.state == ConnectionState::Connected) {
        sessionMs = status.nowMs - stats.sessionStartMs;
    }
    long dataAgeMs = -1;
    if (stats.lastDataMs > 0) {
        dataAgeMs = status.nowMs - stats.lastDataMs;
    }

    JsonObject s = doc.createNestedObject("stats");
    s["totalConnections"] = stats.totalConnections;
    s["totalDisconnections"] = stats.totalDisconnections;
    s["notificationsReceived"] = stats.notificationsReceived;
    s["framesDecoded"] = stats.framesDecoded;
    s["framesDropped"] = stats.framesDropped;
    s["keepalivesSent"] = stats.keepalivesSent;
    s["startCommandsSent"] = stats.startCommandsSent;
    s["staleWarnings"] = stats.staleWarnings;
    s["failedAttempts"] = stats.failedAttempts;
    s["sessionMs"] = sessionMs;
    s["lastDataAgeMs"] = dataAgeMs;
    s["nextRetryDelayMs"] = status.nextRetryDelayMs;

    writeReading(doc.createNestedObject("reading"), status.reading);

    std::string json;
    serializeJson(doc, json);
    return json;
}
