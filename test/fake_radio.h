#ifndef FAKE_RADIO_H
#define FAKE_RADIO_H

#include "bridge_config.h"
#include "connection_supervisor.h"
#include "radio.h"
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Manual millisecond clock shared by the supervisor under test
struct FakeClock {
    uint32_t now = 1000;

    void advance(uint32_t ms) { now += ms; }

    ConnectionSupervisor::Clock source() {
        return [this]() { return now; };
    }
};

// Observable side of one fake session. Outlives the session so tests can
// inspect what happened after the supervisor released it.
struct FakeSessionState {
    std::vector<Capability> capabilities;
    bool alive = true;
    bool subscribeResult = true;
    bool writeResult = true;
    int closeCalls = 0;
    int enumerateCalls = 0;
    std::string subscribedId;
    std::vector<std::pair<std::string, std::string>> writes;  // capability id, payload
    NotifyHandler notify;
    DisconnectHandler onDisconnect;

    // Radio task delivering one notification
    void deliver(const std::string& payload) {
        if (notify) {
            notify(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
        }
    }

    // Peer dropping the link
    void dropLink() {
        alive = false;
        if (onDisconnect) {
            onDisconnect();
        }
    }

    size_t writesOf(const std::string& payload) const {
        size_t count = 0;
        for (const auto& w : writes) {
            if (w.second == payload) count++;
        }
        return count;
    }
};

class FakeSession : public RadioSession {
public:
    explicit FakeSession(std::shared_ptr<FakeSessionState> state) : state(std::move(state)) {}

    std::vector<Capability> enumerateCapabilities() override {
        state->enumerateCalls++;
        return state->capabilities;
    }

    bool subscribe(const std::string& id, NotifyHandler handler) override {
        if (!state->subscribeResult) return false;
        state->subscribedId = id;
        state->notify = std::move(handler);
        return true;
    }

    bool write(const std::string& id, const std::vector<uint8_t>& data) override {
        if (!state->writeResult) return false;
        state->writes.emplace_back(id, std::string(data.begin(), data.end()));
        return true;
    }

    void close() override {
        state->closeCalls++;
        state->alive = false;
        state->notify = nullptr;
    }

    bool isAlive() const override { return state->alive; }

    void setDisconnectHandler(DisconnectHandler handler) override {
        state->onDisconnect = std::move(handler);
    }

private:
    std::shared_ptr<FakeSessionState> state;
};

class FakeScanner : public DeviceScanner {
public:
    // Returned by successive scans; once exhausted every scan returns `fallback`
    std::deque<std::vector<DeviceHandle>> results;
    std::vector<DeviceHandle> fallback;
    int scans = 0;

    std::vector<DeviceHandle> scan(uint32_t timeoutSec) override {
        (void)timeoutSec;
        scans++;
        if (!results.empty()) {
            std::vector<DeviceHandle> next = results.front();
            results.pop_front();
            return next;
        }
        return fallback;
    }
};

class FakeLink : public RadioLink {
public:
    bool succeed = true;
    int opens = 0;
    DeviceHandle lastDevice;
    std::vector<Capability> capabilities;
    std::vector<std::shared_ptr<FakeSessionState>> sessions;

    std::unique_ptr<RadioSession> open(const DeviceHandle& device, uint32_t timeoutSec) override {
        (void)timeoutSec;
        opens++;
        lastDevice = device;
        if (!succeed) return nullptr;

        auto state = std::make_shared<FakeSessionState>();
        state->capabilities = capabilities;
        sessions.push_back(state);
        return std::make_unique<FakeSession>(state);
    }

    std::shared_ptr<FakeSessionState> current() const {
        return sessions.empty() ? nullptr : sessions.back();
    }
};

inline DeviceHandle makeDevice(const std::string& name, const std::string& address, int rssi = -60) {
    DeviceHandle device;
    device.name = name;
    device.address = address;
    device.rssi = rssi;
    return device;
}

// Nordic UART characteristics as a KIRIRI sensor exposes them. The UUIDs are
// upper case on purpose: matching must ignore case.
inline std::vector<Capability> kiririCapabilities() {
    return {
        {"00002A00-0000-1000-8000-00805F9B34FB", CAP_READ},
        {"6E400002-B5A3-F393-E0A9-E50E24DCCA9E", CAP_WRITE | CAP_WRITE_NO_RESPONSE},
        {"6E400003-B5A3-F393-E0A9-E50E24DCCA9E", CAP_NOTIFY},
    };
}

// Defaults with the timers tests rely on spelled out
inline BridgeConfig testConfig() {
    BridgeConfig config = defaultBridgeConfig();
    config.deviceNames = {"KIRIRI01", "KIRIRI02", "KIRIRI03", "KIRI"};
    config.targetAddress = "";
    config.startCommandDeviceNames = {"KIRIRI01"};
    config.scanTimeoutSec = 10;
    config.scanAttemptsPerCycle = 3;
    config.scanRetryPauseMs = 2000;
    config.connectSettleMs = 2000;
    config.reconnectBaseDelayMs = 5000;
    config.reconnectBackoffFactor = 1.5f;
    config.reconnectMaxDelayMs = 60000;
    config.maxReconnectAttempts = -1;
    config.keepaliveEnabled = true;
    config.keepaliveIntervalMs = 15000;
    config.dataTimeoutEnabled = true;
    config.dataTimeoutMs = 60000;
    config.statusReportIntervalMs = 30000;
    config.frameReassembly = true;
    config.frameBufferLimit = 64;
    return config;
}

// Step the supervisor on a 10 ms tick until it reaches `want`. The clock is
// left at the instant of the transition. Returns false if it does not get
// there within maxSteps.
inline bool runUntil(ConnectionSupervisor& supervisor, FakeClock& clock, ConnectionState want,
                     int maxSteps = 100000) {
    if (supervisor.state() == want) return true;
    for (int i = 0; i < maxSteps; i++) {
        supervisor.step();
        if (supervisor.state() == want) return true;
        clock.advance(10);
    }
    return false;
}

#endif // FAKE_RADIO_H
