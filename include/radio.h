#ifndef RADIO_H
#define RADIO_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// =============================================================================
// Radio collaborators
// =============================================================================
// The supervisor only talks to the sensor through these interfaces. The
// firmware implements them with NimBLE (ble_radio.h); tests use fakes.
// =============================================================================

// A device seen during discovery
struct DeviceHandle {
    std::string address;
    std::string name;
    uint8_t addressType = 0;
    int rssi = 0;
};

// GATT characteristic property flags
enum CapabilityProperty : uint8_t {
    CAP_READ              = 0x01,
    CAP_WRITE             = 0x02,
    CAP_WRITE_NO_RESPONSE = 0x04,
    CAP_NOTIFY            = 0x08,
    CAP_INDICATE          = 0x10
};

struct Capability {
    std::string id;          // 128-bit UUID text
    uint8_t properties = 0;  // CapabilityProperty bits
};

using NotifyHandler = std::function<void(const uint8_t* data, size_t length)>;
using DisconnectHandler = std::function<void()>;

// One open connection to a device. Destroying the session closes it.
// Handlers may be invoked from the radio stack's own task.
class RadioSession {
public:
    virtual ~RadioSession() = default;

    virtual std::vector<Capability> enumerateCapabilities() = 0;

    // Enable notifications on a capability. Returns false on failure.
    virtual bool subscribe(const std::string& id, NotifyHandler handler) = 0;

    virtual bool write(const std::string& id, const std::vector<uint8_t>& data) = 0;

    // Idempotent
    virtual void close() = 0;

    virtual bool isAlive() const = 0;

    // Called once when the peer drops the link
    virtual void setDisconnectHandler(DisconnectHandler handler) = 0;
};

class DeviceScanner {
public:
    virtual ~DeviceScanner() = default;

    // Blocking scan. Returns every named device seen, in discovery order.
    virtual std::vector<DeviceHandle> scan(uint32_t timeoutSec) = 0;
};

class RadioLink {
public:
    virtual ~RadioLink() = default;

    // Blocking connect. Returns nullptr on error or timeout.
    virtual std::unique_ptr<RadioSession> open(const DeviceHandle& device, uint32_t timeoutSec) = 0;
};

#endif // RADIO_H
