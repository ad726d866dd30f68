#include "ble_radio.h"
#include "logger.h"
#include <NimBLEDevice.h>
#include <atomic>
#include <mutex>

void initBleRadio(const char* localName) {
    if (!NimBLEDevice::isInitialized()) {
        NimBLEDevice::init(localName);
    }
    NimBLEDevice::setPower(ESP_PWR_LVL_P9);
    LOG_INFO("NimBLE initialized");
}

// -----------------------------------------------------------------------------
// Scanner
// -----------------------------------------------------------------------------

std::vector<DeviceHandle> BleScanner::scan(uint32_t timeoutSec) {
    std::vector<DeviceHandle> devices;

    NimBLEScan* bleScan = NimBLEDevice::getScan();
    bleScan->setActiveScan(true);  // Names often only come in the scan response
    bleScan->setInterval(100);
    bleScan->setWindow(99);

    // Blocks for the whole scan window
    NimBLEScanResults results = bleScan->getResults(timeoutSec * 1000, false);
    for (int i = 0; i < results.getCount(); i++) {
        const NimBLEAdvertisedDevice* adv = results.getDevice(i);
        if (adv == nullptr || !adv->haveName()) continue;

        DeviceHandle handle;
        handle.address = adv->getAddress().toString();
        handle.addressType = adv->getAddress().getType();
        handle.name = adv->getName();
        handle.rssi = adv->getRSSI();
        devices.push_back(handle);
    }
    bleScan->clearResults();
    return devices;
}

// -----------------------------------------------------------------------------
// Session
// -----------------------------------------------------------------------------

namespace {

class BleSession : public RadioSession, public NimBLEClientCallbacks {
public:
    explicit BleSession(NimBLEClient* client) : client(client) {
        client->setClientCallbacks(this, false);
    }

    ~BleSession() override {
        close();
    }

    std::vector<Capability> enumerateCapabilities() override {
        std::vector<Capability> caps;
        if (client == nullptr) return caps;

        // Always rediscover; a cached table from an earlier session may be stale
        const std::vector<NimBLERemoteService*>& services = client->getServices(true);
        for (NimBLERemoteService* service : services) {
            LOG_DEBUGF("Service: %s", service->getUUID().toString().c_str());
            const std::vector<NimBLERemoteCharacteristic*>& chars = service->getCharacteristics(true);
            for (NimBLERemoteCharacteristic* chr : chars) {
                Capability cap;
                cap.id = chr->getUUID().toString();
                if (chr->canRead()) cap.properties |= CAP_READ;
                if (chr->canWrite()) cap.properties |= CAP_WRITE;
                if (chr->canWriteNoResponse()) cap.properties |= CAP_WRITE_NO_RESPONSE;
                if (chr->canNotify()) cap.properties |= CAP_NOTIFY;
                if (chr->canIndicate()) cap.properties |= CAP_INDICATE;
                caps.push_back(cap);
            }
        }
        return caps;
    }

    bool subscribe(const std::string& id, NotifyHandler handler) override {
        NimBLERemoteCharacteristic* chr = findCharacteristic(id);
        if (chr == nullptr) return false;
        return chr->subscribe(true, [handler](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
            handler(data, length);
        });
    }

    bool write(const std::string& id, const std::vector<uint8_t>& data) override {
        NimBLERemoteCharacteristic* chr = findCharacteristic(id);
        if (chr == nullptr || !isAlive()) return false;
        return chr->writeValue(data.data(), data.size(), chr->canWrite());
    }

    void close() override {
        if (client == nullptr) return;
        NimBLEClient* closing = client;
        client = nullptr;
        alive = false;
        // The disconnect event may arrive after this object is gone
        closing->setClientCallbacks(nullptr, false);
        if (closing->isConnected()) {
            closing->disconnect();
        }
        NimBLEDevice::deleteClient(closing);
    }

    bool isAlive() const override {
        return alive.load() && client != nullptr && client->isConnected();
    }

    void setDisconnectHandler(DisconnectHandler handler) override {
        std::lock_guard<std::mutex> lock(handlerMutex);
        disconnectHandler = std::move(handler);
    }

    // NimBLE host task
    void onDisconnect(NimBLEClient* pClient, int reason) override {
        (void)pClient;
        LOG_WARNF("BLE disconnected (reason %d)", reason);
        alive = false;
        std::lock_guard<std::mutex> lock(handlerMutex);
        if (disconnectHandler) {
            disconnectHandler();
        }
    }

private:
    NimBLEClient* client;
    std::atomic<bool> alive{true};
    std::mutex handlerMutex;
    DisconnectHandler disconnectHandler;

    NimBLERemoteCharacteristic* findCharacteristic(const std::string& id) {
        if (client == nullptr) return nullptr;
        NimBLEUUID uuid(id);
        for (NimBLERemoteService* service : client->getServices(false)) {
            NimBLERemoteCharacteristic* chr = service->getCharacteristic(uuid);
            if (chr != nullptr) return chr;
        }
        LOG_ERRORF("Characteristic %s not available", id.c_str());
        return nullptr;
    }
};

} // namespace

// -----------------------------------------------------------------------------
// Link
// -----------------------------------------------------------------------------

std::unique_ptr<RadioSession> BleLink::open(const DeviceHandle& device, uint32_t timeoutSec) {
    NimBLEClient* client = NimBLEDevice::createClient();
    if (client == nullptr) {
        LOG_ERROR("No free BLE client slot");
        return nullptr;
    }
    client->setConnectTimeout(timeoutSec * 1000);

    std::unique_ptr<BleSession> session = std::make_unique<BleSession>(client);
    if (!client->connect(NimBLEAddress(device.address, device.addressType), true)) {
        LOG_ERRORF("BLE connect to %s failed", device.address.c_str());
        return nullptr;  // ~BleSession deletes the client
    }
    LOG_INFOF("BLE connected, MTU %u", client->getMTU());
    return session;
}
