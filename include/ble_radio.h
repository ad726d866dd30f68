#ifndef BLE_RADIO_H
#define BLE_RADIO_H

#include "radio.h"

// NimBLE-Arduino implementation of the radio collaborators.
// Call initBleRadio() once from setup() before the supervisor starts.

void initBleRadio(const char* localName);

class BleScanner : public DeviceScanner {
public:
    std::vector<DeviceHandle> scan(uint32_t timeoutSec) override;
};

class BleLink : public RadioLink {
public:
    std::unique_ptr<RadioSession> open(const DeviceHandle& device, uint32_t timeoutSec) override;
};

#endif // BLE_RADIO_H
