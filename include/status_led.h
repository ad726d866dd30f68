#ifndef STATUS_LED_H
#define STATUS_LED_H

#include <Arduino.h>
#include "state.h"

// What the on-board NeoPixel shows. Blinking: WIFI_CONNECTING, SCANNING,
// CONNECTING, RECONNECTING.
enum LEDStatus {
    LED_STARTUP,
    LED_WIFI_CONNECTING,
    LED_WIFI_FAILED,
    LED_SCANNING,
    LED_CONNECTING,
    LED_STREAMING,
    LED_RECONNECTING,
    LED_BRIDGE_FAILED,
    LED_STOPPED,
    LED_OFF
};

void initStatusLED();

// No-op when the status is unchanged, so it can be called every loop
void setLEDStatus(LEDStatus status);

// LED status shown for a supervisor state
LEDStatus ledStatusFor(ConnectionState state);

// Drives the blink; call from loop()
void updateStatusLED();

#endif // STATUS_LED_H
