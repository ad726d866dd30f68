#include "status_led.h"
#include "config.h"
#include <Adafruit_NeoPixel.h>

// Create NeoPixel object
Adafruit_NeoPixel rgbLed(NUM_PIXELS, RGB_LED_PIN, NEO_GRB + NEO_KHZ800);

// LED Status Colors
#define COLOR_STARTUP         rgbLed.Color(128, 0, 128)  // Purple - System starting
#define COLOR_WIFI_CONNECTING rgbLed.Color(255, 255, 0)  // Yellow - Connecting to WiFi (blinking)
#define COLOR_WIFI_FAILED     rgbLed.Color(255, 0, 255)  // Magenta - No WiFi, console only
#define COLOR_SCANNING        rgbLed.Color(0, 0, 255)    // Blue - Looking for the sensor (blinking)
#define COLOR_CONNECTING      rgbLed.Color(0, 255, 255)  // Cyan - Connecting / discovering (blinking)
#define COLOR_STREAMING       rgbLed.Color(0, 255, 0)    // Green - Sensor connected
#define COLOR_RECONNECTING    rgbLed.Color(255, 80, 0)   // Orange - Waiting to retry (blinking)
#define COLOR_BRIDGE_FAILED   rgbLed.Color(255, 0, 0)    // Red - Gave up reconnecting
#define COLOR_STOPPED         rgbLed.Color(40, 40, 40)   // Dim white - Stopped
#define COLOR_OFF             rgbLed.Color(0, 0, 0)      // Off

// Current status
LEDStatus currentStatus = LED_OFF;

// Blinking state for animations
unsigned long lastBlinkTime = 0;
bool blinkState = false;

static uint32_t colorFor(LEDStatus status) {
    switch (status) {
        case LED_STARTUP:         return COLOR_STARTUP;
        case LED_WIFI_CONNECTING: return COLOR_WIFI_CONNECTING;
        case LED_WIFI_FAILED:     return COLOR_WIFI_FAILED;
        case LED_SCANNING:        return COLOR_SCANNING;
        case LED_CONNECTING:      return COLOR_CONNECTING;
        case LED_STREAMING:       return COLOR_STREAMING;
        case LED_RECONNECTING:    return COLOR_RECONNECTING;
        case LED_BRIDGE_FAILED:   return COLOR_BRIDGE_FAILED;
        case LED_STOPPED:         return COLOR_STOPPED;
        default:                  return COLOR_OFF;
    }
}

static bool isBlinking(LEDStatus status) {
    return status == LED_WIFI_CONNECTING || status == LED_SCANNING ||
           status == LED_CONNECTING || status == LED_RECONNECTING;
}

void initStatusLED() {
    rgbLed.begin();
    rgbLed.setBrightness(RGB_LED_BRIGHTNESS);
    rgbLed.clear();
    rgbLed.show();
}

void setLEDColor(uint32_t color) {
    rgbLed.setPixelColor(0, color);
    rgbLed.show();
}

void setLEDStatus(LEDStatus status) {
    if (status == currentStatus) return;
    currentStatus = status;

    // Blinking states start lit; updateStatusLED() toggles them
    blinkState = true;
    lastBlinkTime = millis();
    setLEDColor(colorFor(status));
}

LEDStatus ledStatusFor(ConnectionState state) {
    switch (state) {
        case ConnectionState::Scanning:     return LED_SCANNING;
        case ConnectionState::Connecting:
        case ConnectionState::Discovering:  return LED_CONNECTING;
        case ConnectionState::Connected:    return LED_STREAMING;
        case ConnectionState::Reconnecting: return LED_RECONNECTING;
        case ConnectionState::Failed:       return LED_BRIDGE_FAILED;
        default:                            return LED_STOPPED;
    }
}

void updateStatusLED() {
    if (!isBlinking(currentStatus)) return;

    unsigned long currentTime = millis();
    if (currentTime - lastBlinkTime >= LED_BLINK_MS) {
        lastBlinkTime = currentTime;
        blinkState = !blinkState;
        setLEDColor(blinkState ? colorFor(currentStatus) : COLOR_OFF);
    }
}
