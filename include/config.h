#ifndef CONFIG_H
#define CONFIG_H

// ============================================================================
// KIRIRI Sensor Bridge - Configuration
// ============================================================================
// Every value below is a default. Override with -D build flags, or at boot
// with /bridge.json on LittleFS (see bridge_config.h).

// ----------------------------------------------------------------------------
// RGB LED Configuration
// ----------------------------------------------------------------------------
#ifndef RGB_LED_PIN
#define RGB_LED_PIN 48
#endif
#define NUM_PIXELS 1
#define RGB_LED_BRIGHTNESS 50  // Brightness (0-255)
#define LED_BLINK_MS       500 // Blink period while scanning / reconnecting

// ----------------------------------------------------------------------------
// WiFi Configuration
// ----------------------------------------------------------------------------
// WiFi credentials can be configured in two ways:
// 1. Create "secrets.h" in this directory with WIFI_SSID_SECRET and WIFI_PASSWORD_SECRET
//    (recommended - secrets.h is gitignored)
// 2. Or modify the default values below (not recommended for public repos)

#if __has_include("secrets.h")
#include "secrets.h"
  #define WIFI_SSID           WIFI_SSID_SECRET
  #define WIFI_PASSWORD       WIFI_PASSWORD_SECRET
#else
  #define WIFI_SSID           ""          // Your WiFi SSID
  #define WIFI_PASSWORD       ""          // Your WiFi password
#endif

#define WIFI_HOSTNAME         "kiriri-bridge"
#define WIFI_CONNECT_TIMEOUT  10000       // WiFi connection timeout in milliseconds

// Note: If WIFI_SSID is left empty, the HTTP/WebSocket front is disabled and
// the bridge only logs readings to the console.

// ----------------------------------------------------------------------------
// Transport Front (HTTP status API + WebSocket telemetry stream)
// ----------------------------------------------------------------------------
#ifndef WEB_SERVER_PORT
#define WEB_SERVER_PORT       80          // HTTP status API port
#endif
#ifndef WS_PORT
#define WS_PORT               8765        // WebSocket telemetry port
#endif
#ifndef WS_LOCAL_ONLY
#define WS_LOCAL_ONLY         true        // Refuse consumers outside our own subnet
#endif
#define CONFIG_OVERRIDE_PATH  "/bridge.json"

// ----------------------------------------------------------------------------
// Sensor Selection
// ----------------------------------------------------------------------------
// Advertised name substrings, most specific first. When several devices match,
// the one matching the earliest entry wins.
#ifndef TARGET_DEVICE_NAMES
#define TARGET_DEVICE_NAMES          {"KIRIRI01", "KIRIRI02", "KIRIRI03", "KIRI"}
#endif
// Fixed BLE address to connect to ("" = any device with a matching name)
#ifndef TARGET_DEVICE_ADDRESS
#define TARGET_DEVICE_ADDRESS        ""
#endif
// Device variants that only stream after receiving START_COMMAND
#ifndef START_COMMAND_DEVICE_NAMES
#define START_COMMAND_DEVICE_NAMES   {"KIRIRI01"}
#endif

// Nordic UART service characteristics
#define NUS_SERVICE_UUID             "6e400001-b5a3-f393-e0a9-e50e24dcca9e"
#ifndef NOTIFY_CHARACTERISTIC_UUID
#define NOTIFY_CHARACTERISTIC_UUID   "6e400003-b5a3-f393-e0a9-e50e24dcca9e"  // TX, notify
#endif
#ifndef WRITE_CHARACTERISTIC_UUID
#define WRITE_CHARACTERISTIC_UUID    "6e400002-b5a3-f393-e0a9-e50e24dcca9e"  // RX, write
#endif

#define START_COMMAND                "START\n"
#define KEEPALIVE_COMMAND            "PING\n"

// ----------------------------------------------------------------------------
// Connection Timing
// ----------------------------------------------------------------------------
#ifndef SCAN_TIMEOUT_SEC
#define SCAN_TIMEOUT_SEC             10      // One BLE scan window
#endif
#define SCAN_ATTEMPTS_PER_CYCLE      3       // Scans before a cycle counts as failed
#define SCAN_RETRY_PAUSE_MS          2000    // Pause between scans in one cycle
#ifndef CONNECT_TIMEOUT_SEC
#define CONNECT_TIMEOUT_SEC          30
#endif
#define CONNECT_SETTLE_MS            2000    // Let the link settle before discovery

// Reconnect backoff
#ifndef RECONNECT_BASE_DELAY_MS
#define RECONNECT_BASE_DELAY_MS      5000
#endif
#define RECONNECT_BACKOFF_FACTOR     1.5f
#define RECONNECT_MAX_DELAY_MS       60000
#ifndef MAX_RECONNECT_ATTEMPTS
#define MAX_RECONNECT_ATTEMPTS       -1      // -1 = retry forever
#endif

// Keepalive
#define KEEPALIVE_ENABLED            true
#define KEEPALIVE_INTERVAL_MS        15000

// Data watchdog (warning only, never forces a reconnect)
#define DATA_TIMEOUT_ENABLED         true
#define DATA_TIMEOUT_MS              60000

#define STATUS_REPORT_INTERVAL_MS    30000   // Periodic "link OK" log line

// Frame reassembly across notifications
#define FRAME_REASSEMBLY_ENABLED     true
#define FRAME_BUFFER_LIMIT           64      // Max buffered bytes of an unterminated frame

// ----------------------------------------------------------------------------
// Task Configuration
// ----------------------------------------------------------------------------
#define SUPERVISOR_TASK_STACK        6144
#define SUPERVISOR_STEP_MS           10
#define WEB_TASK_STACK               6144

// ----------------------------------------------------------------------------
// Logging Configuration
// ----------------------------------------------------------------------------
// Number of log messages to keep in memory for web interface display
// DEBUG level logs are not stored, only INFO, WARN, and ERROR
#define LOG_BUFFER_SIZE     50

#endif // CONFIG_H
