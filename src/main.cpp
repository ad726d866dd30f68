#include <Arduino.h>
#include <freertos/task.h>
#include "config.h"
#include "logger.h"
#include "bridge_config.h"
#include "latest_value_cache.h"
#include "broadcast_hub.h"
#include "connection_supervisor.h"
#include "ble_radio.h"
#include "web_server.h"
#include "status_led.h"

// Owned here for the lifetime of the firmware, passed by reference
static BridgeConfig bridgeConfig;
static LatestValueCache latestReading;
static BroadcastHub hub(latestReading);
static BleScanner bleScanner;
static BleLink bleLink;
static ConnectionSupervisor* supervisor = nullptr;

static void supervisorTask(void* arg) {
  (void)arg;
  for (;;) {
    supervisor->step();
    if (supervisor->stopRequested()) {
      break;
    }
    vTaskDelay(pdMS_TO_TICKS(SUPERVISOR_STEP_MS));
  }
  supervisor->shutdown();
  LOG_INFO("Supervisor task finished");
  vTaskDelete(NULL);
}

void setup() {
  Serial.begin(115200);
  delay(1000);

  logger.setClock([]() { return static_cast<uint32_t>(millis()); });
  logger.setSink([](const char* line) { Serial.print(line); });
  logger.begin(LOG_BUFFER_SIZE);

  LOG_INFO("=== KIRIRI Sensor Bridge ===");

  initStatusLED();
  setLEDStatus(LED_STARTUP);

  // Built-in defaults, then /bridge.json on top
  bridgeConfig = defaultBridgeConfig();
  loadConfigOverrides(bridgeConfig);

  initBleRadio(WIFI_HOSTNAME);

  static ConnectionSupervisor instance(bridgeConfig, bleScanner, bleLink, latestReading,
                                       []() { return static_cast<uint32_t>(millis()); });
  supervisor = &instance;

  // Initialize WiFi, HTTP API and WebSocket stream
  initWebServer(latestReading, hub, *supervisor, bridgeConfig);
  startWebServerTask();  // Run web + broadcast in background task

  supervisor->start();
  xTaskCreatePinnedToCore(supervisorTask, "supervisor", SUPERVISOR_TASK_STACK, NULL, 2, NULL, 1);
  LOG_INFO("Supervisor task started (Core 1)");

  LOG_INFOF("=== System Ready (%s) ===", getIPAddress().c_str());
}

void loop() {
  static unsigned long lastHeartbeat = 0;
  static unsigned long lastConsoleReading = 0;
  static bool failureReported = false;
  static bool stopReported = false;
  unsigned long now = millis();

  setLEDStatus(ledStatusFor(supervisor->state()));
  updateStatusLED();

  if (isStopRequested() && supervisor->state() == ConnectionState::Disconnected && !stopReported) {
    stopReported = true;
    LOG_INFO("Bridge stopped, reset the board to start again");
  }

  if (supervisor->isFailed() && !failureReported) {
    failureReported = true;
    LOG_ERROR("Bridge failed: sensor unreachable, reset the board to retry");
  }

  // Without a network the console is the only consumer
  if (!isWiFiConnected() && now - lastConsoleReading >= 1000) {
    lastConsoleReading = now;
    Reading reading;
    if (latestReading.takePending(reading)) {
      LOG_DEBUGF("Reading: y=%.2f x=%.2f", reading.y, reading.x);
    }
  }

  if (now - lastHeartbeat >= 2000) {
    lastHeartbeat = now;
    LOG_DEBUGF("Heartbeat: %lu ms", now);
  }

  delay(10);
}
