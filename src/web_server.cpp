#include "web_server.h"
#include "config.h"
#include "logger.h"
#include "status_led.h"
#include "telemetry_codec.h"
#include <WiFi.h>
#include <WebServer.h>
#include <WebSocketsServer.h>
#include <LittleFS.h>
#include <freertos/task.h>
#include <atomic>
#include <memory>

bool isWiFiEnabled() {
    return strlen(WIFI_SSID) > 0;
}

// Servers are created in initWebServer() once the ports are known
static std::unique_ptr<WebServer> server;
static std::unique_ptr<WebSocketsServer> webSocket;

static LatestValueCache* bridgeCache = nullptr;
static BroadcastHub* bridgeHub = nullptr;
static ConnectionSupervisor* bridgeSupervisor = nullptr;
static const BridgeConfig* bridgeConfig = nullptr;

static bool wifiConnected = false;

static bool serversRunning = false;
static std::atomic<bool> stopPending{false};

// -----------------------------------------------------------------------------
// Config file
// -----------------------------------------------------------------------------

bool loadConfigOverrides(BridgeConfig& config) {
    if (!LittleFS.begin(true)) {
        LOG_ERROR("LittleFS mount failed, using built-in configuration");
        return false;
    }

    File file = LittleFS.open(CONFIG_OVERRIDE_PATH, "r");
    if (!file || file.isDirectory()) {
        if (file) file.close();
        LOG_INFOF("No %s, using built-in configuration", CONFIG_OVERRIDE_PATH);
        return false;
    }
    String body = file.readString();
    file.close();

    std::string error;
    if (!applyConfigOverrides(std::string(body.c_str()), config, error)) {
        LOG_ERRORF("Ignoring %s: %s", CONFIG_OVERRIDE_PATH, error.c_str());
        return false;
    }
    LOG_INFOF("Configuration overrides loaded from %s", CONFIG_OVERRIDE_PATH);
    return true;
}

// -----------------------------------------------------------------------------
// WebSocket consumers
// -----------------------------------------------------------------------------

// Same IPv4 subnet as our station interface
static bool isLocalClient(IPAddress ip) {
    uint32_t mask = static_cast<uint32_t>(WiFi.subnetMask());
    uint32_t local = static_cast<uint32_t>(WiFi.localIP());
    return (static_cast<uint32_t>(ip) & mask) == (local & mask);
}

void webSocketEvent(uint8_t num, WStype_t type, uint8_t* payload, size_t length) {
    (void)payload;
    (void)length;

    switch (type) {
        case WStype_DISCONNECTED:
            if (bridgeHub->detach(num)) {
                LOG_INFOF("[WS] Consumer #%u disconnected (%u attached)", num,
                          static_cast<unsigned>(bridgeHub->consumerCount()));
            }
            break;
        case WStype_CONNECTED:
            {
                IPAddress ip = webSocket->remoteIP(num);
                if (bridgeConfig->wsLocalOnly && !isLocalClient(ip)) {
                    LOG_WARNF("[WS] Refusing non-local client %s", ip.toString().c_str());
                    webSocket->disconnect(num);
                    break;
                }
                bridgeHub->attach(num, [num](const std::string& json) {
                    return webSocket->sendTXT(num, json.c_str(), json.size());
                });
                LOG_INFOF("[WS] Consumer #%u connected from %s (%u attached)", num, ip.toString().c_str(),
                          static_cast<unsigned>(bridgeHub->consumerCount()));
            }
            break;
        case WStype_TEXT:
            // Consumers only listen
            break;
        default:
            break;
    }
}

// -----------------------------------------------------------------------------
// HTTP API
// -----------------------------------------------------------------------------

static void handleStatus() {
    BridgeStatus status;
    status.state = bridgeSupervisor->state();
    status.stats = bridgeSupervisor->stats();
    status.reading = bridgeCache->snapshot();
    status.deviceAddress = bridgeSupervisor->deviceAddress();
    status.deviceName = bridgeSupervisor->deviceName();
    status.consumers = bridgeHub->consumerCount();
    status.nowMs = millis();
    status.nextRetryDelayMs = bridgeSupervisor->nextRetryDelayMs();
    server->send(200, "application/json", encodeStatus(status).c_str());
}

static void handleUnknownRoute() {
    String body = "{\"error\":\"not found\",\"uri\":\"";
    body += server->uri();
    body += "\"}";
    server->send(404, "application/json", body);
}

static void registerRoutes() {
    server->on("/api/status", HTTP_GET, handleStatus);
    server->on("/api/config", HTTP_GET, []() {
        server->send(200, "application/json", encodeConfig(*bridgeConfig).c_str());
    });
    server->on("/api/stop", HTTP_POST, []() {
        // The web task performs the shutdown after this response is out
        stopPending = true;
        server->send(200, "application/json", "{\"status\":\"stopping\"}");
        LOG_INFO("Stop requested over HTTP");
    });
    server->on("/logs", []() {
        server->send(200, "application/json", logger.getEntriesJSON().c_str());
    });
    server->onNotFound(handleUnknownRoute);
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

// Join the configured network, blinking the LED while waiting.
// Gives up after WIFI_CONNECT_TIMEOUT.
static bool connectStation() {
    LOG_INFOF("Joining WiFi \"%s\" as %s", WIFI_SSID, WIFI_HOSTNAME);
    WiFi.mode(WIFI_STA);
    WiFi.setHostname(WIFI_HOSTNAME);
    WiFi.begin(WIFI_SSID, WIFI_PASSWORD);
    setLEDStatus(LED_WIFI_CONNECTING);

    unsigned long started = millis();
    while (WiFi.status() != WL_CONNECTED && millis() - started < WIFI_CONNECT_TIMEOUT) {
        delay(100);
        updateStatusLED();
    }

    wifiConnected = WiFi.status() == WL_CONNECTED;
    if (!wifiConnected) {
        setLEDStatus(LED_WIFI_FAILED);
        LOG_ERRORF("WiFi join failed (status %d)", WiFi.status());
        return false;
    }
    LOG_INFOF("WiFi up, address %s", WiFi.localIP().toString().c_str());
    return true;
}

void initWebServer(LatestValueCache& cache, BroadcastHub& hub, ConnectionSupervisor& supervisor,
                   const BridgeConfig& config) {
    bridgeCache = &cache;
    bridgeHub = &hub;
    bridgeSupervisor = &supervisor;
    bridgeConfig = &config;

    if (!isWiFiEnabled()) {
        LOG_INFO("No WiFi SSID configured, readings go to the console only");
        return;
    }
    if (!connectStation()) {
        LOG_WARN("Bridge runs without HTTP/WebSocket front");
        return;
    }

    server = std::make_unique<WebServer>(config.httpPort);
    registerRoutes();
    server->begin();
    LOG_INFOF("HTTP API started on port %u", config.httpPort);

    webSocket = std::make_unique<WebSocketsServer>(config.wsPort);
    webSocket->begin();
    webSocket->onEvent(webSocketEvent);
    LOG_INFOF("WebSocket server started on port %u (%s)", config.wsPort,
              config.wsLocalOnly ? "local subnet only" : "any client");

    LOG_INFOF("Stream: ws://%s:%u/", WiFi.localIP().toString().c_str(), config.wsPort);
    serversRunning = true;
}

static void webTask(void* arg) {
    (void)arg;
    for (;;) {
        handleWebServer();
        if (stopPending) {
            bridgeSupervisor->requestStop();
            stopWebServer();
            LOG_INFO("Web server task finished");
            vTaskDelete(NULL);
        }
        vTaskDelay(1);
    }
}

void startWebServerTask() {
    if (!serversRunning) return;
    xTaskCreatePinnedToCore(webTask, "web", WEB_TASK_STACK, NULL, 1, NULL, 0);
    LOG_INFO("Web server task started (Core 0)");
}

void handleWebServer() {
    if (!serversRunning) return;
    server->handleClient();
    webSocket->loop();

    // Push the latest reading to every consumer
    bridgeHub->pump();
}

void stopWebServer() {
    if (!serversRunning) return;
    serversRunning = false;

    bridgeHub->detachAll();
    webSocket->close();
    server->stop();
    LOG_INFO("WebSocket and HTTP servers closed");
}

bool isStopRequested() {
    return stopPending;
}

bool isWiFiConnected() {
    return wifiConnected;
}

String getIPAddress() {
    return wifiConnected ? WiFi.localIP().toString() : String("offline");
}
