#ifndef WEB_SERVER_H
#define WEB_SERVER_H

#include <Arduino.h>
#include "bridge_config.h"
#include "broadcast_hub.h"
#include "connection_supervisor.h"
#include "latest_value_cache.h"

// Apply /bridge.json from LittleFS on top of config (if present)
bool loadConfigOverrides(BridgeConfig& config);

// Connect WiFi and start the HTTP API and the WebSocket telemetry server
// (if WiFi credentials are configured)
void initWebServer(LatestValueCache& cache, BroadcastHub& hub, ConnectionSupervisor& supervisor,
                   const BridgeConfig& config);

// Start web server task (runs handleWebServer and the hub in background)
// Call after initWebServer(). When used, do NOT call handleWebServer() from main loop.
void startWebServerTask();

// Service HTTP/WebSocket clients and push pending readings to consumers
void handleWebServer();

// Detach every consumer and close both servers. Idempotent.
void stopWebServer();

// True once POST /api/stop was received
bool isStopRequested();

// Get WiFi connection status
bool isWiFiConnected();

// Check if WiFi is enabled in configuration
bool isWiFiEnabled();

// Get IP address as string
String getIPAddress();

#endif // WEB_SERVER_H
