#include "connection_supervisor.h"
#include "logger.h"
#include <cctype>
#include <exception>
#include <utility>

static bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

static const Capability* findCapability(const std::vector<Capability>& caps, const std::string& id) {
    for (const Capability& cap : caps) {
        if (equalsIgnoreCase(cap.id, id)) return &cap;
    }
    return nullptr;
}

static std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const std::string& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

ConnectionSupervisor::ConnectionSupervisor(const BridgeConfig& config, DeviceScanner& scanner, RadioLink& link,
                                           LatestValueCache& cache, Clock clock)
    : config(config),
      scanner(scanner),
      link(link),
      cache(cache),
      clock(std::move(clock)),
      backoff(config.reconnectBaseDelayMs, config.reconnectBackoffFactor,
              config.reconnectMaxDelayMs, config.maxReconnectAttempts),
      assembler(config.frameBufferLimit) {}

ConnectionSupervisor::~ConnectionSupervisor() {
    acceptingNotifications = false;
    if (session) {
        session->setDisconnectHandler(nullptr);
        session->close();
    }
}

void ConnectionSupervisor::onStateChange(StateCallback callback) {
    stateCallback = std::move(callback);
}

void ConnectionSupervisor::setState(ConnectionState next) {
    ConnectionState prev = currentState.load();
    if (prev == next) return;
    currentState = next;
    LOG_INFOF("State: %s -> %s", connectionStateName(prev), connectionStateName(next));
    if (stateCallback) {
        stateCallback(prev, next);
    }
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

bool ConnectionSupervisor::start() {
    if (state() != ConnectionState::Disconnected) {
        LOG_WARNF("Supervisor already running (%s)", connectionStateName(state()));
        return false;
    }

    uint32_t now = clock();
    stopFlag = false;
    shutDown = false;
    backoff.reset();
    retryDelayMs = 0;
    scanAttempt = 0;
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        counters = SupervisorStats();
        counters.startMs = now;
    }

    LOG_INFO("==================================================");
    LOG_INFO("KIRIRI sensor bridge starting");
    LOG_INFOF("Target devices: %s", joinNames(config.deviceNames).c_str());
    if (!config.targetAddress.empty()) {
        LOG_INFOF("Target address: %s", config.targetAddress.c_str());
    }
    if (backoff.unbounded()) {
        LOG_INFO("Reconnect attempts: unlimited");
    } else {
        LOG_INFOF("Reconnect attempts: %d", backoff.attemptCap());
    }
    LOG_INFO("==================================================");

    setState(ConnectionState::Scanning);
    return true;
}

void ConnectionSupervisor::requestStop() {
    stopFlag = true;
}

void ConnectionSupervisor::shutdown() {
    stopFlag = true;
    if (shutDown) return;
    shutDown = true;

    LOG_INFO("Stopping supervisor...");
    if (state() == ConnectionState::Connected) {
        // Leaving an established session is a disconnection like any other
        LOG_INFO("Disconnecting from sensor");
        std::lock_guard<std::mutex> lock(statsMutex);
        counters.totalDisconnections++;
    }
    releaseSession();
    retryDelayMs = 0;
    if (state() != ConnectionState::Failed) {
        setState(ConnectionState::Disconnected);
    }
    logStatistics();
    LOG_INFO("Supervisor stopped");
}

void ConnectionSupervisor::step() {
    ConnectionState current = state();
    if (current == ConnectionState::Failed) {
        return;
    }
    if (stopFlag) {
        if (current != ConnectionState::Disconnected || !shutDown) {
            shutdown();
        }
        return;
    }

    uint32_t now = clock();
    switch (current) {
        case ConnectionState::Scanning:     stepScanning(now); break;
        case ConnectionState::Connecting:   stepConnecting(); break;
        case ConnectionState::Discovering:  stepDiscovering(now); break;
        case ConnectionState::Connected:    stepConnected(now); break;
        case ConnectionState::Reconnecting: stepReconnecting(now); break;
        default: break;
    }
}

// -----------------------------------------------------------------------------
// Scanning
// -----------------------------------------------------------------------------

bool ConnectionSupervisor::selectDevice(const std::vector<DeviceHandle>& devices, DeviceHandle& out) const {
    // Earliest configured name wins; within one name, discovery order
    for (const std::string& wanted : config.deviceNames) {
        for (const DeviceHandle& device : devices) {
            if (device.name.empty() || device.name.find(wanted) == std::string::npos) continue;
            if (!config.targetAddress.empty() && !equalsIgnoreCase(device.address, config.targetAddress)) continue;
            out = device;
            return true;
        }
    }

    // A fixed address alone is enough when no names are configured
    if (config.deviceNames.empty() && !config.targetAddress.empty()) {
        for (const DeviceHandle& device : devices) {
            if (equalsIgnoreCase(device.address, config.targetAddress)) {
                out = device;
                return true;
            }
        }
    }
    return false;
}

void ConnectionSupervisor::stepScanning(uint32_t now) {
    if (scanAttempt > 0 && now - lastScanMs < config.scanRetryPauseMs) {
        return;
    }

    scanAttempt++;
    if (scanAttempt > 1) {
        LOG_INFOF("Scan retry %u/%u", scanAttempt, config.scanAttemptsPerCycle);
    } else {
        LOG_INFOF("Scanning for %s (%us)...", joinNames(config.deviceNames).c_str(), config.scanTimeoutSec);
    }

    std::vector<DeviceHandle> devices = scanner.scan(config.scanTimeoutSec);
    lastScanMs = clock();

    for (const DeviceHandle& device : devices) {
        LOG_DEBUGF("Seen: %s (%s) RSSI=%d", device.name.c_str(), device.address.c_str(), device.rssi);
    }

    DeviceHandle chosen;
    if (selectDevice(devices, chosen)) {
        LOG_INFOF("Found: %s (%s) RSSI=%d", chosen.name.c_str(), chosen.address.c_str(), chosen.rssi);
        target = chosen;
        setState(ConnectionState::Connecting);
        return;
    }

    if (scanAttempt >= config.scanAttemptsPerCycle) {
        LOG_WARN("Target device not found");
        scheduleRetry("device not found");
    }
}

// -----------------------------------------------------------------------------
// Connecting / Discovering
// -----------------------------------------------------------------------------

void ConnectionSupervisor::stepConnecting() {
    LOG_INFOF("Connecting to %s (%s)...", target.name.c_str(), target.address.c_str());

    linkLost = false;
    std::unique_ptr<RadioSession> opened = link.open(target, config.connectTimeoutSec);
    if (!opened) {
        LOG_WARNF("Connection to %s failed", target.address.c_str());
        scheduleRetry("connect failed");
        return;
    }

    opened->setDisconnectHandler([this]() { handleDisconnect(); });
    session = std::move(opened);
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        currentAddress = target.address;
        currentName = target.name;
    }

    LOG_INFO("Connected, waiting for the link to settle");
    linkUpMs = clock();
    setState(ConnectionState::Discovering);
}

bool ConnectionSupervisor::nameRequiresStartCommand(const std::string& name) const {
    for (const std::string& variant : config.startCommandDeviceNames) {
        if (!variant.empty() && name.find(variant) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool ConnectionSupervisor::verifyCapabilities() {
    std::vector<Capability> caps = session->enumerateCapabilities();
    LOG_INFOF("Discovered %u characteristics", static_cast<unsigned>(caps.size()));
    for (const Capability& cap : caps) {
        LOG_DEBUGF("  %s [0x%02X]", cap.id.c_str(), cap.properties);
    }

    const Capability* writeCap = findCapability(caps, config.writeCapabilityId);
    if (!writeCap) {
        LOG_ERRORF("Write characteristic not found: %s", config.writeCapabilityId.c_str());
        return false;
    }
    const Capability* notifyCap = findCapability(caps, config.notifyCapabilityId);
    if (!notifyCap) {
        LOG_ERRORF("Notify characteristic not found: %s", config.notifyCapabilityId.c_str());
        return false;
    }

    // Property mismatches are reported but tolerated
    if (!(writeCap->properties & (CAP_WRITE | CAP_WRITE_NO_RESPONSE))) {
        LOG_WARNF("Write characteristic is not writable [0x%02X]", writeCap->properties);
    }
    if (!(notifyCap->properties & CAP_NOTIFY)) {
        LOG_WARNF("Notify characteristic does not notify [0x%02X]", notifyCap->properties);
    }
    return true;
}

void ConnectionSupervisor::stepDiscovering(uint32_t now) {
    if (now - linkUpMs < config.connectSettleMs) {
        return;
    }

    if (linkLost || !session || !session->isAlive()) {
        LOG_WARN("Link dropped before discovery");
        releaseSession();
        scheduleRetry("link dropped during discovery");
        return;
    }

    if (!verifyCapabilities()) {
        releaseSession();
        scheduleRetry("required characteristic missing");
        return;
    }

    startCommandRequired = nameRequiresStartCommand(target.name);

    {
        std::lock_guard<std::mutex> lock(notifyMutex);
        assembler.reset();
    }
    acceptingNotifications = true;

    LOG_INFO("Enabling notifications...");
    bool subscribed = session->subscribe(config.notifyCapabilityId, [this](const uint8_t* data, size_t length) {
        handleNotification(data, length);
    });
    if (!subscribed) {
        LOG_ERROR("Failed to enable notifications");
        releaseSession();
        scheduleRetry("subscribe failed");
        return;
    }

    if (startCommandRequired) {
        LOG_INFO("Sending start command");
        if (!session->write(config.writeCapabilityId, config.startCommand)) {
            LOG_ERROR("Failed to send start command");
            releaseSession();
            scheduleRetry("start command failed");
            return;
        }
        std::lock_guard<std::mutex> lock(statsMutex);
        counters.startCommandsSent++;
    } else {
        LOG_DEBUGF("%s streams without a start command", target.name.c_str());
    }

    enterConnected(clock());
}

void ConnectionSupervisor::enterConnected(uint32_t now) {
    backoff.reset();
    retryDelayMs = 0;
    lastKeepaliveMs = now;
    lastStatusReportMs = now;
    staleWarned = false;
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        counters.totalConnections++;
        counters.failedAttempts = 0;
        counters.sessionStartMs = now;
        lastActivityMs = now;
    }

    setState(ConnectionState::Connected);
    LOG_INFO("==================================================");
    LOG_INFOF("Receiving data from %s (%s)", target.name.c_str(), target.address.c_str());
    LOG_INFO("==================================================");
}

// -----------------------------------------------------------------------------
// Connected
// -----------------------------------------------------------------------------

void ConnectionSupervisor::stepConnected(uint32_t now) {
    if (linkLost) {
        handleLinkLoss("disconnected by peer");
        return;
    }
    if (!session || !session->isAlive()) {
        handleLinkLoss("link no longer alive");
        return;
    }

    if (config.keepaliveEnabled && now - lastKeepaliveMs >= config.keepaliveIntervalMs) {
        lastKeepaliveMs = now;
        if (!session->write(config.writeCapabilityId, config.keepaliveCommand)) {
            LOG_ERROR("Keepalive write failed");
            handleLinkLoss("keepalive failed");
            return;
        }
        LOG_DEBUG("Keepalive sent");
        std::lock_guard<std::mutex> lock(statsMutex);
        counters.keepalivesSent++;
    }

    if (config.dataTimeoutEnabled) {
        checkDataTimeout(now);
    }

    if (config.statusReportIntervalMs > 0 && now - lastStatusReportMs >= config.statusReportIntervalMs) {
        lastStatusReportMs = now;
        reportStatus(now);
    }
}

void ConnectionSupervisor::checkDataTimeout(uint32_t now) {
    uint32_t activity;
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        activity = lastActivityMs;
    }

    // Signed: a frame may land after now was sampled
    int32_t silentMs = static_cast<int32_t>(now - activity);
    if (silentMs <= static_cast<int32_t>(config.dataTimeoutMs)) {
        return;
    }
    if (staleWarned && now - lastStaleWarningMs < config.dataTimeoutMs) {
        return;
    }

    staleWarned = true;
    lastStaleWarningMs = now;
    LOG_WARNF("No data received for %lu ms", static_cast<unsigned long>(silentMs));
    std::lock_guard<std::mutex> lock(statsMutex);
    counters.staleWarnings++;
}

void ConnectionSupervisor::reportStatus(uint32_t now) {
    SupervisorStats s = stats();
    LOG_INFOF("Connection OK | session %lus | frames received %u | dropped %u",
              static_cast<unsigned long>((now - s.sessionStartMs) / 1000), s.framesDecoded, s.framesDropped);
}

// -----------------------------------------------------------------------------
// Reconnecting
// -----------------------------------------------------------------------------

void ConnectionSupervisor::handleLinkLoss(const char* reason) {
    LOG_WARNF("Connection lost: %s", reason);
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        counters.totalDisconnections++;
    }
    releaseSession();
    scheduleRetry(reason);
}

void ConnectionSupervisor::scheduleRetry(const char* reason) {
    uint32_t delay = 0;
    bool retry = backoff.next(delay);
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        counters.failedAttempts = backoff.attempts();
    }

    if (!retry) {
        retryDelayMs = 0;
        LOG_ERRORF("Maximum reconnect attempts reached (%d), giving up: %s", backoff.attemptCap(), reason);
        setState(ConnectionState::Failed);
        logStatistics();
        return;
    }

    retryDelayMs = delay;
    retryStartMs = clock();
    if (backoff.unbounded()) {
        LOG_INFOF("Reconnect attempt %u in %.1f s (%s)", backoff.attempts(), delay / 1000.0, reason);
    } else {
        LOG_INFOF("Reconnect attempt %u/%d in %.1f s (%s)", backoff.attempts(), backoff.attemptCap(),
                  delay / 1000.0, reason);
    }
    setState(ConnectionState::Reconnecting);
}

void ConnectionSupervisor::stepReconnecting(uint32_t now) {
    if (now - retryStartMs < retryDelayMs.load()) {
        return;
    }
    scanAttempt = 0;
    setState(ConnectionState::Scanning);
}

void ConnectionSupervisor::releaseSession() {
    acceptingNotifications = false;
    if (session) {
        session->setDisconnectHandler(nullptr);
        session->close();
        session.reset();
    }
    {
        std::lock_guard<std::mutex> lock(notifyMutex);
        assembler.reset();
    }
    linkLost = false;
}

// -----------------------------------------------------------------------------
// Radio callbacks
// -----------------------------------------------------------------------------

void ConnectionSupervisor::handleDisconnect() {
    linkLost = true;
}

void ConnectionSupervisor::handleNotification(const uint8_t* data, size_t length) {
    if (!acceptingNotifications || data == nullptr) {
        return;
    }

    try {
        std::lock_guard<std::mutex> lock(notifyMutex);

        std::vector<FrameValue> frames;
        uint32_t dropped = 0;
        if (config.frameReassembly) {
            uint32_t before = assembler.droppedSegments();
            frames = assembler.push(data, length);
            dropped = assembler.droppedSegments() - before;
        } else {
            std::optional<FrameValue> value = parseFrame(data, length);
            if (value) {
                frames.push_back(*value);
            } else {
                dropped = 1;
            }
        }

        std::string deviceId;
        {
            std::lock_guard<std::mutex> statsLock(statsMutex);
            counters.notificationsReceived++;
            counters.framesDecoded += static_cast<uint32_t>(frames.size());
            counters.framesDropped += dropped;
            if (!frames.empty()) {
                uint32_t now = clock();
                counters.lastDataMs = now;
                lastActivityMs = now;
            }
            deviceId = currentAddress;
        }

        if (dropped > 0) {
            LOG_DEBUGF("Dropped %u malformed frame(s) in %u byte notification", dropped,
                       static_cast<unsigned>(length));
        }
        for (const FrameValue& frame : frames) {
            LOG_DEBUGF("Frame: y=%.2f x=%.2f", frame.y, frame.x);
            cache.update(deviceId, frame.y, frame.x);
        }
    } catch (const std::exception& e) {
        LOG_ERRORF("Notification handling error: %s", e.what());
    }
}

// -----------------------------------------------------------------------------
// Statistics
// -----------------------------------------------------------------------------

SupervisorStats ConnectionSupervisor::stats() const {
    std::lock_guard<std::mutex> lock(statsMutex);
    return counters;
}

std::string ConnectionSupervisor::deviceAddress() const {
    std::lock_guard<std::mutex> lock(statsMutex);
    return currentAddress;
}

std::string ConnectionSupervisor::deviceName() const {
    std::lock_guard<std::mutex> lock(statsMutex);
    return currentName;
}

void ConnectionSupervisor::logStatistics() {
    SupervisorStats s = stats();
    uint32_t runtimeSec = (clock() - s.startMs) / 1000;
    LOG_INFO("==================================================");
    LOG_INFO("Bridge statistics:");
    LOG_INFOF("  Runtime: %lus", static_cast<unsigned long>(runtimeSec));
    LOG_INFOF("  Connections: %u", s.totalConnections);
    LOG_INFOF("  Disconnections: %u", s.totalDisconnections);
    LOG_INFOF("  Notifications: %u", s.notificationsReceived);
    LOG_INFOF("  Frames decoded: %u, dropped: %u", s.framesDecoded, s.framesDropped);
    LOG_INFOF("  Keepalives: %u, stale warnings: %u", s.keepalivesSent, s.staleWarnings);
    LOG_INFO("==================================================");
}
