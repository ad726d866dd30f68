#ifndef CONNECTION_SUPERVISOR_H
#define CONNECTION_SUPERVISOR_H

#include "backoff_policy.h"
#include "bridge_config.h"
#include "frame_parser.h"
#include "latest_value_cache.h"
#include "radio.h"
#include "state.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// =============================================================================
// Connection Supervisor
// =============================================================================
// Owns the one sensor session of the bridge:
//
//   Disconnected -> Scanning -> Connecting -> Discovering -> Connected
//                       ^                                       |
//                       +------------ Reconnecting <------------+
//
// step() is non-blocking apart from the collaborator calls it makes (scan,
// open), and is called periodically from the supervisor task. Every failure
// path ends in scheduleRetry(), which consults the single BackoffPolicy and
// either waits in Reconnecting or, with a finite attempt cap exhausted, parks
// in Failed for good.
//
// handleNotification() and handleDisconnect() are called from the radio
// stack's task. Everything else belongs to the supervisor task.
// =============================================================================

class ConnectionSupervisor {
public:
    using Clock = std::function<uint32_t()>;
    using StateCallback = std::function<void(ConnectionState from, ConnectionState to)>;

    ConnectionSupervisor(const BridgeConfig& config, DeviceScanner& scanner, RadioLink& link,
                         LatestValueCache& cache, Clock clock);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    // Disconnected -> Scanning. Returns false if already running.
    bool start();

    // Advance the state machine
    void step();

    // Ask the supervisor task to stop at its next step(). Any thread.
    void requestStop();
    bool stopRequested() const { return stopFlag.load(); }

    // Release the session, go to Disconnected and log statistics.
    // Supervisor task only. Safe to call more than once.
    void shutdown();

    ConnectionState state() const { return currentState.load(); }
    bool isFailed() const { return state() == ConnectionState::Failed; }

    SupervisorStats stats() const;
    std::string deviceAddress() const;
    std::string deviceName() const;
    uint32_t nextRetryDelayMs() const { return retryDelayMs.load(); }

    // Resolved during Discovering from the device name
    bool requiresStartCommand() const { return startCommandRequired; }

    // Called on every state change, from the supervisor task
    void onStateChange(StateCallback callback);

    // Radio callbacks
    void handleNotification(const uint8_t* data, size_t length);
    void handleDisconnect();

private:
    BridgeConfig config;
    DeviceScanner& scanner;
    RadioLink& link;
    LatestValueCache& cache;
    Clock clock;
    BackoffPolicy backoff;
    StateCallback stateCallback;

    std::atomic<ConnectionState> currentState{ConnectionState::Disconnected};
    std::atomic<bool> stopFlag{false};
    std::atomic<bool> linkLost{false};
    std::atomic<bool> acceptingNotifications{false};
    std::atomic<uint32_t> retryDelayMs{0};
    bool shutDown = true;

    std::unique_ptr<RadioSession> session;
    DeviceHandle target;
    bool startCommandRequired = false;

    // Timers (supervisor task only)
    uint32_t scanAttempt = 0;
    uint32_t lastScanMs = 0;
    uint32_t linkUpMs = 0;
    uint32_t retryStartMs = 0;
    uint32_t lastKeepaliveMs = 0;
    uint32_t lastStatusReportMs = 0;
    uint32_t lastStaleWarningMs = 0;
    bool staleWarned = false;

    // Guards counters, identity and lastActivityMs (shared with the radio task)
    mutable std::mutex statsMutex;
    SupervisorStats counters;
    std::string currentAddress;
    std::string currentName;
    uint32_t lastActivityMs = 0;  // Last decoded frame, or entering Connected

    // Guards the assembler and ordered cache writes
    std::mutex notifyMutex;
    FrameAssembler assembler;

    void setState(ConnectionState next);

    void stepScanning(uint32_t now);
    void stepConnecting();
    void stepDiscovering(uint32_t now);
    void stepConnected(uint32_t now);
    void stepReconnecting(uint32_t now);

    bool selectDevice(const std::vector<DeviceHandle>& devices, DeviceHandle& out) const;
    bool nameRequiresStartCommand(const std::string& name) const;
    bool verifyCapabilities();
    void enterConnected(uint32_t now);

    void checkDataTimeout(uint32_t now);
    void reportStatus(uint32_t now);

    void handleLinkLoss(const char* reason);
    void scheduleRetry(const char* reason);
    void releaseSession();
    void logStatistics();
};

#endif // CONNECTION_SUPERVISOR_H
