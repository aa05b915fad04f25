#pragma once
// =============================================================================
// Tether - Connection Reconciler
// =============================================================================
// Keeps the set of connected addresses aligned with `adb devices`.
//   poll loop:      replaces the set wholesale, DeviceLostEvent for dropouts
//   auto-connect:   ServiceDiscoveredEvent(connect) for a paired, offline
//                   address -> one connect attempt -> DeviceConnectedEvent
// Both drivers run under the same reconcile mutex.
// =============================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "event_bus.hpp"

namespace tether {

class AdbTransport;
class DeviceRegistry;

struct ReconcilerOptions {
    std::chrono::milliseconds interval{5000};
    bool auto_connect = true;
};

class ConnectionReconciler {
public:
    ConnectionReconciler(AdbTransport& adb, DeviceRegistry& registry, EventBus& bus,
                         ReconcilerOptions opts = {});
    ~ConnectionReconciler();

    ConnectionReconciler(const ConnectionReconciler&) = delete;
    ConnectionReconciler& operator=(const ConnectionReconciler&) = delete;

    // Subscribes to discovery events and starts the poll thread
    void start();
    void stop();
    bool running() const { return running_; }

    // One reconciliation pass; false if the device listing failed
    bool pollOnce();

    /**
     * Auto-connect path for a discovered connect service.
     * Returns true if a connect was attempted and succeeded.
     */
    bool handleServiceDiscovered(const std::string& address, int port);

    bool isConnected(const std::string& address) const;
    std::set<std::string> connectedAddresses() const;

    // Manual connect/disconnect outcomes from the command channel
    void noteConnected(const std::string& address, int port);
    void noteDisconnected(const std::string& address);

    void setAutoConnect(bool enabled);
    bool autoConnect() const { return auto_connect_; }

private:
    void loop();

    AdbTransport& adb_;
    DeviceRegistry& registry_;
    EventBus& bus_;

    std::mutex reconcile_mutex_;          // serializes poll vs auto-connect
    mutable std::mutex state_mutex_;      // connected_
    std::set<std::string> connected_;
    const std::chrono::milliseconds interval_;
    std::atomic<bool> auto_connect_;

    std::atomic<bool> running_{false};
    std::condition_variable wake_cv_;
    std::thread thread_;
    SubscriptionHandle discovered_sub_;
};

} // namespace tether
