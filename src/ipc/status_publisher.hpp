#pragma once
// =============================================================================
// Tether - Status Channel (app -> tray)
// =============================================================================
// One JSON document per connection:
//   {"devices": [{"name", "address", "connected", "mirroring", "model",
//                 "manufacturer", "android_version"}, ...]}
// A missing or refusing tray socket is retried with a fixed delay up to a
// bounded attempt count, then the push is dropped.
// =============================================================================

#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "result.hpp"

namespace tether {
class DeviceRegistry;
class ConnectionReconciler;
class MirrorSessionManager;
class MainContext;
}

namespace tether::ipc {

struct DeviceStatus {
    std::string name;
    std::string address;
    bool connected = false;
    bool mirroring = false;
    std::string model;
    std::string manufacturer;
    std::string android_version;
};

nlohmann::json buildStatusSnapshot(const std::vector<DeviceStatus>& devices);

struct StatusPublisherOptions {
    std::string socket_path = "/tmp/tether_tray.sock";
    int max_attempts = 5;
    std::chrono::milliseconds retry_delay{500};
};

class StatusPublisher {
public:
    StatusPublisher(DeviceRegistry& registry, ConnectionReconciler& reconciler,
                    MirrorSessionManager& sessions, StatusPublisherOptions opts = {});

    // Current state of every registered device
    std::vector<DeviceStatus> collect() const;

    // Connect, write, close. false once the retry budget is exhausted.
    bool push();

    // Queue a push on `ctx`; requests made while one is pending coalesce
    void pushAsync(MainContext& ctx);

    // Low-level send of an arbitrary payload with the retry policy
    static Result<void, IoError> send(const std::string& path, const std::string& payload,
                                      int max_attempts, std::chrono::milliseconds retry_delay);

private:
    DeviceRegistry& registry_;
    ConnectionReconciler& reconciler_;
    MirrorSessionManager& sessions_;
    StatusPublisherOptions opts_;
    std::atomic<bool> pending_{false};
};

} // namespace tether::ipc
