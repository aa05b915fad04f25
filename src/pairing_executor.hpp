#pragma once
// =============================================================================
// Tether - Pairing Handshake
// =============================================================================
// pair -> connect (retried) -> identity properties -> registry upsert.
// At most one handshake per address is in flight at any time.
// =============================================================================

#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <string>

#include "device_registry.hpp"

namespace tether {

class AdbTransport;

struct PairingOptions {
    int max_attempts = 5;
    std::chrono::milliseconds retry_delay{1000};
};

using StatusCallback = std::function<void(const std::string&)>;

class PairingExecutor {
public:
    PairingExecutor(AdbTransport& adb, DeviceRegistry& registry, PairingOptions opts = {});

    /**
     * Run the full handshake. Status text goes to on_status regardless of
     * the outcome. Returns false, leaving the registry untouched, when no
     * connect attempt succeeds or another handshake for `address` is running.
     */
    bool pair(const std::string& address, int pair_port, int connect_port,
              const std::string& secret, const StatusCallback& on_status = nullptr);

    // Best-effort identity properties of a connected device
    DeviceRecord fetchDeviceInfo(const std::string& address, int connect_port);

    bool inFlight(const std::string& address) const;

    // Random ASCII-letter code, e.g. for the pairing password
    static std::string generateCode(size_t length = 5);

private:
    AdbTransport& adb_;
    DeviceRegistry& registry_;
    PairingOptions opts_;

    mutable std::mutex mutex_;
    std::set<std::string> in_flight_;
};

} // namespace tether
