#pragma once
// =============================================================================
// Tether - Discovery Listener
// =============================================================================
// Wraps a ServiceBrowser, feeds the DiscoveryCache and publishes
// ServiceDiscoveredEvent / ServiceLostEvent on the bus. While a pairing
// session is open, every address whose pairing and connect ports are both
// resolved is handed to the found-callback exactly once.
// =============================================================================

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "discovery_cache.hpp"
#include "event_bus.hpp"
#include "result.hpp"
#include "service_browser.hpp"

namespace tether {

// (address, pair_port, connect_port, password)
using FoundCallback = std::function<void(const std::string&, int, int, const std::string&)>;

class DiscoveryListener {
public:
    DiscoveryListener(std::unique_ptr<ServiceBrowser> browser, EventBus& bus);
    ~DiscoveryListener();

    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    // Monitor only: publish events, no found-callback
    Result<void> start();

    // Browse and report resolved endpoints together with `password`
    Result<void> start(std::string password, FoundCallback on_found);

    // Open/close a pairing session on an already running listener
    void setPairingSession(std::string password, FoundCallback on_found);
    void clearPairingSession();

    // Idempotent
    void stop();

    bool running() const;

    const DiscoveryCache& cache() const { return cache_; }

private:
    void onAdded(ServiceKind kind, const std::string& address, int port);
    void onRemoved(ServiceKind kind, const std::string& address);

    std::unique_ptr<ServiceBrowser> browser_;
    EventBus& bus_;
    DiscoveryCache cache_;

    std::mutex lifecycle_mutex_;         // start/stop
    mutable std::mutex session_mutex_;   // password_, on_found_
    std::string password_;
    FoundCallback on_found_;
    std::atomic<bool> running_{false};
};

} // namespace tether
