#pragma once
// =============================================================================
// Tether - Service Browser interface
// =============================================================================
// Browses the two adb wireless-debugging service types and reports each
// advertisement resolved to an IPv4 address and port. The DNS-SD backend
// lives in mdns_browser.*; tests drive a fake.
// =============================================================================

#include <functional>
#include <string>

#include "event_bus.hpp"
#include "result.hpp"

namespace tether {

constexpr const char* kPairingServiceType = "_adb-tls-pairing._tcp";
constexpr const char* kConnectServiceType = "_adb-tls-connect._tcp";

class ServiceBrowser {
public:
    struct Handler {
        std::function<void(ServiceKind kind, const std::string& address, int port)> on_added;
        std::function<void(ServiceKind kind, const std::string& address)> on_removed;
    };

    virtual ~ServiceBrowser() = default;

    // Opens the multicast browsers; an error here is a start failure, not retried
    virtual Result<void> start(Handler handler) = 0;

    // Cancels both browsers and releases the socket. Idempotent.
    virtual void stop() = 0;

    virtual bool running() const = 0;
};

} // namespace tether
