#pragma once
// =============================================================================
// Tether - Discovery Cache
// =============================================================================
// Correlates the pairing and connect advertisements of one address. An entry
// lives until both ports are known, then it is handed out once and the
// address is marked resolved. Further advertisements for a resolved address
// are ignored until forget() or clear().
// =============================================================================

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "event_bus.hpp"

namespace tether {

struct ResolvedEndpoint {
    std::string address;
    int pair_port = 0;
    int connect_port = 0;
};

class DiscoveryCache {
public:
    struct Entry {
        std::optional<int> pair_port;
        std::optional<int> connect_port;
    };

    /**
     * Store `port` under the field for `kind`.
     * Returns the endpoint (and drops the entry) once both fields are set.
     * Always nullopt for an address that already resolved.
     */
    std::optional<ResolvedEndpoint> record(ServiceKind kind, const std::string& address, int port);

    // Connect service withdrawn: start over for this address
    void forget(const std::string& address);

    bool resolved(const std::string& address) const;

    std::optional<Entry> peek(const std::string& address) const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::set<std::string> resolved_;
};

} // namespace tether
