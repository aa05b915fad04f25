#include "discovery_cache.hpp"

namespace tether {

std::optional<ResolvedEndpoint> DiscoveryCache::record(ServiceKind kind,
                                                       const std::string& address, int port) {
    if (address.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    if (resolved_.count(address)) return std::nullopt;

    Entry& e = entries_[address];
    if (kind == ServiceKind::Pairing) e.pair_port = port;
    else e.connect_port = port;

    if (!e.pair_port || !e.connect_port) return std::nullopt;

    ResolvedEndpoint out;
    out.address = address;
    out.pair_port = *e.pair_port;
    out.connect_port = *e.connect_port;
    entries_.erase(address);
    resolved_.insert(address);
    return out;
}

void DiscoveryCache::forget(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(address);
    resolved_.erase(address);
}

bool DiscoveryCache::resolved(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_.count(address) > 0;
}

std::optional<DiscoveryCache::Entry> DiscoveryCache::peek(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(address);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

size_t DiscoveryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void DiscoveryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    resolved_.clear();
}

} // namespace tether
