#include "pending_resolves.hpp"

namespace tether {

bool PendingResolves::begin(const std::string& key, Clock::time_point now) {
    const bool replaced = started_.count(key) > 0;
    started_[key] = now;
    return replaced;
}

void PendingResolves::finish(const std::string& key) {
    started_.erase(key);
}

std::vector<std::string> PendingResolves::expire(Clock::time_point now) {
    std::vector<std::string> expired;
    for (auto it = started_.begin(); it != started_.end();) {
        if (now - it->second >= deadline_) {
            expired.push_back(it->first);
            it = started_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

} // namespace tether
