#pragma once
// =============================================================================
// Tether - Pending DNS-SD resolves
// =============================================================================
// Bookkeeping for in-flight resolves, keyed by "<kind>/<instance>". At most
// one resolve per key is pending; a new Add for the same key supersedes the
// old one. Resolves that have not answered within the deadline expire.
// Not thread-safe: owned by the browser's event loop thread.
// =============================================================================

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace tether {

class PendingResolves {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::seconds kDefaultDeadline{10};

    explicit PendingResolves(Clock::duration deadline = kDefaultDeadline)
        : deadline_(deadline) {}

    /// Track a new resolve. Returns true when it replaced a pending one.
    bool begin(const std::string& key, Clock::time_point now);

    /// Resolve answered (or failed); stop tracking it
    void finish(const std::string& key);

    /// Remove and return every key started more than `deadline` before `now`
    std::vector<std::string> expire(Clock::time_point now);

    bool pending(const std::string& key) const { return started_.count(key) > 0; }
    size_t size() const { return started_.size(); }

private:
    Clock::duration deadline_;
    std::map<std::string, Clock::time_point> started_;
};

} // namespace tether
