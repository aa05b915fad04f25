#include "discovery_listener.hpp"
#include "tether_log.hpp"

namespace tether {

DiscoveryListener::DiscoveryListener(std::unique_ptr<ServiceBrowser> browser, EventBus& bus)
    : browser_(std::move(browser)), bus_(bus) {}

DiscoveryListener::~DiscoveryListener() {
    stop();
}

Result<void> DiscoveryListener::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) return Result<void>();
    if (!browser_) return Error("no service browser configured");

    ServiceBrowser::Handler handler;
    handler.on_added = [this](ServiceKind kind, const std::string& address, int port) {
        onAdded(kind, address, port);
    };
    handler.on_removed = [this](ServiceKind kind, const std::string& address) {
        onRemoved(kind, address);
    };

    auto res = browser_->start(std::move(handler));
    if (res.is_err()) {
        TLOG_ERROR("discovery", "Failed to start mDNS browsing: %s", res.error().message.c_str());
        return res;
    }
    running_ = true;
    TLOG_INFO("discovery", "Browsing %s and %s", kPairingServiceType, kConnectServiceType);
    return Result<void>();
}

Result<void> DiscoveryListener::start(std::string password, FoundCallback on_found) {
    setPairingSession(std::move(password), std::move(on_found));
    auto res = start();
    if (res.is_err()) clearPairingSession();
    return res;
}

void DiscoveryListener::setPairingSession(std::string password, FoundCallback on_found) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    password_ = std::move(password);
    on_found_ = std::move(on_found);
    // Stale half-resolved entries must not complete a new session
    cache_.clear();
}

void DiscoveryListener::clearPairingSession() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    password_.clear();
    on_found_ = nullptr;
}

void DiscoveryListener::stop() {
    // Browser callbacks only take session_mutex_, so joining here is safe
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_) return;
    running_ = false;
    if (browser_) browser_->stop();
    cache_.clear();
    TLOG_INFO("discovery", "Discovery stopped");
}

bool DiscoveryListener::running() const {
    return running_;
}

void DiscoveryListener::onAdded(ServiceKind kind, const std::string& address, int port) {
    if (address.empty() || port <= 0) return;
    TLOG_DEBUG("discovery", "Discovered %s service: %s:%d",
               serviceKindStr(kind), address.c_str(), port);

    ServiceDiscoveredEvent ev;
    ev.address = address;
    ev.port = port;
    ev.kind = kind;
    bus_.publish(ev);

    FoundCallback cb;
    std::string password;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (!on_found_) return;
        cb = on_found_;
        password = password_;
    }

    auto resolved = cache_.record(kind, address, port);
    if (!resolved) return;

    TLOG_INFO("discovery", "Resolved %s (pair %d, connect %d)",
              resolved->address.c_str(), resolved->pair_port, resolved->connect_port);
    try {
        cb(resolved->address, resolved->pair_port, resolved->connect_port, password);
    } catch (const std::exception& e) {
        TLOG_ERROR("discovery", "Found callback threw: %s", e.what());
    }
}

void DiscoveryListener::onRemoved(ServiceKind kind, const std::string& address) {
    if (kind != ServiceKind::Connect || address.empty()) return;
    TLOG_INFO("discovery", "Connect service withdrawn: %s", address.c_str());
    cache_.forget(address);

    ServiceLostEvent ev;
    ev.address = address;
    bus_.publish(ev);
}

} // namespace tether
