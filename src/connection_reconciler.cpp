#include "connection_reconciler.hpp"
#include "adb_client.hpp"
#include "device_registry.hpp"
#include "tether_log.hpp"

#include <vector>

namespace tether {

ConnectionReconciler::ConnectionReconciler(AdbTransport& adb, DeviceRegistry& registry,
                                           EventBus& bus, ReconcilerOptions opts)
    : adb_(adb), registry_(registry), bus_(bus),
      interval_(opts.interval.count() > 0 ? opts.interval : std::chrono::milliseconds(5000)),
      auto_connect_(opts.auto_connect) {}

ConnectionReconciler::~ConnectionReconciler() {
    stop();
}

void ConnectionReconciler::start() {
    if (running_.exchange(true)) return;

    discovered_sub_ = bus_.subscribe<ServiceDiscoveredEvent>(
        [this](const ServiceDiscoveredEvent& e) {
            if (e.kind == ServiceKind::Connect) handleServiceDiscovered(e.address, e.port);
        });

    thread_ = std::thread(&ConnectionReconciler::loop, this);
    TLOG_INFO("reconciler", "Started (interval %lldms, auto-connect %s)",
              static_cast<long long>(interval_.count()), auto_connect_ ? "on" : "off");
}

void ConnectionReconciler::stop() {
    if (!running_.exchange(false)) return;
    discovered_sub_.reset();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        wake_cv_.notify_all();
    }
    if (thread_.joinable()) thread_.join();
    TLOG_INFO("reconciler", "Stopped");
}

void ConnectionReconciler::loop() {
    while (running_) {
        pollOnce();

        std::unique_lock<std::mutex> lock(state_mutex_);
        wake_cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

bool ConnectionReconciler::pollOnce() {
    std::vector<std::string> lost;
    {
        std::lock_guard<std::mutex> reconcile(reconcile_mutex_);

        auto listed = adb_.listDevices();
        if (listed.is_err()) {
            // Keep the previous set; a failed listing proves nothing
            TLOG_DEBUG("reconciler", "adb devices failed: %s", listed.error().message.c_str());
            return false;
        }

        std::set<std::string> current;
        for (const auto& serial : listed.value()) {
            auto split = splitSerial(serial);
            if (split) current.insert(split->first);
        }

        std::lock_guard<std::mutex> state(state_mutex_);
        for (const auto& addr : connected_) {
            if (!current.count(addr)) lost.push_back(addr);
        }
        connected_ = std::move(current);
    }

    for (const auto& addr : lost) {
        TLOG_INFO("reconciler", "Device disconnected: %s", addr.c_str());
        DeviceLostEvent ev;
        ev.address = addr;
        bus_.publish(ev);
    }
    return true;
}

bool ConnectionReconciler::handleServiceDiscovered(const std::string& address, int port) {
    if (!auto_connect_) return false;

    auto record = registry_.find(address);
    if (!record) return false;   // not one of ours

    int old_port = record->connect_port;
    {
        std::lock_guard<std::mutex> reconcile(reconcile_mutex_);
        if (isConnected(address)) return false;

        TLOG_INFO("reconciler", "Auto-connecting to %s (%s:%d)",
                  record->name.c_str(), address.c_str(), port);
        if (!adb_.connect(address, port)) {
            TLOG_WARN("reconciler", "Auto-connect to %s:%d failed", address.c_str(), port);
            return false;
        }

        std::lock_guard<std::mutex> state(state_mutex_);
        connected_.insert(address);
    }

    if (old_port != port) {
        TLOG_INFO("reconciler", "Port of %s changed %d -> %d", address.c_str(), old_port, port);
        DeviceRecord update;
        update.address = address;
        update.connect_port = port;
        update.last_seen = currentIsoTimestamp();
        registry_.upsert(update);

        PortUpdatedEvent pe;
        pe.address = address;
        pe.old_port = old_port;
        pe.new_port = port;
        bus_.publish(pe);
    }

    DeviceConnectedEvent ce;
    ce.address = address;
    ce.port = port;
    bus_.publish(ce);
    return true;
}

bool ConnectionReconciler::isConnected(const std::string& address) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return connected_.count(address) > 0;
}

std::set<std::string> ConnectionReconciler::connectedAddresses() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return connected_;
}

void ConnectionReconciler::noteConnected(const std::string& address, int port) {
    bool inserted;
    {
        std::lock_guard<std::mutex> reconcile(reconcile_mutex_);
        std::lock_guard<std::mutex> state(state_mutex_);
        inserted = connected_.insert(address).second;
    }
    if (inserted) {
        DeviceConnectedEvent ev;
        ev.address = address;
        ev.port = port;
        bus_.publish(ev);
    }
}

void ConnectionReconciler::noteDisconnected(const std::string& address) {
    bool erased;
    {
        std::lock_guard<std::mutex> reconcile(reconcile_mutex_);
        std::lock_guard<std::mutex> state(state_mutex_);
        erased = connected_.erase(address) > 0;
    }
    if (erased) {
        DeviceLostEvent ev;
        ev.address = address;
        bus_.publish(ev);
    }
}

void ConnectionReconciler::setAutoConnect(bool enabled) {
    auto_connect_ = enabled;
    TLOG_INFO("reconciler", "Auto-connect %s", enabled ? "enabled" : "disabled");
}

} // namespace tether
