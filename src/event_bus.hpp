// =============================================================================
// Tether - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Decouples discovery, reconciler, registry, mirroring and the tray channel.
// Handlers run synchronously on the publishing thread, in registration order.
// Usage:
//   auto sub = ctx.bus.subscribe<DevicesChangedEvent>([](const auto& e) { ... });
//   ctx.bus.publish(DevicesChangedEvent{});
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <memory>
#include <string>
#include <cstdint>
#include <atomic>
#include <algorithm>
#include "tether_log.hpp"

namespace tether {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

enum class ServiceKind { Pairing, Connect };

inline const char* serviceKindStr(ServiceKind k) {
    return k == ServiceKind::Pairing ? "pair" : "connect";
}

// Registry content changed (upsert / remove / reload)
struct DevicesChangedEvent : Event {
    std::string address;  // empty for whole-registry changes (reload)
    std::string reason;   // "added", "updated", "removed", "reloaded"
};

// Discovery: one advertisement resolved to address:port
struct ServiceDiscoveredEvent : Event {
    std::string address;
    int port = 0;
    ServiceKind kind = ServiceKind::Connect;
};

// Discovery: a connect advertisement was withdrawn
struct ServiceLostEvent : Event {
    std::string address;
};

// Reconciler transitions
struct DeviceConnectedEvent : Event {
    std::string address;
    int port = 0;
};

struct DeviceLostEvent : Event {
    std::string address;
};

struct PortUpdatedEvent : Event {
    std::string address;
    int old_port = 0;
    int new_port = 0;
};

// Mirroring process ended (explicit stop excluded)
struct MirrorStoppedEvent : Event {
    std::string serial;
};

// Pairing progress text for the presentation layer
struct PairingStatusEvent : Event {
    std::string address;
    std::string message;
};

struct ShutdownEvent : Event {};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    // Explicit unsubscribe before the handle goes out of scope
    void reset() {
        if (unsub_) unsub_();
        unsub_ = nullptr;
    }

    void release() { unsub_ = nullptr; } // detach: subscription lives forever

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    EventBus() : alive_(std::make_shared<std::atomic<bool>>(true)) {}
    ~EventBus() { alive_->store(false); }

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        TLOG_DEBUG("eventbus", "Subscribed handler %llu for %s",
                   (unsigned long long)id, typeid(T).name());

        // A handle may outlive the bus during teardown; the flag keeps
        // the unsubscribe from touching a destroyed map.
        std::weak_ptr<std::atomic<bool>> alive = alive_;
        return SubscriptionHandle([this, key, id, alive]() {
            auto flag = alive.lock();
            if (!flag || !flag->load()) return;
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto key = std::type_index(typeid(T));
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                TLOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            }
        }
    }

    template<typename T>
    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::type_index(typeid(T));
        auto it = handlers_.find(key);
        return it != handlers_.end() && !it->second.empty();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const Event&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace tether
