// =============================================================================
// Tether - TetherContext
// =============================================================================
// Owns every core component for the lifetime of the process. Constructed
// once in main() and passed by reference; nothing here is a global.
// Construction order = dependency order; shutdown() tears down in reverse.
// =============================================================================
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "adb_client.hpp"
#include "command_dispatcher.hpp"
#include "config_loader.hpp"
#include "connection_reconciler.hpp"
#include "device_registry.hpp"
#include "discovery_listener.hpp"
#include "event_bus.hpp"
#include "ipc/command_server.hpp"
#include "ipc/status_publisher.hpp"
#include "mirror_session_manager.hpp"
#include "pairing_executor.hpp"
#include "process_runner.hpp"
#include "task_queue.hpp"

namespace tether {

// Replaceable collaborators. Null members get the production default,
// except the browser: without one, discovery stays off.
struct ContextDeps {
    std::unique_ptr<AdbTransport> adb;
    std::unique_ptr<ProcessLauncher> launcher;
    std::unique_ptr<ServiceBrowser> browser;
};

class TetherContext {
public:
    TetherContext(config::AppConfig cfg, ContextDeps deps, PresentationHooks& hooks);
    ~TetherContext();

    TetherContext(const TetherContext&) = delete;
    TetherContext& operator=(const TetherContext&) = delete;

    /**
     * Load the registry, start the reconciler, discovery and the command
     * channel. Discovery failing is logged and tolerated; a command channel
     * that cannot bind is an error.
     */
    Result<void, IoError> start();

    // Idempotent
    void shutdown();

    bool running() const { return started_ && !stopped_; }

    /**
     * Open a pairing session: every address resolved by discovery from now
     * on is paired once with `password` on the task queue.
     */
    Result<void> beginPairing(const std::string& password);
    void endPairing();

    /**
     * Screenshot of the device home screen stored as the record's thumbnail.
     * This sends HOME to the phone, so it runs only on request or right
     * after a pairing succeeds.
     */
    bool refreshThumbnail(const std::string& address);

    std::string thumbnailPathFor(const std::string& address) const;

    // --- Components (construction order) ---
    const config::AppConfig config;
    EventBus bus;
    std::unique_ptr<AdbTransport> adb;
    std::unique_ptr<ProcessLauncher> launcher;
    DeviceRegistry registry;
    MirrorSessionManager sessions;
    ConnectionReconciler reconciler;
    DiscoveryListener discovery;
    PairingExecutor pairing;
    ipc::StatusPublisher status;
    CommandDispatcher dispatcher;
    ipc::CommandServer commands;
    TaskQueue command_tasks;   // tray commands only
    TaskQueue tasks;           // status pushes, pairing, thumbnails

private:
    void subscribeAll();

    std::vector<SubscriptionHandle> subscriptions_;
    std::mutex lifecycle_mutex_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
};

} // namespace tether
