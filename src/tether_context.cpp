// =============================================================================
// Tether - TetherContext implementation
// =============================================================================
#include "tether_context.hpp"
#include "tether_log.hpp"
#include "tether_paths.hpp"

#include <algorithm>
#include <filesystem>

namespace tether {

namespace {

ReconcilerOptions reconcilerOptions(const config::AppConfig& cfg) {
    ReconcilerOptions o;
    o.interval = std::chrono::seconds(cfg.app.monitor_interval);
    o.auto_connect = cfg.app.auto_connect;
    return o;
}

PairingOptions pairingOptions(const config::AppConfig& cfg) {
    PairingOptions o;
    o.max_attempts = std::max(1, cfg.adb.max_retry_attempts);
    o.retry_delay = std::chrono::milliseconds(std::max(0, cfg.adb.retry_delay_ms));
    return o;
}

ipc::StatusPublisherOptions statusOptions(const config::AppConfig& cfg) {
    ipc::StatusPublisherOptions o;
    o.socket_path = cfg.ipc.tray_socket;
    o.max_attempts = cfg.ipc.status_retry_attempts;
    o.retry_delay = std::chrono::milliseconds(std::max(0, cfg.ipc.status_retry_delay_ms));
    return o;
}

} // namespace

TetherContext::TetherContext(config::AppConfig cfg, ContextDeps deps, PresentationHooks& hooks)
    : config(std::move(cfg))
    , adb(deps.adb ? std::move(deps.adb) : std::make_unique<AdbClient>(config.adb))
    , launcher(deps.launcher ? std::move(deps.launcher) : std::make_unique<PosixProcessLauncher>())
    , registry(config.devicesPath(), bus, *adb)
    , sessions(*launcher, config.scrcpy, &bus)
    , reconciler(*adb, registry, bus, reconcilerOptions(config))
    , discovery(std::move(deps.browser), bus)
    , pairing(*adb, registry, pairingOptions(config))
    , status(registry, reconciler, sessions, statusOptions(config))
    , dispatcher(*adb, registry, reconciler, sessions, hooks)
    , commands(config.ipc.app_socket,
               [this](const ipc::Command& cmd) {
                   // Keep the accept loop free while adb runs
                   if (!command_tasks.post([this, cmd]() { dispatcher.dispatch(cmd); })) {
                       TLOG_WARN("ipc", "Dropping '%s': shutting down", cmd.name.c_str());
                   }
               },
               std::chrono::milliseconds(std::max(10, config.ipc.accept_timeout_ms))) {
    dispatcher.setStateChangedCallback([this]() { status.pushAsync(tasks); });
    subscribeAll();
}

TetherContext::~TetherContext() {
    shutdown();
}

void TetherContext::subscribeAll() {
    auto push = [this]() { status.pushAsync(tasks); };

    subscriptions_.push_back(bus.subscribe<DevicesChangedEvent>(
        [push](const DevicesChangedEvent&) { push(); }));
    subscriptions_.push_back(bus.subscribe<DeviceLostEvent>(
        [push](const DeviceLostEvent& e) {
            TLOG_INFO("context", "%s is no longer connected", e.address.c_str());
            push();
        }));
    subscriptions_.push_back(bus.subscribe<PortUpdatedEvent>(
        [push](const PortUpdatedEvent& e) {
            TLOG_INFO("context", "%s moved from port %d to %d",
                      e.address.c_str(), e.old_port, e.new_port);
            push();
        }));
    subscriptions_.push_back(bus.subscribe<MirrorStoppedEvent>(
        [push](const MirrorStoppedEvent& e) {
            TLOG_INFO("context", "Mirroring of %s ended", e.serial.c_str());
            push();
        }));
    subscriptions_.push_back(bus.subscribe<DeviceConnectedEvent>(
        [push](const DeviceConnectedEvent&) { push(); }));
}

Result<void, IoError> TetherContext::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) return Result<void, IoError>();
    if (stopped_) return IoError("context already shut down");

    TLOG_INFO("context", "Starting (devices: %s)", config.devicesPath().c_str());
    registry.load();

    auto server = commands.start();
    if (server.is_err()) {
        TLOG_ERROR("context", "Command channel unavailable: %s", server.error().message.c_str());
        return server.error();
    }

    reconciler.start();

    auto disc = discovery.start();
    if (disc.is_err()) {
        TLOG_WARN("context", "Discovery disabled: %s", disc.error().message.c_str());
    }

    started_ = true;
    status.pushAsync(tasks);
    TLOG_INFO("context", "Started with %zu paired device(s)", registry.size());
    return Result<void, IoError>();
}

void TetherContext::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) return;
    stopped_ = true;

    TLOG_INFO("context", "Shutting down...");
    bus.publish(ShutdownEvent{});

    // Producers first, so nothing new reaches the queue or the bus
    discovery.stop();
    commands.stop();
    command_tasks.shutdown();
    reconciler.stop();
    sessions.shutdown();
    tasks.shutdown();

    subscriptions_.clear();

    if (registry.hasUnsavedChanges()) {
        TLOG_WARN("context", "Registry has unsaved changes");
    }
    TLOG_INFO("context", "Shutdown complete");
}

Result<void> TetherContext::beginPairing(const std::string& password) {
    if (password.empty()) return Error("pairing password is empty");
    if (!discovery.running()) return Error("discovery is not running");

    discovery.setPairingSession(password,
        [this](const std::string& address, int pair_port, int connect_port,
               const std::string& secret) {
            bool queued = tasks.post([this, address, pair_port, connect_port, secret]() {
                auto report = [this, &address](const std::string& msg) {
                    PairingStatusEvent ev;
                    ev.address = address;
                    ev.message = msg;
                    bus.publish(ev);
                };
                if (!pairing.pair(address, pair_port, connect_port, secret, report)) {
                    TLOG_WARN("context", "Pairing with %s did not complete", address.c_str());
                    return;
                }
                reconciler.noteConnected(address, connect_port);
                refreshThumbnail(address);
            });
            if (!queued) TLOG_WARN("context", "Pairing with %s dropped", address.c_str());
        });
    TLOG_INFO("context", "Pairing session open");
    return Result<void>();
}

void TetherContext::endPairing() {
    discovery.clearPairingSession();
    TLOG_INFO("context", "Pairing session closed");
}

std::string TetherContext::thumbnailPathFor(const std::string& address) const {
    std::string name = address;
    std::replace(name.begin(), name.end(), '.', '_');
    std::replace(name.begin(), name.end(), ':', '_');
    return paths::getScreenshotDirectory() + "/tether_" + name + "_screen.png";
}

bool TetherContext::refreshThumbnail(const std::string& address) {
    auto rec = registry.find(address);
    if (!rec || rec->connect_port <= 0) return false;

    const std::string path = thumbnailPathFor(address);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) {
        TLOG_WARN("context", "Cannot create %s: %s",
                  std::filesystem::path(path).parent_path().c_str(), ec.message().c_str());
        return false;
    }

    auto shot = adb->captureScreenshot(rec->serial(), path);
    if (!shot) return false;
    if (rec->thumbnail && *rec->thumbnail == *shot) return true;

    DeviceRecord update;
    update.address = address;
    update.thumbnail = *shot;
    registry.upsert(update);
    return true;
}

} // namespace tether
