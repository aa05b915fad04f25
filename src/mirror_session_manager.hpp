#pragma once
// =============================================================================
// Tether - Mirroring Session Manager
// =============================================================================
// At most one scrcpy process per serial ("address:port"). A watcher thread
// per process waits for its exit and, if the slot still holds that same
// process, clears it and reports the stop. Explicit stopMirror() clears the
// slot first, so it never produces a stop notification.
// =============================================================================

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "config_loader.hpp"
#include "event_bus.hpp"
#include "process_runner.hpp"

namespace tether {

struct ScreenSize {
    int width = 1920;
    int height = 1080;
};

/**
 * Full scrcpy argv for one session. Window geometry "w,h,x,y" defaults to
 * 800x600 centered and is clamped to `screen`.
 * @param record_file  recording target, used only when cfg.record is set
 */
std::vector<std::string> buildMirrorCommand(const config::ScrcpyConfig& cfg,
                                            const std::string& serial,
                                            const std::string& display_name,
                                            ScreenSize screen = {},
                                            const std::string& record_file = "");

// <record_path or data dir>/recordings/tether_<serial>_<timestamp>.<format>
std::string recordingFilePath(const config::ScrcpyConfig& cfg, const std::string& serial);

using MirrorStopCallback = std::function<void(const std::string& serial)>;

class MirrorSessionManager {
public:
    MirrorSessionManager(ProcessLauncher& launcher, config::ScrcpyConfig cfg,
                         EventBus* bus = nullptr);
    ~MirrorSessionManager();

    MirrorSessionManager(const MirrorSessionManager&) = delete;
    MirrorSessionManager& operator=(const MirrorSessionManager&) = delete;

    // True if a session is live afterwards (including one that already was)
    bool startMirror(const std::string& address, int port, const std::string& display_name);

    // False when there was nothing to stop
    bool stopMirror(const std::string& address, int port);

    bool isMirroring(const std::string& address, int port) const;

    // Called with the serial when a session ends on its own
    void onStop(MirrorStopCallback cb);

    std::vector<std::string> activeSerials() const;

    void setConfig(const config::ScrcpyConfig& cfg);
    void setScreenSize(ScreenSize size);

    // Stops every session and joins all watchers. Idempotent.
    void shutdown();

private:
    struct Watcher {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void watch(const std::string& serial, std::shared_ptr<ChildProcess> proc);
    void reapWatchersLocked();
    static void endProcess(const std::string& serial, ChildProcess& proc);

    ProcessLauncher& launcher_;
    EventBus* bus_;

    mutable std::mutex mutex_;   // sessions_, cfg_, screen_, watchers_
    config::ScrcpyConfig cfg_;
    ScreenSize screen_;
    std::map<std::string, std::shared_ptr<ChildProcess>> sessions_;
    std::vector<Watcher> watchers_;
    bool shut_down_ = false;

    std::mutex callbacks_mutex_;
    std::vector<MirrorStopCallback> stop_callbacks_;
};

} // namespace tether
