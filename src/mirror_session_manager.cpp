#include "mirror_session_manager.hpp"
#include "adb_client.hpp"
#include "tether_log.hpp"
#include "tether_paths.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <sstream>

namespace tether {

namespace {

constexpr auto kStopGracePeriod = std::chrono::seconds(5);

struct WindowGeometry {
    int width = 800;
    int height = 600;
    int x = -1;
    int y = -1;
};

WindowGeometry parseGeometry(const std::string& text) {
    WindowGeometry g;
    if (text.empty()) return g;

    std::vector<int> parts;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            parts.push_back(std::stoi(item));
        } catch (const std::exception&) {
            TLOG_WARN("mirror", "Bad window_geometry '%s', using defaults", text.c_str());
            return WindowGeometry{};
        }
    }
    if (parts.size() != 4) return g;
    g.width = parts[0];
    g.height = parts[1];
    g.x = parts[2];
    g.y = parts[3];
    return g;
}

std::string sanitizeForFilename(std::string s) {
    std::replace_if(s.begin(), s.end(),
                    [](char c) { return c == '.' || c == ':' || c == '/'; }, '_');
    return s;
}

} // anonymous namespace

// =============================================================================
// Command line
// =============================================================================

std::vector<std::string> buildMirrorCommand(const config::ScrcpyConfig& cfg,
                                            const std::string& serial,
                                            const std::string& display_name,
                                            ScreenSize screen,
                                            const std::string& record_file) {
    std::string title = cfg.window_title;
    if (title.empty()) title = display_name.empty() ? "Tether: " + serial : display_name;

    std::vector<std::string> cmd = {
        cfg.scrcpy_path.empty() ? std::string("scrcpy") : cfg.scrcpy_path,
        "--serial", serial,
        "--window-title", title,
    };

    WindowGeometry g = parseGeometry(cfg.window_geometry);
    g.width = std::min(g.width, screen.width);
    g.height = std::min(g.height, screen.height);

    if (!cfg.fullscreen) {
        cmd.insert(cmd.end(), {"--window-width", std::to_string(g.width),
                               "--window-height", std::to_string(g.height)});
        // -1/-1 = let the window manager center it
        if (g.x != -1 && g.y != -1) {
            int x = std::min(std::max(0, g.x), screen.width - g.width);
            int y = std::min(std::max(0, g.y), screen.height - g.height);
            cmd.insert(cmd.end(), {"--window-x", std::to_string(x),
                                   "--window-y", std::to_string(y)});
        }
    }

    if (cfg.always_on_top) cmd.push_back("--always-on-top");
    if (cfg.fullscreen) cmd.push_back("--fullscreen");
    if (cfg.window_borderless) cmd.push_back("--window-borderless");
    if (cfg.max_size > 0) cmd.insert(cmd.end(), {"--max-size", std::to_string(cfg.max_size)});
    if (cfg.rotation > 0) cmd.insert(cmd.end(), {"--rotation", std::to_string(cfg.rotation)});
    if (cfg.stay_awake) cmd.push_back("--stay-awake");

    if (!cfg.enable_audio) cmd.push_back("--no-audio");
    cmd.insert(cmd.end(), {"--video-codec", cfg.video_codec.empty() ? "h264" : cfg.video_codec});
    cmd.insert(cmd.end(), {"--video-bit-rate", std::to_string(cfg.video_bitrate) + "M"});
    if (cfg.max_fps > 0) cmd.insert(cmd.end(), {"--max-fps", std::to_string(cfg.max_fps)});

    if (cfg.show_touches) cmd.push_back("--show-touches");
    if (cfg.turn_screen_off) cmd.push_back("--turn-screen-off");

    if (cfg.record && !record_file.empty()) {
        cmd.insert(cmd.end(), {"--record", record_file});
        if (!cfg.record_format.empty()) {
            cmd.insert(cmd.end(), {"--record-format", cfg.record_format});
        }
    }
    if (cfg.otg) cmd.push_back("--otg");

    return cmd;
}

std::string recordingFilePath(const config::ScrcpyConfig& cfg, const std::string& serial) {
    const std::string dir = cfg.record_path.empty()
        ? paths::getUserDataDirectory() + "/recordings"
        : cfg.record_path;

    time_t t = time(nullptr);
    struct tm tm_{};
    localtime_r(&t, &tm_);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_);

    const std::string ext = cfg.record_format.empty() ? "mp4" : cfg.record_format;
    return dir + "/tether_" + sanitizeForFilename(serial) + "_" + stamp + "." + ext;
}

// =============================================================================
// MirrorSessionManager
// =============================================================================

MirrorSessionManager::MirrorSessionManager(ProcessLauncher& launcher, config::ScrcpyConfig cfg,
                                           EventBus* bus)
    : launcher_(launcher), bus_(bus), cfg_(std::move(cfg)) {}

MirrorSessionManager::~MirrorSessionManager() {
    shutdown();
}

void MirrorSessionManager::setConfig(const config::ScrcpyConfig& cfg) {
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = cfg;
}

void MirrorSessionManager::setScreenSize(ScreenSize size) {
    std::lock_guard<std::mutex> lock(mutex_);
    screen_ = size;
}

void MirrorSessionManager::onStop(MirrorStopCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    stop_callbacks_.push_back(std::move(cb));
}

void MirrorSessionManager::reapWatchersLocked() {
    auto it = std::remove_if(watchers_.begin(), watchers_.end(), [](Watcher& w) {
        if (!w.done->load()) return false;
        if (w.thread.joinable()) w.thread.join();
        return true;
    });
    watchers_.erase(it, watchers_.end());
}

bool MirrorSessionManager::startMirror(const std::string& address, int port,
                                       const std::string& display_name) {
    const std::string serial = makeSerial(address, port);
    if (!isValidSerial(serial)) {
        TLOG_ERROR("mirror", "Invalid serial rejected: %s", serial.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) return false;
    reapWatchersLocked();

    auto it = sessions_.find(serial);
    if (it != sessions_.end()) {
        if (it->second->running()) {
            TLOG_DEBUG("mirror", "Already mirroring %s", serial.c_str());
            return true;
        }
        sessions_.erase(it);   // exited, watcher has not caught up yet
    }

    std::string record_file;
    if (cfg_.record) {
        record_file = recordingFilePath(cfg_, serial);
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(record_file).parent_path(), ec);
        if (ec) {
            TLOG_WARN("mirror", "Cannot create recording directory: %s", ec.message().c_str());
            record_file.clear();
        }
    }

    auto argv = buildMirrorCommand(cfg_, serial, display_name, screen_, record_file);
    TLOG_INFO("mirror", "Starting: %s", joinCommandLine(argv).c_str());

    auto launched = launcher_.launch(argv);
    if (launched.is_err()) {
        TLOG_ERROR("mirror", "Failed to start mirroring %s: %s", serial.c_str(),
                   launched.error().message.c_str());
        return false;
    }

    std::shared_ptr<ChildProcess> proc = launched.value();
    sessions_[serial] = proc;

    Watcher w;
    w.done = std::make_shared<std::atomic<bool>>(false);
    auto done = w.done;
    w.thread = std::thread([this, serial, proc, done]() {
        watch(serial, proc);
        done->store(true);
    });
    watchers_.push_back(std::move(w));
    return true;
}

void MirrorSessionManager::watch(const std::string& serial, std::shared_ptr<ChildProcess> proc) {
    int code = proc->wait();

    bool owned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(serial);
        if (it != sessions_.end() && it->second == proc) {
            sessions_.erase(it);
            owned = true;
        }
    }
    if (!owned) return;   // stopped or replaced meanwhile

    TLOG_INFO("mirror", "Mirroring of %s ended (exit %d)", serial.c_str(), code);

    std::vector<MirrorStopCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = stop_callbacks_;
    }
    for (auto& cb : callbacks) {
        try {
            cb(serial);
        } catch (const std::exception& e) {
            TLOG_ERROR("mirror", "Stop callback threw: %s", e.what());
        }
    }
    if (bus_) {
        MirrorStoppedEvent ev;
        ev.serial = serial;
        bus_->publish(ev);
    }
}

void MirrorSessionManager::endProcess(const std::string& serial, ChildProcess& proc) {
    proc.terminate();
    if (!proc.waitFor(kStopGracePeriod)) {
        TLOG_WARN("mirror", "%s ignored SIGTERM, killing", serial.c_str());
        proc.kill();
        proc.waitFor(std::chrono::seconds(1));
    }
}

bool MirrorSessionManager::stopMirror(const std::string& address, int port) {
    const std::string serial = makeSerial(address, port);

    std::shared_ptr<ChildProcess> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(serial);
        if (it == sessions_.end()) {
            TLOG_DEBUG("mirror", "Nothing to stop for %s", serial.c_str());
            return false;
        }
        proc = it->second;
        sessions_.erase(it);   // slot is cleared whichever path ends the process
    }

    TLOG_INFO("mirror", "Stopping %s (pid %d)", serial.c_str(), proc->pid());
    endProcess(serial, *proc);
    return true;
}

bool MirrorSessionManager::isMirroring(const std::string& address, int port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(makeSerial(address, port));
    return it != sessions_.end() && it->second->running();
}

std::vector<std::string> MirrorSessionManager::activeSerials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [serial, proc] : sessions_) {
        if (proc->running()) out.push_back(serial);
    }
    return out;
}

void MirrorSessionManager::shutdown() {
    std::map<std::string, std::shared_ptr<ChildProcess>> sessions;
    std::vector<Watcher> watchers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        sessions.swap(sessions_);
    }

    for (auto& [serial, proc] : sessions) endProcess(serial, *proc);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        watchers.swap(watchers_);
    }
    // Watchers exit once their process is reaped; join without the lock
    for (auto& w : watchers) {
        if (w.thread.joinable()) w.thread.join();
    }
    TLOG_INFO("mirror", "Session manager shut down (%zu sessions ended)", sessions.size());
}

} // namespace tether
