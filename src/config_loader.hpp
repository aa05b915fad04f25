#pragma once
// =============================================================================
// Tether Config Loader
// =============================================================================
// Loads settings.json with nlohmann/json. Missing sections/keys keep their
// defaults; a missing or malformed file yields a default AppConfig.
// =============================================================================

#include <string>
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "tether_log.hpp"
#include "tether_paths.hpp"

namespace tether {
namespace config {

struct AppSection {
    bool auto_connect = true;
    int monitor_interval = 5;          // seconds between reconciler polls
};

struct AdbConfig {
    std::string adb_path;              // empty = 'adb' from PATH
    int connection_timeout = 10;       // seconds per adb invocation
    int max_retry_attempts = 5;        // connect attempts during pairing
    int retry_delay_ms = 1000;
};

// Pass-through options for the mirroring process command line
struct ScrcpyConfig {
    std::string scrcpy_path;           // empty = 'scrcpy' from PATH
    std::string window_title;          // empty = device name
    std::string window_geometry;       // "w,h,x,y"
    bool always_on_top = true;
    bool fullscreen = false;
    bool window_borderless = false;
    int max_size = 0;
    int rotation = 0;
    bool stay_awake = true;
    bool enable_audio = false;
    std::string video_codec = "h264";
    int video_bitrate = 8;             // Mbit/s
    int max_fps = 0;
    bool show_touches = false;
    bool turn_screen_off = false;
    bool record = false;
    std::string record_format = "mp4";
    std::string record_path;
    bool otg = false;
};

struct IpcConfig {
    std::string app_socket = "/tmp/tether_app.sock";
    std::string tray_socket = "/tmp/tether_tray.sock";
    int status_retry_attempts = 5;
    int status_retry_delay_ms = 500;
    int accept_timeout_ms = 1000;
};

struct LogConfig {
    std::string log_path;              // empty = stderr only
    std::string level = "info";
};

struct StorageConfig {
    std::string devices_path;          // empty = XDG data dir
};

struct AppConfig {
    AppSection app;
    AdbConfig adb;
    ScrcpyConfig scrcpy;
    IpcConfig ipc;
    LogConfig log;
    StorageConfig storage;

    std::string devicesPath() const {
        return storage.devices_path.empty() ? paths::getDefaultDevicesPath()
                                            : storage.devices_path;
    }
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.is_object()) return def;
    auto sec = j.find(section);
    if (sec == j.end() || !sec->is_object()) return def;
    auto it = sec->find(key);
    if (it == sec->end() || it->is_null()) return def;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        TLOG_WARN("config", "%s.%s has wrong type (%s), using default",
                  section.c_str(), key.c_str(), e.what());
        return def;
    }
}

inline AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;
    const AppConfig d;

    config.app.auto_connect = jsonGet<bool>(j, "app", "auto_connect", d.app.auto_connect);
    config.app.monitor_interval = jsonGet<int>(j, "app", "monitor_interval", d.app.monitor_interval);
    if (config.app.monitor_interval < 1) config.app.monitor_interval = 1;

    config.adb.adb_path = jsonGet<std::string>(j, "adb", "adb_path", d.adb.adb_path);
    config.adb.connection_timeout = jsonGet<int>(j, "adb", "connection_timeout", d.adb.connection_timeout);
    config.adb.max_retry_attempts = jsonGet<int>(j, "adb", "max_retry_attempts", d.adb.max_retry_attempts);
    config.adb.retry_delay_ms = jsonGet<int>(j, "adb", "retry_delay_ms", d.adb.retry_delay_ms);

    auto& s = config.scrcpy;
    s.scrcpy_path = jsonGet<std::string>(j, "scrcpy", "scrcpy_path", d.scrcpy.scrcpy_path);
    s.window_title = jsonGet<std::string>(j, "scrcpy", "window_title", d.scrcpy.window_title);
    s.window_geometry = jsonGet<std::string>(j, "scrcpy", "window_geometry", d.scrcpy.window_geometry);
    s.always_on_top = jsonGet<bool>(j, "scrcpy", "always_on_top", d.scrcpy.always_on_top);
    s.fullscreen = jsonGet<bool>(j, "scrcpy", "fullscreen", d.scrcpy.fullscreen);
    s.window_borderless = jsonGet<bool>(j, "scrcpy", "window_borderless", d.scrcpy.window_borderless);
    s.max_size = jsonGet<int>(j, "scrcpy", "max_size", d.scrcpy.max_size);
    s.rotation = jsonGet<int>(j, "scrcpy", "rotation", d.scrcpy.rotation);
    s.stay_awake = jsonGet<bool>(j, "scrcpy", "stay_awake", d.scrcpy.stay_awake);
    s.enable_audio = jsonGet<bool>(j, "scrcpy", "enable_audio", d.scrcpy.enable_audio);
    s.video_codec = jsonGet<std::string>(j, "scrcpy", "video_codec", d.scrcpy.video_codec);
    s.video_bitrate = jsonGet<int>(j, "scrcpy", "video_bitrate", d.scrcpy.video_bitrate);
    s.max_fps = jsonGet<int>(j, "scrcpy", "max_fps", d.scrcpy.max_fps);
    s.show_touches = jsonGet<bool>(j, "scrcpy", "show_touches", d.scrcpy.show_touches);
    s.turn_screen_off = jsonGet<bool>(j, "scrcpy", "turn_screen_off", d.scrcpy.turn_screen_off);
    s.record = jsonGet<bool>(j, "scrcpy", "record", d.scrcpy.record);
    s.record_format = jsonGet<std::string>(j, "scrcpy", "record_format", d.scrcpy.record_format);
    s.record_path = jsonGet<std::string>(j, "scrcpy", "record_path", d.scrcpy.record_path);
    s.otg = jsonGet<bool>(j, "scrcpy", "otg", d.scrcpy.otg);

    config.ipc.app_socket = jsonGet<std::string>(j, "ipc", "app_socket", d.ipc.app_socket);
    config.ipc.tray_socket = jsonGet<std::string>(j, "ipc", "tray_socket", d.ipc.tray_socket);
    config.ipc.status_retry_attempts = jsonGet<int>(j, "ipc", "status_retry_attempts", d.ipc.status_retry_attempts);
    config.ipc.status_retry_delay_ms = jsonGet<int>(j, "ipc", "status_retry_delay_ms", d.ipc.status_retry_delay_ms);
    config.ipc.accept_timeout_ms = jsonGet<int>(j, "ipc", "accept_timeout_ms", d.ipc.accept_timeout_ms);

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", d.log.log_path);
    config.log.level = jsonGet<std::string>(j, "log", "level", d.log.level);

    config.storage.devices_path = jsonGet<std::string>(j, "storage", "devices_path", d.storage.devices_path);

    return config;
}

/**
 * Override config from environment variables.
 * Environment variables take precedence over the settings file.
 */
inline void applyEnvironmentOverrides(AppConfig& config) {
    const char* val;

    if ((val = std::getenv("TETHER_ADB_PATH"))) config.adb.adb_path = val;
    if ((val = std::getenv("TETHER_SCRCPY_PATH"))) config.scrcpy.scrcpy_path = val;
    if ((val = std::getenv("TETHER_LOG_LEVEL"))) config.log.level = val;
    if ((val = std::getenv("TETHER_DEVICES_PATH"))) config.storage.devices_path = val;
}

// @param configPath  Path to settings file (empty = XDG default)
inline AppConfig loadConfig(const std::string& configPath = "") {
    const std::string path = configPath.empty() ? paths::getDefaultSettingsPath() : configPath;

    std::ifstream file(path);
    if (!file.is_open()) {
        TLOG_WARN("config", "%s not found, using defaults", path.c_str());
        return AppConfig{};
    }

    AppConfig config;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        TLOG_ERROR("config", "JSON parse error in %s: %s", path.c_str(), e.what());
        return AppConfig{};
    }

    TLOG_INFO("config", "Loaded %s: auto_connect=%d, monitor_interval=%ds, adb_timeout=%ds",
              path.c_str(), config.app.auto_connect ? 1 : 0,
              config.app.monitor_interval, config.adb.connection_timeout);

    return config;
}

} // namespace config
} // namespace tether
