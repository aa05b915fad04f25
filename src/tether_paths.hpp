#pragma once
// =============================================================================
// Tether - Filesystem Locations
// =============================================================================
// Per-user data/config directories (XDG aware) and the temp directory.
// =============================================================================

#include <string>
#include <cstdlib>

#include <unistd.h>
#include <pwd.h>

namespace tether::paths {

/**
 * Get user's home directory ($HOME, falling back to the passwd entry).
 */
inline std::string getHomeDirectory() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : "/tmp";
    }
    return std::string(home);
}

/**
 * $XDG_DATA_HOME/tether or ~/.local/share/tether
 */
inline std::string getUserDataDirectory() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/tether";
    return getHomeDirectory() + "/.local/share/tether";
}

/**
 * $XDG_CONFIG_HOME/tether or ~/.config/tether
 */
inline std::string getConfigDirectory() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/tether";
    return getHomeDirectory() + "/.config/tether";
}

inline std::string getDefaultDevicesPath() {
    return getUserDataDirectory() + "/paired_devices.json";
}

inline std::string getDefaultSettingsPath() {
    return getConfigDirectory() + "/settings.json";
}

inline std::string getScreenshotDirectory() {
    return getUserDataDirectory() + "/screenshots";
}

} // namespace tether::paths
