#include "adb_client.hpp"
#include "tether_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <sys/stat.h>
#include <arpa/inet.h>

namespace tether {

namespace {

bool fileExists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

// Foreground package from `dumpsys window windows`
// mCurrentFocus=Window{1a2b3c u0 com.example/com.example.Main}
std::string parseFocusedPackage(const std::string& dump) {
    auto pos = dump.find("mCurrentFocus=Window{");
    if (pos == std::string::npos) return "";
    auto close = dump.find('}', pos);
    auto slash = dump.find('/', pos);
    if (slash == std::string::npos || (close != std::string::npos && slash > close)) return "";
    auto space = dump.rfind(' ', slash);
    if (space == std::string::npos || space < pos) return "";
    return dump.substr(space + 1, slash - space - 1);
}

} // anonymous namespace

// =============================================================================
// Helpers
// =============================================================================

std::string trimWhitespace(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool isConnectSuccess(const std::string& output) {
    const std::string text = toLower(output);
    if (contains(text, "unable")) return false;
    return contains(text, "connected");   // also matches "already connected"
}

bool isValidIpv4(const std::string& address) {
    if (address.empty() || address.size() > 15) return false;
    in_addr addr{};
    return ::inet_pton(AF_INET, address.c_str(), &addr) == 1;
}

bool isValidSerial(const std::string& serial) {
    if (serial.empty() || serial.size() > 64) return false;
    for (char c : serial) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

std::string makeSerial(const std::string& address, int port) {
    return address + ":" + std::to_string(port);
}

std::optional<std::pair<std::string, int>> splitSerial(const std::string& serial) {
    auto colon = serial.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= serial.size()) {
        return std::nullopt;
    }
    const std::string port_str = serial.substr(colon + 1);
    for (char c : port_str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    if (port_str.size() > 5) return std::nullopt;
    int port = std::stoi(port_str);
    if (port <= 0 || port > 65535) return std::nullopt;
    return std::make_pair(serial.substr(0, colon), port);
}

std::vector<std::string> parseDeviceList(const std::string& output) {
    std::vector<std::string> serials;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (line.find("List of devices") != std::string::npos) continue;
        if (line.rfind("* daemon", 0) == 0) continue;

        // "serial\tstate"
        size_t tab = line.find('\t');
        if (tab == std::string::npos) continue;
        std::string serial = line.substr(0, tab);
        std::string state = trimWhitespace(line.substr(tab + 1));
        if (state == "device" && !serial.empty()) serials.push_back(serial);
    }
    return serials;
}

std::vector<MdnsService> parseMdnsServices(const std::string& output) {
    std::vector<MdnsService> services;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.find("List of discovered") != std::string::npos) continue;

        std::istringstream fields(line);
        std::vector<std::string> tokens;
        std::string tok;
        while (fields >> tok) tokens.push_back(tok);
        if (tokens.size() < 2) continue;

        MdnsService svc;
        for (const auto& t : tokens) {
            auto colon = t.rfind(':');
            if (colon != std::string::npos) {
                auto split = splitSerial(t);
                if (split && isValidIpv4(split->first)) {
                    svc.address = split->first;
                    svc.port = split->second;
                    continue;
                }
            }
            auto tcp = t.find("._tcp");
            if (tcp != std::string::npos) {
                // Either a bare type or "instance._adb-tls-connect._tcp."
                auto type_start = t.find("._adb");
                if (type_start != std::string::npos && type_start > 0) {
                    if (svc.instance.empty()) svc.instance = t.substr(0, type_start);
                    svc.type = t.substr(type_start + 1, tcp + 5 - type_start - 1);
                } else {
                    svc.type = t.substr(0, tcp + 5);
                }
            } else if (svc.instance.empty()) {
                svc.instance = t;
            }
        }
        if (!svc.address.empty() && !svc.type.empty()) services.push_back(std::move(svc));
    }
    return services;
}

std::optional<int> findConnectPort(AdbTransport& adb, const std::string& address) {
    for (const auto& svc : adb.mdnsServices()) {
        if (svc.address == address && svc.type.find("_adb-tls-connect") != std::string::npos) {
            return svc.port;
        }
    }
    return std::nullopt;
}

// =============================================================================
// AdbClient
// =============================================================================

AdbClient::AdbClient(config::AdbConfig cfg)
    : cfg_(std::move(cfg)),
      adb_path_(cfg_.adb_path.empty() ? "adb" : cfg_.adb_path),
      timeout_(std::chrono::seconds(cfg_.connection_timeout > 0 ? cfg_.connection_timeout : 10)) {}

Result<ProcessResult, IoError> AdbClient::run(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(adb_path_);
    argv.insert(argv.end(), args.begin(), args.end());

    TLOG_DEBUG("adb", "exec: %s", joinCommandLine(argv).c_str());
    auto res = runProcess(argv, timeout_);
    if (res.is_err()) {
        TLOG_ERROR("adb", "Failed to run %s: %s", adb_path_.c_str(), res.error().message.c_str());
        return res;
    }
    if (res.value().timed_out) {
        return IoError("adb " + (args.empty() ? std::string() : args[0]) + " timed out",
                       IoError::Kind::Timeout);
    }
    return res;
}

bool AdbClient::pair(const std::string& address, int port, const std::string& secret) {
    if (!isValidIpv4(address)) {
        TLOG_ERROR("adb", "Invalid pairing address rejected: %s", address.c_str());
        return false;
    }
    auto res = run({"pair", makeSerial(address, port), secret});
    if (res.is_err()) return false;

    const auto& r = res.value();
    const std::string text = toLower(r.output);
    bool ok = r.exit_code == 0 && contains(text, "successfully paired");
    if (!ok) {
        TLOG_WARN("adb", "pair %s:%d: %s", address.c_str(), port, trimWhitespace(r.output).c_str());
    }
    return ok;
}

bool AdbClient::connect(const std::string& address, int port) {
    const std::string serial = makeSerial(address, port);
    if (!isValidSerial(serial)) {
        TLOG_ERROR("adb", "Invalid serial rejected: %s", serial.c_str());
        return false;
    }
    auto res = run({"connect", serial});
    if (res.is_err()) return false;

    const std::string out = trimWhitespace(res.value().output);
    bool ok = isConnectSuccess(out);
    TLOG_INFO("adb", "connect %s -> %s", serial.c_str(), out.c_str());
    return ok;
}

bool AdbClient::disconnect(const std::string& serial) {
    if (!isValidSerial(serial)) {
        TLOG_ERROR("adb", "Invalid serial rejected: %s", serial.c_str());
        return false;
    }
    auto res = run({"disconnect", serial});
    if (res.is_err()) return false;
    TLOG_INFO("adb", "disconnect %s -> %s", serial.c_str(),
              trimWhitespace(res.value().output).c_str());
    return res.value().exit_code == 0;
}

Result<std::vector<std::string>, IoError> AdbClient::listDevices() {
    auto res = run({"devices"});
    if (res.is_err()) return res.error();
    if (res.value().exit_code != 0) {
        return IoError("adb devices exited with " + std::to_string(res.value().exit_code));
    }
    return parseDeviceList(res.value().output);
}

std::string AdbClient::getProp(const std::string& serial, const std::string& prop) {
    if (!isValidSerial(serial)) return "";
    auto res = run({"-s", serial, "shell", "getprop", prop});
    if (res.is_err() || res.value().exit_code != 0) {
        TLOG_DEBUG("adb", "getprop %s on %s failed", prop.c_str(), serial.c_str());
        return "";
    }
    return trimWhitespace(res.value().output);
}

std::vector<MdnsService> AdbClient::mdnsServices() {
    auto res = run({"mdns", "services"});
    if (res.is_err() || res.value().exit_code != 0) {
        TLOG_DEBUG("adb", "mdns services unavailable");
        return {};
    }
    return parseMdnsServices(res.value().output);
}

std::optional<std::string> AdbClient::captureScreenshot(const std::string& serial,
                                                        const std::string& local_path) {
    auto fallback = [&]() -> std::optional<std::string> {
        if (fileExists(local_path)) return local_path;
        return std::nullopt;
    };

    if (!isValidSerial(serial)) return std::nullopt;

    auto window = run({"-s", serial, "shell", "dumpsys", "window"});
    auto windows = run({"-s", serial, "shell", "dumpsys", "window", "windows"});
    if (window.is_err() || windows.is_err()) return fallback();

    const std::string& w = window.value().output;
    const std::string& ws = windows.value().output;
    bool screen_off = contains(w, "mDreamingLockscreen=true") ||
                      contains(w, "mScreenOn=false") ||
                      contains(w, "mInteractive=false");
    bool locked = contains(ws, "mShowingLockscreen=true") ||
                  contains(ws, "mDreamingLockscreen=true");
    if (screen_off || locked) {
        TLOG_INFO("adb", "%s locked or screen off, keeping previous thumbnail", serial.c_str());
        return fallback();
    }

    const std::string package = parseFocusedPackage(ws);
    const std::string remote = "/sdcard/tether_screen.png";

    auto home = run({"-s", serial, "shell", "input", "keyevent", "3"});
    if (home.is_err() || home.value().exit_code != 0) return fallback();

    auto cap = run({"-s", serial, "shell", "screencap", "-p", remote});
    if (cap.is_err() || cap.value().exit_code != 0) {
        TLOG_WARN("adb", "screencap failed on %s", serial.c_str());
        return fallback();
    }

    if (!package.empty()) {
        auto back = run({"-s", serial, "shell", "monkey", "-p", package, "1"});
        if (back.is_err()) {
            TLOG_DEBUG("adb", "Could not return to %s", package.c_str());
        }
    }

    auto pull = run({"-s", serial, "pull", remote, local_path});
    if (pull.is_err() || pull.value().exit_code != 0) {
        TLOG_WARN("adb", "pull of screenshot from %s failed", serial.c_str());
        return fallback();
    }
    return local_path;
}

} // namespace tether
