#include "device_registry.hpp"
#include "adb_client.hpp"
#include "tether_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tether {

// =============================================================================
// DeviceRecord
// =============================================================================

namespace {

// Keys owned by DeviceRecord; everything else goes to `extra`
const char* const kKnownKeys[] = {
    "address", "pair_port", "connect_port", "password", "name", "model",
    "manufacturer", "android_version", "last_seen", "thumbnail",
};

bool isKnownKey(const std::string& key) {
    for (const char* k : kKnownKeys) {
        if (key == k) return true;
    }
    return false;
}

template<typename T>
T readField(const nlohmann::json& j, const char* key, const T& def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception&) {
        TLOG_WARN("registry", "Field '%s' has wrong type, ignored", key);
        return def;
    }
}

} // anonymous namespace

std::string currentIsoTimestamp() {
    time_t t = time(nullptr);
    char buf[32];
    struct tm tm_{};
    localtime_r(&t, &tm_);
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_);
    return buf;
}

std::string DeviceRecord::serial() const {
    return makeSerial(address, connect_port);
}

void DeviceRecord::mergeFrom(const DeviceRecord& u) {
    if (u.pair_port != 0) pair_port = u.pair_port;
    if (u.connect_port != 0) connect_port = u.connect_port;
    if (!u.password.empty()) password = u.password;
    if (!u.name.empty()) name = u.name;
    if (!u.model.empty()) model = u.model;
    if (!u.manufacturer.empty()) manufacturer = u.manufacturer;
    if (!u.android_version.empty()) android_version = u.android_version;
    if (u.thumbnail && !u.thumbnail->empty()) thumbnail = u.thumbnail;
    if (!u.last_seen.empty()) last_seen = u.last_seen;
    if (u.extra.is_object()) {
        for (auto it = u.extra.begin(); it != u.extra.end(); ++it) {
            extra[it.key()] = it.value();
        }
    }
}

void to_json(nlohmann::json& j, const DeviceRecord& r) {
    j = r.extra.is_object() ? r.extra : nlohmann::json::object();
    j["address"] = r.address;
    j["pair_port"] = r.pair_port;
    j["connect_port"] = r.connect_port;
    j["password"] = r.password;
    j["name"] = r.name;
    j["model"] = r.model;
    j["manufacturer"] = r.manufacturer;
    j["android_version"] = r.android_version;
    j["last_seen"] = r.last_seen;
    if (r.thumbnail) j["thumbnail"] = *r.thumbnail;
    else j["thumbnail"] = nullptr;
}

void from_json(const nlohmann::json& j, DeviceRecord& r) {
    r.address = readField<std::string>(j, "address", "");
    r.pair_port = readField<int>(j, "pair_port", 0);
    r.connect_port = readField<int>(j, "connect_port", 0);
    r.password = readField<std::string>(j, "password", "");
    r.name = readField<std::string>(j, "name", "");
    r.model = readField<std::string>(j, "model", "");
    r.manufacturer = readField<std::string>(j, "manufacturer", "");
    r.android_version = readField<std::string>(j, "android_version", "");
    r.last_seen = readField<std::string>(j, "last_seen", "");
    std::string thumb = readField<std::string>(j, "thumbnail", "");
    if (!thumb.empty()) r.thumbnail = thumb;
    else r.thumbnail.reset();

    r.extra = nlohmann::json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!isKnownKey(it.key())) r.extra[it.key()] = it.value();
    }
}

// =============================================================================
// DeviceRegistry
// =============================================================================

DeviceRegistry::DeviceRegistry(std::string path, EventBus& bus, AdbTransport& adb)
    : path_(std::move(path)), bus_(bus), adb_(adb) {}

Result<std::vector<DeviceRecord>, IoError> DeviceRegistry::readFile() const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            return IoError(path_ + " does not exist", IoError::Kind::NotFound, ENOENT);
        }
        return IoError("cannot open " + path_, IoError::Kind::PermissionDenied, errno);
    }

    std::vector<DeviceRecord> devices;
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_array()) {
            return IoError(path_ + ": expected a JSON array", IoError::Kind::Other);
        }
        for (const auto& item : j) {
            if (!item.is_object()) continue;
            DeviceRecord r = item.get<DeviceRecord>();
            if (r.address.empty()) {
                TLOG_WARN("registry", "Skipping record without address");
                continue;
            }
            // Exactly one record per address: later duplicates merge into the first
            auto it = std::find_if(devices.begin(), devices.end(),
                [&](const DeviceRecord& d) { return d.address == r.address; });
            if (it != devices.end()) it->mergeFrom(r);
            else devices.push_back(std::move(r));
        }
    } catch (const nlohmann::json::exception& e) {
        return IoError(path_ + ": " + e.what(), IoError::Kind::Other);
    }
    return devices;
}

Result<void, IoError> DeviceRegistry::writeFile(const std::vector<DeviceRecord>& devices) const {
    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return IoError("mkdir " + target.parent_path().string() + ": " + ec.message(),
                           IoError::Kind::PermissionDenied, ec.value());
        }
    }

    nlohmann::json j = nlohmann::json::array();
    for (const auto& d : devices) j.push_back(d);

    // Whole-file overwrite through a temp file so readers never see half a list
    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            int e = errno;
            return IoError("cannot write " + tmp + ": " + std::strerror(e),
                           e == EACCES ? IoError::Kind::PermissionDenied : IoError::Kind::Other, e);
        }
        out << j.dump(4);
        out.flush();
        if (!out) {
            fs::remove(tmp, ec);
            return IoError("short write to " + tmp, IoError::Kind::Other);
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return IoError("rename to " + path_ + " failed: " + ec.message(),
                       IoError::Kind::Other, ec.value());
    }
    return {};
}

void DeviceRegistry::persistLocked() {
    auto res = writeFile(devices_);
    if (res.is_err()) {
        // Memory stays authoritative until the next successful write
        dirty_ = true;
        TLOG_ERROR("registry", "Persist failed: %s", res.error().message.c_str());
        return;
    }
    dirty_ = false;
    TLOG_DEBUG("registry", "Saved %zu devices to %s", devices_.size(), path_.c_str());
}

void DeviceRegistry::notify(const std::string& address, const char* reason) {
    DevicesChangedEvent ev;
    ev.address = address;
    ev.reason = reason;
    bus_.publish(ev);
}

void DeviceRegistry::load() {
    auto res = readFile();
    std::lock_guard<std::mutex> lock(mutex_);
    if (res.is_err()) {
        if (res.error().kind == IoError::Kind::NotFound) {
            TLOG_INFO("registry", "No registry at %s yet", path_.c_str());
        } else {
            TLOG_ERROR("registry", "Load failed: %s", res.error().message.c_str());
        }
        devices_.clear();
        return;
    }
    devices_ = std::move(res.value());
    TLOG_INFO("registry", "Loaded %zu devices from %s", devices_.size(), path_.c_str());
}

void DeviceRegistry::reload() {
    auto res = readFile();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (res.is_err()) {
            if (res.error().kind == IoError::Kind::NotFound) {
                devices_.clear();
            } else {
                // Keep what we have rather than dropping every device on a bad file
                TLOG_ERROR("registry", "Reload failed, keeping %zu cached devices: %s",
                           devices_.size(), res.error().message.c_str());
                return;
            }
        } else {
            devices_ = std::move(res.value());
        }
        TLOG_INFO("registry", "Reloaded %zu devices", devices_.size());
    }
    notify("", "reloaded");
}

std::vector<DeviceRecord> DeviceRegistry::getDevices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

std::optional<DeviceRecord> DeviceRegistry::find(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& d : devices_) {
        if (d.address == address) return d;
    }
    return std::nullopt;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

bool DeviceRegistry::hasUnsavedChanges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

void DeviceRegistry::upsert(const DeviceRecord& record) {
    if (record.address.empty()) {
        throw std::invalid_argument("DeviceRegistry::upsert: empty address");
    }

    const char* reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(devices_.begin(), devices_.end(),
            [&](const DeviceRecord& d) { return d.address == record.address; });
        if (it != devices_.end()) {
            it->mergeFrom(record);
            reason = "updated";
        } else {
            devices_.push_back(record);
            reason = "added";
        }
        persistLocked();
    }

    TLOG_INFO("registry", "Device %s %s", record.address.c_str(), reason);
    notify(record.address, reason);
}

bool DeviceRegistry::remove(const std::string& address) {
    if (!find(address)) {
        TLOG_WARN("registry", "remove: %s is not registered", address.c_str());
        return false;
    }

    // Best-effort disconnect; the listing runs outside the lock
    auto listed = adb_.listDevices();
    if (listed.is_ok()) {
        for (const auto& serial : listed.value()) {
            auto split = splitSerial(serial);
            if (split && split->first == address) {
                TLOG_INFO("registry", "Disconnecting %s before removal", serial.c_str());
                adb_.disconnect(serial);
            }
        }
    } else {
        TLOG_WARN("registry", "Could not list devices before removing %s: %s",
                  address.c_str(), listed.error().message.c_str());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(devices_.begin(), devices_.end(),
            [&](const DeviceRecord& d) { return d.address == address; });
        // A concurrent remove may have won the race
        if (it == devices_.end()) return false;
        devices_.erase(it);
        persistLocked();
    }

    TLOG_INFO("registry", "Device %s removed", address.c_str());
    notify(address, "removed");
    return true;
}

} // namespace tether
