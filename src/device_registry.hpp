#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

#include "event_bus.hpp"
#include "result.hpp"

namespace tether {

class AdbTransport;

// =============================================================================
// DeviceRecord: one paired phone
// =============================================================================
struct DeviceRecord {
    // --- identity (primary key) ---
    std::string address;            // "192.168.1.5"

    // --- adb endpoints (may drift between sessions) ---
    int pair_port = 0;
    int connect_port = 0;
    std::string password;           // pairing secret

    // --- best-effort device properties ---
    std::string name;               // "Pixel 7"
    std::string model;              // "panther"
    std::string manufacturer;       // "Google"
    std::string android_version;    // "14"

    std::optional<std::string> thumbnail;
    std::string last_seen;          // ISO-8601 local time

    // Keys written by other tools, preserved on rewrite
    nlohmann::json extra = nlohmann::json::object();

    std::string serial() const;

    // Non-empty / non-zero fields of `update` overwrite this record
    void mergeFrom(const DeviceRecord& update);
};

void to_json(nlohmann::json& j, const DeviceRecord& r);
void from_json(const nlohmann::json& j, DeviceRecord& r);

// "2024-01-01T00:00:00"
std::string currentIsoTimestamp();

// =============================================================================
// DeviceRegistry: persisted list of paired devices
// =============================================================================
// Single source of truth for paired devices. Every mutation rewrites the
// whole file on the calling thread before returning, then publishes a
// DevicesChangedEvent once the internal lock is released.
class DeviceRegistry {
public:
    DeviceRegistry(std::string path, EventBus& bus, AdbTransport& adb);
    ~DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Initial read; missing file = empty registry
    void load();

    // Re-read the backing file (another process may have changed it)
    void reload();

    // Snapshot copy
    std::vector<DeviceRecord> getDevices() const;
    std::optional<DeviceRecord> find(const std::string& address) const;
    size_t size() const;

    // Merge by address; throws std::invalid_argument on an empty address
    void upsert(const DeviceRecord& record);

    // Disconnects a live connection first; false if the address is unknown
    bool remove(const std::string& address);

    // True once the last write failed and has not yet been retried successfully
    bool hasUnsavedChanges() const;

    const std::string& path() const { return path_; }

private:
    Result<std::vector<DeviceRecord>, IoError> readFile() const;
    Result<void, IoError> writeFile(const std::vector<DeviceRecord>& devices) const;
    void persistLocked();
    void notify(const std::string& address, const char* reason);

    const std::string path_;
    EventBus& bus_;
    AdbTransport& adb_;

    mutable std::mutex mutex_;
    std::vector<DeviceRecord> devices_;
    bool dirty_ = false;
};

} // namespace tether
