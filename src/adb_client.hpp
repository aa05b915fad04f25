#pragma once
// =============================================================================
// Tether - ADB Transport
// =============================================================================
// Thin wrapper over the adb command line. Every call is bounded by the
// configured connection timeout; failures are logged and returned as
// false / empty / IoError, never thrown.
// =============================================================================

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config_loader.hpp"
#include "process_runner.hpp"
#include "result.hpp"

namespace tether {

// One line of `adb mdns services`
struct MdnsService {
    std::string instance;     // "adb-XXXX-YYYY"
    std::string type;         // "_adb-tls-connect._tcp"
    std::string address;      // IPv4
    int port = 0;
};

/**
 * Seam between the orchestration components and the adb binary.
 * Tests substitute a scripted fake.
 */
class AdbTransport {
public:
    virtual ~AdbTransport() = default;

    // `adb pair address:port secret`; true if adb reported success
    virtual bool pair(const std::string& address, int port, const std::string& secret) = 0;

    // `adb connect address:port`; true on "connected" / "already connected"
    virtual bool connect(const std::string& address, int port) = 0;

    virtual bool disconnect(const std::string& serial) = 0;

    // Serials currently in state "device"
    virtual Result<std::vector<std::string>, IoError> listDevices() = 0;

    // Trimmed property value, empty on failure
    virtual std::string getProp(const std::string& serial, const std::string& prop) = 0;

    virtual std::vector<MdnsService> mdnsServices() = 0;

    /**
     * Capture the home screen into local_path.
     * Locked or dark screen: keeps a previous capture if one exists.
     * Returns the file path, or nullopt when nothing usable is on disk.
     */
    virtual std::optional<std::string> captureScreenshot(const std::string& serial,
                                                         const std::string& local_path) = 0;
};

// =============================================================================
// AdbClient - runProcess() backed implementation
// =============================================================================
class AdbClient : public AdbTransport {
public:
    explicit AdbClient(config::AdbConfig cfg);

    bool pair(const std::string& address, int port, const std::string& secret) override;
    bool connect(const std::string& address, int port) override;
    bool disconnect(const std::string& serial) override;
    Result<std::vector<std::string>, IoError> listDevices() override;
    std::string getProp(const std::string& serial, const std::string& prop) override;
    std::vector<MdnsService> mdnsServices() override;
    std::optional<std::string> captureScreenshot(const std::string& serial,
                                                 const std::string& local_path) override;

    const std::string& adbPath() const { return adb_path_; }

private:
    // adb <args...>, bounded by the configured timeout
    Result<ProcessResult, IoError> run(const std::vector<std::string>& args);

    config::AdbConfig cfg_;
    std::string adb_path_;
    std::chrono::milliseconds timeout_;
};

// =============================================================================
// Helpers (pure, unit tested)
// =============================================================================

// "connected"/"already connected" present and "unable" absent, case-insensitive
bool isConnectSuccess(const std::string& output);

bool isValidIpv4(const std::string& address);

// alnum plus ".:-_", at most 64 chars
bool isValidSerial(const std::string& serial);

std::string makeSerial(const std::string& address, int port);

// "10.0.0.7:5555" -> {"10.0.0.7", 5555}
std::optional<std::pair<std::string, int>> splitSerial(const std::string& serial);

// `adb devices` output -> serials whose state is "device"
std::vector<std::string> parseDeviceList(const std::string& output);

// `adb mdns services` output -> entries with an IPv4 endpoint
std::vector<MdnsService> parseMdnsServices(const std::string& output);

// Current connect port advertised for address, if any
std::optional<int> findConnectPort(AdbTransport& adb, const std::string& address);

std::string trimWhitespace(const std::string& s);

} // namespace tether
