#include "pairing_executor.hpp"
#include "adb_client.hpp"
#include "tether_log.hpp"

#include <random>
#include <stdexcept>
#include <thread>

namespace tether {

namespace {

// Releases the in-flight slot on every exit path
class InFlightGuard {
public:
    InFlightGuard(std::mutex& m, std::set<std::string>& set, std::string address)
        : mutex_(m), set_(set), address_(std::move(address)) {}
    ~InFlightGuard() {
        std::lock_guard<std::mutex> lock(mutex_);
        set_.erase(address_);
    }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::mutex& mutex_;
    std::set<std::string>& set_;
    std::string address_;
};

} // anonymous namespace

PairingExecutor::PairingExecutor(AdbTransport& adb, DeviceRegistry& registry, PairingOptions opts)
    : adb_(adb), registry_(registry), opts_(opts) {
    if (opts_.max_attempts < 1) opts_.max_attempts = 1;
}

std::string PairingExecutor::generateCode(size_t length) {
    static const char kLetters[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<size_t> dist(0, sizeof(kLetters) - 2);
    std::string code;
    code.reserve(length);
    for (size_t i = 0; i < length; ++i) code += kLetters[dist(gen)];
    return code;
}

bool PairingExecutor::inFlight(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(address) > 0;
}

DeviceRecord PairingExecutor::fetchDeviceInfo(const std::string& address, int connect_port) {
    const std::string serial = makeSerial(address, connect_port);

    DeviceRecord info;
    const std::string market_name = adb_.getProp(serial, "ro.product.marketname");
    info.model = adb_.getProp(serial, "ro.product.device");
    info.manufacturer = adb_.getProp(serial, "ro.product.manufacturer");
    info.android_version = adb_.getProp(serial, "ro.build.version.release");

    if (!market_name.empty()) info.name = market_name;
    else if (!info.model.empty()) info.name = info.model;
    else info.name = "Unknown";

    info.last_seen = currentIsoTimestamp();
    return info;
}

bool PairingExecutor::pair(const std::string& address, int pair_port, int connect_port,
                           const std::string& secret, const StatusCallback& on_status) {
    auto status = [&](const std::string& msg) {
        TLOG_INFO("pairing", "%s", msg.c_str());
        if (!on_status) return;
        try {
            on_status(msg);
        } catch (const std::exception& e) {
            TLOG_ERROR("pairing", "Status callback threw: %s", e.what());
        }
    };

    if (address.empty()) {
        throw std::invalid_argument("PairingExecutor::pair: empty address");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_flight_.insert(address).second) {
            TLOG_WARN("pairing", "Pairing with %s already in progress", address.c_str());
            return false;
        }
    }
    InFlightGuard guard(mutex_, in_flight_, address);

    // Step 1: pair. A failure here may just mean the device is already paired.
    status("Pairing with " + address + ":" + std::to_string(pair_port) + "...");
    if (adb_.pair(address, pair_port, secret)) {
        status("Paired successfully");
    } else {
        status("Pairing failed, trying to connect anyway");
    }

    // Step 2: connect with a bounded retry budget
    status("Connecting to " + address + ":" + std::to_string(connect_port) + "...");
    bool connected = false;
    for (int attempt = 1; attempt <= opts_.max_attempts; ++attempt) {
        if (adb_.connect(address, connect_port)) {
            connected = true;
            break;
        }
        TLOG_DEBUG("pairing", "Connect attempt %d/%d to %s failed",
                   attempt, opts_.max_attempts, address.c_str());
        if (attempt < opts_.max_attempts) std::this_thread::sleep_for(opts_.retry_delay);
    }
    if (!connected) {
        status("Could not connect to " + address + ":" + std::to_string(connect_port));
        return false;
    }
    status("Connected successfully");

    // Step 3: identity
    status("Fetching device information...");
    DeviceRecord record = fetchDeviceInfo(address, connect_port);
    record.address = address;
    record.pair_port = pair_port;
    record.connect_port = connect_port;
    record.password = secret;

    // Step 4: persist
    registry_.upsert(record);
    status("Device saved: " + record.name);
    return true;
}

} // namespace tether
