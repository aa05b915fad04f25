#include "ipc/status_publisher.hpp"
#include "ipc/unix_socket.hpp"
#include "connection_reconciler.hpp"
#include "device_registry.hpp"
#include "mirror_session_manager.hpp"
#include "task_queue.hpp"
#include "tether_log.hpp"

#include <thread>

namespace tether::ipc {

nlohmann::json buildStatusSnapshot(const std::vector<DeviceStatus>& devices) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& d : devices) {
        list.push_back({
            {"name", d.name},
            {"address", d.address},
            {"connected", d.connected},
            {"mirroring", d.mirroring},
            {"model", d.model},
            {"manufacturer", d.manufacturer},
            {"android_version", d.android_version},
        });
    }
    return nlohmann::json{{"devices", list}};
}

StatusPublisher::StatusPublisher(DeviceRegistry& registry, ConnectionReconciler& reconciler,
                                 MirrorSessionManager& sessions, StatusPublisherOptions opts)
    : registry_(registry), reconciler_(reconciler), sessions_(sessions), opts_(std::move(opts)) {}

std::vector<DeviceStatus> StatusPublisher::collect() const {
    std::vector<DeviceStatus> out;
    for (const auto& rec : registry_.getDevices()) {
        DeviceStatus s;
        s.name = rec.name.empty() ? "Unknown Device" : rec.name;
        s.address = rec.address;
        s.connected = reconciler_.isConnected(rec.address);
        s.mirroring = rec.connect_port > 0 && sessions_.isMirroring(rec.address, rec.connect_port);
        s.model = rec.model;
        s.manufacturer = rec.manufacturer;
        s.android_version = rec.android_version;
        out.push_back(std::move(s));
    }
    return out;
}

Result<void, IoError> StatusPublisher::send(const std::string& path, const std::string& payload,
                                            int max_attempts, std::chrono::milliseconds retry_delay) {
    if (max_attempts < 1) max_attempts = 1;
    IoError last("no attempt made");
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        auto conn = connectUnix(path);
        if (conn.is_ok()) {
            UniqueFd fd = std::move(conn).value();
            return sendAll(fd.get(), payload);
        }
        last = conn.error();
        // Only a tray that is not up yet is worth waiting for
        if (last.kind != IoError::Kind::NotFound &&
            last.kind != IoError::Kind::ConnectionRefused) {
            break;
        }
        if (attempt < max_attempts) std::this_thread::sleep_for(retry_delay);
    }
    return last;
}

bool StatusPublisher::push() {
    const std::string payload = buildStatusSnapshot(collect()).dump();
    auto res = send(opts_.socket_path, payload, opts_.max_attempts, opts_.retry_delay);
    if (res.is_err()) {
        TLOG_DEBUG("ipc", "Status push to %s dropped: %s",
                   opts_.socket_path.c_str(), res.error().message.c_str());
        return false;
    }
    TLOG_DEBUG("ipc", "Status pushed (%zu bytes)", payload.size());
    return true;
}

void StatusPublisher::pushAsync(MainContext& ctx) {
    if (pending_.exchange(true)) return;
    bool queued = ctx.post([this]() {
        pending_ = false;
        push();
    });
    if (!queued) pending_ = false;
}

} // namespace tether::ipc
