#include "command_dispatcher.hpp"
#include "adb_client.hpp"
#include "connection_reconciler.hpp"
#include "device_registry.hpp"
#include "mirror_session_manager.hpp"
#include "tether_log.hpp"

namespace tether {

CommandDispatcher::CommandDispatcher(AdbTransport& adb, DeviceRegistry& registry,
                                     ConnectionReconciler& reconciler,
                                     MirrorSessionManager& sessions, PresentationHooks& hooks)
    : adb_(adb), registry_(registry), reconciler_(reconciler), sessions_(sessions), hooks_(hooks) {}

void CommandDispatcher::stateChanged() {
    if (on_state_changed_) on_state_changed_();
}

bool CommandDispatcher::dispatch(const ipc::Command& cmd) {
    if (cmd.name == "show") {
        hooks_.presentMainWindow();
        return true;
    }
    if (cmd.name == "pair_new") {
        hooks_.showPairDialog();
        return true;
    }
    if (cmd.name == "quit") {
        hooks_.quit();
        return true;
    }
    if (cmd.name == "connect") return connectDevice(cmd.argument);
    if (cmd.name == "disconnect") return disconnectDevice(cmd.argument);
    if (cmd.name == "mirror") return toggleMirror(cmd.argument);
    if (cmd.name == "unpair") return unpairDevice(cmd.argument);

    TLOG_WARN("ipc", "No handler for command '%s'", cmd.name.c_str());
    return false;
}

bool CommandDispatcher::connectDevice(const std::string& address) {
    auto rec = registry_.find(address);
    if (!rec) {
        TLOG_WARN("ipc", "connect: %s is not a paired device", address.c_str());
        return false;
    }

    int port = rec->connect_port;
    bool ok = port > 0 && adb_.connect(address, port);
    if (!ok) {
        // The connect port moves whenever wireless debugging restarts
        auto current = findConnectPort(adb_, address);
        if (current && *current != port) {
            TLOG_INFO("ipc", "Found %s on port %d, retrying", address.c_str(), *current);
            ok = adb_.connect(address, *current);
            if (ok) {
                DeviceRecord update;
                update.address = address;
                update.connect_port = *current;
                registry_.upsert(update);
                port = *current;
            }
        } else if (!current) {
            TLOG_ERROR("ipc", "Could not find %s; is wireless debugging enabled?", address.c_str());
        }
    }

    if (!ok) {
        TLOG_ERROR("ipc", "Connecting to %s failed", address.c_str());
        return false;
    }

    reconciler_.noteConnected(address, port);
    stateChanged();
    return true;
}

bool CommandDispatcher::disconnectDevice(const std::string& address) {
    auto rec = registry_.find(address);
    if (!rec) {
        TLOG_WARN("ipc", "disconnect: %s is not a paired device", address.c_str());
        return false;
    }
    bool ok = adb_.disconnect(rec->serial());
    reconciler_.noteDisconnected(address);
    stateChanged();
    return ok;
}

bool CommandDispatcher::toggleMirror(const std::string& address) {
    auto rec = registry_.find(address);
    if (!rec) {
        TLOG_WARN("ipc", "mirror: %s is not a paired device", address.c_str());
        return false;
    }
    if (rec->connect_port <= 0) {
        TLOG_WARN("ipc", "mirror: %s has no known connect port", address.c_str());
        return false;
    }

    bool ok;
    if (sessions_.isMirroring(address, rec->connect_port)) {
        ok = sessions_.stopMirror(address, rec->connect_port);
    } else {
        ok = sessions_.startMirror(address, rec->connect_port, rec->name);
    }
    stateChanged();
    return ok;
}

bool CommandDispatcher::unpairDevice(const std::string& address) {
    auto rec = registry_.find(address);
    if (!rec) {
        TLOG_WARN("ipc", "unpair: %s is not a paired device", address.c_str());
        return false;
    }
    // A session on a forgotten device would have no way to be stopped
    sessions_.stopMirror(address, rec->connect_port);
    bool removed = registry_.remove(address);
    if (removed) stateChanged();
    return removed;
}

} // namespace tether
