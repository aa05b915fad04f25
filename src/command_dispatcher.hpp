#pragma once
// =============================================================================
// Tether - Command Dispatcher
// =============================================================================
// Maps command-channel messages onto registry / reconciler / session
// manager operations. Window-level commands go to PresentationHooks.
// =============================================================================

#include <functional>
#include <string>

#include "ipc/command_server.hpp"

namespace tether {

class AdbTransport;
class DeviceRegistry;
class ConnectionReconciler;
class MirrorSessionManager;

// Presentation-layer collaborator (window, pairing dialog, application exit)
class PresentationHooks {
public:
    virtual ~PresentationHooks() = default;
    virtual void presentMainWindow() = 0;
    virtual void showPairDialog() = 0;
    virtual void quit() = 0;
};

class CommandDispatcher {
public:
    CommandDispatcher(AdbTransport& adb, DeviceRegistry& registry,
                      ConnectionReconciler& reconciler, MirrorSessionManager& sessions,
                      PresentationHooks& hooks);

    // Invoked after any command that may have changed device state
    void setStateChangedCallback(std::function<void()> cb) { on_state_changed_ = std::move(cb); }

    // Returns false for commands that could not be carried out
    bool dispatch(const ipc::Command& cmd);

    bool connectDevice(const std::string& address);
    bool disconnectDevice(const std::string& address);
    bool toggleMirror(const std::string& address);
    bool unpairDevice(const std::string& address);

private:
    void stateChanged();

    AdbTransport& adb_;
    DeviceRegistry& registry_;
    ConnectionReconciler& reconciler_;
    MirrorSessionManager& sessions_;
    PresentationHooks& hooks_;
    std::function<void()> on_state_changed_;
};

} // namespace tether
