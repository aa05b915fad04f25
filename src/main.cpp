// =============================================================================
// Tether - tetherd entry point
// =============================================================================
// Headless daemon: discovery, reconciliation, pairing sessions and the
// local command/status channels. A tray or window front-end talks to it
// over the Unix sockets configured in settings.json.
// =============================================================================

#include "tether_context.hpp"
#include "tether_log.hpp"
#include "config_loader.hpp"
#include "mdns_browser.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void onSignal(int) {
    g_shutdown_requested = true;
}

void printUsage(const char* prog) {
    std::fprintf(stderr,
                 "Usage: %s [--config PATH] [--log-level LEVEL] [--pair PASSWORD]\n"
                 "  --config PATH       settings file (default: XDG config dir)\n"
                 "  --log-level LEVEL   trace|debug|info|warn|error\n"
                 "  --pair PASSWORD     open a pairing session at startup\n",
                 prog);
}

// No window in the daemon: presentation requests become log lines
class DaemonHooks : public tether::PresentationHooks {
public:
    void bind(tether::TetherContext* ctx) { ctx_ = ctx; }

    void presentMainWindow() override {
        TLOG_INFO("main", "'show' received; tetherd has no window");
    }

    void showPairDialog() override {
        tether::TetherContext* ctx = ctx_.load();
        if (!ctx) return;
        const std::string code = tether::PairingExecutor::generateCode();
        auto res = ctx->beginPairing(code);
        if (res.is_err()) {
            TLOG_ERROR("main", "Cannot open pairing session: %s", res.error().message.c_str());
            return;
        }
        TLOG_INFO("main", "Pairing session open, password: %s", code.c_str());
    }

    void quit() override {
        TLOG_INFO("main", "Quit requested over the command channel");
        g_shutdown_requested = true;
    }

private:
    std::atomic<tether::TetherContext*> ctx_{nullptr};
};

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string level_override;
    std::string pair_password;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "--config") == 0 && has_value) {
            config_path = argv[++i];
        } else if (std::strcmp(arg, "--log-level") == 0 && has_value) {
            level_override = argv[++i];
        } else if (std::strcmp(arg, "--pair") == 0 && has_value) {
            pair_password = argv[++i];
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    auto cfg = tether::config::loadConfig(config_path);
    tether::config::applyEnvironmentOverrides(cfg);
    if (!level_override.empty()) cfg.log.level = level_override;

    tether::log::setLogLevel(tether::log::parseLevel(cfg.log.level));
    if (!cfg.log.log_path.empty() && !tether::log::openLogFile(cfg.log.log_path.c_str())) {
        TLOG_WARN("main", "Cannot open log file %s, logging to stderr", cfg.log.log_path.c_str());
    }
    TLOG_INFO("main", "tetherd starting...");

    // Keeps snap-packaged scrcpy from printing its launcher notice
    setenv("SNAP_LAUNCHER_NOTICE_ENABLED", "false", 1);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::signal(SIGPIPE, SIG_IGN);

    int exit_code = 0;
    try {
        DaemonHooks hooks;
        tether::ContextDeps deps;
        deps.browser = std::make_unique<tether::MdnsServiceBrowser>();

        tether::TetherContext ctx(cfg, std::move(deps), hooks);
        hooks.bind(&ctx);

        auto started = ctx.start();
        if (started.is_err()) {
            TLOG_FATAL("main", "Startup failed: %s", started.error().message.c_str());
            exit_code = 1;
        } else {
            if (!pair_password.empty()) {
                auto res = ctx.beginPairing(pair_password);
                if (res.is_err()) {
                    TLOG_ERROR("main", "Cannot open pairing session: %s",
                               res.error().message.c_str());
                }
            }

            while (!g_shutdown_requested) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        hooks.bind(nullptr);
        ctx.shutdown();
    } catch (const std::exception& e) {
        TLOG_FATAL("main", "Unhandled exception: %s", e.what());
        exit_code = 1;
    }

    TLOG_INFO("main", "tetherd exiting");
    tether::log::closeLogFile();
    return exit_code;
}
