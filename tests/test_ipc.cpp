// =============================================================================
// Unit tests for the IPC channels: command parsing, CommandServer,
// StatusPublisher and CommandDispatcher over real Unix sockets
// =============================================================================
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "command_dispatcher.hpp"
#include "connection_reconciler.hpp"
#include "device_registry.hpp"
#include "ipc/command_server.hpp"
#include "ipc/status_publisher.hpp"
#include "ipc/unix_socket.hpp"
#include "mirror_session_manager.hpp"
#include "test_fakes.hpp"

using namespace tether;
using namespace tether::ipc;
using namespace std::chrono_literals;
using tether::fakes::FakeAdb;
using tether::fakes::FakeLauncher;
using tether::fakes::TempDir;

namespace {

template<typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

void sendCommand(const std::string& path, const std::string& text) {
    auto conn = connectUnix(path);
    ASSERT_TRUE(conn.is_ok()) << conn.error().message;
    UniqueFd fd = std::move(conn).value();
    ASSERT_TRUE(sendAll(fd.get(), text).is_ok());
}

// Accept one connection on `listener` and read it to EOF
std::string receiveOne(int listen_fd) {
    auto client = acceptWithTimeout(listen_fd, 2000ms);
    if (client.is_err() || !client.value().valid()) return "";
    UniqueFd fd = std::move(client).value();
    auto data = recvAll(fd.get(), 64 * 1024, 2000ms);
    return data.is_ok() ? data.value() : "";
}

} // namespace

// ---------------------------------------------------------------------------
// parseCommand
// ---------------------------------------------------------------------------
TEST(ParseCommandTest, BareTokens) {
    for (const char* name : {"show", "pair_new", "quit"}) {
        auto cmd = parseCommand(name);
        ASSERT_TRUE(cmd.has_value()) << name;
        EXPECT_EQ(cmd->name, name);
        EXPECT_TRUE(cmd->argument.empty());
    }
}

TEST(ParseCommandTest, AddressCommands) {
    auto cmd = parseCommand("mirror:10.0.0.7");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->name, "mirror");
    EXPECT_EQ(cmd->argument, "10.0.0.7");

    cmd = parseCommand("  unpair:10.0.0.8\n");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->name, "unpair");
    EXPECT_EQ(cmd->argument, "10.0.0.8");
}

TEST(ParseCommandTest, RejectsUnknownAndIncomplete) {
    EXPECT_FALSE(parseCommand("").has_value());
    EXPECT_FALSE(parseCommand("   ").has_value());
    EXPECT_FALSE(parseCommand("reboot").has_value());
    EXPECT_FALSE(parseCommand("connect:").has_value());
    EXPECT_FALSE(parseCommand("connect").has_value());
    EXPECT_FALSE(parseCommand("format:/dev/sda").has_value());
}

TEST(ParseCommandTest, KnownCommandList) {
    EXPECT_TRUE(isKnownCommand("disconnect"));
    EXPECT_TRUE(isKnownCommand("pair_new"));
    EXPECT_FALSE(isKnownCommand("devices"));
}

// ---------------------------------------------------------------------------
// Socket helpers
// ---------------------------------------------------------------------------
TEST(UnixSocketTest, StaleSocketFileReplaced) {
    TempDir dir;
    const std::string path = dir.file("stale.sock");
    {
        auto first = listenUnix(path);
        ASSERT_TRUE(first.is_ok());
        // fd closes here, the file stays behind
    }
    auto second = listenUnix(path);
    EXPECT_TRUE(second.is_ok()) << second.error().message;
}

TEST(UnixSocketTest, LiveListenerNotStolen) {
    TempDir dir;
    const std::string path = dir.file("live.sock");
    auto first = listenUnix(path);
    ASSERT_TRUE(first.is_ok());

    auto second = listenUnix(path);
    EXPECT_TRUE(second.is_err());
}

TEST(UnixSocketTest, ConnectToMissingPath) {
    TempDir dir;
    auto conn = connectUnix(dir.file("nobody.sock"));
    ASSERT_TRUE(conn.is_err());
    EXPECT_EQ(conn.error().kind, IoError::Kind::NotFound);
}

TEST(UnixSocketTest, AcceptTimesOutWithEmptyFd) {
    TempDir dir;
    auto listening = listenUnix(dir.file("quiet.sock"));
    ASSERT_TRUE(listening.is_ok());
    auto client = acceptWithTimeout(listening.value().get(), 20ms);
    ASSERT_TRUE(client.is_ok());
    EXPECT_FALSE(client.value().valid());
}

// ---------------------------------------------------------------------------
// CommandServer
// ---------------------------------------------------------------------------
class CommandServerTest : public ::testing::Test {
protected:
    CommandServer::Handler recorder() {
        return [this](const Command& c) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(c.name + "|" + c.argument);
        };
    }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    TempDir dir_;
    std::mutex mutex_;
    std::vector<std::string> received_;
};

TEST_F(CommandServerTest, DeliversCommandsInOrder) {
    CommandServer server(dir_.file("app.sock"), recorder(), 50ms);
    ASSERT_TRUE(server.start().is_ok());
    EXPECT_TRUE(server.is_running());

    sendCommand(server.path(), "show");
    ASSERT_TRUE(waitUntil([&] { return received().size() == 1; }));
    sendCommand(server.path(), "connect:10.0.0.7");
    ASSERT_TRUE(waitUntil([&] { return received().size() == 2; }));

    auto got = received();
    EXPECT_EQ(got[0], "show|");
    EXPECT_EQ(got[1], "connect|10.0.0.7");
    server.stop();
}

TEST_F(CommandServerTest, UnknownCommandsIgnored) {
    CommandServer server(dir_.file("app.sock"), recorder(), 50ms);
    ASSERT_TRUE(server.start().is_ok());

    sendCommand(server.path(), "self_destruct");
    sendCommand(server.path(), "mirror:");
    sendCommand(server.path(), "quit");
    ASSERT_TRUE(waitUntil([&] { return !received().empty(); }));
    std::this_thread::sleep_for(50ms);

    auto got = received();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], "quit|");
    server.stop();
}

TEST_F(CommandServerTest, ThrowingHandlerKeepsServing) {
    std::atomic<int> calls{0};
    CommandServer server(dir_.file("app.sock"), [&](const Command&) {
        if (calls++ == 0) throw std::runtime_error("handler failed");
    }, 50ms);
    ASSERT_TRUE(server.start().is_ok());

    sendCommand(server.path(), "show");
    sendCommand(server.path(), "show");
    EXPECT_TRUE(waitUntil([&] { return calls.load() == 2; }));
    server.stop();
}

TEST_F(CommandServerTest, StopIsPromptAndReleasesPath) {
    const std::string path = dir_.file("app.sock");
    CommandServer server(path, recorder(), 50ms);
    ASSERT_TRUE(server.start().is_ok());

    auto t0 = std::chrono::steady_clock::now();
    server.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    EXPECT_FALSE(server.is_running());
    server.stop();

    CommandServer again(path, recorder(), 50ms);
    EXPECT_TRUE(again.start().is_ok());
}

TEST_F(CommandServerTest, SecondServerOnSamePathFails) {
    const std::string path = dir_.file("app.sock");
    CommandServer first(path, recorder(), 50ms);
    ASSERT_TRUE(first.start().is_ok());
    CommandServer second(path, recorder(), 50ms);
    EXPECT_TRUE(second.start().is_err());
    EXPECT_FALSE(second.is_running());
}

// ---------------------------------------------------------------------------
// StatusPublisher
// ---------------------------------------------------------------------------
TEST(StatusSnapshotTest, DocumentShape) {
    DeviceStatus d;
    d.name = "Pixel 7";
    d.address = "10.0.0.7";
    d.connected = true;
    d.model = "panther";
    auto j = buildStatusSnapshot({d});

    ASSERT_TRUE(j.contains("devices"));
    ASSERT_EQ(j["devices"].size(), 1u);
    const auto& dev = j["devices"][0];
    EXPECT_EQ(dev["name"], "Pixel 7");
    EXPECT_EQ(dev["address"], "10.0.0.7");
    EXPECT_EQ(dev["connected"], true);
    EXPECT_EQ(dev["mirroring"], false);
    EXPECT_EQ(dev["model"], "panther");
    EXPECT_EQ(dev["manufacturer"], "");
    EXPECT_EQ(dev["android_version"], "");

    EXPECT_EQ(buildStatusSnapshot({})["devices"].size(), 0u);
}

TEST(StatusSendTest, GivesUpAfterRetryBudget) {
    TempDir dir;
    auto t0 = std::chrono::steady_clock::now();
    auto res = StatusPublisher::send(dir.file("tray.sock"), "{}", 3, 20ms);
    auto elapsed = std::chrono::steady_clock::now() - t0;

    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.error().kind, IoError::Kind::NotFound);
    EXPECT_GE(elapsed, 40ms);   // two waits between three attempts
}

// Registry + reconciler + session manager wired together over fakes
class IpcWiringTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<DeviceRegistry>(dir_.file("devices.json"), bus_, adb_);
        registry_->load();
        reconciler_ = std::make_unique<ConnectionReconciler>(adb_, *registry_, bus_);
        sessions_ = std::make_unique<MirrorSessionManager>(launcher_, config::ScrcpyConfig{}, &bus_);

        DeviceRecord a;
        a.address = "10.0.0.7";
        a.connect_port = 5555;
        a.name = "Pixel 7";
        a.model = "panther";
        a.manufacturer = "Google";
        a.android_version = "14";
        registry_->upsert(a);

        DeviceRecord b;
        b.address = "10.0.0.8";
        b.connect_port = 37000;
        registry_->upsert(b);
    }

    void TearDown() override { sessions_->shutdown(); }

    TempDir dir_;
    EventBus bus_;
    FakeAdb adb_;
    FakeLauncher launcher_;
    std::unique_ptr<DeviceRegistry> registry_;
    std::unique_ptr<ConnectionReconciler> reconciler_;
    std::unique_ptr<MirrorSessionManager> sessions_;
};

TEST_F(IpcWiringTest, PushDeliversSnapshotToTray) {
    const std::string tray = dir_.file("tray.sock");
    auto listening = listenUnix(tray);
    ASSERT_TRUE(listening.is_ok());

    reconciler_->noteConnected("10.0.0.7", 5555);
    ASSERT_TRUE(sessions_->startMirror("10.0.0.7", 5555, "Pixel 7"));

    StatusPublisherOptions opts;
    opts.socket_path = tray;
    opts.max_attempts = 1;
    StatusPublisher publisher(*registry_, *reconciler_, *sessions_, opts);

    std::string payload;
    std::thread reader([&]() { payload = receiveOne(listening.value().get()); });
    EXPECT_TRUE(publisher.push());
    reader.join();

    auto j = nlohmann::json::parse(payload);
    ASSERT_EQ(j["devices"].size(), 2u);
    for (const auto& dev : j["devices"]) {
        if (dev["address"] == "10.0.0.7") {
            EXPECT_EQ(dev["name"], "Pixel 7");
            EXPECT_EQ(dev["connected"], true);
            EXPECT_EQ(dev["mirroring"], true);
            EXPECT_EQ(dev["android_version"], "14");
        } else {
            EXPECT_EQ(dev["address"], "10.0.0.8");
            // Unnamed devices get a placeholder name
            EXPECT_EQ(dev["name"], "Unknown Device");
            EXPECT_EQ(dev["connected"], false);
            EXPECT_EQ(dev["mirroring"], false);
        }
    }
}

TEST_F(IpcWiringTest, PushWithoutTrayIsDropped) {
    StatusPublisherOptions opts;
    opts.socket_path = dir_.file("tray.sock");
    opts.max_attempts = 2;
    opts.retry_delay = 1ms;
    StatusPublisher publisher(*registry_, *reconciler_, *sessions_, opts);
    EXPECT_FALSE(publisher.push());
}

namespace {

class RecordingHooks : public PresentationHooks {
public:
    void presentMainWindow() override { shows++; }
    void showPairDialog() override { pair_dialogs++; }
    void quit() override { quits++; }

    std::atomic<int> shows{0};
    std::atomic<int> pair_dialogs{0};
    std::atomic<int> quits{0};
};

} // namespace

// ---------------------------------------------------------------------------
// CommandDispatcher
// ---------------------------------------------------------------------------
TEST_F(IpcWiringTest, WindowCommandsReachHooks) {
    RecordingHooks hooks;
    CommandDispatcher dispatcher(adb_, *registry_, *reconciler_, *sessions_, hooks);

    EXPECT_TRUE(dispatcher.dispatch({"show", ""}));
    EXPECT_TRUE(dispatcher.dispatch({"pair_new", ""}));
    EXPECT_TRUE(dispatcher.dispatch({"quit", ""}));
    EXPECT_EQ(hooks.shows.load(), 1);
    EXPECT_EQ(hooks.pair_dialogs.load(), 1);
    EXPECT_EQ(hooks.quits.load(), 1);
}

TEST_F(IpcWiringTest, MirrorTogglesOverSocket) {
    RecordingHooks hooks;
    CommandDispatcher dispatcher(adb_, *registry_, *reconciler_, *sessions_, hooks);
    std::atomic<int> changes{0};
    dispatcher.setStateChangedCallback([&]() { changes++; });

    CommandServer server(dir_.file("app.sock"),
                         [&](const Command& c) { dispatcher.dispatch(c); }, 50ms);
    ASSERT_TRUE(server.start().is_ok());

    sendCommand(server.path(), "mirror:10.0.0.7");
    ASSERT_TRUE(waitUntil([&] { return sessions_->isMirroring("10.0.0.7", 5555); }));

    sendCommand(server.path(), "mirror:10.0.0.7");
    ASSERT_TRUE(waitUntil([&] { return !sessions_->isMirroring("10.0.0.7", 5555); }));

    sendCommand(server.path(), "mirror:10.0.0.7");
    ASSERT_TRUE(waitUntil([&] { return sessions_->isMirroring("10.0.0.7", 5555); }));

    EXPECT_TRUE(waitUntil([&] { return changes.load() == 3; }));
    EXPECT_EQ(launcher_.launchCount(), 2u);
    server.stop();
}

TEST_F(IpcWiringTest, ConnectFollowsMovedPort) {
    RecordingHooks hooks;
    CommandDispatcher dispatcher(adb_, *registry_, *reconciler_, *sessions_, hooks);

    adb_.setReachable({"10.0.0.7:41234"});
    adb_.mdns = {{"adb-XYZ", "_adb-tls-connect._tcp", "10.0.0.7", 41234}};

    EXPECT_TRUE(dispatcher.connectDevice("10.0.0.7"));
    EXPECT_EQ(registry_->find("10.0.0.7")->connect_port, 41234);
    EXPECT_TRUE(reconciler_->isConnected("10.0.0.7"));
}

TEST_F(IpcWiringTest, CommandsForUnknownDevicesRejected) {
    RecordingHooks hooks;
    CommandDispatcher dispatcher(adb_, *registry_, *reconciler_, *sessions_, hooks);

    EXPECT_FALSE(dispatcher.dispatch({"connect", "10.9.9.9"}));
    EXPECT_FALSE(dispatcher.dispatch({"disconnect", "10.9.9.9"}));
    EXPECT_FALSE(dispatcher.dispatch({"mirror", "10.9.9.9"}));
    EXPECT_FALSE(dispatcher.dispatch({"unpair", "10.9.9.9"}));
    EXPECT_EQ(launcher_.launchCount(), 0u);
}

TEST_F(IpcWiringTest, MirrorWithoutConnectPortRejected) {
    RecordingHooks hooks;
    CommandDispatcher dispatcher(adb_, *registry_, *reconciler_, *sessions_, hooks);
    std::atomic<int> changes{0};
    dispatcher.setStateChangedCallback([&]() { changes++; });

    DeviceRecord c;
    c.address = "10.0.0.9";
    c.name = "Galaxy Tab";
    registry_->upsert(c);
    ASSERT_EQ(registry_->find("10.0.0.9")->connect_port, 0);

    EXPECT_FALSE(dispatcher.dispatch({"mirror", "10.0.0.9"}));
    EXPECT_FALSE(sessions_->isMirroring("10.0.0.9", 0));
    EXPECT_EQ(launcher_.launchCount(), 0u);
    EXPECT_EQ(changes.load(), 0);
}

TEST_F(IpcWiringTest, UnpairStopsMirrorAndForgets) {
    RecordingHooks hooks;
    CommandDispatcher dispatcher(adb_, *registry_, *reconciler_, *sessions_, hooks);
    ASSERT_TRUE(dispatcher.toggleMirror("10.0.0.7"));
    ASSERT_TRUE(sessions_->isMirroring("10.0.0.7", 5555));

    EXPECT_TRUE(dispatcher.unpairDevice("10.0.0.7"));
    EXPECT_FALSE(sessions_->isMirroring("10.0.0.7", 5555));
    EXPECT_FALSE(registry_->find("10.0.0.7").has_value());
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(IpcWiringTest, DisconnectMarksDeviceOffline) {
    RecordingHooks hooks;
    CommandDispatcher dispatcher(adb_, *registry_, *reconciler_, *sessions_, hooks);
    adb_.setDevices({"10.0.0.7:5555"});
    ASSERT_TRUE(reconciler_->pollOnce());

    EXPECT_TRUE(dispatcher.disconnectDevice("10.0.0.7"));
    EXPECT_FALSE(reconciler_->isConnected("10.0.0.7"));
    auto calls = adb_.disconnectCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], "10.0.0.7:5555");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
