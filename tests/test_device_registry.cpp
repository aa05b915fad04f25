// =============================================================================
// Unit tests for DeviceRegistry (src/device_registry.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include "device_registry.hpp"
#include "test_fakes.hpp"

using namespace tether;
using tether::fakes::FakeAdb;
using tether::fakes::TempDir;

namespace {

DeviceRecord makeRecord(const std::string& address, int connect_port, const std::string& name = "") {
    DeviceRecord r;
    r.address = address;
    r.pair_port = 40000;
    r.connect_port = connect_port;
    r.password = "ABCDE";
    r.name = name;
    return r;
}

std::string readAll(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeAll(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

} // namespace

class DeviceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = dir_.file("paired_devices.json");
        sub_ = bus_.subscribe<DevicesChangedEvent>([this](const DevicesChangedEvent& e) {
            events_.push_back(e.reason + ":" + e.address);
        });
    }

    TempDir dir_;
    std::string path_;
    EventBus bus_;
    FakeAdb adb_;
    std::vector<std::string> events_;
    SubscriptionHandle sub_;
};

// ---------------------------------------------------------------------------
// DeviceRecord
// ---------------------------------------------------------------------------
TEST(DeviceRecordTest, SerialUsesConnectPort) {
    EXPECT_EQ(makeRecord("10.0.0.7", 5555).serial(), "10.0.0.7:5555");
}

TEST(DeviceRecordTest, MergeOnlyOverwritesPresentFields) {
    DeviceRecord base = makeRecord("10.0.0.7", 5555, "Pixel 7");
    base.model = "panther";
    base.thumbnail = "/tmp/old.png";

    DeviceRecord update;
    update.address = "10.0.0.7";
    update.connect_port = 37000;
    update.extra["nickname"] = "work phone";
    base.mergeFrom(update);

    EXPECT_EQ(base.connect_port, 37000);
    EXPECT_EQ(base.pair_port, 40000);
    EXPECT_EQ(base.name, "Pixel 7");
    EXPECT_EQ(base.model, "panther");
    ASSERT_TRUE(base.thumbnail.has_value());
    EXPECT_EQ(*base.thumbnail, "/tmp/old.png");
    EXPECT_EQ(base.extra["nickname"], "work phone");
}

TEST(DeviceRecordTest, JsonKeepsUnknownKeysAndNullThumbnail) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "address": "10.0.0.7", "pair_port": 40000, "connect_port": 5555,
        "password": "ABCDE", "name": "Pixel 7", "thumbnail": null,
        "color": "#ff0000"
    })");
    DeviceRecord r = j.get<DeviceRecord>();
    EXPECT_EQ(r.address, "10.0.0.7");
    EXPECT_FALSE(r.thumbnail.has_value());
    EXPECT_EQ(r.extra["color"], "#ff0000");

    nlohmann::json out = r;
    EXPECT_TRUE(out["thumbnail"].is_null());
    EXPECT_EQ(out["color"], "#ff0000");
    EXPECT_EQ(out["connect_port"], 5555);
}

TEST(DeviceRecordTest, WrongFieldTypeIgnored) {
    nlohmann::json j = nlohmann::json::parse(R"({"address": "10.0.0.7", "connect_port": "5555"})");
    DeviceRecord r = j.get<DeviceRecord>();
    EXPECT_EQ(r.connect_port, 0);
}

TEST(DeviceRecordTest, IsoTimestampShape) {
    std::string ts = currentIsoTimestamp();
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts[13], ':');
}

// ---------------------------------------------------------------------------
// Load / persist
// ---------------------------------------------------------------------------
TEST_F(DeviceRegistryTest, MissingFileIsEmptyRegistry) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_FALSE(reg.hasUnsavedChanges());
}

TEST_F(DeviceRegistryTest, UpsertPersistsBeforeReturning) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    reg.upsert(makeRecord("10.0.0.7", 5555, "Pixel 7"));

    // A second instance sees the write immediately
    DeviceRegistry other(path_, bus_, adb_);
    other.load();
    auto rec = other.find("10.0.0.7");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->name, "Pixel 7");
    EXPECT_EQ(rec->connect_port, 5555);

    auto text = readAll(path_);
    EXPECT_EQ(text.front(), '[');
    EXPECT_NE(text.find("\n    {"), std::string::npos);  // 4-space indentation
}

TEST_F(DeviceRegistryTest, UpsertMergesByAddress) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    reg.upsert(makeRecord("10.0.0.7", 5555, "Pixel 7"));

    DeviceRecord update;
    update.address = "10.0.0.7";
    update.connect_port = 37123;
    reg.upsert(update);

    ASSERT_EQ(reg.size(), 1u);
    auto rec = reg.find("10.0.0.7");
    EXPECT_EQ(rec->connect_port, 37123);
    EXPECT_EQ(rec->name, "Pixel 7");

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0], "added:10.0.0.7");
    EXPECT_EQ(events_[1], "updated:10.0.0.7");
}

TEST_F(DeviceRegistryTest, IdenticalUpsertIsIdempotent) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    const DeviceRecord r = makeRecord("10.0.0.7", 5555, "Pixel 7");

    reg.upsert(r);
    const std::string first_write = readAll(path_);
    reg.upsert(r);

    ASSERT_EQ(reg.size(), 1u);
    auto rec = reg.find("10.0.0.7");
    EXPECT_EQ(rec->connect_port, 5555);
    EXPECT_EQ(rec->name, "Pixel 7");
    EXPECT_EQ(readAll(path_), first_write);

    // One notification per call
    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0], "added:10.0.0.7");
    EXPECT_EQ(events_[1], "updated:10.0.0.7");
}

TEST_F(DeviceRegistryTest, UpsertEmptyAddressThrows) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    EXPECT_THROW(reg.upsert(DeviceRecord{}), std::invalid_argument);
    EXPECT_TRUE(events_.empty());
}

TEST_F(DeviceRegistryTest, DuplicateAddressesInFileCollapse) {
    writeAll(path_, R"([
        {"address": "10.0.0.7", "connect_port": 5555, "name": "Pixel 7"},
        {"address": "10.0.0.7", "connect_port": 37000},
        {"address": "10.0.0.8", "connect_port": 5555},
        {"name": "no address"}
    ])");
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();

    ASSERT_EQ(reg.size(), 2u);
    auto rec = reg.find("10.0.0.7");
    EXPECT_EQ(rec->connect_port, 37000);
    EXPECT_EQ(rec->name, "Pixel 7");
}

TEST_F(DeviceRegistryTest, UnknownKeysSurviveRewrite) {
    writeAll(path_, R"([{"address": "10.0.0.7", "connect_port": 5555, "pinned": true}])");
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();

    DeviceRecord update;
    update.address = "10.0.0.7";
    update.name = "Pixel 7";
    reg.upsert(update);

    auto j = nlohmann::json::parse(readAll(path_));
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[0]["pinned"], true);
    EXPECT_EQ(j[0]["name"], "Pixel 7");
}

TEST_F(DeviceRegistryTest, CorruptFileOnLoadIsEmpty) {
    writeAll(path_, "{ not json");
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    EXPECT_EQ(reg.size(), 0u);
}

TEST_F(DeviceRegistryTest, ReloadPicksUpExternalEdits) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    reg.upsert(makeRecord("10.0.0.7", 5555));
    events_.clear();

    writeAll(path_, R"([{"address": "10.0.0.9", "connect_port": 5555}])");
    reg.reload();

    EXPECT_FALSE(reg.find("10.0.0.7").has_value());
    EXPECT_TRUE(reg.find("10.0.0.9").has_value());
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0], "reloaded:");
}

TEST_F(DeviceRegistryTest, ReloadOfCorruptFileKeepsCache) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    reg.upsert(makeRecord("10.0.0.7", 5555));
    events_.clear();

    writeAll(path_, "[{ broken");
    reg.reload();

    EXPECT_TRUE(reg.find("10.0.0.7").has_value());
    EXPECT_TRUE(events_.empty());
}

TEST_F(DeviceRegistryTest, WriteFailureLeavesMemoryAuthoritative) {
    // Parent "directory" is a regular file, so create_directories fails
    writeAll(dir_.file("blocker"), "x");
    DeviceRegistry reg(dir_.file("blocker") + "/devices.json", bus_, adb_);
    reg.load();
    reg.upsert(makeRecord("10.0.0.7", 5555));

    EXPECT_TRUE(reg.find("10.0.0.7").has_value());
    EXPECT_TRUE(reg.hasUnsavedChanges());
}

// ---------------------------------------------------------------------------
// Remove
// ---------------------------------------------------------------------------
TEST_F(DeviceRegistryTest, RemoveDisconnectsMatchingSerials) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    reg.upsert(makeRecord("10.0.0.7", 5555));
    reg.upsert(makeRecord("10.0.0.8", 5555));
    adb_.devices = {"10.0.0.7:5555", "10.0.0.7:37000", "10.0.0.8:5555"};
    events_.clear();

    EXPECT_TRUE(reg.remove("10.0.0.7"));

    auto calls = adb_.disconnectCalls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "10.0.0.7:37000");
    EXPECT_EQ(calls[1], "10.0.0.7:5555");
    EXPECT_FALSE(reg.find("10.0.0.7").has_value());
    EXPECT_TRUE(reg.find("10.0.0.8").has_value());
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0], "removed:10.0.0.7");

    DeviceRegistry other(path_, bus_, adb_);
    other.load();
    EXPECT_EQ(other.size(), 1u);
}

TEST_F(DeviceRegistryTest, RemoveUnknownAddressIsNoOp) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    EXPECT_FALSE(reg.remove("10.0.0.42"));
    EXPECT_TRUE(adb_.disconnectCalls().empty());
    EXPECT_TRUE(events_.empty());
}

TEST_F(DeviceRegistryTest, RemoveOfflineDeviceSkipsDisconnect) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    reg.upsert(makeRecord("10.0.0.7", 5555));
    adb_.setDevices({"10.0.0.8:5555"});   // someone else is connected
    events_.clear();

    EXPECT_TRUE(reg.remove("10.0.0.7"));
    EXPECT_TRUE(adb_.disconnectCalls().empty());
    EXPECT_FALSE(reg.find("10.0.0.7").has_value());
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0], "removed:10.0.0.7");
}

TEST_F(DeviceRegistryTest, RemoveStillWorksWhenListingFails) {
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();
    reg.upsert(makeRecord("10.0.0.7", 5555));
    adb_.setListFails(true);

    EXPECT_TRUE(reg.remove("10.0.0.7"));
    EXPECT_EQ(reg.size(), 0u);
}

// ---------------------------------------------------------------------------
// Concurrency
// ---------------------------------------------------------------------------
TEST_F(DeviceRegistryTest, ConcurrentUpsertsKeepOneRecordPerAddress) {
    sub_.reset();
    DeviceRegistry reg(path_, bus_, adb_);
    reg.load();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&reg, t]() {
            for (int i = 0; i < 10; ++i) {
                reg.upsert(makeRecord("10.0.0." + std::to_string(i), 5555 + t));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(reg.size(), 10u);
    DeviceRegistry other(path_, bus_, adb_);
    other.load();
    EXPECT_EQ(other.size(), 10u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
