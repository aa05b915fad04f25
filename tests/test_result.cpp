// =============================================================================
// Unit tests for Result<T, E> (src/result.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <cerrno>
#include <memory>
#include <string>
#include <vector>
#include "result.hpp"

using namespace tether;

namespace {

Result<int, IoError> openRegistry(bool present) {
    if (!present) return IoError("devices.json missing", IoError::Kind::NotFound, ENOENT);
    return 3;
}

Result<std::vector<std::string>> listSerials(bool adb_ok) {
    if (!adb_ok) return Error("adb exited with 1", 1);
    return std::vector<std::string>{"10.0.0.7:5555", "10.0.0.8:5555"};
}

} // namespace

// -----------------------------------------------------------------------------

TEST(ResultTest, HoldsValue) {
    Result<int> r = 42;
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_err());
    EXPECT_EQ(r.value(), 42);
    EXPECT_THROW(r.error(), std::runtime_error);
}

TEST(ResultTest, HoldsError) {
    auto r = listSerials(false);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "adb exited with 1");
    EXPECT_EQ(r.error().code, 1);
    EXPECT_THROW(r.value(), std::runtime_error);
}

TEST(ResultTest, ValueCanBeMovedOut) {
    auto r = listSerials(true);
    ASSERT_TRUE(r.is_ok());
    std::vector<std::string> serials = std::move(r).value();
    ASSERT_EQ(serials.size(), 2u);
    EXPECT_EQ(serials[1], "10.0.0.8:5555");
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> r = std::make_unique<int>(7);
    ASSERT_TRUE(r.is_ok());
    auto p = std::move(r).value();
    EXPECT_EQ(*p, 7);
}

// -----------------------------------------------------------------------------

TEST(IoErrorTest, CarriesKindAndErrno) {
    auto r = openRegistry(false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, IoError::Kind::NotFound);
    EXPECT_EQ(r.error().code, ENOENT);
    EXPECT_EQ(openRegistry(true).value(), 3);
}

TEST(IoErrorTest, NarrowsIntoGenericError) {
    Result<std::string> r = IoError("connect refused", IoError::Kind::ConnectionRefused, ECONNREFUSED);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "connect refused");
    EXPECT_EQ(r.error().code, ECONNREFUSED);
}

TEST(IoErrorTest, DefaultKindIsOther) {
    IoError e("short write");
    EXPECT_EQ(e.kind, IoError::Kind::Other);
    EXPECT_EQ(e.code, 0);
}

// -----------------------------------------------------------------------------

TEST(VoidResultTest, SuccessAndFailure) {
    Result<void> ok;
    EXPECT_TRUE(ok.is_ok());
    EXPECT_THROW(ok.error(), std::runtime_error);

    Result<void, IoError> failed = IoError("poll timed out", IoError::Kind::Timeout);
    EXPECT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error().kind, IoError::Kind::Timeout);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
