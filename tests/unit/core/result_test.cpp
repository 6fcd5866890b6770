#include <gtest/gtest.h>
#include <chatmine/core/types.h>

#include <string>

using namespace chatmine;

TEST(ResultTest, HoldsValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 42);
    EXPECT_THROW((void)r.error(), std::runtime_error);
}

TEST(ResultTest, HoldsError) {
    Result<std::string> r = Error{ErrorCode::QueryFailed, "no such table"};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::QueryFailed);
    EXPECT_EQ(r.error().message, "no such table");
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok);
    Result<void> bad = ErrorCode::UnsupportedPlatform;
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::UnsupportedPlatform);
}

TEST(ResultTest, MoveOutValue) {
    Result<std::string> r = std::string("payload");
    std::string moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

TEST(ErrorCodeTest, HasReadableNames) {
    EXPECT_STREQ(errorToString(ErrorCode::DatabaseOpenFailed), "Database open failed");
    EXPECT_EQ(fmt::format("{}", ErrorCode::UnsupportedPlatform),
              errorToString(ErrorCode::UnsupportedPlatform));
}
