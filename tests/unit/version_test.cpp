#include <gtest/gtest.h>

#include "tbc/core/result.hpp"
#include "tbc/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(tbc::Version::major, 0);
    EXPECT_EQ(tbc::Version::minor, 3);
    EXPECT_EQ(tbc::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(tbc::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = tbc::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = tbc::Result<int>::err(tbc::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOrAndBoolConversion) {
    auto ok = tbc::Result<int>::ok(10);
    auto err = tbc::Result<int>::err(tbc::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
    EXPECT_EQ(err.error().code, -1);
}

TEST(ResultTest, MoveOutOfRvalue) {
    auto text = tbc::Result<std::string>::ok("granary").value();
    EXPECT_EQ(text, "granary");
}

TEST(ResultVoidTest, OkAndError) {
    auto ok = tbc::Result<void>::ok();
    EXPECT_TRUE(ok.hasValue());

    auto err = tbc::Result<void>::err(tbc::Error("void error"));
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error().message, "void error");
}
