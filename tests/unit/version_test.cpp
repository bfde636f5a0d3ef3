#include <gtest/gtest.h>

#include <string>

#include "bulwark/bulwark.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(bulwark::Version::major, 0);
    EXPECT_EQ(bulwark::Version::minor, 3);
    EXPECT_EQ(bulwark::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(bulwark::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = bulwark::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = bulwark::Result<int>::err(bulwark::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = bulwark::Result<int>::err(bulwark::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
}

TEST(ResultTest, ValueOr) {
    auto ok = bulwark::Result<int>::ok(10);
    auto err = bulwark::Result<int>::err(bulwark::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = bulwark::Result<int>::ok(1);
    auto err = bulwark::Result<int>::err(bulwark::Error("fail"));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, MoveOutValue) {
    auto result = bulwark::Result<std::string>::ok("payload");
    std::string taken = std::move(result).value();
    EXPECT_EQ(taken, "payload");
}

TEST(ResultVoidTest, Ok) {
    auto result = bulwark::Result<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = bulwark::Result<void>::err(bulwark::Error("void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}

TEST(ResilienceResultTest, CarriesResilienceError) {
    using bulwark::foundation::ErrorCode;
    using bulwark::foundation::ResilienceError;

    auto result = bulwark::foundation::ResilienceResult<int>::err(
        ResilienceError(ErrorCode::CircuitOpen, "circuit breaker is open"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CircuitOpen);
    EXPECT_EQ(result.error().subsystem(), "Resilience");
}
