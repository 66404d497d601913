#include <gtest/gtest.h>

#include "rgs/rgs.hpp"

using rgs::foundation::ErrorCode;
using rgs::foundation::GameError;
using rgs::foundation::GameResult;

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(rgs::Version::major, 0);
    EXPECT_EQ(rgs::Version::minor, 3);
    EXPECT_EQ(rgs::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(rgs::Version::string, "0.3.0");
}

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(rgs::foundation::errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(rgs::foundation::errorSubsystem(ErrorCode::IdentitySpaceExhausted), "Identity");
    EXPECT_EQ(rgs::foundation::errorSubsystem(ErrorCode::EntityNotFound), "Registry");
    EXPECT_EQ(rgs::foundation::errorSubsystem(ErrorCode::CommitBeforeSync), "Snapshot");
    EXPECT_EQ(rgs::foundation::errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
}

TEST(GameErrorTest, DefaultConstruction) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.entityId().has_value());
}

TEST(GameErrorTest, OnlyExhaustionIsFatal) {
    EXPECT_TRUE(GameError(ErrorCode::IdentitySpaceExhausted).isFatal());
    EXPECT_FALSE(GameError(ErrorCode::CommitBeforeSync).isFatal());
    EXPECT_FALSE(GameError(ErrorCode::InvalidArgument).isFatal());
}

TEST(GameResultTest, OkValue) {
    auto result = GameResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(GameResultTest, ErrorValue) {
    auto result = GameResult<int>::err(GameError(ErrorCode::NotFound, "something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message(), "something failed");
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST(GameResultTest, ValueOr) {
    auto ok = GameResult<int>::ok(10);
    auto err = GameResult<int>::err(GameError(ErrorCode::Unknown, "fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(GameResultTest, BoolConversion) {
    auto ok = GameResult<int>::ok(1);
    auto err = GameResult<int>::err(GameError(ErrorCode::Unknown, "fail"));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(GameResultVoidTest, Ok) {
    auto result = GameResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(GameResultVoidTest, Error) {
    auto result = GameResult<void>::err(GameError(ErrorCode::CommitBeforeSync, "void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message(), "void error");
}
