// VFACE - Error and Result Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>
#include "vface/core/error.h"

#include <memory>
#include <string>

namespace vface {
namespace test {

namespace {

Result<int> ParsePositive(int value) {
    if (value <= 0) {
        return Error(ErrorCode::InvalidArgument, "must be positive")
            .WithDetail("value", std::to_string(value));
    }
    return value;
}

Result<void> Forward(int value) {
    auto parsed = ParsePositive(value);
    if (!parsed) {
        return parsed.GetError();
    }
    return Result<void>::Ok();
}

} // namespace

// ============================================================================
// Error Classification
// ============================================================================

TEST(ErrorTest, KindsFollowCodes) {
    EXPECT_EQ(KindOf(ErrorCode::InvalidFingerprint), ErrorKind::Validation);
    EXPECT_EQ(KindOf(ErrorCode::DuplicateIdentity), ErrorKind::Conflict);
    EXPECT_EQ(KindOf(ErrorCode::IdentityRevoked), ErrorKind::Conflict);
    EXPECT_EQ(KindOf(ErrorCode::NotFound), ErrorKind::NotFound);
    EXPECT_EQ(KindOf(ErrorCode::NotOwner), ErrorKind::Authorization);
    EXPECT_EQ(KindOf(ErrorCode::ReplayDetected), ErrorKind::Replay);
    EXPECT_EQ(KindOf(ErrorCode::StaleTimestamp), ErrorKind::Replay);
    EXPECT_EQ(KindOf(ErrorCode::DecryptionError), ErrorKind::Integrity);
    EXPECT_EQ(KindOf(ErrorCode::RegistryUnavailable), ErrorKind::Infrastructure);
}

TEST(ErrorTest, OnlyInfrastructureIsRetryable) {
    EXPECT_TRUE(Error(ErrorCode::StorageError, "").IsRetryable());
    EXPECT_TRUE(Error(ErrorCode::KeyStoreError, "").IsRetryable());
    EXPECT_FALSE(Error(ErrorCode::ChainBroken, "").IsRetryable());
    EXPECT_FALSE(Error(ErrorCode::AlreadyRegistered, "").IsRetryable());
    EXPECT_FALSE(Error(ErrorCode::InvalidVector, "").IsRetryable());
}

TEST(ErrorTest, ToStringAndDetails) {
    Error error(ErrorCode::AlreadyRegistered, "Identity already registered");
    error.WithDetail("fingerprint", "ab").WithDetail("owner", "02cd");

    EXPECT_EQ(error.ToString(), "Conflict/AlreadyRegistered: Identity already registered");
    EXPECT_EQ(error.GetDetails().size(), 2u);
    EXPECT_EQ(error.GetDetails().at("owner"), "02cd");
    EXPECT_TRUE(error.Is(ErrorCode::AlreadyRegistered));

    EXPECT_EQ(Error(ErrorCode::NotFound, "").ToString(), "NotFound/NotFound");
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, ValueAndError) {
    auto ok = ParsePositive(5);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.Value(), 5);

    auto bad = ParsePositive(-1);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.GetError().Code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(bad.GetError().GetDetails().at("value"), "-1");
}

TEST(ResultTest, ValueOnErrorThrows) {
    auto bad = ParsePositive(0);
    EXPECT_THROW(bad.Value(), BadResultAccess);
}

TEST(ResultTest, VoidForwardsErrors) {
    EXPECT_TRUE(Forward(3));
    auto failed = Forward(0);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.GetError().Kind(), ErrorKind::Validation);
}

TEST(ResultTest, MoveOnlyValues) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    ASSERT_TRUE(result);
    std::unique_ptr<int> owned = std::move(result.Value());
    EXPECT_EQ(*owned, 7);
}

} // namespace test
} // namespace vface
