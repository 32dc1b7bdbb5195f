// VFACE - Fingerprint Derivation Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>
#include "vface/registry/fingerprint.h"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace vface {
namespace registry {
namespace test {

// ============================================================================
// Quantization
// ============================================================================

TEST(FormatQuantizedTest, RoundsHalfAwayFromZero) {
    EXPECT_EQ(FormatQuantized(0.12345, 4), "0.1235");
    EXPECT_EQ(FormatQuantized(-0.12345, 4), "-0.1235");
    EXPECT_EQ(FormatQuantized(0.00005, 4), "0.0001");
    EXPECT_EQ(FormatQuantized(2.5, 0), "3");
    EXPECT_EQ(FormatQuantized(-1.25, 1), "-1.3");
}

TEST(FormatQuantizedTest, StripsTrailingZeros) {
    EXPECT_EQ(FormatQuantized(0.1, 4), "0.1");
    EXPECT_EQ(FormatQuantized(0.99996, 4), "1");
    EXPECT_EQ(FormatQuantized(10.0, 6), "10");
    EXPECT_EQ(FormatQuantized(0.0, 4), "0");
}

TEST(FormatQuantizedTest, NegativeZeroIsZero) {
    EXPECT_EQ(FormatQuantized(-0.0, 4), "0");
    EXPECT_EQ(FormatQuantized(-0.00004, 4), "0");
}

TEST(FormatQuantizedTest, SmallValuesNeverUseExponents) {
    EXPECT_EQ(FormatQuantized(1e-7, 6), "0");
    EXPECT_EQ(FormatQuantized(5e-6, 6), "0.000005");
}

// ============================================================================
// Derivation
// ============================================================================

TEST(FingerprintTest, CanonicalText) {
    FingerprintDeriver deriver({4, 4});
    auto canonical = deriver.Canonicalize({3.0, 4.0, 0.0, 0.0});
    ASSERT_TRUE(canonical);
    EXPECT_EQ(canonical.Value(), "[0.6,0.8,0,0]");

    auto negative = deriver.Canonicalize({3.0, -4.0, 0.0, -0.0});
    ASSERT_TRUE(negative);
    EXPECT_EQ(negative.Value(), "[0.6,-0.8,0,0]");
}

TEST(FingerprintTest, KnownFingerprints) {
    FingerprintDeriver small({4, 4});
    EXPECT_EQ(small.Derive({3.0, 4.0, 0.0, 0.0}).Value(),
              "174dbb2106bf3b2387e118ef2415480392fc7d5c7d56595e3f8c9fd3d8d11338");

    FingerprintDeriver deriver;
    FeatureVector ones(DEFAULT_DIMENSION, 1.0);
    EXPECT_EQ(deriver.Derive(ones).Value(),
              "e8aeeb376140ee56dd48ade05ca06f50b125bda8dce7a77af97b44826829ae93");
}

TEST(FingerprintTest, ScaleInvariant) {
    FingerprintDeriver deriver({4, 4});
    auto a = deriver.Derive({0.3, 0.4, 0.0, 0.0});
    auto b = deriver.Derive({30.0, 40.0, 0.0, 0.0});
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a.Value(), b.Value());
    EXPECT_TRUE(IsValidFingerprint(a.Value()));
}

TEST(FingerprintTest, PrecisionAbsorbsSmallNoise) {
    FingerprintDeriver coarse({4, 2});
    auto a = coarse.Derive({0.6, 0.8, 0.0, 0.0});
    auto b = coarse.Derive({0.6001, 0.8, 0.0, 0.0});
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a.Value(), b.Value());

    FingerprintDeriver fine({4, 6});
    EXPECT_NE(fine.Derive({0.6, 0.8, 0.0, 0.0}).Value(),
              fine.Derive({0.6001, 0.8, 0.0, 0.0}).Value());
}

TEST(FingerprintTest, RejectsBadVectors) {
    FingerprintDeriver deriver({4, 4});

    auto wrongSize = deriver.Derive({1.0, 2.0, 3.0});
    ASSERT_FALSE(wrongSize);
    EXPECT_EQ(wrongSize.GetError().Code(), ErrorCode::DimensionMismatch);

    auto zero = deriver.Derive({0.0, 0.0, 0.0, 0.0});
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.GetError().Code(), ErrorCode::InvalidVector);

    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(deriver.Derive({nan, 1.0, 0.0, 0.0}).GetError().Code(), ErrorCode::InvalidVector);

    double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(deriver.Derive({inf, 1.0, 0.0, 0.0}).GetError().Code(), ErrorCode::InvalidVector);
}

TEST(FingerprintTest, RejectsBadConfig) {
    EXPECT_THROW(FingerprintDeriver({0, 4}), std::invalid_argument);
    EXPECT_THROW(FingerprintDeriver({128, -1}), std::invalid_argument);
    EXPECT_THROW(FingerprintDeriver({128, MAX_PRECISION + 1}), std::invalid_argument);
}

TEST(FingerprintTest, Validation) {
    EXPECT_TRUE(IsValidFingerprint(std::string(64, 'a')));
    EXPECT_FALSE(IsValidFingerprint(std::string(64, 'A')));
    EXPECT_FALSE(IsValidFingerprint(std::string(63, 'a')));
    EXPECT_FALSE(IsValidFingerprint(std::string(64, 'g')));
}

} // namespace test
} // namespace registry
} // namespace vface
