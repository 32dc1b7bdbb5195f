// VFACE - Similarity Matcher Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>
#include "vface/matcher/similarity.h"
#include "vface/matcher/vector_index.h"
#include "vface/util/logging.h"

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace vface {
namespace matcher {
namespace test {

// ============================================================================
// Similarity
// ============================================================================

TEST(SimilarityTest, Basics) {
    EXPECT_DOUBLE_EQ(Norm({3, 4}), 5.0);
    EXPECT_DOUBLE_EQ(Dot({1, 2, 3}, {4, 5, 6}), 32.0);
    EXPECT_DOUBLE_EQ(CosineSimilarity({1, 0}, {2, 0}), 1.0);
    EXPECT_DOUBLE_EQ(CosineSimilarity({1, 0}, {0, 3}), 0.0);
    EXPECT_DOUBLE_EQ(CosineSimilarity({1, 0}, {-1, 0}), -1.0);
    EXPECT_NEAR(CosineSimilarity({1, 1}, {1, 0}), std::sqrt(0.5), 1e-12);
}

TEST(SimilarityTest, EdgeCases) {
    EXPECT_EQ(CosineSimilarity({0, 0}, {1, 1}), 0.0);
    EXPECT_THROW(CosineSimilarity({1, 2}, {1, 2, 3}), std::invalid_argument);

    // Rounding never escapes [-1, 1]
    FeatureVector v = {0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7};
    double self = CosineSimilarity(v, v);
    EXPECT_LE(self, 1.0);
    EXPECT_NEAR(self, 1.0, 1e-12);
}

// ============================================================================
// Linear Scan Index
// ============================================================================

class LinearScanIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        keys_ = KeyStore::CreateEphemeral();
        cipher_ = std::make_unique<registry::VectorCipher>(*keys_);
        LinearScanIndex::Config config;
        config.dimension = 3;
        index_ = std::make_unique<LinearScanIndex>(*cipher_, config);
    }

    void Add(const std::string& fp, const FeatureVector& v, uint64_t sequence) {
        index_->Insert({fp, "owner-" + fp, cipher_->EncryptVector(v).Value(), sequence});
    }

    std::unique_ptr<KeyStore> keys_;
    std::unique_ptr<registry::VectorCipher> cipher_;
    std::unique_ptr<LinearScanIndex> index_;
};

TEST_F(LinearScanIndexTest, OrderedByScoreThenInsertion) {
    Add("far", {0, 1, 0}, 1);
    Add("close", {1, 0.2, 0}, 2);
    Add("exact-late", {2, 0, 0}, 4);
    Add("exact-early", {1, 0, 0}, 3);

    auto matches = index_->Query({1, 0, 0}, 0.5, 10);
    ASSERT_TRUE(matches);
    ASSERT_EQ(matches->size(), 3u);
    EXPECT_EQ(matches.Value()[0].fingerprint, "exact-early");
    EXPECT_EQ(matches.Value()[1].fingerprint, "exact-late");
    EXPECT_EQ(matches.Value()[2].fingerprint, "close");
    EXPECT_EQ(matches.Value()[0].ownerKey, "owner-exact-early");
    EXPECT_DOUBLE_EQ(matches.Value()[0].similarity, 1.0);

    auto top = index_->Query({1, 0, 0}, 0.5, 1);
    ASSERT_TRUE(top);
    ASSERT_EQ(top->size(), 1u);
    EXPECT_EQ(top->front().fingerprint, "exact-early");

    auto all = index_->Query({1, 0, 0}, -1.0, 100);
    ASSERT_TRUE(all);
    EXPECT_EQ(all->size(), 4u);
}

TEST_F(LinearScanIndexTest, ThresholdIsInclusive) {
    Add("a", {1, 1, 0}, 1);
    double score = CosineSimilarity({1, 0, 0}, {1, 1, 0});

    auto hit = index_->Query({1, 0, 0}, score, 5);
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit->size(), 1u);

    auto miss = index_->Query({1, 0, 0}, std::nextafter(score, 2.0), 5);
    ASSERT_TRUE(miss);
    EXPECT_TRUE(miss->empty());
}

TEST_F(LinearScanIndexTest, InsertRemoveClear) {
    Add("a", {1, 0, 0}, 1);
    Add("a", {0, 1, 0}, 1);
    EXPECT_EQ(index_->Size(), 1u);

    auto replaced = index_->Query({0, 1, 0}, 0.99, 1);
    ASSERT_TRUE(replaced);
    EXPECT_EQ(replaced->size(), 1u);

    EXPECT_TRUE(index_->Remove("a"));
    EXPECT_FALSE(index_->Remove("a"));
    EXPECT_FALSE(index_->Contains("a"));

    Add("b", {1, 0, 0}, 2);
    index_->Clear();
    EXPECT_EQ(index_->Size(), 0u);
    auto empty = index_->Query({1, 0, 0}, 0.0, 1);
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());
}

TEST_F(LinearScanIndexTest, UnreadableEntriesAreSkipped) {
    std::vector<std::string> warnings;
    util::Logger& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(util::LogLevel::Info);
    logger.SetCategories({});
    logger.AddSink(std::make_shared<util::CallbackSink>(
        [&warnings](const util::LogEntry& entry) {
            if (entry.category == util::LogCategory::MATCHER) {
                warnings.push_back(entry.message);
            }
        },
        util::LogLevel::Warn));

    Add("good", {1, 0, 0}, 1);
    index_->Insert({"garbage", "x", "not a payload", 2});
    index_->Insert({"wrong-dim", "x", cipher_->EncryptVector({1, 0}).Value(), 3});

    auto matches = index_->Query({1, 0, 0}, 0.0, 10);
    ASSERT_TRUE(matches);
    ASSERT_EQ(matches->size(), 1u);
    EXPECT_EQ(matches->front().fingerprint, "good");

    LinearScanIndex::Stats stats = index_->GetStats();
    EXPECT_EQ(stats.queries, 1u);
    EXPECT_EQ(stats.scanned, 3u);
    EXPECT_EQ(stats.skipped, 2u);
    EXPECT_EQ(stats.matches, 1u);

    logger.ClearSinks();
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].rfind("Skipping ", 0), 0u);
    EXPECT_EQ(warnings[1].rfind("Skipping ", 0), 0u);
}

TEST_F(LinearScanIndexTest, QueryValidation) {
    auto code = [this](const FeatureVector& v, double threshold, size_t topK) {
        auto result = index_->Query(v, threshold, topK);
        EXPECT_FALSE(result);
        return result ? ErrorCode::InvalidArgument : result.GetError().Code();
    };

    EXPECT_EQ(code({1, 0}, 0.5, 1), ErrorCode::DimensionMismatch);
    EXPECT_EQ(code({0, 0, 0}, 0.5, 1), ErrorCode::InvalidVector);
    EXPECT_EQ(code({1, std::numeric_limits<double>::quiet_NaN(), 0}, 0.5, 1),
              ErrorCode::InvalidVector);
    EXPECT_EQ(code({1, 0, 0}, 1.5, 1), ErrorCode::InvalidArgument);
    EXPECT_EQ(code({1, 0, 0}, -1.01, 1), ErrorCode::InvalidArgument);
    EXPECT_EQ(code({1, 0, 0}, std::numeric_limits<double>::quiet_NaN(), 1),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(code({1, 0, 0}, 0.5, 0), ErrorCode::InvalidArgument);
    EXPECT_EQ(code({1, 0, 0}, 0.5, MAX_TOP_K + 1), ErrorCode::InvalidArgument);
}

} // namespace test
} // namespace matcher
} // namespace vface
