// VFACE - Key Rotation Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>
#include "vface/db/database.h"
#include "vface/registry/identity.h"
#include "vface/registry/key_rotation.h"

#include <memory>
#include <string>

namespace vface {
namespace registry {
namespace test {

class KeyRotationTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = db::OpenMemoryDatabase();
        keys_ = KeyStore::CreateEphemeral();
        cipher_ = std::make_unique<VectorCipher>(*keys_);
    }

    /// Store a record the way registration does
    void PutRecord(char fill, std::optional<FeatureVector> vector) {
        IdentityRecord record;
        record.fingerprint = std::string(64, fill);
        record.ownerKey = "02" + std::string(64, '1');
        record.commitmentNonce = std::string(64, '0');
        if (vector) {
            record.encryptedVector = cipher_->EncryptVector(*vector).Value();
            record.keyVersion = cipher_->CurrentVersion();
        }
        record.commitment = ComputeCommitment(record.encryptedVector.value_or(""),
                                              record.commitmentNonce);
        ASSERT_TRUE(db_->Put(db::MakeKey(db::prefix::IDENTITY, record.fingerprint),
                             db::SerializeToString(record)).ok());
    }

    IdentityRecord GetRecord(char fill) {
        std::string value;
        EXPECT_TRUE(db_->Get(db::MakeKey(db::prefix::IDENTITY, std::string(64, fill)), &value).ok());
        IdentityRecord record;
        EXPECT_TRUE(db::DeserializeFromString(value, record));
        return record;
    }

    std::unique_ptr<db::Database> db_;
    std::unique_ptr<KeyStore> keys_;
    std::unique_ptr<VectorCipher> cipher_;
};

TEST_F(KeyRotationTest, NothingToRotate) {
    PutRecord('a', FeatureVector{1, 2});
    PutRecord('b', std::nullopt);

    auto report = KeyRotator(*db_, *cipher_).Run(false);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->targetVersion, 1u);
    EXPECT_EQ(report->candidates, 1u);
    EXPECT_EQ(report->skipped, 1u);
    EXPECT_EQ(report->rotated, 0u);
    EXPECT_FALSE(report->committed);
}

TEST_F(KeyRotationTest, RotatesAndRecomputesCommitment) {
    PutRecord('a', FeatureVector{1, 2});
    PutRecord('b', FeatureVector{3, 4});
    PutRecord('c', std::nullopt);
    IdentityRecord before = GetRecord('a');

    ASSERT_TRUE(keys_->GenerateEncryptionKey());
    auto report = KeyRotator(*db_, *cipher_).Run(false);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->targetVersion, 2u);
    EXPECT_EQ(report->candidates, 2u);
    EXPECT_EQ(report->rotated, 2u);
    EXPECT_TRUE(report->errors.empty());
    EXPECT_TRUE(report->committed);

    IdentityRecord after = GetRecord('a');
    EXPECT_EQ(after.keyVersion, 2u);
    EXPECT_EQ(after.encryptedVector->substr(0, 3), "v2:");
    EXPECT_NE(after.commitment, before.commitment);
    EXPECT_EQ(after.commitment, ComputeCommitment(*after.encryptedVector, after.commitmentNonce));
    EXPECT_EQ(cipher_->DecryptVector(*after.encryptedVector).Value(), (FeatureVector{1, 2}));

    // Running again finds everything current
    auto again = KeyRotator(*db_, *cipher_).Run(false);
    ASSERT_TRUE(again);
    EXPECT_EQ(again->rotated, 0u);
    EXPECT_EQ(again->skipped, 2u);
}

TEST_F(KeyRotationTest, DryRunWritesNothing) {
    PutRecord('a', FeatureVector{1, 2});
    ASSERT_TRUE(keys_->GenerateEncryptionKey());

    auto report = KeyRotator(*db_, *cipher_).Run(true);
    ASSERT_TRUE(report);
    EXPECT_TRUE(report->dryRun);
    EXPECT_EQ(report->rotated, 1u);
    EXPECT_FALSE(report->committed);
    EXPECT_EQ(GetRecord('a').keyVersion, 1u);
}

TEST_F(KeyRotationTest, AnyFailureAbortsTheBatch) {
    PutRecord('a', FeatureVector{1, 2});
    PutRecord('b', FeatureVector{3, 4});

    // A payload sealed under a key this store does not have
    auto foreignKeys = KeyStore::CreateEphemeral();
    VectorCipher foreign(*foreignKeys);
    IdentityRecord broken = GetRecord('b');
    broken.encryptedVector = foreign.EncryptVector({5, 6}).Value();
    ASSERT_TRUE(db_->Put(db::MakeKey(db::prefix::IDENTITY, broken.fingerprint),
                         db::SerializeToString(broken)).ok());

    ASSERT_TRUE(keys_->GenerateEncryptionKey());
    auto report = KeyRotator(*db_, *cipher_).Run(false);
    ASSERT_TRUE(report);
    ASSERT_EQ(report->errors.size(), 1u);
    EXPECT_EQ(report->errors[0].fingerprint, std::string(64, 'b'));
    EXPECT_FALSE(report->committed);
    EXPECT_EQ(GetRecord('a').keyVersion, 1u);
}

TEST_F(KeyRotationTest, CorruptRecordIsReported) {
    PutRecord('a', FeatureVector{1, 2});
    ASSERT_TRUE(db_->Put(db::MakeKey(db::prefix::IDENTITY, std::string(64, 'z')), "junk").ok());

    auto report = KeyRotator(*db_, *cipher_).Run(false);
    ASSERT_TRUE(report);
    ASSERT_EQ(report->errors.size(), 1u);
    EXPECT_EQ(report->errors[0].fingerprint, std::string(64, 'z'));
    EXPECT_EQ(report->errors[0].message, "record is corrupt");
}

} // namespace test
} // namespace registry
} // namespace vface
