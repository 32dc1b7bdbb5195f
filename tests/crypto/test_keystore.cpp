// VFACE - Key Store Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>
#include "vface/core/hex.h"
#include "vface/crypto/keystore.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace vface {
namespace test {

// ============================================================================
// Test Utilities
// ============================================================================

class KeyStoreTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;
    std::filesystem::path keyFile_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("vface_keystore_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
        keyFile_ = testDir_ / "keystore.json";
        ClearEnvironment();
    }

    void TearDown() override {
        ClearEnvironment();
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    static void ClearEnvironment() {
        for (int v = 1; v <= 4; ++v) {
            unsetenv((std::string(ENV_ENCRYPTION_KEY_PREFIX) + std::to_string(v)).c_str());
        }
        unsetenv(ENV_ENCRYPTION_KEY_LEGACY);
        unsetenv(ENV_CURRENT_KEY_VERSION);
    }

    std::unique_ptr<KeyStore> Create() {
        auto opened = KeyStore::Open({keyFile_, true});
        EXPECT_TRUE(opened) << opened.GetError().ToString();
        return std::move(opened.Value());
    }

    void WriteFile(const std::string& contents) {
        std::ofstream out(keyFile_, std::ios::trunc);
        out << contents;
    }
};

static std::string KeyHex(char c) {
    return std::string(64, c);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(KeyStoreTest, MissingFileIsAnErrorUnlessCreating) {
    auto opened = KeyStore::Open({keyFile_, false});
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.GetError().Code(), ErrorCode::KeyStoreError);
    EXPECT_FALSE(std::filesystem::exists(keyFile_));
}

TEST_F(KeyStoreTest, CreateThenReopen) {
    std::string publicKey;
    EncryptionKey key{};
    {
        auto store = Create();
        ASSERT_TRUE(store);
        EXPECT_TRUE(store->IsPersistent());
        EXPECT_EQ(store->CurrentVersion(), 1u);
        publicKey = store->PublicKeyHex();
        key = *store->GetEncryptionKey(1);
    }

    auto perms = std::filesystem::status(keyFile_).permissions();
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);

    auto reopened = KeyStore::Open({keyFile_, false});
    ASSERT_TRUE(reopened) << reopened.GetError().ToString();
    EXPECT_EQ(reopened.Value()->PublicKeyHex(), publicKey);
    EXPECT_EQ(*reopened.Value()->GetEncryptionKey(1), key);
}

TEST_F(KeyStoreTest, OpenNeverReplacesAnExistingFile) {
    WriteFile("{ not json");
    auto opened = KeyStore::Open({keyFile_, true});
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.GetError().Code(), ErrorCode::KeyStoreError);

    std::ifstream in(keyFile_);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "{ not json");
}

TEST_F(KeyStoreTest, RejectsInconsistentDocuments) {
    WriteFile(R"({"format":1,"signing_key":")" + std::string(63, '0') + R"(1",)"
              R"("encryption_keys":{"1":")" + KeyHex('a') + R"("},)"
              R"("current_encryption_version":2})");
    EXPECT_FALSE(KeyStore::Open({keyFile_, false}));

    WriteFile(R"({"format":2,"signing_key":")" + std::string(63, '0') + R"(1",)"
              R"("encryption_keys":{"1":")" + KeyHex('a') + R"("},)"
              R"("current_encryption_version":1})");
    EXPECT_FALSE(KeyStore::Open({keyFile_, false}));

    WriteFile(R"({"format":1,"signing_key":")" + std::string(63, '0') + R"(1",)"
              R"("encryption_keys":{"1":")" + KeyHex('a') + R"("},)"
              R"("current_encryption_version":1})");
    EXPECT_TRUE(KeyStore::Open({keyFile_, false}));
}

TEST_F(KeyStoreTest, EphemeralStoreIsNotPersisted) {
    auto store = KeyStore::CreateEphemeral();
    EXPECT_FALSE(store->IsPersistent());
    EXPECT_EQ(store->CurrentVersion(), 1u);
    EXPECT_TRUE(store->Persist());
    EXPECT_TRUE(store->SigningKey().IsValid());
}

// ============================================================================
// Encryption Keys
// ============================================================================

TEST_F(KeyStoreTest, GenerateAdvancesCurrentVersion) {
    auto store = Create();
    auto version = store->GenerateEncryptionKey();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.Value(), 2u);
    EXPECT_EQ(store->CurrentVersion(), 2u);
    EXPECT_EQ(store->Versions(), (std::vector<uint32_t>{1, 2}));

    auto reopened = KeyStore::Open({keyFile_, false});
    ASSERT_TRUE(reopened);
    EXPECT_EQ(reopened.Value()->CurrentVersion(), 2u);
}

TEST_F(KeyStoreTest, AddEncryptionKeyRules) {
    auto store = Create();
    auto key = *ParseEncryptionKey(KeyHex('b'));

    EXPECT_FALSE(store->AddEncryptionKey(0, key));
    ASSERT_TRUE(store->AddEncryptionKey(3, key));
    EXPECT_TRUE(store->AddEncryptionKey(3, key));

    auto conflicting = store->AddEncryptionKey(3, *ParseEncryptionKey(KeyHex('c')));
    ASSERT_FALSE(conflicting);
    EXPECT_EQ(conflicting.GetError().Code(), ErrorCode::KeyStoreError);

    // Adding does not change the current version
    EXPECT_EQ(store->CurrentVersion(), 1u);
    ASSERT_TRUE(store->SetCurrentVersion(3));
    EXPECT_EQ(store->CurrentVersion(), 3u);

    auto unknown = store->SetCurrentVersion(9);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.GetError().Code(), ErrorCode::NotFound);
}

TEST_F(KeyStoreTest, ParseEncryptionKey) {
    EXPECT_TRUE(ParseEncryptionKey(KeyHex('0')).has_value());
    EXPECT_FALSE(ParseEncryptionKey(std::string(62, '0')).has_value());
    EXPECT_FALSE(ParseEncryptionKey(std::string(64, 'g')).has_value());
}

// ============================================================================
// Environment Import
// ============================================================================

TEST_F(KeyStoreTest, ImportsVersionedKeysFromEnvironment) {
    auto store = Create();
    setenv("VFACE_ENCRYPTION_KEY_V2", KeyHex('d').c_str(), 1);
    setenv(ENV_CURRENT_KEY_VERSION, "2", 1);

    auto imported = store->ImportFromEnvironment(4);
    ASSERT_TRUE(imported) << imported.GetError().ToString();
    EXPECT_EQ(imported.Value(), 1u);
    EXPECT_EQ(store->CurrentVersion(), 2u);
    EXPECT_EQ(BytesToHex(store->GetEncryptionKey(2)->data(), AES_KEY_SIZE), KeyHex('d'));

    // Importing again adds nothing
    auto again = store->ImportFromEnvironment(4);
    ASSERT_TRUE(again);
    EXPECT_EQ(again.Value(), 0u);
}

TEST_F(KeyStoreTest, RejectsMalformedEnvironmentKeys) {
    auto store = Create();
    setenv("VFACE_ENCRYPTION_KEY_V2", "tooshort", 1);
    auto imported = store->ImportFromEnvironment(4);
    ASSERT_FALSE(imported);
    EXPECT_EQ(imported.GetError().Code(), ErrorCode::KeyStoreError);

    unsetenv("VFACE_ENCRYPTION_KEY_V2");
    setenv(ENV_CURRENT_KEY_VERSION, "7", 1);
    EXPECT_FALSE(store->ImportFromEnvironment(4));
}

} // namespace test
} // namespace vface
