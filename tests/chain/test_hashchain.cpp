// VFACE - Hash Chain Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>
#include "vface/chain/hashchain.h"
#include "vface/core/hex.h"
#include "vface/crypto/sha256.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace vface;
using namespace vface::chain;

class HashChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = db::OpenMemoryDatabase();
        keys_ = KeyStore::CreateEphemeral();
        chain_ = std::make_unique<HashChain>(*db_, *keys_, HashChain::Config{});
    }

    void AppendN(int n) {
        for (int i = 0; i < n; ++i) {
            std::string tag = std::to_string(i);
            ASSERT_TRUE(chain_->Append("commit-" + tag, "fp-" + tag));
        }
    }

    /// Overwrite a stored entry in place, bypassing Append
    void Overwrite(const ChainEntry& entry, uint64_t position = 0) {
        uint64_t at = position != 0 ? position : entry.index;
        ASSERT_TRUE(db_->Put(db::MakeIndexKey(db::prefix::CHAIN_ENTRY, at),
                             db::SerializeToString(entry)).ok());
    }

    std::unique_ptr<db::Database> db_;
    std::unique_ptr<KeyStore> keys_;
    std::unique_ptr<HashChain> chain_;
};

// ============================================================================
// Hashing
// ============================================================================

TEST(ChainHashTest, KnownValues) {
    EXPECT_EQ(ComputeGenesisHash(DEFAULT_GENESIS_SEED),
              "c41b5c688c2924f1fd5629860e73e1d3b025202c3d0402956e03c45b5521c409");
    EXPECT_EQ(ComputeEntryHash(1, "c", "f", 1000, "p"),
              "111d3fc6773cb39aa5c4d835a901575aea6d17d8ceb2ba45c96e0fa5a09bf373");
}

// ============================================================================
// Append and Query
// ============================================================================

TEST_F(HashChainTest, EmptyChain) {
    auto root = chain_->GetRoot();
    ASSERT_TRUE(root);
    EXPECT_EQ(root->root, root->genesis);
    EXPECT_EQ(root->genesis, ComputeGenesisHash(DEFAULT_GENESIS_SEED));
    EXPECT_EQ(root->index, 0u);
    EXPECT_EQ(root->totalEntries, 0u);
    EXPECT_EQ(root->timestamp, 0);

    EXPECT_EQ(chain_->Height().Value(), 0u);
    EXPECT_EQ(chain_->GetEntry(1).GetError().Code(), ErrorCode::NotFound);

    auto verify = chain_->VerifyChain();
    ASSERT_TRUE(verify);
    EXPECT_TRUE(verify->valid);
    EXPECT_EQ(verify->checked, 0u);
}

TEST_F(HashChainTest, AppendLinksAndSigns) {
    auto first = chain_->Append("c1", "fp1");
    auto second = chain_->Append("c2", "fp2");
    ASSERT_TRUE(first && second);

    EXPECT_EQ(first->index, 1u);
    EXPECT_EQ(second->index, 2u);
    EXPECT_EQ(first->prevHash, chain_->GetGenesisHash());
    EXPECT_EQ(second->prevHash, first->entryHash);
    EXPECT_EQ(second->entryHash, second->ComputeHash());

    auto signature = HexToBytes(second->signature);
    EXPECT_TRUE(keys_->SigningKey().GetPublicKey().Verify(SHA256Hash(second->entryHash),
                                                          signature));

    auto root = chain_->GetRoot();
    ASSERT_TRUE(root);
    EXPECT_EQ(root->root, second->entryHash);
    EXPECT_EQ(root->index, 2u);
    EXPECT_EQ(root->timestamp, second->timestamp);

    auto fetched = chain_->GetEntry(1);
    ASSERT_TRUE(fetched);
    EXPECT_EQ(fetched->entryHash, first->entryHash);
    EXPECT_EQ(chain_->GetEntry(0).GetError().Code(), ErrorCode::NotFound);
    EXPECT_EQ(chain_->GetEntry(3).GetError().Code(), ErrorCode::NotFound);
}

TEST_F(HashChainTest, FindByFingerprint) {
    AppendN(3);
    auto found = chain_->FindByFingerprint("fp-1");
    ASSERT_TRUE(found);
    EXPECT_EQ(found->index, 2u);
    EXPECT_EQ(found->commitment, "commit-1");

    EXPECT_EQ(chain_->FindByFingerprint("fp-9").GetError().Code(), ErrorCode::NotFound);
}

TEST_F(HashChainTest, DecorateJoinsTheBatch) {
    auto entry = chain_->Append("c", "fp",
        [](const ChainEntry& e, db::WriteBatch& batch) -> Result<void> {
            batch.Put("x-extra", std::to_string(e.index));
            return Result<void>::Ok();
        });
    ASSERT_TRUE(entry);
    std::string value;
    ASSERT_TRUE(db_->Get("x-extra", &value).ok());
    EXPECT_EQ(value, "1");

    auto refused = chain_->Append("c2", "fp2",
        [](const ChainEntry&, db::WriteBatch& batch) -> Result<void> {
            batch.Put("x-extra2", "x");
            return Error(ErrorCode::InvalidArgument, "no");
        });
    ASSERT_FALSE(refused);
    EXPECT_FALSE(db_->Exists("x-extra2"));
    EXPECT_EQ(chain_->Height().Value(), 1u);
    EXPECT_EQ(chain_->FindByFingerprint("fp2").GetError().Code(), ErrorCode::NotFound);
}

TEST_F(HashChainTest, GenesisSeedChangesRoot) {
    HashChain::Config config;
    config.genesisSeed = "other-network";
    HashChain other(*db_, *keys_, config);
    EXPECT_NE(other.GetGenesisHash(), chain_->GetGenesisHash());
    EXPECT_EQ(other.GetGenesisHash(), SHA256Hex("other-network"));
}

// ============================================================================
// Verification
// ============================================================================

TEST_F(HashChainTest, VerifyIntactChain) {
    AppendN(5);
    auto result = chain_->VerifyChain();
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->valid);
    EXPECT_EQ(result->checked, 5u);
    EXPECT_FALSE(result->error.has_value());
    EXPECT_FALSE(result->brokenAt.has_value());

    auto range = chain_->VerifyChain(2, 4);
    ASSERT_TRUE(range);
    EXPECT_TRUE(range->valid);
    EXPECT_EQ(range->checked, 3u);

    auto clamped = chain_->VerifyChain(4, 100);
    ASSERT_TRUE(clamped);
    EXPECT_EQ(clamped->checked, 2u);

    auto past = chain_->VerifyChain(10, std::nullopt);
    ASSERT_TRUE(past);
    EXPECT_EQ(past->checked, 0u);

    EXPECT_EQ(chain_->VerifyChain(0, std::nullopt).GetError().Code(), ErrorCode::InvalidArgument);
}

TEST_F(HashChainTest, DetectsTamperedData) {
    AppendN(4);
    ChainEntry entry = chain_->GetEntry(3).Value();
    entry.commitment = "forged";
    Overwrite(entry);

    auto result = chain_->VerifyChain();
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->brokenAt.value_or(0), 3u);
    EXPECT_EQ(result->checked, 3u);
    EXPECT_EQ(result->error.value_or(""), "Entry hash mismatch (data tampered)");

    // Entries before the damage still verify
    auto prefix = chain_->VerifyChain(1, 2);
    ASSERT_TRUE(prefix);
    EXPECT_TRUE(prefix->valid);
}

TEST_F(HashChainTest, DetectsResignedByOtherKey) {
    AppendN(2);
    ChainEntry entry = chain_->GetEntry(2).Value();
    PrivateKey forger = PrivateKey::Generate();
    entry.signature = BytesToHex(forger.Sign(SHA256Hash(entry.entryHash)));
    Overwrite(entry);

    auto result = chain_->VerifyChain();
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->brokenAt.value_or(0), 2u);
    EXPECT_EQ(result->error.value_or(""), "Signature verification failed");
}

TEST_F(HashChainTest, DetectsBrokenLinkage) {
    AppendN(3);
    // Rewrite entry 2 consistently but pointing at the wrong predecessor
    ChainEntry entry = chain_->GetEntry(2).Value();
    entry.prevHash = std::string(64, '0');
    entry.entryHash = entry.ComputeHash();
    entry.signature = BytesToHex(keys_->SigningKey().Sign(SHA256Hash(entry.entryHash)));
    Overwrite(entry);

    auto result = chain_->VerifyChain();
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->brokenAt.value_or(0), 2u);
    EXPECT_EQ(result->error.value_or(""), "Chain linkage broken (prev_hash mismatch)");
}

// Every stored field is covered by the entry hash or the signature
struct FieldTamper {
    const char* field;
    std::function<void(ChainEntry&)> mutate;
    const char* error;
};

class ChainTamperTest : public HashChainTest,
                        public ::testing::WithParamInterface<FieldTamper> {};

TEST_P(ChainTamperTest, SingleFieldChangeIsDetected) {
    AppendN(3);
    ChainEntry entry = chain_->GetEntry(2).Value();
    GetParam().mutate(entry);
    Overwrite(entry, 2);

    auto result = chain_->VerifyChain();
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->brokenAt.value_or(0), 2u);
    EXPECT_EQ(result->error.value_or(""), GetParam().error);

    auto before = chain_->VerifyChain(1, 1);
    ASSERT_TRUE(before);
    EXPECT_TRUE(before->valid);
}

const char* const HASH_MISMATCH = "Entry hash mismatch (data tampered)";

INSTANTIATE_TEST_SUITE_P(Fields, ChainTamperTest, ::testing::Values(
    FieldTamper{"index", [](ChainEntry& e) { e.index = 7; }, HASH_MISMATCH},
    FieldTamper{"commitment", [](ChainEntry& e) { e.commitment = "forged"; }, HASH_MISMATCH},
    FieldTamper{"fingerprint", [](ChainEntry& e) { e.fingerprint = "fp-forged"; }, HASH_MISMATCH},
    FieldTamper{"timestamp", [](ChainEntry& e) { e.timestamp += 1; }, HASH_MISMATCH},
    FieldTamper{"prevHash", [](ChainEntry& e) { e.prevHash = std::string(64, '0'); },
                HASH_MISMATCH},
    FieldTamper{"entryHash", [](ChainEntry& e) { e.entryHash = std::string(64, 'f'); },
                HASH_MISMATCH},
    FieldTamper{"signature",
                [](ChainEntry& e) { e.signature.back() = e.signature.back() == '0' ? '1' : '0'; },
                "Signature verification failed"}),
    [](const ::testing::TestParamInfo<FieldTamper>& info) {
        return std::string(info.param.field);
    });

TEST_F(HashChainTest, DetectsUnreadableEntry) {
    AppendN(2);
    ASSERT_TRUE(db_->Put(db::MakeIndexKey(db::prefix::CHAIN_ENTRY, 2), "junk").ok());

    auto result = chain_->VerifyChain();
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->brokenAt.value_or(0), 2u);

    EXPECT_EQ(chain_->ExportSnapshot().GetError().Code(), ErrorCode::CorruptRecord);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(HashChainTest, ConcurrentAppendsStayLinked) {
    const int threads = 8;
    const int perThread = 25;
    std::atomic<int> failures{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this, t, perThread, &failures] {
            for (int i = 0; i < perThread; ++i) {
                std::string tag = std::to_string(t) + "-" + std::to_string(i);
                if (!chain_->Append("commit-" + tag, "fp-" + tag)) {
                    ++failures;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures.load(), 0);
    const uint64_t total = threads * perThread;

    auto root = chain_->GetRoot();
    ASSERT_TRUE(root);
    EXPECT_EQ(root->totalEntries, total);
    EXPECT_EQ(root->index, total);

    auto verify = chain_->VerifyChain();
    ASSERT_TRUE(verify);
    EXPECT_TRUE(verify->valid) << verify->error.value_or("");
    EXPECT_EQ(verify->checked, total);
}

// ============================================================================
// Snapshot
// ============================================================================

TEST_F(HashChainTest, ExportSnapshot) {
    auto empty = chain_->ExportSnapshot();
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->entries.empty());
    EXPECT_EQ(empty->root, empty->genesis);

    AppendN(3);
    auto snapshot = chain_->ExportSnapshot();
    ASSERT_TRUE(snapshot);
    ASSERT_EQ(snapshot->entries.size(), 3u);
    EXPECT_EQ(snapshot->totalEntries, 3u);
    EXPECT_EQ(snapshot->publicKey, keys_->PublicKeyHex());
    EXPECT_EQ(snapshot->root, snapshot->entries.back().entryHash);
    EXPECT_GT(snapshot->exportedAt, 0);
    for (size_t i = 0; i < snapshot->entries.size(); ++i) {
        EXPECT_EQ(snapshot->entries[i].index, i + 1);
    }
}

TEST_F(HashChainTest, SurvivesReopen) {
    AppendN(2);
    std::string root = chain_->GetRoot()->root;

    chain_ = std::make_unique<HashChain>(*db_, *keys_, HashChain::Config{});
    auto entry = chain_->Append("c", "fp");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->index, 3u);
    EXPECT_EQ(entry->prevHash, root);
}
