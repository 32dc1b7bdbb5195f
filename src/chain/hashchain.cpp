// VFACE - Hash Chain Engine Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/chain/hashchain.h"
#include "vface/core/hex.h"
#include "vface/crypto/sha256.h"
#include "vface/util/logging.h"

#include <algorithm>

namespace vface {
namespace chain {

namespace {

const char* const MSG_HASH_MISMATCH = "Entry hash mismatch (data tampered)";
const char* const MSG_BAD_SIGNATURE = "Signature verification failed";
const char* const MSG_LINKAGE = "Chain linkage broken (prev_hash mismatch)";
const char* const MSG_GENESIS = "Genesis link broken";
const char* const MSG_UNREADABLE = "Entry missing or unreadable";

bool VerifyEntrySignature(const PublicKey& pubkey, const ChainEntry& entry) {
    auto signature = TryHexToBytes(entry.signature);
    if (!signature || signature->empty()) {
        return false;
    }
    return pubkey.Verify(SHA256Hash(entry.entryHash), *signature);
}

} // namespace

// ============================================================================
// Entry Hashing
// ============================================================================

std::string ComputeEntryHash(uint64_t index, const std::string& commitment,
                             const std::string& fingerprint, TimestampMs timestamp,
                             const std::string& prevHash) {
    std::string preimage = std::to_string(index);
    preimage += '|';
    preimage += commitment;
    preimage += '|';
    preimage += fingerprint;
    preimage += '|';
    preimage += std::to_string(timestamp);
    preimage += '|';
    preimage += prevHash;
    return SHA256Hex(preimage);
}

std::string ComputeGenesisHash(const std::string& seed) {
    return SHA256Hex(seed);
}

std::string ChainEntry::ComputeHash() const {
    return ComputeEntryHash(index, commitment, fingerprint, timestamp, prevHash);
}

// ============================================================================
// HashChain
// ============================================================================

HashChain::HashChain(db::Database& db, const KeyStore& keys, const Config& config)
    : db_(db), keys_(keys), config_(config),
      genesisHash_(ComputeGenesisHash(config.genesisSeed)) {}

Result<uint64_t> HashChain::ReadTip() const {
    std::string value;
    db::Status s = db_.Get(db::MakeKey(db::prefix::CHAIN_TIP), &value);
    if (s.IsNotFound()) {
        return uint64_t{0};
    }
    if (!s.ok()) {
        return db::ToError(s, "read chain tip");
    }
    uint64_t tip = 0;
    if (!db::DeserializeFromString(value, tip)) {
        return Error(ErrorCode::CorruptRecord, "Chain tip record is corrupt");
    }
    return tip;
}

Result<std::optional<ChainEntry>> HashChain::ReadEntry(uint64_t index) const {
    std::string value;
    db::Status s = db_.Get(db::MakeIndexKey(db::prefix::CHAIN_ENTRY, index), &value);
    if (s.IsNotFound()) {
        return std::optional<ChainEntry>();
    }
    if (!s.ok()) {
        return db::ToError(s, "read chain entry " + std::to_string(index));
    }
    ChainEntry entry;
    if (!db::DeserializeFromString(value, entry)) {
        return Error(ErrorCode::CorruptRecord,
                     "Chain entry " + std::to_string(index) + " is corrupt");
    }
    return std::optional<ChainEntry>(std::move(entry));
}

Result<uint64_t> HashChain::Height() const {
    return ReadTip();
}

Result<ChainEntry> HashChain::Append(const std::string& commitment,
                                     const std::string& fingerprint,
                                     const DecorateFn& decorate) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto tip = ReadTip();
    if (!tip) {
        return tip.GetError();
    }

    std::string prevHash = genesisHash_;
    if (tip.Value() > 0) {
        auto latest = ReadEntry(tip.Value());
        if (!latest) {
            return latest.GetError();
        }
        if (!latest.Value()) {
            return Error(ErrorCode::ChainBroken,
                         "Chain tip " + std::to_string(tip.Value()) + " has no entry");
        }
        prevHash = latest.Value()->entryHash;
    }

    ChainEntry entry;
    entry.index = tip.Value() + 1;
    entry.commitment = commitment;
    entry.fingerprint = fingerprint;
    entry.timestamp = GetTimeMillis();
    entry.prevHash = prevHash;
    entry.entryHash = entry.ComputeHash();

    try {
        entry.signature = BytesToHex(keys_.SigningKey().Sign(SHA256Hash(entry.entryHash)));
    } catch (const std::runtime_error& e) {
        return Error(ErrorCode::KeyStoreError, std::string("Chain signing failed: ") + e.what());
    }

    db::WriteBatch batch;
    batch.Put(db::MakeIndexKey(db::prefix::CHAIN_ENTRY, entry.index),
              db::SerializeToString(entry));
    batch.Put(db::MakeKey(db::prefix::CHAIN_TIP), db::SerializeToString(entry.index));
    batch.Put(db::MakeKey(db::prefix::CHAIN_FINGERPRINT, fingerprint),
              db::SerializeToString(entry.index));

    if (decorate) {
        auto decorated = decorate(entry, batch);
        if (!decorated) {
            return decorated.GetError();
        }
    }

    db::WriteOptions options;
    options.sync = true;
    db::Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::CHAIN) << "Append of entry " << entry.index
                                            << " failed: " << s.ToString();
        return db::ToError(s, "append chain entry");
    }

    LOG_DEBUG(util::LogCategory::CHAIN) << "Appended entry " << entry.index << " for "
                                        << util::LogId(fingerprint) << " hash "
                                        << util::LogId(entry.entryHash, 16);
    return entry;
}

Result<ChainRoot> HashChain::GetRoot() const {
    auto tip = ReadTip();
    if (!tip) {
        return tip.GetError();
    }

    ChainRoot root;
    root.genesis = genesisHash_;
    root.root = genesisHash_;
    root.index = tip.Value();
    root.totalEntries = tip.Value();
    if (tip.Value() == 0) {
        return root;
    }

    auto latest = ReadEntry(tip.Value());
    if (!latest) {
        return latest.GetError();
    }
    if (!latest.Value()) {
        return Error(ErrorCode::ChainBroken,
                     "Chain tip " + std::to_string(tip.Value()) + " has no entry");
    }
    root.root = latest.Value()->entryHash;
    root.timestamp = latest.Value()->timestamp;
    return root;
}

Result<ChainEntry> HashChain::GetEntry(uint64_t index) const {
    auto tip = ReadTip();
    if (!tip) {
        return tip.GetError();
    }
    if (index < 1 || index > tip.Value()) {
        return Error(ErrorCode::NotFound, "Chain entry " + std::to_string(index) + " not found");
    }

    auto entry = ReadEntry(index);
    if (!entry) {
        return entry.GetError();
    }
    if (!entry.Value()) {
        return Error(ErrorCode::ChainBroken,
                     "Chain entry " + std::to_string(index) + " is missing");
    }
    return std::move(*entry.Value());
}

Result<ChainEntry> HashChain::FindByFingerprint(const std::string& fingerprint) const {
    std::string value;
    db::Status s = db_.Get(db::MakeKey(db::prefix::CHAIN_FINGERPRINT, fingerprint), &value);
    if (s.IsNotFound()) {
        return Error(ErrorCode::NotFound, "Fingerprint is not anchored on the chain");
    }
    if (!s.ok()) {
        return db::ToError(s, "read chain fingerprint index");
    }
    uint64_t index = 0;
    if (!db::DeserializeFromString(value, index)) {
        return Error(ErrorCode::CorruptRecord, "Chain fingerprint index is corrupt");
    }
    return GetEntry(index);
}

Result<VerifyResult> HashChain::VerifyChain(std::optional<uint64_t> from,
                                            std::optional<uint64_t> to) const {
    uint64_t first = from.value_or(1);
    if (first < 1) {
        return Error(ErrorCode::InvalidArgument, "Verification must start at index 1 or later");
    }

    auto tip = ReadTip();
    if (!tip) {
        return tip.GetError();
    }
    uint64_t last = to ? std::min(*to, tip.Value()) : tip.Value();

    VerifyResult result;
    if (first > last) {
        return result;
    }

    auto pubkey = PublicKey::FromHex(keys_.PublicKeyHex());
    if (!pubkey) {
        return Error(ErrorCode::KeyStoreError, "Signing public key is invalid");
    }

    auto fail = [&](uint64_t index, const char* message) {
        result.valid = false;
        result.error = message;
        result.brokenAt = index;
        LOG_ERROR(util::LogCategory::CHAIN) << "Chain verification failed at entry "
                                            << index << ": " << message;
        return result;
    };

    std::string previousHash;
    for (uint64_t index = first; index <= last; ++index) {
        ++result.checked;

        auto stored = ReadEntry(index);
        if (!stored) {
            if (stored.GetError().Kind() == ErrorKind::Infrastructure) {
                return stored.GetError();
            }
            return fail(index, MSG_UNREADABLE);
        }
        if (!stored.Value()) {
            return fail(index, MSG_UNREADABLE);
        }
        const ChainEntry& entry = *stored.Value();

        // The position is authoritative; a rewritten index field is a hash mismatch
        std::string expected = ComputeEntryHash(index, entry.commitment, entry.fingerprint,
                                                entry.timestamp, entry.prevHash);
        if (entry.index != index || expected != entry.entryHash) {
            return fail(index, MSG_HASH_MISMATCH);
        }
        if (!VerifyEntrySignature(*pubkey, entry)) {
            return fail(index, MSG_BAD_SIGNATURE);
        }
        if (index > first && entry.prevHash != previousHash) {
            return fail(index, MSG_LINKAGE);
        }
        if (index == first && first == 1 && entry.prevHash != genesisHash_) {
            return fail(index, MSG_GENESIS);
        }
        previousHash = entry.entryHash;
    }

    LOG_DEBUG(util::LogCategory::CHAIN) << "Verified entries " << first << " to " << last;
    return result;
}

Result<ChainSnapshot> HashChain::ExportSnapshot() const {
    ChainSnapshot snapshot;
    snapshot.genesis = genesisHash_;
    snapshot.root = genesisHash_;
    snapshot.publicKey = keys_.PublicKeyHex();
    snapshot.exportedAt = GetTimeMillis();

    bool corrupt = false;
    db::Status s = db_.ScanPrefix(db::MakeKey(db::prefix::CHAIN_ENTRY),
        [&](const db::Slice& key, const db::Slice& value) {
            ChainEntry entry;
            if (!db::ParseIndexKey(key) || !db::DeserializeFromString(value.ToString(), entry)) {
                corrupt = true;
                return false;
            }
            snapshot.entries.push_back(std::move(entry));
            return true;
        });
    if (!s.ok()) {
        return db::ToError(s, "export chain snapshot");
    }
    if (corrupt) {
        return Error(ErrorCode::CorruptRecord, "Chain contains an unreadable entry");
    }

    if (!snapshot.entries.empty()) {
        snapshot.root = snapshot.entries.back().entryHash;
    }
    snapshot.totalEntries = snapshot.entries.size();
    return snapshot;
}

} // namespace chain
} // namespace vface
