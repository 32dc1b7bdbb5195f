// VFACE - Hash Chain Engine
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Append-only, signed, hash-linked log of registration commitments.
//
//   entryHash[i] = SHA256("i|commitment|fingerprint|timestampMs|prevHash")
//   prevHash[1]  = SHA256(genesisSeed)
//   prevHash[i]  = entryHash[i-1]
//
// Each entryHash is signed (DER ECDSA/secp256k1 over SHA256(entryHash text))
// with the key store's signing key. Appends are serialized by a chain mutex
// that covers reading the tip and committing the batch.

#ifndef VFACE_CHAIN_HASHCHAIN_H
#define VFACE_CHAIN_HASHCHAIN_H

#include "vface/core/error.h"
#include "vface/core/types.h"
#include "vface/crypto/keystore.h"
#include "vface/db/database.h"

#include <cstdint>
#include <functional>
#include <ios>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vface {
namespace chain {

/// Seed hashed to form prevHash of the first entry
static constexpr const char* DEFAULT_GENESIS_SEED = "vface-genesis-v3";

// ============================================================================
// Chain Entry
// ============================================================================

struct ChainEntry {
    static constexpr uint8_t SERIALIZATION_VERSION = 1;

    /// 1-based position
    uint64_t index{0};
    std::string commitment;
    std::string fingerprint;
    /// Milliseconds since epoch
    TimestampMs timestamp{0};
    std::string prevHash;
    std::string entryHash;
    /// Hex DER signature over SHA256(entryHash)
    std::string signature;

    /// Hash of this entry's fields as they are now
    std::string ComputeHash() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        s << SERIALIZATION_VERSION;
        s << index << commitment << fingerprint << timestamp;
        s << prevHash << entryHash << signature;
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t version = 0;
        s >> version;
        if (version != SERIALIZATION_VERSION) {
            throw std::ios_base::failure("ChainEntry: unknown encoding version");
        }
        s >> index >> commitment >> fingerprint >> timestamp;
        s >> prevHash >> entryHash >> signature;
    }
};

/// Lowercase hex SHA256 of the pipe-joined entry fields
std::string ComputeEntryHash(uint64_t index, const std::string& commitment,
                             const std::string& fingerprint, TimestampMs timestamp,
                             const std::string& prevHash);

/// SHA256(seed) as lowercase hex
std::string ComputeGenesisHash(const std::string& seed);

// ============================================================================
// Query Results
// ============================================================================

struct ChainRoot {
    /// Latest entryHash, or the genesis hash for an empty chain
    std::string root;
    /// Latest index (0 when empty)
    uint64_t index{0};
    /// Timestamp of the latest entry (0 when empty)
    TimestampMs timestamp{0};
    uint64_t totalEntries{0};
    std::string genesis;
};

struct VerifyResult {
    bool valid{true};
    /// Entries examined, including the broken one
    uint64_t checked{0};
    std::optional<std::string> error;
    std::optional<uint64_t> brokenAt;
};

struct ChainSnapshot {
    std::string genesis;
    std::vector<ChainEntry> entries;
    std::string root;
    uint64_t totalEntries{0};
    TimestampMs exportedAt{0};
    /// Hex public key that verifies every signature
    std::string publicKey;
};

// ============================================================================
// Hash Chain
// ============================================================================

class HashChain {
public:
    struct Config {
        std::string genesisSeed{DEFAULT_GENESIS_SEED};
    };

    /**
     * Hook that adds writes to the append batch. It sees the final entry,
     * so records can carry their chain index and signature. An error aborts
     * the append with nothing written.
     */
    using DecorateFn = std::function<Result<void>(const ChainEntry& entry, db::WriteBatch& batch)>;

    HashChain(db::Database& db, const KeyStore& keys, const Config& config);

    /**
     * Link, sign and persist a new entry.
     * @param commitment Registration commitment (hex)
     * @param fingerprint Identity fingerprint
     * @param decorate Optional hook run before the batch is committed
     * @return The persisted entry, StorageError on write failure
     */
    Result<ChainEntry> Append(const std::string& commitment,
                              const std::string& fingerprint,
                              const DecorateFn& decorate = nullptr);

    Result<ChainRoot> GetRoot() const;

    /// NotFound outside [1, latest]
    Result<ChainEntry> GetEntry(uint64_t index) const;

    /// Entry anchoring a fingerprint; NotFound if never anchored
    Result<ChainEntry> FindByFingerprint(const std::string& fingerprint) const;

    /**
     * Recompute hashes, check signatures and linkage over [from, to].
     * @param from First index (default 1, must be >= 1)
     * @param to Last index (default latest, clamped to latest)
     */
    Result<VerifyResult> VerifyChain(std::optional<uint64_t> from = std::nullopt,
                                     std::optional<uint64_t> to = std::nullopt) const;

    /// All entries in order with the verifying public key
    Result<ChainSnapshot> ExportSnapshot() const;

    /// Latest index, 0 for an empty chain
    Result<uint64_t> Height() const;

    const std::string& GetGenesisHash() const { return genesisHash_; }

private:
    db::Database& db_;
    const KeyStore& keys_;
    Config config_;
    std::string genesisHash_;

    /// Serializes appends
    mutable std::mutex mutex_;

    Result<uint64_t> ReadTip() const;
    Result<std::optional<ChainEntry>> ReadEntry(uint64_t index) const;
};

} // namespace chain
} // namespace vface

#endif // VFACE_CHAIN_HASHCHAIN_H
