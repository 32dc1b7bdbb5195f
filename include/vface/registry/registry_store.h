// VFACE - Registry Store
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Identity registration, lookup and owner-signed revocation.
//
// Every write runs under the registry write mutex and commits as a single
// batch: a registration commits together with its chain anchor, a revocation
// together with the consumed nonce, a rotation as one all-or-nothing batch.

#ifndef VFACE_REGISTRY_REGISTRY_STORE_H
#define VFACE_REGISTRY_REGISTRY_STORE_H

#include "vface/chain/hashchain.h"
#include "vface/core/error.h"
#include "vface/core/types.h"
#include "vface/db/database.h"
#include "vface/matcher/similarity.h"
#include "vface/matcher/vector_index.h"
#include "vface/registry/commands.h"
#include "vface/registry/fingerprint.h"
#include "vface/registry/identity.h"
#include "vface/registry/key_rotation.h"
#include "vface/registry/vector_cipher.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vface {
namespace registry {

// ============================================================================
// Identity Directory
// ============================================================================

/**
 * Read-only identity lookups. Consent verification depends on this
 * interface only, so it can be pointed at a remote or failing backend.
 */
class IdentityDirectory {
public:
    virtual ~IdentityDirectory() = default;

    /**
     * Current state of an identity.
     * @return NotFound if never registered, an Infrastructure error if
     *         the backend cannot answer
     */
    virtual Result<IdentityRecord> GetIdentity(const std::string& fingerprint) const = 0;
};

// ============================================================================
// Request / Result Types
// ============================================================================

struct RegisterRequest {
    std::string fingerprint;
    /// Hex compressed secp256k1 public key
    std::string ownerKey;
    std::optional<FeatureVector> vector;
    Metadata metadata;
};

struct RegisterResult {
    /// The fingerprint
    std::string id;
    std::string commitment;
    uint64_t chainIndex{0};
    std::string chainSignature;
    std::string entryHash;
    bool vectorStored{false};
};

struct CheckResult {
    IdentityRecord record;
    /// Decrypted vector, only when requested and stored
    std::optional<FeatureVector> vector;
};

struct RevokeResult {
    std::string fingerprint;
    TimestampMs revokedAt{0};
};

// ============================================================================
// Registry Store
// ============================================================================

class RegistryStore : public IdentityDirectory {
public:
    struct Config {
        size_t dimension{DEFAULT_DIMENSION};
        int precision{DEFAULT_PRECISION};
        /// Require fingerprint == Derive(vector) when a vector is supplied
        bool enforceFingerprint{false};
        /// Similarity at or above which a new vector is a duplicate
        double sybilThreshold{matcher::DEFAULT_SYBIL_THRESHOLD};
        /// Allowed |now - command timestamp|, seconds
        Timestamp revokeWindow{300};
        /// Lifetime of a consumed nonce row, seconds; a row also lives until
        /// its command's timestamp leaves revokeWindow
        Timestamp nonceTtl{300};
    };

    struct Stats {
        uint64_t registrations{0};
        uint64_t sybilRejections{0};
        uint64_t revocations{0};
        uint64_t proofFailures{0};
    };

    /**
     * Writes added by a proof-gated operation. Runs under the write mutex
     * after the proof has been verified; an error aborts the whole batch.
     */
    using ProofBody = std::function<Result<void>(const SignedCommand& command,
                                                 const IdentityRecord& record,
                                                 db::WriteBatch& batch)>;

    RegistryStore(db::Database& db,
                  const VectorCipher& cipher,
                  chain::HashChain& chain,
                  matcher::VectorIndex& index,
                  const Config& config);

    /**
     * Enroll an identity.
     * @return AlreadyRegistered, DuplicateIdentity (details: match_fingerprint,
     *         score), validation errors, or Infrastructure errors
     */
    Result<RegisterResult> Register(const RegisterRequest& request);

    /**
     * Look up an identity.
     * @param includeVector Decrypt and return the stored vector
     * @return nullopt if the fingerprint was never registered
     */
    Result<std::optional<CheckResult>> Check(const std::string& fingerprint,
                                             bool includeVector = false) const;

    /**
     * Revoke an identity with an owner-signed revoke command.
     * @return FingerprintMismatch, StaleTimestamp, ReplayDetected, NotFound,
     *         AlreadyRevoked, NotOwner or MalformedCommand
     */
    Result<RevokeResult> Revoke(const std::string& fingerprint, const OwnershipProof& proof);

    /// Fingerprints registered to an owner key, in key order
    Result<std::vector<std::string>> ListByOwner(const std::string& ownerKey) const;

    /// Similarity search over non-revoked identities
    Result<std::vector<matcher::Match>> Search(const FeatureVector& vector,
                                               double threshold,
                                               size_t topK) const;

    /**
     * Verify an ownership proof and commit body's writes with the nonce.
     *
     * Checks in order: command structure and action, fingerprint, timestamp
     * window, nonce unused, identity exists, identity not revoked, signature.
     *
     * @param expectedAction Action the command must carry
     * @return The parsed command on success
     */
    Result<SignedCommand> ApplyWithOwnershipProof(const std::string& fingerprint,
                                                  const OwnershipProof& proof,
                                                  const std::string& expectedAction,
                                                  const ProofBody& body);

    /// Delete nonce rows whose expiry is before now (unix seconds)
    Result<size_t> PurgeExpiredNonces(Timestamp now);

    /// Reload the vector index from storage; returns entries loaded
    Result<size_t> RebuildIndex();

    /// Re-seal every vector under the current key version
    Result<RotationReport> RotateEncryption(bool dryRun);

    Result<IdentityRecord> GetIdentity(const std::string& fingerprint) const override;

    const Config& GetConfig() const { return config_; }
    Stats GetStats() const;

private:
    db::Database& db_;
    const VectorCipher& cipher_;
    chain::HashChain& chain_;
    matcher::VectorIndex& index_;
    Config config_;
    FingerprintDeriver deriver_;

    /// Serializes every registry write
    std::mutex writeMutex_;

    mutable std::mutex statsMutex_;
    Stats stats_;

    Result<std::optional<IdentityRecord>> ReadRecord(const std::string& fingerprint) const;
    Result<uint64_t> ReadSequence() const;
    Result<void> ValidateRequest(const RegisterRequest& request, std::string& ownerKey) const;
};

} // namespace registry
} // namespace vface

#endif // VFACE_REGISTRY_REGISTRY_STORE_H
