// VFACE - Registry Store Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/registry/registry_store.h"
#include "vface/core/random.h"
#include "vface/crypto/keys.h"
#include "vface/util/logging.h"

#include <algorithm>
#include <cstdio>

namespace vface {
namespace registry {

namespace {

std::string FormatScore(double score) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f", score);
    return buf;
}

/// Normalized hex of a compressed public key, or nullopt
std::optional<std::string> NormalizeOwnerKey(const std::string& hex) {
    auto pubkey = PublicKey::FromHex(hex);
    if (!pubkey || !pubkey->IsValid() || !pubkey->IsCompressed()) {
        return std::nullopt;
    }
    return pubkey->ToHex();
}

std::string OwnerIndexKey(const std::string& ownerKey, const std::string& fingerprint) {
    return db::MakeKey(db::prefix::OWNER_INDEX, ownerKey + fingerprint);
}

} // namespace

RegistryStore::RegistryStore(db::Database& db,
                             const VectorCipher& cipher,
                             chain::HashChain& chain,
                             matcher::VectorIndex& index,
                             const Config& config)
    : db_(db), cipher_(cipher), chain_(chain), index_(index), config_(config),
      deriver_(FingerprintDeriver::Config{config.dimension, config.precision}) {}

RegistryStore::Stats RegistryStore::GetStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

// ============================================================================
// Storage Helpers
// ============================================================================

Result<std::optional<IdentityRecord>> RegistryStore::ReadRecord(const std::string& fingerprint) const {
    std::string value;
    db::Status s = db_.Get(db::MakeKey(db::prefix::IDENTITY, fingerprint), &value);
    if (s.IsNotFound()) {
        return std::optional<IdentityRecord>();
    }
    if (!s.ok()) {
        return db::ToError(s, "read identity");
    }
    IdentityRecord record;
    if (!db::DeserializeFromString(value, record)) {
        LOG_ERROR(util::LogCategory::REGISTRY) << "Corrupt identity record "
                                               << util::LogId(fingerprint);
        return Error(ErrorCode::CorruptRecord, "Identity record is corrupt")
            .WithDetail("fingerprint", fingerprint);
    }
    return std::optional<IdentityRecord>(std::move(record));
}

Result<uint64_t> RegistryStore::ReadSequence() const {
    std::string value;
    db::Status s = db_.Get(db::MakeKey(db::prefix::SEQUENCE), &value);
    if (s.IsNotFound()) {
        return uint64_t{0};
    }
    if (!s.ok()) {
        return db::ToError(s, "read registration sequence");
    }
    uint64_t sequence = 0;
    if (!db::DeserializeFromString(value, sequence)) {
        return Error(ErrorCode::CorruptRecord, "Registration sequence is corrupt");
    }
    return sequence;
}

// ============================================================================
// Registration
// ============================================================================

Result<void> RegistryStore::ValidateRequest(const RegisterRequest& request,
                                            std::string& ownerKey) const {
    if (!IsValidFingerprint(request.fingerprint)) {
        return Error(ErrorCode::InvalidFingerprint,
                     "Fingerprint must be 64 lowercase hex characters");
    }

    auto normalized = NormalizeOwnerKey(request.ownerKey);
    if (!normalized) {
        return Error(ErrorCode::InvalidOwnerKey,
                     "Owner key must be a hex compressed secp256k1 public key");
    }
    ownerKey = *normalized;

    if (request.metadata.size() > MAX_METADATA_ENTRIES) {
        return Error(ErrorCode::InvalidArgument,
                     "Metadata has more than " + std::to_string(MAX_METADATA_ENTRIES) + " entries");
    }
    for (const auto& [key, value] : request.metadata) {
        if (key.empty() || key.size() > MAX_METADATA_KEY_LENGTH) {
            return Error(ErrorCode::InvalidArgument, "Metadata key length out of range")
                .WithDetail("key", key.substr(0, MAX_METADATA_KEY_LENGTH));
        }
        if (value.size() > MAX_METADATA_VALUE_LENGTH) {
            return Error(ErrorCode::InvalidArgument, "Metadata value too long")
                .WithDetail("key", key);
        }
    }

    if (request.vector) {
        auto valid = ValidateVector(*request.vector, config_.dimension);
        if (!valid) {
            return valid;
        }
        if (config_.enforceFingerprint) {
            auto derived = deriver_.Derive(*request.vector);
            if (!derived) {
                return derived.GetError();
            }
            if (derived.Value() != request.fingerprint) {
                return Error(ErrorCode::FingerprintMismatch,
                             "Fingerprint does not match the supplied vector")
                    .WithDetail("derived", derived.Value());
            }
        }
    }
    return Result<void>::Ok();
}

Result<RegisterResult> RegistryStore::Register(const RegisterRequest& request) {
    std::string ownerKey;
    auto valid = ValidateRequest(request, ownerKey);
    if (!valid) {
        return valid.GetError();
    }

    std::lock_guard<std::mutex> lock(writeMutex_);

    auto existing = ReadRecord(request.fingerprint);
    if (!existing) {
        return existing.GetError();
    }
    if (existing.Value()) {
        return Error(ErrorCode::AlreadyRegistered, "Identity already registered")
            .WithDetail("fingerprint", request.fingerprint);
    }

    if (request.vector) {
        auto matches = index_.Query(*request.vector, config_.sybilThreshold, 1);
        if (!matches) {
            return matches.GetError();
        }
        if (!matches->empty()) {
            const matcher::Match& best = matches->front();
            {
                std::lock_guard<std::mutex> statsLock(statsMutex_);
                ++stats_.sybilRejections;
            }
            LOG_WARN(util::LogCategory::REGISTRY)
                << "Sybil rejection for " << util::LogId(request.fingerprint)
                << ": matches " << util::LogId(best.fingerprint)
                << " at " << FormatScore(best.similarity);
            return Error(ErrorCode::DuplicateIdentity,
                         "Vector matches an existing identity")
                .WithDetail("match_fingerprint", best.fingerprint)
                .WithDetail("score", FormatScore(best.similarity));
        }
    }

    IdentityRecord record;
    record.fingerprint = request.fingerprint;
    record.ownerKey = ownerKey;
    record.metadata = request.metadata;
    record.createdAt = GetTimeMillis();

    if (request.vector) {
        auto sealed = cipher_.EncryptVector(*request.vector);
        if (!sealed) {
            return sealed.GetError();
        }
        record.encryptedVector = std::move(sealed.Value());
        record.keyVersion = cipher_.CurrentVersion();
    }

    record.commitmentNonce = GetRandHex(32);
    record.commitment = ComputeCommitment(record.encryptedVector.value_or(""),
                                          record.commitmentNonce);

    auto sequence = ReadSequence();
    if (!sequence) {
        return sequence.GetError();
    }
    record.sequence = sequence.Value() + 1;

    auto entry = chain_.Append(record.commitment, record.fingerprint,
        [&](const chain::ChainEntry& anchored, db::WriteBatch& batch) -> Result<void> {
            record.chainIndex = anchored.index;
            record.chainSignature = anchored.signature;
            batch.Put(db::MakeKey(db::prefix::IDENTITY, record.fingerprint),
                      db::SerializeToString(record));
            batch.Put(OwnerIndexKey(record.ownerKey, record.fingerprint), "");
            batch.Put(db::MakeKey(db::prefix::SEQUENCE), db::SerializeToString(record.sequence));
            return Result<void>::Ok();
        });
    if (!entry) {
        return entry.GetError();
    }

    if (record.HasVector()) {
        index_.Insert({record.fingerprint, record.ownerKey, *record.encryptedVector,
                       record.sequence});
    }

    {
        std::lock_guard<std::mutex> statsLock(statsMutex_);
        ++stats_.registrations;
    }
    LOG_INFO(util::LogCategory::REGISTRY) << "Registered " << util::LogId(record.fingerprint)
                                          << " at chain index " << entry->index
                                          << (record.HasVector() ? " with vector" : "");

    RegisterResult result;
    result.id = record.fingerprint;
    result.commitment = record.commitment;
    result.chainIndex = entry->index;
    result.chainSignature = entry->signature;
    result.entryHash = entry->entryHash;
    result.vectorStored = record.HasVector();
    return result;
}

// ============================================================================
// Lookup
// ============================================================================

Result<std::optional<CheckResult>> RegistryStore::Check(const std::string& fingerprint,
                                                        bool includeVector) const {
    if (!IsValidFingerprint(fingerprint)) {
        return Error(ErrorCode::InvalidFingerprint,
                     "Fingerprint must be 64 lowercase hex characters");
    }

    auto record = ReadRecord(fingerprint);
    if (!record) {
        return record.GetError();
    }
    if (!record.Value()) {
        return std::optional<CheckResult>();
    }

    CheckResult result;
    result.record = std::move(*record.Value());
    if (includeVector && result.record.HasVector()) {
        auto vector = cipher_.DecryptVector(*result.record.encryptedVector);
        if (!vector) {
            return vector.GetError();
        }
        result.vector = std::move(vector.Value());
    }
    return std::optional<CheckResult>(std::move(result));
}

Result<IdentityRecord> RegistryStore::GetIdentity(const std::string& fingerprint) const {
    auto record = ReadRecord(fingerprint);
    if (!record) {
        return record.GetError();
    }
    if (!record.Value()) {
        return Error(ErrorCode::NotFound, "Identity not found");
    }
    return std::move(*record.Value());
}

Result<std::vector<std::string>> RegistryStore::ListByOwner(const std::string& ownerKey) const {
    auto normalized = NormalizeOwnerKey(ownerKey);
    if (!normalized) {
        return Error(ErrorCode::InvalidOwnerKey,
                     "Owner key must be a hex compressed secp256k1 public key");
    }

    std::string prefix = db::MakeKey(db::prefix::OWNER_INDEX, *normalized);
    std::vector<std::string> fingerprints;
    db::Status s = db_.ScanPrefix(prefix, [&](const db::Slice& key, const db::Slice&) {
        fingerprints.push_back(key.ToString().substr(prefix.size()));
        return true;
    });
    if (!s.ok()) {
        return db::ToError(s, "scan owner index");
    }
    return fingerprints;
}

Result<std::vector<matcher::Match>> RegistryStore::Search(const FeatureVector& vector,
                                                          double threshold,
                                                          size_t topK) const {
    return index_.Query(vector, threshold, topK);
}

// ============================================================================
// Ownership Proofs
// ============================================================================

Result<SignedCommand> RegistryStore::ApplyWithOwnershipProof(const std::string& fingerprint,
                                                             const OwnershipProof& proof,
                                                             const std::string& expectedAction,
                                                             const ProofBody& body) {
    auto rejected = [this](Error error) {
        std::lock_guard<std::mutex> statsLock(statsMutex_);
        ++stats_.proofFailures;
        return error;
    };

    auto parsed = ParseSignedCommand(proof.message);
    if (!parsed) {
        return rejected(parsed.GetError());
    }
    const SignedCommand& command = parsed.Value();

    if (CommandAction(command) != expectedAction) {
        return rejected(Error(ErrorCode::MalformedCommand,
                              "Expected action '" + expectedAction + "'"));
    }
    if (CommandFingerprint(command) != fingerprint) {
        return rejected(Error(ErrorCode::FingerprintMismatch,
                              "Signed fingerprint does not match the target"));
    }

    Timestamp now = GetTime();
    Timestamp stamp = CommandTimestamp(command);
    if (stamp < now - config_.revokeWindow || stamp > now + config_.revokeWindow) {
        return rejected(Error(ErrorCode::StaleTimestamp,
                              "Command timestamp outside the allowed window")
                            .WithDetail("window", std::to_string(config_.revokeWindow)));
    }

    std::lock_guard<std::mutex> lock(writeMutex_);

    std::string nonceKey = db::MakeKey(db::prefix::NONCE, CommandNonce(command));
    std::string unused;
    db::Status s = db_.Get(nonceKey, &unused);
    if (s.ok()) {
        LOG_WARN(util::LogCategory::REGISTRY) << "Replayed nonce for "
                                              << util::LogId(fingerprint);
        return rejected(Error(ErrorCode::ReplayDetected, "Nonce already used"));
    }
    if (!s.IsNotFound()) {
        return db::ToError(s, "read nonce");
    }

    auto record = ReadRecord(fingerprint);
    if (!record) {
        return record.GetError();
    }
    if (!record.Value()) {
        return rejected(Error(ErrorCode::NotFound, "Identity not found"));
    }
    const IdentityRecord& identity = *record.Value();
    if (identity.revoked) {
        if (std::holds_alternative<RevokeCommand>(command)) {
            return rejected(Error(ErrorCode::AlreadyRevoked, "Identity already revoked"));
        }
        return rejected(Error(ErrorCode::IdentityRevoked, "Identity is revoked"));
    }

    if (!VerifyOwnershipSignature(identity.ownerKey, proof)) {
        LOG_WARN(util::LogCategory::REGISTRY) << "Bad ownership signature for "
                                              << util::LogId(fingerprint);
        return rejected(Error(ErrorCode::NotOwner, "Signature does not match the owner key"));
    }

    db::WriteBatch batch;
    if (body) {
        auto applied = body(command, identity, batch);
        if (!applied) {
            return applied.GetError();
        }
    }
    // Keep the nonce at least as long as the command itself stays fresh
    Timestamp expiry = std::max(now + config_.nonceTtl, stamp + config_.revokeWindow);
    batch.Put(nonceKey, db::SerializeToString(static_cast<int64_t>(expiry)));

    db::WriteOptions options;
    options.sync = true;
    s = db_.Write(options, &batch);
    if (!s.ok()) {
        return db::ToError(s, "commit " + expectedAction);
    }
    return parsed.Value();
}

Result<RevokeResult> RegistryStore::Revoke(const std::string& fingerprint,
                                           const OwnershipProof& proof) {
    if (!IsValidFingerprint(fingerprint)) {
        return Error(ErrorCode::InvalidFingerprint,
                     "Fingerprint must be 64 lowercase hex characters");
    }

    RevokeResult result;
    result.fingerprint = fingerprint;

    auto applied = ApplyWithOwnershipProof(fingerprint, proof, RevokeCommand::ACTION,
        [&](const SignedCommand&, const IdentityRecord& record, db::WriteBatch& batch) -> Result<void> {
            IdentityRecord updated = record;
            updated.revoked = true;
            updated.revokedAt = GetTimeMillis();
            result.revokedAt = *updated.revokedAt;
            batch.Put(db::MakeKey(db::prefix::IDENTITY, fingerprint),
                      db::SerializeToString(updated));
            return Result<void>::Ok();
        });
    if (!applied) {
        return applied.GetError();
    }

    index_.Remove(fingerprint);
    {
        std::lock_guard<std::mutex> statsLock(statsMutex_);
        ++stats_.revocations;
    }
    LOG_INFO(util::LogCategory::REGISTRY) << "Revoked " << util::LogId(fingerprint);
    return result;
}

// ============================================================================
// Maintenance
// ============================================================================

Result<size_t> RegistryStore::PurgeExpiredNonces(Timestamp now) {
    std::lock_guard<std::mutex> lock(writeMutex_);

    db::WriteBatch batch;
    size_t corrupt = 0;
    db::Status s = db_.ScanPrefix(db::MakeKey(db::prefix::NONCE),
        [&](const db::Slice& key, const db::Slice& value) {
            int64_t expiry = 0;
            if (!db::DeserializeFromString(value.ToString(), expiry)) {
                ++corrupt;
                return true;
            }
            if (expiry < now) {
                batch.Delete(key);
            }
            return true;
        });
    if (!s.ok()) {
        return db::ToError(s, "scan nonces");
    }
    if (corrupt > 0) {
        LOG_WARN(util::LogCategory::REGISTRY) << corrupt << " unreadable nonce rows kept";
    }
    if (batch.Empty()) {
        return size_t{0};
    }

    s = db_.Write(&batch);
    if (!s.ok()) {
        return db::ToError(s, "purge nonces");
    }
    LOG_DEBUG(util::LogCategory::REGISTRY) << "Purged " << batch.Count() << " expired nonces";
    return batch.Count();
}

Result<size_t> RegistryStore::RebuildIndex() {
    std::lock_guard<std::mutex> lock(writeMutex_);

    std::vector<matcher::IndexEntry> entries;
    size_t corrupt = 0;
    db::Status s = db_.ScanPrefix(db::MakeKey(db::prefix::IDENTITY),
        [&](const db::Slice& key, const db::Slice& value) {
            IdentityRecord record;
            if (!db::DeserializeFromString(value.ToString(), record)) {
                ++corrupt;
                LOG_WARN(util::LogCategory::REGISTRY)
                    << "Skipping corrupt identity " << util::LogId(key.ToString().substr(1));
                return true;
            }
            if (!record.revoked && record.HasVector()) {
                entries.push_back({record.fingerprint, record.ownerKey,
                                   *record.encryptedVector, record.sequence});
            }
            return true;
        });
    if (!s.ok()) {
        return db::ToError(s, "scan identities");
    }

    std::sort(entries.begin(), entries.end(),
              [](const matcher::IndexEntry& a, const matcher::IndexEntry& b) {
                  return a.sequence < b.sequence;
              });

    index_.Clear();
    for (auto& entry : entries) {
        index_.Insert(std::move(entry));
    }

    LOG_INFO(util::LogCategory::MATCHER) << "Vector index rebuilt with " << entries.size()
                                         << " entries (" << corrupt << " corrupt skipped)";
    return entries.size();
}

Result<RotationReport> RegistryStore::RotateEncryption(bool dryRun) {
    auto report = [&]() {
        std::lock_guard<std::mutex> lock(writeMutex_);
        return KeyRotator(db_, cipher_).Run(dryRun);
    }();
    if (!report) {
        return report;
    }

    if (report->committed) {
        auto rebuilt = RebuildIndex();
        if (!rebuilt) {
            return rebuilt.GetError();
        }
    }
    return report;
}

} // namespace registry
} // namespace vface
