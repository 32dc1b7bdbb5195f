// VFACE - Encryption Key Rotation Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/registry/key_rotation.h"
#include "vface/registry/identity.h"
#include "vface/util/logging.h"

namespace vface {
namespace registry {

KeyRotator::KeyRotator(db::Database& db, const VectorCipher& cipher)
    : db_(db), cipher_(cipher) {}

Result<RotationReport> KeyRotator::Run(bool dryRun) const {
    RotationReport report;
    report.targetVersion = cipher_.CurrentVersion();
    report.dryRun = dryRun;

    LOG_INFO(util::LogCategory::KEYSTORE) << "Key rotation to v" << report.targetVersion
                                          << (dryRun ? " (dry run)" : "");

    db::WriteBatch batch;
    db::Status s = db_.ScanPrefix(db::MakeKey(db::prefix::IDENTITY),
        [&](const db::Slice& key, const db::Slice& value) {
            IdentityRecord record;
            if (!db::DeserializeFromString(value.ToString(), record)) {
                std::string fingerprint = key.ToString().substr(1);
                report.errors.push_back({fingerprint, "record is corrupt"});
                return true;
            }
            if (!record.HasVector()) {
                return true;
            }
            ++report.candidates;

            auto reencrypted = cipher_.ReEncrypt(*record.encryptedVector);
            if (!reencrypted) {
                report.errors.push_back({record.fingerprint, reencrypted.GetError().Message()});
                LOG_ERROR(util::LogCategory::KEYSTORE)
                    << "Cannot rotate " << util::LogId(record.fingerprint) << ": "
                    << reencrypted.GetError().Message();
                return true;
            }
            if (reencrypted->oldVersion == reencrypted->newVersion) {
                ++report.skipped;
                return true;
            }

            record.encryptedVector = reencrypted->newPayload;
            record.keyVersion = reencrypted->newVersion;
            if (!record.commitmentNonce.empty()) {
                record.commitment = ComputeCommitment(*record.encryptedVector,
                                                      record.commitmentNonce);
            }
            batch.Put(key, db::SerializeToString(record));
            ++report.rotated;
            return true;
        });
    if (!s.ok()) {
        return db::ToError(s, "scan identities for rotation");
    }

    LogInfoF(util::LogCategory::KEYSTORE, "Rotation scan: %llu rotated, %llu skipped, %zu errors",
             static_cast<unsigned long long>(report.rotated),
             static_cast<unsigned long long>(report.skipped), report.errors.size());

    if (!report.errors.empty()) {
        LOG_ERROR(util::LogCategory::KEYSTORE) << "Rotation aborted; no records were changed";
        return report;
    }
    if (dryRun || batch.Empty()) {
        return report;
    }

    db::WriteOptions options;
    options.sync = true;
    s = db_.Write(options, &batch);
    if (!s.ok()) {
        return db::ToError(s, "commit key rotation");
    }
    report.committed = true;
    LOG_INFO(util::LogCategory::KEYSTORE) << "Rotation committed: " << report.rotated
                                          << " vectors re-encrypted";
    return report;
}

} // namespace registry
} // namespace vface
