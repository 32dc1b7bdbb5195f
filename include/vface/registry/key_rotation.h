// VFACE - Encryption Key Rotation
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Offline batch job that re-seals every stored vector under the current key
// version. All updates go into one write batch: either every record moves to
// the new version or none does.

#ifndef VFACE_REGISTRY_KEY_ROTATION_H
#define VFACE_REGISTRY_KEY_ROTATION_H

#include "vface/core/error.h"
#include "vface/db/database.h"
#include "vface/registry/vector_cipher.h"

#include <cstdint>
#include <string>
#include <vector>

namespace vface {
namespace registry {

struct RotationFailure {
    std::string fingerprint;
    std::string message;
};

struct RotationReport {
    /// Version every rotated payload was sealed under
    uint32_t targetVersion{0};
    /// Records holding a vector
    uint64_t candidates{0};
    uint64_t rotated{0};
    /// Records already at the target version
    uint64_t skipped{0};
    std::vector<RotationFailure> errors;
    bool dryRun{false};
    /// True once the batch was written
    bool committed{false};
};

/**
 * Re-encrypts stored vectors. The caller serializes runs against other
 * registry writers.
 */
class KeyRotator {
public:
    KeyRotator(db::Database& db, const VectorCipher& cipher);

    /**
     * Rotate every record with a vector below the current version.
     * Per-record failures are collected in the report and abort the write.
     * @param dryRun Compute the report without writing
     * @return StorageError if the scan or the commit fails
     */
    Result<RotationReport> Run(bool dryRun) const;

private:
    db::Database& db_;
    const VectorCipher& cipher_;
};

} // namespace registry
} // namespace vface

#endif // VFACE_REGISTRY_KEY_ROTATION_H
