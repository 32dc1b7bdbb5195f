// VFACE - Fingerprint Derivation
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Derives the exact-match identifier of a feature vector:
//   L2-normalize -> round to `precision` decimals -> canonical JSON -> SHA-256
//
// The canonical text is the same one the client SDK hashes, so a client and
// the registry derive identical fingerprints for the same vector.

#ifndef VFACE_REGISTRY_FINGERPRINT_H
#define VFACE_REGISTRY_FINGERPRINT_H

#include "vface/core/error.h"
#include "vface/core/types.h"

#include <cstddef>
#include <string>

namespace vface {
namespace registry {

/// Default feature vector dimension
static constexpr size_t DEFAULT_DIMENSION = 128;

/// Default number of decimals kept when quantizing
static constexpr int DEFAULT_PRECISION = 4;

/// Largest precision whose canonical form never needs exponent notation
static constexpr int MAX_PRECISION = 6;

/// Fingerprint length in hex characters
static constexpr size_t FINGERPRINT_HEX_SIZE = 64;

/**
 * Deterministic fingerprint derivation. Pure; safe to share between threads.
 */
class FingerprintDeriver {
public:
    struct Config {
        size_t dimension{DEFAULT_DIMENSION};
        int precision{DEFAULT_PRECISION};
    };

    FingerprintDeriver() = default;

    /// @throws std::invalid_argument on a zero dimension or precision out of [0, 6]
    explicit FingerprintDeriver(const Config& config);

    const Config& GetConfig() const { return config_; }

    /**
     * Derive the 64-character lowercase hex fingerprint.
     * @return DimensionMismatch if vector.size() != dimension,
     *         InvalidVector for a zero or non-finite vector
     */
    Result<std::string> Derive(const FeatureVector& vector) const;

    /// The canonical text that Derive hashes, e.g. "[0.0884,-0.1,0,...]"
    Result<std::string> Canonicalize(const FeatureVector& vector) const;

private:
    Config config_;
};

/**
 * Check dimension, finiteness and non-zero magnitude.
 * Shared by the deriver, the matcher and registration.
 */
Result<void> ValidateVector(const FeatureVector& vector, size_t dimension);

/// Scale to unit length; the vector must have a non-zero finite norm
FeatureVector L2Normalize(const FeatureVector& vector);

/**
 * Shortest decimal text of `value` rounded half away from zero to
 * `precision` decimals: trailing zeros and a trailing point stripped,
 * negative zero printed as "0".
 */
std::string FormatQuantized(double value, int precision);

/// Exactly 64 characters of [0-9a-f]
bool IsValidFingerprint(const std::string& fingerprint);

} // namespace registry
} // namespace vface

#endif // VFACE_REGISTRY_FINGERPRINT_H
