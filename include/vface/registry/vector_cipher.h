// VFACE - Versioned Vector Encryption
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Seals feature vectors at rest with AES-256-GCM under versioned keys.
//
// Payload format:
//   v<version>:<iv hex>:<tag hex>:<ciphertext hex>
// The "v<version>" text is bound as additional authenticated data.
// The legacy form <iv hex>:<tag hex>:<ciphertext hex> (no AAD) decrypts
// as version 1.

#ifndef VFACE_REGISTRY_VECTOR_CIPHER_H
#define VFACE_REGISTRY_VECTOR_CIPHER_H

#include "vface/core/error.h"
#include "vface/core/types.h"
#include "vface/crypto/keystore.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vface {
namespace registry {

/// Version assumed for payloads without a version tag
static constexpr uint32_t LEGACY_KEY_VERSION = 1;

/**
 * Parsed payload fields.
 */
struct SealedPayload {
    uint32_t version{0};
    std::vector<Byte> iv;
    std::vector<Byte> tag;
    std::vector<Byte> ciphertext;
    /// True for the untagged three-part form
    bool legacy{false};

    /// Text bound as AAD ("v2"); empty for legacy payloads
    std::string AssociatedData() const;
};

/**
 * Result of re-sealing a payload under the current key.
 */
struct ReEncryptResult {
    std::string newPayload;
    uint32_t oldVersion{0};
    uint32_t newVersion{0};
};

/**
 * Encrypts with the current key version and decrypts with whichever
 * version a payload names. Holds the key store by reference.
 */
class VectorCipher {
public:
    explicit VectorCipher(const KeyStore& keys);

    /**
     * Seal plaintext under the current version.
     * @return KeyStoreError if the current key is unavailable or encryption fails
     */
    Result<std::string> Encrypt(const std::string& plaintext) const;

    /**
     * Open a payload.
     * @return DecryptionError on a malformed payload, unknown version or
     *         authentication failure
     */
    Result<std::string> Decrypt(const std::string& payload) const;

    /// Decrypt under the recorded version and seal under the current one
    Result<ReEncryptResult> ReEncrypt(const std::string& payload) const;

    /// Seal a vector (JSON array, 17 significant digits)
    Result<std::string> EncryptVector(const FeatureVector& vector) const;

    /// Open a payload produced by EncryptVector
    Result<FeatureVector> DecryptVector(const std::string& payload) const;

    /// Version that new payloads are sealed with
    uint32_t CurrentVersion() const { return keys_.CurrentVersion(); }

    /// Split and hex-decode a payload; nullopt if malformed
    static std::optional<SealedPayload> ParsePayload(const std::string& payload);

private:
    const KeyStore& keys_;
};

/// JSON array text of a vector, each value with 17 significant digits
std::string SerializeVector(const FeatureVector& vector);

/// Parse a JSON array of numbers; nullopt if the text is anything else
std::optional<FeatureVector> ParseVector(const std::string& text);

} // namespace registry
} // namespace vface

#endif // VFACE_REGISTRY_VECTOR_CIPHER_H
