// VFACE - Authenticated Encryption
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// AES-256-GCM primitives used to seal biometric vectors at rest.

#ifndef VFACE_CRYPTO_AEAD_H
#define VFACE_CRYPTO_AEAD_H

#include "vface/core/types.h"

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace vface {

/// AES-256 key size
static constexpr size_t AES_KEY_SIZE = 32;

/// GCM nonce size used for sealing
static constexpr size_t AES_NONCE_SIZE = 12;

/// GCM authentication tag size
static constexpr size_t AES_TAG_SIZE = 16;

using EncryptionKey = std::array<Byte, AES_KEY_SIZE>;
using AeadNonce = std::array<Byte, AES_NONCE_SIZE>;

/**
 * Stateless AES-256-GCM engine.
 */
class CryptoEngine {
public:
    /// Encrypt data using AES-256-GCM
    /// @param key Encryption key (32 bytes)
    /// @param nonce Nonce (12 bytes, must be unique per key)
    /// @param plaintext Data to encrypt
    /// @param aad Additional authenticated data (optional)
    /// @return Ciphertext with the 16-byte tag appended
    /// @throws std::runtime_error if OpenSSL fails
    static std::vector<Byte> Encrypt(
        const EncryptionKey& key,
        const AeadNonce& nonce,
        const std::vector<Byte>& plaintext,
        const std::vector<Byte>& aad = {});

    /// Decrypt ciphertext||tag produced by Encrypt
    /// @return Plaintext, or nullopt on authentication failure
    static std::optional<std::vector<Byte>> Decrypt(
        const EncryptionKey& key,
        const AeadNonce& nonce,
        const std::vector<Byte>& ciphertext,
        const std::vector<Byte>& aad = {});

    /// Decrypt with an IV of arbitrary length (1 to 64 bytes)
    /// @return Plaintext, or nullopt on authentication failure or bad IV length
    static std::optional<std::vector<Byte>> Decrypt(
        const EncryptionKey& key,
        const std::vector<Byte>& iv,
        const std::vector<Byte>& ciphertext,
        const std::vector<Byte>& aad = {});

    static AeadNonce GenerateNonce();

    static EncryptionKey GenerateKey();

    /// Securely zero memory
    static void SecureZero(void* ptr, size_t size);
};

} // namespace vface

#endif // VFACE_CRYPTO_AEAD_H
