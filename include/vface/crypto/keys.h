// VFACE - secp256k1 Keys
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// ECDSA over secp256k1, used for chain entry signatures, consent token
// signatures and identity ownership proofs. Backed by OpenSSL.

#ifndef VFACE_CRYPTO_KEYS_H
#define VFACE_CRYPTO_KEYS_H

#include "vface/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vface {

namespace secp256k1 {
    constexpr size_t PRIVATE_KEY_SIZE = 32;
    /// SEC1 compressed point: 0x02/0x03 prefix and X
    constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;
    /// SEC1 uncompressed point: 0x04 prefix, X and Y
    constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;
    /// Upper bound of a DER ECDSA signature
    constexpr size_t MAX_SIGNATURE_SIZE = 72;
    /// r and s as two 32-byte big-endian integers
    constexpr size_t COMPACT_SIGNATURE_SIZE = 64;
}

// ============================================================================
// PublicKey
// ============================================================================

/// SEC1-encoded secp256k1 point, validated against the curve when built
class PublicKey {
public:
    static constexpr size_t MAX_SIZE = secp256k1::UNCOMPRESSED_PUBKEY_SIZE;
    static constexpr size_t COMPRESSED_SIZE = secp256k1::COMPRESSED_PUBKEY_SIZE;

    PublicKey() { data_.fill(0); }
    PublicKey(const uint8_t* data, size_t len);
    explicit PublicKey(const std::vector<uint8_t>& data)
        : PublicKey(data.data(), data.size()) {}

    /// True if the bytes decode to a point on the curve
    bool IsValid() const { return valid_; }
    bool IsCompressed() const { return size_ == COMPRESSED_SIZE; }
    size_t size() const { return size_; }
    const uint8_t* data() const { return data_.data(); }

    /// DER signature check; owner commands and chain entries use this form
    bool Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const;

    /// 64-byte r||s check; consent tokens use this form
    bool VerifyCompact(const Hash256& hash, const std::vector<uint8_t>& signature) const;

    bool operator==(const PublicKey& other) const;
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

    std::string ToHex() const;

    /// Parse from hex; nullopt unless the result is a valid curve point
    static std::optional<PublicKey> FromHex(const std::string& hex);

private:
    std::array<uint8_t, MAX_SIZE> data_;
    uint8_t size_{0};
    bool valid_{false};
};

// ============================================================================
// PrivateKey
// ============================================================================

/// Scalar in [1, n-1]; wiped with OPENSSL_cleanse on destruction
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;

    PrivateKey() { data_.fill(0); }
    explicit PrivateKey(const std::vector<uint8_t>& data);
    ~PrivateKey();

    PrivateKey(const PrivateKey& other);
    PrivateKey& operator=(const PrivateKey& other);

    static PrivateKey Generate();

    bool IsValid() const { return valid_; }

    /// Derive the compressed public key
    PublicKey GetPublicKey() const;

    /**
     * Sign a SHA-256 digest.
     * Sign() returns DER, SignCompact() returns 64-byte r||s.
     * @throws std::runtime_error if the key is invalid or OpenSSL fails
     */
    std::vector<uint8_t> Sign(const Hash256& hash) const;
    std::vector<uint8_t> SignCompact(const Hash256& hash) const;

    /// Hex of the raw scalar (handle with care)
    std::string ToHex() const;

    static std::optional<PrivateKey> FromHex(const std::string& hex);

    /// Wipe and invalidate the key
    void Clear();

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// KeyPair
// ============================================================================

/// Signing identity of the node: keystore signing key plus its public half
class KeyPair {
public:
    KeyPair() = default;
    explicit KeyPair(const PrivateKey& priv);

    static KeyPair Generate();

    bool IsValid() const { return privateKey_.IsValid(); }
    const PrivateKey& GetPrivateKey() const { return privateKey_; }
    const PublicKey& GetPublicKey() const { return publicKey_; }

    std::vector<uint8_t> Sign(const Hash256& hash) const {
        return privateKey_.Sign(hash);
    }

    bool Verify(const Hash256& hash, const std::vector<uint8_t>& sig) const {
        return publicKey_.Verify(hash, sig);
    }

private:
    PrivateKey privateKey_;
    PublicKey publicKey_;
};

} // namespace vface

#endif // VFACE_CRYPTO_KEYS_H
