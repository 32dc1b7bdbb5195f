// VFACE - Identity Record
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// The persisted enrollment of one fingerprint. Records are never deleted;
// revocation flips a flag and stamps the revocation time.

#ifndef VFACE_REGISTRY_IDENTITY_H
#define VFACE_REGISTRY_IDENTITY_H

#include "vface/core/serialize.h"
#include "vface/core/types.h"

#include <cstdint>
#include <ios>
#include <map>
#include <optional>
#include <string>

namespace vface {
namespace registry {

/// Metadata limits applied at registration
static constexpr size_t MAX_METADATA_ENTRIES = 32;
static constexpr size_t MAX_METADATA_KEY_LENGTH = 64;
static constexpr size_t MAX_METADATA_VALUE_LENGTH = 1024;

using Metadata = std::map<std::string, std::string>;

/**
 * Public and sealed data of a registered identity.
 */
struct IdentityRecord {
    /// On-disk encoding version
    static constexpr uint8_t SERIALIZATION_VERSION = 1;

    /// Primary key, 64 lowercase hex
    std::string fingerprint;

    /// Compressed secp256k1 public key of the owner, hex
    std::string ownerKey;

    /// Sealed vector payload, if a vector was supplied
    std::optional<std::string> encryptedVector;

    /// SHA256(encryptedVector || commitmentNonce) as anchored on the chain
    std::string commitment;

    /// 32 random bytes, hex
    std::string commitmentNonce;

    /// Key version of encryptedVector (0 when no vector)
    uint32_t keyVersion{0};

    /// Chain entry anchoring this record
    uint64_t chainIndex{0};
    std::string chainSignature;

    /// Insertion order, used to break similarity ties
    uint64_t sequence{0};

    TimestampMs createdAt{0};
    bool revoked{false};
    std::optional<TimestampMs> revokedAt;

    Metadata metadata;

    bool HasVector() const { return encryptedVector.has_value(); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        s << SERIALIZATION_VERSION;
        s << fingerprint << ownerKey << encryptedVector << commitment << commitmentNonce;
        s << keyVersion << chainIndex << chainSignature << sequence;
        s << createdAt << revoked << revokedAt << metadata;
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t version = 0;
        s >> version;
        if (version != SERIALIZATION_VERSION) {
            throw std::ios_base::failure("IdentityRecord: unknown encoding version " +
                                         std::to_string(version));
        }
        s >> fingerprint >> ownerKey >> encryptedVector >> commitment >> commitmentNonce;
        s >> keyVersion >> chainIndex >> chainSignature >> sequence;
        s >> createdAt >> revoked >> revokedAt >> metadata;
    }
};

/**
 * Commitment anchored for a record.
 * @param encryptedVector Sealed payload, or "" when no vector is stored
 * @param nonceHex Commitment nonce
 * @return Lowercase hex SHA256(encryptedVector || nonceHex)
 */
std::string ComputeCommitment(const std::string& encryptedVector, const std::string& nonceHex);

} // namespace registry
} // namespace vface

#endif // VFACE_REGISTRY_IDENTITY_H
