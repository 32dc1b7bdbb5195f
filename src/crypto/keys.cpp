// VFACE - secp256k1 Keys Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/crypto/keys.h"
#include "vface/core/hex.h"
#include "vface/core/random.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace vface {

namespace {

struct ECKeyDeleter { void operator()(EC_KEY* k) const { EC_KEY_free(k); } };
struct ECPointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct BNDeleter { void operator()(BIGNUM* b) const { BN_clear_free(b); } };
struct SigDeleter { void operator()(ECDSA_SIG* s) const { ECDSA_SIG_free(s); } };

using ECKeyPtr = std::unique_ptr<EC_KEY, ECKeyDeleter>;
using ECPointPtr = std::unique_ptr<EC_POINT, ECPointDeleter>;
using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;
using SigPtr = std::unique_ptr<ECDSA_SIG, SigDeleter>;

ECKeyPtr NewCurveKey() {
    ECKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key) {
        throw std::runtime_error("Failed to create secp256k1 key context");
    }
    return key;
}

/// EC_KEY holding only the public point; null if the encoding is not on the curve
ECKeyPtr PublicECKey(const uint8_t* data, size_t len) {
    ECKeyPtr key = NewCurveKey();
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    ECPointPtr point(EC_POINT_new(group));
    if (!point) {
        return nullptr;
    }
    if (!EC_POINT_oct2point(group, point.get(), data, len, nullptr)) {
        return nullptr;
    }
    if (!EC_KEY_set_public_key(key.get(), point.get())) {
        return nullptr;
    }
    return key;
}

/// EC_KEY holding the private scalar and the matching public point
ECKeyPtr PrivateECKey(const uint8_t* data) {
    ECKeyPtr key = NewCurveKey();
    BNPtr priv(BN_bin2bn(data, PrivateKey::SIZE, nullptr));
    if (!priv || !EC_KEY_set_private_key(key.get(), priv.get())) {
        throw std::runtime_error("Failed to load private key");
    }

    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    ECPointPtr pub(EC_POINT_new(group));
    if (!pub ||
        !EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr) ||
        !EC_KEY_set_public_key(key.get(), pub.get())) {
        throw std::runtime_error("Failed to derive public key");
    }
    return key;
}

bool IsValidScalar(const uint8_t* data) {
    BNPtr k(BN_bin2bn(data, PrivateKey::SIZE, nullptr));
    if (!k || BN_is_zero(k.get())) {
        return false;
    }
    ECKeyPtr key = NewCurveKey();
    const BIGNUM* order = EC_GROUP_get0_order(EC_KEY_get0_group(key.get()));
    return BN_cmp(k.get(), order) < 0;
}

} // namespace

// ============================================================================
// PublicKey
// ============================================================================

PublicKey::PublicKey(const uint8_t* data, size_t len) {
    data_.fill(0);
    if (!data || (len != COMPRESSED_SIZE && len != MAX_SIZE)) {
        return;
    }
    std::copy(data, data + len, data_.begin());
    size_ = static_cast<uint8_t>(len);

    bool prefixOk = (len == COMPRESSED_SIZE && (data[0] == 0x02 || data[0] == 0x03)) ||
                    (len == MAX_SIZE && data[0] == 0x04);
    valid_ = prefixOk && PublicECKey(data_.data(), size_) != nullptr;
}

bool PublicKey::Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    if (!valid_ || signature.empty() || signature.size() > secp256k1::MAX_SIGNATURE_SIZE) {
        return false;
    }
    ECKeyPtr key = PublicECKey(data_.data(), size_);
    if (!key) {
        return false;
    }
    return ECDSA_verify(0, hash.data(), static_cast<int>(hash.size()),
                        signature.data(), static_cast<int>(signature.size()),
                        key.get()) == 1;
}

bool PublicKey::VerifyCompact(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    if (!valid_ || signature.size() != secp256k1::COMPACT_SIGNATURE_SIZE) {
        return false;
    }
    ECKeyPtr key = PublicECKey(data_.data(), size_);
    if (!key) {
        return false;
    }

    SigPtr sig(ECDSA_SIG_new());
    BIGNUM* r = BN_bin2bn(signature.data(), 32, nullptr);
    BIGNUM* s = BN_bin2bn(signature.data() + 32, 32, nullptr);
    if (!sig || !r || !s) {
        BN_free(r);
        BN_free(s);
        return false;
    }
    // ECDSA_SIG_set0 takes ownership of r and s
    if (!ECDSA_SIG_set0(sig.get(), r, s)) {
        BN_free(r);
        BN_free(s);
        return false;
    }

    return ECDSA_do_verify(hash.data(), static_cast<int>(hash.size()),
                           sig.get(), key.get()) == 1;
}

bool PublicKey::operator==(const PublicKey& other) const {
    return size_ == other.size_ &&
           std::equal(data_.begin(), data_.begin() + size_, other.data_.begin());
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), size_);
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    auto bytes = TryHexToBytes(hex);
    if (!bytes) {
        return std::nullopt;
    }
    PublicKey key(*bytes);
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::PrivateKey(const std::vector<uint8_t>& data) {
    data_.fill(0);
    if (data.size() != SIZE) {
        return;
    }
    std::copy(data.begin(), data.end(), data_.begin());
    valid_ = IsValidScalar(data_.data());
    if (!valid_) {
        Clear();
    }
}

PrivateKey::~PrivateKey() {
    Clear();
}

PrivateKey::PrivateKey(const PrivateKey& other)
    : data_(other.data_), valid_(other.valid_) {}

PrivateKey& PrivateKey::operator=(const PrivateKey& other) {
    if (this != &other) {
        data_ = other.data_;
        valid_ = other.valid_;
    }
    return *this;
}

PrivateKey PrivateKey::Generate() {
    // The chance of drawing 0 or >= n is ~2^-128; loop anyway
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::vector<uint8_t> candidate = GetRandBytes(SIZE);
        PrivateKey key(candidate);
        OPENSSL_cleanse(candidate.data(), candidate.size());
        if (key.IsValid()) {
            return key;
        }
    }
    throw std::runtime_error("Failed to generate private key");
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }

    ECKeyPtr key = PrivateECKey(data_.data());
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    const EC_POINT* point = EC_KEY_get0_public_key(key.get());

    uint8_t out[PublicKey::COMPRESSED_SIZE];
    size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED,
                                    out, sizeof(out), nullptr);
    if (len != sizeof(out)) {
        throw std::runtime_error("Failed to encode public key");
    }
    return PublicKey(out, len);
}

std::vector<uint8_t> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        throw std::runtime_error("Cannot sign with an invalid private key");
    }

    ECKeyPtr key = PrivateECKey(data_.data());
    std::vector<uint8_t> signature(ECDSA_size(key.get()));
    unsigned int sigLen = static_cast<unsigned int>(signature.size());
    if (!ECDSA_sign(0, hash.data(), static_cast<int>(hash.size()),
                    signature.data(), &sigLen, key.get())) {
        throw std::runtime_error("ECDSA signing failed");
    }
    signature.resize(sigLen);
    return signature;
}

std::vector<uint8_t> PrivateKey::SignCompact(const Hash256& hash) const {
    if (!valid_) {
        throw std::runtime_error("Cannot sign with an invalid private key");
    }

    ECKeyPtr key = PrivateECKey(data_.data());
    SigPtr sig(ECDSA_do_sign(hash.data(), static_cast<int>(hash.size()), key.get()));
    if (!sig) {
        throw std::runtime_error("ECDSA signing failed");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    std::vector<uint8_t> out(secp256k1::COMPACT_SIGNATURE_SIZE);
    if (BN_bn2binpad(r, out.data(), 32) != 32 ||
        BN_bn2binpad(s, out.data() + 32, 32) != 32) {
        throw std::runtime_error("Failed to encode signature");
    }
    return out;
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    auto bytes = TryHexToBytes(hex);
    if (!bytes) {
        return std::nullopt;
    }
    PrivateKey key(*bytes);
    OPENSSL_cleanse(bytes->data(), bytes->size());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

void PrivateKey::Clear() {
    OPENSSL_cleanse(data_.data(), data_.size());
    valid_ = false;
}

// ============================================================================
// KeyPair
// ============================================================================

KeyPair::KeyPair(const PrivateKey& priv)
    : privateKey_(priv), publicKey_(priv.GetPublicKey()) {}

KeyPair KeyPair::Generate() {
    return KeyPair(PrivateKey::Generate());
}

} // namespace vface
