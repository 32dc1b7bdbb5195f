// VFACE - Versioned Vector Encryption Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/registry/vector_cipher.h"
#include "vface/core/hex.h"
#include "vface/crypto/aead.h"
#include "vface/util/json.h"
#include "vface/util/logging.h"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace vface {
namespace registry {

namespace {

std::vector<std::string> Split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

std::optional<uint32_t> ParseVersionTag(const std::string& tag) {
    if (tag.size() < 2 || tag.size() > 10 || tag[0] != 'v') {
        return std::nullopt;
    }
    uint64_t version = 0;
    for (size_t i = 1; i < tag.size(); ++i) {
        if (tag[i] < '0' || tag[i] > '9') {
            return std::nullopt;
        }
        version = version * 10 + static_cast<uint64_t>(tag[i] - '0');
    }
    // Canonical decimal only: no leading zeros, no v0
    if (version == 0 || version > UINT32_MAX || tag[1] == '0') {
        return std::nullopt;
    }
    return static_cast<uint32_t>(version);
}

Error DecryptionFailure(const std::string& message) {
    return Error(ErrorCode::DecryptionError, message);
}

} // namespace

// ============================================================================
// SealedPayload
// ============================================================================

std::string SealedPayload::AssociatedData() const {
    if (legacy) {
        return "";
    }
    return "v" + std::to_string(version);
}

// ============================================================================
// VectorCipher
// ============================================================================

VectorCipher::VectorCipher(const KeyStore& keys) : keys_(keys) {}

std::optional<SealedPayload> VectorCipher::ParsePayload(const std::string& payload) {
    std::vector<std::string> parts = Split(payload, ':');

    SealedPayload sealed;
    size_t offset = 0;
    if (parts.size() == 4) {
        auto version = ParseVersionTag(parts[0]);
        if (!version) {
            return std::nullopt;
        }
        sealed.version = *version;
        offset = 1;
    } else if (parts.size() == 3) {
        sealed.version = LEGACY_KEY_VERSION;
        sealed.legacy = true;
    } else {
        return std::nullopt;
    }

    auto iv = TryHexToBytes(parts[offset]);
    auto tag = TryHexToBytes(parts[offset + 1]);
    auto ciphertext = TryHexToBytes(parts[offset + 2]);
    if (!iv || !tag || !ciphertext) {
        return std::nullopt;
    }
    if (iv->empty() || iv->size() > 64 || tag->size() != AES_TAG_SIZE) {
        return std::nullopt;
    }
    // Sealing always uses the standard GCM nonce; only legacy payloads may differ
    if (!sealed.legacy && iv->size() != AES_NONCE_SIZE) {
        return std::nullopt;
    }

    sealed.iv = std::move(*iv);
    sealed.tag = std::move(*tag);
    sealed.ciphertext = std::move(*ciphertext);
    return sealed;
}

Result<std::string> VectorCipher::Encrypt(const std::string& plaintext) const {
    uint32_t version = keys_.CurrentVersion();
    auto key = keys_.GetEncryptionKey(version);
    if (!key) {
        return Error(ErrorCode::KeyStoreError,
                     "No encryption key for current version " + std::to_string(version));
    }

    std::string aadText = "v" + std::to_string(version);
    std::vector<Byte> aad(aadText.begin(), aadText.end());
    std::vector<Byte> data(plaintext.begin(), plaintext.end());

    std::vector<Byte> sealed;
    try {
        AeadNonce nonce = CryptoEngine::GenerateNonce();
        sealed = CryptoEngine::Encrypt(*key, nonce, data, aad);
        CryptoEngine::SecureZero(data.data(), data.size());
        CryptoEngine::SecureZero(key->data(), key->size());

        std::string payload;
        payload.reserve(aadText.size() + 3 + (nonce.size() + sealed.size()) * 2);
        payload += aadText;
        payload += ':';
        payload += BytesToHex(nonce.data(), nonce.size());
        payload += ':';
        payload += BytesToHex(sealed.data() + sealed.size() - AES_TAG_SIZE, AES_TAG_SIZE);
        payload += ':';
        payload += BytesToHex(sealed.data(), sealed.size() - AES_TAG_SIZE);
        return payload;
    } catch (const std::runtime_error& e) {
        CryptoEngine::SecureZero(data.data(), data.size());
        CryptoEngine::SecureZero(key->data(), key->size());
        LOG_ERROR(util::LogCategory::CRYPTO) << "Vector encryption failed: " << e.what();
        return Error(ErrorCode::KeyStoreError, std::string("Encryption failed: ") + e.what());
    }
}

Result<std::string> VectorCipher::Decrypt(const std::string& payload) const {
    auto sealed = ParsePayload(payload);
    if (!sealed) {
        return DecryptionFailure("Malformed encrypted payload");
    }

    auto key = keys_.GetEncryptionKey(sealed->version);
    if (!key) {
        return DecryptionFailure("Unknown key version " + std::to_string(sealed->version))
            .WithDetail("version", std::to_string(sealed->version));
    }

    std::vector<Byte> combined = sealed->ciphertext;
    combined.insert(combined.end(), sealed->tag.begin(), sealed->tag.end());
    std::string aadText = sealed->AssociatedData();
    std::vector<Byte> aad(aadText.begin(), aadText.end());

    std::optional<std::vector<Byte>> plaintext;
    try {
        plaintext = CryptoEngine::Decrypt(*key, sealed->iv, combined, aad);
    } catch (const std::runtime_error& e) {
        CryptoEngine::SecureZero(key->data(), key->size());
        return Error(ErrorCode::KeyStoreError, std::string("Decryption failed: ") + e.what());
    }
    CryptoEngine::SecureZero(key->data(), key->size());

    if (!plaintext) {
        return DecryptionFailure("Authentication failed for key version " +
                                 std::to_string(sealed->version));
    }

    std::string out(plaintext->begin(), plaintext->end());
    CryptoEngine::SecureZero(plaintext->data(), plaintext->size());
    return out;
}

Result<ReEncryptResult> VectorCipher::ReEncrypt(const std::string& payload) const {
    auto sealed = ParsePayload(payload);
    if (!sealed) {
        return DecryptionFailure("Malformed encrypted payload");
    }

    auto plaintext = Decrypt(payload);
    if (!plaintext) {
        return plaintext.GetError();
    }

    auto resealed = Encrypt(plaintext.Value());
    CryptoEngine::SecureZero(&plaintext.Value()[0], plaintext.Value().size());
    if (!resealed) {
        return resealed.GetError();
    }

    ReEncryptResult result;
    result.newPayload = std::move(resealed.Value());
    result.oldVersion = sealed->version;
    result.newVersion = keys_.CurrentVersion();
    return result;
}

Result<std::string> VectorCipher::EncryptVector(const FeatureVector& vector) const {
    std::string text = SerializeVector(vector);
    auto payload = Encrypt(text);
    CryptoEngine::SecureZero(&text[0], text.size());
    return payload;
}

Result<FeatureVector> VectorCipher::DecryptVector(const std::string& payload) const {
    auto plaintext = Decrypt(payload);
    if (!plaintext) {
        return plaintext.GetError();
    }

    auto vector = ParseVector(plaintext.Value());
    CryptoEngine::SecureZero(&plaintext.Value()[0], plaintext.Value().size());
    if (!vector) {
        return DecryptionFailure("Decrypted payload is not a vector");
    }
    return std::move(*vector);
}

// ============================================================================
// Vector Text
// ============================================================================

std::string SerializeVector(const FeatureVector& vector) {
    std::string out = "[";
    char buf[32];
    for (size_t i = 0; i < vector.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        std::snprintf(buf, sizeof(buf), "%.17g", vector[i]);
        out += buf;
    }
    out.push_back(']');
    return out;
}

std::optional<FeatureVector> ParseVector(const std::string& text) {
    auto doc = util::JSONValue::TryParse(text);
    if (!doc || !doc->IsArray()) {
        return std::nullopt;
    }

    FeatureVector vector;
    vector.reserve(doc->Size());
    for (const auto& item : doc->GetArray()) {
        if (!item.IsNumber()) {
            return std::nullopt;
        }
        vector.push_back(item.GetDouble());
    }
    return vector;
}

} // namespace registry
} // namespace vface
