// VFACE - Authenticated Encryption Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/crypto/aead.h"
#include "vface/core/random.h"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace vface {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

} // namespace

std::vector<Byte> CryptoEngine::Encrypt(
    const EncryptionKey& key,
    const AeadNonce& nonce,
    const std::vector<Byte>& plaintext,
    const std::vector<Byte>& aad) {

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize AES-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(AES_NONCE_SIZE), nullptr) != 1) {
        throw std::runtime_error("Failed to set IV length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to set key/IV");
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                              static_cast<int>(aad.size())) != 1) {
            throw std::runtime_error("Failed to add AAD");
        }
    }

    std::vector<Byte> ciphertext(plaintext.size() + AES_TAG_SIZE);
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("Failed to encrypt");
    }
    int ciphertextLen = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertextLen, &len) != 1) {
        throw std::runtime_error("Failed to finalize encryption");
    }
    ciphertextLen += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(AES_TAG_SIZE),
                            ciphertext.data() + ciphertextLen) != 1) {
        throw std::runtime_error("Failed to get auth tag");
    }

    ciphertext.resize(static_cast<size_t>(ciphertextLen) + AES_TAG_SIZE);
    return ciphertext;
}

std::optional<std::vector<Byte>> CryptoEngine::Decrypt(
    const EncryptionKey& key,
    const AeadNonce& nonce,
    const std::vector<Byte>& ciphertext,
    const std::vector<Byte>& aad) {
    return Decrypt(key, std::vector<Byte>(nonce.begin(), nonce.end()), ciphertext, aad);
}

std::optional<std::vector<Byte>> CryptoEngine::Decrypt(
    const EncryptionKey& key,
    const std::vector<Byte>& iv,
    const std::vector<Byte>& ciphertext,
    const std::vector<Byte>& aad) {

    if (ciphertext.size() < AES_TAG_SIZE || iv.empty() || iv.size() > 64) {
        return std::nullopt;
    }
    size_t dataLen = ciphertext.size() - AES_TAG_SIZE;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("Failed to initialize AES-GCM");
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                              static_cast<int>(aad.size())) != 1) {
            return std::nullopt;
        }
    }

    // One spare byte so data() is never null for an empty message
    std::vector<Byte> plaintext(dataLen + 1);
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                          static_cast<int>(dataLen)) != 1) {
        SecureZero(plaintext.data(), plaintext.size());
        return std::nullopt;
    }
    int plaintextLen = len;

    // The tag is trailing; OpenSSL wants a mutable pointer
    std::vector<Byte> tag(ciphertext.end() - AES_TAG_SIZE, ciphertext.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(AES_TAG_SIZE),
                            tag.data()) != 1) {
        SecureZero(plaintext.data(), plaintext.size());
        return std::nullopt;
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintextLen, &len) != 1) {
        SecureZero(plaintext.data(), plaintext.size());
        return std::nullopt;
    }
    plaintextLen += len;

    plaintext.resize(static_cast<size_t>(plaintextLen));
    return plaintext;
}

AeadNonce CryptoEngine::GenerateNonce() {
    AeadNonce nonce{};
    GetRandBytes(nonce.data(), nonce.size());
    return nonce;
}

EncryptionKey CryptoEngine::GenerateKey() {
    EncryptionKey key{};
    GetRandBytes(key.data(), key.size());
    return key;
}

void CryptoEngine::SecureZero(void* ptr, size_t size) {
    volatile Byte* p = static_cast<volatile Byte*>(ptr);
    while (size--) {
        *p++ = 0;
    }
}

} // namespace vface
