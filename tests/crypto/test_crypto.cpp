// VFACE - Crypto Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>
#include "vface/core/hex.h"
#include "vface/crypto/aead.h"
#include "vface/crypto/keys.h"
#include "vface/crypto/sha256.h"

#include <string>
#include <vector>

namespace vface {
namespace test {

// ============================================================================
// SHA-256
// ============================================================================

TEST(SHA256Test, KnownVectors) {
    EXPECT_EQ(SHA256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(SHA256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    SHA256 hasher;
    hasher.Write("a").Write("b").Write("c");
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(BytesToHex(out, sizeof(out)), SHA256Hash(std::string("abc")).ToHex());

    hasher.Reset().Write("");
    hasher.Finalize(out);
    EXPECT_EQ(BytesToHex(out, sizeof(out)), SHA256Hex(""));
}

// ============================================================================
// secp256k1 Keys
// ============================================================================

TEST(KeysTest, GeneratorPoint) {
    auto priv = PrivateKey::FromHex(std::string(63, '0') + "1");
    ASSERT_TRUE(priv.has_value());
    EXPECT_EQ(priv->GetPublicKey().ToHex(),
              "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
}

TEST(KeysTest, RejectsOutOfRangeScalars) {
    EXPECT_FALSE(PrivateKey::FromHex(std::string(64, '0')).has_value());
    // Curve order n
    EXPECT_FALSE(PrivateKey::FromHex(
        "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141").has_value());
    EXPECT_FALSE(PrivateKey::FromHex("abcd").has_value());
}

TEST(KeysTest, PublicKeyParsing) {
    auto key = KeyPair::Generate();
    ASSERT_TRUE(key.IsValid());
    EXPECT_TRUE(key.GetPublicKey().IsCompressed());

    auto parsed = PublicKey::FromHex(key.GetPublicKey().ToHex());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, key.GetPublicKey());

    // x = 0 is not on the curve
    EXPECT_FALSE(PublicKey::FromHex("02" + std::string(64, '0')).has_value());
    EXPECT_FALSE(PublicKey::FromHex("nothex").has_value());
}

TEST(KeysTest, SignAndVerify) {
    auto key = KeyPair::Generate();
    Hash256 digest = SHA256Hash(std::string("revoke"));

    auto der = key.Sign(digest);
    EXPECT_LE(der.size(), secp256k1::MAX_SIGNATURE_SIZE);
    EXPECT_TRUE(key.Verify(digest, der));

    auto compact = key.GetPrivateKey().SignCompact(digest);
    ASSERT_EQ(compact.size(), secp256k1::COMPACT_SIGNATURE_SIZE);
    EXPECT_TRUE(key.GetPublicKey().VerifyCompact(digest, compact));

    Hash256 other = SHA256Hash(std::string("register"));
    EXPECT_FALSE(key.Verify(other, der));
    EXPECT_FALSE(key.GetPublicKey().VerifyCompact(other, compact));

    auto stranger = KeyPair::Generate();
    EXPECT_FALSE(stranger.Verify(digest, der));
}

TEST(KeysTest, GarbageSignaturesFail) {
    auto key = KeyPair::Generate();
    Hash256 digest = SHA256Hash(std::string("x"));
    EXPECT_FALSE(key.Verify(digest, {}));
    EXPECT_FALSE(key.Verify(digest, std::vector<uint8_t>(70, 0x30)));
    EXPECT_FALSE(key.GetPublicKey().VerifyCompact(digest, std::vector<uint8_t>(64, 0)));
    EXPECT_FALSE(key.GetPublicKey().VerifyCompact(digest, std::vector<uint8_t>(63, 1)));
}

// ============================================================================
// AES-256-GCM
// ============================================================================

TEST(AeadTest, NistZeroVectors) {
    EncryptionKey key{};
    AeadNonce nonce{};

    auto empty = CryptoEngine::Encrypt(key, nonce, {});
    EXPECT_EQ(BytesToHex(empty), "530f8afbc74536b9a963b4f1c4cb738b");

    auto sealed = CryptoEngine::Encrypt(key, nonce, std::vector<Byte>(16, 0));
    EXPECT_EQ(BytesToHex(sealed),
              "cea7403d4d606b6e074ec5d3baf39d18d0d1c8a799996bf0265b98b5d48ab919");
}

TEST(AeadTest, DetectsTampering) {
    auto key = CryptoEngine::GenerateKey();
    auto nonce = CryptoEngine::GenerateNonce();
    std::vector<Byte> plaintext = {'v', 'e', 'c', 't', 'o', 'r'};
    std::vector<Byte> aad = {'v', '1'};

    auto sealed = CryptoEngine::Encrypt(key, nonce, plaintext, aad);
    ASSERT_EQ(sealed.size(), plaintext.size() + AES_TAG_SIZE);

    auto opened = CryptoEngine::Decrypt(key, nonce, sealed, aad);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, plaintext);

    auto flipped = sealed;
    flipped[0] ^= 0x01;
    EXPECT_FALSE(CryptoEngine::Decrypt(key, nonce, flipped, aad).has_value());
    EXPECT_FALSE(CryptoEngine::Decrypt(key, nonce, sealed, {'v', '2'}).has_value());

    auto otherKey = CryptoEngine::GenerateKey();
    EXPECT_FALSE(CryptoEngine::Decrypt(otherKey, nonce, sealed, aad).has_value());
}

TEST(AeadTest, VariableLengthIV) {
    auto key = CryptoEngine::GenerateKey();
    auto nonce = CryptoEngine::GenerateNonce();
    std::vector<Byte> plaintext(40, 0x5a);
    auto sealed = CryptoEngine::Encrypt(key, nonce, plaintext);

    std::vector<Byte> iv(nonce.begin(), nonce.end());
    auto opened = CryptoEngine::Decrypt(key, iv, sealed);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, plaintext);

    EXPECT_FALSE(CryptoEngine::Decrypt(key, std::vector<Byte>{}, sealed).has_value());
    EXPECT_FALSE(CryptoEngine::Decrypt(key, std::vector<Byte>(65, 0), sealed).has_value());
    EXPECT_FALSE(CryptoEngine::Decrypt(key, std::vector<Byte>(16, 0), sealed).has_value());
}

} // namespace test
} // namespace vface
