// VFACE - Key Store
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Holds the registry's long-lived secrets:
// - the secp256k1 signing key used for chain entries and consent tokens
// - the AES-256 vector encryption keys, indexed by version
//
// The store has an explicit lifecycle. Open() loads an existing file and
// never replaces it; a new file is generated only when asked to. Every
// mutation is persisted atomically (temp file + rename, mode 0600).

#ifndef VFACE_CRYPTO_KEYSTORE_H
#define VFACE_CRYPTO_KEYSTORE_H

#include "vface/core/error.h"
#include "vface/crypto/aead.h"
#include "vface/crypto/keys.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vface {

/// Environment variable holding the hex key for encryption version N: <prefix>N
static constexpr const char* ENV_ENCRYPTION_KEY_PREFIX = "VFACE_ENCRYPTION_KEY_V";
/// Environment variable holding a version 1 key when no versioned key is set
static constexpr const char* ENV_ENCRYPTION_KEY_LEGACY = "VFACE_ENCRYPTION_KEY";
/// Environment variable selecting the current encryption version
static constexpr const char* ENV_CURRENT_KEY_VERSION = "VFACE_CURRENT_KEY_VERSION";

class KeyStore {
public:
    struct Config {
        /// Key file location
        std::filesystem::path path;
        /// Generate and persist a fresh store when the file does not exist
        bool createIfMissing{false};
    };

    /// Current on-disk format
    static constexpr int FORMAT_VERSION = 1;

    ~KeyStore();

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;

    /**
     * Load the key file, or generate one if it is absent and
     * config.createIfMissing is set.
     * @return KeyStoreError if the file is missing (and creation is off),
     *         unreadable, or fails validation
     */
    static Result<std::unique_ptr<KeyStore>> Open(const Config& config);

    /// Fresh in-memory store with one encryption key (version 1); never persisted
    static std::unique_ptr<KeyStore> CreateEphemeral();

    /// Write the current state to disk (no-op for ephemeral stores)
    Result<void> Persist() const;

    bool IsPersistent() const { return !path_.empty(); }
    const std::filesystem::path& GetPath() const { return path_; }

    // ========================================================================
    // Signing Key
    // ========================================================================

    const KeyPair& SigningKey() const { return signingKey_; }
    std::string PublicKeyHex() const { return signingKey_.GetPublicKey().ToHex(); }

    // ========================================================================
    // Encryption Keys
    // ========================================================================

    /// Version used to seal new data
    uint32_t CurrentVersion() const;

    /// Key for a version, or nullopt if unknown
    std::optional<EncryptionKey> GetEncryptionKey(uint32_t version) const;

    /// Known versions, ascending
    std::vector<uint32_t> Versions() const;

    /**
     * Generate a key one above the highest version, make it current and persist.
     * @return The new version
     */
    Result<uint32_t> GenerateEncryptionKey();

    /**
     * Register a key under a version and persist.
     * Re-adding an identical key is a no-op; a different key for an
     * existing version is rejected.
     */
    Result<void> AddEncryptionKey(uint32_t version, const EncryptionKey& key);

    /// Make an existing version current and persist
    Result<void> SetCurrentVersion(uint32_t version);

    /**
     * Import keys from VFACE_ENCRYPTION_KEY_V<n> (n = 1..maxVersion) and
     * VFACE_ENCRYPTION_KEY, then apply VFACE_CURRENT_KEY_VERSION if set.
     * @return Number of keys added
     */
    Result<size_t> ImportFromEnvironment(uint32_t maxVersion = 32);

private:
    KeyStore() = default;

    static Result<std::unique_ptr<KeyStore>> Load(const std::filesystem::path& path);
    static std::unique_ptr<KeyStore> Generate();

    /// Document as written to disk
    std::string ToDocument() const;

    Result<void> PersistLocked() const;

    std::filesystem::path path_;
    KeyPair signingKey_;
    std::map<uint32_t, EncryptionKey> encryptionKeys_;
    uint32_t currentVersion_{0};
    int64_t createdAt_{0};
    mutable std::mutex mutex_;
};

/// Parse a 64-character hex AES-256 key
std::optional<EncryptionKey> ParseEncryptionKey(const std::string& hex);

} // namespace vface

#endif // VFACE_CRYPTO_KEYSTORE_H
