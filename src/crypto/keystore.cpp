// VFACE - Key Store Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/crypto/keystore.h"
#include "vface/core/hex.h"
#include "vface/core/types.h"
#include "vface/util/json.h"
#include "vface/util/logging.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vface {

namespace fs = std::filesystem;
using util::JSONValue;

std::optional<EncryptionKey> ParseEncryptionKey(const std::string& hex) {
    if (hex.size() != AES_KEY_SIZE * 2) {
        return std::nullopt;
    }
    auto bytes = TryHexToBytes(hex);
    if (!bytes) {
        return std::nullopt;
    }
    EncryptionKey key{};
    std::copy(bytes->begin(), bytes->end(), key.begin());
    CryptoEngine::SecureZero(bytes->data(), bytes->size());
    return key;
}

KeyStore::~KeyStore() {
    for (auto& [version, key] : encryptionKeys_) {
        CryptoEngine::SecureZero(key.data(), key.size());
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<std::unique_ptr<KeyStore>> KeyStore::Open(const Config& config) {
    if (config.path.empty()) {
        return Error(ErrorCode::KeyStoreError, "Key store path not configured");
    }

    std::error_code ec;
    bool exists = fs::exists(config.path, ec);
    if (ec) {
        return Error(ErrorCode::KeyStoreError,
                     "Cannot access key store " + config.path.string() + ": " + ec.message());
    }

    if (exists) {
        auto loaded = Load(config.path);
        if (loaded) {
            LOG_INFO(util::LogCategory::KEYSTORE)
                << "Loaded key store " << config.path.string()
                << " (signing key " << util::LogId(loaded.Value()->PublicKeyHex(), 16)
                << ", encryption v" << loaded.Value()->CurrentVersion() << ")";
        }
        return loaded;
    }

    if (!config.createIfMissing) {
        return Error(ErrorCode::KeyStoreError,
                     "Key store " + config.path.string() + " does not exist");
    }

    std::unique_ptr<KeyStore> store = Generate();
    store->path_ = config.path;
    auto persisted = store->Persist();
    if (!persisted) {
        return persisted.GetError();
    }

    LOG_WARN(util::LogCategory::KEYSTORE)
        << "Generated new key store at " << config.path.string()
        << "; back it up, losing it makes stored vectors unreadable";
    return Result<std::unique_ptr<KeyStore>>(std::move(store));
}

std::unique_ptr<KeyStore> KeyStore::CreateEphemeral() {
    return Generate();
}

std::unique_ptr<KeyStore> KeyStore::Generate() {
    std::unique_ptr<KeyStore> store(new KeyStore());
    store->signingKey_ = KeyPair::Generate();
    store->encryptionKeys_[1] = CryptoEngine::GenerateKey();
    store->currentVersion_ = 1;
    store->createdAt_ = GetTimeMillis();
    return store;
}

Result<std::unique_ptr<KeyStore>> KeyStore::Load(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::KeyStoreError, "Cannot read key store " + path.string());
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    auto doc = JSONValue::TryParse(contents.str());
    if (!doc || !doc->IsObject()) {
        return Error(ErrorCode::KeyStoreError, "Key store " + path.string() + " is not valid JSON");
    }

    auto fail = [&path](const std::string& what) {
        return Error(ErrorCode::KeyStoreError, "Key store " + path.string() + ": " + what);
    };

    if ((*doc)["format"].GetInt(-1) != FORMAT_VERSION) {
        return fail("unsupported format");
    }

    std::unique_ptr<KeyStore> store(new KeyStore());
    store->path_ = path;
    store->createdAt_ = (*doc)["created_at"].GetInt(0);

    auto priv = PrivateKey::FromHex((*doc)["signing_key"].GetString());
    if (!priv) {
        return fail("invalid signing key");
    }
    store->signingKey_ = KeyPair(*priv);

    const JSONValue& keys = (*doc)["encryption_keys"];
    if (!keys.IsObject() || keys.Size() == 0) {
        return fail("no encryption keys");
    }
    for (const auto& [name, value] : keys.GetObject()) {
        char* end = nullptr;
        unsigned long version = std::strtoul(name.c_str(), &end, 10);
        if (name.empty() || *end != '\0' || version == 0 || version > UINT32_MAX) {
            return fail("invalid key version '" + name + "'");
        }
        auto key = ParseEncryptionKey(value.GetString());
        if (!key) {
            return fail("invalid encryption key for version " + name);
        }
        store->encryptionKeys_[static_cast<uint32_t>(version)] = *key;
    }

    int64_t current = (*doc)["current_encryption_version"].GetInt(0);
    if (current <= 0 || store->encryptionKeys_.count(static_cast<uint32_t>(current)) == 0) {
        return fail("current encryption version has no key");
    }
    store->currentVersion_ = static_cast<uint32_t>(current);

    return Result<std::unique_ptr<KeyStore>>(std::move(store));
}

std::string KeyStore::ToDocument() const {
    JSONValue::Object keys;
    for (const auto& [version, key] : encryptionKeys_) {
        keys[std::to_string(version)] = BytesToHex(key.data(), key.size());
    }

    JSONValue::Object doc;
    doc["format"] = FORMAT_VERSION;
    doc["created_at"] = createdAt_;
    doc["signing_key"] = signingKey_.GetPrivateKey().ToHex();
    doc["public_key"] = signingKey_.GetPublicKey().ToHex();
    doc["encryption_keys"] = std::move(keys);
    doc["current_encryption_version"] = currentVersion_;
    return JSONValue(std::move(doc)).ToJSON(true) + "\n";
}

Result<void> KeyStore::Persist() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return PersistLocked();
}

Result<void> KeyStore::PersistLocked() const {
    if (path_.empty()) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::KeyStoreError,
                         "Cannot create " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error(ErrorCode::KeyStoreError, "Cannot write " + tmp.string());
        }
        // Restrict before any secret reaches the file
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            return Error(ErrorCode::KeyStoreError,
                         "Cannot restrict permissions on " + tmp.string() + ": " + ec.message());
        }
        out << ToDocument();
        out.flush();
        if (!out) {
            return Error(ErrorCode::KeyStoreError, "Failed writing " + tmp.string());
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        return Error(ErrorCode::KeyStoreError,
                     "Cannot replace " + path_.string() + ": " + ec.message());
    }
    return Result<void>::Ok();
}

// ============================================================================
// Encryption Keys
// ============================================================================

uint32_t KeyStore::CurrentVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentVersion_;
}

std::optional<EncryptionKey> KeyStore::GetEncryptionKey(uint32_t version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = encryptionKeys_.find(version);
    if (it == encryptionKeys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<uint32_t> KeyStore::Versions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> versions;
    for (const auto& entry : encryptionKeys_) {
        versions.push_back(entry.first);
    }
    return versions;
}

Result<uint32_t> KeyStore::GenerateEncryptionKey() {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t version = encryptionKeys_.empty() ? 1 : encryptionKeys_.rbegin()->first + 1;
    uint32_t previous = currentVersion_;

    encryptionKeys_[version] = CryptoEngine::GenerateKey();
    currentVersion_ = version;

    auto persisted = PersistLocked();
    if (!persisted) {
        encryptionKeys_.erase(version);
        currentVersion_ = previous;
        return persisted.GetError();
    }

    LOG_INFO(util::LogCategory::KEYSTORE) << "Generated encryption key v" << version
                                          << " (now current)";
    return version;
}

Result<void> KeyStore::AddEncryptionKey(uint32_t version, const EncryptionKey& key) {
    if (version == 0) {
        return Error(ErrorCode::InvalidArgument, "Key version must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = encryptionKeys_.find(version);
    if (it != encryptionKeys_.end()) {
        if (it->second == key) {
            return Result<void>::Ok();
        }
        return Error(ErrorCode::KeyStoreError,
                     "A different key is already registered for version " + std::to_string(version));
    }

    encryptionKeys_[version] = key;
    auto persisted = PersistLocked();
    if (!persisted) {
        encryptionKeys_.erase(version);
        return persisted;
    }
    LOG_INFO(util::LogCategory::KEYSTORE) << "Added encryption key v" << version;
    return Result<void>::Ok();
}

Result<void> KeyStore::SetCurrentVersion(uint32_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (encryptionKeys_.count(version) == 0) {
        return Error(ErrorCode::NotFound, "No encryption key for version " + std::to_string(version));
    }
    if (currentVersion_ == version) {
        return Result<void>::Ok();
    }

    uint32_t previous = currentVersion_;
    currentVersion_ = version;
    auto persisted = PersistLocked();
    if (!persisted) {
        currentVersion_ = previous;
        return persisted;
    }
    LOG_INFO(util::LogCategory::KEYSTORE) << "Current encryption version set to v" << version;
    return Result<void>::Ok();
}

Result<size_t> KeyStore::ImportFromEnvironment(uint32_t maxVersion) {
    size_t added = 0;

    auto importKey = [&](uint32_t version, const char* var) -> Result<void> {
        const char* value = std::getenv(var);
        if (!value || !*value) {
            return Result<void>::Ok();
        }
        auto key = ParseEncryptionKey(value);
        if (!key) {
            return Error(ErrorCode::KeyStoreError,
                         std::string(var) + " must be 64 hex characters");
        }
        bool known = GetEncryptionKey(version).has_value();
        auto addResult = AddEncryptionKey(version, *key);
        if (!addResult) {
            return addResult;
        }
        if (!known) {
            ++added;
        }
        return Result<void>::Ok();
    };

    for (uint32_t v = 1; v <= maxVersion; ++v) {
        std::string var = ENV_ENCRYPTION_KEY_PREFIX + std::to_string(v);
        auto imported = importKey(v, var.c_str());
        if (!imported) {
            return imported.GetError();
        }
    }

    // The unversioned variable only fills version 1 when nothing else did
    if (!std::getenv((std::string(ENV_ENCRYPTION_KEY_PREFIX) + "1").c_str())) {
        auto imported = importKey(1, ENV_ENCRYPTION_KEY_LEGACY);
        if (!imported) {
            return imported.GetError();
        }
    }

    if (const char* current = std::getenv(ENV_CURRENT_KEY_VERSION)) {
        char* end = nullptr;
        unsigned long version = std::strtoul(current, &end, 10);
        if (*current == '\0' || *end != '\0' || version == 0 || version > UINT32_MAX) {
            return Error(ErrorCode::KeyStoreError,
                         std::string(ENV_CURRENT_KEY_VERSION) + " must be a positive integer");
        }
        auto set = SetCurrentVersion(static_cast<uint32_t>(version));
        if (!set) {
            return set.GetError();
        }
    }

    return added;
}

} // namespace vface
