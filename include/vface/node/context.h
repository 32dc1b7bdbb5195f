// VFACE - Node Context
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// This file defines the NodeContext structure that owns every registry
// component of a running vfaced (or an offline vface-admin session).

#ifndef VFACE_NODE_CONTEXT_H
#define VFACE_NODE_CONTEXT_H

#include "vface/chain/hashchain.h"
#include "vface/consent/consent_service.h"
#include "vface/core/error.h"
#include "vface/crypto/keystore.h"
#include "vface/db/database.h"
#include "vface/matcher/similarity.h"
#include "vface/matcher/vector_index.h"
#include "vface/registry/fingerprint.h"
#include "vface/registry/registry_store.h"
#include "vface/registry/vector_cipher.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace vface {

namespace util {
class ConfigManager;
}

// ============================================================================
// Node Initialization Options
// ============================================================================

/// Key file name inside the data directory
static constexpr const char* DEFAULT_KEYSTORE_FILENAME = "keystore.json";

/// Database directory name inside the data directory
static constexpr const char* DEFAULT_DB_DIRNAME = "registry";

/**
 * Options for node initialization.
 * Populated from the config file and command line.
 */
struct NodeInitOptions {
    /// Data directory path
    std::filesystem::path dataDir;

    /// Key store file (default <dataDir>/keystore.json)
    std::filesystem::path keystorePath;

    /// Generate a key store when none exists
    bool createKeystore{true};

    /// Use a MemoryDatabase instead of LevelDB
    bool inMemory{false};

    /// Database cache size in MB
    int dbCacheMB{8};

    /// Default threshold for search requests
    double verifyThreshold{matcher::DEFAULT_VERIFY_THRESHOLD};

    /// Largest topK a search request may ask for
    size_t maxTopK{matcher::MAX_TOP_K};

    registry::RegistryStore::Config registry;
    chain::HashChain::Config chain;
    consent::ConsentService::Config consent;

    /**
     * Map a parsed configuration onto options.
     * @return InvalidArgument for out-of-range values
     */
    static Result<NodeInitOptions> FromConfig(const util::ConfigManager& config);
};

// ============================================================================
// Node Context - Holds all node state
// ============================================================================

/**
 * Owns the storage, keys and every registry component. Members are
 * declared in dependency order so destruction runs in reverse.
 */
struct NodeContext {
    std::unique_ptr<db::Database> database;
    std::unique_ptr<KeyStore> keys;
    std::unique_ptr<registry::VectorCipher> cipher;
    std::unique_ptr<registry::FingerprintDeriver> deriver;
    std::unique_ptr<matcher::LinearScanIndex> index;
    std::unique_ptr<chain::HashChain> chain;
    std::unique_ptr<registry::RegistryStore> registry;
    std::unique_ptr<consent::ConsentService> consent;

    /// Whether the node is fully initialized
    std::atomic<bool> initialized{false};

    std::filesystem::path dataDir;
    double verifyThreshold{matcher::DEFAULT_VERIFY_THRESHOLD};
    size_t maxTopK{matcher::MAX_TOP_K};
    Timestamp startedAt{0};

    NodeContext() = default;
    ~NodeContext() = default;

    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;

    bool IsReady() const {
        return initialized.load() && registry != nullptr;
    }
};

// ============================================================================
// Node Initialization Functions
// ============================================================================

/**
 * Initialize the node.
 *
 * 1. Creates the data directory
 * 2. Opens (or creates) the key store and imports keys from the environment
 * 3. Opens the database
 * 4. Builds the cipher, chain, vector index, registry and consent service
 * 5. Loads the vector index from storage
 */
Result<void> InitializeNode(NodeContext& node, const NodeInitOptions& options);

/// Release every component in reverse order
void ShutdownNode(NodeContext& node);

// ============================================================================
// Shutdown Control
// ============================================================================

/// Thread- and signal-safe shutdown request
void RequestShutdown();

bool ShutdownRequested();

} // namespace vface

#endif // VFACE_NODE_CONTEXT_H
