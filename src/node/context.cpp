// VFACE - Node Context Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/node/context.h"
#include "vface/util/config.h"
#include "vface/util/logging.h"

#include <cmath>

namespace vface {

// ============================================================================
// Directory Creation Helper
// ============================================================================

static bool CreateDirectoryIfNeeded(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return std::filesystem::is_directory(path, ec);
    }
    return std::filesystem::create_directories(path, ec);
}

static Error BadOption(const std::string& key, const std::string& requirement) {
    return Error(ErrorCode::InvalidArgument, "-" + key + " " + requirement)
        .WithDetail("option", key);
}

// ============================================================================
// NodeInitOptions
// ============================================================================

Result<NodeInitOptions> NodeInitOptions::FromConfig(const util::ConfigManager& config) {
    using namespace util;
    NodeInitOptions options;

    options.dataDir = config.GetDataDir();
    std::string keystore = config.GetPath(ConfigKeys::KEYSTORE);
    options.keystorePath = keystore.empty()
        ? options.dataDir / DEFAULT_KEYSTORE_FILENAME
        : std::filesystem::path(keystore);

    int64_t dbcache = config.GetInt(ConfigKeys::DBCACHE, options.dbCacheMB);
    if (dbcache < 1 || dbcache > 16384) {
        return BadOption(ConfigKeys::DBCACHE, "must be between 1 and 16384 MB");
    }
    options.dbCacheMB = static_cast<int>(dbcache);

    int64_t dimension = config.GetInt(ConfigKeys::DIMENSION,
                                      static_cast<int64_t>(registry::DEFAULT_DIMENSION));
    if (dimension < 1 || dimension > 4096) {
        return BadOption(ConfigKeys::DIMENSION, "must be between 1 and 4096");
    }
    int64_t precision = config.GetInt(ConfigKeys::PRECISION, registry::DEFAULT_PRECISION);
    if (precision < 0 || precision > registry::MAX_PRECISION) {
        return BadOption(ConfigKeys::PRECISION,
                         "must be between 0 and " + std::to_string(registry::MAX_PRECISION));
    }
    options.registry.dimension = static_cast<size_t>(dimension);
    options.registry.precision = static_cast<int>(precision);
    options.registry.enforceFingerprint = config.GetBool(ConfigKeys::ENFORCEFINGERPRINT, false);

    double sybil = config.GetDouble(ConfigKeys::SYBILTHRESHOLD, matcher::DEFAULT_SYBIL_THRESHOLD);
    double verify = config.GetDouble(ConfigKeys::VERIFYTHRESHOLD, matcher::DEFAULT_VERIFY_THRESHOLD);
    if (!std::isfinite(sybil) || sybil < -1.0 || sybil > 1.0) {
        return BadOption(ConfigKeys::SYBILTHRESHOLD, "must be in [-1, 1]");
    }
    if (!std::isfinite(verify) || verify < -1.0 || verify > 1.0) {
        return BadOption(ConfigKeys::VERIFYTHRESHOLD, "must be in [-1, 1]");
    }
    options.registry.sybilThreshold = sybil;
    options.verifyThreshold = verify;

    int64_t maxTopK = config.GetInt(ConfigKeys::MAXTOPK, static_cast<int64_t>(matcher::MAX_TOP_K));
    if (maxTopK < 1 || maxTopK > static_cast<int64_t>(matcher::MAX_TOP_K)) {
        return BadOption(ConfigKeys::MAXTOPK,
                         "must be between 1 and " + std::to_string(matcher::MAX_TOP_K));
    }
    options.maxTopK = static_cast<size_t>(maxTopK);

    int64_t window = config.GetInt(ConfigKeys::REVOKEWINDOW, options.registry.revokeWindow);
    int64_t ttl = config.GetInt(ConfigKeys::NONCETTL, options.registry.nonceTtl);
    if (window < 1 || window > 86400) {
        return BadOption(ConfigKeys::REVOKEWINDOW, "must be between 1 and 86400 seconds");
    }
    if (ttl < window) {
        // A purged nonce must already be outside the freshness window
        return BadOption(ConfigKeys::NONCETTL, "must not be shorter than -revokewindow");
    }
    options.registry.revokeWindow = window;
    options.registry.nonceTtl = ttl;

    options.chain.genesisSeed = config.GetString(ConfigKeys::GENESISSEED,
                                                 chain::DEFAULT_GENESIS_SEED);
    if (options.chain.genesisSeed.empty()) {
        return BadOption(ConfigKeys::GENESISSEED, "must not be empty");
    }

    options.consent.issuer = config.GetString(ConfigKeys::TOKENISSUER, consent::DEFAULT_ISSUER);
    options.consent.modelVersion = config.GetString(ConfigKeys::MODELVERSION,
                                                    consent::DEFAULT_MODEL_VERSION);
    options.consent.requireApprovalProof = config.GetBool(ConfigKeys::REQUIREAPPROVALPROOF, false);

    return options;
}

// ============================================================================
// InitializeNode - Main initialization function
// ============================================================================

Result<void> InitializeNode(NodeContext& node, const NodeInitOptions& options) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Initializing node...";

    node.dataDir = options.dataDir;
    node.verifyThreshold = options.verifyThreshold;
    node.maxTopK = options.maxTopK;

    // ========================================================================
    // Step 1: Data directory
    // ========================================================================

    if (!options.inMemory || !options.keystorePath.empty()) {
        if (!CreateDirectoryIfNeeded(node.dataDir)) {
            return Error(ErrorCode::StorageError,
                         "Failed to create data directory: " + node.dataDir.string());
        }
    }

    // ========================================================================
    // Step 2: Key store
    // ========================================================================

    if (options.keystorePath.empty()) {
        LOG_WARN(util::LogCategory::KEYSTORE) << "No key store path; using ephemeral keys";
        node.keys = KeyStore::CreateEphemeral();
    } else {
        KeyStore::Config keyConfig;
        keyConfig.path = options.keystorePath;
        keyConfig.createIfMissing = options.createKeystore;
        auto opened = KeyStore::Open(keyConfig);
        if (!opened) {
            return opened.GetError();
        }
        node.keys = std::move(opened.Value());
    }

    auto imported = node.keys->ImportFromEnvironment();
    if (!imported) {
        return imported.GetError();
    }
    if (imported.Value() > 0) {
        LOG_INFO(util::LogCategory::KEYSTORE) << "Imported " << imported.Value()
                                              << " encryption keys from the environment";
    }
    LOG_INFO(util::LogCategory::KEYSTORE) << "Signing key " << util::LogId(node.keys->PublicKeyHex(), 16)
                                          << ", encryption key v" << node.keys->CurrentVersion();

    // ========================================================================
    // Step 3: Database
    // ========================================================================

    if (options.inMemory) {
        LOG_INFO(util::LogCategory::DB) << "Using in-memory database";
        node.database = db::OpenMemoryDatabase();
    } else {
        db::Options dbOptions;
        dbOptions.create_if_missing = true;
        dbOptions.block_cache_size = static_cast<size_t>(options.dbCacheMB) * 1024 * 1024 / 2;
        dbOptions.write_buffer_size = static_cast<size_t>(options.dbCacheMB) * 1024 * 1024 / 4;
        dbOptions.max_open_files = 64;

        std::filesystem::path dbPath = node.dataDir / DEFAULT_DB_DIRNAME;
        LOG_INFO(util::LogCategory::DB) << "Opening database " << dbPath.string();
        auto [status, database] = db::OpenDatabase(dbPath, dbOptions);
        if (!status.ok()) {
            return db::ToError(status, "open database");
        }
        node.database = std::move(database);
    }

    // ========================================================================
    // Step 4: Components
    // ========================================================================

    try {
        node.deriver = std::make_unique<registry::FingerprintDeriver>(
            registry::FingerprintDeriver::Config{options.registry.dimension,
                                                 options.registry.precision});
    } catch (const std::invalid_argument& e) {
        return Error(ErrorCode::InvalidArgument, e.what());
    }

    node.cipher = std::make_unique<registry::VectorCipher>(*node.keys);

    matcher::LinearScanIndex::Config indexConfig;
    indexConfig.dimension = options.registry.dimension;
    node.index = std::make_unique<matcher::LinearScanIndex>(*node.cipher, indexConfig);

    node.chain = std::make_unique<chain::HashChain>(*node.database, *node.keys, options.chain);

    node.registry = std::make_unique<registry::RegistryStore>(
        *node.database, *node.cipher, *node.chain, *node.index, options.registry);

    node.consent = std::make_unique<consent::ConsentService>(
        *node.database, *node.keys, *node.registry, *node.registry, options.consent);

    // ========================================================================
    // Step 5: Load the vector index
    // ========================================================================

    auto loaded = node.registry->RebuildIndex();
    if (!loaded) {
        return loaded.GetError();
    }

    auto root = node.chain->GetRoot();
    if (!root) {
        return root.GetError();
    }
    LOG_INFO(util::LogCategory::CHAIN) << "Chain height " << root->index << ", root "
                                       << util::LogId(root->root, 16);

    node.startedAt = GetTime();
    node.initialized.store(true);
    LOG_INFO(util::LogCategory::DEFAULT) << "Node initialized";
    return Result<void>::Ok();
}

void ShutdownNode(NodeContext& node) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down node...";

    node.initialized.store(false);

    node.consent.reset();
    node.registry.reset();
    node.chain.reset();
    node.index.reset();
    node.cipher.reset();
    node.deriver.reset();

    if (node.database) {
        LOG_INFO(util::LogCategory::DB) << "Closing database";
        node.database.reset();
    }
    node.keys.reset();

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
}

// ============================================================================
// Shutdown Control
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};

void RequestShutdown() {
    g_shutdownRequested.store(true);
}

bool ShutdownRequested() {
    return g_shutdownRequested.load();
}

} // namespace vface
