// VFACE Admin Tool
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Offline operator tool for a vfaced data directory.
// Supports:
// - Creating and inspecting the key store
// - Adding encryption key versions and re-sealing stored vectors
// - Verifying and exporting the hash chain
// - Purging expired replay nonces
// - Deriving fingerprints
//
// vfaced must be stopped first; the database allows a single process.

#include "vface/core/types.h"
#include "vface/crypto/keystore.h"
#include "vface/node/context.h"
#include "vface/registry/fingerprint.h"
#include "vface/registry/key_rotation.h"
#include "vface/rpc/commands.h"
#include "vface/util/config.h"
#include "vface/util/logging.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace vface;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Utilities
// ============================================================================

void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

int Fail(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
    return 1;
}

int Fail(const Error& error) {
    return Fail(error.ToString());
}

/// Parse an unsigned decimal argument
std::optional<uint64_t> ParseUnsigned(const std::string& str) {
    if (str.empty() || str[0] == '-') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(str.c_str(), &end, 10);
    if (errno != 0 || end == str.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

/// Parse "0.1,0.2,..." into a vector of finite numbers
std::optional<FeatureVector> ParseVectorList(const std::string& csv) {
    FeatureVector vector;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start == std::string::npos) {
            return std::nullopt;
        }
        item = item.substr(start, end - start + 1);

        errno = 0;
        char* tail = nullptr;
        double value = std::strtod(item.c_str(), &tail);
        if (errno != 0 || tail == item.c_str() || *tail != '\0' || !std::isfinite(value)) {
            return std::nullopt;
        }
        vector.push_back(value);
    }
    if (vector.empty()) {
        return std::nullopt;
    }
    return vector;
}

// ============================================================================
// Options
// ============================================================================

struct AdminOptions {
    NodeInitOptions node;
    std::string command;
    std::vector<std::string> args;
    bool dryRun{false};
};

/// Open every component, never generating a key store
Result<void> OpenNode(NodeContext& node, const AdminOptions& opts) {
    NodeInitOptions options = opts.node;
    options.createKeystore = false;
    return InitializeNode(node, options);
}

KeyStore::Config KeyStoreConfig(const AdminOptions& opts, bool create) {
    KeyStore::Config config;
    config.path = opts.node.keystorePath;
    config.createIfMissing = create;
    return config;
}

// ============================================================================
// Command: Key Store
// ============================================================================

int CommandInitKeystore(const AdminOptions& opts) {
    if (opts.node.keystorePath.empty()) {
        return Fail("init-keystore needs a key store path (not available with --memory)");
    }
    std::error_code ec;
    if (fs::exists(opts.node.keystorePath, ec)) {
        return Fail("Key store already exists: " + opts.node.keystorePath.string());
    }
    if (opts.node.keystorePath.has_parent_path()) {
        fs::create_directories(opts.node.keystorePath.parent_path(), ec);
        if (ec) {
            return Fail("Cannot create " + opts.node.keystorePath.parent_path().string() +
                        ": " + ec.message());
        }
    }

    auto opened = KeyStore::Open(KeyStoreConfig(opts, true));
    if (!opened) {
        return Fail(opened.GetError());
    }
    const auto& keys = *opened.Value();

    std::cout << "Created key store " << keys.GetPath().string() << "\n";
    std::cout << "Signing public key: " << keys.PublicKeyHex() << "\n";
    std::cout << "Encryption key:     v" << keys.CurrentVersion() << "\n";
    return 0;
}

int CommandShowKeys(const AdminOptions& opts) {
    if (opts.node.keystorePath.empty()) {
        return Fail("show-keys needs a key store path (not available with --memory)");
    }
    auto opened = KeyStore::Open(KeyStoreConfig(opts, false));
    if (!opened) {
        return Fail(opened.GetError());
    }
    const auto& keys = *opened.Value();

    PrintLine('=');
    std::cout << "Key store: " << keys.GetPath().string() << "\n";
    PrintLine('=');
    std::cout << "Signing public key:  " << keys.PublicKeyHex() << "\n";
    std::cout << "Current key version: v" << keys.CurrentVersion() << "\n";
    std::cout << "Known versions:     ";
    for (uint32_t version : keys.Versions()) {
        std::cout << " v" << version;
    }
    std::cout << "\n";
    return 0;
}

int CommandNewEncryptionKey(const AdminOptions& opts) {
    if (opts.node.keystorePath.empty()) {
        return Fail("new-encryption-key needs a key store path (not available with --memory)");
    }
    auto opened = KeyStore::Open(KeyStoreConfig(opts, false));
    if (!opened) {
        return Fail(opened.GetError());
    }
    auto version = opened.Value()->GenerateEncryptionKey();
    if (!version) {
        return Fail(version.GetError());
    }
    std::cout << "Encryption key v" << version.Value() << " is now current\n";
    std::cout << "Run 'vface-admin rotate-keys' to re-seal stored vectors\n";
    return 0;
}

// ============================================================================
// Command: Rotate Keys
// ============================================================================

int CommandRotateKeys(const AdminOptions& opts) {
    NodeContext node;
    auto opened = OpenNode(node, opts);
    if (!opened) {
        return Fail(opened.GetError());
    }

    registry::KeyRotator rotator(*node.database, *node.cipher);
    auto report = rotator.Run(opts.dryRun);
    ShutdownNode(node);
    if (!report) {
        return Fail(report.GetError());
    }

    const auto& r = report.Value();
    PrintLine('=');
    std::cout << (r.dryRun ? "Key rotation (dry run)" : "Key rotation") << "\n";
    PrintLine('=');
    std::cout << "Target version: v" << r.targetVersion << "\n";
    std::cout << "Candidates:     " << r.candidates << "\n";
    std::cout << "Rotated:        " << r.rotated << "\n";
    std::cout << "Skipped:        " << r.skipped << "\n";
    std::cout << "Errors:         " << r.errors.size() << "\n";
    for (const auto& failure : r.errors) {
        std::cout << "  " << failure.fingerprint << ": " << failure.message << "\n";
    }
    if (!r.errors.empty()) {
        std::cout << "Nothing was written\n";
        return 1;
    }
    if (!r.dryRun) {
        std::cout << (r.committed ? "Committed\n" : "Nothing to commit\n");
    }
    return 0;
}

// ============================================================================
// Command: Chain
// ============================================================================

int CommandVerifyChain(const AdminOptions& opts) {
    std::optional<uint64_t> from;
    std::optional<uint64_t> to;
    if (opts.args.size() > 0) {
        from = ParseUnsigned(opts.args[0]);
        if (!from || *from < 1) {
            return Fail("Invalid start index: " + opts.args[0]);
        }
    }
    if (opts.args.size() > 1) {
        to = ParseUnsigned(opts.args[1]);
        if (!to || *to < 1) {
            return Fail("Invalid end index: " + opts.args[1]);
        }
    }

    NodeContext node;
    auto opened = OpenNode(node, opts);
    if (!opened) {
        return Fail(opened.GetError());
    }
    auto result = node.chain->VerifyChain(from, to);
    ShutdownNode(node);
    if (!result) {
        return Fail(result.GetError());
    }

    const auto& verify = result.Value();
    std::cout << "Checked " << verify.checked << " entries\n";
    if (verify.valid) {
        std::cout << "Chain is valid\n";
        return 0;
    }
    std::cout << "Chain is BROKEN";
    if (verify.brokenAt) {
        std::cout << " at entry " << *verify.brokenAt;
    }
    if (verify.error) {
        std::cout << ": " << *verify.error;
    }
    std::cout << "\n";
    return 2;
}

int CommandExportSnapshot(const AdminOptions& opts) {
    NodeContext node;
    auto opened = OpenNode(node, opts);
    if (!opened) {
        return Fail(opened.GetError());
    }
    auto snapshot = node.chain->ExportSnapshot();
    ShutdownNode(node);
    if (!snapshot) {
        return Fail(snapshot.GetError());
    }

    std::string document = rpc::SnapshotToJSON(snapshot.Value()).ToJSON(true);
    if (opts.args.empty()) {
        std::cout << document << "\n";
        return 0;
    }

    std::ofstream file(opts.args[0], std::ios::trunc);
    if (!file.is_open()) {
        return Fail("Cannot open " + opts.args[0]);
    }
    file << document << "\n";
    if (!file.good()) {
        return Fail("Write failed: " + opts.args[0]);
    }
    std::cout << "Wrote " << snapshot.Value().totalEntries << " entries to "
              << opts.args[0] << "\n";
    return 0;
}

// ============================================================================
// Command: Nonces
// ============================================================================

int CommandPurgeNonces(const AdminOptions& opts) {
    NodeContext node;
    auto opened = OpenNode(node, opts);
    if (!opened) {
        return Fail(opened.GetError());
    }
    auto purged = node.registry->PurgeExpiredNonces(GetTime());
    ShutdownNode(node);
    if (!purged) {
        return Fail(purged.GetError());
    }
    std::cout << "Purged " << purged.Value() << " expired nonces\n";
    return 0;
}

// ============================================================================
// Command: Fingerprint
// ============================================================================

int CommandFingerprint(const AdminOptions& opts) {
    if (opts.args.empty()) {
        return Fail("fingerprint needs a comma-separated vector");
    }
    auto vector = ParseVectorList(opts.args[0]);
    if (!vector) {
        return Fail("Invalid vector: expected comma-separated finite numbers");
    }

    std::unique_ptr<registry::FingerprintDeriver> deriver;
    try {
        deriver = std::make_unique<registry::FingerprintDeriver>(
            registry::FingerprintDeriver::Config{opts.node.registry.dimension,
                                                 opts.node.registry.precision});
    } catch (const std::invalid_argument& e) {
        return Fail(e.what());
    }

    auto fingerprint = deriver->Derive(*vector);
    if (!fingerprint) {
        return Fail(fingerprint.GetError());
    }
    std::cout << fingerprint.Value() << "\n";
    return 0;
}

// ============================================================================
// Usage
// ============================================================================

void PrintUsage() {
    std::cout << "VFACE Admin Tool v" << VERSION << "\n\n";
    std::cout << "Usage: vface-admin [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  init-keystore              Generate a new key store\n";
    std::cout << "  show-keys                  Show the signing key and encryption key versions\n";
    std::cout << "  new-encryption-key         Add an encryption key version and make it current\n";
    std::cout << "  rotate-keys [--dry-run]    Re-seal stored vectors under the current key\n";
    std::cout << "  verify-chain [from] [to]   Verify hash chain links and signatures\n";
    std::cout << "  export-snapshot [file]     Export the hash chain as JSON\n";
    std::cout << "  purge-nonces               Delete expired replay nonces\n";
    std::cout << "  fingerprint <v1,v2,...>    Derive the fingerprint of a vector\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -datadir=DIR               Data directory (default: ~/.vface)\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/vface.conf)\n";
    std::cout << "  -keystore=FILE             Key store (default: <datadir>/keystore.json)\n";
    std::cout << "  --memory                   Use an empty in-memory database and ephemeral keys\n";
    std::cout << "  -printtoconsole            Show log output on stderr\n";
    std::cout << "  -help                      Show this help\n";
    std::cout << "  -version                   Show version\n";
    std::cout << "\nVectors starting with '-' must follow '--', e.g. fingerprint -- -0.5,0.5\n";
}

void PrintVersion() {
    std::cout << "VFACE Admin Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 VFACE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Main
// ============================================================================

int AdminMain(int argc, char* argv[]) {
    util::ConfigManager config;
    config.AllowStandardKeys();
    config.AllowKey("memory");
    config.AllowKey("dry-run");

    auto parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        return Fail(parsed.ToString());
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    const auto& positional = config.GetPositionalArgs();
    if (config.GetBool("help", false) || config.GetBool("h", false) || positional.empty()) {
        PrintUsage();
        return positional.empty() && !config.GetBool("help", false) ? 1 : 0;
    }

    auto loaded = config.LoadAllConfigs();
    if (!loaded.success) {
        return Fail("Reading configuration: " + loaded.ToString());
    }

    util::LoggingOptions logging;
    logging.level = util::LogLevelFromString(config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    logging.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false);
    if (!util::InitLogging(logging)) {
        return Fail("Cannot initialize logging");
    }

    auto nodeOptions = NodeInitOptions::FromConfig(config);
    if (!nodeOptions) {
        return Fail(nodeOptions.GetError());
    }

    AdminOptions opts;
    opts.node = nodeOptions.Value();
    opts.command = positional[0];
    opts.args.assign(positional.begin() + 1, positional.end());
    opts.dryRun = config.GetBool("dry-run", false);
    if (config.GetBool("memory", false)) {
        opts.node.inMemory = true;
        opts.node.keystorePath.clear();
    }

    int rc;
    if (opts.command == "init-keystore") {
        rc = CommandInitKeystore(opts);
    } else if (opts.command == "show-keys") {
        rc = CommandShowKeys(opts);
    } else if (opts.command == "new-encryption-key") {
        rc = CommandNewEncryptionKey(opts);
    } else if (opts.command == "rotate-keys") {
        rc = CommandRotateKeys(opts);
    } else if (opts.command == "verify-chain") {
        rc = CommandVerifyChain(opts);
    } else if (opts.command == "export-snapshot") {
        rc = CommandExportSnapshot(opts);
    } else if (opts.command == "purge-nonces") {
        rc = CommandPurgeNonces(opts);
    } else if (opts.command == "fingerprint") {
        rc = CommandFingerprint(opts);
    } else if (opts.command == "help") {
        PrintUsage();
        rc = 0;
    } else {
        std::cerr << "Unknown command: " << opts.command << "\n";
        std::cerr << "Run 'vface-admin help' for usage.\n";
        rc = 1;
    }

    util::Logger::Instance().Shutdown();
    return rc;
}

int main(int argc, char* argv[]) {
    try {
        return AdminMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
