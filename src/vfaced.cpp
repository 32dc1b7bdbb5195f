// VFACE Daemon - Main Entry Point
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// vfaced serves the identity registry over JSON-RPC:
// - Loads vface.conf and command-line options
// - Opens the key store, database and hash chain
// - Serves registry, consent and chain methods
// - Purges expired replay nonces in the background

#include "vface/core/types.h"
#include "vface/node/context.h"
#include "vface/rpc/commands.h"
#include "vface/rpc/server.h"
#include "vface/util/config.h"
#include "vface/util/logging.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <unistd.h>

namespace vface {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.3.0";
constexpr const char* CLIENT_NAME = "V-Face Registry Daemon";

namespace defaults {
    constexpr const char* LOG_FILENAME = "debug.log";
    constexpr const char* PID_FILENAME = "vfaced.pid";
    constexpr uint16_t RPC_PORT = 8645;
    constexpr int RPC_THREADS = 4;
    /// Seconds between nonce purges
    constexpr int NONCE_PURGE_INTERVAL = 60;
}

// ============================================================================
// Global State
// ============================================================================

static std::mutex g_shutdownMutex;
static std::condition_variable g_shutdownCondition;

static std::unique_ptr<NodeContext> g_node;
static std::unique_ptr<rpc::RPCServer> g_rpcServer;
static std::unique_ptr<rpc::RPCCommandTable> g_rpcCommands;
static std::string g_pidFile;

// ============================================================================
// Signal Handling
// ============================================================================

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        // Only async-signal-safe work here; the main loop logs and wakes up
        RequestShutdown();
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: vfaced [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/vface.conf)\n";
    std::cout << "  -datadir=DIR               Data directory (default: ~/.vface)\n";
    std::cout << "  -keystore=FILE             Key store (default: <datadir>/keystore.json)\n";
    std::cout << "  -dbcache=N                 Database cache in MB (default: 8)\n";
    std::cout << "  -printconfig               Print a sample vface.conf and exit\n";
    std::cout << "\nRegistry Options:\n";
    std::cout << "  -dimension=N               Vector dimension (default: 128)\n";
    std::cout << "  -precision=N               Fingerprint decimal places (default: 4)\n";
    std::cout << "  -enforcefingerprint        Require fingerprint == derive(vector)\n";
    std::cout << "  -verifythreshold=X         Default search threshold (default: 0.85)\n";
    std::cout << "  -sybilthreshold=X          Duplicate identity threshold (default: 0.92)\n";
    std::cout << "  -maxtopk=N                 Maximum search results (default: 100)\n";
    std::cout << "  -revokewindow=N            Signed command clock skew in seconds (default: 300)\n";
    std::cout << "  -noncettl=N                Nonce retention in seconds (default: 300)\n";
    std::cout << "  -requireapprovalproof      Require owner-signed consent approvals\n";
    std::cout << "\nRPC Options:\n";
    std::cout << "  -server=0/1                Enable the RPC server (default: 1)\n";
    std::cout << "  -rpcbind=ADDR              Bind address (default: 127.0.0.1)\n";
    std::cout << "  -rpcport=PORT              Port (default: " << defaults::RPC_PORT << ")\n";
    std::cout << "  -rpcuser=USER              Username\n";
    std::cout << "  -rpcpassword=PASS          Password\n";
    std::cout << "  -rpcthreads=N              Worker threads (default: " << defaults::RPC_THREADS << ")\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  -debug=CATEGORY            Enable debug output for a category (or all)\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error\n";
    std::cout << "  -printtoconsole            Also log to the console\n";
    std::cout << "  -logfile=FILE              Log file (default: <datadir>/debug.log)\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 VFACE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Daemon Initialization
// ============================================================================

bool SetupLogging(const util::ConfigManager& config) {
    util::LoggingOptions options;
    options.level = util::LogLevelFromString(config.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    options.categories = config.GetList(util::ConfigKeys::DEBUG);
    if (!options.categories.empty() && options.level > util::LogLevel::Debug) {
        options.level = util::LogLevel::Debug;
    }
    options.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false);

    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    options.logFile = logFile.empty()
        ? config.GetDataDir() + "/" + defaults::LOG_FILENAME
        : logFile;

    return util::InitLogging(options);
}

bool WritePidFile(const std::string& pidFile) {
    std::ofstream file(pidFile);
    if (!file.is_open()) {
        return false;
    }
    file << getpid();
    return true;
}

bool StartRPCServer(const util::ConfigManager& config) {
    if (!config.GetBool(util::ConfigKeys::SERVER, true)) {
        LOG_INFO(util::LogCategory::RPC) << "RPC server disabled";
        return true;
    }

    int64_t port = config.GetInt(util::ConfigKeys::RPCPORT, defaults::RPC_PORT);
    int64_t threads = config.GetInt(util::ConfigKeys::RPCTHREADS, defaults::RPC_THREADS);
    if (port < 1 || port > 65535) {
        LOG_ERROR(util::LogCategory::RPC) << "Invalid -rpcport " << port;
        return false;
    }
    if (threads < 1 || threads > 64) {
        LOG_ERROR(util::LogCategory::RPC) << "Invalid -rpcthreads " << threads;
        return false;
    }

    rpc::RPCServerConfig rpcConfig;
    rpcConfig.bindAddress = config.GetString(util::ConfigKeys::RPCBIND, "127.0.0.1");
    rpcConfig.port = static_cast<uint16_t>(port);
    rpcConfig.rpcUser = config.GetString(util::ConfigKeys::RPCUSER, "");
    rpcConfig.rpcPassword = config.GetString(util::ConfigKeys::RPCPASSWORD, "");
    rpcConfig.threadPoolSize = static_cast<size_t>(threads);

    if (rpcConfig.rpcUser.empty()) {
        LOG_WARN(util::LogCategory::RPC) << "No -rpcuser set; only local callers may use "
                                         << "authenticated methods";
    }

    g_rpcServer = std::make_unique<rpc::RPCServer>(rpcConfig);
    g_rpcCommands = std::make_unique<rpc::RPCCommandTable>(*g_node);
    g_rpcCommands->RegisterCommands(*g_rpcServer);

    if (!g_rpcServer->Start()) {
        LOG_ERROR(util::LogCategory::RPC) << "Failed to start RPC server on "
                                          << rpcConfig.bindAddress << ":" << rpcConfig.port;
        return false;
    }
    return true;
}

void StopRPCServer() {
    if (g_rpcServer) {
        LOG_INFO(util::LogCategory::RPC) << "Stopping RPC server...";
        g_rpcServer->Stop();
        g_rpcServer.reset();
    }
    g_rpcCommands.reset();
}

// ============================================================================
// Main Loop
// ============================================================================

void PurgeNonces() {
    auto purged = g_node->registry->PurgeExpiredNonces(GetTime());
    if (!purged) {
        LOG_WARN(util::LogCategory::REGISTRY) << "Nonce purge failed: "
                                              << purged.GetError().ToString();
    } else if (purged.Value() > 0) {
        LOG_DEBUG(util::LogCategory::REGISTRY) << "Purged " << purged.Value() << " expired nonces";
    }
}

void WaitForShutdown() {
    auto nextPurge = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(g_shutdownMutex);
    while (!ShutdownRequested()) {
        if (std::chrono::steady_clock::now() >= nextPurge) {
            lock.unlock();
            PurgeNonces();
            lock.lock();
            nextPurge = std::chrono::steady_clock::now() +
                        std::chrono::seconds(defaults::NONCE_PURGE_INTERVAL);
        }
        g_shutdownCondition.wait_for(lock, std::chrono::seconds(1));
    }
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown requested";
}

void Shutdown() {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down...";

    // No new requests while the node is torn down
    StopRPCServer();

    if (g_node) {
        ShutdownNode(*g_node);
        g_node.reset();
    }

    if (!g_pidFile.empty()) {
        std::remove(g_pidFile.c_str());
    }

    util::Logger::Instance().Shutdown();
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    config.AllowStandardKeys();

    auto parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }
    if (config.GetBool("printconfig", false)) {
        std::cout << config.GenerateSampleConfig();
        return 0;
    }

    auto loaded = config.LoadAllConfigs();
    if (!loaded.success) {
        std::cerr << "Error reading configuration: " << loaded.ToString() << "\n";
        return 1;
    }
    for (const auto& warning : loaded.warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }
    for (const auto& error : config.Validate()) {
        std::cerr << "Warning: " << error << "\n";
    }

    std::error_code ec;
    std::filesystem::create_directories(config.GetDataDir(), ec);
    if (ec) {
        std::cerr << "Error: Cannot create data directory " << config.GetDataDir()
                  << ": " << ec.message() << "\n";
        return 1;
    }

    if (!SetupLogging(config)) {
        std::cerr << "Error: Cannot open log file\n";
        return 1;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting...";
    LOG_INFO(util::LogCategory::DEFAULT) << "Data directory: " << config.GetDataDir();

    auto options = NodeInitOptions::FromConfig(config);
    if (!options) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Invalid configuration: "
                                              << options.GetError().Message();
        std::cerr << "Error: " << options.GetError().Message() << "\n";
        util::Logger::Instance().Shutdown();
        return 1;
    }

    g_pidFile = config.GetDataDir() + "/" + defaults::PID_FILENAME;
    if (!WritePidFile(g_pidFile)) {
        LOG_WARN(util::LogCategory::DEFAULT) << "Could not write PID file: " << g_pidFile;
        g_pidFile.clear();
    }

    SetupSignalHandlers();

    // ========================================================================
    // Initialize Node (keys, database, chain, registry, consent)
    // ========================================================================

    g_node = std::make_unique<NodeContext>();
    auto initialized = InitializeNode(*g_node, options.Value());
    if (!initialized) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Failed to initialize node: "
                                              << initialized.GetError().ToString();
        std::cerr << "Error: " << initialized.GetError().Message() << "\n";
        Shutdown();
        return 1;
    }

    if (!StartRPCServer(config)) {
        Shutdown();
        return 1;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Daemon started";

    WaitForShutdown();
    Shutdown();
    return 0;
}

} // namespace vface

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return vface::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
