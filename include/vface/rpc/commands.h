// VFACE - RPC Commands
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// The registry's JSON-RPC method table.
//
// Categories:
// - Registry: register, check, revoke, search, fingerprint, listbyowner
// - Consent: requestconsent, approveconsent, verifytoken, listconsents
// - Chain: chainroot, chainentry, chainverify, chainsnapshot, chainfind
// - Utility: help, uptime, stop
//
// Every method accepts named (object) or positional (array) params.

#ifndef VFACE_RPC_COMMANDS_H
#define VFACE_RPC_COMMANDS_H

#include "vface/chain/hashchain.h"
#include "vface/consent/consent_service.h"
#include "vface/core/error.h"
#include "vface/core/types.h"
#include "vface/registry/registry_store.h"
#include "vface/rpc/server.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace vface {

struct NodeContext;

namespace rpc {

// ============================================================================
// Command Categories
// ============================================================================

namespace Category {
    constexpr const char* REGISTRY = "Registry";
    constexpr const char* CONSENT = "Consent";
    constexpr const char* CHAIN = "Chain";
    constexpr const char* UTILITY = "Utility";
}

// ============================================================================
// RPC Command Table
// ============================================================================

/**
 * Binds the registry methods to a node and registers them with a server.
 */
class RPCCommandTable {
public:
    /// The node must outlive the table and every server it registers with
    explicit RPCCommandTable(NodeContext& node);

    /// Register all commands with the server
    void RegisterCommands(RPCServer& server);

    const std::vector<RPCMethod>& GetAllCommands() const { return commands_; }

    NodeContext& GetNode() const { return node_; }

    /// Seconds since the table was created
    int64_t GetUptime() const;

private:
    void RegisterRegistryCommands();
    void RegisterConsentCommands();
    void RegisterChainCommands();
    void RegisterUtilityCommands();

    NodeContext& node_;
    std::vector<RPCMethod> commands_;
    std::chrono::steady_clock::time_point startTime_;
};

// ============================================================================
// Error Mapping
// ============================================================================

/// JSON-RPC code for an error kind
int RPCCodeForKind(ErrorKind kind);

/// {kind, code, retryable, details}
JSONValue ErrorData(const Error& error);

/// Error response carrying the mapped code and ErrorData
RPCResponse ErrorResponse(const Error& error, const JSONValue& id);

// ============================================================================
// Parameter Helpers
// ============================================================================
//
// Each throws RPCParamError when a required argument is missing or an
// argument has the wrong type.

std::string GetRequiredString(const RPCRequest& req, size_t index, const std::string& name);
std::optional<std::string> GetOptionalString(const RPCRequest& req, size_t index,
                                             const std::string& name);
int64_t GetRequiredInt(const RPCRequest& req, size_t index, const std::string& name);
std::optional<int64_t> GetOptionalInt(const RPCRequest& req, size_t index,
                                      const std::string& name);
std::optional<double> GetOptionalNumber(const RPCRequest& req, size_t index,
                                        const std::string& name);
bool GetOptionalBool(const RPCRequest& req, size_t index, const std::string& name,
                     bool defaultValue);

/// Array of finite numbers
FeatureVector ParseVector(const JSONValue& value, const std::string& name);

/// Object of string values
registry::Metadata ParseMetadata(const JSONValue& value);

/**
 * Signed owner message: a string is used verbatim, an object is
 * serialized to compact JSON (sorted keys) before verification.
 */
std::string ParseCommandMessage(const JSONValue& value, const std::string& name);

// ============================================================================
// Result Converters
// ============================================================================

JSONValue RegisterResultToJSON(const registry::RegisterResult& result);
JSONValue CheckResultToJSON(const std::optional<registry::CheckResult>& result);
JSONValue MatchesToJSON(const std::vector<matcher::Match>& matches);
JSONValue ChainEntryToJSON(const chain::ChainEntry& entry);
JSONValue ChainRootToJSON(const chain::ChainRoot& root);
JSONValue VerifyResultToJSON(const chain::VerifyResult& result);
JSONValue SnapshotToJSON(const chain::ChainSnapshot& snapshot);
JSONValue ConsentToJSON(const consent::ActiveConsent& consent);
JSONValue TokenVerificationToJSON(const consent::TokenVerification& verification);

// ============================================================================
// Registry Commands
// ============================================================================

/// Enroll an identity
RPCResponse cmd_register(const RPCRequest& req, const RPCContext& ctx,
                         RPCCommandTable* table);

/// Look up an identity
RPCResponse cmd_check(const RPCRequest& req, const RPCContext& ctx,
                      RPCCommandTable* table);

/// Revoke with an owner-signed command
RPCResponse cmd_revoke(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table);

/// Similarity search
RPCResponse cmd_search(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table);

/// Derive the fingerprint of a vector
RPCResponse cmd_fingerprint(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table);

/// Fingerprints registered to an owner key
RPCResponse cmd_listbyowner(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table);

// ============================================================================
// Consent Commands
// ============================================================================

RPCResponse cmd_requestconsent(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table);

RPCResponse cmd_approveconsent(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table);

RPCResponse cmd_verifytoken(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table);

RPCResponse cmd_listconsents(const RPCRequest& req, const RPCContext& ctx,
                             RPCCommandTable* table);

// ============================================================================
// Chain Commands
// ============================================================================

RPCResponse cmd_chainroot(const RPCRequest& req, const RPCContext& ctx,
                          RPCCommandTable* table);

RPCResponse cmd_chainentry(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table);

RPCResponse cmd_chainverify(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table);

RPCResponse cmd_chainsnapshot(const RPCRequest& req, const RPCContext& ctx,
                              RPCCommandTable* table);

/// Chain entry anchoring a fingerprint
RPCResponse cmd_chainfind(const RPCRequest& req, const RPCContext& ctx,
                          RPCCommandTable* table);

// ============================================================================
// Utility Commands
// ============================================================================

RPCResponse cmd_help(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table);

RPCResponse cmd_uptime(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table);

RPCResponse cmd_stop(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table);

} // namespace rpc
} // namespace vface

#endif // VFACE_RPC_COMMANDS_H
