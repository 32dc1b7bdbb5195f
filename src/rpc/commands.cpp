// VFACE - RPC Commands Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/rpc/commands.h"
#include "vface/node/context.h"
#include "vface/util/logging.h"

#include <cmath>
#include <map>

namespace vface {
namespace rpc {

// ============================================================================
// Error Mapping
// ============================================================================

int RPCCodeForKind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:     return RPCErrorCode::INVALID_PARAMS;
        case ErrorKind::Conflict:       return RPCErrorCode::CONFLICT;
        case ErrorKind::NotFound:       return RPCErrorCode::NOT_FOUND;
        case ErrorKind::Authorization:  return RPCErrorCode::AUTHORIZATION;
        case ErrorKind::Replay:         return RPCErrorCode::REPLAY;
        case ErrorKind::Integrity:      return RPCErrorCode::INTEGRITY;
        case ErrorKind::Infrastructure: return RPCErrorCode::INFRASTRUCTURE;
    }
    return RPCErrorCode::INTERNAL_ERROR;
}

JSONValue ErrorData(const Error& error) {
    JSONValue::Object details;
    for (const auto& [key, value] : error.GetDetails()) {
        details[key] = value;
    }

    JSONValue::Object data;
    data["kind"] = ErrorKindToString(error.Kind());
    data["code"] = ErrorCodeToString(error.Code());
    data["retryable"] = error.IsRetryable();
    data["details"] = JSONValue(std::move(details));
    return JSONValue(std::move(data));
}

RPCResponse ErrorResponse(const Error& error, const JSONValue& id) {
    if (error.Kind() == ErrorKind::Infrastructure || error.Kind() == ErrorKind::Integrity) {
        LOG_WARN(util::LogCategory::RPC) << error.ToString();
    } else {
        LOG_DEBUG(util::LogCategory::RPC) << error.ToString();
    }
    return RPCResponse::Error(RPCCodeForKind(error.Kind()), error.Message(), id, ErrorData(error));
}

// ============================================================================
// Parameter Helpers
// ============================================================================

std::string GetRequiredString(const RPCRequest& req, size_t index, const std::string& name) {
    const JSONValue& param = req.GetArg(index, name);
    if (param.IsNull()) {
        throw RPCParamError("Missing required parameter: " + name);
    }
    if (!param.IsString()) {
        throw RPCParamError("Parameter must be string: " + name);
    }
    return param.GetString();
}

std::optional<std::string> GetOptionalString(const RPCRequest& req, size_t index,
                                             const std::string& name) {
    const JSONValue& param = req.GetArg(index, name);
    if (param.IsNull()) return std::nullopt;
    if (!param.IsString()) {
        throw RPCParamError("Parameter must be string: " + name);
    }
    return param.GetString();
}

int64_t GetRequiredInt(const RPCRequest& req, size_t index, const std::string& name) {
    auto value = GetOptionalInt(req, index, name);
    if (!value) {
        throw RPCParamError("Missing required parameter: " + name);
    }
    return *value;
}

std::optional<int64_t> GetOptionalInt(const RPCRequest& req, size_t index,
                                      const std::string& name) {
    const JSONValue& param = req.GetArg(index, name);
    if (param.IsNull()) return std::nullopt;
    if (param.IsInt()) return param.GetInt();
    // 5.0 is accepted, 5.5 is not
    if (param.IsDouble()) {
        double d = param.GetDouble();
        if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9e15) {
            return static_cast<int64_t>(d);
        }
    }
    throw RPCParamError("Parameter must be integer: " + name);
}

std::optional<double> GetOptionalNumber(const RPCRequest& req, size_t index,
                                        const std::string& name) {
    const JSONValue& param = req.GetArg(index, name);
    if (param.IsNull()) return std::nullopt;
    if (!param.IsNumber()) {
        throw RPCParamError("Parameter must be number: " + name);
    }
    return param.GetDouble();
}

bool GetOptionalBool(const RPCRequest& req, size_t index, const std::string& name,
                     bool defaultValue) {
    const JSONValue& param = req.GetArg(index, name);
    if (param.IsNull()) return defaultValue;
    if (!param.IsBool()) {
        throw RPCParamError("Parameter must be boolean: " + name);
    }
    return param.GetBool();
}

FeatureVector ParseVector(const JSONValue& value, const std::string& name) {
    if (!value.IsArray()) {
        throw RPCParamError("Parameter must be an array of numbers: " + name);
    }
    FeatureVector vector;
    vector.reserve(value.Size());
    for (const auto& item : value.GetArray()) {
        if (!item.IsNumber()) {
            throw RPCParamError("Parameter must be an array of numbers: " + name);
        }
        vector.push_back(item.GetDouble());
    }
    return vector;
}

registry::Metadata ParseMetadata(const JSONValue& value) {
    registry::Metadata metadata;
    if (value.IsNull()) {
        return metadata;
    }
    if (!value.IsObject()) {
        throw RPCParamError("Parameter must be an object: metadata");
    }
    for (const auto& [key, item] : value.GetObject()) {
        if (!item.IsString()) {
            throw RPCParamError("Metadata values must be strings: " + key);
        }
        metadata[key] = item.GetString();
    }
    return metadata;
}

std::string ParseCommandMessage(const JSONValue& value, const std::string& name) {
    if (value.IsString()) {
        return value.GetString();
    }
    if (value.IsObject()) {
        return value.ToJSON();
    }
    if (value.IsNull()) {
        throw RPCParamError("Missing required parameter: " + name);
    }
    throw RPCParamError("Parameter must be a string or object: " + name);
}

// ============================================================================
// Result Converters
// ============================================================================

static JSONValue VectorToJSON(const FeatureVector& vector) {
    JSONValue::Array arr;
    arr.reserve(vector.size());
    for (double v : vector) {
        arr.push_back(v);
    }
    return JSONValue(std::move(arr));
}

JSONValue RegisterResultToJSON(const registry::RegisterResult& result) {
    JSONValue::Object obj;
    obj["success"] = true;
    obj["id"] = result.id;
    obj["commitment"] = result.commitment;
    obj["chainIndex"] = result.chainIndex;
    obj["chainSignature"] = result.chainSignature;
    obj["entryHash"] = result.entryHash;
    obj["vectorStored"] = result.vectorStored;
    return JSONValue(std::move(obj));
}

JSONValue CheckResultToJSON(const std::optional<registry::CheckResult>& result) {
    JSONValue::Object obj;
    if (!result) {
        obj["exists"] = false;
        return JSONValue(std::move(obj));
    }

    const registry::IdentityRecord& record = result->record;
    JSONValue::Object metadata;
    for (const auto& [key, value] : record.metadata) {
        metadata[key] = value;
    }

    obj["exists"] = true;
    obj["revoked"] = record.revoked;
    obj["ownerKey"] = record.ownerKey;
    obj["createdAt"] = record.createdAt;
    if (record.revokedAt) {
        obj["revokedAt"] = *record.revokedAt;
    }
    if (result->vector) {
        obj["vector"] = VectorToJSON(*result->vector);
    }
    obj["commitment"] = record.commitment;
    obj["chainIndex"] = record.chainIndex;
    obj["chainSignature"] = record.chainSignature;
    obj["keyVersion"] = record.keyVersion;
    obj["hasVector"] = record.HasVector();
    obj["metadata"] = JSONValue(std::move(metadata));
    return JSONValue(std::move(obj));
}

JSONValue MatchesToJSON(const std::vector<matcher::Match>& matches) {
    JSONValue::Array arr;
    for (const auto& match : matches) {
        JSONValue::Object item;
        item["fingerprint"] = match.fingerprint;
        item["ownerKey"] = match.ownerKey;
        item["similarity"] = match.similarity;
        arr.push_back(JSONValue(std::move(item)));
    }

    JSONValue::Object obj;
    obj["matched"] = !matches.empty();
    obj["matches"] = JSONValue(std::move(arr));
    return JSONValue(std::move(obj));
}

JSONValue ChainEntryToJSON(const chain::ChainEntry& entry) {
    JSONValue::Object obj;
    obj["index"] = entry.index;
    obj["commitment"] = entry.commitment;
    obj["fingerprint"] = entry.fingerprint;
    obj["timestamp"] = entry.timestamp;
    obj["prevHash"] = entry.prevHash;
    obj["entryHash"] = entry.entryHash;
    obj["signature"] = entry.signature;
    return JSONValue(std::move(obj));
}

JSONValue ChainRootToJSON(const chain::ChainRoot& root) {
    JSONValue::Object obj;
    obj["root"] = root.root;
    obj["index"] = root.index;
    obj["timestamp"] = root.timestamp;
    obj["totalEntries"] = root.totalEntries;
    obj["genesis"] = root.genesis;
    return JSONValue(std::move(obj));
}

JSONValue VerifyResultToJSON(const chain::VerifyResult& result) {
    JSONValue::Object obj;
    obj["valid"] = result.valid;
    obj["checked"] = result.checked;
    if (result.error) {
        obj["error"] = *result.error;
    }
    if (result.brokenAt) {
        obj["brokenAt"] = *result.brokenAt;
    }
    return JSONValue(std::move(obj));
}

JSONValue SnapshotToJSON(const chain::ChainSnapshot& snapshot) {
    JSONValue::Array entries;
    entries.reserve(snapshot.entries.size());
    for (const auto& entry : snapshot.entries) {
        entries.push_back(ChainEntryToJSON(entry));
    }

    JSONValue::Object obj;
    obj["genesis"] = snapshot.genesis;
    obj["entries"] = JSONValue(std::move(entries));
    obj["root"] = snapshot.root;
    obj["totalEntries"] = snapshot.totalEntries;
    obj["exportedAt"] = snapshot.exportedAt;
    obj["publicKey"] = snapshot.publicKey;
    return JSONValue(std::move(obj));
}

JSONValue ConsentToJSON(const consent::ActiveConsent& consent) {
    JSONValue::Array scope;
    for (const auto& s : consent.scope) {
        scope.push_back(s);
    }

    JSONValue::Object obj;
    obj["consentId"] = consent.consentId;
    obj["fingerprint"] = consent.fingerprint;
    obj["companyId"] = consent.companyId;
    obj["scope"] = JSONValue(std::move(scope));
    obj["issuedAt"] = consent.issuedAt;
    obj["expiresAt"] = consent.expiresAt;
    obj["tokenId"] = consent.tokenId;
    return JSONValue(std::move(obj));
}

JSONValue TokenVerificationToJSON(const consent::TokenVerification& verification) {
    JSONValue::Object obj;
    obj["valid"] = verification.valid;
    if (verification.valid && verification.claims) {
        obj["claims"] = verification.claims->ToJSON();
    } else {
        obj["reason"] = verification.reason;
    }
    return JSONValue(std::move(obj));
}

// ============================================================================
// RPCCommandTable Implementation
// ============================================================================

RPCCommandTable::RPCCommandTable(NodeContext& node)
    : node_(node), startTime_(std::chrono::steady_clock::now()) {}

int64_t RPCCommandTable::GetUptime() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
}

void RPCCommandTable::RegisterCommands(RPCServer& server) {
    commands_.clear();
    RegisterRegistryCommands();
    RegisterConsentCommands();
    RegisterChainCommands();
    RegisterUtilityCommands();

    for (const auto& cmd : commands_) {
        server.RegisterMethod(cmd);
    }
    LOG_INFO(util::LogCategory::RPC) << "Registered " << commands_.size() << " RPC methods";
}

void RPCCommandTable::RegisterRegistryCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "register",
        Category::REGISTRY,
        "Enroll an identity and anchor its commitment on the hash chain.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_register(req, ctx, table);
        },
        false,
        {"fingerprint", "ownerKey", "vector", "metadata"},
        {"64 lowercase hex characters", "Compressed secp256k1 public key (hex)",
         "Feature vector (optional)", "String map (optional)"}
    });

    commands_.push_back({
        "check",
        Category::REGISTRY,
        "Look up an identity by fingerprint.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_check(req, ctx, table);
        },
        false,
        {"fingerprint", "includeVector"},
        {"The fingerprint",
         "Return the decrypted vector; authenticated callers only (default=false)"}
    });

    commands_.push_back({
        "revoke",
        Category::REGISTRY,
        "Revoke an identity with an owner-signed revoke command.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_revoke(req, ctx, table);
        },
        false,
        {"fingerprint", "signature", "message"},
        {"The fingerprint", "Hex DER signature over SHA256(message)",
         "Signed command (string, or object serialized with sorted keys)"}
    });

    commands_.push_back({
        "search",
        Category::REGISTRY,
        "Find registered identities similar to a vector.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_search(req, ctx, table);
        },
        false,
        {"vector", "threshold", "topK"},
        {"Feature vector", "Minimum cosine similarity (default=verifythreshold)",
         "Maximum results (default=1)"}
    });

    commands_.push_back({
        "fingerprint",
        Category::REGISTRY,
        "Derive the fingerprint of a feature vector.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_fingerprint(req, ctx, table);
        },
        false,
        {"vector"},
        {"Feature vector"}
    });

    commands_.push_back({
        "listbyowner",
        Category::REGISTRY,
        "List fingerprints registered to an owner key.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_listbyowner(req, ctx, table);
        },
        false,
        {"ownerKey"},
        {"Compressed secp256k1 public key (hex)"}
    });
}

void RPCCommandTable::RegisterConsentCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "requestconsent",
        Category::CONSENT,
        "Open a consent request for an identity.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_requestconsent(req, ctx, table);
        },
        false,
        {"fingerprint", "companyId", "scope", "durationSeconds"},
        {"The fingerprint", "Requesting party", "Array of scope strings",
         "Token lifetime in seconds"}
    });

    commands_.push_back({
        "approveconsent",
        Category::CONSENT,
        "Approve a pending consent request and issue its token.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_approveconsent(req, ctx, table);
        },
        false,
        {"requestId", "fingerprint", "signature", "message"},
        {"The request id", "The fingerprint", "Owner signature (optional)",
         "Signed approve_consent command (optional)"}
    });

    commands_.push_back({
        "verifytoken",
        Category::CONSENT,
        "Verify a consent token, including a live revocation check.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_verifytoken(req, ctx, table);
        },
        false,
        {"token", "audience"},
        {"The token", "Expected audience (optional)"}
    });

    commands_.push_back({
        "listconsents",
        Category::CONSENT,
        "List consents issued for an identity.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_listconsents(req, ctx, table);
        },
        false,
        {"fingerprint"},
        {"The fingerprint"}
    });
}

void RPCCommandTable::RegisterChainCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "chainroot",
        Category::CHAIN,
        "Returns the latest entry hash of the anchoring chain.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_chainroot(req, ctx, table);
        },
        false,
        {},
        {}
    });

    commands_.push_back({
        "chainentry",
        Category::CHAIN,
        "Returns the chain entry at an index.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_chainentry(req, ctx, table);
        },
        false,
        {"index"},
        {"1-based entry index"}
    });

    commands_.push_back({
        "chainverify",
        Category::CHAIN,
        "Verify hashes, signatures and links over a range of entries.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_chainverify(req, ctx, table);
        },
        false,
        {"from", "to"},
        {"First index (default=1)", "Last index (default=tip)"}
    });

    commands_.push_back({
        "chainsnapshot",
        Category::CHAIN,
        "Export every entry with the verifying public key.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_chainsnapshot(req, ctx, table);
        },
        false,
        {},
        {}
    });

    commands_.push_back({
        "chainfind",
        Category::CHAIN,
        "Returns the chain entry anchoring a fingerprint.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_chainfind(req, ctx, table);
        },
        false,
        {"fingerprint"},
        {"The fingerprint"}
    });
}

void RPCCommandTable::RegisterUtilityCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "help",
        Category::UTILITY,
        "List all commands, or get help for a specified command.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_help(req, ctx, table);
        },
        false,
        {"command"},
        {"The command to get help for (optional)"}
    });

    commands_.push_back({
        "uptime",
        Category::UTILITY,
        "Returns the total uptime of the server.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_uptime(req, ctx, table);
        },
        false,
        {},
        {}
    });

    commands_.push_back({
        "stop",
        Category::UTILITY,
        "Stop the server.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_stop(req, ctx, table);
        },
        true,
        {},
        {}
    });
}

// ============================================================================
// Registry Command Implementations
// ============================================================================

static RPCResponse NotReady(const JSONValue& id) {
    return RPCResponse::Error(RPCErrorCode::NOT_READY, "Node is not initialized", id);
}

RPCResponse cmd_register(const RPCRequest& req, const RPCContext& ctx,
                         RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    registry::RegisterRequest request;
    request.fingerprint = GetRequiredString(req, 0, "fingerprint");
    request.ownerKey = GetRequiredString(req, 1, "ownerKey");
    const JSONValue& vector = req.GetArg(2, "vector");
    if (!vector.IsNull()) {
        request.vector = ParseVector(vector, "vector");
    }
    request.metadata = ParseMetadata(req.GetArg(3, "metadata"));

    auto result = node.registry->Register(request);
    if (!result) {
        return ErrorResponse(result.GetError(), req.GetId());
    }
    return RPCResponse::Success(RegisterResultToJSON(result.Value()), req.GetId());
}

RPCResponse cmd_check(const RPCRequest& req, const RPCContext& ctx,
                      RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    std::string fingerprint = GetRequiredString(req, 0, "fingerprint");
    bool includeVector = GetOptionalBool(req, 1, "includeVector", false);

    // Plaintext vectors only go to authenticated callers
    if (includeVector && ctx.username.empty()) {
        return RPCResponse::Error(RPCErrorCode::UNAUTHORIZED,
                                  "includeVector requires an authenticated caller",
                                  req.GetId());
    }

    auto result = node.registry->Check(fingerprint, includeVector);
    if (!result) {
        return ErrorResponse(result.GetError(), req.GetId());
    }
    return RPCResponse::Success(CheckResultToJSON(result.Value()), req.GetId());
}

RPCResponse cmd_revoke(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    std::string fingerprint = GetRequiredString(req, 0, "fingerprint");
    registry::OwnershipProof proof;
    proof.signature = GetRequiredString(req, 1, "signature");
    proof.message = ParseCommandMessage(req.GetArg(2, "message"), "message");

    auto result = node.registry->Revoke(fingerprint, proof);
    if (!result) {
        return ErrorResponse(result.GetError(), req.GetId());
    }

    JSONValue::Object obj;
    obj["success"] = true;
    obj["fingerprint"] = result->fingerprint;
    obj["revokedAt"] = result->revokedAt;
    return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
}

RPCResponse cmd_search(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    FeatureVector vector = ParseVector(req.GetArg(0, "vector"), "vector");
    double threshold = GetOptionalNumber(req, 1, "threshold").value_or(node.verifyThreshold);
    int64_t topK = GetOptionalInt(req, 2, "topK").value_or(static_cast<int64_t>(matcher::DEFAULT_TOP_K));
    if (topK < 1 || static_cast<uint64_t>(topK) > node.maxTopK) {
        return ErrorResponse(Error(ErrorCode::InvalidArgument, "topK out of range")
                                 .WithDetail("max", std::to_string(node.maxTopK)),
                             req.GetId());
    }

    auto result = node.registry->Search(vector, threshold, static_cast<size_t>(topK));
    if (!result) {
        return ErrorResponse(result.GetError(), req.GetId());
    }
    return RPCResponse::Success(MatchesToJSON(result.Value()), req.GetId());
}

RPCResponse cmd_fingerprint(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    FeatureVector vector = ParseVector(req.GetArg(0, "vector"), "vector");
    auto fingerprint = node.deriver->Derive(vector);
    if (!fingerprint) {
        return ErrorResponse(fingerprint.GetError(), req.GetId());
    }

    JSONValue::Object obj;
    obj["fingerprint"] = fingerprint.Value();
    obj["dimension"] = node.deriver->GetConfig().dimension;
    obj["precision"] = node.deriver->GetConfig().precision;
    return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
}

RPCResponse cmd_listbyowner(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    std::string ownerKey = GetRequiredString(req, 0, "ownerKey");
    auto result = node.registry->ListByOwner(ownerKey);
    if (!result) {
        return ErrorResponse(result.GetError(), req.GetId());
    }

    JSONValue::Array arr;
    for (const auto& fingerprint : result.Value()) {
        arr.push_back(fingerprint);
    }
    return RPCResponse::Success(JSONValue(std::move(arr)), req.GetId());
}

// ============================================================================
// Consent Command Implementations
// ============================================================================

RPCResponse cmd_requestconsent(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    std::string fingerprint = GetRequiredString(req, 0, "fingerprint");
    std::string companyId = GetRequiredString(req, 1, "companyId");

    const JSONValue& scopeParam = req.GetArg(2, "scope");
    if (!scopeParam.IsArray()) {
        throw RPCParamError("Parameter must be an array of strings: scope");
    }
    std::vector<std::string> scope;
    for (const auto& item : scopeParam.GetArray()) {
        if (!item.IsString()) {
            throw RPCParamError("Parameter must be an array of strings: scope");
        }
        scope.push_back(item.GetString());
    }
    int64_t duration = GetRequiredInt(req, 3, "durationSeconds");

    auto result = node.consent->RequestConsent(fingerprint, companyId, scope, duration);
    if (!result) {
        return ErrorResponse(result.GetError(), req.GetId());
    }

    JSONValue::Object obj;
    obj["status"] = "pending_user_approval";
    obj["requestId"] = result->requestId;
    return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
}

RPCResponse cmd_approveconsent(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    std::string requestId = GetRequiredString(req, 0, "requestId");
    std::string fingerprint = GetRequiredString(req, 1, "fingerprint");

    std::optional<registry::OwnershipProof> proof;
    auto signature = GetOptionalString(req, 2, "signature");
    const JSONValue& message = req.GetArg(3, "message");
    if (signature || !message.IsNull()) {
        if (!signature) {
            throw RPCParamError("Missing required parameter: signature");
        }
        proof = registry::OwnershipProof{ParseCommandMessage(message, "message"), *signature};
    }

    auto result = node.consent->ApproveConsent(requestId, fingerprint, proof);
    if (!result) {
        return ErrorResponse(result.GetError(), req.GetId());
    }

    JSONValue::Object obj;
    obj["success"] = true;
    obj["token"] = result->token;
    obj["consentId"] = result->consentId;
    obj["expiresAt"] = result->expiresAt;
    return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
}

RPCResponse cmd_verifytoken(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    // A missing token is a denial, not a parameter error
    std::string token = GetOptionalString(req, 0, "token").value_or("");
    auto audience = GetOptionalString(req, 1, "audience");

    consent::TokenVerification verification = node.consent->VerifyToken(token, audience);
    return RPCResponse::Success(TokenVerificationToJSON(verification), req.GetId());
}

RPCResponse cmd_listconsents(const RPCRequest& req, const RPCContext& ctx,
                             RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    std::string fingerprint = GetRequiredString(req, 0, "fingerprint");
    auto result = node.consent->ListConsents(fingerprint);
    if (!result) {
        return ErrorResponse(result.GetError(), req.GetId());
    }

    JSONValue::Array arr;
    for (const auto& consent : result.Value()) {
        arr.push_back(ConsentToJSON(consent));
    }
    return RPCResponse::Success(JSONValue(std::move(arr)), req.GetId());
}

// ============================================================================
// Chain Command Implementations
// ============================================================================

static std::optional<uint64_t> GetOptionalIndex(const RPCRequest& req, size_t index,
                                                const std::string& name) {
    auto value = GetOptionalInt(req, index, name);
    if (!value) return std::nullopt;
    if (*value < 1) {
        throw RPCParamError("Parameter must be a positive index: " + name);
    }
    return static_cast<uint64_t>(*value);
}

RPCResponse cmd_chainroot(const RPCRequest& req, const RPCContext& ctx,
                          RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    auto root = node.chain->GetRoot();
    if (!root) {
        return ErrorResponse(root.GetError(), req.GetId());
    }
    return RPCResponse::Success(ChainRootToJSON(root.Value()), req.GetId());
}

RPCResponse cmd_chainentry(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    auto index = GetOptionalIndex(req, 0, "index");
    if (!index) {
        throw RPCParamError("Missing required parameter: index");
    }
    auto entry = node.chain->GetEntry(*index);
    if (!entry) {
        return ErrorResponse(entry.GetError(), req.GetId());
    }
    return RPCResponse::Success(ChainEntryToJSON(entry.Value()), req.GetId());
}

RPCResponse cmd_chainverify(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    auto from = GetOptionalIndex(req, 0, "from");
    auto to = GetOptionalIndex(req, 1, "to");

    auto result = node.chain->VerifyChain(from, to);
    if (!result) {
        return ErrorResponse(result.GetError(), req.GetId());
    }
    return RPCResponse::Success(VerifyResultToJSON(result.Value()), req.GetId());
}

RPCResponse cmd_chainsnapshot(const RPCRequest& req, const RPCContext& ctx,
                              RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    auto snapshot = node.chain->ExportSnapshot();
    if (!snapshot) {
        return ErrorResponse(snapshot.GetError(), req.GetId());
    }
    return RPCResponse::Success(SnapshotToJSON(snapshot.Value()), req.GetId());
}

RPCResponse cmd_chainfind(const RPCRequest& req, const RPCContext& ctx,
                          RPCCommandTable* table) {
    NodeContext& node = table->GetNode();
    if (!node.IsReady()) return NotReady(req.GetId());

    std::string fingerprint = GetRequiredString(req, 0, "fingerprint");
    auto entry = node.chain->FindByFingerprint(fingerprint);
    if (!entry) {
        return ErrorResponse(entry.GetError(), req.GetId());
    }
    return RPCResponse::Success(ChainEntryToJSON(entry.Value()), req.GetId());
}

// ============================================================================
// Utility Command Implementations
// ============================================================================

RPCResponse cmd_help(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table) {
    auto command = GetOptionalString(req, 0, "command");

    if (!command) {
        std::map<std::string, JSONValue::Array> byCategory;
        for (const auto& cmd : table->GetAllCommands()) {
            JSONValue::Object cmdInfo;
            cmdInfo["name"] = cmd.name;
            cmdInfo["description"] = cmd.description;
            byCategory[cmd.category].push_back(JSONValue(std::move(cmdInfo)));
        }

        JSONValue::Object result;
        for (auto& [category, cmds] : byCategory) {
            result[category] = JSONValue(std::move(cmds));
        }
        return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
    }

    for (const auto& cmd : table->GetAllCommands()) {
        if (cmd.name != *command) continue;

        JSONValue::Object result;
        result["name"] = cmd.name;
        result["category"] = cmd.category;
        result["description"] = cmd.description;
        result["requiresAuth"] = cmd.requiresAuth;

        JSONValue::Array args;
        for (size_t i = 0; i < cmd.argNames.size(); ++i) {
            JSONValue::Object arg;
            arg["name"] = cmd.argNames[i];
            if (i < cmd.argDescriptions.size()) {
                arg["description"] = cmd.argDescriptions[i];
            }
            args.push_back(JSONValue(std::move(arg)));
        }
        result["arguments"] = JSONValue(std::move(args));
        return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
    }

    return RPCResponse::Error(RPCErrorCode::METHOD_NOT_FOUND,
                              "Unknown command: " + *command, req.GetId());
}

RPCResponse cmd_uptime(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table) {
    return RPCResponse::Success(JSONValue(table->GetUptime()), req.GetId());
}

RPCResponse cmd_stop(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table) {
    LOG_INFO(util::LogCategory::RPC) << "Stop requested by "
                                     << (ctx.username.empty() ? ctx.clientAddress : ctx.username);
    RequestShutdown();
    return RPCResponse::Success(JSONValue("vfaced stopping"), req.GetId());
}

} // namespace rpc
} // namespace vface
