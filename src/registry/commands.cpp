// VFACE - Signed Owner Commands Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/registry/commands.h"
#include "vface/core/hex.h"
#include "vface/crypto/sha256.h"
#include "vface/registry/fingerprint.h"
#include "vface/util/json.h"

#include <cmath>

namespace vface {
namespace registry {

namespace {

Error Malformed(const std::string& message) {
    return Error(ErrorCode::MalformedCommand, message);
}

/// Integral JSON number; 1700000000.0 counts as an integer
std::optional<Timestamp> GetIntegerField(const util::JSONValue& value) {
    if (value.IsInt()) {
        return value.GetInt();
    }
    if (value.IsDouble()) {
        double d = value.GetDouble();
        if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15) {
            return static_cast<Timestamp>(d);
        }
    }
    return std::nullopt;
}

Result<std::string> GetStringField(const util::JSONValue& doc, const char* name) {
    if (!doc.HasKey(name) || !doc[name].IsString()) {
        return Malformed(std::string("Field '") + name + "' must be a string");
    }
    return doc[name].GetString();
}

} // namespace

bool IsValidNonce(const std::string& nonce) {
    if (nonce.size() < MIN_NONCE_LENGTH || nonce.size() > MAX_NONCE_LENGTH) {
        return false;
    }
    for (char c : nonce) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

Result<SignedCommand> ParseSignedCommand(const std::string& message) {
    if (message.empty() || message.size() > MAX_COMMAND_SIZE) {
        return Malformed("Command message is empty or too large");
    }

    auto doc = util::JSONValue::TryParse(message);
    if (!doc || !doc->IsObject()) {
        return Malformed("Command message is not a JSON object");
    }

    auto action = GetStringField(*doc, "action");
    if (!action) {
        return action.GetError();
    }
    auto fingerprint = GetStringField(*doc, "fingerprint");
    if (!fingerprint) {
        return fingerprint.GetError();
    }
    if (!IsValidFingerprint(fingerprint.Value())) {
        return Malformed("Command fingerprint is not 64 lowercase hex characters");
    }
    auto nonce = GetStringField(*doc, "nonce");
    if (!nonce) {
        return nonce.GetError();
    }
    if (!IsValidNonce(nonce.Value())) {
        return Malformed("Nonce must be 8-128 characters of [A-Za-z0-9_-]");
    }
    if (!doc->HasKey("timestamp")) {
        return Malformed("Field 'timestamp' is required");
    }
    auto timestamp = GetIntegerField((*doc)["timestamp"]);
    if (!timestamp) {
        return Malformed("Field 'timestamp' must be an integer");
    }

    if (action.Value() == RevokeCommand::ACTION) {
        RevokeCommand cmd;
        cmd.fingerprint = fingerprint.Value();
        cmd.timestamp = *timestamp;
        cmd.nonce = nonce.Value();
        return SignedCommand(std::move(cmd));
    }

    if (action.Value() == ApproveConsentCommand::ACTION) {
        auto requestId = GetStringField(*doc, "request_id");
        if (!requestId) {
            return requestId.GetError();
        }
        if (requestId.Value().empty() || requestId.Value().size() > 64) {
            return Malformed("Field 'request_id' is invalid");
        }
        ApproveConsentCommand cmd;
        cmd.fingerprint = fingerprint.Value();
        cmd.requestId = requestId.Value();
        cmd.timestamp = *timestamp;
        cmd.nonce = nonce.Value();
        return SignedCommand(std::move(cmd));
    }

    return Malformed("Unknown command action '" + action.Value() + "'");
}

const std::string& CommandFingerprint(const SignedCommand& command) {
    return std::visit([](const auto& cmd) -> const std::string& { return cmd.fingerprint; },
                      command);
}

Timestamp CommandTimestamp(const SignedCommand& command) {
    return std::visit([](const auto& cmd) { return cmd.timestamp; }, command);
}

const std::string& CommandNonce(const SignedCommand& command) {
    return std::visit([](const auto& cmd) -> const std::string& { return cmd.nonce; }, command);
}

std::string CommandAction(const SignedCommand& command) {
    return std::visit([](const auto& cmd) {
        return std::string(std::decay_t<decltype(cmd)>::ACTION);
    }, command);
}

bool VerifyOwnershipSignature(const std::string& ownerKeyHex, const OwnershipProof& proof) {
    auto pubkey = PublicKey::FromHex(ownerKeyHex);
    if (!pubkey) {
        return false;
    }
    auto signature = TryHexToBytes(proof.signature);
    if (!signature || signature->empty()) {
        return false;
    }
    return pubkey->Verify(SHA256Hash(proof.message), *signature);
}

// ============================================================================
// Client Helpers
// ============================================================================

std::string BuildCommandMessage(const SignedCommand& command) {
    std::string out = "{\"action\":" + util::JSONQuote(CommandAction(command));
    out += ",\"fingerprint\":" + util::JSONQuote(CommandFingerprint(command));
    if (const auto* approve = std::get_if<ApproveConsentCommand>(&command)) {
        out += ",\"request_id\":" + util::JSONQuote(approve->requestId);
    }
    out += ",\"timestamp\":" + std::to_string(CommandTimestamp(command));
    out += ",\"nonce\":" + util::JSONQuote(CommandNonce(command));
    out += "}";
    return out;
}

OwnershipProof SignCommand(const PrivateKey& key, const SignedCommand& command) {
    OwnershipProof proof;
    proof.message = BuildCommandMessage(command);
    proof.signature = BytesToHex(key.Sign(SHA256Hash(proof.message)));
    return proof;
}

} // namespace registry
} // namespace vface
