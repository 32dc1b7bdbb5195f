// VFACE - Signed Owner Commands
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Owners prove control of an identity by signing a small JSON message with
// the key registered as ownerKey:
//
//   {"action":"revoke","fingerprint":"<fp>","timestamp":<unix s>,"nonce":"<n>"}
//   {"action":"approve_consent","fingerprint":"<fp>","request_id":"<uuid>",
//    "timestamp":<unix s>,"nonce":"<n>"}
//
// The signature is a DER-encoded ECDSA/secp256k1 signature over
// SHA256(message text), hex encoded. The message is verified exactly as
// received; it is never re-serialized.

#ifndef VFACE_REGISTRY_COMMANDS_H
#define VFACE_REGISTRY_COMMANDS_H

#include "vface/core/error.h"
#include "vface/core/types.h"
#include "vface/crypto/keys.h"

#include <string>
#include <variant>

namespace vface {
namespace registry {

/// Nonce length bounds
static constexpr size_t MIN_NONCE_LENGTH = 8;
static constexpr size_t MAX_NONCE_LENGTH = 128;

/// Largest accepted message text
static constexpr size_t MAX_COMMAND_SIZE = 4096;

/// action:"revoke"
struct RevokeCommand {
    static constexpr const char* ACTION = "revoke";

    std::string fingerprint;
    Timestamp timestamp{0};
    std::string nonce;
};

/// action:"approve_consent"
struct ApproveConsentCommand {
    static constexpr const char* ACTION = "approve_consent";

    std::string fingerprint;
    std::string requestId;
    Timestamp timestamp{0};
    std::string nonce;
};

/// A structurally valid owner command
using SignedCommand = std::variant<RevokeCommand, ApproveConsentCommand>;

/**
 * A message and the owner's signature over it.
 */
struct OwnershipProof {
    /// Exact JSON text that was signed
    std::string message;
    /// Hex DER signature over SHA256(message)
    std::string signature;
};

/**
 * Parse and structurally validate a command message.
 * Checks the action tag, field types, fingerprint format, nonce
 * charset/length and integer timestamp; never touches the signature.
 * @return MalformedCommand on any structural problem
 */
Result<SignedCommand> ParseSignedCommand(const std::string& message);

/// Accessors shared by every command type
const std::string& CommandFingerprint(const SignedCommand& command);
Timestamp CommandTimestamp(const SignedCommand& command);
const std::string& CommandNonce(const SignedCommand& command);
std::string CommandAction(const SignedCommand& command);

/// 8 to 128 characters of [A-Za-z0-9_-]
bool IsValidNonce(const std::string& nonce);

/// Verify proof.signature against an owner public key (hex)
bool VerifyOwnershipSignature(const std::string& ownerKeyHex, const OwnershipProof& proof);

// ============================================================================
// Client Helpers
// ============================================================================

/// Canonical message text for a command
std::string BuildCommandMessage(const SignedCommand& command);

/// Build the message for a command and sign it
OwnershipProof SignCommand(const PrivateKey& key, const SignedCommand& command);

} // namespace registry
} // namespace vface

#endif // VFACE_REGISTRY_COMMANDS_H
