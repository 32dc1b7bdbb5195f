// VFACE - Consent Tokens
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Consent tokens are JWS compact serializations:
//
//   base64url(header) "." base64url(claims) "." base64url(signature)
//
// with header {"alg":"ES256K","typ":"JWT"} and a 64-byte r||s
// ECDSA/secp256k1 signature over SHA256(header "." claims).

#ifndef VFACE_CONSENT_TOKEN_H
#define VFACE_CONSENT_TOKEN_H

#include "vface/core/types.h"
#include "vface/crypto/keys.h"
#include "vface/util/json.h"

#include <optional>
#include <string>
#include <vector>

namespace vface {
namespace consent {

/// Default "iss" claim
static constexpr const char* DEFAULT_ISSUER = "https://registry.v-face.org";

/// Default "vf_model_v" claim
static constexpr const char* DEFAULT_MODEL_VERSION = "mobilefacenet_128d";

/// Exact header segment text
static constexpr const char* TOKEN_HEADER = "{\"alg\":\"ES256K\",\"typ\":\"JWT\"}";

struct TokenClaims {
    std::string issuer;         // iss
    std::string subject;        // sub: owner key
    std::string audience;       // aud: company id
    std::string fingerprint;    // vf_fp
    std::vector<std::string> scope;  // vf_scope
    std::string modelVersion;   // vf_model_v
    Timestamp issuedAt{0};      // iat
    Timestamp expiresAt{0};     // exp
    std::string tokenId;        // jti

    util::JSONValue ToJSON() const;

    /// nullopt if any claim is missing or has the wrong type
    static std::optional<TokenClaims> FromJSON(const util::JSONValue& json);
};

enum class TokenDecodeStatus {
    Ok,
    Malformed,
    BadSignature
};

/**
 * Sign claims into a compact token.
 * @throws std::runtime_error if signing fails
 */
std::string EncodeToken(const TokenClaims& claims, const PrivateKey& key);

/**
 * Split, decode and verify a token. Claims are filled only on Ok.
 * Expiry and issuer are not checked here.
 */
TokenDecodeStatus DecodeToken(const std::string& token, const PublicKey& key,
                              TokenClaims& claims);

} // namespace consent
} // namespace vface

#endif // VFACE_CONSENT_TOKEN_H
