// VFACE - Consent Tokens Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/consent/token.h"
#include "vface/core/hex.h"
#include "vface/crypto/sha256.h"

namespace vface {
namespace consent {

util::JSONValue TokenClaims::ToJSON() const {
    util::JSONValue::Array scopeArray;
    for (const auto& s : scope) {
        scopeArray.push_back(s);
    }

    util::JSONValue::Object obj;
    obj["iss"] = issuer;
    obj["sub"] = subject;
    obj["aud"] = audience;
    obj["vf_fp"] = fingerprint;
    obj["vf_scope"] = std::move(scopeArray);
    obj["vf_model_v"] = modelVersion;
    obj["iat"] = static_cast<int64_t>(issuedAt);
    obj["exp"] = static_cast<int64_t>(expiresAt);
    obj["jti"] = tokenId;
    return util::JSONValue(std::move(obj));
}

std::optional<TokenClaims> TokenClaims::FromJSON(const util::JSONValue& json) {
    if (!json.IsObject()) {
        return std::nullopt;
    }
    for (const char* key : {"iss", "sub", "aud", "vf_fp", "vf_model_v", "jti"}) {
        if (!json.HasKey(key) || !json[key].IsString()) {
            return std::nullopt;
        }
    }
    for (const char* key : {"iat", "exp"}) {
        if (!json.HasKey(key) || !json[key].IsInt()) {
            return std::nullopt;
        }
    }
    if (!json.HasKey("vf_scope") || !json["vf_scope"].IsArray()) {
        return std::nullopt;
    }

    TokenClaims claims;
    claims.issuer = json["iss"].GetString();
    claims.subject = json["sub"].GetString();
    claims.audience = json["aud"].GetString();
    claims.fingerprint = json["vf_fp"].GetString();
    claims.modelVersion = json["vf_model_v"].GetString();
    claims.tokenId = json["jti"].GetString();
    claims.issuedAt = json["iat"].GetInt();
    claims.expiresAt = json["exp"].GetInt();
    for (const auto& item : json["vf_scope"].GetArray()) {
        if (!item.IsString()) {
            return std::nullopt;
        }
        claims.scope.push_back(item.GetString());
    }
    return claims;
}

std::string EncodeToken(const TokenClaims& claims, const PrivateKey& key) {
    std::string signingInput = Base64UrlEncode(TOKEN_HEADER);
    signingInput += '.';
    signingInput += Base64UrlEncode(claims.ToJSON().ToJSON());

    std::vector<uint8_t> signature = key.SignCompact(SHA256Hash(signingInput));
    return signingInput + "." + Base64UrlEncode(signature.data(), signature.size());
}

TokenDecodeStatus DecodeToken(const std::string& token, const PublicKey& key,
                              TokenClaims& claims) {
    size_t first = token.find('.');
    if (first == std::string::npos) {
        return TokenDecodeStatus::Malformed;
    }
    size_t second = token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return TokenDecodeStatus::Malformed;
    }

    auto header = Base64UrlDecode(token.substr(0, first));
    auto payload = Base64UrlDecode(token.substr(first + 1, second - first - 1));
    auto signature = Base64UrlDecode(token.substr(second + 1));
    if (!header || !payload || !signature) {
        return TokenDecodeStatus::Malformed;
    }

    auto headerJson = util::JSONValue::TryParse(*header);
    if (!headerJson || !headerJson->IsObject() ||
        (*headerJson)["alg"].GetString() != "ES256K") {
        return TokenDecodeStatus::Malformed;
    }
    auto payloadJson = util::JSONValue::TryParse(*payload);
    if (!payloadJson) {
        return TokenDecodeStatus::Malformed;
    }
    auto decoded = TokenClaims::FromJSON(*payloadJson);
    if (!decoded) {
        return TokenDecodeStatus::Malformed;
    }

    std::vector<uint8_t> sigBytes(signature->begin(), signature->end());
    if (!key.VerifyCompact(SHA256Hash(token.substr(0, second)), sigBytes)) {
        return TokenDecodeStatus::BadSignature;
    }

    claims = std::move(*decoded);
    return TokenDecodeStatus::Ok;
}

} // namespace consent
} // namespace vface
