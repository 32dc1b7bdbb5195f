// VFACE - Consent Token Service Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/consent/consent_service.h"
#include "vface/core/random.h"
#include "vface/registry/fingerprint.h"
#include "vface/util/logging.h"

#include <algorithm>

namespace vface {
namespace consent {

const char* ConsentStatusToString(ConsentStatus status) {
    switch (status) {
        case ConsentStatus::Pending:  return "pending";
        case ConsentStatus::Approved: return "approved";
    }
    return "unknown";
}

ConsentService::ConsentService(db::Database& db,
                               const KeyStore& keys,
                               const registry::IdentityDirectory& directory,
                               registry::RegistryStore& registry,
                               const Config& config)
    : db_(db), keys_(keys), directory_(directory), registry_(registry), config_(config) {}

ConsentService::Stats ConsentService::GetStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

// ============================================================================
// Requests
// ============================================================================

Result<ConsentRequest> ConsentService::RequestConsent(const std::string& fingerprint,
                                                      const std::string& companyId,
                                                      const std::vector<std::string>& scope,
                                                      int64_t durationSeconds) {
    if (!registry::IsValidFingerprint(fingerprint)) {
        return Error(ErrorCode::InvalidFingerprint,
                     "Fingerprint must be 64 lowercase hex characters");
    }
    if (companyId.empty() || companyId.size() > MAX_COMPANY_ID_LENGTH) {
        return Error(ErrorCode::InvalidArgument,
                     "companyId must be 1-" + std::to_string(MAX_COMPANY_ID_LENGTH) + " characters");
    }
    if (scope.empty()) {
        return Error(ErrorCode::InvalidArgument, "scope must not be empty");
    }
    for (const auto& item : scope) {
        if (item.empty()) {
            return Error(ErrorCode::InvalidArgument, "scope entries must not be empty");
        }
    }
    if (durationSeconds < MIN_CONSENT_DURATION || durationSeconds > MAX_CONSENT_DURATION) {
        return Error(ErrorCode::InvalidArgument, "durationSeconds out of range")
            .WithDetail("min", std::to_string(MIN_CONSENT_DURATION))
            .WithDetail("max", std::to_string(MAX_CONSENT_DURATION));
    }

    auto identity = directory_.GetIdentity(fingerprint);
    if (!identity) {
        return identity.GetError();
    }
    if (identity->revoked) {
        return Error(ErrorCode::NotFound, "Identity not found or revoked");
    }

    ConsentRequest request;
    request.requestId = GenerateUUID();
    request.fingerprint = fingerprint;
    request.companyId = companyId;
    request.scope = scope;
    request.durationSeconds = durationSeconds;
    request.createdAt = GetTimeMillis();
    request.status = ConsentStatus::Pending;

    db::Status s = db_.Put(db::MakeKey(db::prefix::CONSENT_REQUEST, request.requestId),
                           db::SerializeToString(request));
    if (!s.ok()) {
        return db::ToError(s, "store consent request");
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.requested;
    }
    LOG_INFO(util::LogCategory::CONSENT) << "Consent request " << request.requestId
                                         << " from " << companyId << " for "
                                         << util::LogId(fingerprint);
    return request;
}

Result<ConsentRequest> ConsentService::GetRequest(const std::string& requestId) const {
    std::string value;
    db::Status s = db_.Get(db::MakeKey(db::prefix::CONSENT_REQUEST, requestId), &value);
    if (s.IsNotFound()) {
        return Error(ErrorCode::NotFound, "Consent request not found");
    }
    if (!s.ok()) {
        return db::ToError(s, "read consent request");
    }
    ConsentRequest request;
    if (!db::DeserializeFromString(value, request)) {
        return Error(ErrorCode::CorruptRecord, "Consent request is corrupt")
            .WithDetail("request_id", requestId);
    }
    return request;
}

// ============================================================================
// Approval
// ============================================================================

Result<ApprovalResult> ConsentService::ApproveConsent(const std::string& requestId,
                                                      const std::string& fingerprint,
                                                      const std::optional<registry::OwnershipProof>& proof) {
    if (requestId.empty()) {
        return Error(ErrorCode::InvalidArgument, "requestId is required");
    }
    if (!registry::IsValidFingerprint(fingerprint)) {
        return Error(ErrorCode::InvalidFingerprint,
                     "Fingerprint must be 64 lowercase hex characters");
    }
    if (config_.requireApprovalProof && !proof) {
        return Error(ErrorCode::NotOwner, "Approval requires a signed approve_consent command");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto request = GetRequest(requestId);
    if (!request) {
        return request.GetError();
    }
    if (request->status != ConsentStatus::Pending) {
        return Error(ErrorCode::RequestNotPending, "Consent request is not pending")
            .WithDetail("status", ConsentStatusToString(request->status));
    }
    if (request->fingerprint != fingerprint) {
        return Error(ErrorCode::ConsentMismatch, "Fingerprint does not match consent request");
    }

    auto identity = directory_.GetIdentity(fingerprint);
    if (!identity) {
        return identity.GetError();
    }
    if (identity->revoked) {
        return Error(ErrorCode::IdentityRevoked, "Identity is revoked");
    }

    Timestamp now = GetTime();
    TokenClaims claims;
    claims.issuer = config_.issuer;
    claims.subject = identity->ownerKey;
    claims.audience = request->companyId;
    claims.fingerprint = fingerprint;
    claims.scope = request->scope;
    claims.modelVersion = config_.modelVersion;
    claims.issuedAt = now;
    claims.expiresAt = now + request->durationSeconds;
    claims.tokenId = GenerateUUID();

    ApprovalResult result;
    try {
        result.token = EncodeToken(claims, keys_.SigningKey().GetPrivateKey());
    } catch (const std::runtime_error& e) {
        return Error(ErrorCode::KeyStoreError, std::string("Token signing failed: ") + e.what());
    }

    ActiveConsent active;
    active.consentId = GenerateUUID();
    active.fingerprint = fingerprint;
    active.companyId = request->companyId;
    active.scope = request->scope;
    active.issuedAt = GetTimeMillis();
    active.expiresAt = active.issuedAt + request->durationSeconds * 1000;
    active.tokenId = claims.tokenId;

    ConsentRequest approved = request.Value();
    approved.status = ConsentStatus::Approved;

    auto addWrites = [&](db::WriteBatch& batch) {
        batch.Put(db::MakeKey(db::prefix::CONSENT_REQUEST, requestId),
                  db::SerializeToString(approved));
        batch.Put(db::MakeKey(db::prefix::CONSENT_ACTIVE, active.consentId),
                  db::SerializeToString(active));
        batch.Put(db::MakeKey(db::prefix::CONSENT_BY_FP, fingerprint + active.consentId), "");
    };

    if (proof) {
        auto applied = registry_.ApplyWithOwnershipProof(
            fingerprint, *proof, registry::ApproveConsentCommand::ACTION,
            [&](const registry::SignedCommand& command, const registry::IdentityRecord&,
                db::WriteBatch& batch) -> Result<void> {
                const auto& approve = std::get<registry::ApproveConsentCommand>(command);
                if (approve.requestId != requestId) {
                    return Error(ErrorCode::ConsentMismatch,
                                 "Signed request_id does not match the request");
                }
                addWrites(batch);
                return Result<void>::Ok();
            });
        if (!applied) {
            return applied.GetError();
        }
    } else {
        db::WriteBatch batch;
        addWrites(batch);
        db::WriteOptions options;
        options.sync = true;
        db::Status s = db_.Write(options, &batch);
        if (!s.ok()) {
            return db::ToError(s, "commit consent approval");
        }
    }

    {
        std::lock_guard<std::mutex> statsLock(statsMutex_);
        ++stats_.approved;
    }
    LOG_INFO(util::LogCategory::CONSENT) << "Approved consent " << active.consentId
                                         << " for " << active.companyId
                                         << (proof ? " with owner proof" : "");

    result.consentId = active.consentId;
    result.expiresAt = active.expiresAt;
    result.claims = std::move(claims);
    return result;
}

// ============================================================================
// Verification
// ============================================================================

TokenVerification ConsentService::Deny(const char* why) const {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.denied;
    }
    LOG_DEBUG(util::LogCategory::CONSENT) << "Token denied: " << why;
    TokenVerification result;
    result.valid = false;
    result.reason = why;
    return result;
}

TokenVerification ConsentService::VerifyToken(const std::string& token,
                                              const std::optional<std::string>& audience) const {
    if (token.empty()) {
        return Deny(reason::MISSING_TOKEN);
    }

    auto pubkey = PublicKey::FromHex(keys_.PublicKeyHex());
    if (!pubkey) {
        LOG_ERROR(util::LogCategory::CONSENT) << "Signing public key is unusable";
        return Deny(reason::INVALID_SIGNATURE);
    }

    TokenClaims claims;
    switch (DecodeToken(token, *pubkey, claims)) {
        case TokenDecodeStatus::Malformed:
            return Deny(reason::MALFORMED_TOKEN);
        case TokenDecodeStatus::BadSignature:
            return Deny(reason::INVALID_SIGNATURE);
        case TokenDecodeStatus::Ok:
            break;
    }

    if (claims.issuer != config_.issuer) {
        return Deny(reason::WRONG_ISSUER);
    }
    if (GetTime() >= claims.expiresAt) {
        return Deny(reason::TOKEN_EXPIRED);
    }
    if (audience && claims.audience != *audience) {
        return Deny(reason::AUDIENCE_MISMATCH);
    }

    auto identity = directory_.GetIdentity(claims.fingerprint);
    if (!identity) {
        if (identity.GetError().Is(ErrorCode::NotFound)) {
            return Deny(reason::IDENTITY_NOT_FOUND);
        }
        LOG_WARN(util::LogCategory::CONSENT) << "Registry lookup failed during verification: "
                                             << identity.GetError().ToString();
        return Deny(reason::REGISTRY_UNAVAILABLE);
    }
    if (identity->revoked) {
        return Deny(reason::IDENTITY_REVOKED);
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.verified;
    }
    TokenVerification result;
    result.valid = true;
    result.claims = std::move(claims);
    return result;
}

// ============================================================================
// Listing
// ============================================================================

Result<std::vector<ActiveConsent>> ConsentService::ListConsents(const std::string& fingerprint) const {
    if (!registry::IsValidFingerprint(fingerprint)) {
        return Error(ErrorCode::InvalidFingerprint,
                     "Fingerprint must be 64 lowercase hex characters");
    }

    std::string prefix = db::MakeKey(db::prefix::CONSENT_BY_FP, fingerprint);
    std::vector<std::string> consentIds;
    db::Status s = db_.ScanPrefix(prefix, [&](const db::Slice& key, const db::Slice&) {
        consentIds.push_back(key.ToString().substr(prefix.size()));
        return true;
    });
    if (!s.ok()) {
        return db::ToError(s, "scan consents");
    }

    std::vector<ActiveConsent> consents;
    for (const auto& id : consentIds) {
        std::string value;
        s = db_.Get(db::MakeKey(db::prefix::CONSENT_ACTIVE, id), &value);
        if (!s.ok()) {
            return db::ToError(s, "read consent " + id);
        }
        ActiveConsent consent;
        if (!db::DeserializeFromString(value, consent)) {
            return Error(ErrorCode::CorruptRecord, "Consent record is corrupt")
                .WithDetail("consent_id", id);
        }
        consents.push_back(std::move(consent));
    }

    std::sort(consents.begin(), consents.end(),
              [](const ActiveConsent& a, const ActiveConsent& b) {
                  return a.issuedAt < b.issuedAt;
              });
    return consents;
}

} // namespace consent
} // namespace vface
