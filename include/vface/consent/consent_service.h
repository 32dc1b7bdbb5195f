// VFACE - Consent Token Service
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Request -> approve -> verify lifecycle of scoped, time-bound consent
// tokens. Verification always performs a live revocation lookup through the
// identity directory and fails closed when the directory cannot answer.

#ifndef VFACE_CONSENT_CONSENT_SERVICE_H
#define VFACE_CONSENT_CONSENT_SERVICE_H

#include "vface/consent/token.h"
#include "vface/core/error.h"
#include "vface/core/types.h"
#include "vface/crypto/keystore.h"
#include "vface/db/database.h"
#include "vface/registry/commands.h"
#include "vface/registry/registry_store.h"

#include <cstdint>
#include <ios>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vface {
namespace consent {

/// Token lifetime bounds, seconds
static constexpr int64_t MIN_CONSENT_DURATION = 60;
static constexpr int64_t MAX_CONSENT_DURATION = 31536000;

/// Longest accepted company id
static constexpr size_t MAX_COMPANY_ID_LENGTH = 128;

// ============================================================================
// Records
// ============================================================================

enum class ConsentStatus : uint8_t {
    Pending = 0,
    Approved = 1
};

const char* ConsentStatusToString(ConsentStatus status);

struct ConsentRequest {
    static constexpr uint8_t SERIALIZATION_VERSION = 1;

    std::string requestId;
    std::string fingerprint;
    std::string companyId;
    std::vector<std::string> scope;
    int64_t durationSeconds{0};
    TimestampMs createdAt{0};
    ConsentStatus status{ConsentStatus::Pending};

    template<typename Stream>
    void Serialize(Stream& s) const {
        s << SERIALIZATION_VERSION;
        s << requestId << fingerprint << companyId << scope << durationSeconds << createdAt;
        s << static_cast<uint8_t>(status);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t version = 0;
        s >> version;
        if (version != SERIALIZATION_VERSION) {
            throw std::ios_base::failure("ConsentRequest: unknown encoding version");
        }
        s >> requestId >> fingerprint >> companyId >> scope >> durationSeconds >> createdAt;
        uint8_t raw = 0;
        s >> raw;
        if (raw > static_cast<uint8_t>(ConsentStatus::Approved)) {
            throw std::ios_base::failure("ConsentRequest: bad status");
        }
        status = static_cast<ConsentStatus>(raw);
    }
};

/// Informational log of an issued token
struct ActiveConsent {
    static constexpr uint8_t SERIALIZATION_VERSION = 1;

    std::string consentId;
    std::string fingerprint;
    std::string companyId;
    std::vector<std::string> scope;
    TimestampMs issuedAt{0};
    TimestampMs expiresAt{0};
    /// jti of the token
    std::string tokenId;

    template<typename Stream>
    void Serialize(Stream& s) const {
        s << SERIALIZATION_VERSION;
        s << consentId << fingerprint << companyId << scope << issuedAt << expiresAt << tokenId;
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t version = 0;
        s >> version;
        if (version != SERIALIZATION_VERSION) {
            throw std::ios_base::failure("ActiveConsent: unknown encoding version");
        }
        s >> consentId >> fingerprint >> companyId >> scope >> issuedAt >> expiresAt >> tokenId;
    }
};

struct ApprovalResult {
    std::string token;
    std::string consentId;
    /// Milliseconds since epoch
    TimestampMs expiresAt{0};
    TokenClaims claims;
};

/// Denial reasons, in the order they are checked
namespace reason {
    constexpr const char* MISSING_TOKEN = "missing_token";
    constexpr const char* MALFORMED_TOKEN = "malformed_token";
    constexpr const char* INVALID_SIGNATURE = "invalid_signature";
    constexpr const char* WRONG_ISSUER = "wrong_issuer";
    constexpr const char* TOKEN_EXPIRED = "token_expired";
    constexpr const char* AUDIENCE_MISMATCH = "audience_mismatch";
    constexpr const char* REGISTRY_UNAVAILABLE = "registry_unavailable";
    constexpr const char* IDENTITY_NOT_FOUND = "identity_not_found";
    constexpr const char* IDENTITY_REVOKED = "identity_revoked";
}

struct TokenVerification {
    bool valid{false};
    /// Set when valid
    std::optional<TokenClaims> claims;
    /// Set when not valid
    std::string reason;
};

// ============================================================================
// Consent Service
// ============================================================================

class ConsentService {
public:
    struct Config {
        std::string issuer{DEFAULT_ISSUER};
        std::string modelVersion{DEFAULT_MODEL_VERSION};
        /// Approval needs an owner-signed approve_consent command
        bool requireApprovalProof{false};
    };

    struct Stats {
        uint64_t requested{0};
        uint64_t approved{0};
        uint64_t verified{0};
        uint64_t denied{0};
    };

    /**
     * @param directory Live identity lookups (request, approve, verify)
     * @param registry Consumes approval proofs atomically with the approval
     */
    ConsentService(db::Database& db,
                   const KeyStore& keys,
                   const registry::IdentityDirectory& directory,
                   registry::RegistryStore& registry,
                   const Config& config);

    /**
     * Open a pending request.
     * @return NotFound if the identity is absent or revoked
     */
    Result<ConsentRequest> RequestConsent(const std::string& fingerprint,
                                          const std::string& companyId,
                                          const std::vector<std::string>& scope,
                                          int64_t durationSeconds);

    /**
     * Approve a pending request and mint its token.
     * @param proof Owner-signed approve_consent command; mandatory when
     *              requireApprovalProof is set
     * @return NotFound, RequestNotPending, ConsentMismatch, IdentityRevoked,
     *         or proof errors
     */
    Result<ApprovalResult> ApproveConsent(const std::string& requestId,
                                          const std::string& fingerprint,
                                          const std::optional<registry::OwnershipProof>& proof = std::nullopt);

    /**
     * Check a token: signature, issuer, expiry, optional audience, then a
     * live revocation lookup. Never throws; every failure is a reason.
     */
    TokenVerification VerifyToken(const std::string& token,
                                  const std::optional<std::string>& audience = std::nullopt) const;

    /// Issued consents for a fingerprint, oldest first
    Result<std::vector<ActiveConsent>> ListConsents(const std::string& fingerprint) const;

    Result<ConsentRequest> GetRequest(const std::string& requestId) const;

    const Config& GetConfig() const { return config_; }
    Stats GetStats() const;

private:
    db::Database& db_;
    const KeyStore& keys_;
    const registry::IdentityDirectory& directory_;
    registry::RegistryStore& registry_;
    Config config_;

    /// Serializes approvals so a request is approved at most once
    std::mutex mutex_;

    mutable std::mutex statsMutex_;
    mutable Stats stats_;

    TokenVerification Deny(const char* why) const;
};

} // namespace consent
} // namespace vface

#endif // VFACE_CONSENT_CONSENT_SERVICE_H
