// VFACE - Consent Service Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>
#include "vface/consent/consent_service.h"
#include "vface/core/hex.h"
#include "vface/matcher/vector_index.h"

#include <memory>
#include <string>
#include <vector>

namespace vface {
namespace consent {
namespace test {

namespace {

const std::string FP_A(64, 'a');
const std::string FP_B(64, 'b');
const std::string FP_UNKNOWN(64, 'f');

/// Directory whose backend is always down
class UnavailableDirectory : public registry::IdentityDirectory {
public:
    Result<registry::IdentityRecord> GetIdentity(const std::string&) const override {
        return Error(ErrorCode::StorageError, "backend offline");
    }
};

} // namespace

class ConsentServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = db::OpenMemoryDatabase();
        keys_ = KeyStore::CreateEphemeral();
        cipher_ = std::make_unique<registry::VectorCipher>(*keys_);
        chain_ = std::make_unique<chain::HashChain>(*db_, *keys_, chain::HashChain::Config{});
        index_ = std::make_unique<matcher::LinearScanIndex>(*cipher_,
                                                            matcher::LinearScanIndex::Config{});
        registry_ = std::make_unique<registry::RegistryStore>(
            *db_, *cipher_, *chain_, *index_, registry::RegistryStore::Config{});
        MakeService(ConsentService::Config{});

        owner_ = PrivateKey::Generate();
        RegisterIdentity(FP_A);
        RegisterIdentity(FP_B);
    }

    void MakeService(const ConsentService::Config& config) {
        service_ = std::make_unique<ConsentService>(*db_, *keys_, *registry_, *registry_, config);
    }

    void RegisterIdentity(const std::string& fingerprint) {
        registry::RegisterRequest request;
        request.fingerprint = fingerprint;
        request.ownerKey = owner_.GetPublicKey().ToHex();
        ASSERT_TRUE(registry_->Register(request));
    }

    void RevokeIdentity(const std::string& fingerprint) {
        registry::RevokeCommand cmd;
        cmd.fingerprint = fingerprint;
        cmd.timestamp = GetTime();
        cmd.nonce = "revoke-" + fingerprint.substr(0, 8);
        ASSERT_TRUE(registry_->Revoke(fingerprint, registry::SignCommand(owner_, cmd)));
    }

    ConsentRequest Request(const std::string& fingerprint = FP_A,
                           const std::string& company = "acme") {
        auto request = service_->RequestConsent(fingerprint, company, {"verify"}, 3600);
        EXPECT_TRUE(request) << request.GetError().ToString();
        return request.Value();
    }

    /// Claims a freshly approved token would carry
    TokenClaims BaseClaims(const std::string& fingerprint = FP_A) {
        TokenClaims claims;
        claims.issuer = DEFAULT_ISSUER;
        claims.subject = owner_.GetPublicKey().ToHex();
        claims.audience = "acme";
        claims.fingerprint = fingerprint;
        claims.scope = {"verify"};
        claims.modelVersion = DEFAULT_MODEL_VERSION;
        claims.issuedAt = GetTime();
        claims.expiresAt = GetTime() + 600;
        claims.tokenId = "jti-1";
        return claims;
    }

    std::string Sign(const TokenClaims& claims) {
        return EncodeToken(claims, keys_->SigningKey().GetPrivateKey());
    }

    registry::OwnershipProof ApproveProof(const std::string& requestId,
                                          const std::string& nonce,
                                          const std::string& fingerprint = FP_A) {
        registry::ApproveConsentCommand cmd;
        cmd.fingerprint = fingerprint;
        cmd.requestId = requestId;
        cmd.timestamp = GetTime();
        cmd.nonce = nonce;
        return registry::SignCommand(owner_, cmd);
    }

    std::unique_ptr<db::Database> db_;
    std::unique_ptr<KeyStore> keys_;
    std::unique_ptr<registry::VectorCipher> cipher_;
    std::unique_ptr<chain::HashChain> chain_;
    std::unique_ptr<matcher::LinearScanIndex> index_;
    std::unique_ptr<registry::RegistryStore> registry_;
    std::unique_ptr<ConsentService> service_;
    PrivateKey owner_;
};

// ============================================================================
// Tokens
// ============================================================================

TEST_F(ConsentServiceTest, TokenEncoding) {
    TokenClaims claims = BaseClaims();
    std::string token = Sign(claims);

    size_t dot = token.find('.');
    ASSERT_NE(dot, std::string::npos);
    EXPECT_EQ(Base64UrlDecode(token.substr(0, dot)).value_or(""), TOKEN_HEADER);

    TokenClaims decoded;
    ASSERT_EQ(DecodeToken(token, keys_->SigningKey().GetPublicKey(), decoded),
              TokenDecodeStatus::Ok);
    EXPECT_EQ(decoded.subject, claims.subject);
    EXPECT_EQ(decoded.scope, claims.scope);
    EXPECT_EQ(decoded.expiresAt, claims.expiresAt);
    EXPECT_EQ(decoded.tokenId, "jti-1");

    TokenClaims untouched;
    EXPECT_EQ(DecodeToken(token, PrivateKey::Generate().GetPublicKey(), untouched),
              TokenDecodeStatus::BadSignature);
    EXPECT_TRUE(untouched.issuer.empty());

    EXPECT_EQ(DecodeToken("a.b", keys_->SigningKey().GetPublicKey(), untouched),
              TokenDecodeStatus::Malformed);
    EXPECT_EQ(DecodeToken(token + ".x", keys_->SigningKey().GetPublicKey(), untouched),
              TokenDecodeStatus::Malformed);
}

TEST_F(ConsentServiceTest, ClaimsRequireEveryField) {
    util::JSONValue json = BaseClaims().ToJSON();
    ASSERT_TRUE(TokenClaims::FromJSON(json).has_value());

    util::JSONValue::Object obj = json.GetObject();
    obj.erase("jti");
    EXPECT_FALSE(TokenClaims::FromJSON(util::JSONValue(obj)).has_value());

    obj = json.GetObject();
    obj["exp"] = "soon";
    EXPECT_FALSE(TokenClaims::FromJSON(util::JSONValue(obj)).has_value());

    obj = json.GetObject();
    obj["vf_scope"] = util::JSONValue(util::JSONValue::Array{util::JSONValue(1)});
    EXPECT_FALSE(TokenClaims::FromJSON(util::JSONValue(obj)).has_value());
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ConsentServiceTest, RequestApproveVerify) {
    ConsentRequest request = Request();
    EXPECT_EQ(request.status, ConsentStatus::Pending);
    EXPECT_EQ(request.requestId.size(), 36u);

    auto approval = service_->ApproveConsent(request.requestId, FP_A);
    ASSERT_TRUE(approval) << approval.GetError().ToString();
    EXPECT_EQ(approval->claims.audience, "acme");
    EXPECT_EQ(approval->claims.subject, owner_.GetPublicKey().ToHex());
    EXPECT_EQ(approval->claims.expiresAt - approval->claims.issuedAt, 3600);
    EXPECT_EQ(approval->claims.modelVersion, DEFAULT_MODEL_VERSION);

    auto verified = service_->VerifyToken(approval->token, std::string("acme"));
    EXPECT_TRUE(verified.valid) << verified.reason;
    ASSERT_TRUE(verified.claims.has_value());
    EXPECT_EQ(verified.claims->fingerprint, FP_A);
    EXPECT_EQ(verified.claims->scope, std::vector<std::string>{"verify"});

    auto stored = service_->GetRequest(request.requestId);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->status, ConsentStatus::Approved);

    auto again = service_->ApproveConsent(request.requestId, FP_A);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.GetError().Code(), ErrorCode::RequestNotPending);

    auto consents = service_->ListConsents(FP_A);
    ASSERT_TRUE(consents);
    ASSERT_EQ(consents->size(), 1u);
    EXPECT_EQ(consents->front().consentId, approval->consentId);
    EXPECT_EQ(consents->front().companyId, "acme");
    EXPECT_EQ(consents->front().expiresAt, approval->expiresAt);

    auto stats = service_->GetStats();
    EXPECT_EQ(stats.requested, 1u);
    EXPECT_EQ(stats.approved, 1u);
    EXPECT_EQ(stats.verified, 1u);
}

TEST_F(ConsentServiceTest, RequestValidation) {
    auto code = [this](const std::string& fp, const std::string& company,
                       const std::vector<std::string>& scope, int64_t duration) {
        auto result = service_->RequestConsent(fp, company, scope, duration);
        EXPECT_FALSE(result);
        return result ? ErrorCode::InvalidArgument : result.GetError().Code();
    };

    EXPECT_EQ(code("bad", "acme", {"verify"}, 3600), ErrorCode::InvalidFingerprint);
    EXPECT_EQ(code(FP_A, "", {"verify"}, 3600), ErrorCode::InvalidArgument);
    EXPECT_EQ(code(FP_A, std::string(MAX_COMPANY_ID_LENGTH + 1, 'c'), {"verify"}, 3600),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(code(FP_A, "acme", {}, 3600), ErrorCode::InvalidArgument);
    EXPECT_EQ(code(FP_A, "acme", {"verify", ""}, 3600), ErrorCode::InvalidArgument);
    EXPECT_EQ(code(FP_A, "acme", {"verify"}, MIN_CONSENT_DURATION - 1), ErrorCode::InvalidArgument);
    EXPECT_EQ(code(FP_A, "acme", {"verify"}, MAX_CONSENT_DURATION + 1), ErrorCode::InvalidArgument);
    EXPECT_EQ(code(FP_UNKNOWN, "acme", {"verify"}, 3600), ErrorCode::NotFound);

    RevokeIdentity(FP_B);
    EXPECT_EQ(code(FP_B, "acme", {"verify"}, 3600), ErrorCode::NotFound);
}

TEST_F(ConsentServiceTest, ApproveChecks) {
    auto missing = service_->ApproveConsent("no-such-request", FP_A);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.GetError().Code(), ErrorCode::NotFound);

    ConsentRequest request = Request(FP_A);
    auto wrongFp = service_->ApproveConsent(request.requestId, FP_B);
    ASSERT_FALSE(wrongFp);
    EXPECT_EQ(wrongFp.GetError().Code(), ErrorCode::ConsentMismatch);

    RevokeIdentity(FP_A);
    auto revoked = service_->ApproveConsent(request.requestId, FP_A);
    ASSERT_FALSE(revoked);
    EXPECT_EQ(revoked.GetError().Code(), ErrorCode::IdentityRevoked);
    EXPECT_EQ(service_->GetRequest(request.requestId)->status, ConsentStatus::Pending);
}

// ============================================================================
// Verification
// ============================================================================

TEST_F(ConsentServiceTest, DenialReasons) {
    EXPECT_EQ(service_->VerifyToken("").reason, reason::MISSING_TOKEN);
    EXPECT_EQ(service_->VerifyToken("not-a-token").reason, reason::MALFORMED_TOKEN);

    TokenClaims claims = BaseClaims();
    std::string foreign = EncodeToken(claims, PrivateKey::Generate());
    EXPECT_EQ(service_->VerifyToken(foreign).reason, reason::INVALID_SIGNATURE);

    TokenClaims wrongIssuer = BaseClaims();
    wrongIssuer.issuer = "https://elsewhere.example";
    EXPECT_EQ(service_->VerifyToken(Sign(wrongIssuer)).reason, reason::WRONG_ISSUER);

    TokenClaims expired = BaseClaims();
    expired.issuedAt = GetTime() - 120;
    expired.expiresAt = GetTime() - 60;
    EXPECT_EQ(service_->VerifyToken(Sign(expired)).reason, reason::TOKEN_EXPIRED);

    std::string good = Sign(BaseClaims());
    EXPECT_EQ(service_->VerifyToken(good, std::string("globex")).reason,
              reason::AUDIENCE_MISMATCH);
    EXPECT_TRUE(service_->VerifyToken(good).valid);

    EXPECT_EQ(service_->VerifyToken(Sign(BaseClaims(FP_UNKNOWN))).reason,
              reason::IDENTITY_NOT_FOUND);

    RevokeIdentity(FP_A);
    auto afterRevoke = service_->VerifyToken(good);
    EXPECT_FALSE(afterRevoke.valid);
    EXPECT_EQ(afterRevoke.reason, reason::IDENTITY_REVOKED);
    EXPECT_FALSE(afterRevoke.claims.has_value());

    EXPECT_GE(service_->GetStats().denied, 8u);
}

TEST_F(ConsentServiceTest, FailsClosedWhenDirectoryIsDown) {
    UnavailableDirectory down;
    ConsentService service(*db_, *keys_, down, *registry_, ConsentService::Config{});

    auto verified = service.VerifyToken(Sign(BaseClaims()));
    EXPECT_FALSE(verified.valid);
    EXPECT_EQ(verified.reason, reason::REGISTRY_UNAVAILABLE);

    auto request = service.RequestConsent(FP_A, "acme", {"verify"}, 3600);
    ASSERT_FALSE(request);
    EXPECT_EQ(request.GetError().Code(), ErrorCode::StorageError);
}

// ============================================================================
// Owner-Signed Approval
// ============================================================================

TEST_F(ConsentServiceTest, ApprovalProofRequired) {
    ConsentService::Config config;
    config.requireApprovalProof = true;
    MakeService(config);

    ConsentRequest request = Request();
    auto unsigned_ = service_->ApproveConsent(request.requestId, FP_A);
    ASSERT_FALSE(unsigned_);
    EXPECT_EQ(unsigned_.GetError().Code(), ErrorCode::NotOwner);

    auto mismatched = service_->ApproveConsent(request.requestId, FP_A,
                                               ApproveProof("other-request", "nonce-mismatch"));
    ASSERT_FALSE(mismatched);
    EXPECT_EQ(mismatched.GetError().Code(), ErrorCode::ConsentMismatch);
    EXPECT_EQ(service_->GetRequest(request.requestId)->status, ConsentStatus::Pending);

    auto approved = service_->ApproveConsent(request.requestId, FP_A,
                                             ApproveProof(request.requestId, "nonce-approve"));
    ASSERT_TRUE(approved) << approved.GetError().ToString();
    EXPECT_TRUE(service_->VerifyToken(approved->token).valid);
}

TEST_F(ConsentServiceTest, ApprovalProofNonceIsConsumed) {
    ConsentRequest first = Request();
    ConsentRequest second = Request();

    ASSERT_TRUE(service_->ApproveConsent(first.requestId, FP_A,
                                         ApproveProof(first.requestId, "nonce-shared")));

    auto replay = service_->ApproveConsent(second.requestId, FP_A,
                                           ApproveProof(second.requestId, "nonce-shared"));
    ASSERT_FALSE(replay);
    EXPECT_EQ(replay.GetError().Code(), ErrorCode::ReplayDetected);
}

TEST_F(ConsentServiceTest, ApprovalProofFromStranger) {
    ConsentRequest request = Request();
    registry::ApproveConsentCommand cmd;
    cmd.fingerprint = FP_A;
    cmd.requestId = request.requestId;
    cmd.timestamp = GetTime();
    cmd.nonce = "nonce-stranger";

    auto result = service_->ApproveConsent(request.requestId, FP_A,
                                           registry::SignCommand(PrivateKey::Generate(), cmd));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.GetError().Code(), ErrorCode::NotOwner);
}

} // namespace test
} // namespace consent
} // namespace vface
