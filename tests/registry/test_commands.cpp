// VFACE - Signed Owner Command Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>
#include "vface/registry/commands.h"
#include "vface/registry/identity.h"

#include <string>

namespace vface {
namespace registry {
namespace test {

namespace {

const std::string FP(64, 'a');

RevokeCommand MakeRevoke(Timestamp ts = 1700000000, const std::string& nonce = "nonce-0001") {
    RevokeCommand cmd;
    cmd.fingerprint = FP;
    cmd.timestamp = ts;
    cmd.nonce = nonce;
    return cmd;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(CommandParseTest, Revoke) {
    std::string message = "{\"action\":\"revoke\",\"fingerprint\":\"" + FP +
                          "\",\"timestamp\":1700000000,\"nonce\":\"abcdEFGH_-12\"}";
    auto parsed = ParseSignedCommand(message);
    ASSERT_TRUE(parsed) << parsed.GetError().ToString();

    const auto* revoke = std::get_if<RevokeCommand>(&parsed.Value());
    ASSERT_NE(revoke, nullptr);
    EXPECT_EQ(revoke->fingerprint, FP);
    EXPECT_EQ(revoke->timestamp, 1700000000);
    EXPECT_EQ(revoke->nonce, "abcdEFGH_-12");
    EXPECT_EQ(CommandAction(parsed.Value()), "revoke");
}

TEST(CommandParseTest, ApproveConsent) {
    std::string message = "{\"nonce\":\"12345678\",\"timestamp\":1700000000.0,"
                          "\"request_id\":\"req-1\",\"fingerprint\":\"" + FP +
                          "\",\"action\":\"approve_consent\"}";
    auto parsed = ParseSignedCommand(message);
    ASSERT_TRUE(parsed) << parsed.GetError().ToString();

    const auto* approve = std::get_if<ApproveConsentCommand>(&parsed.Value());
    ASSERT_NE(approve, nullptr);
    EXPECT_EQ(approve->requestId, "req-1");
    EXPECT_EQ(CommandTimestamp(parsed.Value()), 1700000000);
    EXPECT_EQ(CommandFingerprint(parsed.Value()), FP);
    EXPECT_EQ(CommandNonce(parsed.Value()), "12345678");
}

TEST(CommandParseTest, StructuralErrors) {
    auto expectMalformed = [](const std::string& message) {
        auto parsed = ParseSignedCommand(message);
        ASSERT_FALSE(parsed) << message;
        EXPECT_EQ(parsed.GetError().Code(), ErrorCode::MalformedCommand) << message;
    };

    std::string tail = ",\"timestamp\":1700000000,\"nonce\":\"abcdefgh\"}";
    expectMalformed("");
    expectMalformed("not json");
    expectMalformed("[1,2]");
    expectMalformed("{\"action\":\"burn\",\"fingerprint\":\"" + FP + "\"" + tail);
    expectMalformed("{\"action\":\"revoke\",\"fingerprint\":\"" + std::string(64, 'A') + "\"" + tail);
    expectMalformed("{\"action\":\"revoke\",\"fingerprint\":\"abc\"" + tail);
    expectMalformed("{\"action\":\"revoke\",\"fingerprint\":\"" + FP +
                    "\",\"timestamp\":1.5,\"nonce\":\"abcdefgh\"}");
    expectMalformed("{\"action\":\"revoke\",\"fingerprint\":\"" + FP +
                    "\",\"timestamp\":\"1700000000\",\"nonce\":\"abcdefgh\"}");
    expectMalformed("{\"action\":\"revoke\",\"fingerprint\":\"" + FP +
                    "\",\"nonce\":\"abcdefgh\"}");
    expectMalformed("{\"action\":\"revoke\",\"fingerprint\":\"" + FP +
                    "\",\"timestamp\":1700000000,\"nonce\":\"short\"}");
    expectMalformed("{\"action\":\"revoke\",\"fingerprint\":\"" + FP +
                    "\",\"timestamp\":1700000000,\"nonce\":\"has space\"}");
    expectMalformed("{\"action\":\"approve_consent\",\"fingerprint\":\"" + FP + "\"" + tail);
    expectMalformed("{\"action\":\"revoke\",\"fingerprint\":\"" + FP + "\",\"pad\":\"" +
                    std::string(MAX_COMMAND_SIZE, 'x') + "\"" + tail);
}

TEST(CommandParseTest, NonceRules) {
    EXPECT_TRUE(IsValidNonce("abcdefgh"));
    EXPECT_TRUE(IsValidNonce(std::string(MAX_NONCE_LENGTH, 'z')));
    EXPECT_FALSE(IsValidNonce(std::string(MAX_NONCE_LENGTH + 1, 'z')));
    EXPECT_FALSE(IsValidNonce("abcdefg"));
    EXPECT_FALSE(IsValidNonce("abcdefg!"));
    EXPECT_FALSE(IsValidNonce(""));
}

// ============================================================================
// Signatures
// ============================================================================

TEST(CommandSignatureTest, BuildMessageIsParseable) {
    ApproveConsentCommand approve;
    approve.fingerprint = FP;
    approve.requestId = "r\"1";
    approve.timestamp = 42;
    approve.nonce = "abcdefgh";

    std::string message = BuildCommandMessage(approve);
    EXPECT_EQ(message, "{\"action\":\"approve_consent\",\"fingerprint\":\"" + FP +
                       "\",\"request_id\":\"r\\\"1\",\"timestamp\":42,\"nonce\":\"abcdefgh\"}");

    auto parsed = ParseSignedCommand(message);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(std::get<ApproveConsentCommand>(parsed.Value()).requestId, "r\"1");
}

TEST(CommandSignatureTest, SignAndVerify) {
    PrivateKey owner = PrivateKey::Generate();
    std::string ownerHex = owner.GetPublicKey().ToHex();

    OwnershipProof proof = SignCommand(owner, MakeRevoke());
    EXPECT_TRUE(VerifyOwnershipSignature(ownerHex, proof));

    PrivateKey other = PrivateKey::Generate();
    EXPECT_FALSE(VerifyOwnershipSignature(other.GetPublicKey().ToHex(), proof));
}

TEST(CommandSignatureTest, MessageIsVerifiedVerbatim) {
    PrivateKey owner = PrivateKey::Generate();
    std::string ownerHex = owner.GetPublicKey().ToHex();
    OwnershipProof proof = SignCommand(owner, MakeRevoke());

    // Semantically equal JSON with different whitespace no longer matches
    OwnershipProof spaced = proof;
    spaced.message.insert(1, " ");
    ASSERT_TRUE(ParseSignedCommand(spaced.message));
    EXPECT_FALSE(VerifyOwnershipSignature(ownerHex, spaced));
}

TEST(CommandSignatureTest, GarbageInputs) {
    PrivateKey owner = PrivateKey::Generate();
    OwnershipProof proof = SignCommand(owner, MakeRevoke());

    EXPECT_FALSE(VerifyOwnershipSignature("not-hex", proof));
    EXPECT_FALSE(VerifyOwnershipSignature("02" + std::string(64, '0'), proof));

    OwnershipProof badSig = proof;
    badSig.signature = "zz";
    EXPECT_FALSE(VerifyOwnershipSignature(owner.GetPublicKey().ToHex(), badSig));
    badSig.signature = "";
    EXPECT_FALSE(VerifyOwnershipSignature(owner.GetPublicKey().ToHex(), badSig));
    badSig.signature = "3006020101020101";
    EXPECT_FALSE(VerifyOwnershipSignature(owner.GetPublicKey().ToHex(), badSig));
}

// ============================================================================
// Commitments
// ============================================================================

TEST(CommitmentTest, KnownValue) {
    // SHA256("abc")
    EXPECT_EQ(ComputeCommitment("a", "bc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(ComputeCommitment("", "abc"), ComputeCommitment("ab", "c"));
    EXPECT_NE(ComputeCommitment("", "abc"), ComputeCommitment("", "abd"));
}

} // namespace test
} // namespace registry
} // namespace vface
