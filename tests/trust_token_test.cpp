#include "trust_token.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace mfa {
namespace {

class TrustTokenTest : public ::testing::Test {
protected:
    const trust_token_service tokens{"trust-secret-for-tests-0123456789abcdef", std::chrono::hours{24}};
    const time_point now = util::from_unix_seconds(1'700'000'000);
};

TEST_F(TrustTokenTest, IssuedTokenCarriesTheDeviceTrustClaims) {
    const auto token = tokens.issue("u1", now);
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(std::ranges::count(*token, '.'), 2);

    const auto claims = tokens.verify(*token, now);
    ASSERT_TRUE(claims.has_value());
    EXPECT_EQ(claims->at("sub"), "u1");
    EXPECT_EQ(claims->at("typ"), "device-trust");
    EXPECT_EQ(claims->at("iat"), "1700000000");
    EXPECT_EQ(claims->at("exp"), "1700086400");
}

TEST_F(TrustTokenTest, TokenIsBoundToItsSubject) {
    const auto token = tokens.issue("u1", now);
    ASSERT_TRUE(token.has_value());
    EXPECT_TRUE(tokens.verify_for(*token, "u1", now).has_value());
    EXPECT_EQ(tokens.verify_for(*token, "u2", now).error(), token_error::wrong_subject);
}

TEST_F(TrustTokenTest, TokenExpiresAtItsExpClaim) {
    const auto token = tokens.issue("u1", now);
    ASSERT_TRUE(token.has_value());
    EXPECT_TRUE(tokens.verify(*token, now + std::chrono::hours{24} - std::chrono::seconds{1}).has_value());
    EXPECT_EQ(tokens.verify(*token, now + std::chrono::hours{24}).error(), token_error::token_expired);
}

TEST_F(TrustTokenTest, AlteredPayloadFailsTheSignature) {
    const auto token = tokens.issue("u1", now);
    ASSERT_TRUE(token.has_value());

    const auto other = tokens.issue("u2", now);
    ASSERT_TRUE(other.has_value());
    // u2's payload under u1's signature.
    const auto first_dot = token->find('.');
    const auto last_dot = token->rfind('.');
    const auto other_payload = other->substr(other->find('.'), other->rfind('.') - other->find('.'));
    const auto spliced = token->substr(0, first_dot) + other_payload + token->substr(last_dot);
    EXPECT_EQ(tokens.verify(spliced, now).error(), token_error::invalid_signature);
}

TEST_F(TrustTokenTest, MalformedTokensAreRejected) {
    EXPECT_EQ(tokens.verify("", now).error(), token_error::invalid_format);
    EXPECT_EQ(tokens.verify("no-dots-here", now).error(), token_error::invalid_format);
    EXPECT_EQ(tokens.verify("one.dot", now).error(), token_error::invalid_format);
    EXPECT_EQ(tokens.verify("a.b.c=", now).error(), token_error::invalid_format);
}

TEST_F(TrustTokenTest, SignedTokenOfAnotherTypeIsRejected) {
    const std::string header = "eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9";
    // {"sub":"u1","typ":"access","exp":"1800000000"}
    const std::string payload = "eyJzdWIiOiJ1MSIsInR5cCI6ImFjY2VzcyIsImV4cCI6IjE4MDAwMDAwMDAifQ";
    const std::string signing_input = header + "." + payload;
    EXPECT_EQ(tokens.verify(signing_input + "." + tokens.sign(signing_input), now).error(), token_error::wrong_type);
}

TEST_F(TrustTokenTest, SignedTokenWithoutExpiryIsRejected) {
    const std::string header = "eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9";
    // {"sub":"u1","typ":"device-trust"}
    const std::string payload = "eyJzdWIiOiJ1MSIsInR5cCI6ImRldmljZS10cnVzdCJ9";
    const std::string signing_input = header + "." + payload;
    EXPECT_EQ(tokens.verify(signing_input + "." + tokens.sign(signing_input), now).error(), token_error::missing_expiration_claim);
}

TEST(TrustTokenSecretTest, EmptySecretIsAConfigurationError) {
    EXPECT_THROW((trust_token_service{"", std::chrono::hours{1}}), config_error);
}

TEST(TrustTokenErrorTest, EveryErrorHasAMessage) {
    for (const auto err : {token_error::token_expired, token_error::invalid_signature, token_error::invalid_format,
                           token_error::invalid_json, token_error::missing_expiration_claim, token_error::invalid_claim_format,
                           token_error::wrong_subject, token_error::wrong_type, token_error::json_creation_failed}) {
        EXPECT_NE(to_string(err), "unknown token error.");
    }
}

} // namespace
} // namespace mfa
