#include "otp.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

namespace mfa {
namespace {

// Base32 of the RFC 4226 / RFC 6238 test secret "12345678901234567890".
constexpr std::string_view rfc_secret = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";

TEST(HotpTest, MatchesRfc4226Vectors) {
    const std::array<std::string_view, 10> expected{
        "755224", "287082", "359152", "969429", "338314",
        "254676", "287922", "162583", "399871", "520489"
    };
    for (std::uint64_t counter = 0; counter < expected.size(); ++counter) {
        EXPECT_EQ(otp::hotp(rfc_secret, counter, 6), expected[counter]) << "counter " << counter;
    }
}

TEST(HotpTest, RejectsSecretsThatAreNotBase32) {
    EXPECT_THROW((void)otp::hotp("0189!!", 0, 6), error);
}

TEST(TotpTest, MatchesRfc6238Vectors) {
    EXPECT_EQ(otp::totp(rfc_secret, util::from_unix_seconds(59)), "287082");
    EXPECT_EQ(otp::totp(rfc_secret, util::from_unix_seconds(1111111109)), "081804");
    EXPECT_EQ(otp::totp(rfc_secret, util::from_unix_seconds(1234567890)), "005924");
    EXPECT_EQ(otp::totp(rfc_secret, util::from_unix_seconds(2000000000)), "279037");
}

TEST(TotpTest, IsDeterministicWithinAStep) {
    const auto t = util::from_unix_seconds(1'700'000'010);
    EXPECT_EQ(otp::totp(rfc_secret, t), otp::totp(rfc_secret, t + std::chrono::seconds{29}));
    EXPECT_EQ(otp::time_step(t, totp_period), 1'700'000'010 / 30);
}

TEST(TotpTest, AcceptsOneStepOfSkewEachSide) {
    const auto now = util::from_unix_seconds(1'700'000'010);
    const auto step = otp::time_step(now, totp_period);

    EXPECT_EQ(otp::verify_totp(rfc_secret, otp::totp(rfc_secret, now), now, totp_window), step);
    EXPECT_EQ(otp::verify_totp(rfc_secret, otp::totp(rfc_secret, now - totp_period), now, totp_window), step - 1);
    EXPECT_EQ(otp::verify_totp(rfc_secret, otp::totp(rfc_secret, now + totp_period), now, totp_window), step + 1);
}

TEST(TotpTest, RejectsCodesTwoStepsAway) {
    const auto now = util::from_unix_seconds(1'700'000'010);
    EXPECT_FALSE(otp::verify_totp(rfc_secret, otp::totp(rfc_secret, now - 2 * totp_period), now, totp_window));
    EXPECT_FALSE(otp::verify_totp(rfc_secret, otp::totp(rfc_secret, now + 2 * totp_period), now, totp_window));
}

TEST(TotpTest, RejectsCandidatesOfTheWrongLength) {
    const auto now = util::from_unix_seconds(1'700'000'010);
    const auto code = otp::totp(rfc_secret, now);
    EXPECT_FALSE(otp::verify_totp(rfc_secret, code.substr(0, 5), now, totp_window));
    EXPECT_FALSE(otp::verify_totp(rfc_secret, code + "0", now, totp_window));
    EXPECT_FALSE(otp::verify_totp(rfc_secret, "", now, totp_window));
}

TEST(SecretTest, GeneratesUnpaddedBase32OfTwentyBytes) {
    const auto secret = otp::generate_secret(totp_secret_bytes);
    EXPECT_EQ(secret.size(), 32u);
    EXPECT_TRUE(std::ranges::all_of(secret, [](char c) { return (c >= 'A' && c <= 'Z') || (c >= '2' && c <= '7'); }));
    EXPECT_NE(secret, otp::generate_secret(totp_secret_bytes));
    // The generated secret must be usable by the HOTP implementation.
    EXPECT_EQ(otp::hotp(secret, 0, 6).size(), 6u);
}

TEST(ChallengeCodeTest, IsSixZeroPaddedDigits) {
    for (int i = 0; i < 200; ++i) {
        const auto code = otp::challenge_code(challenge_digits);
        ASSERT_EQ(code.size(), 6u);
        ASSERT_TRUE(std::ranges::all_of(code, [](char c) { return c >= '0' && c <= '9'; })) << code;
    }
}

TEST(BackupCodeTest, BatchHasTheRequestedShape) {
    const auto codes = otp::backup_codes(10, backup_code_length);
    ASSERT_EQ(codes.size(), 10u);
    for (const auto& code : codes) {
        EXPECT_EQ(code.size(), 8u);
        EXPECT_TRUE(std::ranges::all_of(code, [](char c) { return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'); })) << code;
    }
    EXPECT_EQ(std::set<std::string>(codes.begin(), codes.end()).size(), codes.size());
}

TEST(ConstantTimeEqualsTest, ComparesContentAndLength) {
    EXPECT_TRUE(otp::constant_time_equals("123456", "123456"));
    EXPECT_FALSE(otp::constant_time_equals("123456", "123457"));
    EXPECT_FALSE(otp::constant_time_equals("123456", "12345"));
    EXPECT_TRUE(otp::constant_time_equals("", ""));
}

TEST(ChallengeDigestTest, IsBoundToUserAndMethod) {
    const auto digest = otp::challenge_digest("u1", method::sms, "123456");
    EXPECT_EQ(digest.size(), 64u);
    EXPECT_EQ(digest, otp::challenge_digest("u1", method::sms, "123456"));
    EXPECT_NE(digest, otp::challenge_digest("u2", method::sms, "123456"));
    EXPECT_NE(digest, otp::challenge_digest("u1", method::email, "123456"));
    EXPECT_EQ(digest.find("123456"), std::string::npos);
}

TEST(RandomTokenTest, IsLowercaseHexOfTheRequestedLength) {
    const auto token = otp::random_token(32);
    ASSERT_EQ(token.size(), 64u);
    EXPECT_TRUE(std::ranges::all_of(token, [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }));
    EXPECT_NE(token, otp::random_token(32));
    EXPECT_NE(otp::bypass_digest("u1", token), otp::bypass_digest("u2", token));
}

} // namespace
} // namespace mfa
