#include "test_support.hpp"
#include "verification_manager.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace mfa {
namespace {

class VerificationManagerTest : public testing::service_test {
protected:
    verification_manager& verification() { return service->verification(); }

    attempt_state attempts_of(std::string_view user, method m) {
        const auto row = settings.find_one(user, m);
        return row ? row->attempts : attempt_state{};
    }

    const secret_vault vault{testing::test_vault_key()};
};

// Loses every compare-and-swap, as if another writer always got there first.
class contended_settings_store : public memory_settings_store {
public:
    using memory_settings_store::memory_settings_store;

    bool update_if_unchanged(const mfa_setting&) override {
        ++lost_updates;
        return false;
    }

    int lost_updates{0};
};

// Loses only the first compare-and-swap.
class flaky_settings_store : public memory_settings_store {
public:
    using memory_settings_store::memory_settings_store;

    bool update_if_unchanged(const mfa_setting& setting) override {
        if (!lost_once) {
            lost_once = true;
            return false;
        }
        return memory_settings_store::update_if_unchanged(setting);
    }

    bool lost_once{false};
};

TEST_F(VerificationManagerTest, CurrentTotpCodeVerifies) {
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");

    const auto result = verification().verify("u1", "u1@x.com", method::totp, otp::totp(secret, clock.now()));
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.trust_token.has_value());
    EXPECT_EQ(settings.find_one("u1", method::totp)->last_used, clock.now());

    const auto* success = sink.last("MFA_VERIFICATION_SUCCESS");
    ASSERT_NE(success, nullptr);
    EXPECT_EQ(success->kind, audit::category::verification);
    EXPECT_EQ(success->risk, audit::risk_level::low);
    EXPECT_EQ(success->metadata.at("trustedDevice"), "false");
}

TEST_F(VerificationManagerTest, ReplayedTotpCodeIsRejected) {
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");
    const auto code = otp::totp(secret, clock.now());

    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::totp, code).success);
    EXPECT_FALSE(verification().verify("u1", "u1@x.com", method::totp, code).success);
    EXPECT_EQ(attempts_of("u1", method::totp).failed_attempts, 1);
}

TEST_F(VerificationManagerTest, ReplayIsAcceptedWhenProtectionIsOff) {
    opts.totp_replay_protection = false;
    rebuild();
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");
    const auto code = otp::totp(secret, clock.now());

    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::totp, code).success);
    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::totp, code).success);
}

TEST_F(VerificationManagerTest, TrustedDeviceReceivesAToken) {
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");

    const auto result = verification().verify("u1", "u1@x.com", method::totp, otp::totp(secret, clock.now()), true);
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.trust_token.has_value());

    const auto claims = service->verify_trust_token("u1", *result.trust_token);
    ASSERT_TRUE(claims.has_value());
    EXPECT_EQ(claims->at("sub"), "u1");
    EXPECT_EQ(service->verify_trust_token("patient1", *result.trust_token).error(), token_error::wrong_subject);
    EXPECT_EQ(sink.last("MFA_VERIFICATION_SUCCESS")->metadata.at("trustedDevice"), "true");
}

TEST_F(VerificationManagerTest, FailedAttemptReturnsNoTrustToken) {
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");
    const auto wrong = testing::wrong_totp_code(secret, clock.now());

    const auto result = verification().verify("u1", "u1@x.com", method::totp, wrong, true);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.trust_token.has_value());
    EXPECT_EQ(sink.last("MFA_VERIFICATION_SUCCESS"), nullptr);
    EXPECT_EQ(sink.last("MFA_VERIFICATION_FAILED")->metadata.at("failedAttempts"), "1");
}

TEST_F(VerificationManagerTest, FiveWrongCodesLockTheMethod) {
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");
    const auto wrong = testing::wrong_totp_code(secret, clock.now());

    for (int i = 1; i <= opts.max_attempts; ++i) {
        EXPECT_FALSE(verification().verify("u1", "u1@x.com", method::totp, wrong).success);
    }
    const auto locked_until = clock.now() + opts.lockout_cooldown;
    EXPECT_EQ(attempts_of("u1", method::totp).failed_attempts, 5);
    EXPECT_EQ(sink.count("MFA_VERIFICATION_FAILED"), 5u);
    EXPECT_EQ(sink.last("MFA_VERIFICATION_FAILED")->risk, audit::risk_level::high);
    EXPECT_TRUE(sink.last("MFA_VERIFICATION_FAILED")->metadata.contains("lockedUntil"));

    try {
        (void)verification().verify("u1", "u1@x.com", method::totp, otp::totp(secret, clock.now()));
        FAIL() << "expected locked_error";
    } catch (const locked_error& e) {
        EXPECT_EQ(e.locked_until(), locked_until);
    }
    EXPECT_EQ(sink.count("MFA_VERIFICATION_BLOCKED"), 1u);
    EXPECT_EQ(attempts_of("u1", method::totp).failed_attempts, 5);

    clock.advance(opts.lockout_cooldown);
    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::totp, otp::totp(secret, clock.now())).success);
    EXPECT_EQ(attempts_of("u1", method::totp), attempt_state{});
}

TEST_F(VerificationManagerTest, SuccessResetsTheFailureCounter) {
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");
    const auto wrong = testing::wrong_totp_code(secret, clock.now());
    for (int i = 0; i < opts.max_attempts - 1; ++i) {
        EXPECT_FALSE(verification().verify("u1", "u1@x.com", method::totp, wrong).success);
    }
    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::totp, otp::totp(secret, clock.now())).success);
    EXPECT_EQ(attempts_of("u1", method::totp).failed_attempts, 0);
}

TEST_F(VerificationManagerTest, MethodMustBeEnabled) {
    EXPECT_THROW((void)verification().verify("u1", "u1@x.com", method::totp, "123456"), not_found_error);

    [[maybe_unused]] const auto setup = service->enrollment().setup_totp("u1", "u1@x.com");
    EXPECT_THROW((void)verification().verify("u1", "u1@x.com", method::totp, "123456"), not_found_error);
}

TEST_F(VerificationManagerTest, MalformedCodesAreValidationErrors) {
    [[maybe_unused]] const auto enabled = enable_totp("u1", "u1@x.com");

    EXPECT_THROW((void)verification().verify("u1", "u1@x.com", method::totp, "1234567"), validation_error);
    EXPECT_THROW((void)verification().verify("u1", "u1@x.com", method::backup_code, "AB12CD3!"), validation_error);
    EXPECT_THROW((void)verification().verify("u1", "u1@x.com", method::backup_code, "AB12CD3"), validation_error);
    EXPECT_EQ(attempts_of("u1", method::totp).failed_attempts, 0);
    EXPECT_EQ(attempts_of("u1", method::backup_code).failed_attempts, 0);
}

TEST_F(VerificationManagerTest, BackupCodesAcceptLowerCaseEntry) {
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");
    std::string typed = codes[0];
    std::ranges::transform(typed, typed.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::backup_code, typed).success);
    EXPECT_EQ(settings.find_one("u1", method::backup_code)->backup_codes.size(), opts.backup_code_count - 1);
    EXPECT_FALSE(verification().verify("u1", "u1@x.com", method::backup_code, codes[0]).success);
}

TEST_F(VerificationManagerTest, BackupCodesAreSingleUse) {
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");
    ASSERT_EQ(codes.size(), opts.backup_code_count);

    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::backup_code, codes[0]).success);
    EXPECT_EQ(sink.last("MFA_VERIFICATION_SUCCESS")->metadata.at("backupCodesRemaining"), "9");
    EXPECT_EQ(settings.find_one("u1", method::backup_code)->backup_codes.size(), 9u);

    EXPECT_FALSE(verification().verify("u1", "u1@x.com", method::backup_code, codes[0]).success);
    EXPECT_EQ(attempts_of("u1", method::backup_code).failed_attempts, 1);

    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::backup_code, codes[1]).success);
    EXPECT_EQ(settings.find_one("u1", method::backup_code)->backup_codes.size(), 8u);
}

TEST_F(VerificationManagerTest, TotpNeedsNoChallenge) {
    [[maybe_unused]] const auto enabled = enable_totp("u1", "u1@x.com");
    const auto before = sink.events.size();

    EXPECT_NO_THROW(verification().send_challenge("u1", "u1@x.com", method::totp));
    EXPECT_TRUE(delivery.sms.empty());
    EXPECT_TRUE(delivery.email.empty());
    EXPECT_EQ(sink.events.size(), before);
}

TEST_F(VerificationManagerTest, BackupCodesHaveNoChallenge) {
    EXPECT_THROW(verification().send_challenge("u1", "u1@x.com", method::backup_code), unsupported_method_error);
}

TEST_F(VerificationManagerTest, ChallengeNeedsASetup) {
    EXPECT_THROW(verification().send_challenge("u1", "u1@x.com", method::sms), not_found_error);
}

TEST_F(VerificationManagerTest, SmsChallengeVerifiesOnce) {
    enable_sms("u1", "u1@x.com", "+15551234567");

    verification().send_challenge("u1", "u1@x.com", method::sms);
    ASSERT_EQ(delivery.sms.size(), 2u);
    EXPECT_EQ(delivery.sms.back().destination, "+15551234567");
    const auto* sent = sink.last("MFA_CHALLENGE_SENT");
    ASSERT_NE(sent, nullptr);
    EXPECT_EQ(sent->metadata.at("destination"), "+1555123****");
    EXPECT_EQ(sent->risk, audit::risk_level::low);

    const auto code = delivery.sms.back().code;
    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::sms, code).success);
    EXPECT_FALSE(verification().verify("u1", "u1@x.com", method::sms, code).success);
}

TEST_F(VerificationManagerTest, NewChallengeSupersedesTheOpenOne) {
    enable_sms("u1", "u1@x.com", "+15551234567");
    verification().send_challenge("u1", "u1@x.com", method::sms);
    const auto first = delivery.sms.back().code;
    verification().send_challenge("u1", "u1@x.com", method::sms);
    const auto second = delivery.sms.back().code;

    if (first != second) {
        EXPECT_FALSE(verification().verify("u1", "u1@x.com", method::sms, first).success);
    }
    EXPECT_TRUE(verification().verify("u1", "u1@x.com", method::sms, second).success);
}

TEST_F(VerificationManagerTest, ChallengeExpiresAfterItsLifetime) {
    enable_sms("u1", "u1@x.com", "+15551234567");
    verification().send_challenge("u1", "u1@x.com", method::sms);
    clock.advance(opts.challenge_ttl + std::chrono::seconds{1});

    EXPECT_FALSE(verification().verify("u1", "u1@x.com", method::sms, delivery.sms.back().code).success);
}

TEST_F(VerificationManagerTest, EmailChallengeGoesToTheGivenAddress) {
    [[maybe_unused]] const auto setup = service->enrollment().setup_email("u1", "alice@example.com");
    ASSERT_TRUE(service->enrollment().verify_setup("u1", "alice@example.com", method::email, delivery.email.back().code).success);

    verification().send_challenge("u1", "alice@example.com", method::email);
    ASSERT_EQ(delivery.email.size(), 2u);
    EXPECT_EQ(delivery.email.back().destination, "alice@example.com");
    EXPECT_EQ(sink.last("MFA_CHALLENGE_SENT")->metadata.at("destination"), "al***@example.com");
    EXPECT_TRUE(verification().verify("u1", "alice@example.com", method::email, delivery.email.back().code).success);
}

TEST_F(VerificationManagerTest, DailyChallengeBudgetIsEnforced) {
    opts.daily_challenge_limit = 3;
    rebuild();
    enable_sms("u1", "u1@x.com", "+15551234567");   // first challenge of the day

    verification().send_challenge("u1", "u1@x.com", method::sms);
    verification().send_challenge("u1", "u1@x.com", method::sms);
    EXPECT_THROW(verification().send_challenge("u1", "u1@x.com", method::sms), rate_limit_error);
    EXPECT_EQ(delivery.sms.size(), 3u);

    const auto* limited = sink.last("MFA_CHALLENGE_RATE_LIMITED");
    ASSERT_NE(limited, nullptr);
    EXPECT_EQ(limited->risk, audit::risk_level::high);
    EXPECT_EQ(limited->metadata.at("issuedLast24h"), "3");

    clock.advance(std::chrono::hours{24} + std::chrono::seconds{1});
    EXPECT_NO_THROW(verification().send_challenge("u1", "u1@x.com", method::sms));
}

TEST_F(VerificationManagerTest, PatientMayDisableTheLastFactor) {
    [[maybe_unused]] const auto enabled = enable_totp("patient1", "p@x.com");

    verification().disable("patient1", "p@x.com", method::totp);
    EXPECT_EQ(service->method_status("patient1", method::totp), status::disabled);
    const auto backup = settings.find_one("patient1", method::backup_code);
    ASSERT_TRUE(backup.has_value());
    EXPECT_EQ(backup->state, status::disabled);
    EXPECT_TRUE(backup->backup_codes.empty());

    const auto* disabled = sink.last("MFA_DISABLED");
    ASSERT_NE(disabled, nullptr);
    EXPECT_EQ(disabled->kind, audit::category::disablement);
    EXPECT_EQ(disabled->risk, audit::risk_level::high);
    EXPECT_EQ(disabled->metadata.at("disabledByAdmin"), "false");
    EXPECT_EQ(disabled->metadata.at("backupCodesDisabled"), "true");
}

TEST_F(VerificationManagerTest, BackupCodesSurviveWhileAPrimaryFactorRemains) {
    [[maybe_unused]] const auto enabled = enable_totp("patient1", "p@x.com");
    enable_sms("patient1", "p@x.com", "+15551234567");

    verification().disable("patient1", "p@x.com", method::sms);
    EXPECT_EQ(service->method_status("patient1", method::sms), status::disabled);
    EXPECT_EQ(service->method_status("patient1", method::totp), status::enabled);
    EXPECT_EQ(service->method_status("patient1", method::backup_code), status::enabled);
    EXPECT_EQ(sink.last("MFA_DISABLED")->metadata.at("backupCodesDisabled"), "false");
}

TEST_F(VerificationManagerTest, RequiredRoleCannotSelfDisable) {
    [[maybe_unused]] const auto enabled = enable_totp("u1", "u1@x.com");

    EXPECT_THROW(verification().disable("u1", "u1@x.com", method::totp), permission_error);
    EXPECT_EQ(service->method_status("u1", method::totp), status::enabled);

    const auto* denied = sink.last("MFA_DISABLE_DENIED");
    ASSERT_NE(denied, nullptr);
    EXPECT_EQ(denied->risk, audit::risk_level::high);
    EXPECT_EQ(denied->metadata.at("role"), "THERAPIST");
    EXPECT_EQ(sink.count("MFA_DISABLED"), 0u);
}

TEST_F(VerificationManagerTest, AdministratorMayDisableARequiredRole) {
    [[maybe_unused]] const auto enabled = enable_totp("u1", "u1@x.com");

    verification().disable("u1", "u1@x.com", method::totp, "admin1");
    EXPECT_EQ(service->method_status("u1", method::totp), status::disabled);

    const auto* disabled = sink.last("MFA_DISABLED");
    ASSERT_NE(disabled, nullptr);
    EXPECT_EQ(disabled->metadata.at("disabledByAdmin"), "true");
    EXPECT_EQ(disabled->metadata.at("actingAdminId"), "admin1");
}

TEST_F(VerificationManagerTest, DisableNeedsAKnownUserAndAStoredMethod) {
    EXPECT_THROW(verification().disable("ghost", "g@x.com", method::totp), not_found_error);
    EXPECT_THROW(verification().disable("patient1", "p@x.com", method::sms), not_found_error);
}

TEST_F(VerificationManagerTest, TamperedSecretIsAnIntegrityIncident) {
    const auto [secret, codes] = enable_totp("u1", "u1@x.com");
    auto row = settings.find_one("u1", method::totp);
    ASSERT_TRUE(row.has_value());
    auto& stored = std::get<totp_factor>(row->details).secret;
    stored[3] = stored[3] == 'A' ? 'B' : 'A';   // first nonce character
    ASSERT_TRUE(settings.update_if_unchanged(*row));

    EXPECT_THROW((void)verification().verify("u1", "u1@x.com", method::totp, otp::totp(secret, clock.now())), integrity_error);
    const auto* incident = sink.last("MFA_INTEGRITY_FAILURE");
    ASSERT_NE(incident, nullptr);
    EXPECT_EQ(incident->risk, audit::risk_level::critical);
    EXPECT_EQ(incident->metadata.at("mfaMethod"), "TOTP");
    EXPECT_EQ(attempts_of("u1", method::totp).failed_attempts, 0);
}

TEST_F(VerificationManagerTest, EndlessContentionIsAConflict) {
    contended_settings_store contended{clock.fn()};
    const auto secret = otp::generate_secret(totp_secret_bytes);
    mfa_setting row;
    row.user_id = "u1";
    row.details = totp_factor{vault.encrypt(secret), std::nullopt};
    row.state = status::enabled;
    [[maybe_unused]] const auto stored = contended.upsert(row);

    mfa_service contended_service{opts, testing::test_secrets(), collaborators{contended, challenges, bypasses, users, delivery, sink}, clock.fn()};
    EXPECT_THROW((void)contended_service.verification().verify("u1", "u1@x.com", method::totp, otp::totp(secret, clock.now())),
                 conflict_error);
    EXPECT_EQ(contended.lost_updates, detail::max_write_attempts);
    EXPECT_EQ(sink.count("MFA_VERIFICATION_SUCCESS"), 0u);
}

TEST_F(VerificationManagerTest, ChallengeVerdictSurvivesALostUpdate) {
    flaky_settings_store flaky{clock.fn()};
    mfa_service flaky_service{opts, testing::test_secrets(), collaborators{flaky, challenges, bypasses, users, delivery, sink}, clock.fn()};

    [[maybe_unused]] const auto setup = flaky_service.enrollment().setup_sms("u1", "u1@x.com", "+15551234567");
    const auto result = flaky_service.enrollment().verify_setup("u1", "u1@x.com", method::sms, delivery.sms.back().code);

    EXPECT_TRUE(flaky.lost_once);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(flaky.find_one("u1", method::sms)->state, status::enabled);
}

} // namespace
} // namespace mfa
