#include "memory_store.hpp"
#include "test_support.hpp"
#include "config.hpp"
#include <gtest/gtest.h>

namespace mfa {
namespace {

class MemorySettingsStoreTest : public ::testing::Test {
protected:
    static mfa_setting row_for(std::string user, factor details) {
        mfa_setting row;
        row.user_id = std::move(user);
        row.details = std::move(details);
        row.state = status::pending_setup;
        return row;
    }

    testing::manual_clock clock;
    memory_settings_store store{clock.fn()};
};

TEST_F(MemorySettingsStoreTest, UpsertAssignsIdentityAndVersion) {
    const auto first = store.upsert(row_for("u1", totp_factor{"secret-1", std::nullopt}));
    EXPECT_FALSE(first.id.empty());
    EXPECT_EQ(first.version, 1u);
    EXPECT_EQ(first.created_at, clock.now());

    clock.advance(std::chrono::seconds{5});
    const auto second = store.upsert(row_for("u1", totp_factor{"secret-2", std::nullopt}));
    EXPECT_EQ(second.id, first.id);
    EXPECT_EQ(second.version, 2u);
    EXPECT_EQ(second.created_at, first.created_at);
    EXPECT_EQ(second.updated_at, clock.now());
    EXPECT_EQ(std::get<totp_factor>(store.find_one("u1", method::totp)->details).secret, "secret-2");
}

TEST_F(MemorySettingsStoreTest, RowsAreKeyedByUserAndMethod) {
    [[maybe_unused]] const auto a = store.upsert(row_for("u1", totp_factor{"s", std::nullopt}));
    [[maybe_unused]] const auto b = store.upsert(row_for("u1", sms_factor{"p"}));
    [[maybe_unused]] const auto c = store.upsert(row_for("u2", email_factor{}));

    EXPECT_FALSE(store.find_one("u1", method::email).has_value());
    const auto rows = store.find_all("u1");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].kind(), method::totp);
    EXPECT_EQ(rows[1].kind(), method::sms);
    EXPECT_TRUE(store.find_all("nobody").empty());
}

TEST_F(MemorySettingsStoreTest, CompareAndSwapRejectsAStaleVersion) {
    [[maybe_unused]] const auto stored = store.upsert(row_for("u1", totp_factor{"s", std::nullopt}));

    auto mine = *store.find_one("u1", method::totp);
    auto theirs = *store.find_one("u1", method::totp);

    theirs.attempts.failed_attempts = 1;
    ASSERT_TRUE(store.update_if_unchanged(theirs));

    mine.attempts.failed_attempts = 1;
    EXPECT_FALSE(store.update_if_unchanged(mine));

    auto fresh = *store.find_one("u1", method::totp);
    EXPECT_EQ(fresh.version, 2u);
    fresh.attempts.failed_attempts = 2;
    EXPECT_TRUE(store.update_if_unchanged(fresh));
    EXPECT_EQ(store.find_one("u1", method::totp)->attempts.failed_attempts, 2);
}

TEST_F(MemorySettingsStoreTest, CompareAndSwapNeedsAnExistingRow) {
    EXPECT_FALSE(store.update_if_unchanged(row_for("u1", totp_factor{"s", std::nullopt})));
}

class MemoryChallengeStoreTest : public ::testing::Test {
protected:
    testing::manual_clock clock;
    memory_challenge_store store{clock.fn()};
};

TEST_F(MemoryChallengeStoreTest, ChallengeIsConsumedOnce) {
    store.save("u1", method::sms, "hash-1", std::chrono::seconds{300});

    EXPECT_FALSE(store.consume("u1", method::sms, "hash-2"));
    EXPECT_FALSE(store.consume("u1", method::email, "hash-1"));
    EXPECT_TRUE(store.consume("u1", method::sms, "hash-1"));
    EXPECT_FALSE(store.consume("u1", method::sms, "hash-1"));
}

TEST_F(MemoryChallengeStoreTest, ChallengeExpires) {
    store.save("u1", method::email, "hash-1", std::chrono::seconds{300});
    clock.advance(std::chrono::seconds{300});
    EXPECT_FALSE(store.consume("u1", method::email, "hash-1"));
}

TEST_F(MemoryChallengeStoreTest, NewChallengeSupersedesTheOpenOne) {
    store.save("u1", method::sms, "hash-1", std::chrono::seconds{300});
    store.save("u1", method::sms, "hash-2", std::chrono::seconds{300});
    EXPECT_FALSE(store.consume("u1", method::sms, "hash-1"));
    EXPECT_TRUE(store.consume("u1", method::sms, "hash-2"));
}

TEST_F(MemoryChallengeStoreTest, IssuedChallengesAreCountedPerUser) {
    const auto start = clock.now();
    store.save("u1", method::sms, "a", std::chrono::seconds{300});
    clock.advance(std::chrono::hours{1});
    store.save("u1", method::email, "b", std::chrono::seconds{300});
    store.save("u2", method::sms, "c", std::chrono::seconds{300});

    EXPECT_EQ(store.count_issued_since("u1", start), 2u);
    EXPECT_EQ(store.count_issued_since("u1", start + std::chrono::seconds{1}), 1u);
    EXPECT_EQ(store.count_issued_since("u2", start), 1u);
    EXPECT_EQ(store.count_issued_since("u3", start), 0u);
}

TEST_F(MemoryChallengeStoreTest, IssueTimesOutsideTheBudgetWindowAreDropped) {
    const auto start = clock.now();
    store.save("u1", method::sms, "a", std::chrono::seconds{300});
    clock.advance(challenge_budget_window + std::chrono::hours{1});
    store.save("u1", method::sms, "b", std::chrono::seconds{300});

    EXPECT_EQ(store.count_issued_since("u1", start), 1u);
}

class MemoryBypassStoreTest : public ::testing::Test {
protected:
    bypass_grant grant_for(std::string user, std::string hash) {
        return bypass_grant{std::move(user), std::move(hash), "admin1", "lost phone", clock.now() + std::chrono::hours{1}};
    }

    testing::manual_clock clock;
    memory_bypass_store store{clock.fn()};
};

TEST_F(MemoryBypassStoreTest, GrantIsConsumedOnceBeforeItExpires) {
    store.save(grant_for("u1", "h1"));
    EXPECT_FALSE(store.consume("u1", "other"));
    EXPECT_FALSE(store.consume("u2", "h1"));
    EXPECT_TRUE(store.consume("u1", "h1"));
    EXPECT_FALSE(store.consume("u1", "h1"));

    store.save(grant_for("u1", "h2"));
    clock.advance(std::chrono::hours{1});
    EXPECT_FALSE(store.consume("u1", "h2"));
}

TEST_F(MemoryBypassStoreTest, NewGrantReplacesTheOpenOne) {
    store.save(grant_for("u1", "h1"));
    store.save(grant_for("u1", "h2"));
    EXPECT_FALSE(store.consume("u1", "h1"));
    EXPECT_TRUE(store.consume("u1", "h2"));
}

TEST(MemoryUserDirectoryTest, ReportsRoles) {
    memory_user_directory users;
    users.add_user("u1", "THERAPIST");
    EXPECT_EQ(users.role_of("u1"), "THERAPIST");
    EXPECT_FALSE(users.role_of("u2").has_value());

    users.add_user("u1", "ADMIN");
    EXPECT_EQ(users.role_of("u1"), "ADMIN");
}

} // namespace
} // namespace mfa
