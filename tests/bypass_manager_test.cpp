#include "test_support.hpp"
#include "bypass_manager.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

namespace mfa {
namespace {

class BypassManagerTest : public testing::service_test {
protected:
    bypass_manager& bypass() { return service->bypass(); }
};

TEST_F(BypassManagerTest, GrantedTokenWorksOnce) {
    const auto token = bypass().grant("u1", "u1@x.com", "admin1", "lost phone");
    EXPECT_EQ(token.size(), 2 * bypass_token_bytes);

    const auto* granted = sink.last("MFA_BYPASS_GRANTED");
    ASSERT_NE(granted, nullptr);
    EXPECT_EQ(granted->risk, audit::risk_level::high);
    EXPECT_EQ(granted->metadata.at("approvedBy"), "admin1");
    EXPECT_EQ(granted->metadata.at("reason"), "lost phone");
    EXPECT_EQ(granted->metadata.at("expiresAt"), std::to_string(util::to_unix_seconds(clock.now() + opts.bypass_ttl)));

    EXPECT_TRUE(bypass().redeem("u1", "u1@x.com", token));
    EXPECT_EQ(sink.count("MFA_BYPASS_USED"), 1u);
    EXPECT_FALSE(bypass().redeem("u1", "u1@x.com", token));
    EXPECT_EQ(sink.count("MFA_BYPASS_REJECTED"), 1u);
}

TEST_F(BypassManagerTest, TokenExpiresAfterItsLifetime) {
    const auto token = bypass().grant("u1", "u1@x.com", "admin1", "lost phone");
    clock.advance(opts.bypass_ttl);
    EXPECT_FALSE(bypass().redeem("u1", "u1@x.com", token));
}

TEST_F(BypassManagerTest, NewGrantRevokesTheOpenOne) {
    const auto first = bypass().grant("u1", "u1@x.com", "admin1", "lost phone");
    const auto second = bypass().grant("u1", "u1@x.com", "admin1", "lost phone again");
    EXPECT_NE(first, second);
    EXPECT_FALSE(bypass().redeem("u1", "u1@x.com", first));
    EXPECT_TRUE(bypass().redeem("u1", "u1@x.com", second));
}

TEST_F(BypassManagerTest, TokenIsBoundToTheUser) {
    const auto token = bypass().grant("u1", "u1@x.com", "admin1", "lost phone");
    EXPECT_FALSE(bypass().redeem("patient1", "p@x.com", token));
    EXPECT_TRUE(bypass().redeem("u1", "u1@x.com", token));
}

TEST_F(BypassManagerTest, OnlyAnotherAdministratorCanGrant) {
    EXPECT_THROW((void)bypass().grant("u1", "u1@x.com", "patient1", "lost phone"), permission_error);
    EXPECT_THROW((void)bypass().grant("u1", "u1@x.com", "nobody", "lost phone"), permission_error);
    EXPECT_THROW((void)bypass().grant("admin1", "a@x.com", "admin1", "lost phone"), permission_error);
    EXPECT_EQ(sink.count("MFA_BYPASS_DENIED"), 3u);
    EXPECT_EQ(sink.count("MFA_BYPASS_GRANTED"), 0u);
}

TEST_F(BypassManagerTest, GrantNeedsAKnownUserAndAReason) {
    EXPECT_THROW((void)bypass().grant("nobody", "n@x.com", "admin1", "lost phone"), not_found_error);
    EXPECT_THROW((void)bypass().grant("u1", "u1@x.com", "admin1", ""), validation_error);
}

TEST_F(BypassManagerTest, MalformedTokenIsAValidationError) {
    [[maybe_unused]] const auto token = bypass().grant("u1", "u1@x.com", "admin1", "lost phone");
    EXPECT_THROW((void)bypass().redeem("u1", "u1@x.com", "not-a-token"), validation_error);
    EXPECT_THROW((void)bypass().redeem("u1", "u1@x.com", std::string(2 * bypass_token_bytes, 'A')), validation_error);
    EXPECT_EQ(sink.count("MFA_BYPASS_REJECTED"), 0u);
}

} // namespace
} // namespace mfa
