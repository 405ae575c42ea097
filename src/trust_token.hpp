#ifndef MFA_TRUST_TOKEN_HPP
#define MFA_TRUST_TOKEN_HPP

#include "types.hpp"
#include "json_parser.hpp"
#include <string>
#include <string_view>
#include <expected>
#include <chrono>

/**
 * @file trust_token.hpp
 * @brief Signed "remember this device" tokens.
 *
 * Layout: base64url(header).base64url(payload).base64url(HMAC-SHA256) with the
 * claims sub, typ ("device-trust"), iat and exp.
 */

namespace mfa {

enum class token_error {
    token_expired,
    invalid_signature,
    invalid_format,
    invalid_json,
    missing_expiration_claim,
    invalid_claim_format,
    wrong_subject,
    wrong_type,
    json_creation_failed
};

[[nodiscard]] std::string to_string(token_error err);

using claims_map = json::string_map;

class trust_token_service {
public:
    /// @throws config_error if the secret is empty.
    trust_token_service(std::string secret, std::chrono::seconds ttl);
    ~trust_token_service() noexcept;
    trust_token_service(const trust_token_service&) = delete;
    trust_token_service& operator=(const trust_token_service&) = delete;

    /// @brief Base64url HMAC-SHA256 of `data` under the service secret.
    [[nodiscard]] std::string sign(std::string_view data) const;

    /// @brief Mints a token for `user_id`, valid from `now` for the configured lifetime.
    [[nodiscard]] std::expected<std::string, token_error> issue(std::string_view user_id, time_point now) const;

    /**
     * @brief Validates signature, expiry and type of a token.
     * @return The token's claims on success.
     */
    [[nodiscard]] std::expected<claims_map, token_error> verify(std::string_view token, time_point now) const;

    /// @brief verify() plus a check that the token was minted for `user_id`.
    [[nodiscard]] std::expected<claims_map, token_error> verify_for(std::string_view token, std::string_view user_id, time_point now) const;

    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return m_ttl; }

private:
    std::string m_secret;
    const std::chrono::seconds m_ttl;
};

} // namespace mfa

#endif // MFA_TRUST_TOKEN_HPP
