#ifndef MFA_OTP_HPP
#define MFA_OTP_HPP

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace mfa::otp {

/**
 * @brief Generates a fresh random TOTP seed and returns it base32 encoded
 * (RFC 4648 alphabet, no padding for the 20-byte default).
 */
[[nodiscard]] std::string generate_secret(std::size_t bytes);

/**
 * @brief RFC 4226 HOTP: HMAC-SHA1 over the big-endian counter, dynamically
 * truncated to `digits` zero-padded decimal digits.
 * @throws error if the secret is not valid base32.
 */
[[nodiscard]] std::string hotp(std::string_view secret_b32, std::uint64_t counter, unsigned digits);

/// @brief floor(unix_time / period).
[[nodiscard]] std::int64_t time_step(time_point now, std::chrono::seconds period) noexcept;

/// @brief The TOTP code for the step containing `now`.
[[nodiscard]] std::string totp(std::string_view secret_b32, time_point now);

/**
 * @brief Checks `candidate` against steps T-window..T+window around `now`.
 *
 * Each generated code is compared in constant time.
 *
 * @return The matching time step, or std::nullopt when no step matches.
 */
[[nodiscard]] std::optional<std::int64_t> verify_totp(std::string_view secret_b32, std::string_view candidate, time_point now, int window);

/// @brief Uniformly random zero-padded decimal code.
[[nodiscard]] std::string challenge_code(unsigned digits);

/// @brief `count` codes of `length` characters drawn uniformly from [A-Z0-9].
[[nodiscard]] std::vector<std::string> backup_codes(std::size_t count, std::size_t length);

/// @brief Length-checked constant-time comparison.
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Digest handed to the challenge store instead of the plaintext code,
 * bound to the user and method so equal codes never collide across users.
 */
[[nodiscard]] std::string challenge_digest(std::string_view user_id, method m, std::string_view code);

/// @brief `bytes` random bytes, hex encoded. Used for emergency bypass tokens.
[[nodiscard]] std::string random_token(std::size_t bytes);

/// @brief Digest under which a bypass token is stored, bound to the user.
[[nodiscard]] std::string bypass_digest(std::string_view user_id, std::string_view token);

} // namespace mfa::otp

#endif // MFA_OTP_HPP
