#ifndef MFA_CONFIG_HPP
#define MFA_CONFIG_HPP

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <cstddef>

/**
 * @file config.hpp
 * @brief Process-wide MFA configuration, read once at startup from the environment.
 *
 * - MFA_ENCRYPTION_KEY: 64 hex characters, the vault key (required).
 * - MFA_TRUST_SECRET: HMAC key for device-trust tokens, at least 32 bytes (required).
 * - MFA_ISSUER, MFA_MAX_ATTEMPTS, MFA_LOCKOUT_SECONDS, MFA_BACKUP_CODE_COUNT,
 *   MFA_CHALLENGE_TTL_SECONDS, MFA_DAILY_CHALLENGE_LIMIT, MFA_TRUST_DEVICE_DAYS,
 *   MFA_TOTP_REPLAY_PROTECTION, MFA_REQUIRED_ROLES, MFA_BYPASS_TTL_SECONDS,
 *   MFA_ADMIN_ROLES: tunables with defaults.
 */

namespace mfa {

// Wire formats fixed by the provisioning URI and the code shapes.
inline constexpr unsigned totp_digits = 6;
inline constexpr std::chrono::seconds totp_period{30};
inline constexpr int totp_window = 1;
inline constexpr std::size_t totp_secret_bytes = 20;
inline constexpr unsigned challenge_digits = 6;
inline constexpr std::size_t backup_code_length = 8;
inline constexpr std::size_t bypass_token_bytes = 32;

// Sliding window of the daily challenge budget.
inline constexpr std::chrono::hours challenge_budget_window{24};

struct options {
    std::string issuer{"Astral Core"};
    int max_attempts{5};
    std::chrono::seconds lockout_cooldown{900};
    std::size_t backup_code_count{10};
    std::chrono::seconds challenge_ttl{300};
    std::size_t daily_challenge_limit{10};
    std::chrono::hours trust_device_ttl{24 * 30};
    bool totp_replay_protection{true};
    std::vector<std::string> mfa_required_roles{
        "THERAPIST", "CRISIS_COUNSELOR", "ADMIN", "SUPER_ADMIN", "COMPLIANCE_OFFICER"
    };
    std::chrono::seconds bypass_ttl{3600};
    std::vector<std::string> admin_roles{"ADMIN", "SUPER_ADMIN"};

    [[nodiscard]] bool is_mfa_required(std::string_view role) const;
    [[nodiscard]] bool is_admin(std::string_view role) const;
};

struct secrets {
    std::string encryption_key;      // 32 raw bytes
    std::string trust_token_secret;
};

/**
 * @brief Reads the tunables, falling back to the defaults above for unset variables.
 * @throws config_error when a value is present but out of range.
 * @throws env::error when a value is present but not a number.
 */
[[nodiscard]] options load_options();

/**
 * @brief Reads the two process secrets. There is no generated fallback key:
 * a key that changes between restarts makes every stored ciphertext unreadable.
 * @throws config_error when a secret is missing or malformed.
 */
[[nodiscard]] secrets load_secrets();

} // namespace mfa

#endif // MFA_CONFIG_HPP
