#ifndef MFA_TYPES_HPP
#define MFA_TYPES_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <chrono>
#include <cstdint>
#include <functional>

namespace mfa {

using time_point = std::chrono::system_clock::time_point;

/// @brief Source of "now" for every time-dependent decision; injectable so tests can move time.
using clock_fn = std::function<time_point()>;

[[nodiscard]] inline time_point system_now() {
    return std::chrono::system_clock::now();
}

enum class method {
    totp,
    sms,
    email,
    backup_code
};

enum class status {
    disabled,
    pending_setup,
    enabled,
    temporarily_disabled
};

[[nodiscard]] std::string_view to_string(method m) noexcept;
[[nodiscard]] std::string_view to_string(status s) noexcept;

/// @brief Parses the upper-case wire names ("TOTP", "SMS", "EMAIL", "BACKUP_CODE").
[[nodiscard]] std::optional<method> parse_method(std::string_view name) noexcept;
[[nodiscard]] std::optional<status> parse_status(std::string_view name) noexcept;

/// @brief TOTP, SMS and EMAIL are primary factors; backup codes only recover them.
[[nodiscard]] constexpr bool is_primary(method m) noexcept {
    return m != method::backup_code;
}

// --- Method-specific payloads ---

struct totp_factor {
    std::string secret;                         // vault ciphertext of the base32 seed
    std::optional<std::int64_t> last_used_step; // replay protection
};

struct sms_factor {
    std::string phone_number;                   // vault ciphertext of the E.164 number
};

struct email_factor {};

struct backup_code_factor {};

using factor = std::variant<totp_factor, sms_factor, email_factor, backup_code_factor>;

[[nodiscard]] method method_of(const factor& f) noexcept;

/// @brief Failure counter and lockout timestamp, the input of lockout_policy.
struct attempt_state {
    int failed_attempts{0};
    std::optional<time_point> locked_until;

    bool operator==(const attempt_state&) const = default;
};

/**
 * @brief One row per (user_id, method).
 *
 * `version` is bumped by the store on every write and is the compare-and-swap
 * token for update_if_unchanged().
 */
struct mfa_setting {
    std::string id;
    std::string user_id;
    factor details;
    status state{status::disabled};
    std::vector<std::string> backup_codes;      // vault ciphertexts, one per code
    attempt_state attempts;
    std::optional<time_point> last_used;
    time_point created_at{};
    time_point updated_at{};
    std::uint64_t version{0};

    [[nodiscard]] method kind() const noexcept { return method_of(details); }
};

} // namespace mfa

#endif // MFA_TYPES_HPP
