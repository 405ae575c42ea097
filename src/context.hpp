#ifndef MFA_CONTEXT_HPP
#define MFA_CONTEXT_HPP

#include "types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "secret_vault.hpp"
#include "lockout_policy.hpp"
#include "stores.hpp"
#include "delivery.hpp"
#include "audit.hpp"
#include "trust_token.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <format>

namespace mfa {

/**
 * @brief Everything the managers need, borrowed from the owner (mfa_service or a test).
 * All referenced objects must outlive the managers.
 */
struct context {
    const options& opts;
    const secret_vault& vault;
    const lockout_policy& lockout;
    settings_store& settings;
    challenge_store& challenges;
    bypass_store& bypasses;
    user_directory& users;
    delivery_channel& delivery;
    audit::emitter& audit;
    const trust_token_service& trust_tokens;
    clock_fn clock;
};

namespace detail {

/// @brief How often a read-modify-write is retried after losing the compare-and-swap.
inline constexpr int max_write_attempts = 3;

/**
 * @brief Runs `attempt` until it reports a committed write.
 *
 * `attempt` returns std::optional<R>; std::nullopt means the compare-and-swap
 * lost against a concurrent writer and the whole read-modify-write is redone.
 *
 * @throws conflict_error after max_write_attempts lost races.
 */
template<typename Fn>
auto retry_on_conflict(std::string_view operation, Fn&& attempt) {
    for (int i = 0; i < max_write_attempts; ++i) {
        if (auto result = attempt()) {
            return std::move(*result);
        }
    }
    throw conflict_error(std::format("{}: concurrent update, giving up after {} attempts", operation, max_write_attempts));
}

void emit(const context& ctx, audit::category kind, std::string action, audit::outcome result, audit::risk_level risk,
          std::string description, std::string_view user_id, std::string_view user_email, json::string_map metadata = {});

/**
 * @brief Decrypts a stored ciphertext; an integrity failure is audited at
 * CRITICAL and rethrown.
 */
[[nodiscard]] std::string reveal(const context& ctx, std::string_view ciphertext, std::string_view user_id, std::string_view user_email, method m);

/**
 * @brief Returns the code as it is compared: backup codes are upper-cased.
 * Rejects a code whose shape cannot belong to `m` (validation_error).
 */
[[nodiscard]] std::string normalize_code(method m, std::string_view code);

/**
 * @brief Checks `code` against the factor stored in `row` and applies the
 * side effects of a match to `row` (TOTP step recorded, backup code removed).
 *
 * Challenge codes are consumed in the challenge store, which cannot be undone,
 * so the first verdict is kept in `challenge_verdict` and reused when the
 * caller retries after a lost compare-and-swap.
 */
[[nodiscard]] bool check_code(const context& ctx, mfa_setting& row, std::string_view user_email, std::string_view code,
                              time_point now, std::optional<bool>& challenge_verdict);

/// @brief Refuses (rate_limit_error, audited HIGH) once the daily challenge budget is used up.
void check_challenge_budget(const context& ctx, std::string_view user_id, std::string_view user_email, method m);

/// @brief Generates a challenge code, stores its digest and hands the plaintext to the delivery channel.
void deliver_challenge(const context& ctx, std::string_view user_id, method m, std::string_view destination);

/// @brief "+1555****" or "jo***@example.com".
[[nodiscard]] std::string masked_destination(method m, std::string_view destination);

} // namespace detail
} // namespace mfa

#endif // MFA_CONTEXT_HPP
