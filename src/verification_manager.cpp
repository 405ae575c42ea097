#include "verification_manager.hpp"
#include "util.hpp"
#include "logger.hpp"
#include <algorithm>

namespace mfa {

using detail::emit;

verification_result verification_manager::verify(std::string_view user_id, std::string_view email, method m,
                                                 std::string_view code, bool trust_device) {
    const std::string entered = detail::normalize_code(m, code);

    const std::string method_name{to_string(m)};
    std::optional<bool> challenge_verdict;

    // Issued before the attempt is committed; a failure here leaves the row untouched.
    std::optional<std::string> trust_token;
    if (trust_device) {
        auto minted = m_ctx.trust_tokens.issue(user_id, m_ctx.clock());
        if (!minted) {
            throw error(std::format("device-trust token could not be issued: {}", to_string(minted.error())));
        }
        trust_token = std::move(*minted);
    }

    struct attempt_result {
        bool success;
        attempt_state attempts;
    };

    const auto done = detail::retry_on_conflict("verify", [&]() -> std::optional<attempt_result> {
        const auto row = m_ctx.settings.find_one(user_id, m);
        if (!row || row->state != status::enabled) {
            throw not_found_error(std::format("{} is not enabled for this user", method_name));
        }

        const auto now = m_ctx.clock();
        if (m_ctx.lockout.is_locked(row->attempts, now)) {
            emit(m_ctx, audit::category::failure, "MFA_VERIFICATION_BLOCKED", audit::outcome::failure, audit::risk_level::high,
                 "MFA verification blocked due to account lock", user_id, email,
                 {{"mfaMethod", method_name}, {"lockedUntil", std::to_string(util::to_unix_seconds(*row->attempts.locked_until))}});
            throw locked_error(*row->attempts.locked_until);
        }

        mfa_setting next = *row;
        const bool matched = detail::check_code(m_ctx, next, email, entered, now, challenge_verdict);
        if (matched) {
            next.attempts = m_ctx.lockout.after_success();
            next.last_used = now;
        } else {
            next.attempts = m_ctx.lockout.after_failure(row->attempts, now);
        }

        if (!m_ctx.settings.update_if_unchanged(next)) {
            log::warn("verify for user '{}' lost a concurrent update, retrying", user_id);
            return std::nullopt;
        }
        return attempt_result{matched, next.attempts};
    });

    if (!done.success) {
        json::string_map metadata{{"mfaMethod", method_name}, {"failedAttempts", std::to_string(done.attempts.failed_attempts)}};
        if (done.attempts.locked_until) {
            metadata.emplace("lockedUntil", std::to_string(util::to_unix_seconds(*done.attempts.locked_until)));
            log::warn("{} locked for user '{}' after {} failed attempts", method_name, user_id, done.attempts.failed_attempts);
        }
        emit(m_ctx, audit::category::failure, "MFA_VERIFICATION_FAILED", audit::outcome::failure, audit::risk_level::high,
             "MFA verification failed", user_id, email, std::move(metadata));
        return {};
    }

    verification_result result{true, std::move(trust_token)};

    json::string_map metadata{{"mfaMethod", method_name}, {"trustedDevice", trust_device ? "true" : "false"}};
    if (m == method::backup_code) {
        if (const auto row = m_ctx.settings.find_one(user_id, m)) {
            metadata.emplace("backupCodesRemaining", std::to_string(row->backup_codes.size()));
        }
    }
    emit(m_ctx, audit::category::verification, "MFA_VERIFICATION_SUCCESS", audit::outcome::success, audit::risk_level::low,
         "MFA verification successful", user_id, email, std::move(metadata));
    return result;
}

void verification_manager::send_challenge(std::string_view user_id, std::string_view email, method m) {
    if (m == method::totp) {
        log::debug("no challenge needed for TOTP, user '{}'", user_id);
        return;
    }
    if (m != method::sms && m != method::email) {
        throw unsupported_method_error(std::format("{} does not use challenge codes", to_string(m)));
    }

    const std::string method_name{to_string(m)};
    const auto row = m_ctx.settings.find_one(user_id, m);
    if (!row || (row->state != status::enabled && row->state != status::pending_setup)) {
        throw not_found_error(std::format("{} is not set up for this user", method_name));
    }

    std::string destination;
    if (const auto* sms = std::get_if<sms_factor>(&row->details)) {
        destination = detail::reveal(m_ctx, sms->phone_number, user_id, email, m);
    } else {
        destination = std::string(email);
    }

    detail::check_challenge_budget(m_ctx, user_id, email, m);
    detail::deliver_challenge(m_ctx, user_id, m, destination);

    const auto masked = detail::masked_destination(m, destination);
    emit(m_ctx, audit::category::verification, "MFA_CHALLENGE_SENT", audit::outcome::success, audit::risk_level::low,
         "MFA challenge code sent", user_id, email,
         {{"mfaMethod", method_name}, {"destination", masked}});
    log::info("{} challenge sent to {} for user '{}'", method_name, masked, user_id);
}

void verification_manager::disable(std::string_view user_id, std::string_view email, method m, std::optional<std::string_view> acting_admin_id) {
    const std::string method_name{to_string(m)};
    const auto role = m_ctx.users.role_of(user_id);
    if (!role) {
        throw not_found_error("unknown user");
    }

    if (m_ctx.opts.is_mfa_required(*role) && !acting_admin_id) {
        emit(m_ctx, audit::category::disablement, "MFA_DISABLE_DENIED", audit::outcome::failure, audit::risk_level::high,
             "Self-service MFA disable refused for a role that requires MFA", user_id, email,
             {{"mfaMethod", method_name}, {"role", *role}});
        throw permission_error(std::format("role {} requires MFA; an administrator must disable it", *role));
    }

    disable_row(user_id, m);

    bool backup_disabled = false;
    if (is_primary(m) && !has_enabled_primary(user_id)) {
        if (const auto backup = m_ctx.settings.find_one(user_id, method::backup_code); backup && backup->state != status::disabled) {
            disable_row(user_id, method::backup_code);
            backup_disabled = true;
        }
    }

    json::string_map metadata{
        {"mfaMethod", method_name},
        {"disabledByAdmin", acting_admin_id ? "true" : "false"},
        {"backupCodesDisabled", backup_disabled ? "true" : "false"}
    };
    if (acting_admin_id) {
        metadata.emplace("actingAdminId", std::string(*acting_admin_id));
    }
    emit(m_ctx, audit::category::disablement, "MFA_DISABLED", audit::outcome::success, audit::risk_level::high,
         acting_admin_id ? "MFA disabled by administrator" : "MFA disabled by user", user_id, email, std::move(metadata));
    log::info("{} disabled for user '{}'{}", method_name, user_id,
              acting_admin_id ? std::format(" by admin '{}'", *acting_admin_id) : std::string{});
}

void verification_manager::disable_row(std::string_view user_id, method m) {
    detail::retry_on_conflict("disable", [&]() -> std::optional<bool> {
        auto row = m_ctx.settings.find_one(user_id, m);
        if (!row) {
            throw not_found_error(std::format("{} is not set up for this user", to_string(m)));
        }
        row->state = status::disabled;
        if (m == method::backup_code) {
            row->backup_codes.clear();
        }
        if (!m_ctx.settings.update_if_unchanged(*row)) {
            return std::nullopt;
        }
        return true;
    });
}

bool verification_manager::has_enabled_primary(std::string_view user_id) const {
    const auto rows = m_ctx.settings.find_all(user_id);
    return std::ranges::any_of(rows, [](const mfa_setting& s) {
        return is_primary(s.kind()) && s.state == status::enabled;
    });
}

} // namespace mfa
