#include "enrollment_manager.hpp"
#include "otp.hpp"
#include "util.hpp"
#include "logger.hpp"
#include "input_validator.hpp"
#include <ranges>

namespace mfa {

using detail::emit;

std::string enrollment_manager::provisioning_uri(std::string_view issuer, std::string_view email, std::string_view secret) {
    return std::format("otpauth://totp/{}?secret={}&issuer={}&digits={}&period={}",
                       util::url_encode(std::format("{}:{}", issuer, email)),
                       secret,
                       util::url_encode(issuer),
                       totp_digits,
                       totp_period.count());
}

mfa_setting enrollment_manager::pending_row(std::string_view user_id, factor details, const std::vector<std::string>& codes) const {
    mfa_setting row;
    row.user_id = std::string(user_id);
    row.details = std::move(details);
    row.state = status::pending_setup;
    row.backup_codes.reserve(codes.size());
    for (const auto& code : codes) {
        row.backup_codes.push_back(m_ctx.vault.encrypt(code));
    }
    if (const auto existing = m_ctx.settings.find_one(user_id, row.kind())) {
        row.attempts = existing->attempts;
        row.last_used = existing->last_used;
    }
    return row;
}

totp_setup_result enrollment_manager::setup_totp(std::string_view user_id, std::string_view email) {
    totp_setup_result result;
    try {
        result.secret = otp::generate_secret(totp_secret_bytes);
        result.backup_codes = otp::backup_codes(m_ctx.opts.backup_code_count, backup_code_length);
        result.uri = provisioning_uri(m_ctx.opts.issuer, email, result.secret);

        m_ctx.settings.upsert(pending_row(user_id, totp_factor{m_ctx.vault.encrypt(result.secret), std::nullopt}, result.backup_codes));
    } catch (const std::exception& e) {
        emit(m_ctx, audit::category::failure, "TOTP_SETUP_FAILED", audit::outcome::failure, audit::risk_level::high,
             "TOTP MFA setup failed", user_id, email,
             {{"errorCode", "TOTP_SETUP_ERROR"}, {"errorMessage", e.what()}});
        throw;
    }

    emit(m_ctx, audit::category::enrollment, "TOTP_SETUP_INITIATED", audit::outcome::success, audit::risk_level::medium,
         "TOTP MFA setup initiated", user_id, email,
         {{"mfaMethod", "TOTP"}, {"backupCodeCount", std::to_string(result.backup_codes.size())}});
    log::info("TOTP setup started for user '{}'", user_id);
    return result;
}

challenge_setup_result enrollment_manager::setup_sms(std::string_view user_id, std::string_view email, std::string_view phone_number) {
    validation::require(validation::is_e164(phone_number), "phoneNumber", "phone number must be in E.164 format (+15551234567)");
    return setup_challenge_method(user_id, email, method::sms, phone_number);
}

challenge_setup_result enrollment_manager::setup_email(std::string_view user_id, std::string_view email) {
    validation::require(validation::is_email(email), "email", "a valid email address is required");
    return setup_challenge_method(user_id, email, method::email, email);
}

challenge_setup_result enrollment_manager::setup_challenge_method(std::string_view user_id, std::string_view email, method m,
                                                                  std::string_view destination) {
    const std::string method_name{to_string(m)};
    detail::check_challenge_budget(m_ctx, user_id, email, m);

    challenge_setup_result result;
    result.masked_destination = detail::masked_destination(m, destination);
    try {
        result.backup_codes = otp::backup_codes(m_ctx.opts.backup_code_count, backup_code_length);
        factor details = m == method::sms ? factor{sms_factor{m_ctx.vault.encrypt(destination)}} : factor{email_factor{}};
        m_ctx.settings.upsert(pending_row(user_id, std::move(details), result.backup_codes));
        detail::deliver_challenge(m_ctx, user_id, m, destination);
    } catch (const std::exception& e) {
        emit(m_ctx, audit::category::failure, method_name + "_SETUP_FAILED", audit::outcome::failure, audit::risk_level::high,
             std::format("{} MFA setup failed", method_name), user_id, email,
             {{"errorCode", method_name + "_SETUP_ERROR"}, {"errorMessage", e.what()}});
        throw;
    }

    emit(m_ctx, audit::category::enrollment, method_name + "_SETUP_INITIATED", audit::outcome::success, audit::risk_level::medium,
         std::format("{} MFA setup initiated", method_name), user_id, email,
         {{"mfaMethod", method_name}, {"destination", result.masked_destination}});
    log::info("{} setup started for user '{}', challenge sent to {}", method_name, user_id, result.masked_destination);
    return result;
}

setup_verification_result enrollment_manager::verify_setup(std::string_view user_id, std::string_view email, method m, std::string_view code) {
    if (!is_primary(m)) {
        throw unsupported_method_error(std::format("{} has no setup verification", to_string(m)));
    }
    const std::string entered = detail::normalize_code(m, code);

    const std::string method_name{to_string(m)};
    std::optional<bool> challenge_verdict;

    struct attempt_result {
        bool success;
        attempt_state attempts;
        std::vector<std::string> batch;     // ciphertexts moved to the BACKUP_CODE row
    };

    auto done = detail::retry_on_conflict("verify_setup", [&]() -> std::optional<attempt_result> {
        const auto row = m_ctx.settings.find_one(user_id, m);
        if (!row || row->state != status::pending_setup) {
            throw not_found_error(std::format("no pending {} setup found", method_name));
        }

        const auto now = m_ctx.clock();
        if (m_ctx.lockout.is_locked(row->attempts, now)) {
            emit(m_ctx, audit::category::failure, "MFA_SETUP_VERIFICATION_BLOCKED", audit::outcome::failure, audit::risk_level::high,
                 "MFA setup verification blocked due to lockout", user_id, email,
                 {{"mfaMethod", method_name}, {"lockedUntil", std::to_string(util::to_unix_seconds(*row->attempts.locked_until))}});
            throw locked_error(*row->attempts.locked_until);
        }

        mfa_setting next = *row;
        const bool matched = detail::check_code(m_ctx, next, email, entered, now, challenge_verdict);
        attempt_result result{matched, {}, {}};
        if (matched) {
            next.state = status::enabled;
            next.attempts = m_ctx.lockout.after_success();
            next.last_used = now;
            result.batch = std::move(next.backup_codes);
            next.backup_codes.clear();
        } else {
            next.attempts = m_ctx.lockout.after_failure(row->attempts, now);
        }
        result.attempts = next.attempts;

        if (!m_ctx.settings.update_if_unchanged(next)) {
            log::warn("verify_setup for user '{}' lost a concurrent update, retrying", user_id);
            return std::nullopt;
        }
        return result;
    });

    if (!done.success) {
        json::string_map metadata{{"mfaMethod", method_name}, {"failedAttempts", std::to_string(done.attempts.failed_attempts)}};
        if (done.attempts.locked_until) {
            metadata.emplace("lockedUntil", std::to_string(util::to_unix_seconds(*done.attempts.locked_until)));
        }
        emit(m_ctx, audit::category::failure, "MFA_SETUP_VERIFICATION_FAILED", audit::outcome::failure,
             done.attempts.locked_until ? audit::risk_level::high : audit::risk_level::medium,
             "MFA setup verification failed", user_id, email, std::move(metadata));
        return {};
    }

    setup_verification_result result{true, {}};
    result.backup_codes.reserve(done.batch.size());
    for (const auto& ciphertext : done.batch) {
        result.backup_codes.push_back(detail::reveal(m_ctx, ciphertext, user_id, email, method::backup_code));
    }
    store_backup_batch(user_id, std::move(done.batch));

    emit(m_ctx, audit::category::enrollment, "MFA_SETUP_COMPLETED", audit::outcome::success, audit::risk_level::medium,
         "MFA setup completed successfully", user_id, email,
         {{"mfaMethod", method_name}, {"backupCodeCount", std::to_string(result.backup_codes.size())}});
    log::info("{} enabled for user '{}'", method_name, user_id);
    return result;
}

void enrollment_manager::store_backup_batch(std::string_view user_id, std::vector<std::string> ciphertexts) {
    detail::retry_on_conflict("store_backup_batch", [&]() -> std::optional<bool> {
        auto row = m_ctx.settings.find_one(user_id, method::backup_code);
        if (!row) {
            mfa_setting fresh;
            fresh.user_id = std::string(user_id);
            fresh.details = backup_code_factor{};
            fresh.state = status::enabled;
            fresh.backup_codes = ciphertexts;
            m_ctx.settings.upsert(fresh);
            return true;
        }
        // The failure counter and lock of the existing row stay in force.
        row->state = status::enabled;
        row->backup_codes = ciphertexts;
        if (!m_ctx.settings.update_if_unchanged(*row)) {
            log::warn("backup batch for user '{}' lost a concurrent update, retrying", user_id);
            return std::nullopt;
        }
        return true;
    });
}

} // namespace mfa
