#include "context.hpp"
#include "otp.hpp"
#include "util.hpp"
#include "logger.hpp"
#include "input_validator.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <cctype>

namespace mfa::detail {

namespace {
    // Wipes a decrypted secret when it goes out of scope.
    class scrubbed {
    public:
        explicit scrubbed(std::string value) : m_value{std::move(value)} {}
        ~scrubbed() { OPENSSL_cleanse(m_value.data(), m_value.size()); }
        scrubbed(const scrubbed&) = delete;
        scrubbed& operator=(const scrubbed&) = delete;

        [[nodiscard]] const std::string& get() const noexcept { return m_value; }

    private:
        std::string m_value;
    };

    bool check_totp(const context& ctx, totp_factor& factor, std::string_view user_id, std::string_view user_email,
                    std::string_view code, time_point now) {
        const scrubbed secret{reveal(ctx, factor.secret, user_id, user_email, method::totp)};
        const auto step = otp::verify_totp(secret.get(), code, now, totp_window);
        if (!step) {
            return false;
        }
        if (ctx.opts.totp_replay_protection && factor.last_used_step && *step <= *factor.last_used_step) {
            log::warn("TOTP code for step {} replayed by user '{}'", *step, user_id);
            return false;
        }
        factor.last_used_step = *step;
        return true;
    }

    bool check_backup_code(const context& ctx, mfa_setting& row, std::string_view user_email, std::string_view code) {
        // Every stored code is decrypted and compared so the work done does not depend on the match position.
        auto matched = row.backup_codes.end();
        for (auto it = row.backup_codes.begin(); it != row.backup_codes.end(); ++it) {
            const scrubbed plain{reveal(ctx, *it, row.user_id, user_email, method::backup_code)};
            if (otp::constant_time_equals(plain.get(), code) && matched == row.backup_codes.end()) {
                matched = it;
            }
        }
        if (matched == row.backup_codes.end()) {
            return false;
        }
        row.backup_codes.erase(matched);
        return true;
    }
}

void emit(const context& ctx, audit::category kind, std::string action, audit::outcome result, audit::risk_level risk,
          std::string description, std::string_view user_id, std::string_view user_email, json::string_map metadata) {
    ctx.audit.emit(audit::event{
        .kind = kind,
        .action = std::move(action),
        .result = result,
        .risk = risk,
        .description = std::move(description),
        .user_id = std::string(user_id),
        .user_email = std::string(user_email),
        .metadata = std::move(metadata)
    });
}

std::string reveal(const context& ctx, std::string_view ciphertext, std::string_view user_id, std::string_view user_email, method m) {
    try {
        return ctx.vault.decrypt(ciphertext);
    } catch (const integrity_error& e) {
        log::critical("stored {} secret of user '{}' failed authentication: {}", to_string(m), user_id, e.what());
        emit(ctx, audit::category::failure, "MFA_INTEGRITY_FAILURE", audit::outcome::failure, audit::risk_level::critical,
             "Stored MFA secret failed integrity verification", user_id, user_email,
             {{"mfaMethod", std::string(to_string(m))}});
        throw;
    }
}

std::string normalize_code(method m, std::string_view code) {
    std::string entered{code};
    if (m == method::backup_code) {
        std::ranges::transform(entered, entered.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        validation::require(validation::is_backup_code(entered, backup_code_length), "code",
                            std::format("backup codes are {} characters of A-Z and 0-9", backup_code_length));
    } else {
        validation::require(validation::is_numeric_code(entered, challenge_digits), "code",
                            std::format("verification codes are {} digits", challenge_digits));
    }
    return entered;
}

bool check_code(const context& ctx, mfa_setting& row, std::string_view user_email, std::string_view code,
                time_point now, std::optional<bool>& challenge_verdict) {
    const method m = row.kind();
    switch (m) {
        case method::totp:
            return check_totp(ctx, std::get<totp_factor>(row.details), row.user_id, user_email, code, now);
        case method::sms:
        case method::email:
            if (!challenge_verdict) {
                challenge_verdict = ctx.challenges.consume(row.user_id, m, otp::challenge_digest(row.user_id, m, code));
            }
            return *challenge_verdict;
        case method::backup_code:
            return check_backup_code(ctx, row, user_email, code);
    }
    throw unsupported_method_error(std::format("no code check for method {}", to_string(m)));
}

void check_challenge_budget(const context& ctx, std::string_view user_id, std::string_view user_email, method m) {
    const auto since = ctx.clock() - challenge_budget_window;
    const auto issued = ctx.challenges.count_issued_since(user_id, since);
    if (issued >= ctx.opts.daily_challenge_limit) {
        emit(ctx, audit::category::failure, "MFA_CHALLENGE_RATE_LIMITED", audit::outcome::failure, audit::risk_level::high,
             "Daily MFA challenge limit reached", user_id, user_email,
             {{"mfaMethod", std::string(to_string(m))}, {"issuedLast24h", std::to_string(issued)}});
        throw rate_limit_error(std::format("daily challenge limit of {} reached", ctx.opts.daily_challenge_limit));
    }
}

void deliver_challenge(const context& ctx, std::string_view user_id, method m, std::string_view destination) {
    const scrubbed code{otp::challenge_code(challenge_digits)};
    ctx.challenges.save(user_id, m, otp::challenge_digest(user_id, m, code.get()), ctx.opts.challenge_ttl);
    if (m == method::sms) {
        ctx.delivery.send_sms(destination, code.get());
    } else {
        ctx.delivery.send_email(destination, code.get());
    }
}

std::string masked_destination(method m, std::string_view destination) {
    return m == method::sms ? util::mask_phone(destination) : util::mask_email(destination);
}

} // namespace mfa::detail
