#include "mfa_service.hpp"
#include "otp.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>

namespace mfa {

mfa_service::mfa_service(options opts, const secrets& keys, collaborators deps, clock_fn clock)
    : m_opts{std::move(opts)},
      m_clock{std::move(clock)},
      m_vault{keys.encryption_key},
      m_lockout{m_opts.max_attempts, m_opts.lockout_cooldown},
      m_trust_tokens{keys.trust_token_secret, std::chrono::duration_cast<std::chrono::seconds>(m_opts.trust_device_ttl)},
      m_audit{deps.audit, m_clock},
      m_ctx{m_opts, m_vault, m_lockout, deps.settings, deps.challenges, deps.bypasses, deps.users, deps.delivery, m_audit, m_trust_tokens, m_clock},
      m_enrollment{m_ctx},
      m_verification{m_ctx},
      m_bypass{m_ctx}
{}

mfa_service::~mfa_service() = default;

mfa_status mfa_service::get_status(std::string_view user_id) {
    const auto role = m_ctx.users.role_of(user_id);
    if (!role) {
        throw not_found_error("unknown user");
    }

    mfa_status result;
    result.is_required = m_opts.is_mfa_required(*role);

    const auto rows = m_ctx.settings.find_all(user_id);
    bool any_pending = false;
    for (const method m : std::array{method::totp, method::sms, method::email}) {
        const auto it = std::ranges::find_if(rows, [m](const mfa_setting& s) { return s.kind() == m; });
        if (it == rows.end()) {
            continue;
        }
        if (it->state == status::enabled) {
            result.methods.push_back(m);
        } else if (it->state == status::pending_setup) {
            any_pending = true;
        }
    }

    for (const auto& row : rows) {
        if (row.last_used && (!result.last_used || *row.last_used > *result.last_used)) {
            result.last_used = row.last_used;
        }
        if (row.kind() == method::backup_code && row.state == status::enabled) {
            result.backup_codes_remaining = row.backup_codes.size();
        }
    }

    result.is_enabled = !result.methods.empty();
    if (result.is_enabled) {
        result.overall = status::enabled;
    } else if (any_pending) {
        result.overall = status::pending_setup;
    }
    return result;
}

status mfa_service::method_status(std::string_view user_id, method m) {
    const auto row = m_ctx.settings.find_one(user_id, m);
    return row ? row->state : status::disabled;
}

std::vector<std::string> mfa_service::regenerate_backup_codes(std::string_view user_id, std::string_view email) {
    const auto rows = m_ctx.settings.find_all(user_id);
    const bool has_primary = std::ranges::any_of(rows, [](const mfa_setting& s) {
        return is_primary(s.kind()) && s.state == status::enabled;
    });
    if (!has_primary) {
        throw not_found_error("backup codes need an enabled MFA method");
    }

    auto codes = otp::backup_codes(m_opts.backup_code_count, backup_code_length);
    std::vector<std::string> ciphertexts;
    ciphertexts.reserve(codes.size());
    for (const auto& code : codes) {
        ciphertexts.push_back(m_vault.encrypt(code));
    }

    detail::retry_on_conflict("regenerate_backup_codes", [&]() -> std::optional<bool> {
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
        row->state = status::enabled;
        row->backup_codes = ciphertexts;
        if (!m_ctx.settings.update_if_unchanged(*row)) {
            return std::nullopt;
        }
        return true;
    });

    detail::emit(m_ctx, audit::category::enrollment, "BACKUP_CODES_REGENERATED", audit::outcome::success, audit::risk_level::medium,
                 "MFA backup codes regenerated", user_id, email,
                 {{"count", std::to_string(codes.size())}});
    log::info("backup codes regenerated for user '{}'", user_id);
    return codes;
}

std::expected<claims_map, token_error> mfa_service::verify_trust_token(std::string_view user_id, std::string_view token) const {
    return m_trust_tokens.verify_for(token, user_id, m_clock());
}

} // namespace mfa
