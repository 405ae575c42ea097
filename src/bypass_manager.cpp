#include "bypass_manager.hpp"
#include "otp.hpp"
#include "util.hpp"
#include "logger.hpp"
#include "input_validator.hpp"

namespace mfa {

using detail::emit;

std::string bypass_manager::grant(std::string_view user_id, std::string_view email, std::string_view admin_id, std::string_view reason) {
    validation::require(!reason.empty(), "reason", "An emergency bypass needs a reason.");
    if (!m_ctx.users.role_of(user_id)) {
        throw not_found_error("unknown user");
    }

    const auto admin_role = m_ctx.users.role_of(admin_id);
    if (!admin_role || !m_ctx.opts.is_admin(*admin_role) || admin_id == user_id) {
        emit(m_ctx, audit::category::disablement, "MFA_BYPASS_DENIED", audit::outcome::failure, audit::risk_level::high,
             "Emergency MFA bypass refused", user_id, email,
             {{"requestedBy", std::string(admin_id)}, {"reason", std::string(reason)}});
        throw permission_error("an emergency bypass must be granted by another administrator");
    }

    auto token = otp::random_token(bypass_token_bytes);
    const auto expires_at = m_ctx.clock() + m_ctx.opts.bypass_ttl;
    m_ctx.bypasses.save(bypass_grant{
        .user_id = std::string(user_id),
        .token_hash = otp::bypass_digest(user_id, token),
        .approved_by = std::string(admin_id),
        .reason = std::string(reason),
        .expires_at = expires_at
    });

    emit(m_ctx, audit::category::disablement, "MFA_BYPASS_GRANTED", audit::outcome::success, audit::risk_level::high,
         "Emergency MFA bypass granted", user_id, email,
         {{"approvedBy", std::string(admin_id)}, {"reason", std::string(reason)},
          {"expiresAt", std::to_string(util::to_unix_seconds(expires_at))}});
    log::warn("emergency MFA bypass granted for user '{}' by '{}'", user_id, admin_id);
    return token;
}

bool bypass_manager::redeem(std::string_view user_id, std::string_view email, std::string_view token) {
    validation::require(validation::is_hex_token(token, 2 * bypass_token_bytes), "token",
                        std::format("bypass tokens are {} lowercase hex characters", 2 * bypass_token_bytes));

    if (!m_ctx.bypasses.consume(user_id, otp::bypass_digest(user_id, token))) {
        emit(m_ctx, audit::category::failure, "MFA_BYPASS_REJECTED", audit::outcome::failure, audit::risk_level::high,
             "Emergency MFA bypass token rejected", user_id, email);
        return false;
    }

    emit(m_ctx, audit::category::verification, "MFA_BYPASS_USED", audit::outcome::success, audit::risk_level::high,
         "Emergency MFA bypass used", user_id, email);
    log::warn("emergency MFA bypass used by user '{}'", user_id);
    return true;
}

} // namespace mfa
