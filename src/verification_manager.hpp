#ifndef MFA_VERIFICATION_MANAGER_HPP
#define MFA_VERIFICATION_MANAGER_HPP

#include "context.hpp"
#include <string>
#include <string_view>
#include <optional>

namespace mfa {

struct verification_result {
    bool success{false};
    std::optional<std::string> trust_token;
};

/**
 * @class verification_manager
 * @brief Login-time checks against ENABLED factors, challenge dispatch and disablement.
 */
class verification_manager {
public:
    explicit verification_manager(const context& ctx) : m_ctx{ctx} {}

    /**
     * @brief Verifies a login code for an enabled method.
     *
     * The lock is checked before the code is looked at. On success the counter
     * is reset, last_used stamped and, when asked for, a device-trust token minted.
     *
     * @throws not_found_error when the method is not enabled.
     * @throws locked_error while the lockout window is active (audited HIGH).
     */
    [[nodiscard]] verification_result verify(std::string_view user_id, std::string_view email, method m,
                                             std::string_view code, bool trust_device = false);

    /**
     * @brief Sends a fresh challenge code for SMS/EMAIL. TOTP needs none and is a no-op.
     * @throws unsupported_method_error for BACKUP_CODE.
     * @throws rate_limit_error once the daily budget is used up.
     */
    void send_challenge(std::string_view user_id, std::string_view email, method m);

    /**
     * @brief Sets the method to DISABLED.
     *
     * Users whose role requires MFA can only be disabled by an administrator.
     * Disabling the last enabled primary factor disables the backup codes too.
     *
     * @throws permission_error for a self-service disable on an MFA-required role.
     */
    void disable(std::string_view user_id, std::string_view email, method m, std::optional<std::string_view> acting_admin_id = std::nullopt);

private:
    void disable_row(std::string_view user_id, method m);
    [[nodiscard]] bool has_enabled_primary(std::string_view user_id) const;

    const context& m_ctx;
};

} // namespace mfa

#endif // MFA_VERIFICATION_MANAGER_HPP
