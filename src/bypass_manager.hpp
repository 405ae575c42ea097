#ifndef MFA_BYPASS_MANAGER_HPP
#define MFA_BYPASS_MANAGER_HPP

#include "context.hpp"
#include <string>
#include <string_view>

namespace mfa {

/**
 * @class bypass_manager
 * @brief Emergency access for a user who lost every factor.
 *
 * An administrator grants a random token that lets the user past MFA once,
 * within the configured lifetime. Only its digest is stored.
 */
class bypass_manager {
public:
    explicit bypass_manager(const context& ctx) : m_ctx{ctx} {}

    /**
     * @brief Issues a bypass token for `user_id`, revoking any open one.
     * @return The plaintext token, shown once.
     * @throws not_found_error for an unknown user.
     * @throws permission_error unless `admin_id` holds an administrator role
     * and is not the user being bypassed.
     * @throws validation_error when no reason is given.
     */
    [[nodiscard]] std::string grant(std::string_view user_id, std::string_view email, std::string_view admin_id, std::string_view reason);

    /**
     * @brief Redeems a bypass token. A token works once and only before it expires.
     * @throws validation_error when the token is not 64 lowercase hex characters.
     */
    [[nodiscard]] bool redeem(std::string_view user_id, std::string_view email, std::string_view token);

private:
    const context& m_ctx;
};

} // namespace mfa

#endif // MFA_BYPASS_MANAGER_HPP
