#ifndef MFA_LOCKOUT_POLICY_HPP
#define MFA_LOCKOUT_POLICY_HPP

#include "types.hpp"
#include <chrono>

namespace mfa {

/**
 * @class lockout_policy
 * @brief Failure counting and cooldown, shared by setup-time and login-time verification.
 *
 * | condition                                   | effect                                  |
 * |---------------------------------------------|-----------------------------------------|
 * | locked_until > now                          | reject, state unchanged                 |
 * | failure, failed_attempts + 1 <  max         | increment                               |
 * | failure, failed_attempts + 1 >= max         | increment, locked_until = now + cooldown|
 * | success                                     | reset to zero, clear lock               |
 */
class lockout_policy {
public:
    lockout_policy(int max_attempts, std::chrono::seconds cooldown) noexcept
        : m_max_attempts{max_attempts}, m_cooldown{cooldown} {}

    [[nodiscard]] bool is_locked(const attempt_state& state, time_point now) const noexcept;
    [[nodiscard]] attempt_state after_failure(const attempt_state& state, time_point now) const noexcept;
    [[nodiscard]] attempt_state after_success() const noexcept;

    [[nodiscard]] int max_attempts() const noexcept { return m_max_attempts; }
    [[nodiscard]] std::chrono::seconds cooldown() const noexcept { return m_cooldown; }

private:
    int m_max_attempts;
    std::chrono::seconds m_cooldown;
};

} // namespace mfa

#endif // MFA_LOCKOUT_POLICY_HPP
