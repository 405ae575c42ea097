#include "lockout_policy.hpp"

namespace mfa {

bool lockout_policy::is_locked(const attempt_state& state, time_point now) const noexcept {
    return state.locked_until.has_value() && *state.locked_until > now;
}

attempt_state lockout_policy::after_failure(const attempt_state& state, time_point now) const noexcept {
    attempt_state next;
    next.failed_attempts = state.failed_attempts + 1;
    if (next.failed_attempts >= m_max_attempts) {
        next.locked_until = now + m_cooldown;
    }
    return next;
}

attempt_state lockout_policy::after_success() const noexcept {
    return attempt_state{};
}

} // namespace mfa
