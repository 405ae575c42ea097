#ifndef MFA_MFA_SERVICE_HPP
#define MFA_MFA_SERVICE_HPP

#include "context.hpp"
#include "enrollment_manager.hpp"
#include "verification_manager.hpp"
#include "bypass_manager.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <memory>

namespace mfa {

struct mfa_status {
    bool is_enabled{false};
    bool is_required{false};
    std::vector<method> methods;            // enabled primary factors, TOTP, SMS, EMAIL order
    status overall{status::disabled};
    std::optional<time_point> last_used;
    std::size_t backup_codes_remaining{0};
};

/// @brief The external collaborators an mfa_service is wired to.
struct collaborators {
    settings_store& settings;
    challenge_store& challenges;
    bypass_store& bypasses;
    user_directory& users;
    delivery_channel& delivery;
    audit::sink& audit;
};

/**
 * @class mfa_service
 * @brief Entry point of the subsystem: owns the vault, the lockout policy and
 * the token service built from configuration, and exposes the managers.
 */
class mfa_service {
public:
    mfa_service(options opts, const secrets& keys, collaborators deps, clock_fn clock = system_now);
    ~mfa_service();
    mfa_service(const mfa_service&) = delete;
    mfa_service& operator=(const mfa_service&) = delete;

    [[nodiscard]] enrollment_manager& enrollment() noexcept { return m_enrollment; }
    [[nodiscard]] verification_manager& verification() noexcept { return m_verification; }
    [[nodiscard]] bypass_manager& bypass() noexcept { return m_bypass; }

    [[nodiscard]] bool is_mfa_required(std::string_view role) const { return m_opts.is_mfa_required(role); }

    /// @throws not_found_error for a user unknown to the user directory.
    [[nodiscard]] mfa_status get_status(std::string_view user_id);

    /// @brief Row status of one method, DISABLED when the method was never set up.
    [[nodiscard]] status method_status(std::string_view user_id, method m);

    /**
     * @brief Replaces the backup-code batch. The plaintext codes are returned once.
     * @throws not_found_error when no primary factor is enabled.
     */
    [[nodiscard]] std::vector<std::string> regenerate_backup_codes(std::string_view user_id, std::string_view email);

    [[nodiscard]] std::expected<claims_map, token_error> verify_trust_token(std::string_view user_id, std::string_view token) const;

    [[nodiscard]] const options& config() const noexcept { return m_opts; }

private:
    options m_opts;
    clock_fn m_clock;
    secret_vault m_vault;
    lockout_policy m_lockout;
    trust_token_service m_trust_tokens;
    audit::emitter m_audit;
    context m_ctx;
    enrollment_manager m_enrollment;
    verification_manager m_verification;
    bypass_manager m_bypass;
};

} // namespace mfa

#endif // MFA_MFA_SERVICE_HPP
