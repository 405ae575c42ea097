#ifndef MFA_ENROLLMENT_MANAGER_HPP
#define MFA_ENROLLMENT_MANAGER_HPP

#include "context.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace mfa {

struct totp_setup_result {
    std::string secret;                     // base32, shown once
    std::string uri;                        // otpauth:// provisioning URI
    std::vector<std::string> backup_codes;  // plaintext, shown once
};

struct challenge_setup_result {
    std::string masked_destination;
    std::vector<std::string> backup_codes;
};

struct setup_verification_result {
    bool success{false};
    std::vector<std::string> backup_codes;  // the batch that became usable, on success
};

/**
 * @class enrollment_manager
 * @brief Drives DISABLED/absent -> PENDING_SETUP -> ENABLED for one (user, method).
 *
 * A setup call always replaces the stored row for the method with a fresh
 * PENDING_SETUP row; the failure counter and lock carry over so that
 * re-running setup cannot be used to reset a lockout.
 */
class enrollment_manager {
public:
    explicit enrollment_manager(const context& ctx) : m_ctx{ctx} {}

    [[nodiscard]] totp_setup_result setup_totp(std::string_view user_id, std::string_view email);

    /// @throws validation_error when `phone_number` is not E.164.
    [[nodiscard]] challenge_setup_result setup_sms(std::string_view user_id, std::string_view email, std::string_view phone_number);

    /// @throws validation_error when `email` is not an address.
    [[nodiscard]] challenge_setup_result setup_email(std::string_view user_id, std::string_view email);

    /**
     * @brief Proves possession of the pending factor.
     *
     * A wrong code is an expected outcome (success == false, counter advanced);
     * a missing pending row, an active lock, a malformed code or a damaged
     * ciphertext are errors.
     */
    [[nodiscard]] setup_verification_result verify_setup(std::string_view user_id, std::string_view email, method m, std::string_view code);

    /// @brief otpauth://totp/<Issuer:email>?secret=..&issuer=..&digits=6&period=30
    [[nodiscard]] static std::string provisioning_uri(std::string_view issuer, std::string_view email, std::string_view secret);

private:
    [[nodiscard]] mfa_setting pending_row(std::string_view user_id, factor details, const std::vector<std::string>& codes) const;
    [[nodiscard]] challenge_setup_result setup_challenge_method(std::string_view user_id, std::string_view email, method m,
                                                                std::string_view destination);
    void store_backup_batch(std::string_view user_id, std::vector<std::string> ciphertexts);

    const context& m_ctx;
};

} // namespace mfa

#endif // MFA_ENROLLMENT_MANAGER_HPP
