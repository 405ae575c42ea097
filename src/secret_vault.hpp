#ifndef MFA_SECRET_VAULT_HPP
#define MFA_SECRET_VAULT_HPP

#include <string>
#include <string_view>

namespace mfa {

/**
 * @class secret_vault
 * @brief AES-256-GCM encryption for every secret the subsystem persists
 * (TOTP seeds, phone numbers, backup codes).
 *
 * Ciphertext layout: `v1:<base64 nonce>:<base64 ciphertext>:<base64 tag>` with a
 * fresh 16-byte nonce per call and a 16-byte tag. The leading version field
 * leaves room for key identifiers once keys rotate.
 *
 * Thread-safe: the object only holds the immutable key.
 */
class secret_vault {
public:
    /// @throws config_error if the key is not exactly 32 bytes.
    explicit secret_vault(std::string key);
    ~secret_vault() noexcept;
    secret_vault(const secret_vault&) = delete;
    secret_vault& operator=(const secret_vault&) = delete;

    [[nodiscard]] std::string encrypt(std::string_view plaintext) const;

    /// @throws integrity_error on a malformed layout or a tag that does not verify.
    [[nodiscard]] std::string decrypt(std::string_view ciphertext) const;

private:
    std::string m_key;
};

} // namespace mfa

#endif // MFA_SECRET_VAULT_HPP
