#ifndef MFA_PKEYUTIL_HPP
#define MFA_PKEYUTIL_HPP

#include <string>
#include <string_view>

namespace mfa::pkey {

// Result of a decryption operation
struct decryption_result {
    bool success;
    std::string content; // On success, contains the decrypted text. On failure, an error message.
};


/**
 * @brief Decrypts a file encrypted with an RSA public key.
 *
 * Used for configuration values (vault key, trust secret) that are shipped
 * as `openssl pkeyutl -encrypt` output instead of plain environment values.
 *
 * @param filename The path to the encrypted file.
 * @param private_key_path PEM file holding the matching RSA private key.
 * @return A decryption_result struct.
 */
[[nodiscard]] decryption_result decrypt_file(std::string_view filename, std::string_view private_key_path) noexcept;

} // namespace mfa::pkey

#endif // MFA_PKEYUTIL_HPP
