#ifndef MFA_ERRORS_HPP
#define MFA_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <chrono>
#include <format>

namespace mfa {

/// @brief Root of every failure raised by the MFA subsystem.
class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Exception thrown when caller-supplied input has the wrong shape.
class validation_error : public error {
public:
    enum class error_type {
        missing_required_param,
        invalid_format,
        custom_rule_failed
    };

    validation_error(std::string param_name, error_type type, std::string details)
        : error(std::format("Validation failed for parameter '{}': {}", param_name, details)),
          m_paramName{std::move(param_name)},
          m_type{type},
          m_details{std::move(details)}
    {}

    [[nodiscard]] const std::string& get_param_name() const noexcept { return m_paramName; }
    [[nodiscard]] error_type get_type() const noexcept { return m_type; }
    [[nodiscard]] const std::string& get_details() const noexcept { return m_details; }

private:
    std::string m_paramName;
    error_type m_type;
    std::string m_details;
};

/// @brief No setting in the state the operation needs (pending, enabled), or unknown user.
class not_found_error : public error {
public:
    using error::error;
};

/// @brief The (user, method) pair is inside its lockout window.
class locked_error : public error {
public:
    explicit locked_error(std::chrono::system_clock::time_point locked_until)
        : error("verification temporarily locked due to failed attempts"),
          m_locked_until{locked_until}
    {}

    [[nodiscard]] std::chrono::system_clock::time_point locked_until() const noexcept { return m_locked_until; }

private:
    std::chrono::system_clock::time_point m_locked_until;
};

/// @brief Authenticated decryption failed: tampered ciphertext or wrong key.
class integrity_error : public error {
public:
    using error::error;
};

/// @brief The caller may not perform the operation (self-disable on an MFA-required role).
class permission_error : public error {
public:
    using error::error;
};

/// @brief The operation has no meaning for the requested method.
class unsupported_method_error : public error {
public:
    using error::error;
};

/// @brief The daily challenge budget for the user is exhausted.
class rate_limit_error : public error {
public:
    using error::error;
};

/// @brief Concurrent writers kept winning the compare-and-swap on a setting row.
class conflict_error : public error {
public:
    using error::error;
};

/// @brief Startup configuration is missing or malformed.
class config_error : public error {
public:
    using error::error;
};

} // namespace mfa

#endif // MFA_ERRORS_HPP
