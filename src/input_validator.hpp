#ifndef MFA_INPUT_VALIDATOR_HPP
#define MFA_INPUT_VALIDATOR_HPP

#include "errors.hpp"
#include "types.hpp"
#include <string>
#include <map>
#include <optional>
#include <string_view>
#include <functional>
#include <tuple>
#include <utility>
#include <format>
#include <regex>
#include <algorithm>

namespace mfa::validation {

/// @brief Named string inputs (CLI options, decoded form fields).
using arguments = std::map<std::string, std::string, std::less<>>;

/// @brief Describes the requirement level for a parameter.
enum class requirement {
    required,
    optional
};

namespace detail {
    template<typename T>
    std::optional<T> convert(std::string_view value);

    template<>
    inline std::optional<std::string> convert<std::string>(std::string_view value) {
        return std::string(value);
    }

    template<>
    inline std::optional<method> convert<method>(std::string_view value) {
        return parse_method(value);
    }
}

// --- Shape predicates ---

/// @brief E.164: '+', a non-zero country digit, at most 15 digits in total.
[[nodiscard]] inline bool is_e164(std::string_view phone) {
    static const std::regex pattern(R"(^\+[1-9]\d{1,14}$)");
    return std::regex_match(phone.begin(), phone.end(), pattern);
}

[[nodiscard]] inline bool is_numeric_code(std::string_view code, std::size_t digits) {
    return code.size() == digits && std::ranges::all_of(code, [](char c) { return c >= '0' && c <= '9'; });
}

[[nodiscard]] inline bool is_backup_code(std::string_view code, std::size_t length) {
    return code.size() == length &&
           std::ranges::all_of(code, [](char c) { return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'); });
}

[[nodiscard]] inline bool is_hex_token(std::string_view token, std::size_t length) {
    return token.size() == length &&
           std::ranges::all_of(token, [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

[[nodiscard]] inline bool is_email(std::string_view address) {
    const auto at = address.find('@');
    return at != std::string_view::npos && at > 0 && at + 1 < address.size() && address.find('@', at + 1) == std::string_view::npos;
}

/// @brief Throws validation_error (custom_rule_failed) when `condition` is false.
inline void require(bool condition, std::string_view param_name, std::string_view details) {
    if (!condition) {
        throw validation_error(std::string(param_name), validation_error::error_type::custom_rule_failed, std::string(details));
    }
}


/// @brief A validation rule for a parameter of a specific type.
/// @tparam T The expected type of the parameter.
template<typename T>
class rule {
public:
    explicit rule(std::string_view name_sv, requirement r)
        : name(name_sv),
          req(r),
          predicate([](const T&){ return true; }),
          error_message("")
    {}

    explicit rule(std::string_view name_sv, requirement r, std::function<bool(const T&)> p, std::string_view msg)
        : name(name_sv),
          req(r),
          predicate(std::move(p)),
          error_message(msg)
    {}

    std::string_view name;
    requirement req;
    std::function<bool(const T&)> predicate;
    std::string_view error_message;
};


/// @class validator
/// @brief A compile-time set of validation rules checked in declaration order.
template<typename... Rules>
class validator {
public:
    explicit constexpr validator(Rules... rules) : m_rulesTuple{std::move(rules)...} {}

    /// @throws validation_error on the first rule that fails.
    void validate(const arguments& args) const {
        std::apply(
            [&](const auto&... rule_pack) {
                (this->validate_one(args, rule_pack), ...);
            },
            m_rulesTuple
        );
    }

private:
    template<typename T>
    void validate_one(const arguments& args, const rule<T>& r) const {
        const auto it = args.find(r.name);
        if (it == args.end() || it->second.empty()) {
            if (r.req == requirement::required) {
                throw validation_error(
                    std::string(r.name),
                    validation_error::error_type::missing_required_param,
                    "Required parameter is missing."
                );
            }
            return;
        }

        // Values may be phone numbers or codes, so they are not echoed back.
        const auto value = detail::convert<T>(it->second);
        if (!value) {
            throw validation_error(
                std::string(r.name),
                validation_error::error_type::invalid_format,
                "Invalid value."
            );
        }

        if (!r.predicate(*value)) {
            throw validation_error(
                std::string(r.name),
                validation_error::error_type::custom_rule_failed,
                std::string(r.error_message)
            );
        }
    }

    std::tuple<Rules...> m_rulesTuple;
};

} // namespace mfa::validation

#endif // MFA_INPUT_VALIDATOR_HPP
