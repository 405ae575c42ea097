#include "types.hpp"

namespace mfa {

std::string_view to_string(method m) noexcept {
    switch (m) {
        case method::totp: return "TOTP";
        case method::sms: return "SMS";
        case method::email: return "EMAIL";
        case method::backup_code: return "BACKUP_CODE";
    }
    return "UNKNOWN";
}

std::string_view to_string(status s) noexcept {
    switch (s) {
        case status::disabled: return "DISABLED";
        case status::pending_setup: return "PENDING_SETUP";
        case status::enabled: return "ENABLED";
        case status::temporarily_disabled: return "TEMPORARILY_DISABLED";
    }
    return "UNKNOWN";
}

std::optional<method> parse_method(std::string_view name) noexcept {
    if (name == "TOTP") return method::totp;
    if (name == "SMS") return method::sms;
    if (name == "EMAIL") return method::email;
    if (name == "BACKUP_CODE") return method::backup_code;
    return std::nullopt;
}

std::optional<status> parse_status(std::string_view name) noexcept {
    if (name == "DISABLED") return status::disabled;
    if (name == "PENDING_SETUP") return status::pending_setup;
    if (name == "ENABLED") return status::enabled;
    if (name == "TEMPORARILY_DISABLED") return status::temporarily_disabled;
    return std::nullopt;
}

method method_of(const factor& f) noexcept {
    // Alternatives are declared in the same order as the method enumerators.
    return static_cast<method>(f.index());
}

} // namespace mfa
