#include "audit.hpp"
#include "logger.hpp"
#include "util.hpp"

namespace mfa::audit {

std::string_view to_string(category c) noexcept {
    switch (c) {
        case category::enrollment: return "MFA_ENROLLMENT";
        case category::verification: return "MFA_VERIFICATION";
        case category::failure: return "MFA_FAILURE";
        case category::disablement: return "MFA_DISABLEMENT";
    }
    return "UNKNOWN";
}

std::string_view to_string(outcome o) noexcept {
    return o == outcome::success ? "SUCCESS" : "FAILURE";
}

std::string_view to_string(risk_level r) noexcept {
    switch (r) {
        case risk_level::low: return "LOW";
        case risk_level::medium: return "MEDIUM";
        case risk_level::high: return "HIGH";
        case risk_level::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string to_json(const event& e) {
    const json::string_map fields = {
        {"category", std::string(to_string(e.kind))},
        {"action", e.action},
        {"outcome", std::string(to_string(e.result))},
        {"riskLevel", std::string(to_string(e.risk))},
        {"description", e.description},
        {"userId", e.user_id},
        {"userEmail", e.user_email},
        {"timestamp", std::to_string(util::to_unix_seconds(e.occurred_at))}
    };
    return json::json_parser::build(fields, "metadata", e.metadata);
}

void log_sink::record(const event& e) {
    const auto line = to_json(e);
    if (e.risk == risk_level::critical) {
        log::critical("AUDIT {}", line);
    } else if (e.risk == risk_level::high) {
        log::warn("AUDIT {}", line);
    } else {
        log::info("AUDIT {}", line);
    }
}

void emitter::emit(event e) noexcept {
    try {
        e.occurred_at = m_clock();
        m_sink.record(e);
    } catch (const std::exception& ex) {
        log::error("audit sink rejected event '{}' for user '{}': {}", e.action, e.user_id, ex.what());
    }
}

} // namespace mfa::audit
