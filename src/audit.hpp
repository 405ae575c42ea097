#ifndef MFA_AUDIT_HPP
#define MFA_AUDIT_HPP

#include "types.hpp"
#include "json_parser.hpp"
#include <string>
#include <string_view>

namespace mfa::audit {

enum class category {
    enrollment,
    verification,
    failure,
    disablement
};

enum class outcome {
    success,
    failure
};

enum class risk_level {
    low,
    medium,
    high,
    critical
};

[[nodiscard]] std::string_view to_string(category c) noexcept;
[[nodiscard]] std::string_view to_string(outcome o) noexcept;
[[nodiscard]] std::string_view to_string(risk_level r) noexcept;

/**
 * @brief One security-relevant fact. Metadata never carries plaintext
 * secrets or codes, destinations appear masked.
 */
struct event {
    category kind;
    std::string action;
    outcome result;
    risk_level risk;
    std::string description;
    std::string user_id;
    std::string user_email;
    json::string_map metadata;
    time_point occurred_at{};
};

/// @brief The external append-only audit log.
class sink {
public:
    virtual ~sink() = default;
    virtual void record(const event& e) = 0;
};

/// @brief Writes each event as one JSON line through the operational logger.
class log_sink : public sink {
public:
    void record(const event& e) override;
};

[[nodiscard]] std::string to_json(const event& e);

/**
 * @class emitter
 * @brief Shapes events and forwards them to the sink.
 *
 * Auditing is fire-and-forget: a sink failure is reported to the operational
 * log and never aborts the operation being audited.
 */
class emitter {
public:
    emitter(sink& target, clock_fn clock) : m_sink{target}, m_clock{std::move(clock)} {}

    void emit(event e) noexcept;

private:
    sink& m_sink;
    clock_fn m_clock;
};

} // namespace mfa::audit

#endif // MFA_AUDIT_HPP
