#ifndef MFA_LOGGER_HPP
#define MFA_LOGGER_HPP

#include <iostream>
#include <string_view>
#include <format>
#include <syncstream>
#include <thread>
#include <string>

#ifdef MFA_USE_STACKTRACE
#include <stacktrace>
#endif

namespace mfa::log {

// --- Thread-Local Correlation ID for Traceability ---

// Points to a string owned by whoever installed the scope (one CLI invocation,
// one request handled by an embedding service).
inline thread_local std::string_view g_correlation_id;

/**
 * @class correlation_scope
 * @brief A RAII helper to set and clear the thread-local correlation ID.
 *
 * Create an instance of this on the stack at the beginning of an operation.
 * When it goes out of scope, the correlation ID will be cleared.
 */
class correlation_scope {
public:
    explicit correlation_scope(std::string_view id) noexcept {
        g_correlation_id = id;
    }
    ~correlation_scope() {
        g_correlation_id = {};
    }
    correlation_scope(const correlation_scope&) = delete;
    correlation_scope& operator=(const correlation_scope&) = delete;
    correlation_scope(correlation_scope&&) = delete;
    correlation_scope& operator=(correlation_scope&&) = delete;
};


// --- Compile-time configuration for debug logging ---
#ifdef MFA_ENABLE_DEBUG_LOGS
constexpr bool debug_logging_enabled = true;
#else
constexpr bool debug_logging_enabled = false;
#endif


// Defines the severity level of a log message.
enum class Level {
    Debug,
    Perf,
    Info,
    Warning,
    Error,
    Critical
};

namespace detail {
    constexpr std::string_view level_name(const Level level) noexcept {
        switch (level) {
            case Level::Debug: return "DEBUG";
            case Level::Perf: return "PERF";
            case Level::Info: return "INFO";
            case Level::Warning: return "WARN";
            case Level::Error: return "ERROR";
            case Level::Critical: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    inline void vprint(
        const Level level,
        const std::string_view fmt,
        std::format_args args)
    {
        const auto log_prefix = std::format(
            "[{:^8}] [Thread: {}] [{}] ",
            level_name(level),
            std::this_thread::get_id(),
            g_correlation_id.empty() ? "--------" : g_correlation_id
        );
        std::osyncstream synced_out((level == Level::Error || level == Level::Critical) ? std::cerr : std::cout);
        synced_out << log_prefix;
        synced_out << std::vformat(fmt, args);
        synced_out << '\n';
        #ifdef MFA_USE_STACKTRACE
        if (level == Level::Critical) {
            synced_out << "--- Stack Trace ---\n" << std::stacktrace::current() << "-------------------\n";
        }
        #endif
    }
} // namespace detail

// --- Public-facing convenience functions ---

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if constexpr (debug_logging_enabled) {
        detail::vprint(Level::Debug, fmt.get(), std::make_format_args(args...));
    }
}

template<typename... Args>
void perf(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Perf, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Info, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Warning, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Error, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void critical(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Critical, fmt.get(), std::make_format_args(args...));
}
} // namespace mfa::log
#endif // MFA_LOGGER_HPP
