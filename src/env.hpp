#ifndef MFA_ENV_HPP
#define MFA_ENV_HPP

#include "util.hpp"
#include "pkeyutil.hpp"
#include <string>
#include <stdexcept>
#include <concepts>
#include <string_view>
#include <unordered_map>
#include <charconv>
#include <cstdlib>

namespace mfa::env {

    /**
     * @brief Exception thrown when an environment variable cannot be resolved.
     */
    class error : public std::runtime_error {
    public:
        explicit error(const std::string& message)
            : std::runtime_error("env::get: " + message) {}
    };

    /**
     * @brief Concept for types supported by env::get.
     */
    template <typename T>
    concept Supported = std::same_as<T, std::string> ||
                        std::same_as<T, int> ||
                        std::same_as<T, long> ||
                        std::same_as<T, size_t> ||
                        std::same_as<T, bool>;

    namespace detail {

        inline std::unordered_map<std::string, std::string, util::string_hash, util::string_equal>& get_cache() noexcept {
            static thread_local std::unordered_map<std::string, std::string, util::string_hash, util::string_equal> g_cache;
            return g_cache;
        }

        template <Supported T>
        T convert(std::string_view value, const std::string& key);

        template <>
        inline std::string convert<std::string>(std::string_view value, const std::string&) {
            return std::string(value);
        }

        template <std::integral I>
        I convert_integral(std::string_view value, const std::string& key, std::string_view type_name) {
            I result{};
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                throw error("invalid " + std::string(type_name) + " for key '" + key + "': " + std::string(value));
            }
            return result;
        }

        template <>
        inline int convert<int>(std::string_view value, const std::string& key) {
            return convert_integral<int>(value, key, "int");
        }

        template <>
        inline long convert<long>(std::string_view value, const std::string& key) {
            return convert_integral<long>(value, key, "long");
        }

        template <>
        inline size_t convert<size_t>(std::string_view value, const std::string& key) {
            // Note: std::from_chars is strict and does not skip whitespace.
            return convert_integral<size_t>(value, key, "size_t");
        }

        template <>
        inline bool convert<bool>(std::string_view value, const std::string& key) {
            if (value == "1") return true;
            if (value == "0") return false;
            throw error("invalid bool for key '" + key + "' (expected '0' or '1'): " + std::string(value));
        }

        inline std::string fetch_string(std::string_view key) {
            auto& cache = get_cache();
            if (auto it = cache.find(key); it != cache.end()) {
                return it->second;
            }

            // std::getenv requires a null-terminated string.
            const std::string key_str(key);
            const char* raw = std::getenv(key_str.c_str());
            if (!raw) throw error("missing environment variable: " + key_str);

            std::string value = raw;
            if (value.ends_with(".enc")) {
                // The key location is read straight from the environment, it cannot itself be encrypted.
                const char* key_path = std::getenv("MFA_PRIVATE_KEY");
                const auto result = pkey::decrypt_file(value, key_path ? key_path : "private.pem");
                if (!result.success) {
                    throw error("decryption failed for file '" + value + "' (from key '" + key_str + "'): " + result.content);
                }
                value = result.content;
            }

            cache[key_str] = value;
            return value;
        }
    } // namespace detail


    /**
     * @brief Gets an environment variable with type conversion.
     */
    template <Supported T>
    [[nodiscard]] inline T get(const std::string& key) {
        const std::string value = detail::fetch_string(key);
        return detail::convert<T>(value, key);
    }

    /**
     * @brief Gets an environment variable with fallback.
     *
     * Only a missing variable falls back; a present but malformed value is
     * still an error.
     */
    template <Supported T>
    [[nodiscard]] inline T get(const std::string& key, const T& fallback) {
        if (!detail::get_cache().contains(key) && std::getenv(key.c_str()) == nullptr) {
            return fallback;
        }
        return get<T>(key);
    }

    /**
     * @brief Drops the values cached by the calling thread so the next get() re-reads the environment.
     */
    inline void clear_cache() noexcept {
        detail::get_cache().clear();
    }
}

#endif // MFA_ENV_HPP
