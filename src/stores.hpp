#ifndef MFA_STORES_HPP
#define MFA_STORES_HPP

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>

/**
 * @file stores.hpp
 * @brief The persistence collaborators the managers are written against.
 */

namespace mfa {

/**
 * @class settings_store
 * @brief Durable MFA settings, unique per (user_id, method).
 */
class settings_store {
public:
    virtual ~settings_store() = default;

    [[nodiscard]] virtual std::optional<mfa_setting> find_one(std::string_view user_id, method m) = 0;

    /// @brief All rows of the user, in method order.
    [[nodiscard]] virtual std::vector<mfa_setting> find_all(std::string_view user_id) = 0;

    /**
     * @brief Inserts the row or replaces the existing (user_id, method) row
     * unconditionally. The store assigns id (on insert), created_at is kept
     * from the existing row, and version is bumped.
     * @return The row as stored.
     */
    virtual mfa_setting upsert(const mfa_setting& setting) = 0;

    /**
     * @brief Atomic compare-and-swap: writes `setting` only if the stored row
     * still carries `setting.version`.
     * @return false when another writer got there first.
     */
    [[nodiscard]] virtual bool update_if_unchanged(const mfa_setting& setting) = 0;
};

/**
 * @class challenge_store
 * @brief Short-lived SMS/email challenge codes, held as digests.
 *
 * Expiry is the store's concern: consume() never matches an expired code.
 */
class challenge_store {
public:
    virtual ~challenge_store() = default;

    /// @brief Records a new challenge, superseding any open one for (user_id, method).
    virtual void save(std::string_view user_id, method m, std::string_view code_hash, std::chrono::seconds ttl) = 0;

    /// @brief True and invalidated when `code_hash` matches the open, unexpired challenge.
    [[nodiscard]] virtual bool consume(std::string_view user_id, method m, std::string_view code_hash) = 0;

    /// @brief Number of challenges issued to the user at or after `since`, any method.
    [[nodiscard]] virtual std::size_t count_issued_since(std::string_view user_id, time_point since) = 0;
};

/// @brief An administrator-approved, single-use emergency bypass of MFA.
struct bypass_grant {
    std::string user_id;
    std::string token_hash;
    std::string approved_by;
    std::string reason;
    time_point expires_at{};
};

/**
 * @class bypass_store
 * @brief Emergency bypass grants, held as digests. At most one grant per user is open.
 */
class bypass_store {
public:
    virtual ~bypass_store() = default;

    /// @brief Records a grant, revoking any open grant of the same user.
    virtual void save(const bypass_grant& grant) = 0;

    /// @brief True and marked used when `token_hash` matches the user's open, unexpired grant.
    [[nodiscard]] virtual bool consume(std::string_view user_id, std::string_view token_hash) = 0;
};

/// @brief Role lookup owned by the primary authentication system.
class user_directory {
public:
    virtual ~user_directory() = default;

    [[nodiscard]] virtual std::optional<std::string> role_of(std::string_view user_id) = 0;
};

} // namespace mfa

#endif // MFA_STORES_HPP
