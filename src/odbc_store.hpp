#ifndef MFA_ODBC_STORE_HPP
#define MFA_ODBC_STORE_HPP

#include "stores.hpp"
#include <string>

/**
 * @file odbc_store.hpp
 * @brief Store adapters over the tables in db/schema.sql.
 *
 * `db_key` names the environment variable holding the ODBC connection string.
 * Timestamps are stored as Unix milliseconds with 0 meaning "none"; absent
 * ciphertexts are stored as empty strings.
 */

namespace mfa {

class odbc_settings_store : public settings_store {
public:
    explicit odbc_settings_store(std::string db_key, clock_fn clock = system_now);

    [[nodiscard]] std::optional<mfa_setting> find_one(std::string_view user_id, method m) override;
    [[nodiscard]] std::vector<mfa_setting> find_all(std::string_view user_id) override;
    mfa_setting upsert(const mfa_setting& setting) override;
    [[nodiscard]] bool update_if_unchanged(const mfa_setting& setting) override;

private:
    std::string m_db_key;
    clock_fn m_clock;
};

class odbc_challenge_store : public challenge_store {
public:
    explicit odbc_challenge_store(std::string db_key, clock_fn clock = system_now);

    void save(std::string_view user_id, method m, std::string_view code_hash, std::chrono::seconds ttl) override;
    [[nodiscard]] bool consume(std::string_view user_id, method m, std::string_view code_hash) override;
    [[nodiscard]] std::size_t count_issued_since(std::string_view user_id, time_point since) override;

private:
    std::string m_db_key;
    clock_fn m_clock;
};

class odbc_bypass_store : public bypass_store {
public:
    explicit odbc_bypass_store(std::string db_key, clock_fn clock = system_now);

    void save(const bypass_grant& grant) override;
    [[nodiscard]] bool consume(std::string_view user_id, std::string_view token_hash) override;

private:
    std::string m_db_key;
    clock_fn m_clock;
};

class odbc_user_directory : public user_directory {
public:
    /// @param role_query SQL with one `?` for the user id, returning a column named `role`.
    odbc_user_directory(std::string db_key, std::string role_query);

    [[nodiscard]] std::optional<std::string> role_of(std::string_view user_id) override;

private:
    std::string m_db_key;
    std::string m_role_query;
};

} // namespace mfa

#endif // MFA_ODBC_STORE_HPP
