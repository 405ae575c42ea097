#ifndef MFA_MEMORY_STORE_HPP
#define MFA_MEMORY_STORE_HPP

#include "stores.hpp"
#include "util.hpp"
#include <map>
#include <unordered_map>
#include <mutex>
#include <utility>

/**
 * @file memory_store.hpp
 * @brief Process-local implementations of the store interfaces, for tests and
 * single-process embedding. Every operation holds one mutex, which gives the
 * per-row atomicity the managers rely on.
 */

namespace mfa {

class memory_settings_store : public settings_store {
public:
    explicit memory_settings_store(clock_fn clock = system_now) : m_clock{std::move(clock)} {}

    [[nodiscard]] std::optional<mfa_setting> find_one(std::string_view user_id, method m) override;
    [[nodiscard]] std::vector<mfa_setting> find_all(std::string_view user_id) override;
    mfa_setting upsert(const mfa_setting& setting) override;
    [[nodiscard]] bool update_if_unchanged(const mfa_setting& setting) override;

private:
    using key_type = std::pair<std::string, method>;

    clock_fn m_clock;
    std::mutex m_mutex;
    std::map<key_type, mfa_setting> m_rows;
};

class memory_challenge_store : public challenge_store {
public:
    explicit memory_challenge_store(clock_fn clock = system_now) : m_clock{std::move(clock)} {}

    void save(std::string_view user_id, method m, std::string_view code_hash, std::chrono::seconds ttl) override;
    [[nodiscard]] bool consume(std::string_view user_id, method m, std::string_view code_hash) override;
    [[nodiscard]] std::size_t count_issued_since(std::string_view user_id, time_point since) override;

private:
    struct open_challenge {
        std::string code_hash;
        time_point expires_at;
    };

    clock_fn m_clock;
    std::mutex m_mutex;
    std::map<std::pair<std::string, method>, open_challenge> m_open;
    std::unordered_map<std::string, std::vector<time_point>, util::string_hash, util::string_equal> m_issued;
};

class memory_bypass_store : public bypass_store {
public:
    explicit memory_bypass_store(clock_fn clock = system_now) : m_clock{std::move(clock)} {}

    void save(const bypass_grant& grant) override;
    [[nodiscard]] bool consume(std::string_view user_id, std::string_view token_hash) override;

private:
    clock_fn m_clock;
    std::mutex m_mutex;
    std::unordered_map<std::string, bypass_grant, util::string_hash, util::string_equal> m_open;
};

class memory_user_directory : public user_directory {
public:
    void add_user(std::string user_id, std::string role);

    [[nodiscard]] std::optional<std::string> role_of(std::string_view user_id) override;

private:
    std::mutex m_mutex;
    std::unordered_map<std::string, std::string, util::string_hash, util::string_equal> m_roles;
};

} // namespace mfa

#endif // MFA_MEMORY_STORE_HPP
