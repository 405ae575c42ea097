#include "memory_store.hpp"
#include "config.hpp"
#include <algorithm>

namespace mfa {

// --- memory_settings_store ---

std::optional<mfa_setting> memory_settings_store::find_one(std::string_view user_id, method m) {
    std::scoped_lock lock(m_mutex);
    if (auto it = m_rows.find(key_type{std::string(user_id), m}); it != m_rows.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<mfa_setting> memory_settings_store::find_all(std::string_view user_id) {
    std::scoped_lock lock(m_mutex);
    std::vector<mfa_setting> rows;
    for (const auto& [key, setting] : m_rows) {
        if (key.first == user_id) {
            rows.push_back(setting);
        }
    }
    return rows;
}

mfa_setting memory_settings_store::upsert(const mfa_setting& setting) {
    std::scoped_lock lock(m_mutex);
    const auto now = m_clock();
    key_type key{setting.user_id, setting.kind()};

    mfa_setting stored = setting;
    stored.updated_at = now;
    if (auto it = m_rows.find(key); it != m_rows.end()) {
        stored.id = it->second.id;
        stored.created_at = it->second.created_at;
        stored.version = it->second.version + 1;
        it->second = stored;
    } else {
        stored.id = util::get_uuid();
        stored.created_at = now;
        stored.version = 1;
        m_rows.emplace(std::move(key), stored);
    }
    return stored;
}

bool memory_settings_store::update_if_unchanged(const mfa_setting& setting) {
    std::scoped_lock lock(m_mutex);
    auto it = m_rows.find(key_type{setting.user_id, setting.kind()});
    if (it == m_rows.end() || it->second.version != setting.version) {
        return false;
    }
    mfa_setting stored = setting;
    stored.id = it->second.id;
    stored.created_at = it->second.created_at;
    stored.updated_at = m_clock();
    stored.version = setting.version + 1;
    it->second = std::move(stored);
    return true;
}

// --- memory_challenge_store ---

void memory_challenge_store::save(std::string_view user_id, method m, std::string_view code_hash, std::chrono::seconds ttl) {
    std::scoped_lock lock(m_mutex);
    const auto now = m_clock();
    m_open[{std::string(user_id), m}] = open_challenge{std::string(code_hash), now + ttl};

    auto [it, inserted] = m_issued.try_emplace(std::string(user_id));
    const auto cutoff = now - challenge_budget_window;
    std::erase_if(it->second, [cutoff](time_point t) { return t < cutoff; });
    it->second.push_back(now);
}

bool memory_challenge_store::consume(std::string_view user_id, method m, std::string_view code_hash) {
    std::scoped_lock lock(m_mutex);
    auto it = m_open.find({std::string(user_id), m});
    if (it == m_open.end()) {
        return false;
    }
    if (m_clock() >= it->second.expires_at) {
        m_open.erase(it);
        return false;
    }
    if (it->second.code_hash != code_hash) {
        return false;
    }
    m_open.erase(it);
    return true;
}

std::size_t memory_challenge_store::count_issued_since(std::string_view user_id, time_point since) {
    std::scoped_lock lock(m_mutex);
    const auto it = m_issued.find(user_id);
    if (it == m_issued.end()) {
        return 0;
    }
    return static_cast<std::size_t>(std::ranges::count_if(it->second, [since](time_point t) { return t >= since; }));
}

// --- memory_bypass_store ---

void memory_bypass_store::save(const bypass_grant& grant) {
    std::scoped_lock lock(m_mutex);
    m_open.insert_or_assign(grant.user_id, grant);
}

bool memory_bypass_store::consume(std::string_view user_id, std::string_view token_hash) {
    std::scoped_lock lock(m_mutex);
    auto it = m_open.find(user_id);
    if (it == m_open.end()) {
        return false;
    }
    if (m_clock() >= it->second.expires_at) {
        m_open.erase(it);
        return false;
    }
    if (it->second.token_hash != token_hash) {
        return false;
    }
    m_open.erase(it);
    return true;
}

// --- memory_user_directory ---

void memory_user_directory::add_user(std::string user_id, std::string role) {
    std::scoped_lock lock(m_mutex);
    m_roles.insert_or_assign(std::move(user_id), std::move(role));
}

std::optional<std::string> memory_user_directory::role_of(std::string_view user_id) {
    std::scoped_lock lock(m_mutex);
    if (auto it = m_roles.find(user_id); it != m_roles.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace mfa
