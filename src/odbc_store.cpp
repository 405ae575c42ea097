#include "odbc_store.hpp"
#include "sql.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <ranges>

namespace mfa {

namespace {

    constexpr std::string_view select_columns =
        "SELECT id, user_id, method, status, secret, phone_number, last_used_step, backup_codes, "
        "failed_attempts, locked_until, last_used, created_at, updated_at, version FROM mfa_settings ";

    const std::string find_one_sql = std::string(select_columns) + "WHERE user_id = ? AND method = ?";
    const std::string find_all_sql = std::string(select_columns) + "WHERE user_id = ?";

    constexpr std::string_view upsert_sql =
        "INSERT INTO mfa_settings (id, user_id, method, status, secret, phone_number, last_used_step, backup_codes, "
        "failed_attempts, locked_until, last_used, created_at, updated_at, version) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 1) "
        "ON CONFLICT (user_id, method) DO UPDATE SET "
        "status = EXCLUDED.status, secret = EXCLUDED.secret, phone_number = EXCLUDED.phone_number, "
        "last_used_step = EXCLUDED.last_used_step, backup_codes = EXCLUDED.backup_codes, "
        "failed_attempts = EXCLUDED.failed_attempts, locked_until = EXCLUDED.locked_until, "
        "last_used = EXCLUDED.last_used, updated_at = EXCLUDED.updated_at, version = mfa_settings.version + 1";

    constexpr std::string_view cas_sql =
        "UPDATE mfa_settings SET status = ?, secret = ?, phone_number = ?, last_used_step = ?, backup_codes = ?, "
        "failed_attempts = ?, locked_until = ?, last_used = ?, updated_at = ?, version = version + 1 "
        "WHERE user_id = ? AND method = ? AND version = ?";

    constexpr std::string_view close_challenges_sql =
        "UPDATE mfa_challenges SET consumed = 1 WHERE user_id = ? AND method = ? AND consumed = 0";

    constexpr std::string_view insert_challenge_sql =
        "INSERT INTO mfa_challenges (id, user_id, method, code_hash, issued_at, expires_at, consumed) "
        "VALUES (?, ?, ?, ?, ?, ?, 0)";

    constexpr std::string_view consume_challenge_sql =
        "UPDATE mfa_challenges SET consumed = 1 "
        "WHERE user_id = ? AND method = ? AND code_hash = ? AND consumed = 0 AND expires_at > ?";

    constexpr std::string_view count_challenges_sql =
        "SELECT COUNT(*) AS issued FROM mfa_challenges WHERE user_id = ? AND issued_at >= ?";

    constexpr std::string_view revoke_bypasses_sql =
        "UPDATE mfa_bypasses SET used = 1 WHERE user_id = ? AND used = 0";

    constexpr std::string_view insert_bypass_sql =
        "INSERT INTO mfa_bypasses (id, user_id, token_hash, approved_by, reason, created_at, expires_at, used, used_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, 0, 0)";

    constexpr std::string_view consume_bypass_sql =
        "UPDATE mfa_bypasses SET used = 1, used_at = ? "
        "WHERE user_id = ? AND token_hash = ? AND used = 0 AND expires_at > ?";

    long long to_column(const std::optional<time_point>& tp) {
        return tp ? util::to_unix_millis(*tp) : 0LL;
    }

    long long deadline_column(const std::optional<time_point>& tp) {
        return tp ? util::to_unix_millis_ceil(*tp) : 0LL;
    }

    std::optional<time_point> from_column(long long millis) {
        if (millis == 0) {
            return std::nullopt;
        }
        return util::from_unix_millis(millis);
    }

    std::string join_codes(const std::vector<std::string>& codes) {
        std::string joined;
        for (const auto& code : codes) {
            if (!joined.empty()) {
                joined.push_back(',');
            }
            joined += code;
        }
        return joined;
    }

    /// @brief Method-specific columns of a row: secret, phone_number, last_used_step.
    struct factor_columns {
        std::string secret;
        std::string phone_number;
        long long last_used_step{-1};
    };

    factor_columns columns_of(const factor& details) {
        factor_columns cols;
        if (const auto* totp = std::get_if<totp_factor>(&details)) {
            cols.secret = totp->secret;
            cols.last_used_step = totp->last_used_step.value_or(-1);
        } else if (const auto* sms = std::get_if<sms_factor>(&details)) {
            cols.phone_number = sms->phone_number;
        }
        return cols;
    }

    mfa_setting to_setting(const sql::row& r) {
        const auto method_name = r.get_value<std::string>("method");
        const auto kind = parse_method(method_name);
        if (!kind) {
            throw sql::error(std::format("unknown MFA method '{}' in mfa_settings", method_name));
        }
        const auto status_name = r.get_value<std::string>("status");
        const auto state = parse_status(status_name);
        if (!state) {
            throw sql::error(std::format("unknown MFA status '{}' in mfa_settings", status_name));
        }

        mfa_setting s;
        s.id = r.get_value<std::string>("id");
        s.user_id = r.get_value<std::string>("user_id");
        s.state = *state;
        switch (*kind) {
            case method::totp: {
                const auto step = r.get_value<long long>("last_used_step");
                s.details = totp_factor{
                    r.is_null("secret") ? std::string{} : r.get_value<std::string>("secret"),
                    step < 0 ? std::nullopt : std::optional<std::int64_t>{step}
                };
                break;
            }
            case method::sms:
                s.details = sms_factor{r.is_null("phone_number") ? std::string{} : r.get_value<std::string>("phone_number")};
                break;
            case method::email:
                s.details = email_factor{};
                break;
            case method::backup_code:
                s.details = backup_code_factor{};
                break;
        }
        if (!r.is_null("backup_codes")) {
            s.backup_codes = util::split(r.get_value<std::string>("backup_codes"), ',');
        }
        s.attempts.failed_attempts = r.get_value<int>("failed_attempts");
        s.attempts.locked_until = from_column(r.get_value<long long>("locked_until"));
        s.last_used = from_column(r.get_value<long long>("last_used"));
        s.created_at = util::from_unix_millis(r.get_value<long long>("created_at"));
        s.updated_at = util::from_unix_millis(r.get_value<long long>("updated_at"));
        s.version = static_cast<std::uint64_t>(r.get_value<long long>("version"));
        return s;
    }

} // anonymous namespace

// --- odbc_settings_store ---

odbc_settings_store::odbc_settings_store(std::string db_key, clock_fn clock)
    : m_db_key{std::move(db_key)}, m_clock{std::move(clock)} {}

std::optional<mfa_setting> odbc_settings_store::find_one(std::string_view user_id, method m) {
    const auto rs = sql::query(m_db_key, find_one_sql, user_id, to_string(m));
    if (rs.empty()) {
        return std::nullopt;
    }
    return to_setting(rs.at(0));
}

std::vector<mfa_setting> odbc_settings_store::find_all(std::string_view user_id) {
    const auto rs = sql::query(m_db_key, find_all_sql, user_id);
    std::vector<mfa_setting> rows;
    rows.reserve(rs.size());
    for (const auto& r : rs) {
        rows.push_back(to_setting(r));
    }
    std::ranges::sort(rows, {}, [](const mfa_setting& s) { return static_cast<int>(s.kind()); });
    return rows;
}

mfa_setting odbc_settings_store::upsert(const mfa_setting& setting) {
    const auto now = util::to_unix_millis(m_clock());
    const auto cols = columns_of(setting.details);
    sql::exec(m_db_key, upsert_sql,
              util::get_uuid(), setting.user_id, to_string(setting.kind()), to_string(setting.state),
              cols.secret, cols.phone_number, cols.last_used_step, join_codes(setting.backup_codes),
              setting.attempts.failed_attempts, deadline_column(setting.attempts.locked_until), to_column(setting.last_used),
              now, now);

    auto stored = find_one(setting.user_id, setting.kind());
    if (!stored) {
        throw sql::error(std::format("mfa_settings row for user '{}' vanished after upsert", setting.user_id));
    }
    return std::move(*stored);
}

bool odbc_settings_store::update_if_unchanged(const mfa_setting& setting) {
    const auto cols = columns_of(setting.details);
    const auto affected = sql::exec(m_db_key, cas_sql,
              to_string(setting.state), cols.secret, cols.phone_number, cols.last_used_step, join_codes(setting.backup_codes),
              setting.attempts.failed_attempts, deadline_column(setting.attempts.locked_until), to_column(setting.last_used),
              util::to_unix_millis(m_clock()),
              setting.user_id, to_string(setting.kind()), static_cast<long long>(setting.version));
    return affected == 1;
}

// --- odbc_challenge_store ---

odbc_challenge_store::odbc_challenge_store(std::string db_key, clock_fn clock)
    : m_db_key{std::move(db_key)}, m_clock{std::move(clock)} {}

void odbc_challenge_store::save(std::string_view user_id, method m, std::string_view code_hash, std::chrono::seconds ttl) {
    const auto now = m_clock();
    sql::exec(m_db_key, close_challenges_sql, user_id, to_string(m));
    sql::exec(m_db_key, insert_challenge_sql,
              util::get_uuid(), user_id, to_string(m), code_hash,
              util::to_unix_millis(now), util::to_unix_millis_ceil(now + ttl));
}

bool odbc_challenge_store::consume(std::string_view user_id, method m, std::string_view code_hash) {
    const auto affected = sql::exec(m_db_key, consume_challenge_sql,
              user_id, to_string(m), code_hash, util::to_unix_millis(m_clock()));
    return affected > 0;
}

std::size_t odbc_challenge_store::count_issued_since(std::string_view user_id, time_point since) {
    const auto rs = sql::query(m_db_key, count_challenges_sql, user_id, util::to_unix_millis(since));
    if (rs.empty()) {
        return 0;
    }
    return static_cast<std::size_t>(rs.at(0).get_value<long long>("issued"));
}

// --- odbc_bypass_store ---

odbc_bypass_store::odbc_bypass_store(std::string db_key, clock_fn clock)
    : m_db_key{std::move(db_key)}, m_clock{std::move(clock)} {}

void odbc_bypass_store::save(const bypass_grant& grant) {
    sql::exec(m_db_key, revoke_bypasses_sql, grant.user_id);
    sql::exec(m_db_key, insert_bypass_sql,
              util::get_uuid(), grant.user_id, grant.token_hash, grant.approved_by, grant.reason,
              util::to_unix_millis(m_clock()), util::to_unix_millis_ceil(grant.expires_at));
}

bool odbc_bypass_store::consume(std::string_view user_id, std::string_view token_hash) {
    const auto now = util::to_unix_millis(m_clock());
    const auto affected = sql::exec(m_db_key, consume_bypass_sql, now, user_id, token_hash, now);
    return affected > 0;
}

// --- odbc_user_directory ---

odbc_user_directory::odbc_user_directory(std::string db_key, std::string role_query)
    : m_db_key{std::move(db_key)}, m_role_query{std::move(role_query)} {}

std::optional<std::string> odbc_user_directory::role_of(std::string_view user_id) {
    const auto rs = sql::query(m_db_key, m_role_query, user_id);
    if (rs.empty() || rs.at(0).is_null("role")) {
        return std::nullopt;
    }
    return rs.at(0).get_value<std::string>("role");
}

} // namespace mfa
