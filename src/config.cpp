#include "config.hpp"
#include "env.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <algorithm>

namespace mfa {

namespace {
    constexpr std::size_t vault_key_bytes = 32;
    constexpr std::size_t min_trust_secret_bytes = 32;

    template<typename T>
    T require_positive(const std::string& key, T value) {
        if (value <= 0) {
            throw config_error(std::format("{} must be greater than zero", key));
        }
        return value;
    }

    std::string require_secret(const std::string& key) {
        try {
            return env::get<std::string>(key);
        } catch (const env::error& e) {
            throw config_error(std::format("{} is not configured ({})", key, e.what()));
        }
    }
}

bool options::is_mfa_required(std::string_view role) const {
    return std::ranges::find(mfa_required_roles, role) != mfa_required_roles.end();
}

bool options::is_admin(std::string_view role) const {
    return std::ranges::find(admin_roles, role) != admin_roles.end();
}

options load_options() {
    options opts;
    opts.issuer = env::get<std::string>("MFA_ISSUER", opts.issuer);
    if (opts.issuer.empty() || opts.issuer.contains(':')) {
        throw config_error("MFA_ISSUER must be non-empty and must not contain ':'");
    }
    opts.max_attempts = require_positive("MFA_MAX_ATTEMPTS", env::get<int>("MFA_MAX_ATTEMPTS", opts.max_attempts));
    opts.lockout_cooldown = std::chrono::seconds{
        require_positive("MFA_LOCKOUT_SECONDS", env::get<long>("MFA_LOCKOUT_SECONDS", opts.lockout_cooldown.count()))};
    opts.backup_code_count = require_positive("MFA_BACKUP_CODE_COUNT", env::get<size_t>("MFA_BACKUP_CODE_COUNT", opts.backup_code_count));
    opts.challenge_ttl = std::chrono::seconds{
        require_positive("MFA_CHALLENGE_TTL_SECONDS", env::get<long>("MFA_CHALLENGE_TTL_SECONDS", opts.challenge_ttl.count()))};
    opts.daily_challenge_limit = require_positive("MFA_DAILY_CHALLENGE_LIMIT", env::get<size_t>("MFA_DAILY_CHALLENGE_LIMIT", opts.daily_challenge_limit));
    opts.trust_device_ttl = std::chrono::hours{
        24 * require_positive("MFA_TRUST_DEVICE_DAYS", env::get<long>("MFA_TRUST_DEVICE_DAYS", opts.trust_device_ttl.count() / 24))};
    opts.totp_replay_protection = env::get<bool>("MFA_TOTP_REPLAY_PROTECTION", opts.totp_replay_protection);

    if (const auto roles = env::get<std::string>("MFA_REQUIRED_ROLES", ""); !roles.empty()) {
        opts.mfa_required_roles = util::split(roles, ',');
    }
    opts.bypass_ttl = std::chrono::seconds{
        require_positive("MFA_BYPASS_TTL_SECONDS", env::get<long>("MFA_BYPASS_TTL_SECONDS", opts.bypass_ttl.count()))};
    if (const auto roles = env::get<std::string>("MFA_ADMIN_ROLES", ""); !roles.empty()) {
        opts.admin_roles = util::split(roles, ',');
    }

    log::info("MFA options loaded: issuer '{}', {} attempts, {}s lockout, {} backup codes, {}s challenge ttl",
              opts.issuer, opts.max_attempts, opts.lockout_cooldown.count(), opts.backup_code_count, opts.challenge_ttl.count());
    return opts;
}

secrets load_secrets() {
    secrets s;

    const auto key_hex = require_secret("MFA_ENCRYPTION_KEY");
    auto key = util::from_hex(key_hex);
    if (!key || key->size() != vault_key_bytes) {
        throw config_error("MFA_ENCRYPTION_KEY must be 64 hexadecimal characters (256 bits)");
    }
    s.encryption_key = std::move(*key);

    s.trust_token_secret = require_secret("MFA_TRUST_SECRET");
    if (s.trust_token_secret.size() < min_trust_secret_bytes) {
        throw config_error(std::format("MFA_TRUST_SECRET must be at least {} bytes long", min_trust_secret_bytes));
    }
    return s;
}

} // namespace mfa
