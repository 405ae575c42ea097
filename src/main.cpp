#include "mfa_service.hpp"
#include "odbc_store.hpp"
#include "sql.hpp"
#include "env.hpp"
#include "logger.hpp"
#include "input_validator.hpp"
#include "json_parser.hpp"
#include "util.hpp"
#include <openssl/rand.h>
#include <functional>
#include <iostream>
#include <map>
#include <string_view>
#include <ranges>

/**
 * @file main.cpp
 * @brief mfactl: operator command line for the MFA subsystem.
 *
 *   mfactl <command> [--name value ...]
 *
 * The result is printed as one JSON object on the last line of stdout.
 * Exit codes: 0 success, 1 the code was rejected, 2 error.
 */

using namespace mfa;
using namespace mfa::validation;

namespace {

constexpr int exit_ok = 0;
constexpr int exit_rejected = 1;
constexpr int exit_error = 2;

constexpr std::string_view db_key = "MFA_DB";
constexpr std::string_view default_role_query = "SELECT role FROM users WHERE id = ?";

using handler = std::function<int(mfa_service&, const arguments&)>;

// --- Validators ---

const auto is_method = [](const method&) { return true; };

const validator user_validator{
    rule<std::string>{"user", requirement::required},
    rule<std::string>{"email", requirement::optional}
};

const validator identity_validator{
    rule<std::string>{"user", requirement::required},
    rule<std::string>{"email", requirement::required, [](const std::string& s) { return is_email(s); }, "A valid email address is required."}
};

const validator sms_validator{
    rule<std::string>{"user", requirement::required},
    rule<std::string>{"email", requirement::required, [](const std::string& s) { return is_email(s); }, "A valid email address is required."},
    rule<std::string>{"phone", requirement::required, [](const std::string& s) { return is_e164(s); }, "Phone number must be in E.164 format."}
};

const validator code_validator{
    rule<std::string>{"user", requirement::required},
    rule<std::string>{"email", requirement::required},
    rule<method>{"method", requirement::required, is_method, "Unknown MFA method."},
    rule<std::string>{"code", requirement::required}
};

const validator method_validator{
    rule<std::string>{"user", requirement::required},
    rule<std::string>{"email", requirement::required},
    rule<method>{"method", requirement::required, is_method, "Unknown MFA method."},
    rule<std::string>{"admin", requirement::optional}
};

const validator bypass_grant_validator{
    rule<std::string>{"user", requirement::required},
    rule<std::string>{"email", requirement::required},
    rule<std::string>{"admin", requirement::required},
    rule<std::string>{"reason", requirement::required}
};

const validator bypass_redeem_validator{
    rule<std::string>{"user", requirement::required},
    rule<std::string>{"email", requirement::required},
    rule<std::string>{"token", requirement::required}
};


// --- Helpers ---

std::string arg(const arguments& args, std::string_view name) {
    const auto it = args.find(name);
    return it == args.end() ? std::string{} : it->second;
}

method method_arg(const arguments& args) {
    const auto m = parse_method(arg(args, "method"));
    if (!m) {
        throw validation_error("method", validation_error::error_type::invalid_format, "Unknown MFA method.");
    }
    return *m;
}

std::string join(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined.push_back(',');
        }
        joined += item;
    }
    return joined;
}

void print(const json::string_map& fields) {
    std::cout << json::json_parser::build(fields) << std::endl;
}

int print_error(std::string_view code, std::string_view message, json::string_map extra = {}) {
    extra.insert_or_assign("success", "false");
    extra.insert_or_assign("error", std::string(code));
    extra.insert_or_assign("message", std::string(message));
    print(extra);
    return exit_error;
}

arguments parse_arguments(int argc, char* argv[]) {
    arguments args;
    for (int i = 2; i < argc; i += 2) {
        const std::string_view name{argv[i]};
        if (!name.starts_with("--") || name.size() < 3) {
            throw validation_error(std::string(name), validation_error::error_type::invalid_format, "Options look like --name value.");
        }
        if (i + 1 >= argc) {
            throw validation_error(std::string(name.substr(2)), validation_error::error_type::missing_required_param, "Option has no value.");
        }
        args.insert_or_assign(std::string(name.substr(2)), std::string(argv[i + 1]));
    }
    return args;
}

std::string random_hex(std::size_t bytes) {
    std::string raw(bytes, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(raw.data()), static_cast<int>(raw.size())) != 1) {
        throw error("RAND_bytes failed");
    }
    return util::to_hex(raw);
}


// --- Commands ---

int keygen() {
    print({
        {"success", "true"},
        {"MFA_ENCRYPTION_KEY", random_hex(32)},
        {"MFA_TRUST_SECRET", random_hex(32)}
    });
    return exit_ok;
}

int status_command(mfa_service& service, const arguments& args) {
    const auto user = arg(args, "user");
    const auto st = service.get_status(user);

    std::vector<std::string> methods;
    for (const method m : st.methods) {
        methods.emplace_back(to_string(m));
    }
    print({
        {"success", "true"},
        {"userId", user},
        {"isEnabled", st.is_enabled ? "true" : "false"},
        {"isRequired", st.is_required ? "true" : "false"},
        {"methods", join(methods)},
        {"status", std::string(to_string(st.overall))},
        {"lastUsed", st.last_used ? std::to_string(util::to_unix_seconds(*st.last_used)) : ""},
        {"backupCodesRemaining", std::to_string(st.backup_codes_remaining)}
    });
    return exit_ok;
}

int setup_totp_command(mfa_service& service, const arguments& args) {
    const auto result = service.enrollment().setup_totp(arg(args, "user"), arg(args, "email"));
    print({
        {"success", "true"},
        {"secret", result.secret},
        {"uri", result.uri},
        {"backupCodes", join(result.backup_codes)}
    });
    return exit_ok;
}

int setup_sms_command(mfa_service& service, const arguments& args) {
    const auto result = service.enrollment().setup_sms(arg(args, "user"), arg(args, "email"), arg(args, "phone"));
    print({
        {"success", "true"},
        {"maskedPhone", result.masked_destination},
        {"backupCodes", join(result.backup_codes)}
    });
    return exit_ok;
}

int setup_email_command(mfa_service& service, const arguments& args) {
    const auto result = service.enrollment().setup_email(arg(args, "user"), arg(args, "email"));
    print({
        {"success", "true"},
        {"maskedEmail", result.masked_destination},
        {"backupCodes", join(result.backup_codes)}
    });
    return exit_ok;
}

int verify_setup_command(mfa_service& service, const arguments& args) {
    const auto result = service.enrollment().verify_setup(arg(args, "user"), arg(args, "email"), method_arg(args), arg(args, "code"));
    if (!result.success) {
        print({{"success", "false"}});
        return exit_rejected;
    }
    print({{"success", "true"}, {"backupCodes", join(result.backup_codes)}});
    return exit_ok;
}

int challenge_command(mfa_service& service, const arguments& args) {
    service.verification().send_challenge(arg(args, "user"), arg(args, "email"), method_arg(args));
    print({{"success", "true"}});
    return exit_ok;
}

int verify_command(mfa_service& service, const arguments& args) {
    const bool trust_device = arg(args, "trust-device") == "1" || arg(args, "trust-device") == "true";
    const auto result = service.verification().verify(arg(args, "user"), arg(args, "email"), method_arg(args), arg(args, "code"), trust_device);
    if (!result.success) {
        print({{"success", "false"}});
        return exit_rejected;
    }
    json::string_map out{{"success", "true"}};
    if (result.trust_token) {
        out.emplace("trustToken", *result.trust_token);
    }
    print(out);
    return exit_ok;
}

int disable_command(mfa_service& service, const arguments& args) {
    const auto admin = arg(args, "admin");
    service.verification().disable(arg(args, "user"), arg(args, "email"), method_arg(args),
                                   admin.empty() ? std::nullopt : std::optional<std::string_view>{admin});
    print({{"success", "true"}});
    return exit_ok;
}

int backup_codes_command(mfa_service& service, const arguments& args) {
    const auto codes = service.regenerate_backup_codes(arg(args, "user"), arg(args, "email"));
    print({{"success", "true"}, {"backupCodes", join(codes)}});
    return exit_ok;
}

int bypass_grant_command(mfa_service& service, const arguments& args) {
    const auto token = service.bypass().grant(arg(args, "user"), arg(args, "email"), arg(args, "admin"), arg(args, "reason"));
    print({{"success", "true"}, {"bypassToken", token}});
    return exit_ok;
}

int bypass_redeem_command(mfa_service& service, const arguments& args) {
    if (!service.bypass().redeem(arg(args, "user"), arg(args, "email"), arg(args, "token"))) {
        print({{"success", "false"}});
        return exit_rejected;
    }
    print({{"success", "true"}});
    return exit_ok;
}

struct command {
    std::function<void(const arguments&)> validate;
    handler run;
};

const std::map<std::string, command, std::less<>>& commands() {
    static const std::map<std::string, command, std::less<>> table = {
        {"status",       {[](const arguments& a) { user_validator.validate(a); }, &status_command}},
        {"setup-totp",   {[](const arguments& a) { identity_validator.validate(a); }, &setup_totp_command}},
        {"setup-sms",    {[](const arguments& a) { sms_validator.validate(a); }, &setup_sms_command}},
        {"setup-email",  {[](const arguments& a) { identity_validator.validate(a); }, &setup_email_command}},
        {"verify-setup", {[](const arguments& a) { code_validator.validate(a); }, &verify_setup_command}},
        {"challenge",    {[](const arguments& a) { method_validator.validate(a); }, &challenge_command}},
        {"verify",       {[](const arguments& a) { code_validator.validate(a); }, &verify_command}},
        {"disable",      {[](const arguments& a) { method_validator.validate(a); }, &disable_command}},
        {"backup-codes", {[](const arguments& a) { identity_validator.validate(a); }, &backup_codes_command}},
        {"bypass-grant", {[](const arguments& a) { bypass_grant_validator.validate(a); }, &bypass_grant_command}},
        {"bypass-redeem", {[](const arguments& a) { bypass_redeem_validator.validate(a); }, &bypass_redeem_command}}
    };
    return table;
}

int usage() {
    std::cerr << "usage: mfactl <command> [--name value ...]\n"
                 "commands: keygen";
    for (const auto& name : commands() | std::views::keys) {
        std::cerr << ", " << name;
    }
    std::cerr << '\n';
    return exit_error;
}

int run(std::string_view name, const arguments& args) {
    if (name == "keygen") {
        return keygen();
    }
    const auto it = commands().find(name);
    if (it == commands().end()) {
        return usage();
    }
    it->second.validate(args);

    const options opts = load_options();
    const secrets keys = load_secrets();

    odbc_settings_store settings{std::string(db_key)};
    odbc_challenge_store challenges{std::string(db_key)};
    odbc_bypass_store bypasses{std::string(db_key)};
    odbc_user_directory users{std::string(db_key), env::get<std::string>("MFA_USER_ROLE_QUERY", std::string(default_role_query))};
    log_delivery_channel delivery;
    audit::log_sink audit_sink;

    mfa_service service{opts, keys, collaborators{settings, challenges, bypasses, users, delivery, audit_sink}};
    return it->second.run(service, args);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        return usage();
    }

    const std::string correlation_id = util::get_uuid();
    log::correlation_scope scope{correlation_id};

    try {
        return run(argv[1], parse_arguments(argc, argv));
    } catch (const validation_error& e) {
        return print_error("VALIDATION_ERROR", e.what(), {{"parameter", e.get_param_name()}});
    } catch (const locked_error& e) {
        return print_error("LOCKED", e.what(), {{"lockedUntil", std::to_string(util::to_unix_seconds(e.locked_until()))}});
    } catch (const integrity_error& e) {
        log::critical("integrity failure: {}", e.what());
        return print_error("INTEGRITY_ERROR", "Stored MFA data could not be verified.");
    } catch (const not_found_error& e) {
        return print_error("NOT_FOUND", e.what());
    } catch (const permission_error& e) {
        return print_error("PERMISSION_DENIED", e.what());
    } catch (const unsupported_method_error& e) {
        return print_error("UNSUPPORTED_METHOD", e.what());
    } catch (const rate_limit_error& e) {
        return print_error("RATE_LIMITED", e.what());
    } catch (const conflict_error& e) {
        return print_error("CONFLICT", e.what());
    } catch (const config_error& e) {
        log::critical("configuration error: {}", e.what());
        return print_error("CONFIG_ERROR", e.what());
    } catch (const env::error& e) {
        log::critical("configuration error: {}", e.what());
        return print_error("CONFIG_ERROR", e.what());
    } catch (const sql::error& e) {
        log::error("database error (SQLSTATE {}): {}", e.sqlstate, e.what());
        return print_error("DATABASE_ERROR", "The MFA store could not be reached.");
    } catch (const std::exception& e) {
        log::critical("An unexpected error occurred: {}", e.what());
        return print_error("INTERNAL_ERROR", "An unexpected error occurred.");
    }
}
