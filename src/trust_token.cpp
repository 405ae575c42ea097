#include "trust_token.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/crypto.h>
#include <array>
#include <charconv>
#include <optional>

namespace mfa {

std::string to_string(token_error err) {
    switch (err) {
        case token_error::token_expired: return "token has expired.";
        case token_error::invalid_signature: return "token signature is invalid.";
        case token_error::invalid_format: return "token format is invalid.";
        case token_error::invalid_json: return "failed to parse json in payload.";
        case token_error::missing_expiration_claim: return "expiration claim is missing.";
        case token_error::invalid_claim_format: return "a claim has an invalid format.";
        case token_error::wrong_subject: return "token was issued for another user.";
        case token_error::wrong_type: return "token is not a device-trust token.";
        case token_error::json_creation_failed: return "failed to create internal json structure.";
    }
    return "unknown token error.";
}

namespace {

    constexpr std::string_view token_type = "device-trust";

    using sha256_digest = std::array<unsigned char, 32>;

    std::string base64url_encode(std::string_view data) {
        std::string buffer = util::base64_encode(data);
        for (char& c : buffer) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        if (auto pos = buffer.find('='); pos != std::string::npos) buffer.resize(pos);
        return buffer;
    }

    std::expected<std::string, token_error> base64url_decode(std::string_view data) {
        std::string b64_str(data);
        for (char& c : b64_str) {
            if (c == '-') c = '+';
            else if (c == '_') c = '/';
            else if (c == '+' || c == '/' || c == '=') return std::unexpected(token_error::invalid_format);
        }
        while (b64_str.length() % 4) b64_str += '=';

        auto decoded = util::base64_decode(b64_str);
        if (!decoded) return std::unexpected(token_error::invalid_format);
        return std::move(*decoded);
    }

    sha256_digest hmac_sha256(std::string_view secret, std::string_view data) {
        sha256_digest digest{};
        unsigned int hash_len = 0;
        const auto* result = HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.length()),
                                  reinterpret_cast<const unsigned char*>(data.data()), data.length(),
                                  digest.data(), &hash_len);
        if (!result || hash_len != digest.size()) {
            throw error("HMAC-SHA256 failed");
        }
        return digest;
    }

    bool constant_time_compare(std::string_view a, std::string_view b) {
        return a.length() == b.length() && CRYPTO_memcmp(a.data(), b.data(), a.length()) == 0;
    }

    std::optional<std::int64_t> parse_seconds(std::string_view value) {
        std::int64_t parsed{};
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            return std::nullopt;
        }
        return parsed;
    }

} // anonymous namespace

trust_token_service::trust_token_service(std::string secret, std::chrono::seconds ttl)
    : m_secret{std::move(secret)}, m_ttl{ttl}
{
    if (m_secret.empty()) {
        throw config_error("trust token secret cannot be empty");
    }
}

trust_token_service::~trust_token_service() noexcept {
    OPENSSL_cleanse(m_secret.data(), m_secret.size());
}

std::string trust_token_service::sign(std::string_view data) const {
    const sha256_digest signature_raw = hmac_sha256(m_secret, data);
    return base64url_encode({reinterpret_cast<const char*>(signature_raw.data()), signature_raw.size()});
}

std::expected<std::string, token_error> trust_token_service::issue(std::string_view user_id, time_point now) const {
    static const std::string header_b64 = base64url_encode(R"({"alg":"HS256","typ":"JWT"})");

    const auto iat = util::to_unix_seconds(now);
    const claims_map claims = {
        {"sub", std::string(user_id)},
        {"typ", std::string(token_type)},
        {"iat", std::to_string(iat)},
        {"exp", std::to_string(iat + m_ttl.count())}
    };

    std::string payload_str;
    try {
        payload_str = json::json_parser::build(claims);
    } catch (const json::output_error&) {
        return std::unexpected(token_error::json_creation_failed);
    }

    const std::string signing_input = header_b64 + "." + base64url_encode(payload_str);
    return signing_input + "." + sign(signing_input);
}

std::expected<claims_map, token_error> trust_token_service::verify(std::string_view token, time_point now) const {
    const auto first_dot = token.find('.');
    if (first_dot == std::string_view::npos) return std::unexpected(token_error::invalid_format);
    const auto second_dot = token.rfind('.');
    if (second_dot == first_dot) return std::unexpected(token_error::invalid_format);

    const std::string_view signing_input = token.substr(0, second_dot);
    const std::string_view signature_b64 = token.substr(second_dot + 1);

    auto received_signature = base64url_decode(signature_b64);
    if (!received_signature) return std::unexpected(received_signature.error());

    const sha256_digest expected_signature = hmac_sha256(m_secret, signing_input);
    if (!constant_time_compare({reinterpret_cast<const char*>(expected_signature.data()), expected_signature.size()}, *received_signature)) {
        return std::unexpected(token_error::invalid_signature);
    }

    const std::string_view payload_b64 = token.substr(first_dot + 1, second_dot - first_dot - 1);
    auto payload_decoded = base64url_decode(payload_b64);
    if (!payload_decoded) return std::unexpected(payload_decoded.error());

    claims_map claims;
    try {
        claims = json::json_parser(*payload_decoded).get_map();
    } catch (const json::parsing_error&) {
        return std::unexpected(token_error::invalid_json);
    }

    const auto exp_it = claims.find("exp");
    if (exp_it == claims.end()) return std::unexpected(token_error::missing_expiration_claim);

    const auto exp_val = parse_seconds(exp_it->second);
    if (!exp_val) return std::unexpected(token_error::invalid_claim_format);

    if (now >= util::from_unix_seconds(*exp_val)) {
        return std::unexpected(token_error::token_expired);
    }

    if (const auto typ_it = claims.find("typ"); typ_it == claims.end() || typ_it->second != token_type) {
        return std::unexpected(token_error::wrong_type);
    }

    return claims;
}

std::expected<claims_map, token_error> trust_token_service::verify_for(std::string_view token, std::string_view user_id, time_point now) const {
    auto claims = verify(token, now);
    if (!claims) return claims;

    if (const auto sub_it = claims->find("sub"); sub_it == claims->end() || sub_it->second != user_id) {
        return std::unexpected(token_error::wrong_subject);
    }
    return claims;
}

} // namespace mfa
