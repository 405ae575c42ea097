#include "otp.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <oath.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <array>
#include <memory>
#include <format>

namespace mfa::otp {

namespace detail {
    // Custom deleter for buffers allocated by liboath.
    struct OATH_Free_Deleter {
        void operator()(char* ptr) const {
            oath_free(ptr);
        }
    };
    using unique_OATH_buffer = std::unique_ptr<char, OATH_Free_Deleter>;

    // liboath keeps global state; initialize it once for the process and release it at exit.
    class oath_library {
    public:
        oath_library() {
            if (const int rc = oath_init(); rc != OATH_OK) {
                throw error(std::format("liboath oath_init() failed: {}", oath_strerror(rc)));
            }
        }
        ~oath_library() {
            oath_done();
        }
        oath_library(const oath_library&) = delete;
        oath_library& operator=(const oath_library&) = delete;
    };

    void ensure_initialized() {
        static const oath_library library;
    }

    std::string decode_secret(std::string_view secret_b32) {
        ensure_initialized();
        char* raw = nullptr;
        size_t raw_len = 0;
        const int rc = oath_base32_decode(secret_b32.data(), secret_b32.size(), &raw, &raw_len);
        unique_OATH_buffer owned(raw);
        if (rc != OATH_OK) {
            throw error(std::format("liboath oath_base32_decode() failed: {}", oath_strerror(rc)));
        }
        std::string secret(owned.get(), raw_len);
        OPENSSL_cleanse(owned.get(), raw_len);
        return secret;
    }

    std::string hotp_raw(const std::string& secret, std::uint64_t counter, unsigned digits) {
        std::array<char, 10> output{};
        const int rc = oath_hotp_generate(secret.data(), secret.size(), counter, digits, false,
                                          OATH_HOTP_DYNAMIC_TRUNCATION, output.data());
        if (rc != OATH_OK) {
            throw error(std::format("liboath oath_hotp_generate() failed: {}", oath_strerror(rc)));
        }
        return std::string(output.data(), digits);
    }

    // Uniform value in [0, bound) from the OpenSSL CSPRNG, by rejection sampling.
    std::uint32_t uniform_random(std::uint32_t bound) {
        const std::uint32_t limit = UINT32_MAX - (UINT32_MAX % bound);
        while (true) {
            std::uint32_t value = 0;
            if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
                throw error("RAND_bytes failed");
            }
            if (value < limit) {
                return value % bound;
            }
        }
    }
} // namespace detail

std::string generate_secret(std::size_t bytes) {
    detail::ensure_initialized();
    std::string raw(bytes, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(raw.data()), static_cast<int>(raw.size())) != 1) {
        throw error("RAND_bytes failed while generating a TOTP secret");
    }

    char* encoded = nullptr;
    size_t encoded_len = 0;
    const int rc = oath_base32_encode(raw.data(), raw.size(), &encoded, &encoded_len);
    detail::unique_OATH_buffer owned(encoded);
    OPENSSL_cleanse(raw.data(), raw.size());
    if (rc != OATH_OK) {
        throw error(std::format("liboath oath_base32_encode() failed: {}", oath_strerror(rc)));
    }

    std::string secret(owned.get(), encoded_len);
    // Authenticator apps expect the unpadded form.
    if (const auto pad = secret.find('='); pad != std::string::npos) {
        secret.resize(pad);
    }
    return secret;
}

std::string hotp(std::string_view secret_b32, std::uint64_t counter, unsigned digits) {
    const auto secret = detail::decode_secret(secret_b32);
    return detail::hotp_raw(secret, counter, digits);
}

std::int64_t time_step(time_point now, std::chrono::seconds period) noexcept {
    return util::to_unix_seconds(now) / period.count();
}

std::string totp(std::string_view secret_b32, time_point now) {
    return hotp(secret_b32, static_cast<std::uint64_t>(time_step(now, totp_period)), totp_digits);
}

std::optional<std::int64_t> verify_totp(std::string_view secret_b32, std::string_view candidate, time_point now, int window) {
    if (candidate.size() != totp_digits) {
        return std::nullopt;
    }
    const auto secret = detail::decode_secret(secret_b32);
    const std::int64_t current = time_step(now, totp_period);
    for (int offset = -window; offset <= window; ++offset) {
        const std::int64_t step = current + offset;
        if (step < 0) {
            continue;
        }
        if (constant_time_equals(detail::hotp_raw(secret, static_cast<std::uint64_t>(step), totp_digits), candidate)) {
            return step;
        }
    }
    return std::nullopt;
}

std::string challenge_code(unsigned digits) {
    std::uint32_t bound = 1;
    for (unsigned i = 0; i < digits; ++i) {
        bound *= 10;
    }
    return std::format("{:0{}}", detail::uniform_random(bound), digits);
}

std::vector<std::string> backup_codes(std::size_t count, std::size_t length) {
    static constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::vector<std::string> codes;
    codes.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::string code;
        code.reserve(length);
        for (std::size_t j = 0; j < length; ++j) {
            code.push_back(alphabet[detail::uniform_random(static_cast<std::uint32_t>(alphabet.size()))]);
        }
        codes.push_back(std::move(code));
    }
    return codes;
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    return a.length() == b.length() && CRYPTO_memcmp(a.data(), b.data(), a.length()) == 0;
}

std::string challenge_digest(std::string_view user_id, method m, std::string_view code) {
    return util::sha256_hex(std::format("{}:{}:{}", user_id, to_string(m), code));
}

std::string random_token(std::size_t bytes) {
    std::string raw(bytes, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(raw.data()), static_cast<int>(raw.size())) != 1) {
        throw error("RAND_bytes failed while generating a bypass token");
    }
    auto token = util::to_hex(raw);
    OPENSSL_cleanse(raw.data(), raw.size());
    return token;
}

std::string bypass_digest(std::string_view user_id, std::string_view token) {
    return util::sha256_hex(std::format("{}:bypass:{}", user_id, token));
}

} // namespace mfa::otp
