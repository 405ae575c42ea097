#ifndef MFA_UTIL_HPP
#define MFA_UTIL_HPP

#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <algorithm>
#include <optional>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <new> // For std::bad_alloc
#include <stdexcept>

#include <uuid/uuid.h> // For UUID generation

// OpenSSL headers for Base64 and digests
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace mfa::util {

struct string_hash {
    using is_transparent = void;
    [[nodiscard]] size_t operator()(const char* txt) const {
        return std::hash<std::string_view>{}(txt);
    }
    [[nodiscard]] size_t operator()(std::string_view txt) const {
        return std::hash<std::string_view>{}(txt);
    }
    [[nodiscard]] size_t operator()(const std::string& txt) const {
        return std::hash<std::string>{}(txt);
    }
};

struct string_equal {
    using is_transparent = void;
    [[nodiscard]] constexpr bool operator()(std::string_view lhs, std::string_view rhs) const {
        return lhs == rhs;
    }
};


/**
 * @brief Encodes binary data as standard, padded Base64 without line breaks.
 */
[[nodiscard]] inline std::string base64_encode(std::string_view data) {
    std::string buffer(((data.length() + 2) / 3) * 4, '\0');
    const int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buffer.data()),
                                    reinterpret_cast<const unsigned char*>(data.data()),
                                    static_cast<int>(data.length()));
    buffer.resize(len);
    return buffer;
}

/**
 * @brief Decodes a standard Base64 encoded string into a binary string.
 *
 * Uses OpenSSL's BIO chain so padding is handled by the library. Unlike a
 * plain empty-string convention, a decoding failure is reported as nullopt so
 * callers can tell malformed input apart from an empty payload.
 *
 * @param data The Base64 encoded string_view.
 * @return The raw decoded bytes, or std::nullopt on malformed input.
 */
[[nodiscard]] inline std::optional<std::string> base64_decode(std::string_view data) {
    if (data.empty()) {
        return std::string{};
    }
    if (data.size() % 4 != 0) {
        return std::nullopt;
    }

    auto bio_deleter = [](BIO* b) { BIO_free_all(b); };
    using unique_bio = std::unique_ptr<BIO, decltype(bio_deleter)>;

    unique_bio b64(BIO_new(BIO_f_base64()));
    if (!b64) {
        throw std::bad_alloc{};
    }
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    BIO* source = BIO_new_mem_buf(data.data(), static_cast<int>(data.size()));
    if (!source) {
        throw std::bad_alloc{};
    }
    unique_bio bio_chain(BIO_push(b64.release(), source));

    // The decoded size is at most 3/4 of the input size.
    std::string decoded_data(data.size(), '\0');
    const int decoded_len = BIO_read(bio_chain.get(), decoded_data.data(), static_cast<int>(decoded_data.size()));
    if (decoded_len <= 0) {
        return std::nullopt;
    }

    decoded_data.resize(decoded_len);
    return decoded_data;
}

/**
 * @brief Lowercase hex encoding of a byte string.
 */
[[nodiscard]] inline std::string to_hex(std::string_view bytes) {
    static constexpr std::string_view digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const unsigned char c : bytes) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0f]);
    }
    return out;
}

/**
 * @brief Decodes a hex string (either case); nullopt when the input is not valid hex.
 */
[[nodiscard]] inline std::optional<std::string> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = nibble(hex[i]);
        const int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

/**
 * @brief SHA-256 digest of the input, hex encoded.
 */
[[nodiscard]] inline std::string sha256_hex(std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    return to_hex({reinterpret_cast<const char*>(digest.data()), digest_len});
}

/**
 * @brief Percent-encodes a string with the same unreserved set as
 * JavaScript's encodeURIComponent, so otpauth labels match what
 * authenticator apps expect.
 */
[[nodiscard]] inline std::string url_encode(std::string_view value) {
    static constexpr std::string_view unreserved_marks = "-_.!~*'()";
    std::string out;
    out.reserve(value.size() * 3);
    for (const unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || unreserved_marks.contains(static_cast<char>(c))) {
            out.push_back(static_cast<char>(c));
        } else {
            out += std::format("%{:02X}", c);
        }
    }
    return out;
}

/**
 * @brief Splits on a single character, dropping empty pieces.
 */
[[nodiscard]] inline std::vector<std::string> split(std::string_view text, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        const size_t pos = text.find(separator, start);
        const auto piece = text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
        if (!piece.empty()) {
            parts.emplace_back(piece);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return parts;
}

/**
 * @brief Masks a phone number for display: everything but the last four
 * characters is kept, the last four become "****".
 */
[[nodiscard]] inline std::string mask_phone(std::string_view phone) {
    if (phone.size() < 4) {
        return "****";
    }
    return std::string(phone.substr(0, phone.size() - 4)) + "****";
}

/**
 * @brief Masks an email address for display: "jo***@example.com".
 */
[[nodiscard]] inline std::string mask_email(std::string_view email) {
    const auto at = email.find('@');
    const std::string_view local = email.substr(0, at);
    const std::string_view domain = at == std::string_view::npos ? std::string_view{} : email.substr(at + 1);
    if (local.size() <= 2) {
        return std::format("**@{}", domain);
    }
    return std::format("{}***@{}", local.substr(0, 2), domain);
}

/**
 * @brief Seconds since the Unix epoch for a system_clock time point.
 */
[[nodiscard]] inline std::int64_t to_unix_seconds(std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline std::chrono::system_clock::time_point from_unix_seconds(std::int64_t seconds) noexcept {
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

/**
 * @brief Milliseconds since the Unix epoch, truncated.
 */
[[nodiscard]] inline std::int64_t to_unix_millis(std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::floor<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/// @brief Milliseconds since the Unix epoch, rounded up; a stored deadline never moves earlier.
[[nodiscard]] inline std::int64_t to_unix_millis_ceil(std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::ceil<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis) noexcept {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{millis}};
}

/**
 * @brief Generates a new version 4 UUID.
 * @return The UUID as a standard formatted string.
 */
[[nodiscard]] inline std::string get_uuid() noexcept
{
    try {
        std::array<unsigned char, 16> out;
        uuid_generate(out.data());
        std::array<char, 37> uuid_str;
        uuid_unparse(out.data(), uuid_str.data());
        return std::string(uuid_str.data());
    } catch (const std::bad_alloc&) {
        return "uuid_generation_failed";
    }
}

} // namespace mfa::util

#endif // MFA_UTIL_HPP
