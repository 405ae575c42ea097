#include "secret_vault.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <array>
#include <memory>
#include <new>

namespace mfa {

namespace {
    constexpr std::string_view layout_version = "v1";
    constexpr std::size_t key_size = 32;
    constexpr std::size_t nonce_size = 16;
    constexpr std::size_t tag_size = 16;

    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };
    using unique_EVP_CIPHER_CTX = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    unique_EVP_CIPHER_CTX new_context() {
        unique_EVP_CIPHER_CTX ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            throw std::bad_alloc{};
        }
        return ctx;
    }

    // Splits "v1:a:b:c" into its three payload fields.
    bool split_layout(std::string_view text, std::array<std::string_view, 3>& fields) {
        if (!text.starts_with(layout_version) || text.size() <= layout_version.size() || text[layout_version.size()] != ':') {
            return false;
        }
        text.remove_prefix(layout_version.size() + 1);
        for (size_t i = 0; i < fields.size(); ++i) {
            const auto pos = text.find(':');
            if (i + 1 < fields.size()) {
                if (pos == std::string_view::npos) return false;
                fields[i] = text.substr(0, pos);
                text.remove_prefix(pos + 1);
            } else {
                if (pos != std::string_view::npos) return false;
                fields[i] = text;
            }
        }
        return true;
    }
}

secret_vault::secret_vault(std::string key) : m_key{std::move(key)} {
    if (m_key.size() != key_size) {
        throw config_error("vault key must be exactly 32 bytes");
    }
}

secret_vault::~secret_vault() noexcept {
    OPENSSL_cleanse(m_key.data(), m_key.size());
}

std::string secret_vault::encrypt(std::string_view plaintext) const {
    std::array<unsigned char, nonce_size> nonce{};
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        throw error("RAND_bytes failed while generating a vault nonce");
    }

    auto ctx = new_context();
    const auto* key = reinterpret_cast<const unsigned char*>(m_key.data());
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, nonce.data()) != 1) {
        throw error("failed to initialize AES-256-GCM encryption");
    }

    std::string cipher_out(plaintext.size() + EVP_MAX_BLOCK_LENGTH, '\0');
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(cipher_out.data()), &out_len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()), static_cast<int>(plaintext.size())) != 1) {
        throw error("AES-256-GCM encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(cipher_out.data()) + out_len, &final_len) != 1) {
        throw error("AES-256-GCM finalization failed");
    }
    cipher_out.resize(static_cast<size_t>(out_len + final_len));

    std::array<unsigned char, tag_size> tag{};
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag.size()), tag.data()) != 1) {
        throw error("failed to read AES-256-GCM tag");
    }

    return std::format("{}:{}:{}:{}",
        layout_version,
        util::base64_encode({reinterpret_cast<const char*>(nonce.data()), nonce.size()}),
        util::base64_encode(cipher_out),
        util::base64_encode({reinterpret_cast<const char*>(tag.data()), tag.size()}));
}

std::string secret_vault::decrypt(std::string_view ciphertext) const {
    std::array<std::string_view, 3> fields;
    if (!split_layout(ciphertext, fields)) {
        throw integrity_error("vault ciphertext has an unknown layout");
    }
    const auto nonce = util::base64_decode(fields[0]);
    const auto cipher_in = util::base64_decode(fields[1]);
    auto tag = util::base64_decode(fields[2]);
    if (!nonce || !cipher_in || !tag || nonce->size() != nonce_size || tag->size() != tag_size) {
        throw integrity_error("vault ciphertext is malformed");
    }

    auto ctx = new_context();
    const auto* key = reinterpret_cast<const unsigned char*>(m_key.data());
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce->size()), nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, reinterpret_cast<const unsigned char*>(nonce->data())) != 1) {
        throw error("failed to initialize AES-256-GCM decryption");
    }

    std::string plain_out(cipher_in->size() + EVP_MAX_BLOCK_LENGTH, '\0');
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plain_out.data()), &out_len,
                          reinterpret_cast<const unsigned char*>(cipher_in->data()), static_cast<int>(cipher_in->size())) != 1) {
        throw integrity_error("vault ciphertext could not be decrypted");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag->size()), tag->data()) != 1) {
        throw error("failed to set AES-256-GCM tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plain_out.data()) + out_len, &final_len) != 1) {
        OPENSSL_cleanse(plain_out.data(), plain_out.size());
        throw integrity_error("vault authentication tag mismatch");
    }
    plain_out.resize(static_cast<size_t>(out_len + final_len));
    return plain_out;
}

} // namespace mfa
