#pragma once

#include "core/base64.hpp"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rulegate::testing {

/**
 * @brief RSA keypair generated once per test run
 *
 * Plays the upstream's side of password encryption: tests hand the public
 * PEM to the gateway and decrypt what it sends.
 */
class TestKeyPair {
public:
    static const TestKeyPair& instance() {
        static const TestKeyPair keys;
        return keys;
    }

    [[nodiscard]] const std::string& public_pem() const { return public_pem_; }

    /// base64 ciphertext -> plaintext, nullopt when it does not decrypt
    [[nodiscard]] std::optional<std::string> decrypt(const std::string& ciphertext_b64) const {
        const auto ciphertext = base64::decode(ciphertext_b64);
        if (!ciphertext) return std::nullopt;

        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
            EVP_PKEY_CTX_new(key_.get(), nullptr), EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0) {
            return std::nullopt;
        }

        const auto* in = reinterpret_cast<const unsigned char*>(ciphertext->data());
        size_t out_len = 0;
        if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, in, ciphertext->size()) <= 0) {
            return std::nullopt;
        }
        std::vector<unsigned char> out(out_len);
        if (EVP_PKEY_decrypt(ctx.get(), out.data(), &out_len, in, ciphertext->size()) <= 0) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(out.data()), out_len);
    }

    /// Undo the gateway's password encoding: decrypt, then base64-decode
    [[nodiscard]] std::optional<std::string> decrypt_password(const std::string& ciphertext_b64) const {
        const auto inner = decrypt(ciphertext_b64);
        if (!inner) return std::nullopt;
        return base64::decode(*inner);
    }

private:
    TestKeyPair() : key_(EVP_RSA_gen(2048), EVP_PKEY_free) {
        if (!key_) throw std::runtime_error("RSA key generation failed");

        std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
        if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
            throw std::runtime_error("PEM export failed");
        }
        char* data = nullptr;
        const long len = BIO_get_mem_data(bio.get(), &data);
        public_pem_.assign(data, static_cast<size_t>(len));
    }

    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
    std::string public_pem_;
};

} // namespace rulegate::testing
