#include "credential/password_encryptor.hpp"
#include "core/base64.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <format>
#include <vector>

namespace rulegate {

namespace {

constexpr size_t kPkcs1Overhead = 11;

std::string wrap_pem(std::string_view pem) {
    if (pem.find("-----BEGIN") != std::string_view::npos) return std::string(pem);

    // Bare base64 body: re-wrap at 64 columns
    std::string body;
    for (const char c : pem) {
        if (c != '\n' && c != '\r' && c != ' ') body += c;
    }
    std::string out = "-----BEGIN PUBLIC KEY-----\n";
    for (size_t i = 0; i < body.size(); i += 64) {
        out += body.substr(i, 64);
        out += '\n';
    }
    out += "-----END PUBLIC KEY-----\n";
    return out;
}

std::string last_openssl_error() {
    const unsigned long code = ERR_get_error();
    if (code == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

} // anonymous namespace

void PasswordEncryptor::KeyDeleter::operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
}

Result<PasswordEncryptor> PasswordEncryptor::from_pem(std::string_view pem) {
    const std::string text = wrap_pem(pem);

    BIO* bio = BIO_new_mem_buf(text.data(), static_cast<int>(text.size()));
    if (!bio) {
        return Result<PasswordEncryptor>::error(ErrorCategory::CONFIG_ERROR, "BIO_new_mem_buf failed");
    }
    EVP_PKEY* key = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!key) {
        return Result<PasswordEncryptor>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Invalid RSA public key: {}", last_openssl_error()));
    }
    if (EVP_PKEY_base_id(key) != EVP_PKEY_RSA) {
        EVP_PKEY_free(key);
        return Result<PasswordEncryptor>::error(ErrorCategory::CONFIG_ERROR,
            "Public key is not an RSA key");
    }

    return Result<PasswordEncryptor>::ok(
        PasswordEncryptor(std::shared_ptr<EVP_PKEY>(key, KeyDeleter{})));
}

size_t PasswordEncryptor::max_plaintext_size() const {
    return static_cast<size_t>(EVP_PKEY_get_size(key_.get())) - kPkcs1Overhead;
}

Result<std::string> PasswordEncryptor::encrypt(std::string_view password) const {
    const std::string encoded = base64::encode(password);
    if (encoded.size() > max_plaintext_size()) {
        return Result<std::string>::error(ErrorCategory::CREDENTIAL_FAILED,
            std::format("Password too long for a {}-bit key", EVP_PKEY_get_bits(key_.get())));
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(key_.get(), nullptr);
    if (!ctx) {
        return Result<std::string>::error(ErrorCategory::CREDENTIAL_FAILED, "EVP_PKEY_CTX_new failed");
    }

    std::vector<uint8_t> ciphertext;
    size_t out_len = 0;
    const auto* in = reinterpret_cast<const uint8_t*>(encoded.data());

    bool ok = EVP_PKEY_encrypt_init(ctx) > 0
        && EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING) > 0
        && EVP_PKEY_encrypt(ctx, nullptr, &out_len, in, encoded.size()) > 0;
    if (ok) {
        ciphertext.resize(out_len);
        ok = EVP_PKEY_encrypt(ctx, ciphertext.data(), &out_len, in, encoded.size()) > 0;
    }
    EVP_PKEY_CTX_free(ctx);

    if (!ok) {
        return Result<std::string>::error(ErrorCategory::CREDENTIAL_FAILED,
            std::format("RSA encryption failed: {}", last_openssl_error()));
    }
    return Result<std::string>::ok(base64::encode(ciphertext.data(), out_len));
}

} // namespace rulegate
