#pragma once

#include "core/error.hpp"

#include <memory>
#include <string>
#include <string_view>

typedef struct evp_pkey_st EVP_PKEY;

namespace rulegate {

/**
 * @brief Encrypts login passwords for the upstream's login endpoint
 *
 * encrypt(p) = base64(RSA-PKCS#1-v1.5(public_key, base64(p))).
 * PKCS#1 v1.5 padding is randomized, so two encryptions of the same
 * password differ.
 */
class PasswordEncryptor {
public:
    /**
     * @brief Load an RSA public key
     * @param pem PEM text ("-----BEGIN PUBLIC KEY-----" block), or the bare
     *        base64 body of one
     */
    [[nodiscard]] static Result<PasswordEncryptor> from_pem(std::string_view pem);

    [[nodiscard]] Result<std::string> encrypt(std::string_view password) const;

    /// Largest plaintext the key accepts (modulus size - 11)
    [[nodiscard]] size_t max_plaintext_size() const;

private:
    struct KeyDeleter {
        void operator()(EVP_PKEY* key) const;
    };

    explicit PasswordEncryptor(std::shared_ptr<EVP_PKEY> key) : key_(std::move(key)) {}

    std::shared_ptr<EVP_PKEY> key_;
};

} // namespace rulegate
