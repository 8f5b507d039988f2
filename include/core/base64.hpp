#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rulegate::base64 {

/// Standard alphabet, padded, no line breaks
inline std::string encode(const uint8_t* data, size_t len) {
    if (len == 0) return {};
    std::string out(4 * ((len + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

inline std::string encode(std::string_view text) {
    return encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/**
 * @brief Decode padded standard base64; whitespace and line breaks are ignored
 * @return nullopt for input that is not base64
 */
inline std::optional<std::string> decode(std::string_view encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (const char c : encoded) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') compact += c;
    }
    if (compact.empty()) return std::string{};
    if (compact.size() % 4 != 0) return std::nullopt;

    std::string out(3 * compact.size() / 4, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(compact.data()),
                                        static_cast<int>(compact.size()));
    if (written < 0) return std::nullopt;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (compact.ends_with("==")) padding = 2;
    else if (compact.ends_with('=')) padding = 1;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace rulegate::base64
