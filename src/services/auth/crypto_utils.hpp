#pragma once

/// @file crypto_utils.hpp
/// @brief Internal helpers over OpenSSL: RNG, HMAC, PBKDF2, Base64URL,
///        constant-time comparison.
///
/// Used internally by CredentialHasher and TokenCodec. No primitive is
/// implemented here; everything delegates to libcrypto.

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cas::service::detail {

using Bytes = std::vector<uint8_t>;

// =============================================================================
// Secure random generation
// =============================================================================

/// Draw numBytes from the OpenSSL CSPRNG. nullopt if the RNG is not seeded.
[[nodiscard]] inline std::optional<Bytes> secureRandomBytes(std::size_t numBytes) {
    Bytes buf(numBytes);
    if (numBytes > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return std::nullopt;
    }
    return buf;
}

/// Encode bytes to lowercase hex string.
[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

/// numBytes of CSPRNG output, hex-encoded.
[[nodiscard]] inline std::optional<std::string> secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    if (!bytes) {
        return std::nullopt;
    }
    return toHex(bytes->data(), bytes->size());
}

// =============================================================================
// HMAC / PBKDF2
// =============================================================================

/// HMAC-SHA256(key, message). nullopt on libcrypto failure.
[[nodiscard]] inline std::optional<Bytes> hmacSha256(std::string_view key,
                                                     std::string_view message) {
    Bytes mac(EVP_MAX_MD_SIZE);
    unsigned int macLen = 0;
    auto* out = HMAC(EVP_sha256(),
                     key.data(), static_cast<int>(key.size()),
                     reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                     mac.data(), &macLen);
    if (out == nullptr) {
        return std::nullopt;
    }
    mac.resize(macLen);
    return mac;
}

/// PBKDF2-HMAC-SHA256 (RFC 8018). nullopt on libcrypto failure.
[[nodiscard]] inline std::optional<Bytes> pbkdf2Sha256(std::string_view password,
                                                       const Bytes& salt,
                                                       uint32_t iterations,
                                                       std::size_t keyLength) {
    Bytes key(keyLength);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        return std::nullopt;
    }
    return key;
}

// =============================================================================
// Base64URL encoding/decoding (RFC 4648 §5, unpadded)
// =============================================================================

[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(const Bytes& data) {
    return base64urlEncode(data.data(), data.size());
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Strict unpadded base64url decode.
///
/// Rejects padding, characters outside the URL-safe alphabet, impossible
/// lengths (4n+1) and non-zero trailing bits, so every byte string has
/// exactly one accepted encoding.
[[nodiscard]] inline std::optional<Bytes> base64urlDecode(std::string_view input) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-') {
            return 62;
        }
        if (c == '_') {
            return 63;
        }
        return -1;
    };

    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    Bytes result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        int val = decodeChar(c);
        if (val < 0) {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    if (bits > 0 && (buf & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }
    return result;
}

[[nodiscard]] inline std::optional<std::string> base64urlDecodeString(std::string_view input) {
    auto bytes = base64urlDecode(input);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Compare two byte strings without data-dependent early exit.
/// Only the length comparison is variable-time.
[[nodiscard]] inline bool constantTimeEqual(const void* a, std::size_t aLen,
                                            const void* b, std::size_t bLen) {
    if (aLen != bLen) {
        return false;
    }
    return aLen == 0 || CRYPTO_memcmp(a, b, aLen) == 0;
}

[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    return constantTimeEqual(a.data(), a.size(), b.data(), b.size());
}

[[nodiscard]] inline bool constantTimeEqual(const Bytes& a, const Bytes& b) {
    return constantTimeEqual(a.data(), a.size(), b.data(), b.size());
}

}  // namespace cas::service::detail
