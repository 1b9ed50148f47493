#pragma once

/// @file auth_types.hpp
/// @brief Core type definitions for the authentication layer.
///
/// Defines identities, token claims, login responses and the configuration
/// consumed by the credential hasher, token codec and authenticator.

#include "cas/foundation/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cas::service {

using cas::foundation::UserId;

/// Source of the current wall-clock time. Injected so tests can move time.
using ClockSource = std::function<std::chrono::system_clock::time_point()>;

/// The real system clock.
inline ClockSource systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

// -- Identity -----------------------------------------------------------------

/// Durable record of a registered user.
///
/// credentialHash is produced by CredentialHasher and is only ever checked
/// through CredentialHasher::verify. Identities handed out by
/// Authenticator::authorize carry an empty credentialHash.
struct Identity {
    UserId userId;
    std::string loginName;
    std::string credentialHash;
    std::string role = "user";
    std::chrono::system_clock::time_point createdAt{};
};

// -- Token structures ---------------------------------------------------------

/// Value of an extension claim.
using ClaimValue = std::variant<std::string, int64_t, bool>;

/// Decoded token payload.
///
/// The registered claims are typed fields; anything else travels in
/// extensions and is validated on decode (flat scalars only).
struct TokenClaims {
    std::string subject;                                ///< "sub": user id.
    std::chrono::system_clock::time_point issuedAt{};   ///< "iat".
    std::chrono::system_clock::time_point expiresAt{};  ///< "exp".
    std::string tokenId;                                ///< "jti".
    std::string algorithm;                              ///< Header "alg", set on decode.
    std::map<std::string, ClaimValue> extensions;

    bool operator==(const TokenClaims&) const = default;
};

/// Successful login outcome handed to the routing layer.
struct LoginResponse {
    std::string token;
    std::string tokenType = "bearer";
    std::chrono::seconds expiresIn{};
};

// -- Configuration ------------------------------------------------------------

/// Token signing algorithm.
enum class TokenAlgorithm : uint8_t {
    HS256,  ///< HMAC-SHA256 with a shared secret.
    RS256   ///< RSA-SHA256 with a PEM key pair.
};

constexpr std::string_view tokenAlgorithmName(TokenAlgorithm alg) {
    switch (alg) {
        case TokenAlgorithm::HS256: return "HS256";
        case TokenAlgorithm::RS256: return "RS256";
    }
    return "HS256";
}

constexpr std::optional<TokenAlgorithm> parseTokenAlgorithm(std::string_view name) {
    if (name == "HS256") {
        return TokenAlgorithm::HS256;
    }
    if (name == "RS256") {
        return TokenAlgorithm::RS256;
    }
    return std::nullopt;
}

/// Minimum HS256 secret length accepted by validateAuthConfig().
inline constexpr std::size_t kMinSigningKeyLength = 32;

/// Latest whole second a system_clock::time_point can hold. Token timestamps
/// and expiry deadlines never pass it.
inline constexpr int64_t kMaxTokenEpochSeconds =
    std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::time_point::max().time_since_epoch())
        .count();

/// Configuration for the authentication layer.
///
/// Loaded by loadAuthConfig() and checked once at startup with
/// validateAuthConfig().
struct AuthConfig {
    /// Shared secret for HS256. Empty means "not configured".
    std::string signingKey;

    /// PEM-encoded RSA private key for RS256 signing.
    std::string rsaPrivateKeyPem;

    /// PEM-encoded RSA public key for RS256 verification.
    std::string rsaPublicKeyPem;

    TokenAlgorithm algorithm = TokenAlgorithm::HS256;

    /// Default access token lifetime.
    std::chrono::seconds tokenTtl{900};  // 15 minutes

    /// Upper bound for session cache entries; nullopt disables caching.
    std::optional<std::chrono::seconds> cacheTtl{std::chrono::seconds{300}};

    /// Grace window applied to "exp" on validation. Zero unless set.
    std::chrono::seconds clockSkewGrace{0};

    /// PBKDF2 iteration count for newly hashed credentials.
    uint32_t hashIterations = 600000;

    /// Minimum password length accepted at registration.
    uint32_t minPasswordLength = 8;

    /// Capacity of the in-memory session cache.
    std::size_t cacheMaxEntries = 10000;

    /// Populate the session cache when a login succeeds.
    bool warmCacheOnLogin = false;
};

}  // namespace cas::service
