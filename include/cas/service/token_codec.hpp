#pragma once

/// @file token_codec.hpp
/// @brief Signed, time-bounded access tokens (JWS compact form, HS256/RS256).
///
/// Token format:
///   base64url(header) . base64url(payload) . base64url(signature)
///
/// The signature covers the exact encoded bytes "header.payload". Decoding
/// is strict, so altering any character of a token is detected.

#include "cas/foundation/auth_result.hpp"
#include "cas/service/auth_types.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;

/// Issues and validates access tokens.
///
/// Holds immutable configuration and a clock only, so one instance can be
/// shared by any number of threads.
///
/// Example:
/// @code
///   TokenCodec codec(config);
///   TokenClaims claims;
///   claims.subject = "42";
///   auto token = codec.issue(claims, std::chrono::minutes{15});
///   auto decoded = codec.validate(token.value());
/// @endcode
class TokenCodec {
public:
    explicit TokenCodec(const AuthConfig& config, ClockSource clock = systemClock());

    /// Sign the given claims.
    ///
    /// issuedAt defaults to now when unset, and expiresAt is always
    /// issuedAt + ttl. An empty tokenId is replaced by a random one.
    ///
    /// @return The token, or InvalidArgument (bad ttl, subject or extension
    ///         name), ConfigurationError (no key), CryptoFailure.
    [[nodiscard]] AuthResult<std::string> issue(const TokenClaims& claims,
                                                std::chrono::seconds ttl) const;

    /// Check structure, signature and expiry, in that order.
    ///
    /// @return The decoded claims, or MalformedToken, InvalidSignature,
    ///         TokenExpired.
    [[nodiscard]] AuthResult<TokenClaims> validate(std::string_view token) const;

    [[nodiscard]] TokenAlgorithm algorithm() const noexcept { return algorithm_; }

    /// True for claim names the codec owns ("sub", "iat", "exp", "jti").
    [[nodiscard]] static bool isRegisteredClaim(std::string_view name) noexcept;

private:
    [[nodiscard]] AuthResult<std::string> sign(std::string_view signingInput) const;
    [[nodiscard]] bool verifySignature(std::string_view signingInput,
                                       std::string_view encodedSignature) const;

    std::string signingKey_;
    std::string rsaPrivateKeyPem_;
    std::string rsaPublicKeyPem_;
    TokenAlgorithm algorithm_;
    std::chrono::seconds clockSkewGrace_;
    ClockSource clock_;
};

}  // namespace cas::service
