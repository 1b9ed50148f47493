/// @file token_codec.cpp
/// @brief TokenCodec implementation with HS256 and RS256 signing.
///
/// Header:  {"alg":"HS256"|"RS256","typ":"JWT"}
/// Payload: {"sub":"...","iat":N,"exp":N,"jti":"...",<extensions>}

#include "cas/service/token_codec.hpp"

#include "cas/foundation/auth_logger.hpp"

#include "claims_json.hpp"
#include "crypto_utils.hpp"
#include "rsa_utils.hpp"

#include <array>
#include <string>

namespace cas::service {

using cas::foundation::LogCategory;

namespace {

constexpr std::size_t kTokenIdBytes = 16;

int64_t toEpoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpoch(int64_t epoch) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(epoch));
}

/// Split "a.b.c" into exactly three non-empty parts.
bool splitToken(std::string_view token, std::array<std::string_view, 3>& parts) {
    auto first = token.find('.');
    if (first == std::string_view::npos) {
        return false;
    }
    auto second = token.find('.', first + 1);
    if (second == std::string_view::npos ||
        token.find('.', second + 1) != std::string_view::npos) {
        return false;
    }
    parts[0] = token.substr(0, first);
    parts[1] = token.substr(first + 1, second - first - 1);
    parts[2] = token.substr(second + 1);
    return !parts[0].empty() && !parts[1].empty() && !parts[2].empty();
}

AuthResult<TokenClaims> malformed(std::string message) {
    return AuthResult<TokenClaims>::err(AuthError(ErrorCode::MalformedToken, std::move(message)));
}

}  // anonymous namespace

// ---------------------------------------------------------------------------
// TokenCodec
// ---------------------------------------------------------------------------

TokenCodec::TokenCodec(const AuthConfig& config, ClockSource clock)
    : signingKey_(config.signingKey),
      rsaPrivateKeyPem_(config.rsaPrivateKeyPem),
      rsaPublicKeyPem_(config.rsaPublicKeyPem),
      algorithm_(config.algorithm),
      clockSkewGrace_(config.clockSkewGrace),
      clock_(clock ? std::move(clock) : systemClock()) {}

bool TokenCodec::isRegisteredClaim(std::string_view name) noexcept {
    return name == "sub" || name == "iat" || name == "exp" || name == "jti";
}

AuthResult<std::string> TokenCodec::issue(const TokenClaims& claims,
                                          std::chrono::seconds ttl) const {
    if (ttl <= std::chrono::seconds::zero()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidArgument, "token ttl must be positive"));
    }
    if (claims.subject.empty()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidArgument, "token subject must not be empty"));
    }
    for (const auto& [name, value] : claims.extensions) {
        if (isRegisteredClaim(name)) {
            return AuthResult<std::string>::err(
                AuthError(ErrorCode::InvalidArgument,
                          "extension claim collides with registered claim: " + name));
        }
    }

    auto issuedAt = claims.issuedAt.time_since_epoch().count() > 0 ? claims.issuedAt : clock_();
    auto iat = toEpoch(issuedAt);
    if (iat < 0 || ttl.count() > kMaxTokenEpochSeconds - iat) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidArgument, "token lifetime is out of range"));
    }
    auto exp = iat + ttl.count();

    std::string jti = claims.tokenId;
    if (jti.empty()) {
        auto random = detail::secureRandomHex(kTokenIdBytes);
        if (!random) {
            CAS_LOG_ERROR(LogCategory::Token, "token id generation failed");
            return AuthResult<std::string>::err(
                AuthError(ErrorCode::CryptoFailure, "token id generation failed"));
        }
        jti = std::move(*random);
    }

    std::string header = "{\"alg\":";
    header += detail::jsonQuote(tokenAlgorithmName(algorithm_));
    header += ",\"typ\":\"JWT\"}";

    std::string payload = "{\"sub\":";
    payload += detail::jsonQuote(claims.subject);
    payload += ",\"iat\":" + std::to_string(iat);
    payload += ",\"exp\":" + std::to_string(exp);
    payload += ",\"jti\":" + detail::jsonQuote(jti);
    for (const auto& [name, value] : claims.extensions) {
        payload += ',';
        payload += detail::jsonQuote(name);
        payload += ':';
        payload += detail::jsonValue(value);
    }
    payload += '}';

    std::string signingInput = detail::base64urlEncode(header) + "." +
                               detail::base64urlEncode(payload);

    auto signature = sign(signingInput);
    if (!signature) {
        return AuthResult<std::string>::err(std::move(signature).error());
    }
    return AuthResult<std::string>::ok(signingInput + "." + signature.value());
}

AuthResult<std::string> TokenCodec::sign(std::string_view signingInput) const {
    if (algorithm_ == TokenAlgorithm::RS256) {
        if (rsaPrivateKeyPem_.empty()) {
            return AuthResult<std::string>::err(
                AuthError(ErrorCode::ConfigurationError, "RS256 private key is not configured"));
        }
        auto key = detail::loadPrivateKey(rsaPrivateKeyPem_);
        if (!key) {
            return AuthResult<std::string>::err(
                AuthError(ErrorCode::ConfigurationError, "RS256 private key is unusable"));
        }
        auto sig = detail::rsaSha256Sign(key.get(), signingInput);
        if (!sig) {
            CAS_LOG_ERROR(LogCategory::Token, "RS256 signing failed");
            return AuthResult<std::string>::err(
                AuthError(ErrorCode::CryptoFailure, "RS256 signing failed"));
        }
        return AuthResult<std::string>::ok(detail::base64urlEncode(*sig));
    }

    if (signingKey_.empty()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::ConfigurationError, "HS256 signing key is not configured"));
    }
    auto mac = detail::hmacSha256(signingKey_, signingInput);
    if (!mac) {
        CAS_LOG_ERROR(LogCategory::Token, "HS256 signing failed");
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoFailure, "HS256 signing failed"));
    }
    return AuthResult<std::string>::ok(detail::base64urlEncode(*mac));
}

bool TokenCodec::verifySignature(std::string_view signingInput,
                                 std::string_view encodedSignature) const {
    if (algorithm_ == TokenAlgorithm::RS256) {
        auto sigBytes = detail::base64urlDecode(encodedSignature);
        auto key = detail::loadPublicKey(rsaPublicKeyPem_);
        if (!sigBytes || !key) {
            return false;
        }
        return detail::rsaSha256Verify(key.get(), signingInput, *sigBytes);
    }

    if (signingKey_.empty()) {
        return false;
    }
    auto mac = detail::hmacSha256(signingKey_, signingInput);
    if (!mac) {
        return false;
    }
    // Comparing encodings rejects non-canonical spellings of the same bytes.
    return detail::constantTimeEqual(detail::base64urlEncode(*mac), encodedSignature);
}

AuthResult<TokenClaims> TokenCodec::validate(std::string_view token) const {
    std::array<std::string_view, 3> parts;
    if (!splitToken(token, parts)) {
        return malformed("token must have three non-empty segments");
    }

    auto headerJson = detail::base64urlDecodeString(parts[0]);
    auto payloadJson = detail::base64urlDecodeString(parts[1]);
    auto signatureBytes = detail::base64urlDecode(parts[2]);
    if (!headerJson || !payloadJson || !signatureBytes) {
        return malformed("token segment is not valid base64url");
    }

    // -- Header ---------------------------------------------------------------
    auto header = detail::parseFlatObject(*headerJson);
    if (!header) {
        return malformed("token header is not a JSON object");
    }
    auto algIt = header->find("alg");
    if (algIt == header->end() || !std::holds_alternative<std::string>(algIt->second)) {
        return malformed("token header has no algorithm");
    }
    const auto& alg = std::get<std::string>(algIt->second);
    if (alg != tokenAlgorithmName(algorithm_)) {
        return AuthResult<TokenClaims>::err(
            AuthError(ErrorCode::InvalidSignature, "unexpected token algorithm"));
    }

    // -- Signature ------------------------------------------------------------
    auto signingInput = token.substr(0, parts[0].size() + 1 + parts[1].size());
    if (!verifySignature(signingInput, parts[2])) {
        return AuthResult<TokenClaims>::err(
            AuthError(ErrorCode::InvalidSignature, "token signature mismatch"));
    }

    // -- Payload --------------------------------------------------------------
    auto payload = detail::parseFlatObject(*payloadJson);
    if (!payload) {
        return malformed("token payload is not a JSON object");
    }

    TokenClaims claims;
    claims.algorithm = alg;

    auto sub = payload->find("sub");
    if (sub == payload->end() || !std::holds_alternative<std::string>(sub->second) ||
        std::get<std::string>(sub->second).empty()) {
        return malformed("token subject is missing");
    }
    claims.subject = std::get<std::string>(sub->second);

    auto iat = payload->find("iat");
    auto exp = payload->find("exp");
    if (iat == payload->end() || !std::holds_alternative<int64_t>(iat->second) ||
        exp == payload->end() || !std::holds_alternative<int64_t>(exp->second)) {
        return malformed("token timestamps are missing");
    }
    auto iatValue = std::get<int64_t>(iat->second);
    auto expValue = std::get<int64_t>(exp->second);
    if (iatValue < 0 || expValue > kMaxTokenEpochSeconds) {
        return malformed("token timestamps are out of range");
    }
    if (expValue <= iatValue) {
        return malformed("token expires before it was issued");
    }
    claims.issuedAt = fromEpoch(iatValue);
    claims.expiresAt = fromEpoch(expValue);

    if (auto jti = payload->find("jti"); jti != payload->end()) {
        if (!std::holds_alternative<std::string>(jti->second)) {
            return malformed("token id must be a string");
        }
        claims.tokenId = std::get<std::string>(jti->second);
    }

    for (auto& [name, value] : *payload) {
        if (!isRegisteredClaim(name)) {
            claims.extensions.emplace(name, std::move(value));
        }
    }

    // -- Expiry ---------------------------------------------------------------
    // Compared in seconds so a large grace saturates instead of overflowing.
    auto deadline = clockSkewGrace_.count() > kMaxTokenEpochSeconds - expValue
                        ? kMaxTokenEpochSeconds
                        : expValue + clockSkewGrace_.count();
    if (toEpoch(clock_()) >= deadline) {
        return AuthResult<TokenClaims>::err(
            AuthError(ErrorCode::TokenExpired, "token has expired"));
    }

    return AuthResult<TokenClaims>::ok(std::move(claims));
}

}  // namespace cas::service
