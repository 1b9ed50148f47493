/// @file authenticator.cpp
/// @brief Authenticator implementation orchestrating login and authorization.

#include "cas/service/authenticator.hpp"

#include "cas/foundation/auth_logger.hpp"
#include "cas/service/auth_config.hpp"
#include "cas/service/credential_hasher.hpp"
#include "cas/service/input_validator.hpp"
#include "cas/service/session_cache.hpp"
#include "cas/service/token_codec.hpp"
#include "cas/service/user_directory.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;

namespace {

constexpr std::string_view kInvalidCredentialsMessage = "invalid login name or secret";

constexpr std::string_view kDefaultRole = "user";

/// Copy of an identity that is safe to hand out or cache.
Identity withoutSecret(Identity identity) {
    identity.credentialHash.clear();
    return identity;
}

/// Parse a token subject back into a user id. Zero is never issued.
std::optional<UserId> parseSubject(std::string_view subject) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(subject.data(), subject.data() + subject.size(), value);
    if (ec != std::errc{} || ptr != subject.data() + subject.size() || value == 0) {
        return std::nullopt;
    }
    return UserId(value);
}

LogContext errorContext(const AuthError& error, std::optional<UserId> userId = std::nullopt) {
    LogContext ctx;
    ctx.userId = userId;
    ctx.extra["error"] = std::string(cas::foundation::errorCodeName(error.code()));
    return ctx;
}

}  // namespace

// -- Construction / destruction -----------------------------------------------

AuthResult<std::unique_ptr<Authenticator>> Authenticator::create(
    AuthConfig config,
    std::shared_ptr<IUserDirectory> directory,
    std::shared_ptr<ISessionCache> cache,
    ClockSource clock) {
    if (auto valid = validateAuthConfig(config); !valid) {
        CAS_LOG_ERROR(LogCategory::Config,
                      "refusing to start: " + std::string(valid.error().message()));
        return AuthResult<std::unique_ptr<Authenticator>>::err(valid.error());
    }
    if (!directory) {
        return AuthResult<std::unique_ptr<Authenticator>>::err(
            AuthError(ErrorCode::ConfigurationError, "a user directory is required"));
    }
    return AuthResult<std::unique_ptr<Authenticator>>::ok(std::make_unique<Authenticator>(
        std::move(config), std::move(directory), std::move(cache), std::move(clock)));
}

Authenticator::Authenticator(AuthConfig config,
                             std::shared_ptr<IUserDirectory> directory,
                             std::shared_ptr<ISessionCache> cache,
                             ClockSource clock)
    : config_(std::move(config)),
      directory_(std::move(directory)),
      cache_(std::move(cache)),
      clock_(clock ? std::move(clock) : systemClock()),
      hasher_(std::make_unique<CredentialHasher>(config_.hashIterations)),
      codec_(std::make_unique<TokenCodec>(config_, clock_)) {
    // Verified against on unknown logins so both rejection paths cost one
    // key derivation.
    auto dummy = hasher_->hash("cas-unknown-login");
    if (dummy) {
        dummyHash_ = std::move(dummy).value();
    } else {
        CAS_LOG_WARN(LogCategory::Credential, "could not prepare dummy credential hash");
    }
}

Authenticator::~Authenticator() = default;
Authenticator::Authenticator(Authenticator&&) noexcept = default;
Authenticator& Authenticator::operator=(Authenticator&&) noexcept = default;

// -- Login --------------------------------------------------------------------

AuthResult<LoginResponse> Authenticator::login(std::string_view loginName,
                                               std::string_view secret) {
    auto found = directory_->findByLogin(loginName);
    if (!found) {
        if (!found.error().is(ErrorCode::NotFound)) {
            CAS_LOG_CTX(LogLevel::Error, LogCategory::Directory,
                        "login lookup failed", errorContext(found.error()));
            return AuthResult<LoginResponse>::err(std::move(found).error());
        }
        static_cast<void>(hasher_->verify(secret, dummyHash_));
        CAS_LOG_INFO(LogCategory::Credential, "login rejected");
        return AuthResult<LoginResponse>::err(
            AuthError(ErrorCode::InvalidCredentials, std::string(kInvalidCredentialsMessage)));
    }

    const auto& identity = found.value();
    if (!hasher_->verify(secret, identity.credentialHash)) {
        LogContext ctx;
        ctx.userId = identity.userId;
        CAS_LOG_CTX(LogLevel::Info, LogCategory::Credential, "login rejected", ctx);
        return AuthResult<LoginResponse>::err(
            AuthError(ErrorCode::InvalidCredentials, std::string(kInvalidCredentialsMessage)));
    }

    TokenClaims claims;
    claims.subject = std::to_string(identity.userId.value());
    claims.issuedAt = clock_();
    claims.extensions["role"] = identity.role;

    auto token = codec_->issue(claims, config_.tokenTtl);
    if (!token) {
        CAS_LOG_CTX(LogLevel::Error, LogCategory::Token, "token issue failed",
                    errorContext(token.error(), identity.userId));
        return AuthResult<LoginResponse>::err(std::move(token).error());
    }

    if (config_.warmCacheOnLogin) {
        auto expiry = std::chrono::floor<std::chrono::seconds>(claims.issuedAt) + config_.tokenTtl;
        cacheIdentity(claims.subject, withoutSecret(identity), expiry);
    }

    LogContext ctx;
    ctx.userId = identity.userId;
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Credential, "login succeeded", ctx);

    LoginResponse response;
    response.token = std::move(token).value();
    response.expiresIn = config_.tokenTtl;
    return AuthResult<LoginResponse>::ok(std::move(response));
}

// -- Authorization ------------------------------------------------------------

AuthResult<Identity> Authenticator::authorize(std::string_view token) {
    auto claims = codec_->validate(token);
    if (!claims) {
        CAS_LOG_CTX(LogLevel::Info, LogCategory::Token, "authorization rejected",
                    errorContext(claims.error()));
        return AuthResult<Identity>::err(std::move(claims).error());
    }

    const auto& subject = claims.value().subject;
    auto userId = parseSubject(subject);
    if (!userId) {
        CAS_LOG_INFO(LogCategory::Token, "authorization rejected: subject is not a user id");
        return AuthResult<Identity>::err(
            AuthError(ErrorCode::MalformedToken, "token subject is not a user id"));
    }

    const bool caching = cache_ && config_.cacheTtl.has_value();
    if (caching) {
        auto cached = cache_->get(subject);
        if (cached && cached.value().has_value()) {
            return AuthResult<Identity>::ok(std::move(*cached.value()));
        }
        if (!cached) {
            CAS_LOG_CTX(LogLevel::Warning, LogCategory::Cache, "cache lookup failed",
                        errorContext(cached.error(), *userId));
        }
    }

    auto found = directory_->findById(*userId);
    if (!found) {
        if (found.error().is(ErrorCode::NotFound)) {
            LogContext ctx;
            ctx.userId = *userId;
            CAS_LOG_CTX(LogLevel::Info, LogCategory::Directory,
                        "token subject has no identity", ctx);
            return AuthResult<Identity>::err(
                AuthError(ErrorCode::AccountNotFound, "identity no longer exists"));
        }
        CAS_LOG_CTX(LogLevel::Error, LogCategory::Directory, "identity lookup failed",
                    errorContext(found.error(), *userId));
        return AuthResult<Identity>::err(std::move(found).error());
    }

    auto identity = withoutSecret(std::move(found).value());
    if (caching) {
        cacheIdentity(subject, identity, claims.value().expiresAt);
    }
    return AuthResult<Identity>::ok(std::move(identity));
}

AuthResult<Identity> Authenticator::authorizeHeader(std::string_view headerValue) {
    constexpr std::string_view scheme = "bearer";

    auto space = headerValue.find(' ');
    auto given = headerValue.substr(0, space);
    bool schemeMatches = given.size() == scheme.size() &&
        std::equal(given.begin(), given.end(), scheme.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        });
    if (space == std::string_view::npos || !schemeMatches) {
        return AuthResult<Identity>::err(
            AuthError(ErrorCode::MalformedToken, "authorization header is not a bearer token"));
    }

    auto token = headerValue.substr(space + 1);
    while (!token.empty() && token.front() == ' ') {
        token.remove_prefix(1);
    }
    while (!token.empty() && token.back() == ' ') {
        token.remove_suffix(1);
    }
    if (token.empty()) {
        return AuthResult<Identity>::err(
            AuthError(ErrorCode::MalformedToken, "authorization header carries no token"));
    }
    return authorize(token);
}

void Authenticator::cacheIdentity(const std::string& subject,
                                  const Identity& identity,
                                  std::chrono::system_clock::time_point tokenExpiry) {
    if (!cache_ || !config_.cacheTtl) {
        return;
    }
    auto remaining = std::chrono::floor<std::chrono::seconds>(tokenExpiry - clock_());
    auto ttl = std::min(*config_.cacheTtl, remaining);
    if (ttl <= std::chrono::seconds::zero()) {
        return;
    }
    if (auto stored = cache_->put(subject, identity, ttl); !stored) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Cache, "cache store failed",
                    errorContext(stored.error(), identity.userId));
    }
}

// -- Account maintenance ------------------------------------------------------

AuthResult<Identity> Authenticator::registerUser(std::string_view loginName,
                                                 std::string_view secret) {
    if (auto check = InputValidator::validateLoginName(loginName); !check) {
        return AuthResult<Identity>::err(
            AuthError(ErrorCode::InvalidArgument, std::move(check.message)));
    }
    if (auto check = InputValidator::validatePassword(secret, config_.minPasswordLength);
        !check) {
        return AuthResult<Identity>::err(
            AuthError(ErrorCode::InvalidArgument, std::move(check.message)));
    }

    auto hashed = hasher_->hash(secret);
    if (!hashed) {
        return AuthResult<Identity>::err(std::move(hashed).error());
    }

    auto created = directory_->create(loginName, hashed.value(), kDefaultRole);
    if (!created) {
        CAS_LOG_CTX(LogLevel::Info, LogCategory::Directory, "registration rejected",
                    errorContext(created.error()));
        return AuthResult<Identity>::err(std::move(created).error());
    }

    LogContext ctx;
    ctx.userId = created.value().userId;
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Directory, "identity registered", ctx);
    return AuthResult<Identity>::ok(withoutSecret(std::move(created).value()));
}

AuthResult<void> Authenticator::changeCredential(UserId userId,
                                                 std::string_view currentSecret,
                                                 std::string_view newSecret) {
    auto found = directory_->findById(userId);
    if (!found) {
        if (found.error().is(ErrorCode::NotFound)) {
            return AuthResult<void>::err(
                AuthError(ErrorCode::AccountNotFound, "identity does not exist"));
        }
        return AuthResult<void>::err(std::move(found).error());
    }

    if (!hasher_->verify(currentSecret, found.value().credentialHash)) {
        LogContext ctx;
        ctx.userId = userId;
        CAS_LOG_CTX(LogLevel::Info, LogCategory::Credential, "credential change rejected", ctx);
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidCredentials, std::string(kInvalidCredentialsMessage)));
    }

    if (auto check = InputValidator::validatePassword(newSecret, config_.minPasswordLength);
        !check) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidArgument, std::move(check.message)));
    }

    auto hashed = hasher_->hash(newSecret);
    if (!hashed) {
        return AuthResult<void>::err(std::move(hashed).error());
    }

    if (auto updated = directory_->updateCredentialHash(userId, hashed.value()); !updated) {
        if (updated.error().is(ErrorCode::NotFound)) {
            return AuthResult<void>::err(
                AuthError(ErrorCode::AccountNotFound, "identity does not exist"));
        }
        return updated;
    }

    if (cache_) {
        if (auto dropped = cache_->invalidate(std::to_string(userId.value())); !dropped) {
            CAS_LOG_CTX(LogLevel::Warning, LogCategory::Cache, "cache invalidation failed",
                        errorContext(dropped.error(), userId));
        }
    }

    LogContext ctx;
    ctx.userId = userId;
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Credential, "credential changed", ctx);
    return AuthResult<void>::ok();
}

AuthResult<void> Authenticator::deleteAccount(UserId userId) {
    if (auto removed = directory_->remove(userId); !removed) {
        if (removed.error().is(ErrorCode::NotFound)) {
            return AuthResult<void>::err(
                AuthError(ErrorCode::AccountNotFound, "identity does not exist"));
        }
        return removed;
    }

    // A surviving cache entry would keep the deleted identity authorized. The
    // revocation mark also outlasts any authorize() that read the directory
    // before remove() and has yet to fill the cache.
    if (cache_) {
        auto key = std::to_string(userId.value());
        auto dropped = config_.cacheTtl ? cache_->revoke(key, *config_.cacheTtl)
                                        : cache_->invalidate(key);
        if (!dropped) {
            CAS_LOG_CTX(LogLevel::Error, LogCategory::Cache,
                        "cache invalidation after deletion failed",
                        errorContext(dropped.error(), userId));
            return AuthResult<void>::err(AuthError(
                ErrorCode::Unavailable, "identity removed but its cache entry could not be dropped"));
        }
    }

    LogContext ctx;
    ctx.userId = userId;
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Directory, "identity deleted", ctx);
    return AuthResult<void>::ok();
}

}  // namespace cas::service
