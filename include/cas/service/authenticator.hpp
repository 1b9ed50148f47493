#pragma once

/// @file authenticator.hpp
/// @brief Login and per-request authorization over the auth components.
///
/// Orchestrates IUserDirectory, ISessionCache, CredentialHasher and
/// TokenCodec. Holds no mutable state of its own.

#include "cas/foundation/auth_result.hpp"
#include "cas/service/auth_types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace cas::service {

using cas::foundation::AuthResult;

class IUserDirectory;
class ISessionCache;
class CredentialHasher;
class TokenCodec;

/// Authentication entry points: login, authorize and account maintenance.
///
/// Error categories seen by callers:
///   login:     InvalidCredentials, Unavailable
///   authorize: MalformedToken, InvalidSignature, TokenExpired,
///              AccountNotFound, Unavailable
///
/// An unknown login name and a wrong secret are indistinguishable from
/// the outside, in the error returned and in the work performed.
///
/// Example:
/// @code
///   auto directory = std::make_shared<InMemoryUserDirectory>();
///   auto cache = std::make_shared<InMemorySessionCache>(config.cacheMaxEntries);
///   auto auth = Authenticator::create(config, directory, cache);
///
///   auto login = auth.value()->login("alice@example.com", "CorrectHorse1");
///   auto identity = auth.value()->authorize(login.value().token);
/// @endcode
class Authenticator {
public:
    /// Validate the configuration and build an Authenticator.
    ///
    /// @param cache May be null; caching is then disabled.
    /// @return The instance, or ConfigurationError.
    [[nodiscard]] static AuthResult<std::unique_ptr<Authenticator>> create(
        AuthConfig config,
        std::shared_ptr<IUserDirectory> directory,
        std::shared_ptr<ISessionCache> cache,
        ClockSource clock = systemClock());

    /// Construct without validating the configuration. Prefer create().
    Authenticator(AuthConfig config,
                  std::shared_ptr<IUserDirectory> directory,
                  std::shared_ptr<ISessionCache> cache,
                  ClockSource clock = systemClock());

    ~Authenticator();

    Authenticator(const Authenticator&) = delete;
    Authenticator& operator=(const Authenticator&) = delete;
    Authenticator(Authenticator&&) noexcept;
    Authenticator& operator=(Authenticator&&) noexcept;

    /// Verify a login name and secret and issue an access token.
    [[nodiscard]] AuthResult<LoginResponse> login(std::string_view loginName,
                                                  std::string_view secret);

    /// Resolve the identity behind an access token.
    ///
    /// The returned identity never carries a credential hash.
    [[nodiscard]] AuthResult<Identity> authorize(std::string_view token);

    /// authorize() for an HTTP Authorization header value ("Bearer <token>").
    [[nodiscard]] AuthResult<Identity> authorizeHeader(std::string_view headerValue);

    /// Create an identity with role "user".
    /// @return The identity (without hash), InvalidArgument, Conflict or
    ///         Unavailable.
    [[nodiscard]] AuthResult<Identity> registerUser(std::string_view loginName,
                                                    std::string_view secret);

    /// Replace a secret after checking the current one.
    [[nodiscard]] AuthResult<void> changeCredential(UserId userId,
                                                    std::string_view currentSecret,
                                                    std::string_view newSecret);

    /// Remove an identity. Tokens already issued for it stop resolving.
    [[nodiscard]] AuthResult<void> deleteAccount(UserId userId);

    [[nodiscard]] const AuthConfig& config() const noexcept { return config_; }

private:
    void cacheIdentity(const std::string& subject,
                       const Identity& identity,
                       std::chrono::system_clock::time_point tokenExpiry);

    AuthConfig config_;
    std::shared_ptr<IUserDirectory> directory_;
    std::shared_ptr<ISessionCache> cache_;
    ClockSource clock_;
    std::unique_ptr<CredentialHasher> hasher_;
    std::unique_ptr<TokenCodec> codec_;
    std::string dummyHash_;
};

}  // namespace cas::service
