/// @file auth_config.cpp
/// @brief validateAuthConfig() and loadAuthConfig().

#include "cas/service/auth_config.hpp"

#include "cas/foundation/auth_logger.hpp"
#include "cas/service/credential_hasher.hpp"
#include "rsa_utils.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::ConfigManager;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;

namespace {

AuthResult<void> configError(std::string message) {
    return AuthResult<void>::err(AuthError(ErrorCode::ConfigurationError, std::move(message)));
}

/// Read an optional key into target. Missing keys leave target unchanged.
template <typename T>
AuthResult<void> readOptional(const ConfigManager& config, std::string_view key, T& target) {
    if (!config.hasKey(key)) {
        return AuthResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return configError("invalid value for " + std::string(key) + ": " +
                           std::string(value.error().message()));
    }
    target = std::move(value).value();
    return AuthResult<void>::ok();
}

}  // namespace

AuthResult<void> validateAuthConfig(const AuthConfig& config) {
    switch (config.algorithm) {
        case TokenAlgorithm::HS256:
            if (config.signingKey.empty()) {
                return configError("auth.signing_key is required for HS256");
            }
            if (config.signingKey.size() < kMinSigningKeyLength) {
                return configError("auth.signing_key must be at least " +
                                   std::to_string(kMinSigningKeyLength) + " bytes");
            }
            break;
        case TokenAlgorithm::RS256:
            if (config.rsaPrivateKeyPem.empty() || config.rsaPublicKeyPem.empty()) {
                return configError("RS256 requires auth.rsa_private_key_pem and "
                                   "auth.rsa_public_key_pem");
            }
            if (!detail::loadPrivateKey(config.rsaPrivateKeyPem)) {
                return configError("auth.rsa_private_key_pem is not a usable private key");
            }
            if (!detail::loadPublicKey(config.rsaPublicKeyPem)) {
                return configError("auth.rsa_public_key_pem is not a usable public key");
            }
            break;
    }

    if (config.tokenTtl <= std::chrono::seconds::zero()) {
        return configError("auth.token_ttl_seconds must be positive");
    }
    if (config.cacheTtl && *config.cacheTtl <= std::chrono::seconds::zero()) {
        return configError("auth.cache_ttl_seconds must be positive");
    }
    if (config.clockSkewGrace < std::chrono::seconds::zero()) {
        return configError("auth.clock_skew_grace_seconds must not be negative");
    }

    // Every deadline derived from these durations must stay representable.
    auto headroom = kMaxTokenEpochSeconds -
                    std::chrono::floor<std::chrono::seconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    if (config.tokenTtl.count() > headroom) {
        return configError("auth.token_ttl_seconds is too large");
    }
    if (config.clockSkewGrace.count() > headroom - config.tokenTtl.count()) {
        return configError("auth.clock_skew_grace_seconds is too large");
    }
    if (config.cacheTtl && config.cacheTtl->count() > headroom) {
        return configError("auth.cache_ttl_seconds is too large");
    }
    if (config.hashIterations == 0 ||
        config.hashIterations > CredentialHasher::kMaxIterations) {
        return configError("auth.hash_iterations is out of range");
    }
    return AuthResult<void>::ok();
}

AuthResult<AuthConfig> loadAuthConfig(const ConfigManager& config) {
    AuthConfig result;

    auto fail = [](const AuthResult<void>& status) {
        CAS_LOG_ERROR(LogCategory::Config, std::string(status.error().message()));
        return AuthResult<AuthConfig>::err(status.error());
    };

    if (auto s = readOptional(config, "auth.signing_key", result.signingKey); !s) {
        return fail(s);
    }
    if (auto s = readOptional(config, "auth.rsa_private_key_pem", result.rsaPrivateKeyPem); !s) {
        return fail(s);
    }
    if (auto s = readOptional(config, "auth.rsa_public_key_pem", result.rsaPublicKeyPem); !s) {
        return fail(s);
    }

    std::string algorithm(tokenAlgorithmName(result.algorithm));
    if (auto s = readOptional(config, "auth.algorithm", algorithm); !s) {
        return fail(s);
    }
    auto parsed = parseTokenAlgorithm(algorithm);
    if (!parsed) {
        return fail(configError("auth.algorithm must be HS256 or RS256"));
    }
    result.algorithm = *parsed;

    int64_t tokenTtl = result.tokenTtl.count();
    if (auto s = readOptional(config, "auth.token_ttl_seconds", tokenTtl); !s) {
        return fail(s);
    }
    result.tokenTtl = std::chrono::seconds{tokenTtl};

    // 0 disables the session cache.
    int64_t cacheTtl = result.cacheTtl ? result.cacheTtl->count() : 0;
    if (auto s = readOptional(config, "auth.cache_ttl_seconds", cacheTtl); !s) {
        return fail(s);
    }
    if (cacheTtl == 0) {
        result.cacheTtl.reset();
    } else {
        result.cacheTtl = std::chrono::seconds{cacheTtl};
    }

    int64_t grace = result.clockSkewGrace.count();
    if (auto s = readOptional(config, "auth.clock_skew_grace_seconds", grace); !s) {
        return fail(s);
    }
    result.clockSkewGrace = std::chrono::seconds{grace};

    if (auto s = readOptional(config, "auth.hash_iterations", result.hashIterations); !s) {
        return fail(s);
    }
    if (auto s = readOptional(config, "auth.min_password_length", result.minPasswordLength); !s) {
        return fail(s);
    }
    if (auto s = readOptional(config, "auth.cache_max_entries", result.cacheMaxEntries); !s) {
        return fail(s);
    }
    if (auto s = readOptional(config, "auth.warm_cache_on_login", result.warmCacheOnLogin); !s) {
        return fail(s);
    }

    CAS_LOG_INFO(LogCategory::Config,
                 "auth configuration loaded (algorithm=" + algorithm + ")");
    return AuthResult<AuthConfig>::ok(std::move(result));
}

}  // namespace cas::service
