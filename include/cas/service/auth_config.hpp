#pragma once

/// @file auth_config.hpp
/// @brief Startup checks and YAML mapping for AuthConfig.

#include "cas/foundation/auth_result.hpp"
#include "cas/foundation/config_manager.hpp"
#include "cas/service/auth_types.hpp"

namespace cas::service {

using cas::foundation::AuthResult;

/// Check that a configuration can issue and validate tokens.
///
/// Rejects: HS256 without a key of at least kMinSigningKeyLength bytes,
/// RS256 without both PEM keys (or with keys OpenSSL cannot parse),
/// non-positive token or cache TTLs, a negative clock grace, durations whose
/// deadlines would pass kMaxTokenEpochSeconds and a zero iteration count.
///
/// @return Success or ConfigurationError naming the offending field.
[[nodiscard]] AuthResult<void> validateAuthConfig(const AuthConfig& config);

/// Build an AuthConfig from keys under "auth." in a loaded ConfigManager.
///
/// Absent keys keep their defaults. A present key of the wrong type, or an
/// unknown algorithm name, is a ConfigurationError. The result is not
/// validated; call validateAuthConfig() before use.
[[nodiscard]] AuthResult<AuthConfig> loadAuthConfig(const cas::foundation::ConfigManager& config);

}  // namespace cas::service
