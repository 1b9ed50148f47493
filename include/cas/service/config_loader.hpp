#pragma once

/// @file config_loader.hpp
/// @brief Configuration file resolution shared by the command-line tools.

#include <filesystem>

#include "cas/foundation/auth_result.hpp"
#include "cas/foundation/config_manager.hpp"

namespace cas::service {

/// Default configuration file used when neither --config nor
/// CAS_CONFIG_PATH is given.
inline constexpr const char* kDefaultConfigPath = "/etc/cas/auth.yaml";

/// Load YAML configuration into a ConfigManager.
///
/// The CAS_CONFIG_PATH environment variable, when set, overrides
/// defaultPath.
///
/// @param config     ConfigManager to populate.
/// @param defaultPath Fallback config file path.
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] cas::foundation::AuthResult<void>
loadConfig(cas::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

} // namespace cas::service
