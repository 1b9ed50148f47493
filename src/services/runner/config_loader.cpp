/// @file config_loader.cpp
/// @brief loadConfig() and parseConfigArg().

#include "cas/service/config_loader.hpp"

#include "cas/foundation/auth_logger.hpp"

#include <cstdlib>
#include <string>
#include <string_view>

namespace cas::service {

using cas::foundation::LogCategory;

// -- Config loading ----------------------------------------------------------

cas::foundation::AuthResult<void>
loadConfig(cas::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("CAS_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    auto loaded = config.load(configPath);
    if (!loaded) {
        CAS_LOG_ERROR(LogCategory::Config, std::string(loaded.error().message()));
    } else {
        CAS_LOG_INFO(LogCategory::Config, "configuration loaded from " + configPath.string());
    }
    return loaded;
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace cas::service
