#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "cas/foundation/auth_result.hpp"

namespace cas::foundation {

/// YAML-backed configuration store.
///
/// The YAML tree is flattened into a map of dotted keys
/// (e.g. "auth.token_ttl_seconds") so lookups never walk yaml-cpp nodes
/// that alias one another.
///
/// Example:
/// @code
///   ConfigManager config;
///   if (auto loaded = config.load("/etc/cas/auth.yaml"); !loaded) {
///       return loaded.error();
///   }
///   auto ttl = config.get<int>("auth.token_ttl_seconds");
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    AuthResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    AuthResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value, or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    AuthResult<T> get(std::string_view key) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
AuthResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return AuthResult<T>::err(
            AuthError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return AuthResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return AuthResult<T>::err(
            AuthError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

} // namespace cas::foundation
