#pragma once

/// @file auth_logger.hpp
/// @brief AuthLogger wrapping kcenon logger_system for structured auth logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cas/foundation/auth_result.hpp"
#include "cas/foundation/types.hpp"

namespace cas::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per auth component.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Startup, wiring, CLI
    Credential = 1, ///< Hashing and verification
    Token      = 2, ///< Token issue and validation
    Directory  = 3, ///< User directory access
    Cache      = 4, ///< Session cache access
    Config     = 5  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Credential", "Token", "Directory", "Cache", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log entry.
///
/// Never put secrets, credential hashes or token strings in here.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.userId = UserId(42);
///   ctx.extra["error"] = "Expired";
///   logger.logWithContext(LogLevel::Info, LogCategory::Token,
///                         "authorization rejected", ctx);
/// @endcode
struct LogContext {
    std::optional<UserId> userId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Auth logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Credential | Info          |
/// | Token      | Info          |
/// | Directory  | Info          |
/// | Cache      | Warning       |
/// | Config     | Info          |
class AuthLogger {
public:
    AuthLogger();
    ~AuthLogger();

    AuthLogger(const AuthLogger&) = delete;
    AuthLogger& operator=(const AuthLogger&) = delete;
    AuthLogger(AuthLogger&&) noexcept;
    AuthLogger& operator=(AuthLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    AuthResult<void> flush();

    /// Process-wide instance used by the CAS_LOG macros.
    static AuthLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cas::foundation

// ---------------------------------------------------------------------------
// Convenience macros (macros are global)
// ---------------------------------------------------------------------------

/// CAS_MIN_LOG_LEVEL can be defined before including this header to
/// drop logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef CAS_MIN_LOG_LEVEL
    #define CAS_MIN_LOG_LEVEL 0
#endif

#define CAS_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= CAS_MIN_LOG_LEVEL &&                      \
            ::cas::foundation::AuthLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::cas::foundation::AuthLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define CAS_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                         \
        if (static_cast<int>(level) >= CAS_MIN_LOG_LEVEL) {                      \
            ::cas::foundation::AuthLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                   \
        }                                                                        \
    } while (0)

#define CAS_LOG_DEBUG(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Debug, (cat), (msg))

#define CAS_LOG_INFO(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Info, (cat), (msg))

#define CAS_LOG_WARN(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Warning, (cat), (msg))

#define CAS_LOG_ERROR(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Error, (cat), (msg))
