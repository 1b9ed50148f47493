/// @file auth_logger.cpp
/// @brief AuthLogger implementation wrapping kcenon logger_system.

#include "cas/foundation/auth_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace cas::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: CAS -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Credential
    LogLevel::Info,     // Token
    LogLevel::Info,     // Directory
    LogLevel::Warning,  // Cache
    LogLevel::Info      // Config
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.userId && ctx.userId->isValid()) {
        append("user_id", std::to_string(ctx.userId->value()));
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct AuthLogger::Impl {
    // Lock-free reads on the hot path.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category.
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("cas.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // Unregistered names resolve to the NullLogger; use the default instead.
        if (!logger->is_enabled(kci::log_level::off)) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg, std::string_view ctx) const {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctx.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctx.empty()) {
            formatted += " {";
            formatted += ctx;
            formatted += '}';
        }
        // Sink failures are not propagated to callers.
        static_cast<void>(getLogger(cat)->log(mapLevel(level), formatted));
    }
};

AuthLogger::AuthLogger() : impl_(std::make_unique<Impl>()) {}

AuthLogger::~AuthLogger() = default;

AuthLogger::AuthLogger(AuthLogger&&) noexcept = default;
AuthLogger& AuthLogger::operator=(AuthLogger&&) noexcept = default;

void AuthLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void AuthLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void AuthLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel AuthLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool AuthLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

AuthResult<void> AuthLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return AuthResult<void>::ok();
}

AuthLogger& AuthLogger::instance() {
    static AuthLogger inst;
    return inst;
}

} // namespace cas::foundation
