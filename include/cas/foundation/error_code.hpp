#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the auth server.

#include <cstdint>
#include <string_view>

namespace cas::foundation {

/// Error codes grouped by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    Conflict = 0x0004,

    // Storage / cache collaborators (0x0100 - 0x01FF)
    Unavailable = 0x0100,

    // Credentials (0x0200 - 0x02FF)
    InvalidCredentials = 0x0200,
    AccountNotFound = 0x0201,
    CryptoFailure = 0x0202,

    // Tokens (0x0300 - 0x03FF)
    MalformedToken = 0x0300,
    InvalidSignature = 0x0301,
    TokenExpired = 0x0302,

    // Config (0x0400 - 0x04FF)
    ConfigurationError = 0x0400,
    ConfigLoadFailed = 0x0401,
    ConfigKeyNotFound = 0x0402,
    ConfigTypeMismatch = 0x0403,

    // Logger (0x0500 - 0x05FF)
    LoggerError = 0x0500,
    LoggerFlushFailed = 0x0501,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Storage";
        case 0x0200: return "Credential";
        case 0x0300: return "Token";
        case 0x0400: return "Config";
        case 0x0500: return "Logger";
        default: return "Unknown";
    }
}

/// Stable, client-facing name of an error code.
///
/// This is the only detail a transport layer should echo back to callers.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::Unavailable: return "Unavailable";
        case ErrorCode::InvalidCredentials: return "InvalidCredentials";
        case ErrorCode::AccountNotFound: return "AccountNotFound";
        case ErrorCode::CryptoFailure: return "CryptoFailure";
        case ErrorCode::MalformedToken: return "Malformed";
        case ErrorCode::InvalidSignature: return "InvalidSignature";
        case ErrorCode::TokenExpired: return "Expired";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::LoggerError: return "LoggerError";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
    }
    return "Unknown";
}

} // namespace cas::foundation
