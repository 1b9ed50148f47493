#pragma once

/// @file auth_error.hpp
/// @brief Error type carried by AuthResult<T>.

#include <string>
#include <string_view>
#include <utility>

#include "cas/foundation/error_code.hpp"

namespace cas::foundation {

/// Error value with a categorized code and a human-readable message.
///
/// The message is meant for operators and logs. Anything returned to an
/// untrusted client should be derived from code() alone.
class AuthError {
public:
    AuthError() = default;

    explicit AuthError(ErrorCode code)
        : code_(code) {}

    AuthError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    [[nodiscard]] bool is(ErrorCode code) const noexcept { return code_ == code; }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace cas::foundation
