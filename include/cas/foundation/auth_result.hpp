#pragma once

/// @file auth_result.hpp
/// @brief AuthResult<T> type alias for auth-specific error handling.

#include "cas/core/result.hpp"
#include "cas/foundation/auth_error.hpp"

namespace cas::foundation {

/// Result type specialized with AuthError.
///
/// Example:
/// @code
///   AuthResult<Identity> lookup(uint64_t id) {
///       if (id == 0) {
///           return AuthResult<Identity>::err(
///               AuthError(ErrorCode::InvalidArgument, "user id must be non-zero"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using AuthResult = cas::Result<T, AuthError>;

}  // namespace cas::foundation
