#pragma once

/// @file credential_hasher.hpp
/// @brief Salted, deliberately slow credential hashing (PBKDF2-HMAC-SHA256).
///
/// Hashes are self-describing so the work factor can be raised later without
/// invalidating existing records:
///
///   $pbkdf2-sha256$<iterations>$<base64url salt>$<base64url key>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "cas/foundation/auth_result.hpp"

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;

/// One-way credential hashing and verification.
///
/// Stateless apart from the configured work factor; safe to share between
/// threads.
///
/// Example:
/// @code
///   CredentialHasher hasher(600000);
///   auto stored = hasher.hash("CorrectHorse1");
///   bool ok = hasher.verify("CorrectHorse1", stored.value());
/// @endcode
class CredentialHasher {
public:
    static constexpr std::string_view kAlgorithmTag = "pbkdf2-sha256";
    static constexpr std::size_t kSaltLength = 16;
    static constexpr std::size_t kKeyLength = 32;

    /// Upper bound accepted from a stored hash; anything above is treated
    /// as malformed rather than run.
    static constexpr uint32_t kMaxIterations = 10'000'000;

    explicit CredentialHasher(uint32_t iterations);

    /// Hash a plaintext credential with a fresh random salt.
    ///
    /// @return The encoded hash, or CryptoFailure if libcrypto fails.
    [[nodiscard]] AuthResult<std::string> hash(std::string_view plaintext) const;

    /// Check a plaintext credential against a stored hash.
    ///
    /// Returns false for a mismatch and for any hash value that cannot be
    /// parsed; never reports an error.
    [[nodiscard]] bool verify(std::string_view plaintext, std::string_view hashValue) const;

    [[nodiscard]] uint32_t iterations() const noexcept { return iterations_; }

private:
    uint32_t iterations_;
};

}  // namespace cas::service
