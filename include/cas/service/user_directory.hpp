#pragma once

/// @file user_directory.hpp
/// @brief Identity lookup interface and in-memory implementation.
///
/// Abstracts the durable store of identities so the Authenticator can work
/// with any backend. Lookups distinguish "no such identity" (NotFound) from
/// "store unreachable" (Unavailable).

#include "cas/foundation/auth_result.hpp"
#include "cas/service/auth_types.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cas::service {

using cas::foundation::AuthResult;

/// Abstract interface for identity persistence.
///
/// Implementations must be thread-safe when shared across threads.
class IUserDirectory {
public:
    virtual ~IUserDirectory() = default;

    /// Find an identity by login name (case-sensitive).
    /// @return The identity, NotFound or Unavailable.
    [[nodiscard]] virtual AuthResult<Identity> findByLogin(std::string_view loginName) const = 0;

    /// Find an identity by user id.
    /// @return The identity, NotFound or Unavailable.
    [[nodiscard]] virtual AuthResult<Identity> findById(UserId userId) const = 0;

    /// Create a new identity and assign its user id.
    /// @return The stored identity, Conflict if the login name is taken, or
    ///         Unavailable.
    [[nodiscard]] virtual AuthResult<Identity> create(std::string_view loginName,
                                                      std::string_view credentialHash,
                                                      std::string_view role) = 0;

    /// Replace the stored credential hash.
    /// @return Success, NotFound or Unavailable.
    [[nodiscard]] virtual AuthResult<void> updateCredentialHash(UserId userId,
                                                                std::string_view credentialHash) = 0;

    /// Delete an identity.
    /// @return Success, NotFound or Unavailable.
    [[nodiscard]] virtual AuthResult<void> remove(UserId userId) = 0;
};

/// Thread-safe in-memory user directory for testing and development.
///
/// User ids are assigned sequentially starting at 1. setAvailable(false)
/// makes every call fail with Unavailable, which stands in for a lost
/// database connection.
class InMemoryUserDirectory : public IUserDirectory {
public:
    explicit InMemoryUserDirectory(ClockSource clock = systemClock());

    [[nodiscard]] AuthResult<Identity> findByLogin(std::string_view loginName) const override;

    [[nodiscard]] AuthResult<Identity> findById(UserId userId) const override;

    [[nodiscard]] AuthResult<Identity> create(std::string_view loginName,
                                              std::string_view credentialHash,
                                              std::string_view role) override;

    [[nodiscard]] AuthResult<void> updateCredentialHash(UserId userId,
                                                        std::string_view credentialHash) override;

    [[nodiscard]] AuthResult<void> remove(UserId userId) override;

    void setAvailable(bool available) noexcept;

    [[nodiscard]] std::size_t size() const;

private:
    ClockSource clock_;
    std::atomic<bool> available_{true};

    mutable std::mutex mutex_;
    std::unordered_map<UserId, Identity> users_;
    std::unordered_map<std::string, UserId> loginIndex_;
    uint64_t nextId_ = 1;
};

}  // namespace cas::service
