#pragma once

/// @file session_cache.hpp
/// @brief Short-lived cache of resolved identities keyed by token subject.
///
/// The cache only saves directory round-trips. A miss is never an
/// authorization decision, and callers treat cache failures as misses.

#include "cas/foundation/auth_result.hpp"
#include "cas/service/auth_types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace cas::service {

using cas::foundation::AuthResult;

/// Abstract session cache.
///
/// Implementations must be thread-safe. put() overwrites and invalidate()
/// of an absent key succeeds, so both are idempotent. A key marked by
/// revoke() reads as a miss and ignores put() until the mark expires.
class ISessionCache {
public:
    virtual ~ISessionCache() = default;

    /// Look up an entry.
    /// @return The identity, nullopt on a miss, or Unavailable.
    [[nodiscard]] virtual AuthResult<std::optional<Identity>> get(std::string_view key) = 0;

    /// Store an entry that expires after ttl.
    [[nodiscard]] virtual AuthResult<void> put(std::string_view key,
                                               const Identity& identity,
                                               std::chrono::seconds ttl) = 0;

    /// Drop an entry if present.
    [[nodiscard]] virtual AuthResult<void> invalidate(std::string_view key) = 0;

    /// Drop an entry and block refills of the key for ttl.
    ///
    /// A put() racing with the revocation, started from a lookup made
    /// before it, cannot bring the entry back.
    [[nodiscard]] virtual AuthResult<void> revoke(std::string_view key,
                                                  std::chrono::seconds ttl) = 0;
};

/// Thread-safe in-memory LRU cache with per-entry expiry.
///
/// Usage:
/// @code
///   InMemorySessionCache cache(10000);
///   (void)cache.put("42", identity, std::chrono::minutes{5});
///   auto hit = cache.get("42");
/// @endcode
class InMemorySessionCache : public ISessionCache {
public:
    explicit InMemorySessionCache(std::size_t maxEntries, ClockSource clock = systemClock());
    ~InMemorySessionCache() override;

    InMemorySessionCache(const InMemorySessionCache&) = delete;
    InMemorySessionCache& operator=(const InMemorySessionCache&) = delete;

    [[nodiscard]] AuthResult<std::optional<Identity>> get(std::string_view key) override;

    [[nodiscard]] AuthResult<void> put(std::string_view key,
                                       const Identity& identity,
                                       std::chrono::seconds ttl) override;

    [[nodiscard]] AuthResult<void> invalidate(std::string_view key) override;

    [[nodiscard]] AuthResult<void> revoke(std::string_view key,
                                          std::chrono::seconds ttl) override;

    /// Make every call fail with Unavailable (simulates a lost cache node).
    void setAvailable(bool available) noexcept;

    /// Number of stored entries, including revocation marks and ones that
    /// expired but were not yet looked up.
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] uint64_t hitCount() const;

    [[nodiscard]] uint64_t missCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cas::service
