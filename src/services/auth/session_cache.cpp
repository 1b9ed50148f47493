/// @file session_cache.cpp
/// @brief InMemorySessionCache implementation using a doubly-linked list +
///        hash map for O(1) LRU eviction and lookup.

#include "cas/service/session_cache.hpp"

#include <algorithm>
#include <atomic>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::ErrorCode;

// ── Cache entry stored in the LRU list ──────────────────────────────────────

struct SessionEntry {
    std::string key;
    Identity identity;
    std::chrono::system_clock::time_point expiresAt;
    bool revoked = false;
};

// ── Impl ────────────────────────────────────────────────────────────────────

struct InMemorySessionCache::Impl {
    std::size_t maxEntries = 0;
    ClockSource clock;

    // front = most recently used, back = least recently used.
    std::list<SessionEntry> lruList;
    std::unordered_map<std::string, std::list<SessionEntry>::iterator> index;

    mutable std::mutex mutex;

    std::atomic<bool> available{true};
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};

    void touch(std::list<SessionEntry>::iterator it) {
        lruList.splice(lruList.begin(), lruList, it);
    }

    void erase(std::unordered_map<std::string,
                                  std::list<SessionEntry>::iterator>::iterator it) {
        lruList.erase(it->second);
        index.erase(it);
    }

    // Drop expired entries first; fall back to the least recently used one.
    void makeRoom(std::chrono::system_clock::time_point now) {
        for (auto it = lruList.begin(); it != lruList.end();) {
            if (it->expiresAt <= now) {
                index.erase(it->key);
                it = lruList.erase(it);
            } else {
                ++it;
            }
        }
        while (!lruList.empty() && lruList.size() >= maxEntries) {
            index.erase(lruList.back().key);
            lruList.pop_back();
        }
    }

    AuthResult<void> insert(std::string key, SessionEntry entry,
                            std::chrono::system_clock::time_point now) {
        if (maxEntries == 0) {
            return AuthResult<void>::ok();
        }
        if (lruList.size() >= maxEntries) {
            makeRoom(now);
        }
        lruList.push_front(std::move(entry));
        index[std::move(key)] = lruList.begin();
        return AuthResult<void>::ok();
    }

    AuthResult<void> checkAvailable() const {
        if (!available.load(std::memory_order_acquire)) {
            return AuthResult<void>::err(
                AuthError(ErrorCode::Unavailable, "session cache is unavailable"));
        }
        return AuthResult<void>::ok();
    }
};

// ── Construction / destruction ──────────────────────────────────────────────

InMemorySessionCache::InMemorySessionCache(std::size_t maxEntries, ClockSource clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->maxEntries = maxEntries;
    impl_->clock = clock ? std::move(clock) : systemClock();
}

InMemorySessionCache::~InMemorySessionCache() = default;

// ── get() ───────────────────────────────────────────────────────────────────

AuthResult<std::optional<Identity>> InMemorySessionCache::get(std::string_view key) {
    if (auto status = impl_->checkAvailable(); !status) {
        return AuthResult<std::optional<Identity>>::err(status.error());
    }

    std::lock_guard lock(impl_->mutex);
    auto it = impl_->index.find(std::string(key));
    if (it == impl_->index.end()) {
        impl_->misses.fetch_add(1, std::memory_order_relaxed);
        return AuthResult<std::optional<Identity>>::ok(std::nullopt);
    }

    if (it->second->expiresAt <= impl_->clock()) {
        impl_->erase(it);
        impl_->misses.fetch_add(1, std::memory_order_relaxed);
        return AuthResult<std::optional<Identity>>::ok(std::nullopt);
    }
    if (it->second->revoked) {
        impl_->misses.fetch_add(1, std::memory_order_relaxed);
        return AuthResult<std::optional<Identity>>::ok(std::nullopt);
    }

    impl_->touch(it->second);
    impl_->hits.fetch_add(1, std::memory_order_relaxed);
    return AuthResult<std::optional<Identity>>::ok(it->second->identity);
}

// ── put() ───────────────────────────────────────────────────────────────────

AuthResult<void> InMemorySessionCache::put(std::string_view key,
                                           const Identity& identity,
                                           std::chrono::seconds ttl) {
    if (auto status = impl_->checkAvailable(); !status) {
        return status;
    }
    if (ttl <= std::chrono::seconds::zero()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidArgument, "cache ttl must be positive"));
    }

    std::lock_guard lock(impl_->mutex);
    auto now = impl_->clock();
    auto keyStr = std::string(key);

    auto it = impl_->index.find(keyStr);
    if (it != impl_->index.end()) {
        auto& entry = *it->second;
        if (entry.revoked && entry.expiresAt > now) {
            return AuthResult<void>::ok();
        }
        entry.identity = identity;
        entry.expiresAt = now + ttl;
        entry.revoked = false;
        impl_->touch(it->second);
        return AuthResult<void>::ok();
    }

    return impl_->insert(keyStr, SessionEntry{keyStr, identity, now + ttl}, now);
}

// ── invalidate() ────────────────────────────────────────────────────────────

AuthResult<void> InMemorySessionCache::invalidate(std::string_view key) {
    if (auto status = impl_->checkAvailable(); !status) {
        return status;
    }

    std::lock_guard lock(impl_->mutex);
    auto it = impl_->index.find(std::string(key));
    if (it != impl_->index.end()) {
        impl_->erase(it);
    }
    return AuthResult<void>::ok();
}

// ── revoke() ────────────────────────────────────────────────────────────────

AuthResult<void> InMemorySessionCache::revoke(std::string_view key,
                                              std::chrono::seconds ttl) {
    if (auto status = impl_->checkAvailable(); !status) {
        return status;
    }
    if (ttl <= std::chrono::seconds::zero()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidArgument, "cache ttl must be positive"));
    }

    std::lock_guard lock(impl_->mutex);
    auto now = impl_->clock();
    auto keyStr = std::string(key);

    auto it = impl_->index.find(keyStr);
    if (it != impl_->index.end()) {
        auto& entry = *it->second;
        entry.identity = Identity{};
        entry.expiresAt = std::max(entry.revoked ? entry.expiresAt : now, now + ttl);
        entry.revoked = true;
        impl_->touch(it->second);
        return AuthResult<void>::ok();
    }

    SessionEntry mark{keyStr, Identity{}, now + ttl};
    mark.revoked = true;
    return impl_->insert(keyStr, std::move(mark), now);
}

// ── Diagnostics ─────────────────────────────────────────────────────────────

void InMemorySessionCache::setAvailable(bool available) noexcept {
    impl_->available.store(available, std::memory_order_release);
}

std::size_t InMemorySessionCache::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->lruList.size();
}

uint64_t InMemorySessionCache::hitCount() const {
    return impl_->hits.load(std::memory_order_relaxed);
}

uint64_t InMemorySessionCache::missCount() const {
    return impl_->misses.load(std::memory_order_relaxed);
}

} // namespace cas::service
