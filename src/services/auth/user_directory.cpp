/// @file user_directory.cpp
/// @brief InMemoryUserDirectory implementation.

#include "cas/service/user_directory.hpp"

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::ErrorCode;

namespace {

template <typename T>
AuthResult<T> unavailable() {
    return AuthResult<T>::err(AuthError(ErrorCode::Unavailable, "user directory is unavailable"));
}

template <typename T>
AuthResult<T> notFound() {
    return AuthResult<T>::err(AuthError(ErrorCode::NotFound, "identity not found"));
}

}  // namespace

InMemoryUserDirectory::InMemoryUserDirectory(ClockSource clock)
    : clock_(clock ? std::move(clock) : systemClock()) {}

AuthResult<Identity> InMemoryUserDirectory::findByLogin(std::string_view loginName) const {
    if (!available_.load(std::memory_order_acquire)) {
        return unavailable<Identity>();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loginIndex_.find(std::string(loginName));
    if (it == loginIndex_.end()) {
        return notFound<Identity>();
    }
    return AuthResult<Identity>::ok(users_.at(it->second));
}

AuthResult<Identity> InMemoryUserDirectory::findById(UserId userId) const {
    if (!available_.load(std::memory_order_acquire)) {
        return unavailable<Identity>();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(userId);
    if (it == users_.end()) {
        return notFound<Identity>();
    }
    return AuthResult<Identity>::ok(it->second);
}

AuthResult<Identity> InMemoryUserDirectory::create(std::string_view loginName,
                                                   std::string_view credentialHash,
                                                   std::string_view role) {
    if (!available_.load(std::memory_order_acquire)) {
        return unavailable<Identity>();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key(loginName);
    if (loginIndex_.count(key) > 0) {
        return AuthResult<Identity>::err(
            AuthError(ErrorCode::Conflict, "login name is already registered"));
    }

    Identity identity;
    identity.userId = UserId(nextId_++);
    identity.loginName = key;
    identity.credentialHash = std::string(credentialHash);
    identity.role = std::string(role);
    identity.createdAt = clock_();

    loginIndex_.emplace(std::move(key), identity.userId);
    users_.emplace(identity.userId, identity);
    return AuthResult<Identity>::ok(std::move(identity));
}

AuthResult<void> InMemoryUserDirectory::updateCredentialHash(UserId userId,
                                                             std::string_view credentialHash) {
    if (!available_.load(std::memory_order_acquire)) {
        return unavailable<void>();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(userId);
    if (it == users_.end()) {
        return notFound<void>();
    }
    it->second.credentialHash = std::string(credentialHash);
    return AuthResult<void>::ok();
}

AuthResult<void> InMemoryUserDirectory::remove(UserId userId) {
    if (!available_.load(std::memory_order_acquire)) {
        return unavailable<void>();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(userId);
    if (it == users_.end()) {
        return notFound<void>();
    }
    loginIndex_.erase(it->second.loginName);
    users_.erase(it);
    return AuthResult<void>::ok();
}

void InMemoryUserDirectory::setAvailable(bool available) noexcept {
    available_.store(available, std::memory_order_release);
}

std::size_t InMemoryUserDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

} // namespace cas::service
