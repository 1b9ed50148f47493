#pragma once

/// @file input_validator.hpp
/// @brief Login-name and secret checks applied before anything is hashed.
///
/// Login names are email addresses (RFC 5322 subset, RFC 5321 limits).
/// Secrets are checked for length and character-class variety.

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace cas::service {

/// Outcome of a validation check. The message is safe to show to the user.
struct ValidationResult {
    bool valid;
    std::string message;

    explicit operator bool() const noexcept { return valid; }

    static ValidationResult ok() { return {true, {}}; }
    static ValidationResult fail(std::string msg) {
        return {false, std::move(msg)};
    }
};

/// Stateless checks, safe to call from any thread.
class InputValidator {
public:
    static constexpr std::size_t kMaxLoginNameLength = 254;
    static constexpr std::size_t kMaxLocalPartLength = 64;
    static constexpr std::size_t kMaxDomainLength = 253;
    static constexpr std::size_t kMaxDomainLabelLength = 63;

    static constexpr std::size_t kMaxPasswordLength = 128;

    /// Character classes (upper, lower, digit, other) a secret must mix.
    static constexpr int kRequiredPasswordClasses = 3;

    // -- Login name -----------------------------------------------------------

    [[nodiscard]] static ValidationResult validateLoginName(std::string_view loginName) {
        if (loginName.empty()) {
            return ValidationResult::fail("login name must not be empty");
        }
        if (loginName.size() > kMaxLoginNameLength) {
            return ValidationResult::fail("login name exceeds maximum length");
        }

        auto at = loginName.find('@');
        if (at == std::string_view::npos || loginName.rfind('@') != at) {
            return ValidationResult::fail("login name must be an email address");
        }
        if (auto local = checkLocalPart(loginName.substr(0, at)); !local) {
            return local;
        }
        return checkDomain(loginName.substr(at + 1));
    }

    // -- Secret ---------------------------------------------------------------

    [[nodiscard]] static ValidationResult validatePassword(std::string_view password,
                                                           uint32_t minLength) {
        if (password.size() < minLength) {
            return ValidationResult::fail(
                "password must be at least " + std::to_string(minLength) + " characters");
        }
        if (password.size() > kMaxPasswordLength) {
            return ValidationResult::fail(
                "password must not exceed " + std::to_string(kMaxPasswordLength) +
                " characters");
        }
        if (characterClasses(password) < kRequiredPasswordClasses) {
            return ValidationResult::fail(
                "password must mix at least three of: uppercase, lowercase, digits, symbols");
        }
        return ValidationResult::ok();
    }

private:
    static ValidationResult checkLocalPart(std::string_view local) {
        if (local.empty() || local.size() > kMaxLocalPartLength) {
            return ValidationResult::fail("email local part has an invalid length");
        }
        if (local.front() == '.' || local.back() == '.' ||
            local.find("..") != std::string_view::npos) {
            return ValidationResult::fail("email local part has misplaced dots");
        }
        for (char c : local) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && !isAtextSpecial(c)) {
                return ValidationResult::fail("email local part contains invalid character");
            }
        }
        return ValidationResult::ok();
    }

    /// Dot-separated labels of [A-Za-z0-9-], no label empty or hyphen-edged,
    /// at least two labels.
    static ValidationResult checkDomain(std::string_view domain) {
        if (domain.empty() || domain.size() > kMaxDomainLength) {
            return ValidationResult::fail("email domain is invalid");
        }
        if (domain.find('.') == std::string_view::npos) {
            return ValidationResult::fail("email domain must have at least one dot");
        }

        while (true) {
            auto dot = domain.find('.');
            auto label = domain.substr(0, dot);
            if (label.empty() || label.size() > kMaxDomainLabelLength ||
                label.front() == '-' || label.back() == '-') {
                return ValidationResult::fail("email domain label is invalid");
            }
            for (char c : label) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
                    return ValidationResult::fail("email domain contains invalid character");
                }
            }
            if (dot == std::string_view::npos) {
                return ValidationResult::ok();
            }
            domain.remove_prefix(dot + 1);
        }
    }

    static int characterClasses(std::string_view password) {
        int upper = 0;
        int lower = 0;
        int digit = 0;
        int other = 0;
        for (char c : password) {
            auto uc = static_cast<unsigned char>(c);
            if (std::isupper(uc)) {
                upper = 1;
            } else if (std::islower(uc)) {
                lower = 1;
            } else if (std::isdigit(uc)) {
                digit = 1;
            } else {
                other = 1;
            }
        }
        return upper + lower + digit + other;
    }

    /// RFC 5322 atext specials, plus '.' (placement checked separately).
    static constexpr bool isAtextSpecial(char c) noexcept {
        constexpr std::string_view specials = ".!#$%&'*+/=?^_`{|}~-";
        return specials.find(c) != std::string_view::npos;
    }
};

} // namespace cas::service
