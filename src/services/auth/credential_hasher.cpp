/// @file credential_hasher.cpp
/// @brief CredentialHasher implementation over OpenSSL PBKDF2.

#include "cas/service/credential_hasher.hpp"

#include "cas/foundation/auth_logger.hpp"
#include "crypto_utils.hpp"

#include <charconv>
#include <vector>

namespace cas::service {

using cas::foundation::LogCategory;

namespace {

/// Split "$tag$iter$salt$key" into its four fields.
bool splitHash(std::string_view value, std::vector<std::string_view>& fields) {
    if (value.empty() || value.front() != '$') {
        return false;
    }
    value.remove_prefix(1);
    fields.clear();
    while (true) {
        auto pos = value.find('$');
        fields.push_back(value.substr(0, pos));
        if (pos == std::string_view::npos) {
            break;
        }
        value.remove_prefix(pos + 1);
    }
    return fields.size() == 4;
}

}  // namespace

CredentialHasher::CredentialHasher(uint32_t iterations)
    : iterations_(iterations) {}

AuthResult<std::string> CredentialHasher::hash(std::string_view plaintext) const {
    auto salt = detail::secureRandomBytes(kSaltLength);
    if (!salt) {
        CAS_LOG_ERROR(LogCategory::Credential, "random salt generation failed");
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoFailure, "random salt generation failed"));
    }

    auto key = detail::pbkdf2Sha256(plaintext, *salt, iterations_, kKeyLength);
    if (!key) {
        CAS_LOG_ERROR(LogCategory::Credential, "key derivation failed");
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoFailure, "key derivation failed"));
    }

    std::string encoded;
    encoded.reserve(96);
    encoded += '$';
    encoded += kAlgorithmTag;
    encoded += '$';
    encoded += std::to_string(iterations_);
    encoded += '$';
    encoded += detail::base64urlEncode(*salt);
    encoded += '$';
    encoded += detail::base64urlEncode(*key);
    return AuthResult<std::string>::ok(std::move(encoded));
}

bool CredentialHasher::verify(std::string_view plaintext, std::string_view hashValue) const {
    std::vector<std::string_view> fields;
    if (!splitHash(hashValue, fields) || fields[0] != kAlgorithmTag) {
        return false;
    }

    const auto& iterText = fields[1];
    uint32_t iterations = 0;
    auto [ptr, ec] = std::from_chars(iterText.data(), iterText.data() + iterText.size(),
                                     iterations);
    if (ec != std::errc{} || ptr != iterText.data() + iterText.size() ||
        iterations == 0 || iterations > kMaxIterations) {
        return false;
    }

    auto salt = detail::base64urlDecode(fields[2]);
    auto expected = detail::base64urlDecode(fields[3]);
    if (!salt || !expected || salt->empty() || expected->empty() ||
        expected->size() > 2 * kKeyLength) {
        return false;
    }

    auto derived = detail::pbkdf2Sha256(plaintext, *salt, iterations, expected->size());
    if (!derived) {
        CAS_LOG_ERROR(LogCategory::Credential, "key derivation failed during verify");
        return false;
    }
    return detail::constantTimeEqual(*derived, *expected);
}

}  // namespace cas::service
