#pragma once

/// @file rsa_utils.hpp
/// @brief RSA-SHA256 signing and verification using the OpenSSL 3.x EVP API.
///
/// Keys are loaded from PEM strings through BIO_new_mem_buf (no file I/O).

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace cas::service::detail {

struct BioDeleter {
    void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

/// Parse a PEM private key. Empty pointer if the PEM is unusable.
[[nodiscard]] inline PkeyPtr loadPrivateKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    PkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    ERR_clear_error();
    return key;
}

/// Parse a PEM SubjectPublicKeyInfo. Empty pointer if the PEM is unusable.
[[nodiscard]] inline PkeyPtr loadPublicKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    PkeyPtr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    ERR_clear_error();
    return key;
}

/// Sign a message with RSA-SHA256 (PKCS#1 v1.5).
///
/// @return Raw signature bytes, or nullopt on failure.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> rsaSha256Sign(EVP_PKEY* key,
                                                                       std::string_view message) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || key == nullptr) {
        return std::nullopt;
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
        return std::nullopt;
    }

    std::size_t sigLen = 0;
    const auto* data = reinterpret_cast<const unsigned char*>(message.data());
    if (EVP_DigestSign(ctx.get(), nullptr, &sigLen, data, message.size()) != 1) {
        return std::nullopt;
    }
    std::vector<uint8_t> signature(sigLen);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, data, message.size()) != 1) {
        return std::nullopt;
    }
    signature.resize(sigLen);
    return signature;
}

/// Verify an RSA-SHA256 signature.
[[nodiscard]] inline bool rsaSha256Verify(EVP_PKEY* key,
                                          std::string_view message,
                                          const std::vector<uint8_t>& signature) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || key == nullptr) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
        return false;
    }
    int result = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                  reinterpret_cast<const unsigned char*>(message.data()),
                                  message.size());
    ERR_clear_error();
    return result == 1;
}

}  // namespace cas::service::detail
