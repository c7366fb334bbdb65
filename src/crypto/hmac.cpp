// Satchel - HMAC Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/crypto/hmac.h"

#include <stdexcept>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace satchel {

// ============================================================================
// HMAC
// ============================================================================

struct HMACStream::Impl {
    EVP_MAC* mac{nullptr};
    EVP_MAC_CTX* ctx{nullptr};
    size_t outputSize{0};

    Impl(Digest digest, const Byte* key, size_t keyLen) {
        mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
        if (!mac) {
            throw std::runtime_error("HMAC: EVP_MAC_fetch failed");
        }
        ctx = EVP_MAC_CTX_new(mac);
        if (!ctx) {
            EVP_MAC_free(mac);
            throw std::runtime_error("HMAC: EVP_MAC_CTX_new failed");
        }

        const char* name = digest == Digest::SHA256 ? "SHA256" : "SHA512";
        outputSize = digest == Digest::SHA256 ? 32 : 64;

        OSSL_PARAM params[2];
        params[0] = OSSL_PARAM_construct_utf8_string(
            OSSL_MAC_PARAM_DIGEST, const_cast<char*>(name), 0);
        params[1] = OSSL_PARAM_construct_end();

        // A zero-length key still needs a valid pointer
        static const Byte EMPTY_KEY = 0;
        if (EVP_MAC_init(ctx, keyLen ? key : &EMPTY_KEY, keyLen, params) != 1) {
            EVP_MAC_CTX_free(ctx);
            EVP_MAC_free(mac);
            throw std::runtime_error("HMAC: EVP_MAC_init failed");
        }
    }

    ~Impl() {
        EVP_MAC_CTX_free(ctx);
        EVP_MAC_free(mac);
    }
};

HMACStream::HMACStream(Digest digest, const Byte* key, size_t keyLen)
    : impl_(std::make_unique<Impl>(digest, key, keyLen)) {}

HMACStream::~HMACStream() = default;

HMACStream::HMACStream(HMACStream&& other) noexcept = default;
HMACStream& HMACStream::operator=(HMACStream&& other) noexcept = default;

HMACStream& HMACStream::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_MAC_update(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("HMAC: update failed");
    }
    return *this;
}

size_t HMACStream::OutputSize() const {
    return impl_->outputSize;
}

void HMACStream::Finalize(Byte* mac) {
    size_t outLen = 0;
    if (EVP_MAC_final(impl_->ctx, mac, &outLen, impl_->outputSize) != 1 ||
        outLen != impl_->outputSize) {
        throw std::runtime_error("HMAC: final failed");
    }
}

// ============================================================================
// One-shot helpers
// ============================================================================

Hash256 ComputeHMAC_SHA256(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    Hash256 result;
    HMACStream(HMACStream::Digest::SHA256, key, keyLen).Write(data, dataLen).Finalize(result.data());
    return result;
}

SecureBuffer<64> ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                                    const Byte* data, size_t dataLen) {
    SecureBuffer<64> result;
    HMACStream(HMACStream::Digest::SHA512, key, keyLen).Write(data, dataLen).Finalize(result.data());
    return result;
}

// ============================================================================
// PBKDF2
// ============================================================================

SecureBytes PBKDF2_SHA512(const std::string& password,
                          const std::string& salt,
                          uint32_t iterations,
                          size_t keyLen) {
    SecureBytes out(keyLen);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha512(),
                          static_cast<int>(keyLen), out.data()) != 1) {
        throw std::runtime_error("PBKDF2_SHA512 failed");
    }
    return out;
}

bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

} // namespace satchel
