// Satchel - HMAC and PBKDF2
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// HMAC-SHA256 (RFC 6979 nonce generation), HMAC-SHA512 (BIP32 key
// derivation) and PBKDF2-HMAC-SHA512 (BIP39 seed stretching).

#ifndef SATCHEL_CRYPTO_HMAC_H
#define SATCHEL_CRYPTO_HMAC_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "satchel/core/types.h"
#include "satchel/crypto/secure.h"

namespace satchel {

// ============================================================================
// Incremental HMAC
// ============================================================================

/**
 * Streaming HMAC over an OpenSSL EVP_MAC context.
 *
 * The digest is fixed at construction. Key material lives only inside the
 * OpenSSL context, which is freed (and cleansed by OpenSSL) on destruction.
 */
class HMACStream {
public:
    enum class Digest { SHA256, SHA512 };

    HMACStream(Digest digest, const Byte* key, size_t keyLen);
    ~HMACStream();

    /// Non-copyable (contains key material)
    HMACStream(const HMACStream&) = delete;
    HMACStream& operator=(const HMACStream&) = delete;

    HMACStream(HMACStream&& other) noexcept;
    HMACStream& operator=(HMACStream&& other) noexcept;

    /// Write data to HMAC
    HMACStream& Write(const Byte* data, size_t len);

    HMACStream& Write(const std::vector<Byte>& data) {
        return Write(data.data(), data.size());
    }

    /// Output length (32 or 64)
    size_t OutputSize() const;

    /// Finalize into mac[0..OutputSize())
    void Finalize(Byte* mac);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// One-shot helpers
// ============================================================================

/// Compute HMAC-SHA256 in one call
Hash256 ComputeHMAC_SHA256(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

/// Compute HMAC-SHA512 in one call. The result lands in a buffer that is
/// zeroed when it goes out of scope.
SecureBuffer<64> ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                                    const Byte* data, size_t dataLen);

// ============================================================================
// PBKDF2 (Password-Based Key Derivation Function 2)
// ============================================================================

/**
 * PBKDF2 with HMAC-SHA512.
 *
 * @param password Password bytes (the mnemonic sentence for BIP39)
 * @param salt Salt bytes ("mnemonic" + passphrase for BIP39)
 * @param iterations Iteration count (2048 for BIP39)
 * @param keyLen Output length
 * @return Derived key
 */
SecureBytes PBKDF2_SHA512(const std::string& password,
                          const std::string& salt,
                          uint32_t iterations,
                          size_t keyLen);

/// Constant-time comparison of two byte ranges
bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len);

} // namespace satchel

#endif // SATCHEL_CRYPTO_HMAC_H
