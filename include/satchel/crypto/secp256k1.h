// Satchel - secp256k1 Elliptic Curve Operations
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Scalar and point operations on secp256k1 needed by BIP32 derivation and
// transaction signing, implemented over OpenSSL BIGNUM / EC_POINT.
//
// Signatures are deterministic (RFC 6979, HMAC-SHA256), always low-S
// (s <= n/2, BIP 62) and DER encoded with minimal integer lengths.

#ifndef SATCHEL_CRYPTO_SECP256K1_H
#define SATCHEL_CRYPTO_SECP256K1_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace satchel {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Private key size in bytes
constexpr size_t PRIVATE_KEY_SIZE = 32;

/// Compressed public key size (02/03 || x)
constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;

/// Uncompressed public key size (04 || x || y)
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

/// Maximum DER signature size
constexpr size_t MAX_DER_SIGNATURE_SIZE = 72;

/// Curve order n (big-endian)
constexpr std::array<uint8_t, 32> CURVE_ORDER = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
};

/// n / 2 (big-endian), the largest accepted s value
constexpr std::array<uint8_t, 32> HALF_CURVE_ORDER = {
    0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4, 0x50, 0x1D,
    0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0
};

// ============================================================================
// Key Operations
// ============================================================================

/// Check 0 < key < n for a 32-byte big-endian scalar
bool IsValidPrivateKey(const uint8_t* key);

/// Check that bytes parse as a point on the curve (33 or 65 bytes)
bool IsValidPublicKey(const uint8_t* pubkey, size_t len);

/**
 * Compute the compressed public key d*G.
 *
 * @param privateKey 32-byte secret scalar
 * @param out 33-byte output buffer
 * @return false if the private key is out of range
 */
bool ComputePublicKey(const uint8_t* privateKey, uint8_t* out);

/**
 * Compute (key + tweak) mod n.
 *
 * Returns false without touching result when tweak >= n or the sum is zero.
 * These are the two BIP32 "invalid child" conditions.
 */
bool PrivateKeyTweakAdd(const uint8_t* key, const uint8_t* tweak, uint8_t* result);

// ============================================================================
// ECDSA
// ============================================================================

/**
 * Sign a 32-byte message hash.
 *
 * @param hash Message digest (sighash)
 * @param privateKey 32-byte secret scalar
 * @return Low-S DER signature without sighash byte, or nullopt for an
 *         invalid private key
 */
std::optional<std::vector<uint8_t>> SignDER(const uint8_t* hash, const uint8_t* privateKey);

/**
 * Sign and return the raw (r, s) pair (each 32 bytes big-endian), s low.
 */
std::optional<std::array<uint8_t, 64>> SignCompact(const uint8_t* hash,
                                                   const uint8_t* privateKey);

/// Verify a DER signature (strict DER, any s) against a public key
bool VerifyDER(const uint8_t* hash, const uint8_t* pubkey, size_t pubkeyLen,
               const std::vector<uint8_t>& signature);

// ============================================================================
// Signature Encoding
// ============================================================================

/// DER-encode (r, s) with minimal integer lengths
std::vector<uint8_t> EncodeDER(const uint8_t* r, const uint8_t* s);

/// Parse a strict DER signature into 32-byte r and s
bool DecodeDER(const std::vector<uint8_t>& der, uint8_t* r, uint8_t* s);

/// Check s <= n/2
bool IsLowS(const uint8_t* s);

} // namespace secp256k1
} // namespace satchel

#endif // SATCHEL_CRYPTO_SECP256K1_H
