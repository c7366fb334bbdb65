// Satchel - Key Types
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// secp256k1 private keys, compressed public keys and key pairs.

#pragma once

#include <satchel/core/types.h>
#include <satchel/crypto/secp256k1.h>
#include <satchel/crypto/secure.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace satchel {

class PublicKey;
class PrivateKey;

// ============================================================================
// PublicKey
// ============================================================================

/**
 * A compressed secp256k1 public key (33 bytes, 02/03 || x).
 *
 * Every address type this library produces commits to the compressed form,
 * so uncompressed keys are accepted only for verification.
 */
class PublicKey {
public:
    /// Compressed size
    static constexpr size_t COMPRESSED_SIZE = secp256k1::COMPRESSED_PUBKEY_SIZE;

    /// Default constructor - invalid/empty key
    PublicKey() { data_.fill(0); }

    /// Construct from 33 raw bytes; anything else yields an invalid key
    PublicKey(const uint8_t* data, size_t len);

    explicit PublicKey(const std::vector<uint8_t>& data)
        : PublicKey(data.data(), data.size()) {}

    /// Check that the bytes are a point on the curve
    bool IsValid() const;

    size_t size() const { return valid_ ? COMPRESSED_SIZE : 0; }

    const uint8_t* data() const { return data_.data(); }
    const uint8_t* begin() const { return data_.data(); }
    const uint8_t* end() const { return data_.data() + size(); }

    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(begin(), end());
    }

    /// Compute Hash160 (for address derivation)
    Hash160 GetHash160() const;

    /// Verify a DER ECDSA signature (without sighash byte)
    bool Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const;

    bool operator==(const PublicKey& other) const {
        return valid_ == other.valid_ && data_ == other.data_;
    }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

    std::string ToHex() const;
    static std::optional<PublicKey> FromHex(const std::string& hex);

private:
    std::array<uint8_t, COMPRESSED_SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key.
 *
 * Always exactly 32 bytes in [1, n-1]. The scalar lives in a SecureBuffer
 * and is wiped on destruction, on Clear(), and when moved from.
 */
class PrivateKey {
public:
    /// Size in bytes
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;

    /// Default constructor - invalid key
    PrivateKey() = default;

    /// Construct from raw 32 bytes
    explicit PrivateKey(const uint8_t* data);

    PrivateKey(PrivateKey&& other) noexcept;
    PrivateKey& operator=(PrivateKey&& other) noexcept;

    /// Copies duplicate secret material; used only where the cache hands out
    /// a key to a signer
    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;

    bool IsValid() const { return valid_; }

    /// Get raw data (const only)
    const uint8_t* data() const { return data_.data(); }
    static constexpr size_t size() { return SIZE; }

    /// Derive the compressed public key
    PublicKey GetPublicKey() const;

    /// Sign a 32-byte hash. Returns a low-S DER signature without the
    /// sighash byte. Throws std::logic_error on an invalid key.
    std::vector<uint8_t> Sign(const Hash256& hash) const;

    /// (key + tweak) mod n, or nullopt when tweak >= n or the sum is zero
    std::optional<PrivateKey> TweakAdd(const uint8_t* tweak) const;

    /// Constant-time comparison
    bool operator==(const PrivateKey& other) const;
    bool operator!=(const PrivateKey& other) const { return !(*this == other); }

    /// Zero and invalidate the key
    void Clear();

private:
    SecureBuffer<SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// KeyPair - Combined private and public key
// ============================================================================

/// A private key together with its compressed public key
class KeyPair {
public:
    KeyPair() = default;

    explicit KeyPair(PrivateKey priv);

    bool IsValid() const { return privateKey_.IsValid(); }

    const PrivateKey& GetPrivateKey() const { return privateKey_; }
    const PublicKey& GetPublicKey() const { return publicKey_; }

    /// Sign a hash with the private key
    std::vector<uint8_t> Sign(const Hash256& hash) const {
        return privateKey_.Sign(hash);
    }

    /// Zero the private half
    void Clear() { privateKey_.Clear(); }

private:
    PrivateKey privateKey_;
    PublicKey publicKey_;
};

} // namespace satchel
