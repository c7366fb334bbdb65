// Satchel - Hierarchical Deterministic Key Derivation (BIP32/BIP39/BIP44)
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Mnemonic to seed, seed to master key, and private child derivation along
// BIP44/49/84 account paths. Every intermediate secret is held in a
// SecureBuffer/SecureBytes and wiped when the derivation call returns.

#ifndef SATCHEL_WALLET_HDKEY_H
#define SATCHEL_WALLET_HDKEY_H

#include <satchel/core/types.h>
#include <satchel/crypto/keys.h>
#include <satchel/crypto/secure.h>
#include <satchel/wallet/chainparams.h>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace satchel {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// Hardened key derivation threshold
constexpr uint32_t HARDENED_FLAG = 0x80000000;

/// Maximum number of components in a derivation path
constexpr size_t MAX_PATH_DEPTH = 10;

/// BIP39 seed length
constexpr size_t BIP39_SEED_SIZE = 64;

/// BIP39 PBKDF2 iteration count
constexpr uint32_t BIP39_PBKDF2_ROUNDS = 2048;

/// Upper bound on index skips under DerivationPolicy::RetryNextIndex
constexpr uint32_t MAX_DERIVATION_RETRIES = 1000;

/**
 * What to do when a child key is invalid (IL >= n or the child is zero).
 *
 * The event has probability below 2^-127 per derivation.
 */
enum class DerivationPolicy {
    Strict,          // Throw CryptographicInvariantError(InvalidChild)
    RetryNextIndex,  // BIP32: proceed with the next index (non-hardened only)
};

const char* DerivationPolicyToString(DerivationPolicy policy);
std::optional<DerivationPolicy> DerivationPolicyFromString(const std::string& str);

/**
 * Run one child derivation attempt per index until attempt() succeeds.
 *
 * Returns the index that succeeded. Under Strict, or for a hardened index,
 * a failed attempt throws immediately; under RetryNextIndex the index is
 * advanced up to MAX_DERIVATION_RETRIES times (never across the hardened
 * boundary) before throwing CryptographicInvariantError(InvalidChild).
 */
uint32_t DeriveWithPolicy(uint32_t index, DerivationPolicy policy,
                          const std::function<bool(uint32_t)>& attempt);

// ============================================================================
// Key Derivation Path
// ============================================================================

/// One path level: a 31-bit index and the hardened flag
struct PathComponent {
    uint32_t index;
    bool hardened;

    PathComponent(uint32_t idx = 0, bool hard = false)
        : index(idx), hardened(hard) {}

    /// Index with HARDENED_FLAG applied
    uint32_t GetFullIndex() const {
        return hardened ? (index | HARDENED_FLAG) : index;
    }

    std::string ToString() const;

    bool operator==(const PathComponent& other) const {
        return index == other.index && hardened == other.hardened;
    }
};

/**
 * A BIP32 derivation path such as m/84'/0'/0'/0/5.
 *
 * Accepted text form is m(/<index>['|h])*, each index below 2^31, at most
 * MAX_PATH_DEPTH components.
 */
class DerivationPath {
public:
    DerivationPath() = default;

    explicit DerivationPath(std::vector<PathComponent> components)
        : components_(std::move(components)) {}

    /// Parse, nullopt on any syntax or range error
    static std::optional<DerivationPath> Parse(const std::string& path);

    /// Parse or throw ValidationError(InvalidPath)
    static DerivationPath FromString(const std::string& path);

    /// m/purpose'/coinType'/0'/change/accountIndex
    static DerivationPath ForAccount(AddressType type, uint32_t coinType,
                                     uint32_t accountIndex, uint32_t change = 0);

    const std::vector<PathComponent>& GetComponents() const { return components_; }
    size_t Depth() const { return components_.size(); }
    bool IsEmpty() const { return components_.empty(); }

    /// Append one component
    DerivationPath Child(uint32_t index, bool hardened = false) const;

    std::string ToString() const;

    bool operator==(const DerivationPath& other) const { return components_ == other.components_; }
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }

private:
    std::vector<PathComponent> components_;
};

// ============================================================================
// Extended Key (BIP32)
// ============================================================================

/**
 * A private extended key: 32-byte scalar, 32-byte chain code and the
 * metadata needed for xprv/xpub serialization.
 *
 * Neuter() yields a public-only form that can be serialized but not
 * derived from.
 */
class ExtendedKey {
public:
    static constexpr size_t CHAIN_CODE_SIZE = 32;
    static constexpr size_t SERIALIZED_SIZE = 78;

    static constexpr uint32_t XPRV_VERSION = 0x0488ADE4;
    static constexpr uint32_t XPUB_VERSION = 0x0488B21E;

    /// Invalid key
    ExtendedKey() = default;

    /**
     * Master key: I = HMAC-SHA512("Bitcoin seed", seed).
     * Throws CryptographicInvariantError(InvalidMasterKey) when IL is zero
     * or not below the curve order.
     */
    static ExtendedKey FromSeed(const Byte* seed, size_t seedLen);
    static ExtendedKey FromSeed(const SecureBytes& seed) {
        return FromSeed(seed.data(), seed.size());
    }

    /// Derive one child (index may carry HARDENED_FLAG)
    ExtendedKey DeriveChild(uint32_t index,
                            DerivationPolicy policy = DerivationPolicy::Strict) const;

    /// Derive along a path
    ExtendedKey DerivePath(const DerivationPath& path,
                           DerivationPolicy policy = DerivationPolicy::Strict) const;

    bool IsValid() const { return valid_; }
    bool IsPrivate() const { return privateKey_.IsValid(); }

    /// Throws std::logic_error on a neutered key
    const PrivateKey& GetPrivateKey() const;

    const PublicKey& GetPublicKey() const { return publicKey_; }
    const SecureBuffer<CHAIN_CODE_SIZE>& GetChainCode() const { return chainCode_; }

    uint8_t GetDepth() const { return depth_; }
    uint32_t GetParentFingerprint() const { return parentFingerprint_; }
    uint32_t GetChildNumber() const { return childNumber_; }

    /// First 4 bytes of Hash160(public key), big-endian
    uint32_t GetFingerprint() const;

    /// Drop the private half
    ExtendedKey Neuter() const;

    /// xprv (private) or xpub (neutered) Base58Check string
    std::string ToBase58() const;

    /// Zero the private key and chain code
    void Clear();

private:
    PrivateKey privateKey_;
    PublicKey publicKey_;
    SecureBuffer<CHAIN_CODE_SIZE> chainCode_;
    uint8_t depth_{0};
    uint32_t parentFingerprint_{0};
    uint32_t childNumber_{0};
    bool valid_{false};

    /// One CKDpriv attempt; false if IL >= n or the child is zero
    bool TryDeriveChild(uint32_t index, ExtendedKey& out) const;
};

// ============================================================================
// BIP39 Seed
// ============================================================================

/// Caller-supplied mnemonic check (wordlist membership and checksum)
using MnemonicValidator = std::function<bool(const std::string& mnemonic)>;

class Mnemonic {
public:
    /**
     * BIP39 seed: PBKDF2-HMAC-SHA512(mnemonic, "mnemonic" + passphrase,
     * 2048 rounds, 64 bytes). The mnemonic is expected in NFKD form.
     */
    static SecureBytes ToSeed(const std::string& mnemonic,
                              const std::string& passphrase = "");

    /// 12, 15, 18, 21 or 24 lowercase ASCII words separated by single spaces
    static bool IsWellFormed(const std::string& mnemonic);

    /// Validator that only checks IsWellFormed
    static MnemonicValidator DefaultValidator();
};

} // namespace wallet
} // namespace satchel

#endif // SATCHEL_WALLET_HDKEY_H
