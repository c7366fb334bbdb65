// Satchel - UTXO Chain Parameters
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Static per-chain address parameters: base58 version prefixes (one or two
// bytes), optional bech32 HRP, WIF prefix and BIP44 coin type.

#ifndef SATCHEL_WALLET_CHAINPARAMS_H
#define SATCHEL_WALLET_CHAINPARAMS_H

#include "satchel/core/types.h"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace satchel {
namespace wallet {

// ============================================================================
// Address Type
// ============================================================================

/// Output/address kinds the wallet derives and spends
enum class AddressType {
    P2PKH,          // Legacy base58 (1..., D..., t1...)
    P2SH_P2WPKH,    // Nested SegWit (3..., M...)
    P2WPKH,         // Native SegWit bech32 (bc1q..., ltc1q...)
};

/// Convert address type to its config/CLI name
const char* AddressTypeToString(AddressType type);

/// Parse "p2pkh", "p2sh-p2wpkh", "p2wpkh" (and "legacy", "transparent",
/// "segwit" aliases)
std::optional<AddressType> AddressTypeFromString(const std::string& str);

/// BIP purpose field for the derivation path (44, 49 or 84)
uint32_t PurposeForAddressType(AddressType type);

/// True when spending this type uses witness data and BIP143 sighash
bool IsSegWitType(AddressType type);

// ============================================================================
// Version Bytes
// ============================================================================

/**
 * A one- or two-byte base58check version prefix.
 *
 * Two-byte prefixes (Zcash-style t1/t3) compare element-wise, never as a
 * packed integer, so 0x1cb8 can not collide with a one-byte 0xb8.
 */
class VersionBytes {
public:
    VersionBytes() = default;

    /// One-byte prefix
    explicit VersionBytes(uint8_t b0) : bytes_{b0, 0}, length_(1) {}

    /// Two-byte prefix
    VersionBytes(uint8_t b0, uint8_t b1) : bytes_{b0, b1}, length_(2) {}

    size_t size() const { return length_; }
    const uint8_t* data() const { return bytes_.data(); }
    uint8_t operator[](size_t i) const { return bytes_[i]; }

    /// True if payload starts with exactly these bytes
    bool Matches(const uint8_t* payload, size_t len) const;

    bool operator==(const VersionBytes& other) const {
        return length_ == other.length_ && bytes_[0] == other.bytes_[0] &&
               (length_ < 2 || bytes_[1] == other.bytes_[1]);
    }
    bool operator!=(const VersionBytes& other) const { return !(*this == other); }

    std::string ToHex() const;

private:
    std::array<uint8_t, 2> bytes_{{0, 0}};
    size_t length_{0};
};

// ============================================================================
// Chain Parameters
// ============================================================================

/// Address and derivation parameters of one UTXO chain
struct ChainParams {
    std::string id;                  // Registry key, e.g. "bitcoin-mainnet"
    std::string name;
    std::string symbol;
    VersionBytes pubKeyHash;
    VersionBytes scriptHash;
    std::optional<std::string> bech32Hrp;
    uint8_t wifVersion{0x80};
    uint32_t coinType{0};
    AddressType defaultAddressType{AddressType::P2PKH};

    /// SegWit outputs are available only where a bech32 HRP is defined
    bool SupportsSegWit() const { return bech32Hrp.has_value(); }

    /// Check the chain can produce addresses of this type
    bool SupportsAddressType(AddressType type) const {
        return type == AddressType::P2PKH || SupportsSegWit();
    }
};

// ============================================================================
// Chain Registry
// ============================================================================

/**
 * Table of chain parameters keyed by chain id.
 *
 * A registry is a plain value owned by the caller (typically through a
 * KeyringContext). BuiltIn() returns a fresh copy of the supported chains.
 */
class ChainRegistry {
public:
    ChainRegistry() = default;

    /// Bitcoin, Bitcoin testnet, Litecoin, Dogecoin, Zcash, Flux, BitcoinZ,
    /// Ravencoin, Ritocoin and NOSO
    static ChainRegistry BuiltIn();

    /// Add or replace a chain
    void Add(ChainParams params);

    /// Lookup by id, nullptr if absent
    const ChainParams* Find(const std::string& id) const;

    /// Lookup by id. Throws ValidationError(UnknownChain) if absent.
    const ChainParams& Get(const std::string& id) const;

    /// All registered ids in sorted order
    std::vector<std::string> Ids() const;

    size_t Size() const { return chains_.size(); }

private:
    std::map<std::string, ChainParams> chains_;
};

} // namespace wallet
} // namespace satchel

#endif // SATCHEL_WALLET_CHAINPARAMS_H
