// Satchel - Address Encoding
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Base58Check and Bech32 (witness v0) codecs, chain-aware address
// encoding and resolution of address strings to output scripts.

#ifndef SATCHEL_WALLET_ADDRESS_H
#define SATCHEL_WALLET_ADDRESS_H

#include "satchel/core/script.h"
#include "satchel/core/types.h"
#include "satchel/crypto/keys.h"
#include "satchel/wallet/chainparams.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace satchel {
namespace wallet {

// ============================================================================
// Base58
// ============================================================================

/// Encode bytes to base58; leading zero bytes map to leading '1's
std::string EncodeBase58(const std::vector<uint8_t>& data);

/// Decode base58, nullopt on an invalid character
std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str);

/// Append the first 4 bytes of dSHA256(data) and encode
std::string EncodeBase58Check(const std::vector<uint8_t>& data);

/// Decode and verify the 4-byte checksum, returning the payload
std::optional<std::vector<uint8_t>> DecodeBase58Check(const std::string& str);

// ============================================================================
// Bech32 (BIP173)
// ============================================================================

/// Maximum length of a bech32 string
static constexpr size_t BECH32_MAX_LENGTH = 90;

/// Encode a witness v0 program. Throws ValidationError(InvalidAddress) for
/// a program length other than 20 or 32.
std::string EncodeSegwitAddress(const std::string& hrp, const std::vector<uint8_t>& program);

/// Decode a witness v0 address for the given HRP. Returns nullopt on mixed
/// case, bad charset, bad checksum (including bech32m), wrong HRP, a
/// witness version other than 0, or a program that is not 20 or 32 bytes.
std::optional<std::vector<uint8_t>> DecodeSegwitAddress(const std::string& hrp,
                                                        const std::string& address);

// ============================================================================
// Base58Check Addresses
// ============================================================================

/// Decoded base58check address
struct Base58Address {
    VersionBytes version;
    Hash160 hash;
};

/// version (1 or 2 bytes) || hash20, base58check encoded
std::string EncodeBase58Address(const VersionBytes& version, const Hash160& hash);

/// Decode a 21- or 22-byte payload into version and hash
std::optional<Base58Address> DecodeBase58Address(const std::string& address);

// ============================================================================
// Chain-Aware Addresses
// ============================================================================

/// Address of a compressed public key. Throws ValidationError
/// (UnsupportedAddressType) for a SegWit type on a chain without SegWit.
std::string EncodeAddress(const PublicKey& pubkey, AddressType type, const ChainParams& params);

/// Address string to output script, or nullopt if it does not belong to
/// the chain. Bech32 is tried first, then base58check.
std::optional<Script> DecodeAddress(const std::string& address, const ChainParams& params);

/// True if the address decodes for this chain
bool ValidateAddress(const std::string& address, const ChainParams& params);

/// Same as DecodeAddress but throws ValidationError(InvalidAddress)
Script ScriptPubKeyForAddress(const std::string& address, const ChainParams& params);

// ============================================================================
// WIF
// ============================================================================

/// wifVersion || key32 || 0x01, base58check encoded
std::string EncodeWIF(const PrivateKey& key, const ChainParams& params);

/// Decode a compressed-key WIF string for this chain
std::optional<PrivateKey> DecodeWIF(const std::string& wif, const ChainParams& params);

} // namespace wallet
} // namespace satchel

#endif // SATCHEL_WALLET_ADDRESS_H
