// Satchel - UTXO Chain Parameters Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/wallet/chainparams.h"
#include "satchel/wallet/errors.h"
#include "satchel/core/hex.h"

#include <algorithm>
#include <cctype>

namespace satchel {
namespace wallet {

// ============================================================================
// Address Type
// ============================================================================

const char* AddressTypeToString(AddressType type) {
    switch (type) {
        case AddressType::P2PKH:       return "p2pkh";
        case AddressType::P2SH_P2WPKH: return "p2sh-p2wpkh";
        case AddressType::P2WPKH:      return "p2wpkh";
    }
    return "unknown";
}

std::optional<AddressType> AddressTypeFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "p2pkh" || lower == "legacy" || lower == "transparent") {
        return AddressType::P2PKH;
    }
    if (lower == "p2sh-p2wpkh" || lower == "p2sh_p2wpkh" || lower == "nested") {
        return AddressType::P2SH_P2WPKH;
    }
    if (lower == "p2wpkh" || lower == "segwit" || lower == "bech32") {
        return AddressType::P2WPKH;
    }
    return std::nullopt;
}

uint32_t PurposeForAddressType(AddressType type) {
    switch (type) {
        case AddressType::P2PKH:       return 44;
        case AddressType::P2SH_P2WPKH: return 49;
        case AddressType::P2WPKH:      return 84;
    }
    return 44;
}

bool IsSegWitType(AddressType type) {
    switch (type) {
        case AddressType::P2PKH:       return false;
        case AddressType::P2SH_P2WPKH: return true;
        case AddressType::P2WPKH:      return true;
    }
    return false;
}

// ============================================================================
// Version Bytes
// ============================================================================

bool VersionBytes::Matches(const uint8_t* payload, size_t len) const {
    if (length_ == 0 || len < length_) {
        return false;
    }
    for (size_t i = 0; i < length_; ++i) {
        if (payload[i] != bytes_[i]) {
            return false;
        }
    }
    return true;
}

std::string VersionBytes::ToHex() const {
    return BytesToHex(bytes_.data(), length_);
}

// ============================================================================
// Chain Registry
// ============================================================================

namespace {

ChainParams MakeChain(const char* id, const char* name, const char* symbol,
                      VersionBytes pkh, VersionBytes sh,
                      std::optional<std::string> hrp, uint8_t wif,
                      uint32_t coinType, AddressType defaultType) {
    ChainParams p;
    p.id = id;
    p.name = name;
    p.symbol = symbol;
    p.pubKeyHash = pkh;
    p.scriptHash = sh;
    p.bech32Hrp = std::move(hrp);
    p.wifVersion = wif;
    p.coinType = coinType;
    p.defaultAddressType = defaultType;
    return p;
}

} // namespace

ChainRegistry ChainRegistry::BuiltIn() {
    ChainRegistry reg;
    const VersionBytes T1(0x1c, 0xb8);
    const VersionBytes T3(0x1c, 0xbd);

    reg.Add(MakeChain("bitcoin-mainnet", "Bitcoin", "BTC",
                      VersionBytes(0x00), VersionBytes(0x05), std::string("bc"),
                      0x80, 0, AddressType::P2WPKH));
    reg.Add(MakeChain("bitcoin-testnet", "Bitcoin Testnet", "tBTC",
                      VersionBytes(0x6f), VersionBytes(0xc4), std::string("tb"),
                      0xef, 1, AddressType::P2WPKH));
    reg.Add(MakeChain("litecoin-mainnet", "Litecoin", "LTC",
                      VersionBytes(0x30), VersionBytes(0x32), std::string("ltc"),
                      0xb0, 2, AddressType::P2WPKH));
    reg.Add(MakeChain("dogecoin-mainnet", "Dogecoin", "DOGE",
                      VersionBytes(0x1e), VersionBytes(0x16), std::nullopt,
                      0x9e, 3, AddressType::P2PKH));
    reg.Add(MakeChain("zcash-mainnet", "Zcash", "ZEC",
                      T1, T3, std::nullopt, 0x80, 133, AddressType::P2PKH));
    reg.Add(MakeChain("flux-mainnet", "Flux", "FLUX",
                      T1, T3, std::nullopt, 0x80, 19167, AddressType::P2PKH));
    reg.Add(MakeChain("bitcoinz-mainnet", "BitcoinZ", "BTCZ",
                      T1, T3, std::nullopt, 0x80, 177, AddressType::P2PKH));
    reg.Add(MakeChain("ravencoin-mainnet", "Ravencoin", "RVN",
                      VersionBytes(0x3c), VersionBytes(0x7a), std::nullopt,
                      0x80, 175, AddressType::P2PKH));
    // Ravencoin fork, shares Ravencoin's coin type
    reg.Add(MakeChain("ritocoin-mainnet", "Ritocoin", "RITO",
                      VersionBytes(0x19), VersionBytes(0x69), std::nullopt,
                      0x80, 175, AddressType::P2PKH));
    // Dash-derived prefixes and coin type
    reg.Add(MakeChain("noso-mainnet", "NOSO", "NOSO",
                      VersionBytes(0x4c), VersionBytes(0x10), std::nullopt,
                      0xcc, 5, AddressType::P2PKH));
    return reg;
}

void ChainRegistry::Add(ChainParams params) {
    std::string id = params.id;
    chains_[id] = std::move(params);
}

const ChainParams* ChainRegistry::Find(const std::string& id) const {
    auto it = chains_.find(id);
    return it == chains_.end() ? nullptr : &it->second;
}

const ChainParams& ChainRegistry::Get(const std::string& id) const {
    const ChainParams* params = Find(id);
    if (!params) {
        throw ValidationError(ErrorCode::UnknownChain, "unknown chain '" + id + "'");
    }
    return *params;
}

std::vector<std::string> ChainRegistry::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(chains_.size());
    for (const auto& [id, params] : chains_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace wallet
} // namespace satchel
