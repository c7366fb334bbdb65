// Satchel - Address Encoding Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/wallet/address.h"
#include "satchel/wallet/errors.h"
#include "satchel/crypto/ripemd160.h"
#include "satchel/crypto/secure.h"
#include "satchel/crypto/sha256.h"

#include <cstring>
#include <stdexcept>

namespace satchel {
namespace wallet {

// ============================================================================
// Base58 Implementation
// ============================================================================

namespace {

const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const int8_t BASE58_MAP[256] = {
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1, 0, 1, 2, 3, 4, 5, 6,  7, 8,-1,-1,-1,-1,-1,-1,
    -1, 9,10,11,12,13,14,15, 16,-1,17,18,19,20,21,-1,
    22,23,24,25,26,27,28,29, 30,31,32,-1,-1,-1,-1,-1,
    -1,33,34,35,36,37,38,39, 40,41,42,43,-1,44,45,46,
    47,48,49,50,51,52,53,54, 55,56,57,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
};

constexpr size_t CHECKSUM_SIZE = 4;

} // namespace

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    size_t zeroes = 0;
    while (zeroes < data.size() && data[zeroes] == 0) {
        ++zeroes;
    }

    // log(256) / log(58), rounded up
    size_t size = (data.size() - zeroes) * 138 / 100 + 1;
    std::vector<uint8_t> b58(size);
    size_t length = 0;

    for (size_t i = zeroes; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = b58.begin() + (b58.size() - length);
    while (it != b58.end() && *it == 0) {
        ++it;
    }

    std::string str;
    str.reserve(zeroes + (b58.end() - it));
    str.assign(zeroes, '1');
    while (it != b58.end()) {
        str += BASE58_ALPHABET[*it++];
    }
    // The digits of a WIF payload are key material
    SecureClear(b58.data(), b58.size());
    return str;
}

std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str) {
    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == '1') {
        ++zeroes;
    }

    // log(58) / log(256), rounded up
    size_t size = (str.size() - zeroes) * 733 / 1000 + 1;
    std::vector<uint8_t> b256(size);
    size_t length = 0;

    for (size_t i = zeroes; i < str.size(); ++i) {
        int carry = BASE58_MAP[static_cast<uint8_t>(str[i])];
        if (carry < 0) {
            SecureClear(b256.data(), b256.size());
            return std::nullopt;
        }
        size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = b256.begin() + (b256.size() - length);
    while (it != b256.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result;
    result.reserve(zeroes + (b256.end() - it));
    result.assign(zeroes, 0x00);
    result.insert(result.end(), it, b256.end());
    SecureClear(b256.data(), b256.size());
    return result;
}

std::string EncodeBase58Check(const std::vector<uint8_t>& data) {
    Hash256 hash = DoubleSHA256(data.data(), data.size());
    std::vector<uint8_t> withChecksum;
    withChecksum.reserve(data.size() + CHECKSUM_SIZE);
    withChecksum.assign(data.begin(), data.end());
    withChecksum.insert(withChecksum.end(), hash.begin(), hash.begin() + CHECKSUM_SIZE);
    std::string encoded = EncodeBase58(withChecksum);
    SecureClear(withChecksum.data(), withChecksum.size());
    return encoded;
}

std::optional<std::vector<uint8_t>> DecodeBase58Check(const std::string& str) {
    auto data = DecodeBase58(str);
    if (!data) {
        return std::nullopt;
    }
    if (data->size() < CHECKSUM_SIZE) {
        SecureClear(data->data(), data->size());
        return std::nullopt;
    }

    size_t payloadLen = data->size() - CHECKSUM_SIZE;
    Hash256 hash = DoubleSHA256(data->data(), payloadLen);
    if (std::memcmp(hash.data(), data->data() + payloadLen, CHECKSUM_SIZE) != 0) {
        SecureClear(data->data(), data->size());
        return std::nullopt;
    }

    data->resize(payloadLen);
    return data;
}

// ============================================================================
// Bech32 Implementation
// ============================================================================

namespace {

const char* BECH32_ALPHABET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

const int8_t BECH32_MAP[128] = {
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    15,-1,10,17,21,20,26,30,  7, 5,-1,-1,-1,-1,-1,-1,
    -1,29,-1,24,13,25, 9, 8, 23,-1,18,22,31,27,19,-1,
     1, 0, 3,16,11,28,12,14,  6, 4, 2,-1,-1,-1,-1,-1,
    -1,29,-1,24,13,25, 9, 8, 23,-1,18,22,31,27,19,-1,
     1, 0, 3,16,11,28,12,14,  6, 4, 2,-1,-1,-1,-1,-1,
};

/// BIP173 checksum constant; bech32m (0x2bc830a3) is not accepted
constexpr uint32_t BECH32_CONST = 1;

constexpr size_t BECH32_CHECKSUM_SIZE = 6;

uint32_t Bech32Polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        if (top & 1) chk ^= 0x3b6a57b2;
        if (top & 2) chk ^= 0x26508e6d;
        if (top & 4) chk ^= 0x1ea119fa;
        if (top & 8) chk ^= 0x3d4233dd;
        if (top & 16) chk ^= 0x2a1462b3;
    }
    return chk;
}

std::vector<uint8_t> Bech32HrpExpand(const std::string& hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) >> 5);
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) & 31);
    }
    return ret;
}

bool Bech32VerifyChecksum(const std::string& hrp, const std::vector<uint8_t>& values) {
    auto exp = Bech32HrpExpand(hrp);
    exp.insert(exp.end(), values.begin(), values.end());
    return Bech32Polymod(exp) == BECH32_CONST;
}

std::vector<uint8_t> Bech32CreateChecksum(const std::string& hrp,
                                          const std::vector<uint8_t>& values) {
    auto exp = Bech32HrpExpand(hrp);
    exp.insert(exp.end(), values.begin(), values.end());
    exp.resize(exp.size() + BECH32_CHECKSUM_SIZE);
    uint32_t mod = Bech32Polymod(exp) ^ BECH32_CONST;
    std::vector<uint8_t> ret(BECH32_CHECKSUM_SIZE);
    for (size_t i = 0; i < BECH32_CHECKSUM_SIZE; ++i) {
        ret[i] = (mod >> (5 * (5 - i))) & 31;
    }
    return ret;
}

void ConvertBits8to5(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    for (uint8_t value : in) {
        acc = ((acc << 8) | value) & 0xfff;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back((acc >> bits) & 31);
        }
    }
    if (bits > 0) {
        out.push_back((acc << (5 - bits)) & 31);
    }
}

bool ConvertBits5to8(const std::vector<uint8_t>& in, size_t offset, std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    for (size_t i = offset; i < in.size(); ++i) {
        acc = ((acc << 5) | in[i]) & 0xfff;
        bits += 5;
        while (bits >= 8) {
            bits -= 8;
            out.push_back((acc >> bits) & 255);
        }
    }
    // At most 4 bits of zero padding
    if (bits >= 5 || ((acc << (8 - bits)) & 255)) {
        return false;
    }
    return true;
}

bool IsValidProgramSize(size_t size) {
    return size == Hash160::SIZE || size == Hash256::SIZE;
}

} // namespace

std::string EncodeSegwitAddress(const std::string& hrp, const std::vector<uint8_t>& program) {
    if (!IsValidProgramSize(program.size())) {
        throw ValidationError(ErrorCode::InvalidAddress,
                              "witness program must be 20 or 32 bytes, got " +
                              std::to_string(program.size()));
    }

    std::vector<uint8_t> values;
    values.push_back(0);  // witness version
    ConvertBits8to5(program, values);

    auto checksum = Bech32CreateChecksum(hrp, values);
    values.insert(values.end(), checksum.begin(), checksum.end());

    std::string result = hrp + "1";
    result.reserve(result.size() + values.size());
    for (uint8_t v : values) {
        result += BECH32_ALPHABET[v];
    }
    return result;
}

std::optional<std::vector<uint8_t>> DecodeSegwitAddress(const std::string& hrp,
                                                        const std::string& address) {
    if (address.size() > BECH32_MAX_LENGTH) {
        return std::nullopt;
    }

    bool hasLower = false;
    bool hasUpper = false;
    std::string lower;
    lower.reserve(address.size());
    for (char c : address) {
        if (c < 33 || c > 126) {
            return std::nullopt;
        }
        if (c >= 'a' && c <= 'z') hasLower = true;
        if (c >= 'A' && c <= 'Z') {
            hasUpper = true;
            c = static_cast<char>(c - 'A' + 'a');
        }
        lower += c;
    }
    if (hasLower && hasUpper) {
        return std::nullopt;
    }

    size_t pos = lower.rfind('1');
    if (pos == std::string::npos || pos < 1 || pos + 1 + BECH32_CHECKSUM_SIZE > lower.size()) {
        return std::nullopt;
    }
    if (lower.compare(0, pos, hrp) != 0 || pos != hrp.size()) {
        return std::nullopt;
    }

    std::vector<uint8_t> values;
    values.reserve(lower.size() - pos - 1);
    for (size_t i = pos + 1; i < lower.size(); ++i) {
        int8_t val = BECH32_MAP[static_cast<uint8_t>(lower[i]) & 0x7f];
        if (val < 0) {
            return std::nullopt;
        }
        values.push_back(static_cast<uint8_t>(val));
    }

    if (!Bech32VerifyChecksum(hrp, values)) {
        return std::nullopt;
    }
    values.resize(values.size() - BECH32_CHECKSUM_SIZE);

    if (values.empty() || values[0] != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> program;
    if (!ConvertBits5to8(values, 1, program) || !IsValidProgramSize(program.size())) {
        return std::nullopt;
    }
    return program;
}

// ============================================================================
// Base58Check Addresses
// ============================================================================

std::string EncodeBase58Address(const VersionBytes& version, const Hash160& hash) {
    std::vector<uint8_t> payload;
    payload.reserve(version.size() + Hash160::SIZE);
    payload.insert(payload.end(), version.data(), version.data() + version.size());
    payload.insert(payload.end(), hash.begin(), hash.end());
    return EncodeBase58Check(payload);
}

std::optional<Base58Address> DecodeBase58Address(const std::string& address) {
    auto payload = DecodeBase58Check(address);
    if (!payload) {
        return std::nullopt;
    }

    Base58Address result;
    if (payload->size() == 1 + Hash160::SIZE) {
        result.version = VersionBytes((*payload)[0]);
    } else if (payload->size() == 2 + Hash160::SIZE) {
        result.version = VersionBytes((*payload)[0], (*payload)[1]);
    } else {
        return std::nullopt;
    }
    result.hash = Hash160(payload->data() + result.version.size(), Hash160::SIZE);
    return result;
}

// ============================================================================
// Chain-Aware Addresses
// ============================================================================

std::string EncodeAddress(const PublicKey& pubkey, AddressType type, const ChainParams& params) {
    if (!pubkey.IsValid()) {
        throw ValidationError(ErrorCode::InvalidAddress, "invalid public key");
    }
    if (!params.SupportsAddressType(type)) {
        throw ValidationError(ErrorCode::UnsupportedAddressType,
                              std::string(AddressTypeToString(type)) +
                              " is not supported on " + params.id);
    }

    Hash160 pkh = pubkey.GetHash160();
    switch (type) {
        case AddressType::P2PKH:
            return EncodeBase58Address(params.pubKeyHash, pkh);
        case AddressType::P2SH_P2WPKH: {
            Script redeem = Script::CreateP2WPKHRedeemScript(pkh);
            return EncodeBase58Address(params.scriptHash,
                                       ComputeHash160(redeem.data(), redeem.size()));
        }
        case AddressType::P2WPKH:
            return EncodeSegwitAddress(*params.bech32Hrp, pkh.ToVector());
    }
    throw ValidationError(ErrorCode::UnsupportedAddressType, "unknown address type");
}

std::optional<Script> DecodeAddress(const std::string& address, const ChainParams& params) {
    if (params.bech32Hrp) {
        auto program = DecodeSegwitAddress(*params.bech32Hrp, address);
        if (program) {
            if (program->size() == Hash160::SIZE) {
                return Script::CreateP2WPKH(Hash160(program->data(), program->size()));
            }
            return Script::CreateP2WSH(Hash256(program->data(), program->size()));
        }
    }

    auto decoded = DecodeBase58Address(address);
    if (!decoded) {
        return std::nullopt;
    }
    if (decoded->version == params.pubKeyHash) {
        return Script::CreateP2PKH(decoded->hash);
    }
    if (decoded->version == params.scriptHash) {
        return Script::CreateP2SH(decoded->hash);
    }
    return std::nullopt;
}

bool ValidateAddress(const std::string& address, const ChainParams& params) {
    return DecodeAddress(address, params).has_value();
}

Script ScriptPubKeyForAddress(const std::string& address, const ChainParams& params) {
    auto script = DecodeAddress(address, params);
    if (!script) {
        throw ValidationError(ErrorCode::InvalidAddress,
                              "'" + address + "' is not a valid " + params.id + " address");
    }
    return *script;
}

// ============================================================================
// WIF
// ============================================================================

namespace {

constexpr uint8_t WIF_COMPRESSED_FLAG = 0x01;

} // namespace

std::string EncodeWIF(const PrivateKey& key, const ChainParams& params) {
    if (!key.IsValid()) {
        throw std::logic_error("EncodeWIF on invalid key");
    }

    SecureBytes payload;
    payload.reserve(2 + PrivateKey::SIZE);
    payload.Append(params.wifVersion);
    payload.Append(key.data(), PrivateKey::SIZE);
    payload.Append(WIF_COMPRESSED_FLAG);

    std::vector<uint8_t> raw(payload.data(), payload.data() + payload.size());
    std::string wif = EncodeBase58Check(raw);
    SecureClear(raw.data(), raw.size());
    return wif;
}

std::optional<PrivateKey> DecodeWIF(const std::string& wif, const ChainParams& params) {
    auto payload = DecodeBase58Check(wif);
    if (!payload) {
        return std::nullopt;
    }

    std::optional<PrivateKey> result;
    if (payload->size() == 2 + PrivateKey::SIZE &&
        (*payload)[0] == params.wifVersion &&
        (*payload)[1 + PrivateKey::SIZE] == WIF_COMPRESSED_FLAG) {
        PrivateKey key(payload->data() + 1);
        if (key.IsValid()) {
            result = std::move(key);
        }
    }
    SecureClear(payload->data(), payload->size());
    return result;
}

} // namespace wallet
} // namespace satchel
