// Satchel - Script Header
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Output scripts and input scripts for the standard single-key templates
// the wallet pays to and spends from.

#ifndef SATCHEL_CORE_SCRIPT_H
#define SATCHEL_CORE_SCRIPT_H

#include "satchel/core/types.h"
#include "satchel/core/serialize.h"
#include <cstdint>
#include <vector>
#include <string>

namespace satchel {

// ============================================================================
// Opcodes
// ============================================================================

/// Opcodes used by the standard templates
enum Opcode : uint8_t {
    OP_0 = 0x00,
    OP_FALSE = OP_0,
    OP_PUSHDATA1 = 0x4c,
    OP_PUSHDATA2 = 0x4d,
    OP_PUSHDATA4 = 0x4e,
    OP_1 = 0x51,
    OP_TRUE = OP_1,
    OP_16 = 0x60,

    OP_RETURN = 0x6a,
    OP_DUP = 0x76,
    OP_EQUAL = 0x87,
    OP_EQUALVERIFY = 0x88,
    OP_HASH160 = 0xa9,
    OP_CHECKSIG = 0xac,

    OP_INVALIDOPCODE = 0xff,
};

/// Get human-readable name for an opcode
std::string GetOpName(Opcode opcode);

/// Recognized output templates
enum class ScriptType {
    NONSTANDARD,
    P2PKH,
    P2SH,
    P2WPKH,
    P2WSH,
    NULL_DATA,
};

const char* ScriptTypeToString(ScriptType type);

// ============================================================================
// Script Class
// ============================================================================

/// Serialized script, used inside transaction inputs and outputs
class Script : public std::vector<uint8_t> {
public:
    using base_type = std::vector<uint8_t>;
    using base_type::base_type;

    Script() = default;
    explicit Script(const base_type& bytes) : base_type(bytes) {}

    // ========================================================================
    // Construction
    // ========================================================================

    /// Push an opcode
    Script& operator<<(Opcode opcode);

    /// Push raw data with minimal size prefix
    Script& operator<<(const std::vector<uint8_t>& data);

    /// Push a 20-byte hash
    Script& operator<<(const Hash160& hash);

    /// Push a 32-byte hash
    Script& operator<<(const Hash256& hash);

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Get next opcode and pushed data; false on truncated push
    bool GetOp(const_iterator& pc, Opcode& opcodeRet, std::vector<uint8_t>& dataRet) const;

    /// Check script consists only of push operations
    bool IsPushOnly() const;

    // ========================================================================
    // Template Detection
    // ========================================================================

    /// OP_DUP OP_HASH160 <20> OP_EQUALVERIFY OP_CHECKSIG
    bool IsPayToPublicKeyHash() const;

    /// OP_HASH160 <20> OP_EQUAL
    bool IsPayToScriptHash() const;

    /// OP_0 <20>
    bool IsPayToWitnessPubKeyHash() const;

    /// OP_0 <32>
    bool IsPayToWitnessScriptHash() const;

    /// Starts with OP_RETURN
    bool IsUnspendable() const { return !empty() && (*this)[0] == OP_RETURN; }

    ScriptType GetType() const;

    /// Extract the 20-byte hash from P2PKH, P2SH or P2WPKH
    bool ExtractHash160(Hash160& hash) const;

    // ========================================================================
    // Standard Script Builders
    // ========================================================================

    /// OP_DUP OP_HASH160 <hash> OP_EQUALVERIFY OP_CHECKSIG
    static Script CreateP2PKH(const Hash160& pubKeyHash);

    /// OP_HASH160 <hash> OP_EQUAL
    static Script CreateP2SH(const Hash160& scriptHash);

    /// OP_0 <hash>
    static Script CreateP2WPKH(const Hash160& pubKeyHash);

    /// OP_0 <hash>
    static Script CreateP2WSH(const Hash256& scriptHash);

    /// OP_HASH160 <hash160(OP_0 <pkh>)> OP_EQUAL
    static Script CreateP2SH_P2WPKH(const Hash160& pubKeyHash);

    /// Redeem script of a nested P2WPKH output (OP_0 <pkh>)
    static Script CreateP2WPKHRedeemScript(const Hash160& pubKeyHash) {
        return CreateP2WPKH(pubKeyHash);
    }

    /// <sig||hashtype> <pubkey>
    static Script CreateP2PKHScriptSig(const std::vector<uint8_t>& sigWithHashType,
                                       const std::vector<uint8_t>& pubkey);

    /// Single push of the redeem script, for spending P2SH-P2WPKH
    static Script CreateP2SH_P2WPKHScriptSig(const Hash160& pubKeyHash);

    /// BIP143 scriptCode for P2WPKH: the P2PKH script of the key hash,
    /// prefixed with its length (0x19)
    static std::vector<uint8_t> P2WPKHScriptCode(const Hash160& pubKeyHash);

    // ========================================================================
    // Conversion
    // ========================================================================

    /// Human-readable disassembly
    std::string ToString() const;

    std::string ToHex() const;

private:
    void AppendDataSize(uint32_t size);
};

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Script& script) {
    WriteCompactSize(s, script.size());
    if (!script.empty()) {
        s.Write(script.data(), script.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, Script& script) {
    uint64_t size = ReadCompactSize(s);
    script.resize(size);
    if (size > 0) {
        s.Read(script.data(), size);
    }
}

} // namespace satchel

#endif // SATCHEL_CORE_SCRIPT_H
