// Satchel - Script Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/core/script.h"
#include "satchel/core/hex.h"
#include "satchel/crypto/ripemd160.h"
#include <cstring>
#include <sstream>

namespace satchel {

// ============================================================================
// Opcode Names
// ============================================================================

std::string GetOpName(Opcode opcode) {
    switch (opcode) {
        case OP_0: return "OP_0";
        case OP_PUSHDATA1: return "OP_PUSHDATA1";
        case OP_PUSHDATA2: return "OP_PUSHDATA2";
        case OP_PUSHDATA4: return "OP_PUSHDATA4";
        case OP_1: return "OP_1";
        case OP_16: return "OP_16";
        case OP_RETURN: return "OP_RETURN";
        case OP_DUP: return "OP_DUP";
        case OP_EQUAL: return "OP_EQUAL";
        case OP_EQUALVERIFY: return "OP_EQUALVERIFY";
        case OP_HASH160: return "OP_HASH160";
        case OP_CHECKSIG: return "OP_CHECKSIG";
        case OP_INVALIDOPCODE: return "OP_INVALIDOPCODE";
    }
    if (opcode > OP_1 && opcode < OP_16) {
        return "OP_" + std::to_string(opcode - OP_1 + 1);
    }
    return "OP_UNKNOWN";
}

const char* ScriptTypeToString(ScriptType type) {
    switch (type) {
        case ScriptType::NONSTANDARD: return "nonstandard";
        case ScriptType::P2PKH:       return "pubkeyhash";
        case ScriptType::P2SH:        return "scripthash";
        case ScriptType::P2WPKH:      return "witness_v0_keyhash";
        case ScriptType::P2WSH:       return "witness_v0_scripthash";
        case ScriptType::NULL_DATA:   return "nulldata";
    }
    return "unknown";
}

// ============================================================================
// Script Implementation
// ============================================================================

void Script::AppendDataSize(uint32_t size) {
    if (size < OP_PUSHDATA1) {
        push_back(static_cast<uint8_t>(size));
    } else if (size <= 0xff) {
        push_back(OP_PUSHDATA1);
        push_back(static_cast<uint8_t>(size));
    } else if (size <= 0xffff) {
        push_back(OP_PUSHDATA2);
        push_back(size & 0xff);
        push_back((size >> 8) & 0xff);
    } else {
        push_back(OP_PUSHDATA4);
        push_back(size & 0xff);
        push_back((size >> 8) & 0xff);
        push_back((size >> 16) & 0xff);
        push_back((size >> 24) & 0xff);
    }
}

Script& Script::operator<<(Opcode opcode) {
    push_back(static_cast<uint8_t>(opcode));
    return *this;
}

Script& Script::operator<<(const std::vector<uint8_t>& data) {
    AppendDataSize(static_cast<uint32_t>(data.size()));
    insert(end(), data.begin(), data.end());
    return *this;
}

Script& Script::operator<<(const Hash160& hash) {
    AppendDataSize(Hash160::SIZE);
    insert(end(), hash.begin(), hash.end());
    return *this;
}

Script& Script::operator<<(const Hash256& hash) {
    AppendDataSize(Hash256::SIZE);
    insert(end(), hash.begin(), hash.end());
    return *this;
}

bool Script::GetOp(const_iterator& pc, Opcode& opcodeRet, std::vector<uint8_t>& dataRet) const {
    dataRet.clear();

    if (pc >= end()) {
        return false;
    }

    uint8_t opcode = *pc++;
    opcodeRet = static_cast<Opcode>(opcode);

    if (opcode <= OP_PUSHDATA4) {
        size_t nSize = 0;
        if (opcode < OP_PUSHDATA1) {
            nSize = opcode;
        } else if (opcode == OP_PUSHDATA1) {
            if (end() - pc < 1) return false;
            nSize = *pc++;
        } else if (opcode == OP_PUSHDATA2) {
            if (end() - pc < 2) return false;
            nSize = static_cast<size_t>(pc[0]) | (static_cast<size_t>(pc[1]) << 8);
            pc += 2;
        } else {
            if (end() - pc < 4) return false;
            nSize = static_cast<size_t>(pc[0]) | (static_cast<size_t>(pc[1]) << 8) |
                    (static_cast<size_t>(pc[2]) << 16) | (static_cast<size_t>(pc[3]) << 24);
            pc += 4;
        }

        if (static_cast<size_t>(end() - pc) < nSize) {
            return false;
        }
        dataRet.assign(pc, pc + nSize);
        pc += nSize;
    }

    return true;
}

bool Script::IsPushOnly() const {
    auto pc = begin();
    std::vector<uint8_t> data;
    while (pc < end()) {
        Opcode opcode;
        if (!GetOp(pc, opcode, data)) {
            return false;
        }
        if (opcode > OP_16) {
            return false;
        }
    }
    return true;
}

bool Script::IsPayToPublicKeyHash() const {
    return size() == 25 &&
           (*this)[0] == OP_DUP &&
           (*this)[1] == OP_HASH160 &&
           (*this)[2] == 20 &&
           (*this)[23] == OP_EQUALVERIFY &&
           (*this)[24] == OP_CHECKSIG;
}

bool Script::IsPayToScriptHash() const {
    return size() == 23 &&
           (*this)[0] == OP_HASH160 &&
           (*this)[1] == 20 &&
           (*this)[22] == OP_EQUAL;
}

bool Script::IsPayToWitnessPubKeyHash() const {
    return size() == 22 && (*this)[0] == OP_0 && (*this)[1] == 20;
}

bool Script::IsPayToWitnessScriptHash() const {
    return size() == 34 && (*this)[0] == OP_0 && (*this)[1] == 32;
}

ScriptType Script::GetType() const {
    if (IsPayToPublicKeyHash()) return ScriptType::P2PKH;
    if (IsPayToScriptHash()) return ScriptType::P2SH;
    if (IsPayToWitnessPubKeyHash()) return ScriptType::P2WPKH;
    if (IsPayToWitnessScriptHash()) return ScriptType::P2WSH;
    if (IsUnspendable()) return ScriptType::NULL_DATA;
    return ScriptType::NONSTANDARD;
}

bool Script::ExtractHash160(Hash160& hash) const {
    size_t offset;
    switch (GetType()) {
        case ScriptType::P2PKH:  offset = 3; break;
        case ScriptType::P2SH:   offset = 2; break;
        case ScriptType::P2WPKH: offset = 2; break;
        default: return false;
    }
    std::memcpy(hash.data(), data() + offset, Hash160::SIZE);
    return true;
}

Script Script::CreateP2PKH(const Hash160& pubKeyHash) {
    Script script;
    script << OP_DUP << OP_HASH160 << pubKeyHash << OP_EQUALVERIFY << OP_CHECKSIG;
    return script;
}

Script Script::CreateP2SH(const Hash160& scriptHash) {
    Script script;
    script << OP_HASH160 << scriptHash << OP_EQUAL;
    return script;
}

Script Script::CreateP2WPKH(const Hash160& pubKeyHash) {
    Script script;
    script << OP_0 << pubKeyHash;
    return script;
}

Script Script::CreateP2WSH(const Hash256& scriptHash) {
    Script script;
    script << OP_0 << scriptHash;
    return script;
}

Script Script::CreateP2SH_P2WPKH(const Hash160& pubKeyHash) {
    Script redeem = CreateP2WPKHRedeemScript(pubKeyHash);
    return CreateP2SH(ComputeHash160(redeem.data(), redeem.size()));
}

Script Script::CreateP2PKHScriptSig(const std::vector<uint8_t>& sigWithHashType,
                                    const std::vector<uint8_t>& pubkey) {
    Script script;
    script << sigWithHashType << pubkey;
    return script;
}

Script Script::CreateP2SH_P2WPKHScriptSig(const Hash160& pubKeyHash) {
    Script redeem = CreateP2WPKHRedeemScript(pubKeyHash);
    Script script;
    script << static_cast<const std::vector<uint8_t>&>(redeem);
    return script;
}

std::vector<uint8_t> Script::P2WPKHScriptCode(const Hash160& pubKeyHash) {
    Script p2pkh = CreateP2PKH(pubKeyHash);
    std::vector<uint8_t> code;
    code.reserve(p2pkh.size() + 1);
    code.push_back(static_cast<uint8_t>(p2pkh.size()));
    code.insert(code.end(), p2pkh.begin(), p2pkh.end());
    return code;
}

std::string Script::ToString() const {
    std::ostringstream oss;
    auto pc = begin();
    bool first = true;

    while (pc < end()) {
        if (!first) {
            oss << " ";
        }
        first = false;

        Opcode opcode;
        std::vector<uint8_t> data;
        if (!GetOp(pc, opcode, data)) {
            oss << "[error]";
            break;
        }

        if (opcode > OP_0 && opcode <= OP_PUSHDATA4) {
            oss << BytesToHex(data);
        } else {
            oss << GetOpName(opcode);
        }
    }

    return oss.str();
}

std::string Script::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace satchel
