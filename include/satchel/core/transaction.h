// Satchel - Transaction Header
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Transaction primitives with legacy and BIP144 (segwit) wire formats.

#ifndef SATCHEL_CORE_TRANSACTION_H
#define SATCHEL_CORE_TRANSACTION_H

#include "satchel/core/types.h"
#include "satchel/core/script.h"
#include "satchel/core/serialize.h"
#include <cstdint>
#include <vector>
#include <string>
#include <limits>

namespace satchel {

// ============================================================================
// OutPoint - Reference to a previous transaction output
// ============================================================================

/// A transaction hash (internal byte order) and an output index
class OutPoint {
public:
    TxHash hash;
    uint32_t n;

    static constexpr uint32_t NULL_INDEX = std::numeric_limits<uint32_t>::max();

    OutPoint() : hash(), n(NULL_INDEX) {}
    OutPoint(const TxHash& hashIn, uint32_t nIn) : hash(hashIn), n(nIn) {}

    bool IsNull() const { return hash.IsNull() && n == NULL_INDEX; }

    friend bool operator==(const OutPoint& a, const OutPoint& b) {
        return a.hash == b.hash && a.n == b.n;
    }
    friend bool operator!=(const OutPoint& a, const OutPoint& b) {
        return !(a == b);
    }

    /// "<display txid>:<n>"
    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const OutPoint& outpoint) {
    Serialize(s, outpoint.hash);
    Serialize(s, outpoint.n);
}

template<typename Stream>
void Unserialize(Stream& s, OutPoint& outpoint) {
    Unserialize(s, outpoint.hash);
    Unserialize(s, outpoint.n);
}

// ============================================================================
// TxIn - Transaction Input
// ============================================================================

/// Witness stack of one input
using ScriptWitness = std::vector<std::vector<uint8_t>>;

/// An input spending a previous output
class TxIn {
public:
    OutPoint prevout;
    Script scriptSig;
    uint32_t nSequence;
    ScriptWitness witness;

    static constexpr uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;

    /// Enables nLockTime without signalling replaceability
    static constexpr uint32_t MAX_SEQUENCE_NONFINAL = SEQUENCE_FINAL - 1;

    TxIn() : nSequence(SEQUENCE_FINAL) {}

    explicit TxIn(const OutPoint& prevoutIn,
                  Script scriptSigIn = Script(),
                  uint32_t nSequenceIn = SEQUENCE_FINAL)
        : prevout(prevoutIn), scriptSig(std::move(scriptSigIn)), nSequence(nSequenceIn) {}

    friend bool operator==(const TxIn& a, const TxIn& b) {
        return a.prevout == b.prevout &&
               a.scriptSig == b.scriptSig &&
               a.nSequence == b.nSequence &&
               a.witness == b.witness;
    }
    friend bool operator!=(const TxIn& a, const TxIn& b) {
        return !(a == b);
    }
};

template<typename Stream>
void Serialize(Stream& s, const TxIn& txin) {
    Serialize(s, txin.prevout);
    Serialize(s, txin.scriptSig);
    Serialize(s, txin.nSequence);
}

template<typename Stream>
void Unserialize(Stream& s, TxIn& txin) {
    Unserialize(s, txin.prevout);
    Unserialize(s, txin.scriptSig);
    Unserialize(s, txin.nSequence);
}

// ============================================================================
// TxOut - Transaction Output
// ============================================================================

/// An amount locked to a scriptPubKey
class TxOut {
public:
    Amount nValue;
    Script scriptPubKey;

    TxOut() : nValue(0) {}
    TxOut(Amount nValueIn, Script scriptPubKeyIn)
        : nValue(nValueIn), scriptPubKey(std::move(scriptPubKeyIn)) {}

    friend bool operator==(const TxOut& a, const TxOut& b) {
        return a.nValue == b.nValue && a.scriptPubKey == b.scriptPubKey;
    }
    friend bool operator!=(const TxOut& a, const TxOut& b) {
        return !(a == b);
    }
};

template<typename Stream>
void Serialize(Stream& s, const TxOut& txout) {
    Serialize(s, static_cast<uint64_t>(txout.nValue));
    Serialize(s, txout.scriptPubKey);
}

template<typename Stream>
void Unserialize(Stream& s, TxOut& txout) {
    uint64_t value;
    Unserialize(s, value);
    txout.nValue = value;
    Unserialize(s, txout.scriptPubKey);
}

// ============================================================================
// MutableTransaction
// ============================================================================

/// Serialization flag: include marker, flag and witness data when present
static constexpr int SERIALIZE_TRANSACTION_NO_WITNESS = 0;
static constexpr int SERIALIZE_TRANSACTION_WITNESS = 1;

/// A transaction under construction
class MutableTransaction {
public:
    std::vector<TxIn> vin;
    std::vector<TxOut> vout;
    uint32_t version;
    uint32_t nLockTime;

    static constexpr uint32_t CURRENT_VERSION = 2;

    MutableTransaction();

    bool IsNull() const { return vin.empty() && vout.empty(); }

    /// True if any input carries witness data
    bool HasWitness() const;

    /// txid: dSHA256 of the non-witness serialization (internal order)
    TxHash GetHash() const;

    /// wtxid: dSHA256 of the full serialization
    TxHash GetWitnessHash() const;

    /// Sum of output values; throws std::runtime_error on overflow
    Amount GetValueOut() const;

    /// Size without witness data
    size_t GetBaseSize() const;

    /// Size with witness data (equal to base size for legacy)
    size_t GetTotalSize() const;

    /// BIP141 weight: base * 3 + total
    size_t GetWeight() const;

    /// ceil(weight / 4)
    size_t GetVirtualSize() const;

    /// Wire bytes, with witness when present
    std::vector<uint8_t> ToBytes() const;

    std::string ToHex() const;

    /// Parse wire bytes (legacy or segwit). Throws std::ios_base::failure
    /// on truncated or malformed data.
    static MutableTransaction Deserialize(const std::vector<uint8_t>& data);
};

/// ceil((baseSize * 3 + totalSize) / 4)
size_t ComputeVirtualSize(size_t baseSize, size_t totalSize);

template<typename Stream>
void SerializeTransaction(Stream& s, const MutableTransaction& tx, int flags) {
    const bool witness = (flags & SERIALIZE_TRANSACTION_WITNESS) && tx.HasWitness();

    Serialize(s, tx.version);
    if (witness) {
        ser_writedata8(s, 0x00);  // marker
        ser_writedata8(s, 0x01);  // flag
    }
    WriteCompactSize(s, tx.vin.size());
    for (const auto& in : tx.vin) {
        Serialize(s, in);
    }
    WriteCompactSize(s, tx.vout.size());
    for (const auto& out : tx.vout) {
        Serialize(s, out);
    }
    if (witness) {
        for (const auto& in : tx.vin) {
            WriteCompactSize(s, in.witness.size());
            for (const auto& item : in.witness) {
                Serialize(s, item);
            }
        }
    }
    Serialize(s, tx.nLockTime);
}

template<typename Stream>
void Serialize(Stream& s, const MutableTransaction& tx) {
    SerializeTransaction(s, tx, SERIALIZE_TRANSACTION_WITNESS);
}

template<typename Stream>
void Unserialize(Stream& s, MutableTransaction& tx) {
    Unserialize(s, tx.version);

    uint64_t nIn = ReadCompactSize(s);
    bool witness = false;
    if (nIn == 0) {
        uint8_t flag = ser_readdata8(s);
        if (flag != 0x01) {
            throw std::ios_base::failure("Unknown transaction optional data");
        }
        witness = true;
        nIn = ReadCompactSize(s);
    }

    tx.vin.assign(nIn, TxIn());
    for (auto& in : tx.vin) {
        Unserialize(s, in);
    }
    uint64_t nOut = ReadCompactSize(s);
    tx.vout.assign(nOut, TxOut());
    for (auto& out : tx.vout) {
        Unserialize(s, out);
    }

    if (witness) {
        for (auto& in : tx.vin) {
            uint64_t items = ReadCompactSize(s);
            in.witness.assign(items, {});
            for (auto& item : in.witness) {
                Unserialize(s, item);
            }
        }
        if (!tx.HasWitness()) {
            throw std::ios_base::failure("Superfluous witness record");
        }
    }
    Unserialize(s, tx.nLockTime);
}

} // namespace satchel

#endif // SATCHEL_CORE_TRANSACTION_H
