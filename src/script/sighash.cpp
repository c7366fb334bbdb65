// Satchel - Signature Hash Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/script/sighash.h"
#include "satchel/crypto/sha256.h"

#include <stdexcept>

namespace satchel {

// ============================================================================
// Legacy Signature Hash
// ============================================================================

Hash256 LegacySignatureHash(const MutableTransaction& tx, size_t nIn,
                            const Script& scriptCode, uint32_t nHashType) {
    if (nIn >= tx.vin.size()) {
        throw std::out_of_range("LegacySignatureHash: input index out of range");
    }

    MutableTransaction txCopy(tx);
    for (auto& input : txCopy.vin) {
        input.scriptSig.clear();
        input.witness.clear();
    }
    txCopy.vin[nIn].scriptSig = scriptCode;

    DataStream ss;
    SerializeTransaction(ss, txCopy, SERIALIZE_TRANSACTION_NO_WITNESS);
    ser_writedata32(ss, nHashType);

    return DoubleSHA256(ss.Data());
}

// ============================================================================
// BIP143 Signature Hash
// ============================================================================

PrecomputedTransactionData::PrecomputedTransactionData(const MutableTransaction& tx) {
    DataStream prevouts;
    DataStream sequences;
    for (const auto& in : tx.vin) {
        Serialize(prevouts, in.prevout);
        ser_writedata32(sequences, in.nSequence);
    }

    DataStream outputs;
    for (const auto& out : tx.vout) {
        Serialize(outputs, out);
    }

    hashPrevouts = DoubleSHA256(prevouts.Data());
    hashSequence = DoubleSHA256(sequences.Data());
    hashOutputs = DoubleSHA256(outputs.Data());
}

Hash256 SegwitSignatureHash(const MutableTransaction& tx, size_t nIn,
                            const std::vector<uint8_t>& scriptCode, Amount amount,
                            const PrecomputedTransactionData& cache, uint32_t nHashType) {
    if (nIn >= tx.vin.size()) {
        throw std::out_of_range("SegwitSignatureHash: input index out of range");
    }
    const TxIn& in = tx.vin[nIn];

    DataStream ss;
    ser_writedata32(ss, tx.version);
    Serialize(ss, cache.hashPrevouts);
    Serialize(ss, cache.hashSequence);
    Serialize(ss, in.prevout);
    // scriptCode already carries its length prefix
    ss.Write(scriptCode.data(), scriptCode.size());
    ser_writedata64(ss, amount);
    ser_writedata32(ss, in.nSequence);
    Serialize(ss, cache.hashOutputs);
    ser_writedata32(ss, tx.nLockTime);
    ser_writedata32(ss, nHashType);

    return DoubleSHA256(ss.Data());
}

} // namespace satchel
