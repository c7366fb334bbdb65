// Satchel - Transaction Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/core/transaction.h"
#include "satchel/core/hex.h"
#include "satchel/crypto/sha256.h"
#include <sstream>

namespace satchel {

// ============================================================================
// OutPoint Implementation
// ============================================================================

std::string OutPoint::ToString() const {
    std::ostringstream ss;
    ss << hash.ToHex() << ":" << n;
    return ss.str();
}

// ============================================================================
// MutableTransaction Implementation
// ============================================================================

MutableTransaction::MutableTransaction()
    : version(CURRENT_VERSION), nLockTime(0) {}

bool MutableTransaction::HasWitness() const {
    for (const auto& in : vin) {
        if (!in.witness.empty()) {
            return true;
        }
    }
    return false;
}

TxHash MutableTransaction::GetHash() const {
    DataStream ss;
    SerializeTransaction(ss, *this, SERIALIZE_TRANSACTION_NO_WITNESS);
    return TxHash(DoubleSHA256(ss.Data()));
}

TxHash MutableTransaction::GetWitnessHash() const {
    DataStream ss;
    SerializeTransaction(ss, *this, SERIALIZE_TRANSACTION_WITNESS);
    return TxHash(DoubleSHA256(ss.Data()));
}

Amount MutableTransaction::GetValueOut() const {
    Amount total = 0;
    for (const auto& out : vout) {
        if (out.nValue > std::numeric_limits<Amount>::max() - total) {
            throw std::runtime_error("Total TxOut value overflows");
        }
        total += out.nValue;
    }
    return total;
}

size_t MutableTransaction::GetBaseSize() const {
    SizeComputer sc;
    SerializeTransaction(sc, *this, SERIALIZE_TRANSACTION_NO_WITNESS);
    return sc.size();
}

size_t MutableTransaction::GetTotalSize() const {
    SizeComputer sc;
    SerializeTransaction(sc, *this, SERIALIZE_TRANSACTION_WITNESS);
    return sc.size();
}

size_t MutableTransaction::GetWeight() const {
    return GetBaseSize() * 3 + GetTotalSize();
}

size_t MutableTransaction::GetVirtualSize() const {
    return ComputeVirtualSize(GetBaseSize(), GetTotalSize());
}

std::vector<uint8_t> MutableTransaction::ToBytes() const {
    DataStream ss;
    SerializeTransaction(ss, *this, SERIALIZE_TRANSACTION_WITNESS);
    return ss.Data();
}

std::string MutableTransaction::ToHex() const {
    return BytesToHex(ToBytes());
}

MutableTransaction MutableTransaction::Deserialize(const std::vector<uint8_t>& data) {
    DataStream ss(data);
    MutableTransaction tx;
    Unserialize(ss, tx);
    if (!ss.empty()) {
        throw std::ios_base::failure("trailing bytes after transaction");
    }
    return tx;
}

size_t ComputeVirtualSize(size_t baseSize, size_t totalSize) {
    return (baseSize * 3 + totalSize + 3) / 4;
}

} // namespace satchel
