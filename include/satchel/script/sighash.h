// Satchel - Signature Hash Calculation
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Legacy (pre-segwit) and BIP143 signature hashes for SIGHASH_ALL.

#ifndef SATCHEL_SCRIPT_SIGHASH_H
#define SATCHEL_SCRIPT_SIGHASH_H

#include "satchel/core/transaction.h"
#include "satchel/core/types.h"

#include <cstdint>
#include <vector>

namespace satchel {

// ============================================================================
// Signature Hash Types
// ============================================================================

/// Only SIGHASH_ALL is produced by this library
enum SigHashType : uint8_t {
    SIGHASH_ALL = 1,
};

// ============================================================================
// Legacy Signature Hash
// ============================================================================

/**
 * Calculate the legacy signature hash for one input.
 *
 * Every scriptSig is cleared, input nIn gets scriptCode, the 4-byte LE hash
 * type is appended and the result is double-SHA256'd. Cost is O(n) per
 * input, so O(n^2) per transaction.
 *
 * Throws std::out_of_range if nIn is not an input index.
 */
Hash256 LegacySignatureHash(const MutableTransaction& tx,
                            size_t nIn,
                            const Script& scriptCode,
                            uint32_t nHashType = SIGHASH_ALL);

// ============================================================================
// BIP143 Signature Hash
// ============================================================================

/// Per-transaction hashes shared by every BIP143 input
struct PrecomputedTransactionData {
    Hash256 hashPrevouts;
    Hash256 hashSequence;
    Hash256 hashOutputs;

    PrecomputedTransactionData() = default;
    explicit PrecomputedTransactionData(const MutableTransaction& tx);
};

/**
 * Calculate the BIP143 signature hash for one input.
 *
 * scriptCode is the serialized script including its length prefix, e.g.
 * 0x19 76a914{20}88ac for P2WPKH.
 */
Hash256 SegwitSignatureHash(const MutableTransaction& tx,
                            size_t nIn,
                            const std::vector<uint8_t>& scriptCode,
                            Amount amount,
                            const PrecomputedTransactionData& cache,
                            uint32_t nHashType = SIGHASH_ALL);

} // namespace satchel

#endif // SATCHEL_SCRIPT_SIGHASH_H
