// Satchel - Coin Selection
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Greedy largest-first UTXO selection with a two-output fee estimate, an
// address-type dependent dust threshold, and a sweep mode guarded by a
// maximum fee-to-balance ratio.

#ifndef SATCHEL_WALLET_COINSELECTION_H
#define SATCHEL_WALLET_COINSELECTION_H

#include <satchel/core/types.h>
#include <satchel/wallet/chainparams.h>
#include <satchel/wallet/txbuilder.h>

#include <cstddef>
#include <vector>

namespace satchel {
namespace wallet {

/// Fee rate in satoshis per virtual byte
using FeeRate = double;

// ============================================================================
// Size Model
// ============================================================================

/// Virtual-size estimate: overhead + nIn * input + nOut * output
struct SizeModel {
    size_t overhead;
    size_t input;
    size_t output;

    SizeModel() : overhead(10), input(148), output(34) {}
    SizeModel(size_t ov, size_t in, size_t out) : overhead(ov), input(in), output(out) {}

    /// P2PKH spends
    static SizeModel Legacy() { return SizeModel(10, 148, 34); }

    /// P2WPKH and P2SH-P2WPKH spends
    static SizeModel SegWit() { return SizeModel(11, 68, 31); }

    size_t Estimate(size_t numInputs, size_t numOutputs) const {
        return overhead + numInputs * input + numOutputs * output;
    }
};

// ============================================================================
// Dust Policy
// ============================================================================

/// Smallest output worth creating, per output type
struct DustPolicy {
    Amount p2pkh{546};
    Amount p2shP2wpkh{540};
    Amount p2wpkh{294};

    Amount For(AddressType type) const;
};

// ============================================================================
// Selection Parameters / Results
// ============================================================================

struct SelectionParams {
    SizeModel legacySize{SizeModel::Legacy()};
    SizeModel segwitSize{SizeModel::SegWit()};
    DustPolicy dust;

    /// Sweep rejects a fee above this share of the swept balance
    double maxSweepFeeRatio{0.20};

    const SizeModel& SizeFor(AddressType type) const {
        return type == AddressType::P2PKH ? legacySize : segwitSize;
    }
};

struct SelectionResult {
    std::vector<UTXO> selected;
    Amount totalValue{0};
    Amount target{0};
    Amount fee{0};
    Amount change{0};       // 0 when the change output was dropped
    bool hasChange{false};
    size_t estimatedVsize{0};

    size_t OutputCount() const { return hasChange ? 2 : 1; }

    std::vector<TransactionInput> ToInputs() const;
};

struct SweepResult {
    std::vector<UTXO> selected;
    Amount totalValue{0};
    Amount fee{0};
    Amount amount{0};       // totalValue - fee, sent to a single output
    size_t estimatedVsize{0};

    std::vector<TransactionInput> ToInputs() const;
};

// ============================================================================
// UTXO Selector
// ============================================================================

class UTXOSelector {
public:
    UTXOSelector() = default;
    explicit UTXOSelector(const SelectionParams& params) : params_(params) {}

    void SetParams(const SelectionParams& params) { params_ = params; }
    const SelectionParams& GetParams() const { return params_; }

    /**
     * Pick confirmed UTXOs, largest first, until they cover target plus a
     * two-output fee. Change below the dust threshold is dropped and the fee
     * recomputed for one output.
     *
     * Throws ValidationError(InvalidAmount) for a zero target or a negative
     * fee rate, InsufficientFundsError when the funds fall short.
     */
    SelectionResult Select(const std::vector<UTXO>& utxos, Amount target,
                           FeeRate feeRate, AddressType type) const;

    /**
     * Spend every confirmed UTXO to one output.
     *
     * Throws InsufficientFundsError with FeeRatioExceeded, InsufficientFunds
     * or BelowDust.
     */
    SweepResult Sweep(const std::vector<UTXO>& utxos, FeeRate feeRate,
                      AddressType type) const;

    /// Confirmed UTXOs sorted by value, largest first
    static std::vector<UTXO> EligibleUTXOs(const std::vector<UTXO>& utxos);

private:
    SelectionParams params_;
};

// ============================================================================
// Utility Functions
// ============================================================================

/// ceil(vsize * feeRate). Throws ValidationError(InvalidAmount) for a bad
/// rate or a fee that does not fit in an Amount.
Amount FeeForVsize(size_t vsize, FeeRate feeRate);

size_t EstimateVsize(AddressType type, size_t numInputs, size_t numOutputs,
                     const SelectionParams& params = SelectionParams());

Amount EstimateFee(AddressType type, size_t numInputs, size_t numOutputs, FeeRate feeRate,
                   const SelectionParams& params = SelectionParams());

} // namespace wallet
} // namespace satchel

#endif // SATCHEL_WALLET_COINSELECTION_H
