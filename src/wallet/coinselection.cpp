// Satchel - Coin Selection Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <satchel/wallet/coinselection.h>
#include <satchel/wallet/errors.h>
#include <satchel/util/logging.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>

namespace satchel {
namespace wallet {

namespace {

void CheckFeeRate(FeeRate feeRate) {
    if (!std::isfinite(feeRate) || feeRate < 0) {
        throw ValidationError(ErrorCode::InvalidAmount, "fee rate must be a non-negative number");
    }
}

std::vector<TransactionInput> InputsOf(const std::vector<UTXO>& utxos) {
    std::vector<TransactionInput> inputs;
    inputs.reserve(utxos.size());
    for (const auto& utxo : utxos) {
        inputs.push_back(TransactionInput::FromUTXO(utxo));
    }
    return inputs;
}

Amount AddValue(Amount total, Amount value) {
    if (value > std::numeric_limits<Amount>::max() - total) {
        throw ValidationError(ErrorCode::InvalidAmount, "UTXO total overflows");
    }
    return total + value;
}

} // namespace

// ============================================================================
// DustPolicy / Results
// ============================================================================

Amount DustPolicy::For(AddressType type) const {
    switch (type) {
        case AddressType::P2PKH:       return p2pkh;
        case AddressType::P2SH_P2WPKH: return p2shP2wpkh;
        case AddressType::P2WPKH:      return p2wpkh;
    }
    return p2pkh;
}

std::vector<TransactionInput> SelectionResult::ToInputs() const {
    return InputsOf(selected);
}

std::vector<TransactionInput> SweepResult::ToInputs() const {
    return InputsOf(selected);
}

// ============================================================================
// UTXOSelector
// ============================================================================

std::vector<UTXO> UTXOSelector::EligibleUTXOs(const std::vector<UTXO>& utxos) {
    std::vector<UTXO> eligible;
    eligible.reserve(utxos.size());
    std::copy_if(utxos.begin(), utxos.end(), std::back_inserter(eligible),
                 [](const UTXO& u) { return u.confirmed; });

    // Stable so equal values keep their caller order
    std::stable_sort(eligible.begin(), eligible.end(),
                     [](const UTXO& a, const UTXO& b) { return a.value > b.value; });
    return eligible;
}

SelectionResult UTXOSelector::Select(const std::vector<UTXO>& utxos, Amount target,
                                     FeeRate feeRate, AddressType type) const {
    if (target == 0) {
        throw ValidationError(ErrorCode::InvalidAmount, "target must be positive");
    }
    CheckFeeRate(feeRate);

    const SizeModel& model = params_.SizeFor(type);
    const Amount dust = params_.dust.For(type);

    SelectionResult result;
    result.target = target;

    // Accumulate assuming recipient + change
    for (const auto& utxo : EligibleUTXOs(utxos)) {
        result.selected.push_back(utxo);
        result.totalValue = AddValue(result.totalValue, utxo.value);

        Amount fee = FeeForVsize(model.Estimate(result.selected.size(), 2), feeRate);
        if (result.totalValue >= target && result.totalValue - target >= fee) {
            break;
        }
    }

    const size_t nIn = result.selected.size();
    const size_t vsizeTwo = model.Estimate(nIn, 2);
    const Amount feeTwo = FeeForVsize(vsizeTwo, feeRate);

    if (result.totalValue >= target && result.totalValue - target >= feeTwo &&
        result.totalValue - target - feeTwo >= dust) {
        result.fee = feeTwo;
        result.change = result.totalValue - target - feeTwo;
        result.hasChange = true;
        result.estimatedVsize = vsizeTwo;
    } else {
        const size_t vsizeOne = model.Estimate(nIn, 1);
        const Amount feeOne = FeeForVsize(vsizeOne, feeRate);
        if (result.totalValue < target || result.totalValue - target < feeOne) {
            Amount required = target > std::numeric_limits<Amount>::max() - feeOne
                                  ? std::numeric_limits<Amount>::max()
                                  : target + feeOne;
            LOG_DEBUG(util::LogCategory::SELECT) << "short: need " << required
                                                 << " have " << result.totalValue;
            throw InsufficientFundsError(ErrorCode::InsufficientFunds,
                "need " + std::to_string(required) + ", have " + std::to_string(result.totalValue),
                required, result.totalValue);
        }
        // Sub-dust remainder goes to the miner
        result.fee = result.totalValue - target;
        result.change = 0;
        result.hasChange = false;
        result.estimatedVsize = vsizeOne;
    }

    LOG_DEBUG(util::LogCategory::SELECT) << AddressTypeToString(type)
                                         << " selected " << nIn << " of " << utxos.size()
                                         << " utxos, total=" << result.totalValue
                                         << " fee=" << result.fee
                                         << " change=" << result.change;
    return result;
}

SweepResult UTXOSelector::Sweep(const std::vector<UTXO>& utxos, FeeRate feeRate,
                                AddressType type) const {
    CheckFeeRate(feeRate);

    SweepResult result;
    result.selected = EligibleUTXOs(utxos);
    for (const auto& utxo : result.selected) {
        result.totalValue = AddValue(result.totalValue, utxo.value);
    }
    if (result.selected.empty() || result.totalValue == 0) {
        throw InsufficientFundsError(ErrorCode::InsufficientFunds,
            "no confirmed UTXOs to sweep", 0, 0);
    }

    result.estimatedVsize = params_.SizeFor(type).Estimate(result.selected.size(), 1);
    result.fee = FeeForVsize(result.estimatedVsize, feeRate);

    double ratio = static_cast<double>(result.fee) / static_cast<double>(result.totalValue);
    if (ratio > params_.maxSweepFeeRatio) {
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(1)
            << "fee " << result.fee << " is " << ratio * 100 << "% of balance "
            << result.totalValue << ", limit " << params_.maxSweepFeeRatio * 100 << "%";
        throw InsufficientFundsError(ErrorCode::FeeRatioExceeded, msg.str(),
                                     result.fee, result.totalValue);
    }
    if (result.fee >= result.totalValue) {
        throw InsufficientFundsError(ErrorCode::InsufficientFunds,
            "fee exceeds balance", result.fee, result.totalValue);
    }

    result.amount = result.totalValue - result.fee;
    const Amount dust = params_.dust.For(type);
    if (result.amount < dust) {
        throw InsufficientFundsError(ErrorCode::BelowDust,
            "sweep amount " + std::to_string(result.amount) + " is below dust " + std::to_string(dust),
            result.fee + dust, result.totalValue);
    }

    LOG_DEBUG(util::LogCategory::SELECT) << "sweep " << result.selected.size()
                                         << " utxos, amount=" << result.amount
                                         << " fee=" << result.fee;
    return result;
}

// ============================================================================
// Utility Functions
// ============================================================================

Amount FeeForVsize(size_t vsize, FeeRate feeRate) {
    CheckFeeRate(feeRate);
    const double fee = std::ceil(static_cast<double>(vsize) * feeRate);
    // 2^64 as a double; anything at or above it has no Amount representation
    if (fee >= static_cast<double>(std::numeric_limits<Amount>::max())) {
        throw ValidationError(ErrorCode::InvalidAmount,
            "fee for " + std::to_string(vsize) + " vB is not representable");
    }
    return static_cast<Amount>(fee);
}

size_t EstimateVsize(AddressType type, size_t numInputs, size_t numOutputs,
                     const SelectionParams& params) {
    return params.SizeFor(type).Estimate(numInputs, numOutputs);
}

Amount EstimateFee(AddressType type, size_t numInputs, size_t numOutputs, FeeRate feeRate,
                   const SelectionParams& params) {
    return FeeForVsize(EstimateVsize(type, numInputs, numOutputs, params), feeRate);
}

} // namespace wallet
} // namespace satchel
