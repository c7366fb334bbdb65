// Satchel - Coin Amount Formatting
// Copyright (c) 2024 Satchel Developers
// MIT License

#ifndef SATCHEL_WALLET_AMOUNT_H
#define SATCHEL_WALLET_AMOUNT_H

#include "satchel/core/types.h"

#include <optional>
#include <string>

namespace satchel {
namespace wallet {

/// Smallest units per whole coin on every supported chain
constexpr Amount COIN = 100000000;

/// Fractional digits of a whole-coin amount
constexpr int COIN_DECIMALS = 8;

/**
 * Format an amount in smallest units as a whole-coin decimal string.
 *
 * decimals is clamped to [0, 8]. Digits beyond it are rounded half up, so
 * FormatAmount(150000000, 0) is "2". No decimal point is written for 0.
 */
std::string FormatAmount(Amount amount, int decimals = COIN_DECIMALS);

/**
 * Parse a whole-coin decimal string ("0.0001", "12", ".5") into smallest
 * units using integer arithmetic only.
 *
 * Returns nullopt for signs, separators, whitespace, more than eight
 * significant fractional digits, or a value that overflows Amount.
 */
std::optional<Amount> ParseAmount(const std::string& str);

} // namespace wallet
} // namespace satchel

#endif // SATCHEL_WALLET_AMOUNT_H
