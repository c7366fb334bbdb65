// Satchel - Coin Amount Formatting Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <satchel/wallet/amount.h>

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>

namespace satchel {
namespace wallet {

std::string FormatAmount(Amount amount, int decimals) {
    decimals = std::clamp(decimals, 0, COIN_DECIMALS);

    Amount unit = 1;
    for (int i = decimals; i < COIN_DECIMALS; ++i) {
        unit *= 10;
    }
    const Amount scale = COIN / unit;

    Amount whole = amount / COIN;
    Amount frac = (amount % COIN + unit / 2) / unit;
    if (frac == scale) {
        ++whole;
        frac = 0;
    }

    std::ostringstream oss;
    oss << whole;
    if (decimals > 0) {
        oss << "." << std::setfill('0') << std::setw(decimals) << frac;
    }
    return oss.str();
}

std::optional<Amount> ParseAmount(const std::string& str) {
    const size_t dotPos = str.find('.');
    const std::string wholePart = str.substr(0, dotPos);
    std::string fracPart = (dotPos != std::string::npos) ? str.substr(dotPos + 1) : "";

    auto isDigits = [](const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
    };
    if (wholePart.empty() && fracPart.empty()) {
        return std::nullopt;
    }
    if (!isDigits(wholePart) || !isDigits(fracPart)) {
        return std::nullopt;
    }

    // Trailing zeros past the eighth digit carry no value
    while (fracPart.size() > static_cast<size_t>(COIN_DECIMALS) && fracPart.back() == '0') {
        fracPart.pop_back();
    }
    if (fracPart.size() > static_cast<size_t>(COIN_DECIMALS)) {
        return std::nullopt;
    }
    fracPart.resize(COIN_DECIMALS, '0');

    constexpr Amount MAX = std::numeric_limits<Amount>::max();
    Amount whole = 0;
    for (char c : wholePart) {
        const Amount digit = static_cast<Amount>(c - '0');
        if (whole > (MAX - digit) / 10) {
            return std::nullopt;
        }
        whole = whole * 10 + digit;
    }

    Amount frac = 0;
    for (char c : fracPart) {
        frac = frac * 10 + static_cast<Amount>(c - '0');
    }

    if (whole > (MAX - frac) / COIN) {
        return std::nullopt;
    }
    return whole * COIN + frac;
}

} // namespace wallet
} // namespace satchel
