// Satchel - Signing Policy
// Copyright (c) 2024 Satchel Developers
// MIT License

#ifndef SATCHEL_WALLET_POLICY_H
#define SATCHEL_WALLET_POLICY_H

#include <satchel/util/config.h>
#include <satchel/wallet/coinselection.h>
#include <satchel/wallet/hdkey.h>

#include <string>

namespace satchel {
namespace wallet {

/// Knobs that change derivation and selection behaviour
struct SigningPolicy {
    DerivationPolicy derivation{DerivationPolicy::Strict};
    SelectionParams selection;

    /**
     * Read [policy], [dust], [size.legacy] and [size.segwit]. Missing keys
     * keep their defaults. Throws ValidationError(InvalidConfig) on a value
     * that is present but unusable.
     */
    static SigningPolicy FromConfig(const util::ConfigManager& config);

    /// INI text that FromConfig reads back to the same policy
    std::string ToConfigString() const;
};

} // namespace wallet
} // namespace satchel

#endif // SATCHEL_WALLET_POLICY_H
