// Satchel - Keyring
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Session object that turns a mnemonic into per-chain, per-account key
// pairs and signs transactions with them. The seed and every cached private
// key live in zeroizing buffers and are wiped by Lock().

#ifndef SATCHEL_WALLET_KEYRING_H
#define SATCHEL_WALLET_KEYRING_H

#include <satchel/crypto/keys.h>
#include <satchel/crypto/secure.h>
#include <satchel/wallet/chainparams.h>
#include <satchel/wallet/coinselection.h>
#include <satchel/wallet/hdkey.h>
#include <satchel/wallet/policy.h>
#include <satchel/wallet/txbuilder.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace satchel {
namespace wallet {

/**
 * Everything a Keyring needs from its owner. The context must outlive every
 * Keyring built from it.
 */
struct KeyringContext {
    ChainRegistry chains{ChainRegistry::BuiltIn()};
    SigningPolicy policy;
    MnemonicValidator validator{Mnemonic::DefaultValidator()};
};

class Keyring {
public:
    explicit Keyring(const KeyringContext& context);
    ~Keyring();

    Keyring(const Keyring&) = delete;
    Keyring& operator=(const Keyring&) = delete;

    // ========================================================================
    // Session
    // ========================================================================

    /**
     * Validate the mnemonic and derive the session seed. Replaces any
     * previous session. Throws ValidationError(InvalidMnemonic).
     */
    void Unlock(const std::string& mnemonic);

    bool IsUnlocked() const;

    /// Wipe the seed and every cached key
    void Lock();

    /// Wipe cached keys, keep the session seed
    void Clear();

    size_t CachedKeyCount() const;

    // ========================================================================
    // Keys and addresses
    // ========================================================================

    /// m/purpose'/coin'/0'/change/accountIndex for the chain
    DerivationPath GetPath(const std::string& chainId, uint32_t accountIndex,
                           std::optional<AddressType> type = std::nullopt) const;

    /**
     * Derive or fetch the cached key pair. An empty type selects the chain's
     * default. Throws ValidationError (Locked, UnknownChain,
     * UnsupportedAddressType) or CryptographicInvariantError.
     */
    KeyPair GetKeyPair(const std::string& chainId, uint32_t accountIndex,
                       std::optional<AddressType> type = std::nullopt);

    std::string GetAddress(const std::string& chainId, uint32_t accountIndex,
                           std::optional<AddressType> type = std::nullopt);

    /// WIF export of the account key
    std::string ExportWIF(const std::string& chainId, uint32_t accountIndex,
                          std::optional<AddressType> type = std::nullopt);

    /// "chainId:account:type address" for every cached key, public data only
    std::vector<std::string> ExportPublicState() const;

    // ========================================================================
    // Signing
    // ========================================================================

    /// Build and sign with the account key
    SignedTransaction SignTransaction(const std::string& chainId, uint32_t accountIndex,
                                      const std::vector<TransactionInput>& inputs,
                                      const std::vector<TransactionOutput>& outputs,
                                      std::optional<AddressType> type = std::nullopt);

    /**
     * Select UTXOs for amount plus fee, send amount to recipient and any
     * change above dust back to changeAddress (the account address if
     * empty).
     */
    SignedTransaction Send(const std::string& chainId, uint32_t accountIndex,
                           const std::vector<UTXO>& utxos,
                           const std::string& recipient, Amount amount, FeeRate feeRate,
                           std::optional<AddressType> type = std::nullopt,
                           const std::string& changeAddress = "");

    /// Spend every confirmed UTXO to recipient
    SignedTransaction Sweep(const std::string& chainId, uint32_t accountIndex,
                            const std::vector<UTXO>& utxos,
                            const std::string& recipient, FeeRate feeRate,
                            std::optional<AddressType> type = std::nullopt);

private:
    struct CachedKey {
        KeyPair keys;
        std::string address;
        DerivationPath path;
    };

    const KeyringContext& context_;
    SecureBytes seed_;
    bool unlocked_{false};
    std::map<std::string, CachedKey> cache_;
    mutable std::mutex mutex_;

    AddressType ResolveType(const ChainParams& params, std::optional<AddressType> type) const;
    const CachedKey& GetOrDerive(const ChainParams& params, uint32_t accountIndex, AddressType type);
    void ClearCache();
};

} // namespace wallet
} // namespace satchel

#endif // SATCHEL_WALLET_KEYRING_H
