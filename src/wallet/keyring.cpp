// Satchel - Keyring Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <satchel/wallet/keyring.h>
#include <satchel/wallet/address.h>
#include <satchel/wallet/errors.h>
#include <satchel/util/logging.h>

namespace satchel {
namespace wallet {

namespace {

std::string CacheKey(const std::string& chainId, uint32_t accountIndex, AddressType type) {
    return chainId + ":" + std::to_string(accountIndex) + ":" + AddressTypeToString(type);
}

} // namespace

Keyring::Keyring(const KeyringContext& context)
    : context_(context) {}

Keyring::~Keyring() {
    Lock();
}

// ============================================================================
// Session
// ============================================================================

void Keyring::Unlock(const std::string& mnemonic) {
    if (!context_.validator || !context_.validator(mnemonic)) {
        throw ValidationError(ErrorCode::InvalidMnemonic, "mnemonic rejected by validator");
    }

    SecureBytes seed = Mnemonic::ToSeed(mnemonic);

    std::lock_guard<std::mutex> lock(mutex_);
    ClearCache();
    seed_ = std::move(seed);
    unlocked_ = true;
    LOG_INFO(util::LogCategory::WALLET) << "Keyring unlocked";
}

bool Keyring::IsUnlocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unlocked_;
}

void Keyring::Lock() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!unlocked_ && cache_.empty()) {
        return;
    }
    ClearCache();
    seed_.Clear();
    unlocked_ = false;
    LOG_INFO(util::LogCategory::WALLET) << "Keyring locked";
}

void Keyring::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ClearCache();
}

size_t Keyring::CachedKeyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void Keyring::ClearCache() {
    for (auto& [id, entry] : cache_) {
        entry.keys.Clear();
    }
    cache_.clear();
}

// ============================================================================
// Keys and addresses
// ============================================================================

AddressType Keyring::ResolveType(const ChainParams& params,
                                 std::optional<AddressType> type) const {
    AddressType resolved = type.value_or(params.defaultAddressType);
    if (!params.SupportsAddressType(resolved)) {
        throw ValidationError(ErrorCode::UnsupportedAddressType,
            std::string(AddressTypeToString(resolved)) + " is not available on " + params.id);
    }
    return resolved;
}

const Keyring::CachedKey& Keyring::GetOrDerive(const ChainParams& params,
                                               uint32_t accountIndex, AddressType type) {
    if (!unlocked_) {
        throw ValidationError(ErrorCode::Locked, "keyring is locked");
    }

    const std::string id = CacheKey(params.id, accountIndex, type);
    auto it = cache_.find(id);
    if (it != cache_.end()) {
        return it->second;
    }

    DerivationPath path = DerivationPath::ForAccount(type, params.coinType, accountIndex);

    ExtendedKey master = ExtendedKey::FromSeed(seed_);
    ExtendedKey child = master.DerivePath(path, context_.policy.derivation);
    master.Clear();

    CachedKey entry{KeyPair(child.GetPrivateKey()), "", path};
    child.Clear();
    entry.address = EncodeAddress(entry.keys.GetPublicKey(), type, params);

    LOG_DEBUG(util::LogCategory::KEYS) << id << " " << path.ToString() << " -> " << entry.address;

    auto inserted = cache_.emplace(id, std::move(entry));
    return inserted.first->second;
}

DerivationPath Keyring::GetPath(const std::string& chainId, uint32_t accountIndex,
                                std::optional<AddressType> type) const {
    const ChainParams& params = context_.chains.Get(chainId);
    return DerivationPath::ForAccount(ResolveType(params, type), params.coinType, accountIndex);
}

KeyPair Keyring::GetKeyPair(const std::string& chainId, uint32_t accountIndex,
                            std::optional<AddressType> type) {
    const ChainParams& params = context_.chains.Get(chainId);
    AddressType resolved = ResolveType(params, type);

    std::lock_guard<std::mutex> lock(mutex_);
    return GetOrDerive(params, accountIndex, resolved).keys;
}

std::string Keyring::GetAddress(const std::string& chainId, uint32_t accountIndex,
                                std::optional<AddressType> type) {
    const ChainParams& params = context_.chains.Get(chainId);
    AddressType resolved = ResolveType(params, type);

    std::lock_guard<std::mutex> lock(mutex_);
    return GetOrDerive(params, accountIndex, resolved).address;
}

std::string Keyring::ExportWIF(const std::string& chainId, uint32_t accountIndex,
                               std::optional<AddressType> type) {
    const ChainParams& params = context_.chains.Get(chainId);
    AddressType resolved = ResolveType(params, type);

    std::lock_guard<std::mutex> lock(mutex_);
    return EncodeWIF(GetOrDerive(params, accountIndex, resolved).keys.GetPrivateKey(), params);
}

std::vector<std::string> Keyring::ExportPublicState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> lines;
    lines.reserve(cache_.size());
    for (const auto& [id, entry] : cache_) {
        lines.push_back(id + " " + entry.address);
    }
    return lines;
}

// ============================================================================
// Signing
// ============================================================================

SignedTransaction Keyring::SignTransaction(const std::string& chainId, uint32_t accountIndex,
                                           const std::vector<TransactionInput>& inputs,
                                           const std::vector<TransactionOutput>& outputs,
                                           std::optional<AddressType> type) {
    const ChainParams& params = context_.chains.Get(chainId);
    AddressType resolved = ResolveType(params, type);

    LocalSigner signer(GetKeyPair(chainId, accountIndex, resolved));
    TransactionBuilder builder(params, resolved);
    builder.AddInputs(inputs).AddOutputs(outputs);
    return builder.Build(signer);
}

SignedTransaction Keyring::Send(const std::string& chainId, uint32_t accountIndex,
                                const std::vector<UTXO>& utxos,
                                const std::string& recipient, Amount amount, FeeRate feeRate,
                                std::optional<AddressType> type,
                                const std::string& changeAddress) {
    const ChainParams& params = context_.chains.Get(chainId);
    AddressType resolved = ResolveType(params, type);

    // Resolve the recipient before spending effort on selection
    ScriptPubKeyForAddress(recipient, params);

    UTXOSelector selector(context_.policy.selection);
    SelectionResult selection = selector.Select(utxos, amount, feeRate, resolved);

    std::vector<TransactionOutput> outputs{{recipient, amount}};
    if (selection.hasChange) {
        std::string change = changeAddress.empty()
                                 ? GetAddress(chainId, accountIndex, resolved)
                                 : changeAddress;
        outputs.push_back({change, selection.change});
    }

    LogInfoF(util::LogCategory::WALLET, "%s send %llu with %zu inputs, fee %llu",
             chainId.c_str(), static_cast<unsigned long long>(amount),
             selection.selected.size(), static_cast<unsigned long long>(selection.fee));
    return SignTransaction(chainId, accountIndex, selection.ToInputs(), outputs, resolved);
}

SignedTransaction Keyring::Sweep(const std::string& chainId, uint32_t accountIndex,
                                 const std::vector<UTXO>& utxos,
                                 const std::string& recipient, FeeRate feeRate,
                                 std::optional<AddressType> type) {
    const ChainParams& params = context_.chains.Get(chainId);
    AddressType resolved = ResolveType(params, type);

    ScriptPubKeyForAddress(recipient, params);

    UTXOSelector selector(context_.policy.selection);
    SweepResult sweep = selector.Sweep(utxos, feeRate, resolved);

    LogInfoF(util::LogCategory::WALLET, "%s sweep %zu inputs, amount %llu, fee %llu",
             chainId.c_str(), sweep.selected.size(),
             static_cast<unsigned long long>(sweep.amount),
             static_cast<unsigned long long>(sweep.fee));
    return SignTransaction(chainId, accountIndex, sweep.ToInputs(),
                           {{recipient, sweep.amount}}, resolved);
}

} // namespace wallet
} // namespace satchel
