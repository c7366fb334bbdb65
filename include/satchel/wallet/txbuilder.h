// Satchel - Transaction Builder
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Builds and signs single-key spends (P2PKH, P2SH-P2WPKH, P2WPKH) for any
// registered chain. Signing goes through ISigner so a remote or hardware
// signer can stand in for the in-memory key.

#ifndef SATCHEL_WALLET_TXBUILDER_H
#define SATCHEL_WALLET_TXBUILDER_H

#include <satchel/core/transaction.h>
#include <satchel/crypto/keys.h>
#include <satchel/script/sighash.h>
#include <satchel/wallet/chainparams.h>

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace satchel {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

constexpr uint32_t TX_VERSION = 2;
constexpr uint32_t TX_LOCKTIME = 0;

/// nLockTime-enabled, not replaceable
constexpr uint32_t TX_SEQUENCE = TxIn::MAX_SEQUENCE_NONFINAL;

// ============================================================================
// Wallet-facing data types
// ============================================================================

/// An unspent output as reported by a chain backend
struct UTXO {
    std::string txid;   // Display-order hex
    uint32_t vout{0};
    Amount value{0};
    bool confirmed{false};
};

/// An input to spend. scriptPubKey, when present, selects the sighash
/// scheme; otherwise the builder's address type decides.
struct TransactionInput {
    std::string txid;   // Display-order hex
    uint32_t vout{0};
    Amount value{0};
    std::optional<Script> scriptPubKey;

    TransactionInput() = default;
    TransactionInput(std::string id, uint32_t n, Amount v)
        : txid(std::move(id)), vout(n), value(v) {}

    static TransactionInput FromUTXO(const UTXO& utxo) {
        return TransactionInput(utxo.txid, utxo.vout, utxo.value);
    }
};

struct TransactionOutput {
    std::string address;
    Amount value{0};
};

/// Result of a successful build
struct SignedTransaction {
    std::string txHex;
    std::string txid;   // Display-order hex
    size_t size{0};     // Full serialized size
    size_t vsize{0};    // ceil(weight / 4)
    Amount fee{0};
    bool hasWitness{false};
};

// ============================================================================
// Signer interface
// ============================================================================

/**
 * Produces DER signatures (without hash type byte) over 32-byte sighashes.
 *
 * Sign() may complete asynchronously; errors are delivered through the
 * future.
 */
class ISigner {
public:
    virtual ~ISigner() = default;

    virtual const PublicKey& GetPublicKey() const = 0;
    virtual std::future<std::vector<uint8_t>> Sign(const Hash256& sighash) = 0;
};

/// Signs with an in-memory key pair
class LocalSigner : public ISigner {
public:
    explicit LocalSigner(KeyPair keys) : keys_(std::move(keys)) {}
    ~LocalSigner() override { keys_.Clear(); }

    LocalSigner(const LocalSigner&) = delete;
    LocalSigner& operator=(const LocalSigner&) = delete;

    const PublicKey& GetPublicKey() const override { return keys_.GetPublicKey(); }
    std::future<std::vector<uint8_t>> Sign(const Hash256& sighash) override;

private:
    KeyPair keys_;
};

// ============================================================================
// TransactionBuilder
// ============================================================================

/**
 * One-shot builder: collect inputs and outputs, then Build() computes every
 * sighash, requests all signatures, serializes and reports txid, size,
 * vsize and fee.
 *
 * A rejected input or output set leaves the builder in CollectIO with its
 * transaction untouched, so the caller may correct it and build again. Once
 * signing starts the builder cannot be reused; another Build() throws
 * std::logic_error. The chain parameters are copied.
 */
class TransactionBuilder {
public:
    enum class State {
        CollectIO,
        ComputeSighashes,
        Sign,
        Serialize,
        ComputeTxIdAndSize,
        Done,
    };

    TransactionBuilder(const ChainParams& params, AddressType type);

    TransactionBuilder& AddInput(const TransactionInput& input);
    TransactionBuilder& AddInputs(const std::vector<TransactionInput>& inputs);
    TransactionBuilder& AddOutput(const TransactionOutput& output);
    TransactionBuilder& AddOutputs(const std::vector<TransactionOutput>& outputs);

    /**
     * Build and sign.
     *
     * Throws ValidationError (EmptyIO, InvalidTxid, InvalidAddress,
     * UnsupportedAddressType), InsufficientFundsError when outputs exceed
     * inputs, and CryptographicInvariantError (SigningFailed) when the
     * signer fails.
     */
    SignedTransaction Build(ISigner& signer);

    State GetState() const { return state_; }

    /// The transaction as of the last completed step
    const MutableTransaction& GetTransaction() const { return tx_; }

private:
    /// Sighash scheme of one input
    enum class InputKind { Legacy, NestedSegwit, NativeSegwit };

    InputKind KindOf(const TransactionInput& input) const;
    void CollectIO(const PublicKey& pubkey);
    std::vector<Hash256> ComputeSighashes(const PublicKey& pubkey);
    std::vector<std::vector<uint8_t>> SignAll(ISigner& signer,
                                              const std::vector<Hash256>& sighashes);
    void ApplySignatures(const PublicKey& pubkey,
                         const std::vector<std::vector<uint8_t>>& signatures);

    ChainParams params_;
    AddressType type_;
    std::vector<TransactionInput> inputs_;
    std::vector<TransactionOutput> outputs_;
    std::vector<InputKind> kinds_;
    MutableTransaction tx_;
    State state_{State::CollectIO};
};

/**
 * Check every input's signature against its recomputed sighash.
 *
 * Supports the three single-key spend forms; no script interpreter is run.
 * amounts[i] is the value of input i (needed by BIP143).
 */
bool VerifyInputSignatures(const MutableTransaction& tx,
                           const std::vector<Amount>& amounts);

const char* TxBuilderStateToString(TransactionBuilder::State state);

} // namespace wallet
} // namespace satchel

#endif // SATCHEL_WALLET_TXBUILDER_H
