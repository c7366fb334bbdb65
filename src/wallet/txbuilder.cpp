// Satchel - Transaction Builder Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <satchel/wallet/txbuilder.h>
#include <satchel/wallet/address.h>
#include <satchel/wallet/errors.h>
#include <satchel/core/hex.h>
#include <satchel/crypto/ripemd160.h>
#include <satchel/crypto/secp256k1.h>
#include <satchel/util/logging.h>

#include <limits>
#include <stdexcept>

namespace satchel {
namespace wallet {

namespace {

Amount CheckedSum(Amount a, Amount b, const char* what) {
    if (b > std::numeric_limits<Amount>::max() - a) {
        throw ValidationError(ErrorCode::InvalidAmount, std::string(what) + " overflows");
    }
    return a + b;
}

TxHash ParseTxid(const std::string& txid) {
    if (txid.size() != 64 || !IsValidHex(txid)) {
        throw ValidationError(ErrorCode::InvalidTxid, "malformed txid '" + txid + "'");
    }
    return TxHash::FromHex(txid);
}

/// True if the DER body is canonical and low-S
bool IsCanonicalSignature(const std::vector<uint8_t>& der) {
    uint8_t r[32];
    uint8_t s[32];
    return secp256k1::DecodeDER(der, r, s) && secp256k1::IsLowS(s);
}

} // namespace

// ============================================================================
// LocalSigner
// ============================================================================

std::future<std::vector<uint8_t>> LocalSigner::Sign(const Hash256& sighash) {
    std::promise<std::vector<uint8_t>> promise;
    try {
        promise.set_value(keys_.Sign(sighash));
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

// ============================================================================
// TransactionBuilder
// ============================================================================

const char* TxBuilderStateToString(TransactionBuilder::State state) {
    switch (state) {
        case TransactionBuilder::State::CollectIO:          return "collect-io";
        case TransactionBuilder::State::ComputeSighashes:   return "compute-sighashes";
        case TransactionBuilder::State::Sign:               return "sign";
        case TransactionBuilder::State::Serialize:          return "serialize";
        case TransactionBuilder::State::ComputeTxIdAndSize: return "compute-txid";
        case TransactionBuilder::State::Done:               return "done";
    }
    return "unknown";
}

TransactionBuilder::TransactionBuilder(const ChainParams& params, AddressType type)
    : params_(params), type_(type) {
    tx_.version = TX_VERSION;
    tx_.nLockTime = TX_LOCKTIME;
}

TransactionBuilder& TransactionBuilder::AddInput(const TransactionInput& input) {
    if (state_ != State::CollectIO) {
        throw std::logic_error("TransactionBuilder: inputs are frozen");
    }
    inputs_.push_back(input);
    return *this;
}

TransactionBuilder& TransactionBuilder::AddInputs(const std::vector<TransactionInput>& inputs) {
    for (const auto& in : inputs) {
        AddInput(in);
    }
    return *this;
}

TransactionBuilder& TransactionBuilder::AddOutput(const TransactionOutput& output) {
    if (state_ != State::CollectIO) {
        throw std::logic_error("TransactionBuilder: outputs are frozen");
    }
    outputs_.push_back(output);
    return *this;
}

TransactionBuilder& TransactionBuilder::AddOutputs(const std::vector<TransactionOutput>& outputs) {
    for (const auto& out : outputs) {
        AddOutput(out);
    }
    return *this;
}

TransactionBuilder::InputKind TransactionBuilder::KindOf(const TransactionInput& input) const {
    if (input.scriptPubKey) {
        switch (input.scriptPubKey->GetType()) {
            case ScriptType::P2PKH:  return InputKind::Legacy;
            case ScriptType::P2SH:   return InputKind::NestedSegwit;
            case ScriptType::P2WPKH: return InputKind::NativeSegwit;
            default:
                throw ValidationError(ErrorCode::UnsupportedAddressType,
                    "cannot spend " + std::string(ScriptTypeToString(input.scriptPubKey->GetType())) +
                    " output " + input.txid + ":" + std::to_string(input.vout));
        }
    }
    switch (type_) {
        case AddressType::P2PKH:       return InputKind::Legacy;
        case AddressType::P2SH_P2WPKH: return InputKind::NestedSegwit;
        case AddressType::P2WPKH:      return InputKind::NativeSegwit;
    }
    return InputKind::Legacy;
}

void TransactionBuilder::CollectIO(const PublicKey& pubkey) {
    if (inputs_.empty() || outputs_.empty()) {
        throw ValidationError(ErrorCode::EmptyIO, "transaction needs at least one input and one output");
    }
    if (!params_.SupportsAddressType(type_)) {
        throw ValidationError(ErrorCode::UnsupportedAddressType,
            std::string(AddressTypeToString(type_)) + " is not available on " + params_.id);
    }

    const Hash160 pkh = pubkey.GetHash160();
    const Hash160 redeemHash = ComputeHash160(Script::CreateP2WPKHRedeemScript(pkh));

    // Staged locally so a rejected transaction leaves the builder untouched
    std::vector<InputKind> kinds;
    std::vector<TxIn> vin;
    std::vector<TxOut> vout;
    kinds.reserve(inputs_.size());
    vin.reserve(inputs_.size());
    vout.reserve(outputs_.size());

    Amount totalIn = 0;
    for (const auto& input : inputs_) {
        InputKind kind = KindOf(input);
        if (kind != InputKind::Legacy && !params_.SupportsSegWit()) {
            throw ValidationError(ErrorCode::UnsupportedAddressType,
                "segwit input on " + params_.id);
        }
        if (input.scriptPubKey) {
            Hash160 owner;
            input.scriptPubKey->ExtractHash160(owner);
            const Hash160& expected = (kind == InputKind::NestedSegwit) ? redeemHash : pkh;
            if (owner != expected) {
                throw ValidationError(ErrorCode::UnsupportedAddressType,
                    "input " + input.txid + ":" + std::to_string(input.vout) +
                    " is not locked to the signing key");
            }
        }
        kinds.push_back(kind);
        vin.emplace_back(OutPoint(ParseTxid(input.txid), input.vout), Script(), TX_SEQUENCE);
        totalIn = CheckedSum(totalIn, input.value, "input total");
    }

    Amount totalOut = 0;
    for (const auto& output : outputs_) {
        if (output.value == 0) {
            throw ValidationError(ErrorCode::InvalidAmount, "zero-value output to " + output.address);
        }
        vout.emplace_back(output.value, ScriptPubKeyForAddress(output.address, params_));
        totalOut = CheckedSum(totalOut, output.value, "output total");
    }

    if (totalOut > totalIn) {
        throw InsufficientFundsError(ErrorCode::InsufficientFunds,
            "outputs exceed inputs", totalOut, totalIn);
    }

    kinds_ = std::move(kinds);
    tx_.vin = std::move(vin);
    tx_.vout = std::move(vout);
}

std::vector<Hash256> TransactionBuilder::ComputeSighashes(const PublicKey& pubkey) {
    const Hash160 pkh = pubkey.GetHash160();
    const Script legacyCode = Script::CreateP2PKH(pkh);
    const std::vector<uint8_t> segwitCode = Script::P2WPKHScriptCode(pkh);

    std::optional<PrecomputedTransactionData> cache;
    std::vector<Hash256> sighashes;
    sighashes.reserve(tx_.vin.size());

    for (size_t i = 0; i < tx_.vin.size(); ++i) {
        if (kinds_[i] == InputKind::Legacy) {
            sighashes.push_back(LegacySignatureHash(tx_, i, legacyCode));
        } else {
            if (!cache) {
                cache.emplace(tx_);
            }
            sighashes.push_back(SegwitSignatureHash(tx_, i, segwitCode, inputs_[i].value, *cache));
        }
    }
    return sighashes;
}

std::vector<std::vector<uint8_t>> TransactionBuilder::SignAll(ISigner& signer,
                                                              const std::vector<Hash256>& sighashes) {
    std::vector<std::future<std::vector<uint8_t>>> pending;
    pending.reserve(sighashes.size());
    for (const auto& hash : sighashes) {
        pending.push_back(signer.Sign(hash));
    }

    std::vector<std::vector<uint8_t>> signatures;
    signatures.reserve(pending.size());
    for (size_t i = 0; i < pending.size(); ++i) {
        std::vector<uint8_t> der;
        try {
            der = pending[i].get();
        } catch (const std::exception& e) {
            throw CryptographicInvariantError(ErrorCode::SigningFailed,
                "input " + std::to_string(i) + ": " + e.what());
        }
        if (!IsCanonicalSignature(der) ||
            !signer.GetPublicKey().Verify(sighashes[i], der)) {
            throw CryptographicInvariantError(ErrorCode::SigningFailed,
                "input " + std::to_string(i) + ": signer returned an invalid signature");
        }
        der.push_back(SIGHASH_ALL);
        signatures.push_back(std::move(der));
    }
    return signatures;
}

void TransactionBuilder::ApplySignatures(const PublicKey& pubkey,
                                         const std::vector<std::vector<uint8_t>>& signatures) {
    const std::vector<uint8_t> pub = pubkey.ToVector();
    const Hash160 pkh = pubkey.GetHash160();

    for (size_t i = 0; i < tx_.vin.size(); ++i) {
        TxIn& in = tx_.vin[i];
        switch (kinds_[i]) {
            case InputKind::Legacy:
                in.scriptSig = Script::CreateP2PKHScriptSig(signatures[i], pub);
                break;
            case InputKind::NestedSegwit:
                in.scriptSig = Script::CreateP2SH_P2WPKHScriptSig(pkh);
                in.witness = {signatures[i], pub};
                break;
            case InputKind::NativeSegwit:
                in.witness = {signatures[i], pub};
                break;
        }
    }
}

SignedTransaction TransactionBuilder::Build(ISigner& signer) {
    if (state_ != State::CollectIO) {
        throw std::logic_error("TransactionBuilder::Build called twice");
    }
    const PublicKey pubkey = signer.GetPublicKey();

    CollectIO(pubkey);

    state_ = State::ComputeSighashes;
    auto sighashes = ComputeSighashes(pubkey);

    state_ = State::Sign;
    auto signatures = SignAll(signer, sighashes);

    state_ = State::Serialize;
    ApplySignatures(pubkey, signatures);

    SignedTransaction result;
    result.txHex = tx_.ToHex();

    state_ = State::ComputeTxIdAndSize;
    result.txid = tx_.GetHash().ToHex();
    result.size = tx_.GetTotalSize();
    result.vsize = tx_.GetVirtualSize();
    result.hasWitness = tx_.HasWitness();

    Amount totalIn = 0;
    for (const auto& input : inputs_) {
        totalIn += input.value;
    }
    result.fee = totalIn - tx_.GetValueOut();

    state_ = State::Done;

    LOG_INFO(util::LogCategory::TX) << params_.id << " tx " << result.txid
                                    << " inputs=" << tx_.vin.size()
                                    << " outputs=" << tx_.vout.size()
                                    << " vsize=" << result.vsize
                                    << " fee=" << result.fee;
    return result;
}

// ============================================================================
// Signature verification
// ============================================================================

bool VerifyInputSignatures(const MutableTransaction& tx, const std::vector<Amount>& amounts) {
    if (amounts.size() != tx.vin.size()) {
        return false;
    }

    std::optional<PrecomputedTransactionData> cache;
    for (size_t i = 0; i < tx.vin.size(); ++i) {
        const TxIn& in = tx.vin[i];
        std::vector<uint8_t> sig;
        std::vector<uint8_t> pub;
        bool segwit = !in.witness.empty();

        if (segwit) {
            if (in.witness.size() != 2) {
                return false;
            }
            sig = in.witness[0];
            pub = in.witness[1];
        } else {
            auto pc = in.scriptSig.begin();
            Opcode op;
            if (!in.scriptSig.GetOp(pc, op, sig) || !in.scriptSig.GetOp(pc, op, pub) ||
                pc != in.scriptSig.end()) {
                return false;
            }
        }

        if (sig.empty() || sig.back() != SIGHASH_ALL) {
            return false;
        }
        sig.pop_back();

        PublicKey pubkey(pub);
        if (!pubkey.IsValid()) {
            return false;
        }

        Hash256 sighash;
        if (segwit) {
            if (!cache) {
                cache.emplace(tx);
            }
            sighash = SegwitSignatureHash(tx, i, Script::P2WPKHScriptCode(pubkey.GetHash160()),
                                          amounts[i], *cache);
        } else {
            sighash = LegacySignatureHash(tx, i, Script::CreateP2PKH(pubkey.GetHash160()));
        }

        if (!pubkey.Verify(sighash, sig)) {
            LOG_DEBUG(util::LogCategory::TX) << "signature check failed for input " << i;
            return false;
        }
    }
    return true;
}

} // namespace wallet
} // namespace satchel
