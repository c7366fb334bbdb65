// Satchel - Keyring Tests
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <gtest/gtest.h>

#include <satchel/wallet/keyring.h>
#include <satchel/wallet/address.h>
#include <satchel/wallet/errors.h>
#include <satchel/core/hex.h>
#include <satchel/util/logging.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace satchel {
namespace wallet {
namespace test {

const char* TEST_MNEMONIC =
    "abandon abandon abandon abandon abandon abandon "
    "abandon abandon abandon abandon abandon about";

const char* BTC = "bitcoin-mainnet";

class KeyringTest : public ::testing::Test {
protected:
    void SetUp() override {
        keyring_ = std::make_unique<Keyring>(context_);
    }

    void Unlock() { keyring_->Unlock(TEST_MNEMONIC); }

    template <typename Fn>
    ErrorCode CodeOf(Fn&& fn) {
        try {
            fn();
        } catch (const WalletError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected WalletError";
        return ErrorCode::InvalidConfig;
    }

    KeyringContext context_;
    std::unique_ptr<Keyring> keyring_;
};

// ============================================================================
// Session
// ============================================================================

TEST_F(KeyringTest, LockedKeyringRefusesKeys) {
    EXPECT_FALSE(keyring_->IsUnlocked());
    EXPECT_EQ(CodeOf([&] { keyring_->GetAddress(BTC, 0); }), ErrorCode::Locked);
    EXPECT_EQ(CodeOf([&] { keyring_->GetKeyPair(BTC, 0); }), ErrorCode::Locked);
    EXPECT_EQ(CodeOf([&] { keyring_->ExportWIF(BTC, 0); }), ErrorCode::Locked);
}

TEST_F(KeyringTest, RejectedMnemonic) {
    EXPECT_EQ(CodeOf([&] { keyring_->Unlock("hello world"); }), ErrorCode::InvalidMnemonic);
    EXPECT_FALSE(keyring_->IsUnlocked());
}

TEST_F(KeyringTest, ValidatorIsInjected) {
    std::vector<std::string> seen;
    context_.validator = [&](const std::string& m) { seen.push_back(m); return false; };
    EXPECT_EQ(CodeOf([&] { keyring_->Unlock(TEST_MNEMONIC); }), ErrorCode::InvalidMnemonic);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], TEST_MNEMONIC);

    context_.validator = [](const std::string&) { return true; };
    EXPECT_NO_THROW(keyring_->Unlock("any phrase the wallet accepts"));
    EXPECT_TRUE(keyring_->IsUnlocked());
}

TEST_F(KeyringTest, LockWipesCache) {
    Unlock();
    keyring_->GetAddress(BTC, 0);
    keyring_->GetAddress(BTC, 1);
    EXPECT_EQ(keyring_->CachedKeyCount(), 2u);

    keyring_->Lock();
    EXPECT_FALSE(keyring_->IsUnlocked());
    EXPECT_EQ(keyring_->CachedKeyCount(), 0u);
    EXPECT_EQ(CodeOf([&] { keyring_->GetAddress(BTC, 0); }), ErrorCode::Locked);
}

TEST_F(KeyringTest, ClearKeepsSession) {
    Unlock();
    std::string before = keyring_->GetAddress(BTC, 0);
    keyring_->Clear();
    EXPECT_EQ(keyring_->CachedKeyCount(), 0u);
    EXPECT_TRUE(keyring_->IsUnlocked());
    EXPECT_EQ(keyring_->GetAddress(BTC, 0), before);
}

TEST_F(KeyringTest, UnlockReplacesSession) {
    Unlock();
    keyring_->GetAddress(BTC, 0);
    Unlock();
    EXPECT_EQ(keyring_->CachedKeyCount(), 0u);
}

// ============================================================================
// Addresses
// ============================================================================

TEST_F(KeyringTest, DefaultTypeAddresses) {
    Unlock();
    EXPECT_EQ(keyring_->GetAddress(BTC, 0), "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
    EXPECT_EQ(keyring_->GetAddress(BTC, 1), "bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g");
    EXPECT_EQ(keyring_->GetAddress("litecoin-mainnet", 0),
              "ltc1qjmxnz78nmc8nq77wuxh25n2es7rzm5c2rkk4wh");
    EXPECT_EQ(keyring_->GetAddress("bitcoin-testnet", 0),
              "tb1q6rz28mcfaxtmd6v789l9rrlrusdprr9pqcpvkl");
    EXPECT_EQ(keyring_->GetAddress("dogecoin-mainnet", 0), "DBus3bamQjgJULBJtYXpEzDWQRwF5iwxgC");
    EXPECT_EQ(keyring_->GetAddress("zcash-mainnet", 0), "t1XVXWCvpMgBvUaed4XDqWtgQgJSu1Ghz7F");
}

TEST_F(KeyringTest, ExplicitTypes) {
    Unlock();
    EXPECT_EQ(keyring_->GetAddress(BTC, 0, AddressType::P2PKH),
              "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA");
    EXPECT_EQ(keyring_->GetAddress(BTC, 0, AddressType::P2SH_P2WPKH),
              "37VucYSaXLCAsxYyAPfbSi9eh4iEcbShgf");
    EXPECT_EQ(keyring_->GetPath(BTC, 0, AddressType::P2SH_P2WPKH).ToString(), "m/49'/0'/0'/0/0");
    EXPECT_EQ(keyring_->GetPath("dogecoin-mainnet", 4).ToString(), "m/44'/3'/0'/0/4");
}

TEST_F(KeyringTest, UnknownChainAndUnsupportedType) {
    Unlock();
    EXPECT_EQ(CodeOf([&] { keyring_->GetAddress("nocoin-mainnet", 0); }), ErrorCode::UnknownChain);
    EXPECT_EQ(CodeOf([&] { keyring_->GetAddress("dogecoin-mainnet", 0, AddressType::P2WPKH); }),
              ErrorCode::UnsupportedAddressType);
    EXPECT_EQ(CodeOf([&] { keyring_->GetPath("ravencoin-mainnet", 0, AddressType::P2SH_P2WPKH); }),
              ErrorCode::UnsupportedAddressType);
}

TEST_F(KeyringTest, CacheIsPerChainAccountAndType) {
    Unlock();
    keyring_->GetAddress(BTC, 0);
    keyring_->GetAddress(BTC, 0);
    EXPECT_EQ(keyring_->CachedKeyCount(), 1u);
    keyring_->GetAddress(BTC, 0, AddressType::P2PKH);
    keyring_->GetAddress("litecoin-mainnet", 0);
    EXPECT_EQ(keyring_->CachedKeyCount(), 3u);
}

TEST_F(KeyringTest, KeyPairMatchesAddress) {
    Unlock();
    KeyPair keys = keyring_->GetKeyPair(BTC, 0);
    EXPECT_EQ(keys.GetPublicKey().ToHex(),
              "0330d54fd0dd420a6e5f8d3624f5f3482cae350f79d5f0753bf5beef9c2d91af3c");

    const ChainParams& btc = context_.chains.Get(BTC);
    auto decoded = DecodeWIF(keyring_->ExportWIF(BTC, 0), btc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->GetPublicKey(), keys.GetPublicKey());
}

TEST_F(KeyringTest, ExportPublicStateHasNoSecrets) {
    Unlock();
    keyring_->GetAddress(BTC, 1);
    keyring_->GetAddress(BTC, 0);
    std::string wif = keyring_->ExportWIF(BTC, 0);

    auto lines = keyring_->ExportPublicState();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "bitcoin-mainnet:0:p2wpkh bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
    EXPECT_EQ(lines[1], "bitcoin-mainnet:1:p2wpkh bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g");
    for (const auto& line : lines) {
        EXPECT_EQ(line.find(wif), std::string::npos);
    }
}

TEST_F(KeyringTest, RetryPolicyGivesSameKeys) {
    context_.policy.derivation = DerivationPolicy::RetryNextIndex;
    Unlock();
    EXPECT_EQ(keyring_->GetAddress(BTC, 0), "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
}

TEST_F(KeyringTest, ConcurrentDerivationIsConsistent) {
    Unlock();
    std::vector<std::string> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] { results[i] = keyring_->GetAddress(BTC, i % 2); });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i], i % 2 == 0 ? "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu"
                                         : "bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g");
    }
    EXPECT_EQ(keyring_->CachedKeyCount(), 2u);
}

// ============================================================================
// Signing
// ============================================================================

std::vector<UTXO> Funding() {
    UTXO a;
    a.txid = std::string(64, 'a');
    a.vout = 0;
    a.value = 30000;
    a.confirmed = true;
    UTXO b;
    b.txid = std::string(64, 'b');
    b.vout = 1;
    b.value = 80000;
    b.confirmed = true;
    UTXO pending;
    pending.txid = std::string(64, 'c');
    pending.value = 500000;
    pending.confirmed = false;
    return {a, b, pending};
}

TEST_F(KeyringTest, SendWithChange) {
    Unlock();
    const std::string recipient = "bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g";
    SignedTransaction tx = keyring_->Send(BTC, 0, Funding(), recipient, 50000, 1.0);

    EXPECT_EQ(tx.fee, 141u);
    EXPECT_TRUE(tx.hasWitness);

    auto parsed = MutableTransaction::Deserialize(HexToBytes(tx.txHex));
    ASSERT_EQ(parsed.vin.size(), 1u);
    EXPECT_EQ(parsed.vin[0].prevout.hash.ToHex(), std::string(64, 'b'));
    ASSERT_EQ(parsed.vout.size(), 2u);

    const ChainParams& btc = context_.chains.Get(BTC);
    EXPECT_EQ(parsed.vout[0].nValue, 50000u);
    EXPECT_EQ(parsed.vout[0].scriptPubKey, ScriptPubKeyForAddress(recipient, btc));
    EXPECT_EQ(parsed.vout[1].nValue, 80000u - 50000 - 141);
    EXPECT_EQ(parsed.vout[1].scriptPubKey,
              ScriptPubKeyForAddress(keyring_->GetAddress(BTC, 0), btc));
    EXPECT_TRUE(VerifyInputSignatures(parsed, {80000}));
}

TEST_F(KeyringTest, SendToExplicitChangeAddress) {
    Unlock();
    const std::string change = "bc1q8c6fshw2dlwun7ekn9qwf37cu2rn755upcp6el";
    SignedTransaction tx = keyring_->Send(BTC, 0, Funding(), "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA",
                                          50000, 1.0, std::nullopt, change);
    auto parsed = MutableTransaction::Deserialize(HexToBytes(tx.txHex));
    ASSERT_EQ(parsed.vout.size(), 2u);
    EXPECT_EQ(parsed.vout[1].scriptPubKey,
              ScriptPubKeyForAddress(change, context_.chains.Get(BTC)));
}

TEST_F(KeyringTest, LegacySendOnDogecoin) {
    Unlock();
    const std::string self = keyring_->GetAddress("dogecoin-mainnet", 0);
    SignedTransaction tx = keyring_->Send("dogecoin-mainnet", 0, Funding(), self, 100000, 1.0);

    EXPECT_FALSE(tx.hasWitness);
    auto parsed = MutableTransaction::Deserialize(HexToBytes(tx.txHex));
    EXPECT_EQ(parsed.vin.size(), 2u);
    EXPECT_TRUE(VerifyInputSignatures(parsed, {80000, 30000}));
}

TEST_F(KeyringTest, SendValidatesRecipientFirst) {
    Unlock();
    EXPECT_EQ(CodeOf([&] { keyring_->Send(BTC, 0, {}, "1nvalid", 1000, 1.0); }),
              ErrorCode::InvalidAddress);
    EXPECT_EQ(CodeOf([&] {
                  keyring_->Send(BTC, 0, Funding(), "bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g",
                                 1000000, 1.0);
              }),
              ErrorCode::InsufficientFunds);
}

TEST_F(KeyringTest, SweepSpendsAllConfirmed) {
    Unlock();
    const std::string recipient = "bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g";
    SignedTransaction tx = keyring_->Sweep(BTC, 0, Funding(), recipient, 2.0);

    const Amount fee = EstimateFee(AddressType::P2WPKH, 2, 1, 2.0);
    EXPECT_EQ(tx.fee, fee);

    auto parsed = MutableTransaction::Deserialize(HexToBytes(tx.txHex));
    ASSERT_EQ(parsed.vin.size(), 2u);
    ASSERT_EQ(parsed.vout.size(), 1u);
    EXPECT_EQ(parsed.vout[0].nValue, 110000u - fee);
    EXPECT_TRUE(VerifyInputSignatures(parsed, {80000, 30000}));
}

TEST_F(KeyringTest, SweepHonoursPolicyRatio) {
    context_.policy.selection.maxSweepFeeRatio = 0.001;
    Unlock();
    EXPECT_EQ(CodeOf([&] {
                  keyring_->Sweep(BTC, 0, Funding(), "bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g", 2.0);
              }),
              ErrorCode::FeeRatioExceeded);
}

TEST_F(KeyringTest, SignTransactionDirectly) {
    Unlock();
    SignedTransaction tx = keyring_->SignTransaction(
        BTC, 0, {TransactionInput(std::string(64, 'd'), 0, 10000)},
        {{"bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g", 9000}});
    EXPECT_EQ(tx.fee, 1000u);
    auto parsed = MutableTransaction::Deserialize(HexToBytes(tx.txHex));
    EXPECT_TRUE(VerifyInputSignatures(parsed, {10000}));
}

TEST_F(KeyringTest, SecretsNeverReachTheLog) {
    std::vector<std::string> messages;
    auto sink = std::make_shared<util::CallbackSink>(
        [&](const util::LogEntry& e) { messages.push_back(e.message); }, util::LogLevel::Trace);
    util::Logger::Instance().SetLevel(util::LogLevel::Trace);
    util::Logger::Instance().AddSink(sink);

    Unlock();
    keyring_->GetAddress(BTC, 0);
    std::string wif = keyring_->ExportWIF(BTC, 0);
    keyring_->Send(BTC, 0, Funding(), "bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g", 50000, 1.0);
    keyring_->Lock();

    util::Logger::Instance().RemoveSink(sink);
    util::Logger::Instance().SetLevel(util::LogLevel::Info);

    const std::string privHex = "4604b4b710fe91f584fff084e1a9159fe4f8408fff380596a604948474ce4fa3";
    EXPECT_FALSE(messages.empty());
    for (const auto& m : messages) {
        EXPECT_EQ(m.find("abandon"), std::string::npos) << m;
        EXPECT_EQ(m.find(wif), std::string::npos) << m;
        EXPECT_EQ(m.find(privHex), std::string::npos) << m;
    }
}

} // namespace test
} // namespace wallet
} // namespace satchel
