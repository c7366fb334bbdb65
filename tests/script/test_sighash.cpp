// Satchel - Signature Hash Tests
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <gtest/gtest.h>
#include "satchel/script/sighash.h"
#include "satchel/core/hex.h"
#include "satchel/core/transaction.h"

#include <string>

using namespace satchel;

namespace {

Hash160 HashFromHex(const std::string& hex) {
    auto bytes = HexToBytes(hex);
    return Hash160(bytes.data(), bytes.size());
}

MutableTransaction FromHex(const std::string& hex) {
    return MutableTransaction::Deserialize(HexToBytes(hex));
}

} // namespace

// ============================================================================
// BIP143 examples
// ============================================================================

class SegwitSighashTest : public ::testing::Test {
protected:
    // Native P2WPKH example, input 1 spends 6 BTC
    const std::string nativeTx_ =
        "0100000002fff7f7881a8099afa6940d42d1e7f6362bec38171ea3edf433541db4e4ad969f"
        "0000000000eeffffffef51e1b804cc89d182d279655c3aa89e815b1b309fe287d9b2b55d57"
        "b90ec68a0100000000ffffffff02202cb206000000001976a9148280b37df378db99f66f85"
        "c95a783a76ac7a6d5988ac9093510d000000001976a9143bde42dbee7e4dbe6a21b2d50ce2"
        "f0167faa815988ac11000000";

    // P2SH-P2WPKH example, spends 10 BTC
    const std::string nestedTx_ =
        "0100000001db6b1b20aa0fd7b23880be2ecbd4a98130974cf4748fb66092ac4d3ceb1a5477"
        "0100000000feffffff02b8b4eb0b000000001976a914a457b684d7f0d539a46a45bbc043f3"
        "5b59d0d96388ac0008af2f000000001976a914fd270b1ee6abcaea97fea7ad0402e8bd8ad6"
        "d77c88ac92040000";
};

TEST_F(SegwitSighashTest, NativeP2WPKH) {
    MutableTransaction tx = FromHex(nativeTx_);
    PrecomputedTransactionData cache(tx);

    EXPECT_EQ(cache.hashPrevouts.GetHex(),
              "96b827c8483d4e9b96712b6713a7b68d6e8003a781feba36c31143470b4efd37");
    EXPECT_EQ(cache.hashSequence.GetHex(),
              "52b0a642eea2fb7ae638c36f6252b6750293dbe574a806984b8e4d8548339a3b");
    EXPECT_EQ(cache.hashOutputs.GetHex(),
              "863ef3e1a92afbfdb97f31ad0fc7683ee943e9abcf2501590ff8f6551f47e5e5");

    auto scriptCode = Script::P2WPKHScriptCode(HashFromHex("1d0f172a0ecb48aee1be1f2687d2963ae33f71a1"));
    Hash256 sighash = SegwitSignatureHash(tx, 1, scriptCode, 600000000, cache);
    EXPECT_EQ(sighash.GetHex(),
              "c37af31116d1b27caf68aae9e3ac82f1477929014d5b917657d0eb49478cb670");
}

TEST_F(SegwitSighashTest, NestedP2WPKH) {
    MutableTransaction tx = FromHex(nestedTx_);
    PrecomputedTransactionData cache(tx);

    EXPECT_EQ(cache.hashPrevouts.GetHex(),
              "b0287b4a252ac05af83d2dcef00ba313af78a3e9c329afa216eb3aa2a7b4613a");
    EXPECT_EQ(cache.hashSequence.GetHex(),
              "18606b350cd8bf565266bc352f0caddcf01e8fa789dd8a15386327cf8cabe198");
    EXPECT_EQ(cache.hashOutputs.GetHex(),
              "de984f44532e2173ca0d64314fcefe6d30da6f8cf27bafa706da61df8a226c83");

    auto scriptCode = Script::P2WPKHScriptCode(HashFromHex("79091972186c449eb1ded22b78e40d009bdf0089"));
    Hash256 sighash = SegwitSignatureHash(tx, 0, scriptCode, 1000000000, cache);
    EXPECT_EQ(sighash.GetHex(),
              "64f3b0f4dd2bb3aa1ce8566d220cc74dda9df97d8490cc81d89d735c92e59fb6");
}

TEST_F(SegwitSighashTest, CommitsToAmount) {
    MutableTransaction tx = FromHex(nativeTx_);
    PrecomputedTransactionData cache(tx);
    auto scriptCode = Script::P2WPKHScriptCode(HashFromHex("1d0f172a0ecb48aee1be1f2687d2963ae33f71a1"));

    EXPECT_NE(SegwitSignatureHash(tx, 1, scriptCode, 600000000, cache),
              SegwitSignatureHash(tx, 1, scriptCode, 600000001, cache));
}

TEST_F(SegwitSighashTest, IndexOutOfRangeThrows) {
    MutableTransaction tx = FromHex(nestedTx_);
    PrecomputedTransactionData cache(tx);
    EXPECT_THROW(SegwitSignatureHash(tx, 1, {}, 0, cache), std::out_of_range);
}

// ============================================================================
// Legacy
// ============================================================================

class LegacySighashTest : public ::testing::Test {
protected:
    void SetUp() override {
        tx_.vin.emplace_back(OutPoint(TxHash::FromHex(std::string(64, '1')), 0),
                             Script(), TxIn::MAX_SEQUENCE_NONFINAL);
        tx_.vin.emplace_back(OutPoint(TxHash::FromHex(std::string(64, '2')), 1),
                             Script(), TxIn::MAX_SEQUENCE_NONFINAL);
        tx_.vout.emplace_back(90000, Script::CreateP2PKH(HashFromHex(std::string(40, 'a'))));
        code_ = Script::CreateP2PKH(HashFromHex(std::string(40, 'b')));
    }

    MutableTransaction tx_;
    Script code_;
};

TEST_F(LegacySighashTest, IgnoresExistingScriptSigsAndWitness) {
    Hash256 clean = LegacySignatureHash(tx_, 0, code_);

    tx_.vin[0].scriptSig = Script(std::vector<uint8_t>{0x01, 0x02});
    tx_.vin[1].scriptSig = Script(std::vector<uint8_t>{0x03});
    tx_.vin[1].witness = {{0x04}};
    EXPECT_EQ(LegacySignatureHash(tx_, 0, code_), clean);
}

TEST_F(LegacySighashTest, DiffersPerInputAndOutput) {
    Hash256 h0 = LegacySignatureHash(tx_, 0, code_);
    Hash256 h1 = LegacySignatureHash(tx_, 1, code_);
    EXPECT_NE(h0, h1);

    tx_.vout[0].nValue += 1;
    EXPECT_NE(LegacySignatureHash(tx_, 0, code_), h0);
}

TEST_F(LegacySighashTest, CommitsToHashType) {
    EXPECT_NE(LegacySignatureHash(tx_, 0, code_, SIGHASH_ALL),
              LegacySignatureHash(tx_, 0, code_, 2));
}

TEST_F(LegacySighashTest, IndexOutOfRangeThrows) {
    EXPECT_THROW(LegacySignatureHash(tx_, 2, code_), std::out_of_range);
}
