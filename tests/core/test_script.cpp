// Satchel - Script Tests
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <gtest/gtest.h>
#include "satchel/core/script.h"
#include "satchel/core/hex.h"
#include "satchel/core/types.h"

#include <vector>

using namespace satchel;

namespace {

Hash160 TestHash() {
    auto bytes = HexToBytes("751e76e8199196d454941c45d1b3a323f1433bd6");
    return Hash160(bytes.data(), bytes.size());
}

} // namespace

// ============================================================================
// Standard templates
// ============================================================================

TEST(ScriptTest, P2PKH) {
    Script s = Script::CreateP2PKH(TestHash());
    EXPECT_EQ(s.ToHex(), "76a914751e76e8199196d454941c45d1b3a323f1433bd688ac");
    EXPECT_TRUE(s.IsPayToPublicKeyHash());
    EXPECT_EQ(s.GetType(), ScriptType::P2PKH);
    EXPECT_EQ(s.ToString(),
              "OP_DUP OP_HASH160 751e76e8199196d454941c45d1b3a323f1433bd6 "
              "OP_EQUALVERIFY OP_CHECKSIG");
}

TEST(ScriptTest, P2SH) {
    Script s = Script::CreateP2SH(TestHash());
    EXPECT_EQ(s.ToHex(), "a914751e76e8199196d454941c45d1b3a323f1433bd687");
    EXPECT_TRUE(s.IsPayToScriptHash());
    EXPECT_EQ(s.GetType(), ScriptType::P2SH);
}

TEST(ScriptTest, P2WPKH) {
    Script s = Script::CreateP2WPKH(TestHash());
    EXPECT_EQ(s.ToHex(), "0014751e76e8199196d454941c45d1b3a323f1433bd6");
    EXPECT_TRUE(s.IsPayToWitnessPubKeyHash());
    EXPECT_EQ(s.GetType(), ScriptType::P2WPKH);
}

TEST(ScriptTest, P2WSH) {
    Hash256 h;
    h[0] = 0x01;
    Script s = Script::CreateP2WSH(h);
    EXPECT_EQ(s.size(), 34u);
    EXPECT_TRUE(s.IsPayToWitnessScriptHash());
    EXPECT_FALSE(s.IsPayToWitnessPubKeyHash());
    EXPECT_EQ(s.GetType(), ScriptType::P2WSH);
}

TEST(ScriptTest, NestedSegwitWrapsRedeemHash) {
    Script redeem = Script::CreateP2WPKHRedeemScript(TestHash());
    Script outer = Script::CreateP2SH_P2WPKH(TestHash());
    EXPECT_EQ(outer.GetType(), ScriptType::P2SH);

    Hash160 extracted;
    ASSERT_TRUE(outer.ExtractHash160(extracted));
    EXPECT_NE(extracted, TestHash());
    EXPECT_EQ(redeem.size(), 22u);
}

TEST(ScriptTest, ExtractHash160) {
    Hash160 h;
    EXPECT_TRUE(Script::CreateP2PKH(TestHash()).ExtractHash160(h));
    EXPECT_EQ(h, TestHash());
    EXPECT_TRUE(Script::CreateP2WPKH(TestHash()).ExtractHash160(h));
    EXPECT_EQ(h, TestHash());

    Script data;
    data << OP_RETURN;
    EXPECT_FALSE(data.ExtractHash160(h));
    EXPECT_TRUE(data.IsUnspendable());
    EXPECT_EQ(data.GetType(), ScriptType::NULL_DATA);
}

// ============================================================================
// Spending scripts
// ============================================================================

TEST(ScriptTest, P2PKHScriptSigPushesSigAndKey) {
    std::vector<uint8_t> sig(71, 0x30);
    std::vector<uint8_t> pub(33, 0x02);
    Script s = Script::CreateP2PKHScriptSig(sig, pub);
    EXPECT_EQ(s.size(), 1 + 71 + 1 + 33u);
    EXPECT_TRUE(s.IsPushOnly());

    Script::const_iterator pc = s.begin();
    Opcode op;
    std::vector<uint8_t> data;
    ASSERT_TRUE(s.GetOp(pc, op, data));
    EXPECT_EQ(data, sig);
    ASSERT_TRUE(s.GetOp(pc, op, data));
    EXPECT_EQ(data, pub);
    EXPECT_EQ(pc, s.end());
}

TEST(ScriptTest, NestedSegwitScriptSigPushesRedeemScript) {
    Script s = Script::CreateP2SH_P2WPKHScriptSig(TestHash());
    EXPECT_EQ(s.ToHex(), "160014751e76e8199196d454941c45d1b3a323f1433bd6");
}

TEST(ScriptTest, P2WPKHScriptCodeIsLengthPrefixedP2PKH) {
    auto code = Script::P2WPKHScriptCode(TestHash());
    EXPECT_EQ(BytesToHex(code), "1976a914751e76e8199196d454941c45d1b3a323f1433bd688ac");
}

TEST(ScriptTest, PushDataSizes) {
    Script s;
    s << std::vector<uint8_t>(75, 0x01);
    EXPECT_EQ(s[0], 75);

    Script s2;
    s2 << std::vector<uint8_t>(76, 0x01);
    EXPECT_EQ(s2[0], OP_PUSHDATA1);
    EXPECT_EQ(s2[1], 76);

    Script s3;
    s3 << std::vector<uint8_t>(300, 0x01);
    EXPECT_EQ(s3[0], OP_PUSHDATA2);
}

TEST(ScriptTest, TruncatedPushFailsToParse) {
    Script s;
    s.push_back(0x05);
    s.push_back(0x01);
    auto pc = s.cbegin();
    Opcode op;
    std::vector<uint8_t> data;
    EXPECT_FALSE(s.GetOp(pc, op, data));
    EXPECT_EQ(s.GetType(), ScriptType::NONSTANDARD);
}

TEST(ScriptTest, OpNames) {
    EXPECT_EQ(GetOpName(OP_CHECKSIG), "OP_CHECKSIG");
    EXPECT_EQ(GetOpName(static_cast<Opcode>(0x52)), "OP_2");
    EXPECT_STREQ(ScriptTypeToString(ScriptType::P2WPKH), "witness_v0_keyhash");
}
