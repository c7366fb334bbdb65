// Satchel - RIPEMD160 Tests
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <gtest/gtest.h>
#include "satchel/crypto/ripemd160.h"
#include "satchel/crypto/sha256.h"
#include "satchel/core/types.h"
#include "satchel/core/hex.h"

#include <string>
#include <vector>

namespace satchel {
namespace test {

namespace {

std::vector<Byte> Bytes(const std::string& s) {
    return std::vector<Byte>(s.begin(), s.end());
}

} // namespace

TEST(RIPEMD160Test, EmptyString) {
    EXPECT_EQ(RIPEMD160Hash(nullptr, 0).GetHex(), "9c1185a5c5e9fc54612808977ee8f548b2258d31");
}

TEST(RIPEMD160Test, Abc) {
    EXPECT_EQ(RIPEMD160Hash(Bytes("abc")).GetHex(), "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc");
}

TEST(RIPEMD160Test, MessageDigest) {
    EXPECT_EQ(RIPEMD160Hash(Bytes("message digest")).GetHex(),
              "5d0689ef49d2fae572b881b123a85ffa21595f36");
}

TEST(Hash160Test, IsRipemdOfSha256) {
    auto data = Bytes("satchel");
    Hash256 sha = SHA256Hash(data);
    EXPECT_EQ(ComputeHash160(data), RIPEMD160Hash(sha.data(), sha.size()));
}

TEST(Hash160Test, GeneratorPublicKey) {
    // Compressed public key of private key 1
    auto pub = HexToBytes("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    EXPECT_EQ(ComputeHash160(pub).GetHex(), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

} // namespace test
} // namespace satchel
