// Satchel - Serialization Tests
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <gtest/gtest.h>
#include "satchel/core/serialize.h"
#include "satchel/core/types.h"

#include <vector>

using namespace satchel;

// ============================================================================
// DataStream
// ============================================================================

TEST(DataStreamTest, WriteAndRead) {
    DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    ds.Write(data.data(), data.size());
    EXPECT_EQ(ds.size(), 4u);

    std::vector<uint8_t> result(4);
    ds.Read(result.data(), result.size());
    EXPECT_EQ(result, data);
    EXPECT_TRUE(ds.empty());
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream ds(std::vector<uint8_t>{0x01});
    uint32_t v;
    EXPECT_THROW(ds >> v, std::ios_base::failure);
}

TEST(DataStreamTest, Clear) {
    DataStream ds;
    ds << uint32_t(42);
    ds.clear();
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.TotalSize(), 0u);
}

// ============================================================================
// Integers (little-endian)
// ============================================================================

TEST(SerializeTest, Uint32LittleEndian) {
    DataStream ds;
    ds << uint32_t(0x01020304);
    EXPECT_EQ(ds.Data(), (std::vector<uint8_t>{0x04, 0x03, 0x02, 0x01}));
}

TEST(SerializeTest, Uint64LittleEndian) {
    DataStream ds;
    ds << uint64_t(100000);
    EXPECT_EQ(ds.ToHex(), "a086010000000000");

    uint64_t out;
    ds >> out;
    EXPECT_EQ(out, 100000u);
}

// ============================================================================
// CompactSize
// ============================================================================

TEST(CompactSizeTest, Encodings) {
    struct Case { uint64_t value; const char* hex; };
    const Case cases[] = {
        {0, "00"},
        {252, "fc"},
        {253, "fdfd00"},
        {0xffff, "fdffff"},
        {0x10000, "fe00000100"},
    };
    for (const auto& c : cases) {
        DataStream ds;
        WriteCompactSize(ds, c.value);
        EXPECT_EQ(ds.ToHex(), c.hex) << c.value;
        EXPECT_EQ(ReadCompactSize(ds), c.value);
    }
}

TEST(CompactSizeTest, RejectsNonCanonical) {
    DataStream ds(std::vector<uint8_t>{0xfd, 0x10, 0x00});
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

TEST(CompactSizeTest, RejectsOversize) {
    DataStream ds;
    ser_writedata8(ds, 0xfe);
    ser_writedata32(ds, static_cast<uint32_t>(MAX_SIZE + 1));
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

// ============================================================================
// Byte vectors and hashes
// ============================================================================

TEST(SerializeTest, ByteVectorIsLengthPrefixed) {
    DataStream ds;
    ds << std::vector<uint8_t>{0xaa, 0xbb};
    EXPECT_EQ(ds.ToHex(), "02aabb");
}

TEST(SerializeTest, HashIsRawInternalOrder) {
    Hash256 h;
    h[0] = 0x11;
    DataStream ds;
    ds << h;
    ASSERT_EQ(ds.size(), 32u);
    EXPECT_EQ(ds.Data()[0], 0x11);
}

TEST(SerializeTest, SizeComputerMatchesStream) {
    std::vector<uint8_t> v(300, 0x01);
    DataStream ds;
    ds << v;
    EXPECT_EQ(GetSerializeSize(v), ds.size());
    EXPECT_EQ(GetSerializeSize(v), 303u);
}
