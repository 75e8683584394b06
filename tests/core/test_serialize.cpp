// ZKDROP - Serialization Tests
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <gtest/gtest.h>
#include "zkdrop/core/serialize.h"
#include "zkdrop/core/types.h"

#include <limits>
#include <string>
#include <vector>

using namespace zkdrop;

// ============================================================================
// DataStream Basic Tests
// ============================================================================

TEST(DataStreamTest, DefaultConstructor) {
    DataStream ds;
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.size(), 0u);
}

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
    DataStream ds;
    ds << uint8_t(7);
    uint32_t value = 0;
    EXPECT_THROW(ds >> value, std::ios_base::failure);
}

TEST(DataStreamTest, StrKeepsWholeBuffer) {
    DataStream ds;
    ds << uint32_t(0x01020304);
    uint8_t first = 0;
    ds >> first;
    
    // Reading does not shrink the encoded form
    EXPECT_EQ(ds.Str().size(), 4u);
    EXPECT_EQ(ds.size(), 3u);
}

TEST(DataStreamTest, ConstructFromString) {
    std::string bytes("\x2a\x00\x00\x00", 4);
    DataStream ds(bytes);
    uint32_t value = 0;
    ds >> value;
    EXPECT_EQ(value, 42u);
}

// ============================================================================
// Integer Encoding Tests
// ============================================================================

TEST(SerializeTest, Uint32IsLittleEndian) {
    DataStream ds;
    ds << uint32_t(0x12345678);
    const auto& data = ds.Data();
    ASSERT_EQ(data.size(), 4u);
    EXPECT_EQ(data[0], 0x78);
    EXPECT_EQ(data[3], 0x12);
}

TEST(SerializeTest, Uint64Extremes) {
    DataStream ds;
    ds << uint64_t(0) << std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(ds.size(), 16u);
    
    uint64_t a = 1, b = 0;
    ds >> a >> b;
    EXPECT_EQ(a, 0u);
    EXPECT_EQ(b, std::numeric_limits<uint64_t>::max());
}

TEST(SerializeTest, AddressIsRawBytes) {
    Address addr = Address::FromHex("0x0102030405060708090a0b0c0d0e0f1011121314");
    DataStream ds;
    ds << addr;
    ASSERT_EQ(ds.size(), Address::SIZE);
    EXPECT_EQ(ds.Data()[0], 0x01);
    EXPECT_EQ(ds.Data()[19], 0x14);
    
    Address decoded;
    ds >> decoded;
    EXPECT_EQ(decoded, addr);
}
