// STAKEVOTE - Core Types Tests
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// Covers addresses, amounts and the binary serialization used for records.

#include <gtest/gtest.h>

#include <stakevote/core/serialize.h>
#include <stakevote/core/types.h>

#include <map>
#include <string>
#include <vector>

namespace stakevote {
namespace {

const std::string kHexA = "00112233445566778899aabbccddeeff00112233";
const std::string kHexB = "ffeeddccbbaa99887766554433221100ffeeddcc";

// ============================================================================
// Amount Tests
// ============================================================================

TEST(AmountTest, MoneyRange) {
    EXPECT_TRUE(MoneyRange(0));
    EXPECT_TRUE(MoneyRange(COIN));
    EXPECT_TRUE(MoneyRange(MAX_MONEY));
    EXPECT_FALSE(MoneyRange(-1));
    EXPECT_FALSE(MoneyRange(MAX_MONEY + 1));
}

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.size(), 20u);
    EXPECT_EQ(addr.ToHex(), std::string(40, '0'));
}

TEST(AddressTest, HexRoundTrip) {
    Address addr = Address::FromHex(kHexA);
    EXPECT_FALSE(addr.IsNull());
    EXPECT_EQ(addr.ToHex(), kHexA);
    EXPECT_EQ(addr[0], 0x00);
    EXPECT_EQ(addr[1], 0x11);
    EXPECT_EQ(addr[19], 0x33);
}

TEST(AddressTest, HexPrefixAndCase) {
    Address lower = Address::FromHex(kHexB);
    Address prefixed = Address::FromHex("0x" + kHexB);
    Address upper = Address::FromHex("FFEEDDCCBBAA99887766554433221100FFEEDDCC");
    EXPECT_EQ(lower, prefixed);
    EXPECT_EQ(lower, upper);
}

TEST(AddressTest, InvalidHex) {
    EXPECT_THROW(Address::FromHex("1234"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex(kHexA + "00"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex("zz" + kHexA.substr(2)), std::invalid_argument);

    Address out = Address::FromHex(kHexA);
    EXPECT_FALSE(Address::TryParseHex("not hex", out));
    EXPECT_EQ(out.ToHex(), kHexA);  // Unchanged on failure
}

TEST(AddressTest, Ordering) {
    Address a = Address::FromHex(kHexA);
    Address b = Address::FromHex(kHexB);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);

    std::map<Address, int> byAddress{{b, 2}, {a, 1}};
    EXPECT_EQ(byAddress.begin()->second, 1);
}

TEST(AddressTest, SetNull) {
    Address a = Address::FromHex(kHexA);
    a.SetNull();
    EXPECT_TRUE(a.IsNull());
}

TEST(AddressTest, ShortString) {
    Address a = Address::FromHex(kHexA);
    EXPECT_EQ(a.ToShortString(), "001122...2233");
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ss;
    ss << static_cast<uint32_t>(0x01020304) << static_cast<uint64_t>(1);

    ASSERT_EQ(ss.size(), 12u);
    EXPECT_EQ(ss.data()[0], 0x04);
    EXPECT_EQ(ss.data()[3], 0x01);
    EXPECT_EQ(ss.data()[4], 0x01);
    EXPECT_EQ(ss.data()[11], 0x00);

    uint32_t a = 0;
    uint64_t b = 0;
    ss >> a >> b;
    EXPECT_EQ(a, 0x01020304u);
    EXPECT_EQ(b, 1u);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, NegativeAmount) {
    DataStream ss;
    ss << static_cast<int64_t>(-5);
    int64_t value = 0;
    ss >> value;
    EXPECT_EQ(value, -5);
}

TEST(SerializeTest, Bool) {
    DataStream ss;
    ss << true << false;
    bool a = false;
    bool b = true;
    ss >> a >> b;
    EXPECT_TRUE(a);
    EXPECT_FALSE(b);

    DataStream bad;
    bad << static_cast<uint8_t>(2);
    EXPECT_THROW(bad >> a, std::ios_base::failure);
}

TEST(SerializeTest, CompactSize) {
    struct Case { uint64_t value; size_t bytes; };
    for (const Case& c : {Case{0, 1}, Case{252, 1}, Case{253, 3}, Case{0xFFFF, 3},
                          Case{0x10000, 5}, Case{MAX_SIZE, 5}}) {
        DataStream ss;
        WriteCompactSize(ss, c.value);
        EXPECT_EQ(ss.size(), c.bytes) << c.value;
        EXPECT_EQ(ReadCompactSize(ss), c.value);
    }
}

TEST(SerializeTest, CompactSizeRejectsNonCanonical) {
    DataStream ss;
    ser_writedata8(ss, 0xFD);
    ser_writedata16(ss, 10);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(SerializeTest, CompactSizeRejectsOversize) {
    DataStream ss;
    WriteCompactSize(ss, MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(SerializeTest, StringAndVector) {
    std::vector<std::string> names{"alpha", "", std::string(300, 'x')};

    DataStream ss;
    ss << names;

    std::vector<std::string> decoded;
    ss >> decoded;
    EXPECT_EQ(decoded, names);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, AddressIsRawBytes) {
    Address a = Address::FromHex(kHexA);
    DataStream ss;
    ss << a;
    ASSERT_EQ(ss.size(), Address::SIZE);
    EXPECT_EQ(ss.str(), std::string(reinterpret_cast<const char*>(a.data()), Address::SIZE));

    Address b;
    ss >> b;
    EXPECT_EQ(a, b);
}

TEST(SerializeTest, TruncatedInputThrows) {
    DataStream ss;
    ss << std::string("hello");
    std::string full = ss.str();

    DataStream truncated(reinterpret_cast<const uint8_t*>(full.data()), full.size() - 1);
    std::string out;
    EXPECT_THROW(truncated >> out, std::ios_base::failure);

    DataStream empty;
    uint64_t value = 0;
    EXPECT_THROW(empty >> value, std::ios_base::failure);
}

} // namespace
} // namespace stakevote
