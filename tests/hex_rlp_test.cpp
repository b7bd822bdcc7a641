#include <gtest/gtest.h>
#include "encoding/rlp.hpp"
#include "utils/hex.hpp"

namespace {
Bytes Ascii(const std::string& s) { return Bytes(s.begin(), s.end()); }
}

TEST(Hex, Quantities) {
  EXPECT_EQ(ToHexQuantity(0), "0x0");
  EXPECT_EQ(ToHexQuantity(100), "0x64");
  EXPECT_EQ(ToHexQuantity(0x1234abcdULL), "0x1234abcd");
  EXPECT_EQ(ParseHexQuantity("0x64"), 100u);
  EXPECT_EQ(ParseHexQuantity("0X1A"), 26u);
  EXPECT_THROW(ParseHexQuantity("0x"), std::invalid_argument);
  EXPECT_THROW(ParseHexQuantity("0xzz"), std::invalid_argument);
  EXPECT_THROW(ParseHexQuantity("0x10000000000000000"), std::invalid_argument);
}

TEST(Hex, BytesConversion) {
  EXPECT_EQ(HexToBytes("0x00ff10"), (Bytes{0x00, 0xff, 0x10}));
  EXPECT_EQ(HexToBytes("ABcd"), (Bytes{0xab, 0xcd}));
  EXPECT_EQ(BytesToHex0x(Bytes{0xde, 0xad}), "0xdead");
  EXPECT_EQ(BytesToHex0x(Bytes{}), "0x");
  EXPECT_THROW(HexToBytes("0xabc"), std::invalid_argument);
  EXPECT_THROW(HexToBytes("0xgg"), std::invalid_argument);
}

TEST(Hex, NormalizesAddressesAndHashes) {
  EXPECT_EQ(NormalizeAddress("0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2"),
            "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
  EXPECT_THROW(NormalizeAddress("0x1234"), std::invalid_argument);
  EXPECT_THROW(NormalizeHash("0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2"), std::invalid_argument);
  EXPECT_EQ(NormalizeHash(std::string("0x") + std::string(64, 'A')), std::string("0x") + std::string(64, 'a'));
}

TEST(Rlp, Strings) {
  EXPECT_EQ(RLP::EncodeBytes(Ascii("dog")), HexToBytes("0x83646f67"));
  EXPECT_EQ(RLP::EncodeBytes(Bytes{}), HexToBytes("0x80"));
  EXPECT_EQ(RLP::EncodeBytes(Bytes{0x7f}), HexToBytes("0x7f"));
  EXPECT_EQ(RLP::EncodeBytes(Bytes{0x80}), HexToBytes("0x8180"));
  EXPECT_EQ(RLP::EncodeString("0x646f67"), HexToBytes("0x83646f67"));

  Bytes long_str = Ascii("Lorem ipsum dolor sit amet, consectetur adipisicing elit");
  ASSERT_EQ(long_str.size(), 56u);
  Bytes expected = HexToBytes("0xb838");
  expected.insert(expected.end(), long_str.begin(), long_str.end());
  EXPECT_EQ(RLP::EncodeBytes(long_str), expected);
}

TEST(Rlp, Integers) {
  EXPECT_EQ(RLP::EncodeUint(0), HexToBytes("0x80"));
  EXPECT_EQ(RLP::EncodeUint(15), HexToBytes("0x0f"));
  EXPECT_EQ(RLP::EncodeUint(1024), HexToBytes("0x820400"));
  EXPECT_EQ(RLP::EncodeBigEndian(HexToBytes("0x000400")), HexToBytes("0x820400"));
  EXPECT_EQ(RLP::EncodeBigEndian(HexToBytes("0x0000")), HexToBytes("0x80"));
}

TEST(Rlp, Lists) {
  EXPECT_EQ(RLP::EncodeList({}), HexToBytes("0xc0"));
  EXPECT_EQ(RLP::EncodeList({RLP::EncodeBytes(Ascii("cat")), RLP::EncodeBytes(Ascii("dog"))}),
            HexToBytes("0xc88363617483646f67"));
  // [ [], [[]], [ [], [[]] ] ]
  Bytes empty = RLP::EncodeList({});
  Bytes one = RLP::EncodeList({empty});
  EXPECT_EQ(RLP::EncodeList({empty, one, RLP::EncodeList({empty, one})}), HexToBytes("0xc7c0c1c0c3c0c1c0"));
}
