// Byte buffer: endianness, integer views, bit fields, nibbles, hex.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "harness/test_harness.hpp"

using namespace fltfmt;
using namespace fltfmt::testing;

using ByteVec = std::vector<uint8_t>;

// ===================================================================
// Endianness
// ===================================================================

TEST_CASE("endianness conversion") {
  const ByteVec Seq = {1, 2, 3, 4};
  CHECK(convertEndianness(Seq, Endianness::Little, Endianness::Big) ==
        ByteVec{4, 3, 2, 1});
  CHECK(convertEndianness(Seq, Endianness::Big, Endianness::Middle) ==
        ByteVec{2, 1, 4, 3});
  CHECK(convertEndianness(Seq, Endianness::Little, Endianness::Middle) ==
        ByteVec{3, 4, 1, 2});
  CHECK(convertEndianness(ByteVec{3, 4, 1, 2}, Endianness::Middle,
                          Endianness::Little) == Seq);
  CHECK(convertEndianness(Seq, Endianness::Big, Endianness::Big) == Seq);
  // Middle-endian needs whole 16-bit words.
  CHECK_THROWS_AS((void)convertEndianness(ByteVec{1, 2, 3}, Endianness::Middle,
                                          Endianness::Big),
                  EncodingError);
}

TEST_CASE("tagged buffers") {
  const ByteVec Seq = {1, 2, 3, 4};
  EncodedBytes Tagged{Seq, Endianness::Little};
  EncodedBytes AsBig = convertEndianness(Tagged, Endianness::Big);
  CHECK(AsBig.Order == Endianness::Big);
  CHECK(AsBig.Bytes == ByteVec{4, 3, 2, 1});
  CHECK_FALSE(AsBig == Tagged);
}

TEST_CASE("bit and nibble reversal") {
  CHECK(reverseByteBits(ByteVec{0x01, 0xF0}) == ByteVec{0x80, 0x0F});
  CHECK(reverseByteNibbles(ByteVec{0x12, 0xAB}) == ByteVec{0x21, 0xBA});
}

// ===================================================================
// Integer view
// ===================================================================

TEST_CASE("integer view") {
  CHECK(bytesToInteger({0x34, 0x12}, Endianness::Little) == bits_t(0x1234));
  CHECK(bytesToInteger({0x34, 0x12}, Endianness::Big) == bits_t(0x3412));
  CHECK(bytesToInteger({0x12, 0x34, 0x56, 0x78}, Endianness::Middle) ==
        bits_t(0x34127856));
  CHECK(bytesToInteger({0x01}, Endianness::Big, true) == bits_t(0x80));
  CHECK(integerToBytes(0x1234, 4, Endianness::Little) ==
        ByteVec{0x34, 0x12, 0x00, 0x00});
  CHECK(integerToBytes(0x1234, 2, Endianness::Big) == ByteVec{0x12, 0x34});
  CHECK_THROWS_AS((void)integerToBytes(0x10000, 2, Endianness::Big),
                  EncodingError);
  CHECK_THROWS_AS((void)integerToBytes(-1, 2, Endianness::Big), EncodingError);
}

// ===================================================================
// Bit fields (first field least significant)
// ===================================================================

TEST_CASE("bit fields") {
  CHECK(packFields({5, 3}, {4, 4}, 1, Endianness::Big) == ByteVec{0x35});
  std::vector<bits_t> Split = unpackFields({0x35}, {4, 4}, 1, Endianness::Big);
  REQUIRE(Split.size() == size_t(2));
  CHECK(Split[0] == 5);
  CHECK(Split[1] == 3);
  CHECK_THROWS_AS((void)packFields({16}, {4}, 1, Endianness::Big),
                  EncodingError);
  CHECK_THROWS_AS((void)packFields({1, 2}, {4}, 1, Endianness::Big),
                  EncodingError);
}

TEST_CASE("digit-unit fields") {
  CHECK(fieldsTotalBits({3, 2}, 4) == size_t(20));
  CHECK(packFields({0x999, 0x21}, {3, 2}, 4, Endianness::Big) ==
        ByteVec{0x02, 0x19, 0x99});
}

TEST_CASE("fields straddling bytes") {
  CHECK(packFields({0x3FF, 0x1, 0x1}, {10, 5, 1}, 1, Endianness::Big) ==
        ByteVec{0x87, 0xFF});
  std::vector<bits_t> Unaligned =
      unpackFields({0x87, 0xFF}, {10, 5, 1}, 1, Endianness::Big);
  REQUIRE(Unaligned.size() == size_t(3));
  CHECK(Unaligned[0] == 0x3FF);
  CHECK(Unaligned[1] == 0x1);
  CHECK(Unaligned[2] == 0x1);
}

// ===================================================================
// Decimal nibbles
// ===================================================================

TEST_CASE("decimal nibbles") {
  CHECK(decimalToNibbles(210, 3) == 0x210);
  CHECK(decimalToNibbles(7, 3) == 0x007);
  CHECK_THROWS_AS((void)decimalToNibbles(1000, 3), EncodingError);

  bits_t Decoded;
  REQUIRE(nibblesToDecimal(0x501, Decoded));
  CHECK(Decoded == 501);
  CHECK_FALSE(nibblesToDecimal(0xF00, Decoded));
}

// ===================================================================
// Hex text
// ===================================================================

TEST_CASE("hex text") {
  CHECK(toHex({0x9A, 0x3F}) == "9A3F");
  CHECK(toHex({0x9A, 0x3F}, true) == "9A 3F");
  CHECK(fromHex("9a 3F") == ByteVec{0x9A, 0x3F});
  CHECK_THROWS_AS((void)fromHex("ABC"), EncodingError);
  CHECK_THROWS_AS((void)fromHex("GG"), EncodingError);
}
