#ifndef FLTFMT_CORE_BYTES_HPP
#define FLTFMT_CORE_BYTES_HPP

// Byte and bit buffer: endianness conversion, integer view of a byte
// string, bit-field packing and hex text.
//
// Field convention: the first field in a list occupies the least
// significant position of the integer formed from the bytes.

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "fltfmt/core/bits.hpp"
#include "fltfmt/core/enums.hpp"
#include "fltfmt/core/exceptions.hpp"

namespace fltfmt {

// A fixed-length byte sequence tagged with its byte order.
struct EncodedBytes {
  std::vector<uint8_t> Bytes;
  Endianness Order = Endianness::Little;

  size_t size() const { return Bytes.size(); }
  bool operator==(const EncodedBytes &Other) const = default;
};

// ===================================================================
// Byte-level permutations
// ===================================================================

inline uint8_t reverseBits(uint8_t B) {
  uint8_t Result = 0;
  for (int I = 0; I < 8; ++I)
    if (B & (1u << I))
      Result |= static_cast<uint8_t>(0x80u >> I);
  return Result;
}

inline std::vector<uint8_t> reverseByteBits(std::vector<uint8_t> Bytes) {
  for (auto &B : Bytes)
    B = reverseBits(B);
  return Bytes;
}

inline std::vector<uint8_t> reverseByteNibbles(std::vector<uint8_t> Bytes) {
  for (auto &B : Bytes)
    B = static_cast<uint8_t>((B >> 4) | (B << 4));
  return Bytes;
}

// Swap the two bytes of every 16-bit word.
inline std::vector<uint8_t> reverseBytePairs(std::vector<uint8_t> Bytes) {
  if (Bytes.size() % 2 != 0)
    throw EncodingError("middle-endian data needs an even byte count, got " +
                        std::to_string(Bytes.size()));
  for (size_t I = 0; I + 1 < Bytes.size(); I += 2)
    std::swap(Bytes[I], Bytes[I + 1]);
  return Bytes;
}

inline std::vector<uint8_t> convertEndianness(std::vector<uint8_t> Bytes,
                                              Endianness From,
                                              Endianness To) {
  if (From == To)
    return Bytes;
  if (From == Endianness::Middle)
    return convertEndianness(reverseBytePairs(std::move(Bytes)),
                             Endianness::Big, To);
  if (To == Endianness::Middle)
    return reverseBytePairs(
        convertEndianness(std::move(Bytes), From, Endianness::Big));
  std::reverse(Bytes.begin(), Bytes.end());
  return Bytes;
}

inline EncodedBytes convertEndianness(const EncodedBytes &Data,
                                      Endianness To) {
  return {convertEndianness(Data.Bytes, Data.Order, To), To};
}

// ===================================================================
// Integer view
// ===================================================================

// BitsLittleEndian: bits inside each byte are stored least significant
// first (some bit-serial machines).
inline bits_t bytesToInteger(const std::vector<uint8_t> &Bytes,
                             Endianness Order, bool BitsLittleEndian = false) {
  std::vector<uint8_t> Big = convertEndianness(Bytes, Order, Endianness::Big);
  if (BitsLittleEndian)
    Big = reverseByteBits(std::move(Big));
  return bytesToMpz(Big);
}

inline std::vector<uint8_t> integerToBytes(const bits_t &Val, size_t Len,
                                           Endianness Order,
                                           bool BitsLittleEndian = false) {
  std::vector<uint8_t> Big = mpzToBytes(Val, Len);
  if (BitsLittleEndian)
    Big = reverseByteBits(std::move(Big));
  return convertEndianness(std::move(Big), Endianness::Big, Order);
}

// ===================================================================
// Bit fields
// ===================================================================

// Widths are counted in units of UnitBits (1 for bit fields, 4 for
// nibble fields).
inline size_t fieldsTotalBits(const std::vector<int> &Widths, int UnitBits) {
  size_t Total = 0;
  for (int W : Widths)
    Total += static_cast<size_t>(W) * UnitBits;
  return Total;
}

inline std::vector<bits_t> splitInteger(const bits_t &Val,
                                        const std::vector<int> &Widths,
                                        int UnitBits) {
  std::vector<bits_t> Fields;
  Fields.reserve(Widths.size());
  bits_t Rest = Val;
  for (int W : Widths) {
    auto Bits = static_cast<mp_bitcnt_t>(W) * UnitBits;
    bits_t Field;
    mpz_fdiv_r_2exp(Field.get_mpz_t(), Rest.get_mpz_t(), Bits);
    mpz_fdiv_q_2exp(Rest.get_mpz_t(), Rest.get_mpz_t(), Bits);
    Fields.push_back(Field);
  }
  return Fields;
}

inline bits_t joinInteger(const std::vector<bits_t> &Fields,
                          const std::vector<int> &Widths, int UnitBits) {
  if (Fields.size() != Widths.size())
    throw EncodingError("expected " + std::to_string(Widths.size()) +
                        " field values, got " + std::to_string(Fields.size()));
  bits_t Result = 0;
  mp_bitcnt_t Offset = 0;
  for (size_t I = 0; I < Fields.size(); ++I) {
    auto Bits = static_cast<mp_bitcnt_t>(Widths[I]) * UnitBits;
    if (Fields[I] < 0 || bitLength(Fields[I]) > Bits)
      throw EncodingError("field " + std::to_string(I) + " value " +
                          Fields[I].get_str(16) + " does not fit " +
                          std::to_string(Bits) + " bits");
    Result += Fields[I] << Offset;
    Offset += Bits;
  }
  return Result;
}

inline std::vector<bits_t> unpackFields(const std::vector<uint8_t> &Bytes,
                                        const std::vector<int> &Widths,
                                        int UnitBits, Endianness Order,
                                        bool BitsLittleEndian = false) {
  return splitInteger(bytesToInteger(Bytes, Order, BitsLittleEndian), Widths,
                      UnitBits);
}

inline std::vector<uint8_t> packFields(const std::vector<bits_t> &Fields,
                                       const std::vector<int> &Widths,
                                       int UnitBits, Endianness Order,
                                       bool BitsLittleEndian = false) {
  size_t Len = (fieldsTotalBits(Widths, UnitBits) + 7) / 8;
  return integerToBytes(joinInteger(Fields, Widths, UnitBits), Len, Order,
                        BitsLittleEndian);
}

// ===================================================================
// BCD nibble codes
// ===================================================================

// Decimal value -> one digit per nibble, Digits nibbles wide.
inline bits_t decimalToNibbles(const bits_t &Val, int Digits) {
  if (Val < 0)
    throw EncodingError("negative BCD field");
  std::string Text = Val.get_str(10);
  if (static_cast<int>(Text.size()) > Digits)
    throw EncodingError("BCD value " + Text + " does not fit " +
                        std::to_string(Digits) + " digits");
  return bits_t(Text, 16);
}

// Nibble code -> decimal value. Returns false when a nibble is not a
// decimal digit.
inline bool nibblesToDecimal(const bits_t &Code, bits_t &Val) {
  std::string Text = Code.get_str(16);
  for (char C : Text)
    if (!std::isdigit(static_cast<unsigned char>(C)))
      return false;
  Val = bits_t(Text, 10);
  return true;
}

// ===================================================================
// Hex text
// ===================================================================

inline std::string toHex(const std::vector<uint8_t> &Bytes,
                         bool SeparateBytes = false) {
  static const char Digits[] = "0123456789ABCDEF";
  std::string Result;
  for (size_t I = 0; I < Bytes.size(); ++I) {
    if (SeparateBytes && I > 0)
      Result += ' ';
    Result += Digits[Bytes[I] >> 4];
    Result += Digits[Bytes[I] & 0xF];
  }
  return Result;
}

inline std::vector<uint8_t> fromHex(std::string_view Text) {
  std::string Digits;
  for (char C : Text) {
    if (std::isspace(static_cast<unsigned char>(C)))
      continue;
    if (!std::isxdigit(static_cast<unsigned char>(C)))
      throw EncodingError("invalid hex digit '" + std::string(1, C) + "'");
    Digits += C;
  }
  if (Digits.size() % 2 != 0)
    throw EncodingError("odd number of hex digits");
  std::vector<uint8_t> Bytes;
  Bytes.reserve(Digits.size() / 2);
  for (size_t I = 0; I < Digits.size(); I += 2)
    Bytes.push_back(
        static_cast<uint8_t>(std::stoul(Digits.substr(I, 2), nullptr, 16)));
  return Bytes;
}

} // namespace fltfmt

#endif // FLTFMT_CORE_BYTES_HPP
