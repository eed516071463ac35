#ifndef FLTFMT_CODEC_CODEC_HPP
#define FLTFMT_CODEC_CODEC_HPP

// Family dispatch. unpack() decodes a byte buffer of exactly the
// format's width into its canonical FloatValue; pack() encodes a value,
// rounding and renormalizing it into range first. pack() returns an
// empty optional when the value cannot be represented at all (NaN or
// infinity requested from a format without them, or overflow without
// infinity).

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fltfmt/codec/bcd.hpp"
#include "fltfmt/codec/decimal.hpp"
#include "fltfmt/codec/paired.hpp"
#include "fltfmt/codec/positional.hpp"
#include "fltfmt/core/bytes.hpp"
#include "fltfmt/core/float.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {

inline FloatValue unpack(const FormatSpec &Spec, const EncodedBytes &Data) {
  switch (Spec.family()) {
  case Family::Binary:
    return binary::unpack(Spec, Data);
  case Family::Hexadecimal:
    return hexadecimal::unpack(Spec, Data);
  case Family::BCD:
    return bcd::unpack(Spec, Data);
  case Family::DPD:
    return dpd::unpack(Spec, Data);
  case Family::PairedDouble:
    return paired::unpack(Spec, Data);
  }
  throw EncodingError("unknown format family");
}

inline std::optional<EncodedBytes> pack(const FormatSpec &Spec,
                                        const FloatValue &V) {
  switch (Spec.family()) {
  case Family::Binary:
    return binary::pack(Spec, V);
  case Family::Hexadecimal:
    return hexadecimal::pack(Spec, V);
  case Family::BCD:
    return bcd::pack(Spec, V);
  case Family::DPD:
    return dpd::pack(Spec, V);
  case Family::PairedDouble:
    return paired::pack(Spec, V);
  }
  throw EncodingError("unknown format family");
}

// Raw bytes are read in the format's own byte order.
inline FloatValue unpack(const FormatSpec &Spec,
                         const std::vector<uint8_t> &Bytes) {
  return unpack(Spec, EncodedBytes{Bytes, Spec.endianness()});
}

// Sign flip through decode and encode, so it holds for every negation
// rule.
inline std::optional<EncodedBytes> negate(const FormatSpec &Spec,
                                          const EncodedBytes &Data) {
  return pack(Spec, unpack(Spec, Data).negated());
}

// ===================================================================
// Bit views of an encoded value
// ===================================================================

inline bits_t toBitsInteger(const FormatSpec &Spec, const EncodedBytes &Data) {
  return bytesToInteger(Data.Bytes, Data.Order, Spec.bitsLittleEndian());
}

inline EncodedBytes fromBitsInteger(const FormatSpec &Spec,
                                    const bits_t &Bits) {
  return {integerToBytes(Bits, Spec.totalBytes(), Spec.endianness(),
                         Spec.bitsLittleEndian()),
          Spec.endianness()};
}

// Zero-padded to the format's width when Base is a power of two.
inline std::string toBitsText(const FormatSpec &Spec, const EncodedBytes &Data,
                              int Base = 16, bool Uppercase = true) {
  bits_t Bits = toBitsInteger(Spec, Data);
  std::string Text = Bits.get_str(Base);
  if (Uppercase)
    for (char &C : Text)
      C = static_cast<char>(std::toupper(static_cast<unsigned char>(C)));
  if (isPowerOfTwo(static_cast<unsigned long>(Base))) {
    size_t DigitBits = static_cast<size_t>(log2Exact(Base));
    size_t Width = (Spec.totalBits() + DigitBits - 1) / DigitBits;
    if (Text.size() < Width)
      Text.insert(0, Width - Text.size(), '0');
  }
  return Text;
}

// Separators '.', ',', '_' and spaces are ignored.
inline EncodedBytes fromBitsText(const FormatSpec &Spec, std::string_view Text,
                                 int Base = 16) {
  std::string Digits;
  for (char C : Text)
    if (C != '.' && C != ',' && C != '_' && C != ' ')
      Digits += C;
  bits_t Bits;
  if (Digits.empty() || Bits.set_str(Digits, Base) != 0)
    throw EncodingError("invalid base-" + std::to_string(Base) +
                        " bit text '" + std::string(Text) + "'");
  return fromBitsInteger(Spec, Bits);
}

} // namespace fltfmt

#endif // FLTFMT_CODEC_CODEC_HPP
