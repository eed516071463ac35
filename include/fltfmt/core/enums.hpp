#ifndef FLTFMT_CORE_ENUMS_HPP
#define FLTFMT_CORE_ENUMS_HPP

namespace fltfmt {

// Codec family. Every FormatSpec belongs to exactly one.
enum class Family {
  Binary,       // radix 2, optional hidden bit
  Hexadecimal,  // radix 16 significand, binary exponent (IBM 360)
  BCD,          // one decimal digit per nibble
  DPD,          // IEEE 754-2008 densely packed decimal
  PairedDouble  // two binary halves whose sum is the value
};

enum class Endianness {
  Little,
  Big,
  Middle // little-endian 16-bit words in big-endian order (VAX, PDP-11)
};

enum class ExponentMode {
  Excess,         // stored = exponent + bias
  RadixComplement // stored as a radix-complement signed integer
};

// Interpretation of a significand when attaching an exponent to it.
enum class SignificandMode {
  Integral,   // significand is an integer:      m * r^e
  Fractional, // significand is a pure fraction: 0.m * r^e
  Scientific  // one digit before the point:     m.mmm * r^e
};

// Treatment of the raw fields of negative values.
enum class NegMode {
  SignMagnitude,
  DiminishedRadixComplement, // one's complement of significand and exponent
  RadixComplement,           // ten's/two's complement of exponent:significand
  RadixComplementSignificand // complement of the significand only
};

// Extra exponent tweak for formats whose rule is not a plain bias.
enum class ExponentAdjust {
  None,
  DiminishedNegative // negative exponents stored one below the excess form
};

enum class ValueKind { Finite, Zero, Infinity, NaN, Denormal };

} // namespace fltfmt

#endif // FLTFMT_CORE_ENUMS_HPP
