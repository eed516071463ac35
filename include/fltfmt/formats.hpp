#ifndef FLTFMT_FORMATS_HPP
#define FLTFMT_FORMATS_HPP

// Named formats. Each accessor compiles its FormatSpec once, on first
// use, and returns the same immutable instance afterwards.

#include <memory>

#include "fltfmt/core/enums.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {
namespace formats {

namespace detail {

inline FormatParams ieeeBinary(const char *Name, int SigBits, int ExpBits,
                               Endianness Order) {
  FormatParams P;
  P.Name = Name;
  P.Kind = Family::Binary;
  P.Fields = {{field::Significand, SigBits},
              {field::Exponent, ExpBits},
              {field::Sign, 1}};
  P.Bias = (1L << (ExpBits - 1)) - 1;
  P.BiasMode = SignificandMode::Scientific;
  P.HiddenBit = true;
  P.GradualUnderflow = true;
  P.Infinity = true;
  P.Nan = true;
  P.Order = Order;
  return P;
}

inline FormatParams ieeeDecimal(const char *Name, int SigContBits,
                                int ExpContBits) {
  FormatParams P;
  P.Name = Name;
  P.Kind = Family::DPD;
  P.Fields = {{field::SignificandContinuation, SigContBits},
              {field::ExponentContinuation, ExpContBits},
              {field::Combination, 5},
              {field::Sign, 1}};
  P.GradualUnderflow = true;
  P.Infinity = true;
  P.Nan = true;
  P.Order = Endianness::Big;
  return P;
}

inline FormatParams ibm(const char *Name, int SigBits) {
  FormatParams P;
  P.Name = Name;
  P.Kind = Family::Hexadecimal;
  P.Fields = {{field::Significand, SigBits},
              {field::Exponent, 7},
              {field::Sign, 1}};
  P.Bias = 64;
  P.BiasMode = SignificandMode::Fractional;
  P.HiddenBit = false;
  P.Order = Endianness::Big;
  return P;
}

inline FormatParams vax(const char *Name, int SigBits, int ExpBits) {
  FormatParams P;
  P.Name = Name;
  P.Fields = {{field::Significand, SigBits},
              {field::Exponent, ExpBits},
              {field::Sign, 1}};
  P.Bias = 1L << (ExpBits - 1);
  P.BiasMode = SignificandMode::Fractional;
  P.Order = Endianness::Middle;
  return P;
}

inline FormatParams hpBcd(const char *Name) {
  FormatParams P;
  P.Name = Name;
  P.Kind = Family::BCD;
  P.Fields = {{field::Exponent, 3}, {field::Significand, 12}, {field::Sign, 1}};
  P.ExpMode = ExponentMode::RadixComplement;
  P.MinExp = -499;
  P.MaxExp = 499;
  P.Order = Endianness::Little;
  return P;
}

} // namespace detail

inline const FormatSpec &ieeeBinary16() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ieeeBinary("IEEE_binary16", 10, 5, Endianness::Little));
  return Spec;
}

inline const FormatSpec &ieeeBinary32() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ieeeBinary("IEEE_binary32", 23, 8, Endianness::Little));
  return Spec;
}

inline const FormatSpec &ieeeBinary64() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ieeeBinary("IEEE_binary64", 52, 11, Endianness::Little));
  return Spec;
}

inline const FormatSpec &ieeeBinary128() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ieeeBinary("IEEE_binary128", 112, 15, Endianness::Little));
  return Spec;
}

inline const FormatSpec &ieeeBinary32BE() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ieeeBinary("IEEE_binary32_BE", 23, 8, Endianness::Big));
  return Spec;
}

inline const FormatSpec &ieeeBinary64BE() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ieeeBinary("IEEE_binary64_BE", 52, 11, Endianness::Big));
  return Spec;
}

inline const FormatSpec &ieeeDecimal32() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ieeeDecimal("IEEE_decimal32", 20, 6));
  return Spec;
}

inline const FormatSpec &ieeeDecimal64() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ieeeDecimal("IEEE_decimal64", 50, 8));
  return Spec;
}

inline const FormatSpec &ieeeDecimal128() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ieeeDecimal("IEEE_decimal128", 110, 12));
  return Spec;
}

inline const FormatSpec &ibm32() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ibm("IBM32", 24));
  return Spec;
}

inline const FormatSpec &ibm64() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::ibm("IBM64", 56));
  return Spec;
}

inline const FormatSpec &vaxF() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::vax("VAX_F", 23, 8));
  return Spec;
}

inline const FormatSpec &vaxG() {
  static const FormatSpec Spec = FormatSpec::compile(
      detail::vax("VAX_G", 52, 11));
  return Spec;
}

// Intel 8087 80-bit extended: explicit integer bit.
inline const FormatSpec &x87Extended() {
  static const FormatSpec Spec = [] {
    FormatParams P = detail::ieeeBinary("x87_extended", 64, 15,
                                        Endianness::Little);
    P.HiddenBit = false;
    P.MinEncodedExp = 1;
    return FormatSpec::compile(P);
  }();
  return Spec;
}

// IBM 360 extended: two long halves; the low half repeats the sign and
// carries the exponent minus 14.
inline const FormatSpec &ibm128() {
  static const FormatSpec Spec = [] {
    FormatParams P = detail::ibm("IBM128", 56);
    P.Fields = {{field::Significand, 56}, {"lo_exponent", 7},
                {"lo_sign", 1},           {field::Significand, 56},
                {field::Exponent, 7},     {field::Sign, 1}};
    P.MinEncodedExp = 14;
    P.PackHook = [](FieldValues &F) {
      F[1] = F[4] >= 14 && F[4] < 127 ? bits_t(F[4] - 14) : F[4];
      F[2] = F[5];
    };
    return FormatSpec::compile(P);
  }();
  return Spec;
}

// Microsoft Binary Format single precision (sign between significand and
// exponent).
inline const FormatSpec &mbfSingle() {
  static const FormatSpec Spec = [] {
    FormatParams P;
    P.Name = "MBF_single";
    P.Fields = {{field::Significand, 23}, {field::Sign, 1}, {field::Exponent, 8}};
    P.Bias = 128;
    P.BiasMode = SignificandMode::Fractional;
    P.Order = Endianness::Little;
    return FormatSpec::compile(P);
  }();
  return Spec;
}

// CDC 6600 single: one's complement words, negative exponents stored one
// below their excess form.
inline const FormatSpec &cdcSingle() {
  static const FormatSpec Spec = [] {
    FormatParams P;
    P.Name = "CDC_single";
    P.Fields = {{field::Significand, 48}, {field::Exponent, 11}, {field::Sign, 1}};
    P.HiddenBit = false;
    P.Bias = 1024;
    P.BiasMode = SignificandMode::Integral;
    P.MinExp = -1023;
    P.Negation = NegMode::DiminishedRadixComplement;
    P.ExpAdjust = ExponentAdjust::DiminishedNegative;
    P.Order = Endianness::Big;
    return FormatSpec::compile(P);
  }();
  return Spec;
}

// Apple II (6502) software floating point. The sign and significand
// form one two's complement number whose sign and leading bits differ,
// so negative significands are renormalized after complementing.
inline const FormatSpec &appleII() {
  static const FormatSpec Spec = [] {
    FormatParams P;
    P.Name = "APPLE_II";
    P.Fields = {{field::Significand, 23}, {field::Sign, 1}, {field::Exponent, 8}};
    P.HiddenBit = false;
    P.Bias = 128;
    P.BiasMode = SignificandMode::Scientific;
    P.MinEncodedExp = 0;
    P.GradualUnderflow = true;
    P.Negation = NegMode::RadixComplementSignificand;
    P.Order = Endianness::Big;
    P.NegateHook = [](bits_t &M, long &E, bool Packing) {
      const bits_t Top = bits_t(1) << 22;
      const bits_t Span = bits_t(1) << 23;
      // A zero field under a minus sign is -2^23 units.
      if (E > 0 && M == 0) {
        M = Top;
        ++E;
        return;
      }
      // Packing stops at exponent 1: an all-zero field at exponent 0 is -0.
      const long Floor = Packing ? 1 : 0;
      while (E > Floor && (M >= Top) == Packing) {
        M = (M * 2) % Span;
        --E;
      }
    };
    return FormatSpec::compile(P);
  }();
  return Spec;
}

// HP-71B: 3-digit ten's complement exponent, 12 digits, sign digit.
inline const FormatSpec &hp71b() {
  static const FormatSpec Spec = [] {
    FormatParams P = detail::hpBcd("HP71B");
    P.DenormalEncodedExp = 0x501;
    P.InfiniteEncodedExp = 0xF00;
    P.NanEncodedExp = 0xF01;
    return FormatSpec::compile(P);
  }();
  return Spec;
}

// HP Saturn (RPL) real object: HP-71B digits behind a 5-nibble prolog.
// Objects of any other type are refused on unpack.
inline const FormatSpec &saturn() {
  static const FormatSpec Spec = [] {
    FormatParams P = detail::hpBcd("SATURN");
    P.Fields.insert(P.Fields.begin(), FieldDef{"prolog", 5});
    P.PackHook = [](FieldValues &F) { F[0] = 0x02933; };
    P.UnpackHook = [](FieldValues &F) {
      if (F[0] != 0x02933)
        throw EncodingError("SATURN: prolog " + F[0].get_str(16) +
                            " is not a real object");
    };
    return FormatSpec::compile(P);
  }();
  return Spec;
}

inline const FormatSpec &doubleDouble() {
  static const FormatSpec Spec = [] {
    FormatParams P;
    P.Name = "IEEE_double_double";
    P.Kind = Family::PairedDouble;
    P.Half = std::make_shared<const FormatSpec>(ieeeBinary64());
    P.ExtraPrecision = true;
    return FormatSpec::compile(P);
  }();
  return Spec;
}

} // namespace formats
} // namespace fltfmt

#endif // FLTFMT_FORMATS_HPP
