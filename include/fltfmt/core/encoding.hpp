#ifndef FLTFMT_CORE_ENCODING_HPP
#define FLTFMT_CORE_ENCODING_HPP

// Exponent encoding and the negation strategies shared by the field
// based codecs.

#include "fltfmt/core/bits.hpp"
#include "fltfmt/core/enums.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {

// Stored (numeric) exponent field -> exponent in the given significand
// interpretation.
inline long decodeExponent(const FormatSpec &Spec, long Stored,
                           SignificandMode Mode = SignificandMode::Integral) {
  long E = Stored;
  if (Spec.exponentMode() == ExponentMode::RadixComplement) {
    long Span = radixPower(Spec.exponentRadix(), Spec.exponentDigits()).get_si();
    if (E >= Span / 2)
      E -= Span;
  }
  E -= Spec.bias(Mode);
  if (Spec.exponentAdjust() == ExponentAdjust::DiminishedNegative && E < 0)
    ++E;
  return E;
}

inline long encodeExponent(const FormatSpec &Spec, long Exp,
                           SignificandMode Mode = SignificandMode::Integral) {
  long Stored = Exp + Spec.bias(Mode);
  if (Spec.exponentMode() == ExponentMode::RadixComplement && Stored < 0)
    Stored += radixPower(Spec.exponentRadix(), Spec.exponentDigits()).get_si();
  if (Spec.exponentAdjust() == ExponentAdjust::DiminishedNegative && Exp < 0)
    --Stored;
  return Stored;
}

inline void applyNegation(const FormatSpec &Spec, bits_t &Significand,
                          long &Exponent) {
  const int SigDigits = Spec.significandFieldDigits();
  switch (Spec.negation()) {
  case NegMode::SignMagnitude:
    return;
  case NegMode::DiminishedRadixComplement: {
    Significand = radixPower(Spec.radix(), SigDigits) - 1 - Significand;
    Exponent =
        radixPower(Spec.exponentRadix(), Spec.exponentDigits()).get_si() - 1 -
        Exponent;
    return;
  }
  case NegMode::RadixComplementSignificand: {
    bits_t Span = radixPower(Spec.radix(), SigDigits);
    Significand = (Span - Significand) % Span;
    return;
  }
  case NegMode::RadixComplement: {
    // Exponent and significand form one number, the field declared
    // first being least significant.
    bits_t SigSpan = radixPower(Spec.radix(), SigDigits);
    bits_t ExpSpan = radixPower(Spec.radix(), Spec.exponentDigits());
    bool ExponentLow = Spec.fieldPieces(field::Exponent).front() <
                       Spec.fieldPieces(field::Significand).front();
    bits_t Combined = ExponentLow ? bits_t(Exponent) + Significand * ExpSpan
                                  : Significand + bits_t(Exponent) * SigSpan;
    bits_t Span = SigSpan * ExpSpan;
    Combined = (Span - Combined) % Span;
    if (ExponentLow) {
      Exponent = bits_t(Combined % ExpSpan).get_si();
      Significand = Combined / ExpSpan;
    } else {
      Significand = Combined % SigSpan;
      Exponent = bits_t(Combined / SigSpan).get_si();
    }
    return;
  }
  }
}

// Apply the format's negation rule to the raw significand field and the
// numeric exponent field of a value whose sign field says "negative".
// Every rule is an involution, so pack and unpack share it; the format's
// negation hook then runs with the direction.
inline void negateFields(const FormatSpec &Spec, bits_t &Significand,
                         long &Exponent, bool Packing) {
  applyNegation(Spec, Significand, Exponent);
  if (Spec.negateHook())
    Spec.negateHook()(Significand, Exponent, Packing);
}

} // namespace fltfmt

#endif // FLTFMT_CORE_ENCODING_HPP
