#ifndef FLTFMT_CODEC_DECIMAL_HPP
#define FLTFMT_CODEC_DECIMAL_HPP

// IEEE 754-2008 decimal interchange formats, DPD encoding.
//
// Storage: sign (1 bit), combination (5 bits), exponent continuation,
// significand continuation. The combination field carries the two
// leading exponent bits and the leading significand digit, or marks
// Infinity (11110) and NaN (11111). Encoding keeps the value's cohort:
// 1234*10^-3 and 1234000*10^-6 pack differently.

#include <optional>

#include "fltfmt/codec/normalize.hpp"
#include "fltfmt/core/dpd.hpp"
#include "fltfmt/core/encoding.hpp"
#include "fltfmt/core/fields.hpp"
#include "fltfmt/core/float.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {
namespace dpd {

inline constexpr unsigned InfinityCombination = 0x1E;
inline constexpr unsigned NanCombination = 0x1F;

inline FloatValue unpack(const FormatSpec &Spec, const EncodedBytes &Data) {
  FieldValues Values = unpackFieldValues(Spec, Data);
  int Sign = isEven(getField(Spec, Values, field::Sign)) ? +1 : -1;
  unsigned Comb =
      static_cast<unsigned>(getField(Spec, Values, field::Combination).get_ui());
  bits_t ExpCont = getField(Spec, Values, field::ExponentContinuation);
  bits_t SigCont = getField(Spec, Values, field::SignificandContinuation);
  const int ContBits = Spec.fieldWidth(field::ExponentContinuation);
  const int N = Spec.significandDigits();

  unsigned A = (Comb >> 4) & 1, B = (Comb >> 3) & 1;
  unsigned C = (Comb >> 2) & 1, D = (Comb >> 1) & 1, E = Comb & 1;
  unsigned ExpMsb, Msd;
  if (A == 0 || B == 0) {
    ExpMsb = Comb >> 3;
    Msd = Comb & 7;
  } else if (C == 0 || D == 0) {
    ExpMsb = (Comb >> 1) & 3;
    Msd = 8 | E;
  } else if (E == 0) {
    return FloatValue::infinity(Sign);
  } else {
    return FloatValue::nan();
  }

  bits_t M = bits_t(Msd) * radixPower(10, N - 1) +
             decodeContinuation(SigCont, N - 1);
  long Stored = (static_cast<long>(ExpMsb) << ContBits) + ExpCont.get_si();
  if (M == 0)
    return FloatValue::zero(Sign);
  return FloatValue(Sign, M, decodeExponent(Spec, Stored));
}

inline std::optional<EncodedBytes> pack(const FormatSpec &Spec,
                                        const FloatValue &V) {
  const int ContBits = Spec.fieldWidth(field::ExponentContinuation);
  const int N = Spec.significandDigits();
  FieldValues Values(Spec.fields().size(), bits_t(0));
  int Sign = V.sign();
  unsigned Comb = 0;
  bits_t M = 0;
  long Stored = Spec.zeroEncodedExponent();

  FloatValue Val = resolve(Spec, V);
  Normalized Fit;
  if (Val.isNumber())
    Fit = normalize(Spec, Val.significand(), Val.exponent(), false);

  if (Val.isNan()) {
    if (!Spec.hasNan())
      return std::nullopt;
    Comb = NanCombination;
    Sign = +1;
  } else if (Val.isInfinite() ||
             (Val.isNumber() && Fit.Kind == Normalized::Outcome::Overflow)) {
    if (!Spec.hasInfinity())
      return std::nullopt;
    Comb = InfinityCombination;
  } else {
    if (Val.isNumber() && Fit.Kind != Normalized::Outcome::Zero) {
      M = Fit.Significand;
      Stored = encodeExponent(Spec, Fit.Exponent);
    }
    bits_t Scale = radixPower(10, N - 1);
    unsigned Msd = static_cast<unsigned>(bits_t(M / Scale).get_ui());
    unsigned ExpMsb = static_cast<unsigned>(Stored >> ContBits);
    if (Msd < 8)
      Comb = (ExpMsb << 3) | Msd;
    else
      Comb = 0x18 | (ExpMsb << 1) | (Msd & 1);
    setField(Spec, Values, field::ExponentContinuation,
             bits_t(Stored & ((1L << ContBits) - 1)));
    setField(Spec, Values, field::SignificandContinuation,
             encodeContinuation(M % Scale, N - 1));
  }

  setField(Spec, Values, field::Sign, bits_t(Sign < 0 ? 1 : 0));
  setField(Spec, Values, field::Combination, bits_t(Comb));
  return packFieldValues(Spec, std::move(Values));
}

} // namespace dpd
} // namespace fltfmt

#endif // FLTFMT_CODEC_DECIMAL_HPP
