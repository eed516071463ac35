#ifndef FLTFMT_CODEC_POSITIONAL_HPP
#define FLTFMT_CODEC_POSITIONAL_HPP

// Binary and hexadecimal codecs. Both store a sign field, a binary
// exponent field and a significand field; they differ in the significand
// radix (2 or 16) and in the hidden bit, which only binary formats have.

#include <algorithm>
#include <optional>

#include "fltfmt/codec/normalize.hpp"
#include "fltfmt/core/bytes.hpp"
#include "fltfmt/core/encoding.hpp"
#include "fltfmt/core/fields.hpp"
#include "fltfmt/core/float.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {
namespace detail {

inline FloatValue unpackPositional(const FormatSpec &Spec,
                                   const EncodedBytes &Data) {
  FieldValues Values = unpackFieldValues(Spec, Data);
  bits_t SignField = getField(Spec, Values, field::Sign);
  bits_t M = getField(Spec, Values, field::Significand);
  long E = getField(Spec, Values, field::Exponent).get_si();

  bool Negative = !isEven(SignField);
  if (Negative)
    negateFields(Spec, M, E, false);
  int Sign = Negative ? -1 : +1;

  const bits_t Msb = Spec.minNormalSignificand();
  const bool Hidden = Spec.hiddenBit();
  const long Zero = Spec.zeroEncodedExponent();
  const std::optional<long> Denormal = Spec.denormalEncodedExponent();

  // Infinity keeps only the explicit integer digit, if any.
  if (Spec.infiniteEncodedExponent() && E == *Spec.infiniteEncodedExponent() &&
      M % Msb == 0)
    return FloatValue::infinity(Sign);
  if (Spec.nanEncodedExponent() && E == *Spec.nanEncodedExponent())
    return FloatValue::nan();

  if ((M == 0 && !Hidden) || (M == 0 && (E == Zero || E == Denormal)) ||
      (E == Zero && Spec.minEncodedExponent() > Zero && !Denormal))
    return FloatValue::zero(Sign);

  // Denormals share the scale of the lowest normal exponent.
  if (Denormal && E == *Denormal) {
    long Scale = std::max(E, Spec.minEncodedExponent());
    return FloatValue(Sign, M, decodeExponent(Spec, Scale));
  }
  if (Hidden)
    M += Msb;
  return FloatValue(Sign, M, decodeExponent(Spec, E));
}

inline std::optional<EncodedBytes> packPositional(const FormatSpec &Spec,
                                                  const FloatValue &V) {
  const int R = Spec.radix();
  const long N = Spec.significandDigits();
  const bool Hidden = Spec.hiddenBit();
  const bits_t Msb = Spec.minNormalSignificand();

  bits_t M = 0;
  long E = Spec.zeroEncodedExponent();
  int Sign = V.sign();

  auto Infinity = [&]() {
    if (!Spec.hasInfinity())
      return false;
    E = *Spec.infiniteEncodedExponent();
    M = Hidden ? bits_t(0) : Msb;
    return true;
  };

  FloatValue Val = resolve(Spec, V);
  switch (Val.kind()) {
  case ValueKind::NaN:
    if (!Spec.hasNan())
      return std::nullopt;
    E = *Spec.nanEncodedExponent();
    M = (N >= 2 ? radixPower(R, N - 2) : bits_t(1)) +
        (Hidden ? bits_t(0) : Msb);
    Sign = +1;
    break;
  case ValueKind::Infinity:
    if (!Infinity())
      return std::nullopt;
    break;
  case ValueKind::Zero:
    break;
  default: {
    Normalized Fit = normalize(Spec, Val.significand(), Val.exponent());
    switch (Fit.Kind) {
    case Normalized::Outcome::Zero:
      break;
    case Normalized::Outcome::Overflow:
      if (!Infinity())
        return std::nullopt;
      break;
    case Normalized::Outcome::Subnormal:
      if (Spec.denormalEncodedExponent()) {
        E = *Spec.denormalEncodedExponent();
        M = Fit.Significand;
      } else if (!Hidden) {
        E = encodeExponent(Spec, Fit.Exponent);
        M = Fit.Significand;
      }
      break;
    case Normalized::Outcome::Normal:
      M = Fit.Significand;
      E = encodeExponent(Spec, Fit.Exponent);
      if (Hidden)
        M -= Msb;
      break;
    }
  }
  }

  bool Negative = Sign < 0;
  if (Negative)
    negateFields(Spec, M, E, true);

  FieldValues Values(Spec.fields().size(), bits_t(0));
  setField(Spec, Values, field::Sign,
           bits_t(Negative ? Spec.minusSignValue() : 0));
  setField(Spec, Values, field::Exponent, bits_t(E));
  setField(Spec, Values, field::Significand, M);
  return packFieldValues(Spec, std::move(Values));
}

} // namespace detail

namespace binary {
inline FloatValue unpack(const FormatSpec &Spec, const EncodedBytes &Data) {
  return detail::unpackPositional(Spec, Data);
}
inline std::optional<EncodedBytes> pack(const FormatSpec &Spec,
                                        const FloatValue &V) {
  return detail::packPositional(Spec, V);
}
} // namespace binary

namespace hexadecimal {
inline FloatValue unpack(const FormatSpec &Spec, const EncodedBytes &Data) {
  return detail::unpackPositional(Spec, Data);
}
inline std::optional<EncodedBytes> pack(const FormatSpec &Spec,
                                        const FloatValue &V) {
  return detail::packPositional(Spec, V);
}
} // namespace hexadecimal

} // namespace fltfmt

#endif // FLTFMT_CODEC_POSITIONAL_HPP
