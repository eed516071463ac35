#ifndef FLTFMT_CODEC_BCD_HPP
#define FLTFMT_CODEC_BCD_HPP

// Binary-coded decimal codec (calculator formats). Fields are counted in
// decimal digits and stored one digit per nibble, the first field in the
// least significant nibbles. Special exponent slots may be non-decimal
// nibble patterns such as 0xF00.

#include <optional>

#include "fltfmt/codec/normalize.hpp"
#include "fltfmt/core/bytes.hpp"
#include "fltfmt/core/encoding.hpp"
#include "fltfmt/core/fields.hpp"
#include "fltfmt/core/float.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {
namespace bcd {

inline bits_t decimalField(const FormatSpec &Spec, const FieldValues &Values,
                           const char *Name) {
  bits_t Code = getField(Spec, Values, Name);
  bits_t Val;
  if (!nibblesToDecimal(Code, Val))
    throw EncodingError(Spec.name() + ": non-decimal digit in " + Name +
                        " field (" + Code.get_str(16) + ")");
  return Val;
}

inline FloatValue unpack(const FormatSpec &Spec, const EncodedBytes &Data) {
  FieldValues Values = unpackFieldValues(Spec, Data);
  bits_t SignDigit = decimalField(Spec, Values, field::Sign);
  bits_t M = decimalField(Spec, Values, field::Significand);
  long ECode = getField(Spec, Values, field::Exponent).get_si();
  bool Negative = !isEven(SignDigit);
  int Sign = Negative ? -1 : +1;

  if (Spec.infiniteEncodedExponent() && ECode == *Spec.infiniteEncodedExponent())
    return FloatValue::infinity(Sign);
  if (Spec.nanEncodedExponent() && ECode == *Spec.nanEncodedExponent())
    return FloatValue::nan();

  long E = decimalField(Spec, Values, field::Exponent).get_si();
  if (Negative)
    negateFields(Spec, M, E, false);
  if (M == 0)
    return FloatValue::zero(Sign);
  return FloatValue(Sign, M, decodeExponent(Spec, E));
}

inline std::optional<EncodedBytes> pack(const FormatSpec &Spec,
                                        const FloatValue &V) {
  bits_t M = 0;
  long E = Spec.slotNumber(Spec.zeroEncodedExponent()).value_or(0);
  std::optional<long> Marker; // non-numeric exponent code
  int Sign = V.sign();

  FloatValue Val = resolve(Spec, V);
  Normalized Fit;
  if (Val.isNumber())
    Fit = normalize(Spec, Val.significand(), Val.exponent());

  bool Overflow = Val.isNumber() && Fit.Kind == Normalized::Outcome::Overflow;
  if (Val.isNan()) {
    if (!Spec.hasNan())
      return std::nullopt;
    Marker = Spec.nanEncodedExponent();
    Sign = +1;
  } else if (Val.isInfinite() || Overflow) {
    if (!Spec.hasInfinity())
      return std::nullopt;
    Marker = Spec.infiniteEncodedExponent();
  } else if (Val.isNumber() && Fit.Kind != Normalized::Outcome::Zero) {
    M = Fit.Significand;
    if (Fit.Kind == Normalized::Outcome::Subnormal &&
        Spec.denormalEncodedExponent())
      Marker = Spec.denormalEncodedExponent();
    else
      E = encodeExponent(Spec, Fit.Exponent);
  }
  if (Marker) {
    std::optional<long> Numeric = Spec.slotNumber(*Marker);
    if (Numeric) {
      E = *Numeric;
      Marker.reset();
    }
  }

  bool Negative = Sign < 0;
  if (Negative) {
    long Scratch = E;
    negateFields(Spec, M, Scratch, true);
    if (!Marker)
      E = Scratch;
  }

  const int ExpDigits = Spec.exponentDigits();
  FieldValues Values(Spec.fields().size(), bits_t(0));
  setField(Spec, Values, field::Sign,
           bits_t(Negative ? Spec.minusSignValue() : 0));
  setField(Spec, Values, field::Exponent,
           Marker ? bits_t(*Marker) : decimalToNibbles(bits_t(E), ExpDigits));
  setField(Spec, Values, field::Significand,
           decimalToNibbles(M, Spec.significandFieldDigits()));
  return packFieldValues(Spec, std::move(Values));
}

} // namespace bcd
} // namespace fltfmt

#endif // FLTFMT_CODEC_BCD_HPP
