#ifndef FLTFMT_CORE_PROPERTIES_HPP
#define FLTFMT_CORE_PROPERTIES_HPP

// Derived properties of a format: extreme values, epsilons, and the
// decimal precision and range it supports.

#include <cmath>
#include <optional>

#include "fltfmt/core/float.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {

inline std::optional<FloatValue> infinityOf(const FormatSpec &Spec,
                                            int Sign = +1) {
  if (!Spec.hasInfinity())
    return std::nullopt;
  return FloatValue::infinity(Sign);
}

inline std::optional<FloatValue> nanOf(const FormatSpec &Spec) {
  if (!Spec.hasNan())
    return std::nullopt;
  return FloatValue::nan();
}

inline FloatValue maxValue(const FormatSpec &Spec, int Sign = +1) {
  return FloatValue(Sign, Spec.significandLimit() - 1,
                    Spec.maxExponent(SignificandMode::Integral));
}

// Formats with a hidden bit whose minimum encoded exponent is also the
// zero slot cannot store significand 0 there; the smallest normal has
// stored significand 1.
inline FloatValue minNormalizedValue(const FormatSpec &Spec, int Sign = +1) {
  bits_t M = Spec.minNormalSignificand();
  if (Spec.hiddenBit() && !Spec.gradualUnderflow() &&
      Spec.minEncodedExponent() == Spec.zeroEncodedExponent())
    M += 1;
  return FloatValue(Sign, M, Spec.minExponent(SignificandMode::Integral));
}

inline FloatValue minValue(const FormatSpec &Spec, int Sign = +1) {
  if (Spec.gradualUnderflow())
    return FloatValue(Sign, 1, Spec.minExponent(SignificandMode::Integral));
  return minNormalizedValue(Spec, Sign);
}

// Distance from 1 to the next larger value: radix^(1-digits).
inline FloatValue epsilon(const FormatSpec &Spec, int Sign = +1) {
  return FloatValue(Sign, 1, 1 - Spec.significandDigits());
}

inline FloatValue halfEpsilon(const FormatSpec &Spec, int Sign = +1) {
  return FloatValue(Sign, Spec.radix() / 2, -Spec.significandDigits());
}

// Smallest value that changes 1 when added to it under the format's
// rounding: half an epsilon when ties round away, otherwise the next
// representable value above half an epsilon.
inline FloatValue strictEpsilon(const FormatSpec &Spec, int Sign = +1) {
  if (Spec.rounding() == RoundingMode::TiesAway)
    return halfEpsilon(Spec, Sign);
  const long N = Spec.significandDigits();
  bits_t M = bits_t(Spec.radix() / 2) * Spec.minNormalSignificand() + 1;
  return FloatValue(Sign, M, 1 - 2 * N);
}

// Decimal digits always preserved by a decimal -> format -> decimal trip.
inline int decimalDigitsStored(const FormatSpec &Spec) {
  if (Spec.radix() == 10)
    return Spec.significandDigits();
  return static_cast<int>(std::floor((Spec.significandDigits() - 1) *
                                     std::log10(Spec.radix())));
}

// Decimal digits needed to distinguish every value of the format.
inline int decimalDigitsNecessary(const FormatSpec &Spec) {
  if (Spec.radix() == 10)
    return Spec.significandDigits();
  return static_cast<int>(std::ceil(Spec.significandDigits() *
                                    std::log10(Spec.radix()))) +
         1;
}

// Largest n such that 10^n is a finite value of the format.
inline long decimalMaxExp(const FormatSpec &Spec) {
  if (Spec.radix() == 10)
    return Spec.maxExponent(SignificandMode::Scientific);
  return static_cast<long>(
      std::floor(Spec.maxExponent(SignificandMode::Fractional) *
                 std::log10(Spec.radix())));
}

// Smallest n such that 10^n is a normalized value of the format.
inline long decimalMinExp(const FormatSpec &Spec) {
  if (Spec.radix() == 10)
    return Spec.minExponent(SignificandMode::Scientific);
  return static_cast<long>(
      std::ceil(Spec.minExponent(SignificandMode::Fractional) *
                std::log10(Spec.radix())));
}

} // namespace fltfmt

#endif // FLTFMT_CORE_PROPERTIES_HPP
