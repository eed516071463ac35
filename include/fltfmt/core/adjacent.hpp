#ifndef FLTFMT_CORE_ADJACENT_HPP
#define FLTFMT_CORE_ADJACENT_HPP

// Adjacent values: next, previous and unit in the last place.
//
// Operands are canonicalized first, so a decimal cohort member such as
// 1*10^0 steps to its true neighbour rather than to 2*10^0. Zero of
// either sign steps up to +minValue and down to -minValue.

#include "fltfmt/codec/normalize.hpp"
#include "fltfmt/core/float.hpp"
#include "fltfmt/core/format.hpp"
#include "fltfmt/core/properties.hpp"

namespace fltfmt {

// Significand pushed to the top of the digit range while the exponent
// stays at or above the minimum.
inline FloatValue canonicalize(const FormatSpec &Spec, const FloatValue &V) {
  FloatValue X = resolve(Spec, V);
  if (!X.isNumber())
    return X;
  Normalized Fit = normalize(Spec, X.significand(), X.exponent());
  switch (Fit.Kind) {
  case Normalized::Outcome::Zero:
    return FloatValue::zero(X.sign());
  case Normalized::Outcome::Overflow:
    return FloatValue::infinity(X.sign());
  default:
    return FloatValue(X.sign(), Fit.Significand, Fit.Exponent);
  }
}

inline FloatValue prevValue(const FormatSpec &Spec, const FloatValue &V);

inline FloatValue nextValue(const FormatSpec &Spec, const FloatValue &V) {
  FloatValue X = canonicalize(Spec, V);
  if (X.isNan())
    return X;
  if (X.isInfinite())
    return X.isNegative() ? maxValue(Spec, -1) : X;
  if (X.isZero())
    return minValue(Spec, +1);
  if (X.isNegative())
    return prevValue(Spec, X.negated()).negated();

  bits_t M = X.significand() + 1;
  long E = X.exponent();
  if (M >= Spec.significandLimit()) {
    M = Spec.minNormalSignificand();
    ++E;
  }
  if (E > Spec.maxExponent(SignificandMode::Integral))
    return FloatValue::infinity(+1);
  return FloatValue(+1, M, E);
}

inline FloatValue prevValue(const FormatSpec &Spec, const FloatValue &V) {
  FloatValue X = canonicalize(Spec, V);
  if (X.isNan())
    return X;
  if (X.isInfinite())
    return X.isNegative() ? X : maxValue(Spec, +1);
  if (X.isZero())
    return minValue(Spec, -1);
  if (X.isNegative())
    return nextValue(Spec, X.negated()).negated();

  const long MinE = Spec.minExponent(SignificandMode::Integral);
  const bits_t Msb = Spec.minNormalSignificand();
  bits_t M = X.significand();
  long E = X.exponent();
  if (M > Msb || E == MinE) {
    M -= 1;
    if (E == MinE && !Spec.gradualUnderflow() &&
        M < minNormalizedValue(Spec).significand())
      return FloatValue::zero(+1);
    if (M == 0)
      return FloatValue::zero(+1);
  } else {
    M = Spec.significandLimit() - 1;
    --E;
  }
  return FloatValue(+1, M, E);
}

// Unit in the last place. At a power of the radix the unit is that of
// the binade below.
inline FloatValue ulp(const FormatSpec &Spec, const FloatValue &V) {
  FloatValue X = canonicalize(Spec, V);
  if (X.isNan())
    return X;
  if (X.isInfinite())
    return FloatValue(+1, 1, Spec.maxExponent(SignificandMode::Integral));
  const long MinE = Spec.minExponent(SignificandMode::Integral);
  if (X.isZero() || X.exponent() <= MinE)
    return minValue(Spec, +1);
  long E = X.exponent();
  if (X.significand() == Spec.minNormalSignificand())
    --E;
  return FloatValue(+1, 1, E);
}

} // namespace fltfmt

#endif // FLTFMT_CORE_ADJACENT_HPP
