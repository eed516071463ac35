#ifndef FLTFMT_CORE_FLOAT_HPP
#define FLTFMT_CORE_FLOAT_HPP

// FloatValue: the canonical decoded tuple (sign, significand, exponent).
//
// A finite value is Sign * Significand * radix^Exponent with an integral
// significand. The radix is the format's, so a FloatValue is only
// meaningful together with the FormatSpec it came from. Zero, Infinity
// and NaN carry no significand. Denormal is an input marker meaning
// "Significand at the format's minimum integral exponent".

#include <algorithm>
#include <compare>
#include <utility>

#include "fltfmt/core/bits.hpp"
#include "fltfmt/core/enums.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {

class FloatValue {
public:
  FloatValue() = default; // +0

  FloatValue(int Sign, bits_t Significand, long Exponent)
      : Sign(Sign < 0 ? -1 : +1), Significand(std::move(Significand)),
        Exponent(Exponent), Kind(ValueKind::Finite) {}

  static FloatValue zero(int Sign = +1) {
    return FloatValue(Sign, ValueKind::Zero);
  }
  static FloatValue infinity(int Sign = +1) {
    return FloatValue(Sign, ValueKind::Infinity);
  }
  static FloatValue nan() { return FloatValue(+1, ValueKind::NaN); }
  static FloatValue denormal(int Sign, bits_t Significand) {
    FloatValue V(Sign, ValueKind::Denormal);
    V.Significand = std::move(Significand);
    return V;
  }

  int sign() const { return Sign; }
  const bits_t &significand() const { return Significand; }
  long exponent() const { return Exponent; }
  ValueKind kind() const { return Kind; }

  bool isZero() const { return Kind == ValueKind::Zero; }
  bool isInfinite() const { return Kind == ValueKind::Infinity; }
  bool isNan() const { return Kind == ValueKind::NaN; }
  bool isNegative() const { return Sign < 0; }
  // Finite and non-zero (including denormal markers).
  bool isNumber() const {
    return Kind == ValueKind::Finite || Kind == ValueKind::Denormal;
  }

  FloatValue negated() const {
    FloatValue V = *this;
    if (Kind != ValueKind::NaN)
      V.Sign = -Sign;
    return V;
  }

  FloatValue withSign(int NewSign) const {
    FloatValue V = *this;
    if (Kind != ValueKind::NaN)
      V.Sign = NewSign < 0 ? -1 : +1;
    return V;
  }

  // Structural equality: same kind, sign and tuple. 1*10^0 and 10*10^-1
  // are different values here; use compareValues for numeric order.
  bool operator==(const FloatValue &Other) const {
    if (Kind != Other.Kind)
      return false;
    switch (Kind) {
    case ValueKind::NaN:
      return true;
    case ValueKind::Zero:
    case ValueKind::Infinity:
      return Sign == Other.Sign;
    case ValueKind::Denormal:
      return Sign == Other.Sign && Significand == Other.Significand;
    case ValueKind::Finite:
      return Sign == Other.Sign && Significand == Other.Significand &&
             Exponent == Other.Exponent;
    }
    return false;
  }

private:
  FloatValue(int Sign, ValueKind Kind) : Sign(Sign < 0 ? -1 : +1), Kind(Kind) {}

  int Sign = +1;
  bits_t Significand = 0;
  long Exponent = 0;
  ValueKind Kind = ValueKind::Zero;
};

// Replace a Denormal marker by the finite tuple it stands for, and a
// finite zero significand by Zero.
inline FloatValue resolve(const FormatSpec &Spec, const FloatValue &V) {
  if (V.kind() == ValueKind::Denormal)
    return resolve(Spec,
                   FloatValue(V.sign(), V.significand(),
                              Spec.minExponent(SignificandMode::Integral)));
  if (V.kind() == ValueKind::Finite && V.significand() == 0)
    return FloatValue::zero(V.sign());
  return V;
}

// Numeric comparison. NaN is unordered; +0 and -0 are equivalent.
inline std::partial_ordering compareValues(const FormatSpec &Spec,
                                           const FloatValue &A,
                                           const FloatValue &B) {
  FloatValue X = resolve(Spec, A);
  FloatValue Y = resolve(Spec, B);
  if (X.isNan() || Y.isNan())
    return std::partial_ordering::unordered;

  // Rank: -inf < negative < zero < positive < +inf
  auto Rank = [](const FloatValue &V) {
    if (V.isZero())
      return 0;
    if (V.isInfinite())
      return V.sign() * 2;
    return V.sign();
  };
  int RX = Rank(X), RY = Rank(Y);
  if (RX != RY)
    return RX < RY ? std::partial_ordering::less
                   : std::partial_ordering::greater;
  if (RX == 0 || RX == 2 || RX == -2)
    return std::partial_ordering::equivalent;

  long Common = std::min(X.exponent(), Y.exponent());
  bits_t MX = X.significand() *
              radixPower(Spec.radix(), X.exponent() - Common);
  bits_t MY = Y.significand() *
              radixPower(Spec.radix(), Y.exponent() - Common);
  int C = cmp(MX, MY) * RX;
  if (C < 0)
    return std::partial_ordering::less;
  if (C > 0)
    return std::partial_ordering::greater;
  return std::partial_ordering::equivalent;
}

inline bool sameValue(const FormatSpec &Spec, const FloatValue &A,
                      const FloatValue &B) {
  if (A.isNan() || B.isNan())
    return A.isNan() && B.isNan();
  FloatValue X = resolve(Spec, A), Y = resolve(Spec, B);
  if (X.isZero() || Y.isZero())
    return X.isZero() && Y.isZero() && X.sign() == Y.sign();
  return compareValues(Spec, X, Y) == std::partial_ordering::equivalent;
}

} // namespace fltfmt

#endif // FLTFMT_CORE_FLOAT_HPP
