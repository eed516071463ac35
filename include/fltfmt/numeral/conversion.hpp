#ifndef FLTFMT_NUMERAL_CONVERSION_HPP
#define FLTFMT_NUMERAL_CONVERSION_HPP

// Correctly rounded conversion between numerals and format values.
//
// algorithmM is Clinger's Algorithm M: the exact rational u/v = F*B^E is
// rescaled by powers of the format radix until the integer quotient has
// exactly the format's digit count (or the exponent hits a bound), then
// the quotient is rounded with the remainder.

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "fltfmt/codec/codec.hpp"
#include "fltfmt/codec/normalize.hpp"
#include "fltfmt/core/bits.hpp"
#include "fltfmt/core/float.hpp"
#include "fltfmt/core/format.hpp"
#include "fltfmt/core/properties.hpp"
#include "fltfmt/core/rounding.hpp"
#include "fltfmt/numeral/numeral.hpp"

namespace fltfmt {

// Nearest value of the format to F * Base^E (F >= 0). The result may lie
// outside the exponent range; pack() then overflows or underflows it.
inline FloatValue algorithmM(const FormatSpec &Spec, const bits_t &F, long E,
                             int Base = 10) {
  if (F == 0)
    return FloatValue::zero(+1);
  const int R = Spec.radix();
  const long N = Spec.significandDigits();
  const long MinE = Spec.minExponent(SignificandMode::Integral);
  const long MaxE = Spec.maxExponent(SignificandMode::Integral);
  const bits_t Low = Spec.minNormalSignificand();
  const bits_t High = Spec.significandLimit();

  bits_t U = F, V = 1;
  if (E < 0)
    V = radixPower(Base, -E);
  else
    U *= radixPower(Base, E);

  // Start near the answer from the radix lengths of U and V; the loop
  // below only has to correct by a step or two.
  long K = static_cast<long>(mpz_sizeinbase(U.get_mpz_t(), R)) -
           static_cast<long>(mpz_sizeinbase(V.get_mpz_t(), R)) - (N - 1);
  K = std::max(MinE, std::min(MaxE, K));
  if (K > 0)
    V *= radixPower(R, K);
  else if (K < 0)
    U *= radixPower(R, -K);

  bits_t X;
  for (;;) {
    X = U / V;
    if (X >= Low && X < High)
      break;
    if (X < Low) {
      if (K <= MinE)
        break;
      U *= R;
      --K;
    } else {
      if (K >= MaxE)
        break;
      V *= R;
      ++K;
    }
  }

  bits_t Q = roundQuotient(X, U - X * V, V, Spec.rounding());
  if (Q == High) {
    Q = Low;
    ++K;
  }
  if (Q == 0)
    return FloatValue::zero(+1);
  return FloatValue(+1, Q, K);
}

// ===================================================================
// Text -> value
// ===================================================================

inline FloatValue numeralToValue(const FormatSpec &Spec, const Numeral &Num) {
  int Sign = Num.Negative ? -1 : +1;
  switch (Num.Special) {
  case Numeral::Kind::NaN:
    return FloatValue::nan();
  case Numeral::Kind::Infinity:
    return FloatValue::infinity(Sign);
  case Numeral::Kind::Finite:
    break;
  }
  if (Num.isZero())
    return FloatValue::zero(Sign);

  // Far outside the exponent range the result is known without scaling:
  // Lead is the decimal exponent of the leading digit.
  long Lead = Num.Exponent + static_cast<long>(Num.Digits.size()) - 1;
  if (Lead > decimalMaxExp(Spec) + 1)
    return FloatValue(Sign, Spec.minNormalSignificand(),
                      Spec.maxExponent(SignificandMode::Integral) + 1);
  if (Lead < decimalMinExp(Spec) - decimalDigitsNecessary(Spec) - 2)
    return FloatValue::zero(Sign);

  bits_t F(Num.Digits, 10);
  // A decimal format takes the digits as they are and keeps the cohort.
  if (Spec.radix() == 10 && F < Spec.significandLimit())
    return FloatValue(Sign, F, Num.Exponent);
  return algorithmM(Spec, F, Num.Exponent, 10).withSign(Sign);
}

inline FloatValue parseValue(const FormatSpec &Spec, std::string_view Text) {
  return numeralToValue(Spec, readNumeral(Text));
}

inline std::optional<EncodedBytes> encodeText(const FormatSpec &Spec,
                                              std::string_view Text) {
  return pack(Spec, parseValue(Spec, Text));
}

// ===================================================================
// Value -> text
// ===================================================================

struct TextFormat {
  enum class Mode {
    Shortest, // fewest digits that read back to the same value
    Exact,    // every digit of the exact decimal expansion
    Precision // exactly Digits significant digits
  };
  Mode Output = Mode::Shortest;
  int Digits = 0;
  fltfmt::Notation Style = fltfmt::Notation::General;
  bool Uppercase = false;
};

namespace detail {

struct DecimalDigits {
  bits_t Digits;
  long Exponent = 0;
};

// Exact decimal expansion of M * Radix^E, trailing zeros removed.
inline DecimalDigits exactDecimal(int Radix, const bits_t &M, long E) {
  DecimalDigits Result{M, 0};
  if (Radix == 10) {
    Result.Exponent = E;
  } else if (E >= 0) {
    Result.Digits = M * radixPower(Radix, E);
  } else {
    // Radix = 2^B: M * 2^(B*E) = M * 5^(-B*E) * 10^(B*E)
    long B = log2Exact(static_cast<unsigned long>(Radix));
    Result.Digits = M * radixPower(5, -B * E);
    Result.Exponent = B * E;
  }
  while (Result.Digits != 0 && Result.Digits % 10 == 0) {
    Result.Digits /= 10;
    ++Result.Exponent;
  }
  return Result;
}

inline DecimalDigits roundDecimal(const DecimalDigits &D, long Precision) {
  long Len = digitCount(D.Digits, 10);
  DecimalDigits Result = D;
  if (Len > Precision) {
    Result.Digits =
        roundShiftRight(D.Digits, 10, Len - Precision, RoundingMode::TiesToEven);
    Result.Exponent += Len - Precision;
    if (Result.Digits == radixPower(10, Precision)) {
      Result.Digits /= 10;
      ++Result.Exponent;
    }
  } else if (Len < Precision) {
    Result.Digits *= radixPower(10, Precision - Len);
    Result.Exponent -= Precision - Len;
  }
  return Result;
}

} // namespace detail

inline Numeral valueToNumeral(const FormatSpec &Spec, const FloatValue &V,
                              const TextFormat &Fmt = {}) {
  FloatValue X = resolve(Spec, V);
  Numeral Num;
  Num.Negative = X.isNegative();
  if (X.isNan()) {
    Num.Special = Numeral::Kind::NaN;
    Num.Negative = false;
    return Num;
  }
  if (X.isInfinite()) {
    Num.Special = Numeral::Kind::Infinity;
    return Num;
  }
  if (X.isZero())
    return Num;

  detail::DecimalDigits Exact =
      detail::exactDecimal(Spec.radix(), X.significand(), X.exponent());
  detail::DecimalDigits Out = Exact;
  switch (Fmt.Output) {
  case TextFormat::Mode::Exact:
    break;
  case TextFormat::Mode::Precision:
    Out = detail::roundDecimal(Exact, std::max(1, Fmt.Digits));
    break;
  case TextFormat::Mode::Shortest: {
    if (Spec.radix() == 10)
      break;
    FloatValue Target = X.withSign(+1);
    long Len = digitCount(Exact.Digits, 10);
    for (long P = 1; P < Len; ++P) {
      detail::DecimalDigits Candidate = detail::roundDecimal(Exact, P);
      FloatValue Back =
          algorithmM(Spec, Candidate.Digits, Candidate.Exponent, 10);
      if (sameValue(Spec, Back, Target)) {
        Out = Candidate;
        break;
      }
    }
    break;
  }
  }
  Num.Digits = Out.Digits.get_str(10);
  Num.Exponent = Out.Exponent;
  return Num;
}

inline std::string formatValue(const FormatSpec &Spec, const FloatValue &V,
                               const TextFormat &Fmt = {}) {
  return writeNumeral(valueToNumeral(Spec, V, Fmt), Fmt.Style, Fmt.Uppercase);
}

inline std::string decodeText(const FormatSpec &Spec, const EncodedBytes &Data,
                              const TextFormat &Fmt = {}) {
  return formatValue(Spec, unpack(Spec, Data), Fmt);
}

// ===================================================================
// Format -> format
// ===================================================================

// Correctly rounded: the exact source value goes through Algorithm M in
// the source radix, with no decimal detour.
inline FloatValue convertValue(const FormatSpec &From, const FloatValue &V,
                               const FormatSpec &To) {
  FloatValue X = resolve(From, V);
  if (!X.isNumber())
    return X;
  if (From.radix() == To.radix())
    return X;
  return algorithmM(To, X.significand(), X.exponent(), From.radix())
      .withSign(X.sign());
}

inline std::optional<EncodedBytes> convert(const FormatSpec &From,
                                           const EncodedBytes &Data,
                                           const FormatSpec &To) {
  return pack(To, convertValue(From, unpack(From, Data), To));
}

} // namespace fltfmt

#endif // FLTFMT_NUMERAL_CONVERSION_HPP
