#ifndef FLTFMT_CODEC_NORMALIZE_HPP
#define FLTFMT_CODEC_NORMALIZE_HPP

// Fit an arbitrary (significand, integral exponent) pair into a format's
// digit count and exponent range, rounding with the format's policy.

#include <algorithm>

#include "fltfmt/core/bits.hpp"
#include "fltfmt/core/format.hpp"
#include "fltfmt/core/rounding.hpp"

namespace fltfmt {

struct Normalized {
  enum class Outcome { Zero, Overflow, Subnormal, Normal };
  Outcome Kind = Outcome::Zero;
  bits_t Significand = 0;
  long Exponent = 0;
};

// Exact number of radix digits of a positive integer.
inline long digitCount(const bits_t &Val, int Radix) {
  if (Val == 0)
    return 0;
  long Count = static_cast<long>(mpz_sizeinbase(Val.get_mpz_t(), Radix));
  if (radixPower(Radix, Count - 1) > Val)
    --Count;
  return Count;
}

// ShiftUp: move digits into the significand's high end while the
// exponent allows. Decimal interchange formats keep their cohort and
// only shift when the exponent is out of range.
inline Normalized normalize(const FormatSpec &Spec, bits_t M, long E,
                            bool ShiftUp = true) {
  using Outcome = Normalized::Outcome;
  const int R = Spec.radix();
  const long N = Spec.significandDigits();
  const long MinE = Spec.minExponent(SignificandMode::Integral);
  const long MaxE = Spec.maxExponent(SignificandMode::Integral);
  const bits_t Limit = Spec.significandLimit();

  if (M == 0)
    return {Outcome::Zero, 0, 0};

  long Len = digitCount(M, R);
  if (Len > N) {
    M = roundShiftRight(M, R, Len - N, Spec.rounding());
    E += Len - N;
    if (M >= Limit) {
      M /= R;
      ++E;
    }
    Len = N;
  }

  if (ShiftUp && E > MinE && Len < N) {
    long K = std::min(N - Len, E - MinE);
    M *= radixPower(R, K);
    E -= K;
  }

  if (E < MinE) {
    // Shifted below the last digit position: less than half a unit.
    if (MinE - E > Len)
      return {Outcome::Zero, 0, 0};
    M = roundShiftRight(M, R, MinE - E, Spec.rounding());
    E = MinE;
    if (M == 0)
      return {Outcome::Zero, 0, 0};
  }

  if (E > MaxE) {
    long Room = N - digitCount(M, R);
    long K = std::min(Room, E - MaxE);
    if (K > 0) {
      M *= radixPower(R, K);
      E -= K;
    }
    if (E > MaxE)
      return {Outcome::Overflow, 0, 0};
  }

  Outcome Kind = M < Spec.minNormalSignificand() && E == MinE
                     ? Outcome::Subnormal
                     : Outcome::Normal;
  return {Kind, M, E};
}

} // namespace fltfmt

#endif // FLTFMT_CODEC_NORMALIZE_HPP
