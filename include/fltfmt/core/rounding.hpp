#ifndef FLTFMT_CORE_ROUNDING_HPP
#define FLTFMT_CORE_ROUNDING_HPP

#include "fltfmt/core/bits.hpp"

namespace fltfmt {

// Rounding is always to nearest. The mode only decides exact ties.
enum class RoundingMode {
  TiesToEven,    // IEEE 754 default
  TiesAway,      // away from zero
  TiesTowardZero // truncate on a tie
};

// Round the quotient Q of a division whose remainder is Rem and divisor
// Div (0 <= Rem < Div) to nearest. Returns the adjusted quotient.
inline bits_t roundQuotient(bits_t Q, const bits_t &Rem, const bits_t &Div,
                            RoundingMode Mode) {
  int Cmp = cmp(Rem, Div - Rem);
  if (Cmp > 0) {
    ++Q;
  } else if (Cmp == 0) {
    switch (Mode) {
    case RoundingMode::TiesToEven:
      if (!isEven(Q))
        ++Q;
      break;
    case RoundingMode::TiesAway:
      ++Q;
      break;
    case RoundingMode::TiesTowardZero:
      break;
    }
  }
  return Q;
}

// Divide a non-negative Val by Radix^Digits with rounding.
inline bits_t roundShiftRight(const bits_t &Val, unsigned long Radix,
                              unsigned long Digits, RoundingMode Mode) {
  if (Digits == 0)
    return Val;
  bits_t Div = radixPower(Radix, Digits);
  bits_t Q = Val / Div;
  bits_t Rem = Val - Q * Div;
  return roundQuotient(Q, Rem, Div, Mode);
}

} // namespace fltfmt

#endif // FLTFMT_CORE_ROUNDING_HPP
