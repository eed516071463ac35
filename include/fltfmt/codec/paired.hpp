#ifndef FLTFMT_CODEC_PAIRED_HPP
#define FLTFMT_CODEC_PAIRED_HPP

// Double-double: two binary values whose exact sum is the number. The
// high half comes first in storage and each half uses the half format's
// byte order.
//
// With extra precision the high half is rounded to nearest and the low
// half may have the opposite sign, giving one more bit of precision.
// Without it the high half is truncated.
//
// Below the half format's normal range the pair keeps the half format's
// lowest exponent, so precision tapers off the way subnormals do.

#include <algorithm>
#include <cstdlib>
#include <optional>

#include "fltfmt/codec/normalize.hpp"
#include "fltfmt/codec/positional.hpp"
#include "fltfmt/core/fields.hpp"
#include "fltfmt/core/float.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {
namespace paired {

inline FloatValue unpack(const FormatSpec &Spec, const EncodedBytes &Data) {
  checkLength(Spec, Data);
  const FormatSpec &Half = Spec.half();
  const size_t HalfBytes = Half.totalBytes();
  EncodedBytes HiBytes{{Data.Bytes.begin(), Data.Bytes.begin() + HalfBytes},
                       Data.Order};
  EncodedBytes LoBytes{{Data.Bytes.begin() + HalfBytes, Data.Bytes.end()},
                       Data.Order};

  FloatValue Hi = resolve(Half, binary::unpack(Half, HiBytes));
  if (!Hi.isNumber())
    return Hi;
  FloatValue Lo = resolve(Half, binary::unpack(Half, LoBytes));

  // Exact sum on the finer of the two grids, subnormal low halves included.
  int Sign = Hi.sign();
  bits_t M = Hi.significand();
  long E = Hi.exponent();
  if (Lo.isNumber()) {
    bits_t Part = Lo.significand();
    if (Lo.exponent() < E) {
      M <<= static_cast<mp_bitcnt_t>(E - Lo.exponent());
      E = Lo.exponent();
    } else {
      Part <<= static_cast<mp_bitcnt_t>(Lo.exponent() - E);
    }
    if (Lo.sign() == Sign)
      M += Part;
    else
      M -= Part;
  }
  if (M == 0)
    return FloatValue::zero(Sign);
  if (M < 0) {
    M = -M;
    Sign = -Sign;
  }

  Normalized Fit = normalize(Spec, M, E);
  switch (Fit.Kind) {
  case Normalized::Outcome::Zero:
    return FloatValue::zero(Sign);
  case Normalized::Outcome::Overflow:
    return FloatValue::infinity(Sign);
  default:
    return FloatValue(Sign, Fit.Significand, Fit.Exponent);
  }
}

inline std::optional<EncodedBytes> pack(const FormatSpec &Spec,
                                        const FloatValue &V) {
  const FormatSpec &Half = Spec.half();
  FloatValue Hi = FloatValue::zero(V.sign());
  FloatValue Lo = FloatValue::zero(+1);

  FloatValue Val = resolve(Spec, V);
  if (Val.isNan() || Val.isInfinite()) {
    Hi = Val;
  } else if (Val.isNumber()) {
    Normalized Fit = normalize(Spec, Val.significand(), Val.exponent());
    switch (Fit.Kind) {
    case Normalized::Outcome::Overflow:
      Hi = FloatValue::infinity(Val.sign());
      break;
    case Normalized::Outcome::Zero:
      break;
    case Normalized::Outcome::Subnormal:
    case Normalized::Outcome::Normal: {
      // The high half sits on the half format's grid for this magnitude;
      // near the bottom of the range fewer digits are left for the low
      // half.
      const long HalfDigits = Half.significandDigits();
      const long Len = static_cast<long>(bitLength(Fit.Significand));
      const long HiE =
          std::max(Fit.Exponent + Len - HalfDigits,
                   Half.minExponent(SignificandMode::Integral));
      const long Shift = std::max(0L, HiE - Fit.Exponent);
      const bits_t Div = bits_t(1) << static_cast<mp_bitcnt_t>(Shift);
      bits_t HiM = Fit.Significand / Div;
      if (Spec.extraPrecision() && Shift > 0) {
        bits_t Rounded =
            roundQuotient(HiM, Fit.Significand - HiM * Div, Div,
                          RoundingMode::TiesToEven);
        // Keep the truncated high half when rounding up would overflow
        // the half format.
        bool Carry = Rounded >= Half.significandLimit();
        if (!Carry || Fit.Exponent + Shift + 1 <=
                          Half.maxExponent(SignificandMode::Integral))
          HiM = Rounded;
      }
      bits_t Rem = Fit.Significand - HiM * Div;
      Hi = FloatValue(Val.sign(), HiM, Fit.Exponent + Shift);
      if (Rem != 0)
        Lo = FloatValue(Rem < 0 ? -Val.sign() : Val.sign(), abs(Rem),
                        Fit.Exponent);
      break;
    }
    }
  }

  std::optional<EncodedBytes> HiBytes = binary::pack(Half, Hi);
  std::optional<EncodedBytes> LoBytes = binary::pack(Half, Lo);
  if (!HiBytes || !LoBytes)
    return std::nullopt;
  EncodedBytes Result{HiBytes->Bytes, Half.endianness()};
  Result.Bytes.insert(Result.Bytes.end(), LoBytes->Bytes.begin(),
                      LoBytes->Bytes.end());
  return Result;
}

} // namespace paired
} // namespace fltfmt

#endif // FLTFMT_CODEC_PAIRED_HPP
