#ifndef FLTFMT_CORE_FORMAT_HPP
#define FLTFMT_CORE_FORMAT_HPP

// FormatSpec: the compiled, immutable description of a storage format.
//
// FormatParams is the raw parameter record a caller fills in. compile()
// validates it and derives everything the codecs need: digit counts,
// the three equivalent exponent biases, exponent bounds in each
// significand interpretation, and the reserved encoded-exponent slots.
//
// Reserved slots (zero, denormal, infinity, NaN) are stored field codes.
// For BCD formats a code is the nibble pattern (0xF00 is a legal slot
// even though it is not a decimal number). Minimum and maximum encoded
// exponents are numeric.

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fltfmt/core/bits.hpp"
#include "fltfmt/core/bytes.hpp"
#include "fltfmt/core/dpd.hpp"
#include "fltfmt/core/enums.hpp"
#include "fltfmt/core/exceptions.hpp"
#include "fltfmt/core/rounding.hpp"

namespace fltfmt {

class FormatSpec;

// One declared field. Width is in bits, except for BCD formats where it
// is in decimal digits (one nibble each). A name may appear more than
// once; the pieces form one logical field, first piece least significant.
struct FieldDef {
  std::string Name;
  int Width = 0;
};

// Raw field values in declared order: bit-field integers, or nibble
// codes for BCD.
using FieldValues = std::vector<bits_t>;

// Run on the raw field list right before it is packed, or right after
// it is unpacked.
using FieldsHook = std::function<void(FieldValues &)>;

// Run on the significand and numeric exponent fields of a negative value
// after the format's negation rule. Packing tells the direction.
using NegationHook =
    std::function<void(bits_t &Significand, long &Exponent, bool Packing)>;

struct FormatParams {
  std::string Name;
  Family Kind = Family::Binary;
  std::vector<FieldDef> Fields;

  bool HiddenBit = true; // Binary only

  std::optional<long> Bias;
  SignificandMode BiasMode = SignificandMode::Scientific;
  std::optional<ExponentMode> ExpMode;
  // Exponent bounds, in BiasMode for excess formats and in scientific
  // form for radix-complement formats.
  std::optional<long> MinExp;
  std::optional<long> MaxExp;

  std::optional<long> MinEncodedExp;
  std::optional<long> MaxEncodedExp;
  std::optional<long> ZeroEncodedExp;
  std::optional<long> DenormalEncodedExp;
  std::optional<long> InfiniteEncodedExp;
  std::optional<long> NanEncodedExp;

  bool GradualUnderflow = false;
  bool Infinity = false;
  bool Nan = false;

  Endianness Order = Endianness::Little;
  bool BitsLittleEndian = false;
  RoundingMode Rounding = RoundingMode::TiesToEven;
  NegMode Negation = NegMode::SignMagnitude;
  ExponentAdjust ExpAdjust = ExponentAdjust::None;
  FieldsHook PackHook;
  FieldsHook UnpackHook;
  NegationHook NegateHook;

  // PairedDouble only.
  std::shared_ptr<const FormatSpec> Half;
  bool ExtraPrecision = true;
};

namespace field {
inline constexpr const char *Sign = "sign";
inline constexpr const char *Exponent = "exponent";
inline constexpr const char *Significand = "significand";
inline constexpr const char *Combination = "combination";
inline constexpr const char *ExponentContinuation = "exponent_continuation";
inline constexpr const char *SignificandContinuation =
    "significand_continuation";
} // namespace field

class FormatSpec {
public:
  static FormatSpec compile(const FormatParams &Params);

  const std::string &name() const { return Name; }
  Family family() const { return Kind; }
  int radix() const { return Radix; }
  int exponentRadix() const { return ExpRadix; }
  int significandDigits() const { return Digits; }
  bool hiddenBit() const { return HiddenBit; }
  int exponentDigits() const { return ExpDigits; }
  ExponentMode exponentMode() const { return ExpMode; }

  long bias(SignificandMode Mode = SignificandMode::Scientific) const {
    return Biases[index(Mode)];
  }
  long minExponent(SignificandMode Mode = SignificandMode::Scientific) const {
    return MinExps[index(Mode)];
  }
  long maxExponent(SignificandMode Mode = SignificandMode::Scientific) const {
    return MaxExps[index(Mode)];
  }

  long zeroEncodedExponent() const { return ZeroSlot; }
  std::optional<long> denormalEncodedExponent() const { return DenormalSlot; }
  std::optional<long> infiniteEncodedExponent() const { return InfSlot; }
  std::optional<long> nanEncodedExponent() const { return NanSlot; }
  long minEncodedExponent() const { return MinEncoded; }
  long maxEncodedExponent() const { return MaxEncoded; }

  bool gradualUnderflow() const { return Gradual; }
  bool hasInfinity() const { return InfSlot.has_value(); }
  bool hasNan() const { return NanSlot.has_value(); }

  Endianness endianness() const { return Order; }
  bool bitsLittleEndian() const { return BitsLE; }
  RoundingMode rounding() const { return Round; }
  NegMode negation() const { return Negation; }
  ExponentAdjust exponentAdjust() const { return ExpAdjust; }
  const FieldsHook &packHook() const { return PackHook; }
  const FieldsHook &unpackHook() const { return UnpackHook; }
  const NegationHook &negateHook() const { return NegateHook; }

  const FormatSpec &half() const { return *Half; }
  bool extraPrecision() const { return ExtraPrecision; }

  const std::vector<FieldDef> &fields() const { return Layout; }
  const std::vector<int> &widths() const { return Widths; }
  // Bits per width unit: 4 for BCD nibbles, 1 otherwise.
  int unitBits() const { return Kind == Family::BCD ? 4 : 1; }
  bool hasField(const std::string &Field) const {
    return Pieces.count(Field) != 0;
  }
  // Indices of the pieces of a logical field; empty when absent.
  const std::vector<int> &fieldPieces(const std::string &Field) const {
    static const std::vector<int> None;
    auto It = Pieces.find(Field);
    return It == Pieces.end() ? None : It->second;
  }
  // Aggregated width in declared units.
  int fieldWidth(const std::string &Field) const {
    int Total = 0;
    for (int I : fieldPieces(Field))
      Total += Widths[I];
    return Total;
  }
  // Width of the significand field in radix digits.
  int significandFieldDigits() const { return SigFieldDigits; }
  // Value of the sign field for negative numbers.
  int minusSignValue() const { return Kind == Family::BCD ? 9 : 1; }

  size_t totalBits() const { return TotalBits; }
  size_t totalBytes() const { return (TotalBits + 7) / 8; }

  // Significand bounds r^(digits-1) and r^digits.
  bits_t minNormalSignificand() const {
    return radixPower(Radix, Digits - 1);
  }
  bits_t significandLimit() const { return radixPower(Radix, Digits); }

  // BCD slot codes are nibble patterns; everything else is numeric.
  std::optional<long> slotNumber(long Code) const {
    if (Kind != Family::BCD)
      return Code;
    bits_t Val;
    if (!nibblesToDecimal(bits_t(Code), Val))
      return std::nullopt;
    return Val.get_si();
  }
  long slotCode(long Number) const {
    if (Kind != Family::BCD)
      return Number;
    return decimalToNibbles(bits_t(Number), ExpDigits).get_si();
  }

private:
  FormatSpec() = default;

  static int index(SignificandMode Mode) { return static_cast<int>(Mode); }

  void compileLayout(const FormatParams &Params);
  void compileSlots(const FormatParams &Params);
  void compileExponents(const FormatParams &Params);
  void compilePaired(const FormatParams &Params);
  void setBounds(long IntegralMin, long IntegralMax);

  std::string Name;
  Family Kind = Family::Binary;
  std::vector<FieldDef> Layout;
  std::vector<int> Widths;
  std::map<std::string, std::vector<int>> Pieces;

  int Radix = 2;
  int ExpRadix = 2;
  int Digits = 0;
  int SigFieldDigits = 0;
  bool HiddenBit = false;
  int ExpDigits = 0;
  ExponentMode ExpMode = ExponentMode::Excess;

  long Biases[3] = {0, 0, 0};
  long MinExps[3] = {0, 0, 0};
  long MaxExps[3] = {0, 0, 0};

  long ZeroSlot = 0;
  std::optional<long> DenormalSlot;
  std::optional<long> InfSlot;
  std::optional<long> NanSlot;
  long MinEncoded = 0;
  long MaxEncoded = 0;

  bool Gradual = false;
  Endianness Order = Endianness::Little;
  bool BitsLE = false;
  RoundingMode Round = RoundingMode::TiesToEven;
  NegMode Negation = NegMode::SignMagnitude;
  ExponentAdjust ExpAdjust = ExponentAdjust::None;
  FieldsHook PackHook;
  FieldsHook UnpackHook;
  NegationHook NegateHook;

  std::shared_ptr<const FormatSpec> Half;
  bool ExtraPrecision = true;

  size_t TotalBits = 0;
};

// ===================================================================
// Compilation
// ===================================================================

inline void FormatSpec::compileLayout(const FormatParams &Params) {
  if (Params.Fields.empty())
    throw SchemaError(Params.Name + ": no fields declared");
  for (size_t I = 0; I < Params.Fields.size(); ++I) {
    const FieldDef &F = Params.Fields[I];
    if (F.Width <= 0)
      throw SchemaError(Params.Name + ": field '" + F.Name +
                        "' has non-positive width");
    Layout.push_back(F);
    Widths.push_back(F.Width);
    Pieces[F.Name].push_back(static_cast<int>(I));
  }

  bool Splittable = Kind == Family::Binary || Kind == Family::Hexadecimal;
  for (const auto &[FieldName, Idx] : Pieces)
    if (Idx.size() > 1 && !Splittable)
      throw SchemaError(Params.Name + ": field '" + FieldName +
                        "' is split but this family does not allow splits");

  TotalBits = fieldsTotalBits(Widths, unitBits());

  if (Kind == Family::DPD) {
    for (const char *Required :
         {field::Sign, field::Combination, field::ExponentContinuation,
          field::SignificandContinuation})
      if (!hasField(Required))
        throw SchemaError(Params.Name + ": DPD format lacks field '" +
                          Required + "'");
    if (fieldWidth(field::Sign) != 1 || fieldWidth(field::Combination) != 5)
      throw SchemaError(Params.Name +
                        ": DPD needs a 1-bit sign and 5-bit combination");
    int Cont = dpd::continuationDigits(
        fieldWidth(field::SignificandContinuation));
    if (Cont < 0)
      throw SchemaError(Params.Name +
                        ": DPD significand continuation must be 10k, "
                        "10k+4 or 10k+7 bits");
    Radix = 10;
    ExpRadix = 2;
    Digits = 1 + Cont;
    SigFieldDigits = Digits;
    HiddenBit = false;
    ExpDigits = 2 + fieldWidth(field::ExponentContinuation);
    return;
  }

  if (!hasField(field::Significand) || !hasField(field::Exponent))
    throw SchemaError(Params.Name +
                      ": significand and exponent fields are required");
  int SigWidth = fieldWidth(field::Significand);
  ExpDigits = fieldWidth(field::Exponent);

  switch (Kind) {
  case Family::Binary:
    Radix = 2;
    ExpRadix = 2;
    HiddenBit = Params.HiddenBit;
    SigFieldDigits = SigWidth;
    Digits = SigWidth + (HiddenBit ? 1 : 0);
    break;
  case Family::Hexadecimal:
    if (SigWidth % 4 != 0)
      throw SchemaError(Params.Name +
                        ": hexadecimal significand must be whole nibbles");
    Radix = 16;
    ExpRadix = 2;
    HiddenBit = false;
    SigFieldDigits = SigWidth / 4;
    Digits = SigFieldDigits;
    break;
  case Family::BCD:
    Radix = 10;
    ExpRadix = 10;
    HiddenBit = false;
    SigFieldDigits = SigWidth;
    Digits = SigWidth;
    break;
  default:
    break;
  }

  if (Params.Negation == NegMode::RadixComplement && ExpRadix != Radix)
    throw SchemaError(Params.Name + ": radix-complement negation needs the "
                                    "exponent and significand in one radix");
}

inline void FormatSpec::compileSlots(const FormatParams &Params) {
  auto Number = [this](long Code) { return slotNumber(Code); };

  ZeroSlot = Params.ZeroEncodedExp.value_or(0);
  MinEncoded = Params.MinEncodedExp.value_or(0);
  DenormalSlot = Params.DenormalEncodedExp;
  Gradual = Params.GradualUnderflow || DenormalSlot.has_value();
  if (Gradual) {
    if (!DenormalSlot)
      DenormalSlot = 0;
    std::optional<long> D = Number(*DenormalSlot);
    if (D && *D >= MinEncoded) {
      MinEncoded = *D;
      if (HiddenBit)
        ++MinEncoded;
    }
  }
  if (MinEncoded == Number(ZeroSlot) && HiddenBit &&
      !Params.MinEncodedExp)
    ++MinEncoded;

  MaxEncoded = Params.MaxEncodedExp.value_or(
      radixPower(ExpRadix, ExpDigits).get_si() - 1);

  auto Reserve = [&](std::optional<long> &Slot) {
    std::optional<long> N = Number(*Slot);
    if (N && *N <= MaxEncoded)
      MaxEncoded = *N - 1;
  };
  if (Params.Infinity || Params.InfiniteEncodedExp) {
    InfSlot = Params.InfiniteEncodedExp;
    if (!InfSlot)
      InfSlot = Params.NanEncodedExp ? *Params.NanEncodedExp
                                     : slotCode(MaxEncoded);
    Reserve(InfSlot);
  }
  if (Params.Nan || Params.NanEncodedExp) {
    NanSlot = Params.NanEncodedExp;
    if (!NanSlot)
      NanSlot = InfSlot ? *InfSlot : slotCode(MaxEncoded);
    Reserve(NanSlot);
  }

  for (const std::optional<long> &Special : {InfSlot, NanSlot}) {
    if (!Special)
      continue;
    if (*Special == ZeroSlot || (DenormalSlot && *Special == *DenormalSlot))
      throw SchemaError(Params.Name +
                        ": special exponent slot overlaps zero/denormal");
  }
  if (Kind == Family::BCD && InfSlot && NanSlot && *InfSlot == *NanSlot)
    throw SchemaError(Params.Name +
                      ": BCD infinity and NaN need distinct exponent slots");
}

inline void FormatSpec::setBounds(long IntegralMin, long IntegralMax) {
  const int S = index(SignificandMode::Scientific);
  const int F = index(SignificandMode::Fractional);
  const int I = index(SignificandMode::Integral);
  MinExps[I] = IntegralMin;
  MaxExps[I] = IntegralMax;
  MinExps[F] = IntegralMin + Digits;
  MaxExps[F] = IntegralMax + Digits;
  MinExps[S] = IntegralMin + Digits - 1;
  MaxExps[S] = IntegralMax + Digits - 1;
}

inline void FormatSpec::compileExponents(const FormatParams &Params) {
  std::optional<long> MinExp = Params.MinExp;
  std::optional<long> MaxExp = Params.MaxExp;
  std::optional<long> Bias = Params.Bias;
  SignificandMode Mode = Params.BiasMode;

  if (Kind == Family::DPD && !Bias) {
    long Limit = 3L * (1L << fieldWidth(field::ExponentContinuation)) - 1;
    long Max = Limit / 2;
    long Min = -Max;
    if (Limit % 2 == 1)
      ++Max;
    Bias = -Min;
    Mode = SignificandMode::Scientific;
    if (!MinExp)
      MinExp = Min;
    if (!MaxExp)
      MaxExp = Max;
  }

  ExpMode = Params.ExpMode.value_or(Bias ? ExponentMode::Excess
                                         : ExponentMode::RadixComplement);
  const int S = index(SignificandMode::Scientific);
  const int F = index(SignificandMode::Fractional);
  const int I = index(SignificandMode::Integral);
  const long N = Digits;

  if (ExpMode == ExponentMode::RadixComplement) {
    if (Bias && *Bias != 0)
      throw SchemaError(Params.Name +
                        ": a bias cannot be combined with a radix-complement "
                        "exponent");
    long Span = radixPower(ExpRadix, ExpDigits).get_si();
    long SciMin = MinExp.value_or(-(Span / 2) + 1);
    long SciMax = MaxExp.value_or(Span / 2 - 1);
    Biases[S] = 0;
    Biases[F] = -1;
    Biases[I] = N - 1;
    setBounds(SciMin - (N - 1), SciMax - (N - 1));
    return;
  }

  long B = Bias.value_or(radixPower(ExpRadix, ExpDigits - 1).get_si() - 1);
  switch (Mode) {
  case SignificandMode::Integral:
    Biases[I] = B;
    Biases[F] = B - N;
    Biases[S] = Biases[F] + 1;
    break;
  case SignificandMode::Fractional:
    Biases[F] = B;
    Biases[I] = B + N;
    Biases[S] = B + 1;
    if (MinExp)
      *MinExp -= N;
    if (MaxExp)
      *MaxExp -= N;
    break;
  case SignificandMode::Scientific:
    Biases[S] = B;
    Biases[F] = B - 1;
    Biases[I] = Biases[F] + N;
    if (MinExp)
      *MinExp -= N - 1;
    if (MaxExp)
      *MaxExp -= N - 1;
    break;
  }
  long IntegralMin = MinExp.value_or(MinEncoded - Biases[I]);
  // Negative exponents are stored one lower, so the lowest stored value
  // cannot hold a negative exponent.
  if (!MinExp && ExpAdjust == ExponentAdjust::DiminishedNegative &&
      IntegralMin < 0)
    ++IntegralMin;
  setBounds(IntegralMin, MaxExp.value_or(MaxEncoded - Biases[I]));
}

inline void FormatSpec::compilePaired(const FormatParams &Params) {
  if (!Params.Half)
    throw SchemaError(Params.Name + ": paired format needs a half format");
  if (Params.Half->family() != Family::Binary)
    throw SchemaError(Params.Name + ": paired halves must be binary");
  Half = Params.Half;
  ExtraPrecision = Params.ExtraPrecision;

  Radix = 2;
  ExpRadix = 2;
  HiddenBit = false;
  Digits = 2 * Half->significandDigits() + (ExtraPrecision ? 1 : 0);
  SigFieldDigits = Digits;
  ExpDigits = Half->exponentDigits();
  ExpMode = ExponentMode::Excess;
  Order = Half->endianness();
  BitsLE = Half->bitsLittleEndian();
  TotalBits = 2 * Half->totalBytes() * 8;

  const int S = index(SignificandMode::Scientific);
  const int F = index(SignificandMode::Fractional);
  const int I = index(SignificandMode::Integral);
  Biases[S] = Half->bias(SignificandMode::Scientific);
  Biases[F] = Biases[S] - 1;
  Biases[I] = Biases[F] + Digits;
  long SciMax = Half->maxExponent(SignificandMode::Scientific);
  setBounds(Half->minExponent(SignificandMode::Integral),
            SciMax - (Digits - 1));

  Gradual = true;
  ZeroSlot = Half->zeroEncodedExponent();
  MinEncoded = Half->minEncodedExponent();
  MaxEncoded = Half->maxEncodedExponent();
  InfSlot = Half->infiniteEncodedExponent();
  NanSlot = Half->nanEncodedExponent();
}

inline FormatSpec FormatSpec::compile(const FormatParams &Params) {
  FormatSpec Spec;
  Spec.Name = Params.Name;
  Spec.Kind = Params.Kind;
  Spec.Order = Params.Order;
  Spec.BitsLE = Params.BitsLittleEndian;
  Spec.Round = Params.Rounding;
  Spec.Negation = Params.Negation;
  Spec.ExpAdjust = Params.ExpAdjust;
  Spec.PackHook = Params.PackHook;
  Spec.UnpackHook = Params.UnpackHook;
  Spec.NegateHook = Params.NegateHook;

  if (Params.Kind == Family::PairedDouble) {
    Spec.compilePaired(Params);
    return Spec;
  }
  Spec.compileLayout(Params);
  Spec.compileSlots(Params);
  Spec.compileExponents(Params);
  if (Spec.minExponent(SignificandMode::Integral) >
      Spec.maxExponent(SignificandMode::Integral))
    throw SchemaError(Params.Name + ": empty exponent range");
  return Spec;
}

} // namespace fltfmt

#endif // FLTFMT_CORE_FORMAT_HPP
