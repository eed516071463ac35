// Format compilation: derived digits, biases, exponent bounds, slots,
// field layout, derived properties and schema validation.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "harness/test_harness.hpp"

using namespace fltfmt;
using namespace fltfmt::testing;

namespace {

constexpr auto Int = SignificandMode::Integral;
constexpr auto Frac = SignificandMode::Fractional;
constexpr auto Sci = SignificandMode::Scientific;

FormatParams binaryParams(int SigBits, int ExpBits) {
  FormatParams P;
  P.Name = "test_binary";
  P.Fields = {{field::Significand, SigBits},
              {field::Exponent, ExpBits},
              {field::Sign, 1}};
  P.Bias = (1L << (ExpBits - 1)) - 1;
  P.GradualUnderflow = true;
  P.Infinity = true;
  P.Nan = true;
  return P;
}

void checkBiasConventions(const FormatSpec &Spec) {
  INFO(Spec.name());
  CHECK(Spec.bias(Frac) == Spec.bias(Sci) - 1);
  CHECK(Spec.bias(Int) == Spec.bias(Frac) + Spec.significandDigits());
  CHECK(Spec.minExponent(Sci) ==
        Spec.minExponent(Int) + Spec.significandDigits() - 1);
  CHECK(Spec.maxExponent(Frac) ==
        Spec.maxExponent(Int) + Spec.significandDigits());
  CHECK(Spec.minExponent(Int) <= Spec.maxExponent(Int));
}

} // namespace

// ===================================================================
// IEEE binary
// ===================================================================

TEST_CASE("binary64 layout") {
  const FormatSpec &B64 = formats::ieeeBinary64();
  CHECK(B64.radix() == 2);
  CHECK(B64.significandDigits() == 53);
  CHECK(B64.hiddenBit());
  CHECK(B64.bias(Sci) == 1023L);
  CHECK(B64.bias(Frac) == 1022L);
  CHECK(B64.bias(Int) == 1075L);
  CHECK(B64.minExponent(Int) == -1074L);
  CHECK(B64.maxExponent(Int) == 971L);
  CHECK(B64.minExponent(Sci) == -1022L);
  CHECK(B64.maxExponent(Sci) == 1023L);
  CHECK(B64.totalBytes() == size_t(8));
  CHECK(B64.zeroEncodedExponent() == 0L);
  CHECK(B64.denormalEncodedExponent() == 0L);
  CHECK(B64.infiniteEncodedExponent() == 2047L);
  CHECK(B64.nanEncodedExponent() == 2047L);
  CHECK(B64.minEncodedExponent() == 1L);
  CHECK(B64.maxEncodedExponent() == 2046L);
  CHECK(B64.gradualUnderflow());
}

TEST_CASE("other binary layouts") {
  const FormatSpec &X87 = formats::x87Extended();
  CHECK(X87.significandDigits() == 64);
  CHECK_FALSE(X87.hiddenBit());
  CHECK(X87.bias(Int) == 16446L);
  CHECK(X87.minExponent(Sci) == -16382L);
  CHECK(X87.maxExponent(Sci) == 16383L);
  CHECK(X87.totalBytes() == size_t(10));

  const FormatSpec &Mbf = formats::mbfSingle();
  CHECK(Mbf.minEncodedExponent() == 1L);
  CHECK_FALSE(Mbf.gradualUnderflow());
  CHECK_FALSE(Mbf.hasInfinity());
  CHECK_FALSE(Mbf.hasNan());

  // Negative exponents are stored one lower, so stored 0 cannot hold one.
  const FormatSpec &Cdc = formats::cdcSingle();
  CHECK(Cdc.minExponent(Int) == -1023L);
  CHECK(Cdc.maxExponent(Int) == 1023L);

  const FormatSpec &Apple = formats::appleII();
  CHECK(Apple.significandDigits() == 23);
  CHECK(Apple.bias(Sci) == 128L);
  CHECK(Apple.minEncodedExponent() == 0L);
  CHECK(Apple.minExponent(Int) == -150L);
  CHECK(Apple.maxExponent(Int) == 105L);
  CHECK(Apple.gradualUnderflow());
  CHECK(Apple.negation() == NegMode::RadixComplementSignificand);
  CHECK(static_cast<bool>(Apple.negateHook()));
  CHECK(Apple.totalBytes() == size_t(4));
}

TEST_CASE("diminished negative exponents raise the minimum") {
  FormatParams P;
  P.Name = "diminished";
  P.Fields = {{field::Significand, 48}, {field::Exponent, 11}, {field::Sign, 1}};
  P.HiddenBit = false;
  P.Bias = 1024;
  P.BiasMode = Int;
  P.ExpAdjust = ExponentAdjust::DiminishedNegative;
  CHECK(FormatSpec::compile(P).minExponent(Int) == -1023L);

  P.ExpAdjust = ExponentAdjust::None;
  CHECK(FormatSpec::compile(P).minExponent(Int) == -1024L);
}

// ===================================================================
// IEEE decimal
// ===================================================================

TEST_CASE("decimal layouts") {
  const FormatSpec &D32 = formats::ieeeDecimal32();
  CHECK(D32.radix() == 10);
  CHECK(D32.significandDigits() == 7);
  CHECK(D32.exponentDigits() == 8);
  CHECK(D32.bias(Int) == 101L);
  CHECK(D32.minExponent(Sci) == -95L);
  CHECK(D32.maxExponent(Sci) == 96L);
  CHECK(D32.minExponent(Int) == -101L);
  CHECK(D32.maxExponent(Int) == 90L);
  CHECK(D32.totalBytes() == size_t(4));

  CHECK(formats::ieeeDecimal64().significandDigits() == 16);
  CHECK(formats::ieeeDecimal64().bias(Int) == 398L);
  CHECK(formats::ieeeDecimal128().significandDigits() == 34);
  CHECK(formats::ieeeDecimal128().bias(Int) == 6176L);
  CHECK(formats::ieeeDecimal128().maxExponent(Sci) == 6144L);
}

// ===================================================================
// Hexadecimal, BCD, paired
// ===================================================================

TEST_CASE("hexadecimal layouts") {
  const FormatSpec &Ibm = formats::ibm32();
  CHECK(Ibm.radix() == 16);
  CHECK(Ibm.exponentRadix() == 2);
  CHECK(Ibm.significandDigits() == 6);
  CHECK(Ibm.bias(Frac) == 64L);
  CHECK(Ibm.bias(Int) == 70L);
  CHECK(Ibm.minExponent(Int) == -70L);
  CHECK(Ibm.maxExponent(Int) == 57L);

  const FormatSpec &Ibm128 = formats::ibm128();
  CHECK(Ibm128.significandDigits() == 28);
  CHECK(Ibm128.fieldWidth(field::Significand) == 112);
  CHECK(Ibm128.fieldPieces(field::Significand) == std::vector<int>{0, 3});
  CHECK(Ibm128.totalBytes() == size_t(16));
}

TEST_CASE("BCD layouts") {
  const FormatSpec &Hp = formats::hp71b();
  CHECK(Hp.radix() == 10);
  CHECK(Hp.unitBits() == 4);
  CHECK(Hp.exponentMode() == ExponentMode::RadixComplement);
  CHECK(Hp.minExponent(Sci) == -499L);
  CHECK(Hp.maxExponent(Sci) == 499L);
  CHECK(Hp.minExponent(Int) == -510L);
  CHECK(Hp.maxExponent(Int) == 488L);
  CHECK(Hp.denormalEncodedExponent() == 0x501L);
  CHECK(Hp.infiniteEncodedExponent() == 0xF00L);
  CHECK(Hp.nanEncodedExponent() == 0xF01L);
  CHECK(Hp.totalBits() == size_t(64));
  CHECK(Hp.minusSignValue() == 9);
  CHECK_FALSE(Hp.slotNumber(0xF00).has_value());
  CHECK(Hp.slotNumber(0x501) == 501L);
  CHECK(Hp.slotCode(501) == 0x501L);

  CHECK(formats::saturn().totalBits() == size_t(84));
}

TEST_CASE("double-double layout") {
  const FormatSpec &Dd = formats::doubleDouble();
  CHECK(Dd.significandDigits() == 107);
  // Below 2^-968 precision tapers down to the half's smallest subnormal.
  CHECK(Dd.minExponent(Int) == -1074L);
  CHECK(Dd.minExponent(Sci) == -968L);
  CHECK(Dd.maxExponent(Sci) == 1023L);
  CHECK(Dd.gradualUnderflow());
  CHECK(Dd.totalBytes() == size_t(16));
  CHECK(Dd.half().name() == "IEEE_binary64");
}

TEST_CASE("bias conventions hold for every catalog format") {
  for (const FormatSpec *Spec :
       {&formats::ieeeBinary16(), &formats::ieeeBinary32(),
        &formats::ieeeBinary64(), &formats::ieeeBinary128(),
        &formats::x87Extended(), &formats::ieeeDecimal32(),
        &formats::ieeeDecimal64(), &formats::ibm32(), &formats::ibm64(),
        &formats::vaxF(), &formats::vaxG(), &formats::mbfSingle(),
        &formats::cdcSingle(), &formats::appleII(), &formats::hp71b(),
        &formats::doubleDouble()})
    checkBiasConventions(*Spec);
}

// ===================================================================
// Derived properties
// ===================================================================

TEST_CASE("decimal properties") {
  const FormatSpec &B64 = formats::ieeeBinary64();
  const FormatSpec &D32 = formats::ieeeDecimal32();
  const FormatSpec &Dd = formats::doubleDouble();
  CHECK(decimalDigitsStored(B64) == 15);
  CHECK(decimalDigitsNecessary(B64) == 17);
  CHECK(decimalMaxExp(B64) == 308L);
  CHECK(decimalMinExp(B64) == -307L);
  CHECK(decimalDigitsStored(formats::ieeeBinary32()) == 6);
  CHECK(decimalDigitsNecessary(formats::ieeeBinary32()) == 9);
  CHECK(decimalDigitsStored(D32) == 7);
  CHECK(decimalDigitsNecessary(D32) == 7);
  CHECK(decimalMaxExp(D32) == 96L);
  CHECK(decimalMinExp(D32) == -95L);
  CHECK(decimalDigitsStored(Dd) == 31);
  CHECK(decimalDigitsNecessary(Dd) == 34);
}

TEST_CASE("extreme values") {
  const FormatSpec &B64 = formats::ieeeBinary64();
  const FormatSpec &Ibm = formats::ibm32();
  CHECK(maxValue(B64) == FloatValue(+1, (bits_t(1) << 53) - 1, 971));
  CHECK(minValue(B64) == FloatValue(+1, 1, -1074));
  CHECK(minNormalizedValue(B64) == FloatValue(+1, bits_t(1) << 52, -1074));
  CHECK(minValue(Ibm) == FloatValue(+1, bits_t(1) << 20, -70));
  CHECK(minValue(formats::cdcSingle()) ==
        FloatValue(+1, bits_t(1) << 47, -1023));
  CHECK(epsilon(B64) == FloatValue(+1, 1, -52));
  CHECK(halfEpsilon(B64) == FloatValue(+1, 1, -53));
  CHECK(compareValues(B64, strictEpsilon(B64), halfEpsilon(B64)) ==
        std::partial_ordering::greater);
  CHECK(strictEpsilon(formats::hp71b()) == FloatValue(+1, 500000000001, -23));
  CHECK(infinityOf(B64).has_value());
  CHECK_FALSE(infinityOf(Ibm).has_value());
  CHECK(nanOf(B64).has_value());
  CHECK_FALSE(nanOf(formats::mbfSingle()).has_value());
}

// ===================================================================
// Schema errors
// ===================================================================

TEST_CASE("schema errors") {
  CHECK_THROWS_AS((void)FormatSpec::compile(FormatParams{}), SchemaError);

  {
    // Missing exponent field.
    FormatParams P = binaryParams(23, 8);
    P.Fields = {{field::Significand, 23}, {field::Sign, 1}};
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    FormatParams P = binaryParams(23, 8);
    P.Fields.push_back({"pad", 0});
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    // Infinity on the zero slot.
    FormatParams P = binaryParams(23, 8);
    P.InfiniteEncodedExp = 0;
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    // Hexadecimal significand that is not whole nibbles.
    FormatParams P = formats::detail::ibm("bad_hex", 22);
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    // Radix complement across a binary exponent and a hex significand.
    FormatParams P = formats::detail::ibm("bad_complement", 24);
    P.Negation = NegMode::RadixComplement;
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    FormatParams P = formats::detail::ieeeDecimal("bad_dpd", 21, 6);
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    // DPD without a sign field.
    FormatParams P = formats::detail::ieeeDecimal("bad_dpd", 20, 6);
    P.Fields.pop_back();
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    FormatParams P = formats::detail::hpBcd("split_bcd");
    P.Fields.push_back({field::Significand, 2});
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    FormatParams P = formats::detail::hpBcd("same_slots");
    P.InfiniteEncodedExp = 0xF00;
    P.NanEncodedExp = 0xF00;
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    FormatParams P;
    P.Name = "half_less";
    P.Kind = Family::PairedDouble;
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    FormatParams P = binaryParams(23, 8);
    P.MinExp = 10;
    P.MaxExp = -10;
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);
  }
  {
    // A bias means excess notation; complement exponents have none.
    FormatParams P = binaryParams(23, 8);
    P.ExpMode = ExponentMode::RadixComplement;
    CHECK_THROWS_AS((void)FormatSpec::compile(P), SchemaError);

    FormatParams Hp = formats::detail::hpBcd("biased_complement");
    Hp.Bias = 500;
    CHECK_THROWS_AS((void)FormatSpec::compile(Hp), SchemaError);

    Hp.Bias = 0;
    CHECK_NOTHROW((void)FormatSpec::compile(Hp));
  }
}

TEST_CASE("custom formats compile like catalog ones") {
  FormatSpec Custom = FormatSpec::compile(binaryParams(10, 5));
  CHECK(Custom.bias(Sci) == 15L);
  CHECK(Custom.maxExponent(Int) == formats::ieeeBinary16().maxExponent(Int));
}
