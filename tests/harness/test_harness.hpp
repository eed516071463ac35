#ifndef FLTFMT_TESTS_HARNESS_TEST_HARNESS_HPP
#define FLTFMT_TESTS_HARNESS_TEST_HARNESS_HPP

// "This against that" test harness.
//
// testAgainst(Name, Iter, ImplA, ImplB)
//   runs ImplA and ImplB on every input yielded by Iter and compares
//   their std::string outputs. Both implementations are opaque callables
//   Input -> std::string; the harness does not know what backs them.

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include "fltfmt/fltfmt.hpp"

namespace fltfmt::testing {

// ===================================================================
// Printing
// ===================================================================

inline std::string describe(const std::string &S) { return "'" + S + "'"; }
inline std::string describe(const char *S) { return describe(std::string(S)); }
inline std::string describe(const bits_t &V) { return "0x" + V.get_str(16); }
inline std::string describe(const std::vector<uint8_t> &Bytes) {
  return toHex(Bytes);
}
inline std::string describe(const EncodedBytes &Data) {
  return toHex(Data.Bytes);
}
inline std::string describe(const std::optional<EncodedBytes> &Data) {
  return Data ? toHex(Data->Bytes) : std::string("(none)");
}
template <typename T>
std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                 std::string>
describe(T V) {
  return std::to_string(V);
}

// ===================================================================
// Results
// ===================================================================

struct TestResult {
  int Total = 0;
  int Passed = 0;
  int Failed = 0;
};

// ===================================================================
// testAgainst: the harness
// ===================================================================

static constexpr int MaxReportedFailures = 10;

template <typename IterFn, typename ImplA, typename ImplB>
TestResult testAgainst(const char *Name, IterFn Iter, ImplA A, ImplB B) {
  TestResult R;
  int NumReported = 0;

  Iter([&](const auto &Input) {
    R.Total++;
    std::string OA = A(Input);
    std::string OB = B(Input);
    if (OA == OB) {
      R.Passed++;
      return;
    }
    R.Failed++;
    if (NumReported < MaxReportedFailures) {
      ++NumReported;
      std::fprintf(stderr, "  FAIL %s: input=%s  implA=%s implB=%s\n", Name,
                   describe(Input).c_str(), OA.c_str(), OB.c_str());
    }
  });

  std::printf("%s: %d/%d passed", Name, R.Passed, R.Total);
  if (R.Failed > 0)
    std::printf(" (%d FAILED)", R.Failed);
  std::printf("\n");
  return R;
}

// ===================================================================
// Iteration strategies
// ===================================================================

// Every value from a fixed list.
template <typename Input> struct TargetedValues {
  const Input *Values;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    for (int I = 0; I < Count; ++I)
      Callback(Values[I]);
  }
};

// Uniform random bit patterns of a given width.
struct RandomBits {
  uint64_t Seed;
  int Count;
  int Bits;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::mt19937_64 Rng(Seed);
    for (int I = 0; I < Count; ++I) {
      bits_t Val = 0;
      for (int Done = 0; Done < Bits; Done += 32)
        Val = (Val << 32) + static_cast<unsigned long>(Rng() & 0xFFFFFFFFu);
      Val &= (bits_t(1) << static_cast<mp_bitcnt_t>(Bits)) - 1;
      Callback(Val);
    }
  }
};

// Random decimal numerals: up to MaxDigits significant digits with a
// decimal exponent in [MinExp, MaxExp] and a random sign.
struct RandomDecimals {
  uint64_t Seed;
  int Count;
  int MaxDigits;
  int MinExp;
  int MaxExp;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::mt19937_64 Rng(Seed);
    std::uniform_int_distribution<int> Len(1, MaxDigits);
    std::uniform_int_distribution<int> Digit(0, 9);
    std::uniform_int_distribution<int> Exp(MinExp, MaxExp);
    for (int I = 0; I < Count; ++I) {
      std::string Text = (Rng() & 1) ? "-" : "";
      int N = Len(Rng);
      Text += static_cast<char>('1' + Digit(Rng) % 9);
      for (int K = 1; K < N; ++K)
        Text += static_cast<char>('0' + Digit(Rng));
      Text += "e" + std::to_string(Exp(Rng));
      Callback(Text);
    }
  }
};

// Run multiple strategies in sequence.
template <typename... Strategies> struct Combined {
  std::tuple<Strategies...> Strats;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::apply([&](const auto &...S) { (S(Callback), ...); }, Strats);
  }
};

template <typename... Strategies>
Combined<Strategies...> combined(Strategies... S) {
  return {std::tuple{std::move(S)...}};
}

// ===================================================================
// Shorthands
// ===================================================================

// Hex of the encoding of a numeral, "(none)" when unrepresentable.
inline std::string encodeHex(const FormatSpec &Spec, std::string_view Text) {
  return describe(encodeText(Spec, Text));
}

inline std::string packHex(const FormatSpec &Spec, const FloatValue &V) {
  return describe(pack(Spec, V));
}

inline FloatValue unpackHex(const FormatSpec &Spec, std::string_view Hex) {
  return unpack(Spec, EncodedBytes{fromHex(Hex), Spec.endianness()});
}

} // namespace fltfmt::testing

#endif // FLTFMT_TESTS_HARNESS_TEST_HARNESS_HPP
