#ifndef FLTFMT_NUMERAL_NUMERAL_HPP
#define FLTFMT_NUMERAL_NUMERAL_HPP

// Decimal numeral text: [+-]digits[.digits][e[+-]digits], "inf",
// "infinity" and "nan" in any case.

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "fltfmt/core/exceptions.hpp"

namespace fltfmt {

struct Numeral {
  enum class Kind { Finite, Infinity, NaN };

  Kind Special = Kind::Finite;
  bool Negative = false;
  // Value is Digits * 10^Exponent. No leading zeros; empty means zero.
  std::string Digits;
  long Exponent = 0;

  bool isZero() const { return Special == Kind::Finite && Digits.empty(); }
};

enum class Notation { General, Scientific, Fixed };

namespace detail {

inline bool equalsIgnoreCase(std::string_view A, std::string_view B) {
  return A.size() == B.size() &&
         std::equal(A.begin(), A.end(), B.begin(), [](char X, char Y) {
           return std::tolower(static_cast<unsigned char>(X)) ==
                  std::tolower(static_cast<unsigned char>(Y));
         });
}

inline bool isDigit(char C) {
  return std::isdigit(static_cast<unsigned char>(C)) != 0;
}

} // namespace detail

inline Numeral readNumeral(std::string_view Text) {
  while (!Text.empty() && std::isspace(static_cast<unsigned char>(Text.front())))
    Text.remove_prefix(1);
  while (!Text.empty() && std::isspace(static_cast<unsigned char>(Text.back())))
    Text.remove_suffix(1);
  const std::string Original(Text);

  Numeral Result;
  if (!Text.empty() && (Text.front() == '+' || Text.front() == '-')) {
    Result.Negative = Text.front() == '-';
    Text.remove_prefix(1);
  }
  if (detail::equalsIgnoreCase(Text, "inf") ||
      detail::equalsIgnoreCase(Text, "infinity")) {
    Result.Special = Numeral::Kind::Infinity;
    return Result;
  }
  if (detail::equalsIgnoreCase(Text, "nan")) {
    Result.Special = Numeral::Kind::NaN;
    Result.Negative = false;
    return Result;
  }

  std::string Digits;
  long FractionDigits = 0;
  size_t Pos = 0;
  while (Pos < Text.size() && detail::isDigit(Text[Pos]))
    Digits += Text[Pos++];
  if (Pos < Text.size() && Text[Pos] == '.') {
    ++Pos;
    while (Pos < Text.size() && detail::isDigit(Text[Pos])) {
      Digits += Text[Pos++];
      ++FractionDigits;
    }
  }
  if (Digits.empty())
    throw NumeralError("no digits in '" + Original + "'");

  long Exponent = 0;
  if (Pos < Text.size() && (Text[Pos] == 'e' || Text[Pos] == 'E')) {
    ++Pos;
    bool NegativeExp = false;
    if (Pos < Text.size() && (Text[Pos] == '+' || Text[Pos] == '-'))
      NegativeExp = Text[Pos++] == '-';
    size_t Start = Pos;
    while (Pos < Text.size() && detail::isDigit(Text[Pos])) {
      if (Pos - Start >= 9)
        throw NumeralError("exponent out of range in '" + Original + "'");
      Exponent = Exponent * 10 + (Text[Pos++] - '0');
    }
    if (Pos == Start)
      throw NumeralError("missing exponent digits in '" + Original + "'");
    if (NegativeExp)
      Exponent = -Exponent;
  }
  if (Pos != Text.size())
    throw NumeralError("unexpected text in '" + Original + "'");

  size_t FirstNonZero = Digits.find_first_not_of('0');
  Result.Digits =
      FirstNonZero == std::string::npos ? "" : Digits.substr(FirstNonZero);
  Result.Exponent = Exponent - FractionDigits;
  return Result;
}

inline std::string writeNumeral(const Numeral &Num,
                                Notation Style = Notation::General,
                                bool Uppercase = false) {
  std::string Sign = Num.Negative ? "-" : "";
  switch (Num.Special) {
  case Numeral::Kind::NaN:
    return "NaN";
  case Numeral::Kind::Infinity:
    return (Num.Negative ? "-" : "+") + std::string("Infinity");
  case Numeral::Kind::Finite:
    break;
  }
  if (Num.Digits.empty())
    return Sign + "0";

  const std::string &D = Num.Digits;
  const long Len = static_cast<long>(D.size());
  const long SciExp = Num.Exponent + Len - 1;

  if (Style == Notation::General)
    Style = SciExp >= -4 && SciExp < 21 ? Notation::Fixed
                                        : Notation::Scientific;

  if (Style == Notation::Scientific) {
    std::string Text = Sign + D.substr(0, 1);
    if (Len > 1)
      Text += "." + D.substr(1);
    Text += Uppercase ? 'E' : 'e';
    return Text + std::to_string(SciExp);
  }

  if (Num.Exponent >= 0)
    return Sign + D + std::string(static_cast<size_t>(Num.Exponent), '0');
  long Point = Len + Num.Exponent;
  if (Point <= 0)
    return Sign + "0." + std::string(static_cast<size_t>(-Point), '0') + D;
  return Sign + D.substr(0, static_cast<size_t>(Point)) + "." +
         D.substr(static_cast<size_t>(Point));
}

} // namespace fltfmt

#endif // FLTFMT_NUMERAL_NUMERAL_HPP
