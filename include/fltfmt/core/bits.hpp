#ifndef FLTFMT_CORE_BITS_HPP
#define FLTFMT_CORE_BITS_HPP

// bits_t: an unbounded bag of bits.
//
// Encoded words, field values and significands are GMP integers, so a
// format of any width (80-bit x87, 128-bit double-double, 16-digit BCD)
// goes through the same code. Byte import/export uses mpz_import and
// mpz_export with most-significant byte first.

#include <cstddef>
#include <cstdint>
#include <vector>

#include <gmpxx.h>

#include "fltfmt/core/exceptions.hpp"

namespace fltfmt {

using bits_t = mpz_class;

// Radix^N for N >= 0.
inline bits_t radixPower(unsigned long Radix, unsigned long N) {
  bits_t Result;
  mpz_ui_pow_ui(Result.get_mpz_t(), Radix, N);
  return Result;
}

inline bool isPowerOfTwo(unsigned long Val) {
  return Val != 0 && (Val & (Val - 1)) == 0;
}

// log2 of a power of two.
inline int log2Exact(unsigned long Val) {
  int Result = 0;
  while (Val > 1) {
    Val >>= 1;
    ++Result;
  }
  return Result;
}

inline bool isEven(const bits_t &Val) { return mpz_even_p(Val.get_mpz_t()); }

inline size_t bitLength(const bits_t &Val) {
  return Val == 0 ? 0 : mpz_sizeinbase(Val.get_mpz_t(), 2);
}

// Big-endian byte string -> integer.
inline bits_t bytesToMpz(const std::vector<uint8_t> &Bytes) {
  bits_t Result;
  if (!Bytes.empty())
    mpz_import(Result.get_mpz_t(), Bytes.size(), 1, 1, 0, 0, Bytes.data());
  return Result;
}

// Integer -> big-endian byte string of exactly Len bytes.
inline std::vector<uint8_t> mpzToBytes(const bits_t &Val, size_t Len) {
  if (Val < 0)
    throw EncodingError("negative value cannot be stored as bytes");
  size_t Needed = (bitLength(Val) + 7) / 8;
  if (Needed > Len)
    throw EncodingError("value needs " + std::to_string(Needed) +
                        " bytes, format holds " + std::to_string(Len));
  std::vector<uint8_t> Result(Len, 0);
  if (Needed > 0) {
    size_t Count = 0;
    mpz_export(Result.data() + (Len - Needed), &Count, 1, 1, 0, 0,
               Val.get_mpz_t());
  }
  return Result;
}

} // namespace fltfmt

#endif // FLTFMT_CORE_BITS_HPP
