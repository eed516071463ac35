#ifndef FLTFMT_CORE_DPD_HPP
#define FLTFMT_CORE_DPD_HPP

// Densely packed decimal transcoding (Cowlishaw's boolean equations).
//
// A 10-bit declet holds three decimal digits. The leading group of a
// continuation field may be short: one digit in 4 bits or two digits in
// 7 bits. Short groups use the same equations with the high inputs zero.

#include <cstdint>
#include <string>

#include "fltfmt/core/bits.hpp"
#include "fltfmt/core/exceptions.hpp"

namespace fltfmt {
namespace dpd {

// 12-bit BCD (three nibbles, digits abcd efgh ijkm) -> 10-bit declet
// (pqr stu v wxy).
inline uint16_t bcdToDpd(uint16_t Bcd) {
  auto Bit = [Bcd](int N) -> unsigned { return (Bcd >> N) & 1u; };
  unsigned A = Bit(11), B = Bit(10), C = Bit(9), D = Bit(8);
  unsigned E = Bit(7), F = Bit(6), G = Bit(5), H = Bit(4);
  unsigned I = Bit(3), J = Bit(2), K = Bit(1), M = Bit(0);
  unsigned NA = A ^ 1u, NE = E ^ 1u, NI = I ^ 1u;

  unsigned P = B | (A & J) | (A & F & I);
  unsigned Q = C | (A & K) | (A & G & I);
  unsigned R = D;
  unsigned S = (F & (NA | NI)) | (NA & E & J) | (E & I);
  unsigned T = G | (NA & E & K) | (A & I);
  unsigned U = H;
  unsigned V = A | E | I;
  unsigned W = A | (E & I) | (NE & J);
  unsigned X = E | (A & I) | (NA & K);
  unsigned Y = M;

  return static_cast<uint16_t>((P << 9) | (Q << 8) | (R << 7) | (S << 6) |
                               (T << 5) | (U << 4) | (V << 3) | (W << 2) |
                               (X << 1) | Y);
}

// 10-bit declet -> 12-bit BCD.
inline uint16_t dpdToBcd(uint16_t Dpd) {
  auto Bit = [Dpd](int N) -> unsigned { return (Dpd >> N) & 1u; };
  unsigned P = Bit(9), Q = Bit(8), R = Bit(7), S = Bit(6), T = Bit(5);
  unsigned U = Bit(4), V = Bit(3), W = Bit(2), X = Bit(1), Y = Bit(0);
  unsigned NS = S ^ 1u, NT = T ^ 1u, NV = V ^ 1u, NW = W ^ 1u, NX = X ^ 1u;

  unsigned A = (V & W) & (NS | T | NX);
  unsigned B = P & (NV | NW | (S & NT & X));
  unsigned C = Q & (NV | NW | (S & NT & X));
  unsigned D = R;
  unsigned E = V & ((NW & X) | (NT & X) | (S & X));
  unsigned F = (S & (NV | NX)) | (P & NS & T & V & W & X);
  unsigned G = (T & (NV | NX)) | (Q & NS & T & W);
  unsigned H = U;
  unsigned I = V & ((NW & NX) | (W & X & (S | T)));
  unsigned J = (NV & W) | (S & V & NW & X) | (P & W & (NX | (NS & NT)));
  unsigned K = (NV & X) | (T & NW & X) | (Q & V & W & (NX | (NS & NT)));
  unsigned M = Y;

  return static_cast<uint16_t>((A << 11) | (B << 10) | (C << 9) | (D << 8) |
                               (E << 7) | (F << 6) | (G << 5) | (H << 4) |
                               (I << 3) | (J << 2) | (K << 1) | M);
}

inline uint16_t binaryToBcd(unsigned Val) {
  return static_cast<uint16_t>(((Val / 100) << 8) | (((Val / 10) % 10) << 4) |
                               (Val % 10));
}

inline unsigned bcdToBinary(uint16_t Bcd) {
  return ((Bcd >> 8) & 0xF) * 100 + ((Bcd >> 4) & 0xF) * 10 + (Bcd & 0xF);
}

// Declet for a decimal value 0..999.
inline uint16_t encodeDeclet(unsigned Val) {
  return bcdToDpd(binaryToBcd(Val));
}

inline unsigned decodeDeclet(uint16_t Dpd) {
  return bcdToBinary(dpdToBcd(Dpd));
}

// Number of bits a continuation field needs for Digits decimal digits.
inline int continuationBits(int Digits) {
  int Bits = (Digits / 3) * 10;
  switch (Digits % 3) {
  case 1:
    Bits += 4;
    break;
  case 2:
    Bits += 7;
    break;
  }
  return Bits;
}

// Inverse of continuationBits; -1 when the width is not a valid
// continuation width (10k, 10k+4 or 10k+7).
inline int continuationDigits(int Bits) {
  int Digits = (Bits / 10) * 3;
  switch (Bits % 10) {
  case 0:
    return Digits;
  case 4:
    return Digits + 1;
  case 7:
    return Digits + 2;
  default:
    return -1;
  }
}

// Decimal integer (< 10^Digits) -> continuation bits, least significant
// declet in the low bits.
inline bits_t encodeContinuation(bits_t Val, int Digits) {
  if (Val < 0 || Val >= radixPower(10, Digits))
    throw EncodingError("decimal continuation " + Val.get_str() +
                        " exceeds " + std::to_string(Digits) + " digits");
  bits_t Result = 0;
  mp_bitcnt_t Shift = 0;
  for (int Left = Digits; Left > 0; Left -= 3) {
    bits_t Group = Val % 1000;
    Val /= 1000;
    Result += bits_t(encodeDeclet(static_cast<unsigned>(Group.get_ui())))
              << Shift;
    Shift += 10;
  }
  return Result;
}

inline bits_t decodeContinuation(bits_t Bits, int Digits) {
  bits_t Result = 0;
  bits_t Scale = 1;
  for (int Left = Digits; Left > 0; Left -= 3) {
    bits_t Group;
    mpz_fdiv_r_2exp(Group.get_mpz_t(), Bits.get_mpz_t(), 10);
    mpz_fdiv_q_2exp(Bits.get_mpz_t(), Bits.get_mpz_t(), 10);
    Result += Scale * decodeDeclet(static_cast<uint16_t>(Group.get_ui()));
    Scale *= 1000;
  }
  return Result;
}

} // namespace dpd
} // namespace fltfmt

#endif // FLTFMT_CORE_DPD_HPP
