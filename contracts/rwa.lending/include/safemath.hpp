#pragma once

#include <rwa.lending/rwa.lending.types.hpp>

// Checked fixed-point helpers. Every operation reports overflow and division by zero
// as err::ARITHMETIC_ERROR instead of wrapping.
namespace rwalend { namespace safemath {

static constexpr int128 INT128_MAX_VALUE = int128(~(unsigned __int128)0 >> 1);
static constexpr int128 INT128_MIN_VALUE = -INT128_MAX_VALUE - 1;

inline result<int128> add(int128 a, int128 b) {
   if ((b > 0 && a > INT128_MAX_VALUE - b) || (b < 0 && a < INT128_MIN_VALUE - b))
      return err::ARITHMETIC_ERROR;
   return a + b;
}

inline result<int128> sub(int128 a, int128 b) {
   if ((b < 0 && a > INT128_MAX_VALUE + b) || (b > 0 && a < INT128_MIN_VALUE + b))
      return err::ARITHMETIC_ERROR;
   return a - b;
}

inline result<int128> mul(int128 a, int128 b) {
   if (a == 0 || b == 0) return int128(0);
   if (a > 0) {
      if (b > 0) { if (a > INT128_MAX_VALUE / b) return err::ARITHMETIC_ERROR; }
      else       { if (b < INT128_MIN_VALUE / a) return err::ARITHMETIC_ERROR; }
   } else {
      if (b > 0) { if (a < INT128_MIN_VALUE / b) return err::ARITHMETIC_ERROR; }
      else       { if (b < INT128_MAX_VALUE / a) return err::ARITHMETIC_ERROR; }
   }
   return a * b;
}

// truncates toward zero
inline result<int128> div(int128 a, int128 b) {
   if (b == 0) return err::ARITHMETIC_ERROR;
   if (a == INT128_MIN_VALUE && b == -1) return err::ARITHMETIC_ERROR;
   return a / b;
}

// rounds toward +inf when inexact
inline result<int128> div_ceil(int128 a, int128 b) {
   int128 q;
   RWA_TRY(q, div(a, b))
   if (a % b != 0 && ((a > 0) == (b > 0))) q += 1;
   return q;
}

inline result<int128> mul_div(int128 a, int128 b, int128 c) {
   int128 p;
   RWA_TRY(p, mul(a, b))
   return div(p, c);
}

inline result<int128> mul_div_ceil(int128 a, int128 b, int128 c) {
   int128 p;
   RWA_TRY(p, mul(a, b))
   return div_ceil(p, c);
}

// clamped at zero, for balances that may not go negative
inline int128 saturating_sub(int128 a, int128 b) {
   return a > b ? a - b : 0;
}

// ===== RATE_SCALE (10^7) =====

inline result<int128> mul_rate(int128 a, int128 rate) { return mul_div(a, rate, RATE_SCALE); }
inline result<int128> div_rate(int128 a, int128 b)    { return mul_div(a, RATE_SCALE, b); }

// ===== share tokens, XRATE_SCALE (10^12) =====
// Roundings always favor the pool.

// deposit
inline result<int128> to_b_token_down(int128 amount, int128 b_rate) {
   return mul_div(amount, XRATE_SCALE, b_rate);
}

inline result<int128> to_b_token_up(int128 amount, int128 b_rate) {
   return mul_div_ceil(amount, XRATE_SCALE, b_rate);
}

// withdraw
inline result<int128> to_underlying_from_b_token(int128 b_tokens, int128 b_rate) {
   return mul_div(b_tokens, b_rate, XRATE_SCALE);
}

// borrow
inline result<int128> to_d_token_up(int128 amount, int128 d_rate) {
   return mul_div_ceil(amount, XRATE_SCALE, d_rate);
}

// repay
inline result<int128> to_d_token_down(int128 amount, int128 d_rate) {
   return mul_div(amount, XRATE_SCALE, d_rate);
}

// outstanding debt
inline result<int128> to_underlying_from_d_token(int128 d_tokens, int128 d_rate) {
   return mul_div_ceil(d_tokens, d_rate, XRATE_SCALE);
}

} } // namespace rwalend::safemath
