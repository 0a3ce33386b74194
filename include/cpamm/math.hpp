#ifndef CPAMM_MATH_HPP
#define CPAMM_MATH_HPP

#include "types.hpp"

namespace cpamm {

// =============================================================================
// 256-bit Unsigned Integer (two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// =============================================================================
// Fixed-Point Helpers
//
// All inputs are bounded by MAX_COINS, so every product fits in 240 bits and
// every quotient that is stored back into pool state is re-checked against
// MAX_COINS. Overflow is never silent: it throws PoolError(MATH_ERROR).
// =============================================================================

namespace math {

enum class Rounding : uint8_t {
    DOWN = 0,
    UP = 1
};

// Full 256-bit product
U256 mul_wide(U128 a, U128 b);

// Quotient and remainder of a 256/128 division; throws MATH_ERROR on a zero
// divisor or when the quotient does not fit in 128 bits
U128 div_wide(const U256& num, U128 denom, U128* remainder = nullptr);

// floor or ceil of a * b / denom
U128 mul_div(U128 a, U128 b, U128 denom, Rounding rounding = Rounding::DOWN);

// ceil(a / b)
U128 ceil_div(U128 a, U128 b);

// Checked arithmetic bounded by MAX_COINS
Coins add(Coins a, Coins b);
Coins sub(Coins a, Coins b);

// Throws MATH_ERROR when value > MAX_COINS
Coins check_coins(U128 value);

// floor(sqrt(x))
U128 isqrt(const U256& x);

} // namespace math

} // namespace cpamm

#endif // CPAMM_MATH_HPP
