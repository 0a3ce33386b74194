// =============================================================================
// math.cpp - Bounded integer arithmetic for pool accounting
// =============================================================================

#include "cpamm/math.hpp"
#include "cpamm/errors.hpp"

namespace cpamm {
namespace math {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;
constexpr U128 U128_MAX = ~U128(0);

} // anonymous namespace

U256 mul_wide(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

U128 div_wide(const U256& num, U128 denom, U128* remainder) {
    if (denom == 0) {
        throw PoolError(ErrorCode::MATH_ERROR, "division by zero");
    }
    if (num.hi == 0) {
        if (remainder) *remainder = num.lo % denom;
        return num.lo / denom;
    }
    if (num.hi >= denom) {
        throw PoolError(ErrorCode::MATH_ERROR, "quotient exceeds 128 bits");
    }

    // Restoring long division over the low limb; rem < denom on entry, and the
    // bit shifted out of rem (carry) means the true value is >= 2^128 > denom
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;  // Wraps back into range when carry is set
            quot |= 1;
        }
    }

    if (remainder) *remainder = rem;
    return quot;
}

U128 mul_div(U128 a, U128 b, U128 denom, Rounding rounding) {
    U256 product = mul_wide(a, b);
    U128 rem = 0;
    U128 result = div_wide(product, denom, &rem);

    if (rounding == Rounding::UP && rem != 0) {
        if (result == U128_MAX) {
            throw PoolError(ErrorCode::MATH_ERROR, "mul_div rounding overflow");
        }
        result += 1;
    }
    return result;
}

U128 ceil_div(U128 a, U128 b) {
    if (b == 0) {
        throw PoolError(ErrorCode::MATH_ERROR, "division by zero");
    }
    return a / b + (a % b != 0 ? 1 : 0);
}

Coins check_coins(U128 value) {
    if (value > MAX_COINS) {
        throw PoolError(ErrorCode::MATH_ERROR,
                        "amount " + coins::to_string(value) + " exceeds MAX_COINS");
    }
    return value;
}

Coins add(Coins a, Coins b) {
    // Both operands <= 2^120, so the raw sum cannot wrap 128 bits
    return check_coins(check_coins(a) + check_coins(b));
}

Coins sub(Coins a, Coins b) {
    if (b > a) {
        throw PoolError(ErrorCode::MATH_ERROR,
                        "underflow: " + coins::to_string(a) + " - " + coins::to_string(b));
    }
    return a - b;
}

U128 isqrt(const U256& x) {
    if (x.is_zero()) return 0;

    // Bitwise search for the largest r with r*r <= x; r < 2^128 always
    U128 result = 0;
    for (int bit = 127; bit >= 0; --bit) {
        U128 candidate = result | (U128(1) << bit);
        if (mul_wide(candidate, candidate) <= x) {
            result = candidate;
        }
    }
    return result;
}

} // namespace math
} // namespace cpamm
