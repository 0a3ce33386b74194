// =============================================================================
// liquidity_engine.cpp - LP share accounting
// =============================================================================

#include "cpamm/liquidity_engine.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/math.hpp"

namespace cpamm {

LiquidityEngine::LiquidityEngine(Coins min_liquidity)
    : min_liquidity_(min_liquidity) {}

DepositResult LiquidityEngine::compute_add(Coins amount0, Coins amount1, Coins reserve0,
                                           Coins reserve1, Coins total_supply) const {
    if (amount0 == 0 || amount1 == 0) {
        throw PoolError(ErrorCode::LOW_AMOUNT, "both token amounts must be positive");
    }
    math::check_coins(amount0);
    math::check_coins(amount1);

    DepositResult result{0, amount0, amount1, 0, 0};

    if (total_supply == 0) {
        result.lp_minted = math::isqrt(math::mul_wide(amount0, amount1));
        if (result.lp_minted < min_liquidity_) {
            throw PoolError(ErrorCode::LOW_LIQUIDITY,
                            "initial liquidity " + coins::to_string(result.lp_minted) +
                            " below minimum " + coins::to_string(min_liquidity_));
        }
        return result;
    }

    if (reserve0 == 0 || reserve1 == 0) {
        throw PoolError(ErrorCode::NO_LIQUIDITY, "supply outstanding with an empty reserve");
    }

    // amount0 / reserve0 <= amount1 / reserve1  <=>  token0 is the limiting side
    if (math::mul_wide(amount0, reserve1) <= math::mul_wide(amount1, reserve0)) {
        result.lp_minted = math::mul_div(amount0, total_supply, reserve0);
        result.used1 = math::mul_div(amount0, reserve1, reserve0, math::Rounding::UP);
        result.refund1 = amount1 - result.used1;
    } else {
        result.lp_minted = math::mul_div(amount1, total_supply, reserve1);
        result.used0 = math::mul_div(amount1, reserve0, reserve1, math::Rounding::UP);
        result.refund0 = amount0 - result.used0;
    }

    if (result.lp_minted == 0) {
        throw PoolError(ErrorCode::LOW_LIQUIDITY, "deposit too small to mint any LP");
    }
    return result;
}

WithdrawResult LiquidityEngine::compute_remove(Coins lp_amount, Coins reserve0, Coins reserve1,
                                               Coins total_supply) const {
    if (lp_amount == 0) {
        throw PoolError(ErrorCode::LOW_AMOUNT, "nothing to burn");
    }
    if (lp_amount > total_supply) {
        throw PoolError(ErrorCode::LOW_LIQUIDITY,
                        "burn of " + coins::to_string(lp_amount) +
                        " exceeds supply " + coins::to_string(total_supply));
    }

    WithdrawResult result{};
    result.amount0 = math::mul_div(lp_amount, reserve0, total_supply);
    result.amount1 = math::mul_div(lp_amount, reserve1, total_supply);

    if (result.amount0 == 0 && result.amount1 == 0) {
        throw PoolError(ErrorCode::ZERO_OUTPUT, "burn too small to withdraw anything");
    }
    return result;
}

DepositResult LiquidityEngine::quote_add(const ReserveState& state, Coins amount0,
                                         Coins amount1) const {
    return compute_add(amount0, amount1, state.reserve0(), state.reserve1(),
                       state.total_supply());
}

WithdrawResult LiquidityEngine::quote_remove(const ReserveState& state, Coins lp_amount) const {
    return compute_remove(lp_amount, state.reserve0(), state.reserve1(), state.total_supply());
}

void LiquidityEngine::commit(ReserveState& state, const DepositResult& deposit) const {
    state.apply_deposit(deposit.used0, deposit.used1, deposit.lp_minted);
}

void LiquidityEngine::commit(ReserveState& state, Coins lp_burned,
                             const WithdrawResult& withdrawal) const {
    state.apply_withdraw(withdrawal.amount0, withdrawal.amount1, lp_burned);
}

} // namespace cpamm
