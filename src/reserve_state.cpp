// =============================================================================
// reserve_state.cpp - Reserve and LP-supply bookkeeping
// =============================================================================

#include "cpamm/reserve_state.hpp"
#include "cpamm/errors.hpp"

namespace cpamm {

void ReserveState::apply_swap(Side side_in, Coins amount_in, Coins base_out,
                              Coins provider_fee, Coins protocol_fee) {
    Side side_out = other(side_in);

    Coins new_in = math::add(reserve(side_in), amount_in);
    Coins new_out = math::sub(reserve(side_out), base_out);

    const FeeAccumulator& acc = fees(side_out);
    FeeAccumulator new_fees{math::add(acc.provider, provider_fee),
                            math::add(acc.protocol, protocol_fee)};

    reserve_ref(side_in) = new_in;
    reserve_ref(side_out) = new_out;
    fees_ref(side_out) = new_fees;
}

void ReserveState::apply_deposit(Coins amount0, Coins amount1, Coins lp_minted) {
    Coins new0 = math::add(reserve0_, amount0);
    Coins new1 = math::add(reserve1_, amount1);
    Coins new_supply = math::add(total_supply_, lp_minted);

    reserve0_ = new0;
    reserve1_ = new1;
    total_supply_ = new_supply;
}

void ReserveState::apply_withdraw(Coins amount0, Coins amount1, Coins lp_burned) {
    if (lp_burned > total_supply_) {
        throw PoolError(ErrorCode::LOW_LIQUIDITY,
                        "burn of " + coins::to_string(lp_burned) +
                        " exceeds supply " + coins::to_string(total_supply_));
    }
    Coins new0 = math::sub(reserve0_, amount0);
    Coins new1 = math::sub(reserve1_, amount1);
    Coins new_supply = total_supply_ - lp_burned;

    reserve0_ = new0;
    reserve1_ = new1;
    total_supply_ = new_supply;
}

FeeAccumulator ReserveState::take_fees(Side side) {
    FeeAccumulator& acc = fees_ref(side);
    FeeAccumulator taken = acc;
    acc = FeeAccumulator{0, 0};
    return taken;
}

} // namespace cpamm
