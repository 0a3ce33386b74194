// =============================================================================
// swap_engine.cpp - Constant-product swap pricing
// =============================================================================

#include "cpamm/swap_engine.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/math.hpp"

namespace cpamm {

SwapEngine::SwapEngine(Coins min_amount_in)
    : min_amount_in_(min_amount_in == 0 ? 1 : min_amount_in) {}

SwapQuote SwapEngine::compute_swap(Coins amount_in, Coins reserve_in, Coins reserve_out,
                                   bool has_ref, const FeeRates& rates) const {
    if (amount_in < min_amount_in_) {
        throw PoolError(ErrorCode::LOW_AMOUNT,
                        "amount_in " + coins::to_string(amount_in) +
                        " below minimum " + coins::to_string(min_amount_in_));
    }
    if (reserve_in == 0 || reserve_out == 0) {
        throw PoolError(ErrorCode::NO_LIQUIDITY, "pool has no liquidity");
    }
    math::check_coins(reserve_out);

    // reserve_in + amount_in must itself stay within MAX_COINS
    Coins new_reserve_in = math::add(reserve_in, amount_in);

    SwapQuote quote{};
    quote.base_out = math::mul_div(amount_in, reserve_out, new_reserve_in);

    quote.provider_fee = FeeSchedule::fee_for(quote.base_out, rates.lp_fee);
    quote.protocol_fee = FeeSchedule::fee_for(quote.base_out, rates.protocol_fee);
    quote.ref_fee = has_ref ? FeeSchedule::fee_for(quote.base_out, rates.ref_fee) : 0;

    Coins total_fees = quote.provider_fee + quote.protocol_fee + quote.ref_fee;
    if (total_fees >= quote.base_out) {
        throw PoolError(ErrorCode::ZERO_OUTPUT,
                        "fees " + coins::to_string(total_fees) +
                        " consume output " + coins::to_string(quote.base_out));
    }
    quote.amount_out = quote.base_out - total_fees;

    // base_out < reserve_out always holds for a finite input; the product check
    // catches any rounding that would still let value leak out
    Coins new_reserve_out = math::sub(reserve_out, quote.base_out);
    U256 k_before = math::mul_wide(reserve_in, reserve_out);
    U256 k_after = math::mul_wide(new_reserve_in, new_reserve_out);
    if (k_after < k_before) {
        throw PoolError(ErrorCode::WRONG_K, "constant product would decrease");
    }

    return quote;
}

SwapQuote SwapEngine::quote(const ReserveState& state, Side side_in, Coins amount_in,
                            bool has_ref, const FeeRates& rates) const {
    return compute_swap(amount_in, state.reserve(side_in),
                        state.reserve(other(side_in)), has_ref, rates);
}

void SwapEngine::commit(ReserveState& state, Side side_in, Coins amount_in,
                        const SwapQuote& quote) const {
    state.apply_swap(side_in, amount_in, quote.base_out,
                     quote.provider_fee, quote.protocol_fee);
}

} // namespace cpamm
