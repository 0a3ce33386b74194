#ifndef CPAMM_FEE_COLLECTOR_HPP
#define CPAMM_FEE_COLLECTOR_HPP

#include "types.hpp"
#include "fee_schedule.hpp"
#include "reserve_state.hpp"

namespace cpamm {

// =============================================================================
// FeeCollector - pays out accrued fees once an accumulator reaches the minimum
//
// Threshold policy is per accumulator: a token side is collected when either
// its provider or its protocol accumulator reaches min_collect_fees. A
// collected side pays both of its accumulators and is zeroed; the caller
// earns 0.1% of the side's total, taken out of the protocol share.
// =============================================================================

class FeeCollector {
public:
    explicit FeeCollector(Coins min_collect_fees = fees::REQUIRED_MIN_COLLECT_FEES);

    Coins min_collect_fees() const { return min_collect_fees_; }

    bool is_collectible(const FeeAccumulator& acc) const;

    // floor(total / 1000), capped at the protocol share
    static Coins collector_reward(const FeeAccumulator& acc);

    // Payouts the current accumulators would produce, in order token0 then
    // token1 and provider, protocol, collector within a side. Empty = no-op.
    Instructions plan(const ReserveState& state, const FeeSchedule& schedule,
                      const Address& collector) const;

    // plan(), then zero every collected side
    Instructions collect(ReserveState& state, const FeeSchedule& schedule,
                         const Address& collector) const;

private:
    Coins min_collect_fees_;

    void plan_side(Side side, const FeeAccumulator& acc, const FeeSchedule& schedule,
                   const Address& collector, Instructions& out) const;
};

} // namespace cpamm

#endif // CPAMM_FEE_COLLECTOR_HPP
