#ifndef CPAMM_SWAP_ENGINE_HPP
#define CPAMM_SWAP_ENGINE_HPP

#include "types.hpp"
#include "fee_schedule.hpp"
#include "reserve_state.hpp"

namespace cpamm {

// =============================================================================
// Swap Quote
// =============================================================================

struct SwapQuote {
    Coins base_out;      // floor(amount_in * reserve_out / (reserve_in + amount_in))
    Coins amount_out;    // base_out minus all fees
    Coins provider_fee;
    Coins protocol_fee;
    Coins ref_fee;
};

// =============================================================================
// SwapEngine - constant-product pricing with a three-way fee split
//
// Fees round up and the output rounds down, so the pool never pays out more
// than the curve allows and K never decreases.
// =============================================================================

class SwapEngine {
public:
    // Inputs below min_amount_in fail with LOW_AMOUNT (zero always does)
    explicit SwapEngine(Coins min_amount_in = 1);

    Coins min_amount_in() const { return min_amount_in_; }

    // Pure computation; throws LOW_AMOUNT, NO_LIQUIDITY, ZERO_OUTPUT, WRONG_K,
    // MATH_ERROR
    SwapQuote compute_swap(Coins amount_in, Coins reserve_in, Coins reserve_out,
                           bool has_ref, const FeeRates& rates) const;

    // compute_swap against the current reserves of state
    SwapQuote quote(const ReserveState& state, Side side_in, Coins amount_in,
                    bool has_ref, const FeeRates& rates) const;

    // Commits a quote: reserves move by amount_in / base_out and the provider
    // and protocol fees accrue on the output side. The referral fee is left for
    // the caller to pay out.
    void commit(ReserveState& state, Side side_in, Coins amount_in,
                const SwapQuote& quote) const;

private:
    Coins min_amount_in_;
};

} // namespace cpamm

#endif // CPAMM_SWAP_ENGINE_HPP
