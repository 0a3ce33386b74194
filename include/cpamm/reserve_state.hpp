#ifndef CPAMM_RESERVE_STATE_HPP
#define CPAMM_RESERVE_STATE_HPP

#include "types.hpp"
#include "math.hpp"

namespace cpamm {

// =============================================================================
// Fee Accumulators (accrued, not yet collected)
// =============================================================================

struct FeeAccumulator {
    Coins provider;
    Coins protocol;

    Coins total() const { return provider + protocol; }
    bool empty() const { return provider == 0 && protocol == 0; }
};

// =============================================================================
// ReserveState - reserves, fee accumulators and LP supply
//
// Every mutator computes all new values first and assigns them only when every
// bound check has passed, so a thrown PoolError leaves the state untouched.
// =============================================================================

class ReserveState {
public:
    ReserveState() = default;

    Coins reserve(Side side) const {
        return side == Side::TOKEN0 ? reserve0_ : reserve1_;
    }
    Coins reserve0() const { return reserve0_; }
    Coins reserve1() const { return reserve1_; }
    Coins total_supply() const { return total_supply_; }

    const FeeAccumulator& fees(Side side) const {
        return side == Side::TOKEN0 ? fees0_ : fees1_;
    }

    bool has_liquidity() const {
        return reserve0_ > 0 && reserve1_ > 0;
    }

    // reserve0 * reserve1 (constant-product K)
    U256 product() const { return math::mul_wide(reserve0_, reserve1_); }

    // reserve_in += amount_in; reserve_out -= base_out; fees accrue on the
    // output side
    void apply_swap(Side side_in, Coins amount_in, Coins base_out,
                    Coins provider_fee, Coins protocol_fee);

    // Reserves grow by the used amounts, supply by the minted shares
    void apply_deposit(Coins amount0, Coins amount1, Coins lp_minted);

    // Reserves shrink by the withdrawn amounts, supply by the burned shares
    void apply_withdraw(Coins amount0, Coins amount1, Coins lp_burned);

    // Returns the accumulator for one side and zeroes it
    FeeAccumulator take_fees(Side side);

private:
    Coins reserve0_ = 0;
    Coins reserve1_ = 0;
    Coins total_supply_ = 0;
    FeeAccumulator fees0_{0, 0};
    FeeAccumulator fees1_{0, 0};

    Coins& reserve_ref(Side side) {
        return side == Side::TOKEN0 ? reserve0_ : reserve1_;
    }
    FeeAccumulator& fees_ref(Side side) {
        return side == Side::TOKEN0 ? fees0_ : fees1_;
    }
};

} // namespace cpamm

#endif // CPAMM_RESERVE_STATE_HPP
