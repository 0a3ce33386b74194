#ifndef CPAMM_LIQUIDITY_ENGINE_HPP
#define CPAMM_LIQUIDITY_ENGINE_HPP

#include "types.hpp"
#include "reserve_state.hpp"

namespace cpamm {

// =============================================================================
// Liquidity Results
// =============================================================================

struct DepositResult {
    Coins lp_minted;
    Coins used0;      // Amounts that enter the reserves
    Coins used1;
    Coins refund0;    // Over-supplied remainder, returned to the provider
    Coins refund1;
};

struct WithdrawResult {
    Coins amount0;
    Coins amount1;
};

// =============================================================================
// LiquidityEngine - LP share minting and burning
// =============================================================================

class LiquidityEngine {
public:
    // First deposits minting fewer than min_liquidity shares are rejected
    explicit LiquidityEngine(Coins min_liquidity = 1000);

    Coins min_liquidity() const { return min_liquidity_; }

    // First deposit: isqrt(amount0 * amount1).
    // Later deposits: min(amount0 * supply / reserve0, amount1 * supply / reserve1);
    // the over-supplied side is only taken at the current ratio (rounded up in
    // the pool's favour), the rest is refunded.
    DepositResult compute_add(Coins amount0, Coins amount1, Coins reserve0,
                              Coins reserve1, Coins total_supply) const;

    // Pro-rata: floor(lp_amount * reserve_i / total_supply)
    WithdrawResult compute_remove(Coins lp_amount, Coins reserve0, Coins reserve1,
                                  Coins total_supply) const;

    // compute_add / compute_remove against the current state
    DepositResult quote_add(const ReserveState& state, Coins amount0, Coins amount1) const;
    WithdrawResult quote_remove(const ReserveState& state, Coins lp_amount) const;

    // Reserves and supply move together, or not at all
    void commit(ReserveState& state, const DepositResult& deposit) const;
    void commit(ReserveState& state, Coins lp_burned, const WithdrawResult& withdrawal) const;

private:
    Coins min_liquidity_;
};

} // namespace cpamm

#endif // CPAMM_LIQUIDITY_ENGINE_HPP
