#ifndef CPAMM_POOL_HPP
#define CPAMM_POOL_HPP

#include <set>
#include <shared_mutex>
#include <utility>

#include "types.hpp"
#include "config.hpp"
#include "fee_schedule.hpp"
#include "reserve_state.hpp"
#include "swap_engine.hpp"
#include "liquidity_engine.hpp"
#include "fee_collector.hpp"

namespace cpamm {

// =============================================================================
// Gas-Equivalent Costs (charged per committed operation)
// =============================================================================

namespace gas {
constexpr uint64_t SWAP = 25000;
constexpr uint64_t PROVIDE_LIQUIDITY = 30000;
constexpr uint64_t BURN = 25000;
constexpr uint64_t COLLECT_BASE = 20000;
constexpr uint64_t COLLECT_PER_PAYOUT = 5000;
constexpr uint64_t ADMIN = 5000;
}

// =============================================================================
// Requests
// =============================================================================

// Who sent the message and how much gas-equivalent it carries
struct CallContext {
    Address sender;
    uint64_t gas;
};

struct SwapRequest {
    Address from;
    Address token_wallet;   // Wallet of the token being sold
    Coins amount_in;
    Coins min_out;
    bool has_ref;
    Address ref_address;
    Address to;             // NONE = pay the output to `from`
};

struct ProvideLiquidityRequest {
    Address from;
    Coins amount0;
    Coins amount1;
    Coins min_lp_out;
};

struct BurnNotification {
    Coins lp_amount;
    Address from;
    Address response;       // NONE = return excess to `from`
};

struct SetFeesRequest {
    FeeRates rates;
    Address protocol_fee_address;
    Address provider_fee_address;   // NONE = keep the current provider recipient
};

// =============================================================================
// Results
// =============================================================================

struct SwapResult {
    bool refunded;          // min_out not met; nothing committed
    SwapQuote quote;
    Instructions instructions;
};

struct ProvideResult {
    bool refunded;          // min_lp_out not met; nothing committed
    DepositResult deposit;
    Instructions instructions;
};

struct BurnResult {
    WithdrawResult withdrawn;
    Instructions instructions;
};

struct CollectResult {
    bool collected;         // false = no accumulator reached the minimum
    Instructions instructions;
};

enum class PoolStatus : uint8_t {
    ACTIVE = 0,
    LOCKED = 1
};

struct PoolData {
    Address wallet0;
    Address wallet1;
    Coins reserve0;
    Coins reserve1;
    Coins total_supply;
    FeeRates rates;
    Address provider_fee_address;
    Address protocol_fee_address;
    FeeAccumulator fees0;
    FeeAccumulator fees1;
    bool locked;
    uint64_t gas_accrued;
};

// =============================================================================
// PoolController - the single serialized entry point for one pool
//
// Each mutating call validates, computes, mutates and builds its outbound
// instructions under one exclusive lock; any PoolError leaves the pool exactly
// as it was.
// =============================================================================

class PoolController {
public:
    // Throws FEE_OUT_OF_RANGE, INVALID_RECIPIENT or INVALID_TOKEN for a bad config
    explicit PoolController(const PoolConfig& config);
    ~PoolController() = default;

    // Non-copyable
    PoolController(const PoolController&) = delete;
    PoolController& operator=(const PoolController&) = delete;

    // =========================================================================
    // User Operations
    // =========================================================================

    SwapResult swap(const CallContext& ctx, const SwapRequest& req);
    ProvideResult provide_liquidity(const CallContext& ctx, const ProvideLiquidityRequest& req);
    BurnResult burn_notification(const CallContext& ctx, const BurnNotification& req);

    // Anyone may trigger collection; the sender earns the collector reward
    CollectResult collect_fees(const CallContext& ctx);

    // =========================================================================
    // Administrative Operations (authorized callers only)
    // =========================================================================

    Instructions set_fees(const CallContext& ctx, const SetFeesRequest& req);
    Instructions set_lock_status(const CallContext& ctx, bool locked);
    Instructions reset_gas(const CallContext& ctx);
    Instructions add_authorized(const CallContext& ctx, const Address& addr);
    Instructions remove_authorized(const CallContext& ctx, const Address& addr);

    // =========================================================================
    // Query Operations
    // =========================================================================

    PoolData get_pool_data() const;
    std::pair<Coins, Coins> get_reserves() const;
    Coins get_total_supply() const;
    PoolStatus status() const;
    bool is_authorized(const Address& addr) const;

    // Swap quote for amount_in of the token held by token_wallet (referral
    // fee included); no state change
    SwapQuote get_expected_outputs(Coins amount_in, const Address& token_wallet) const;

    const Address& owner() const { return owner_; }

private:
    Address owner_;
    Address wallet0_;
    Address wallet1_;
    uint64_t min_operating_reserve_;

    FeeSchedule schedule_;
    ReserveState state_;
    SwapEngine swap_engine_;
    LiquidityEngine liquidity_engine_;
    FeeCollector collector_;

    std::set<Address> authorized_;
    bool locked_{false};
    uint64_t gas_accrued_{0};

    mutable std::shared_mutex mutex_;

    // Internal helpers (caller holds mutex_)
    Side side_for(const Address& token_wallet) const;
    void require_active() const;
    void require_authorized(const Address& caller) const;
    void require_gas(const CallContext& ctx, uint64_t cost) const;

    // Accrues cost and appends the unused remainder as an EXCESS instruction
    void settle_gas(const CallContext& ctx, uint64_t cost, const Address& excess_to,
                    Instructions& out);
};

} // namespace cpamm

#endif // CPAMM_POOL_HPP
