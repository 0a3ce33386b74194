// =============================================================================
// pool.cpp - PoolController: validation, delegation and instruction output
// =============================================================================

#include "cpamm/pool.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/logging.hpp"

#include <mutex>

namespace cpamm {

namespace {

// Logs a rejected operation and lets the error continue to the caller
template <typename Fn>
auto logged(const char* op, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const PoolError& e) {
        logging::get()->warn("{} rejected: {} ({})", op, to_string(e.code()), e.what());
        throw;
    }
}

Address check_wallet(const Address& wallet, const char* name) {
    if (address::is_null(wallet)) {
        throw PoolError(ErrorCode::INVALID_TOKEN, std::string(name) + " is null");
    }
    return wallet;
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PoolController::PoolController(const PoolConfig& config)
    : owner_(config.owner),
      wallet0_(check_wallet(config.wallet0, "wallet0")),
      wallet1_(check_wallet(config.wallet1, "wallet1")),
      min_operating_reserve_(config.min_operating_reserve),
      schedule_(config.fees, config.provider_fee_address, config.protocol_fee_address),
      swap_engine_(config.min_swap_amount),
      liquidity_engine_(config.min_liquidity),
      collector_(config.min_collect_fees) {
    if (wallet0_ == wallet1_) {
        throw PoolError(ErrorCode::INVALID_TOKEN, "wallet0 and wallet1 must differ");
    }
    FeeSchedule::validate_recipient(owner_, "owner");

    authorized_.insert(owner_);
    for (const auto& addr : config.authorized) {
        FeeSchedule::validate_recipient(addr, "authorized address");
        authorized_.insert(addr);
    }

    logging::get()->info("pool created: wallet0={} wallet1={} fees={}/{}/{} bps",
                         address::to_hex(wallet0_), address::to_hex(wallet1_),
                         schedule_.lp_fee(), schedule_.protocol_fee(), schedule_.ref_fee());
}

// =============================================================================
// Internal Helpers
// =============================================================================

Side PoolController::side_for(const Address& token_wallet) const {
    if (token_wallet == wallet0_) return Side::TOKEN0;
    if (token_wallet == wallet1_) return Side::TOKEN1;
    throw PoolError(ErrorCode::INVALID_TOKEN,
                    "unknown token wallet " + address::to_hex(token_wallet));
}

void PoolController::require_active() const {
    if (locked_) {
        throw PoolError(ErrorCode::POOL_LOCKED, "pool is locked");
    }
}

void PoolController::require_authorized(const Address& caller) const {
    if (authorized_.find(caller) == authorized_.end()) {
        throw PoolError(ErrorCode::INVALID_CALLER,
                        "caller " + address::to_hex(caller) + " is not authorized");
    }
}

void PoolController::require_gas(const CallContext& ctx, uint64_t cost) const {
    // The sender must keep min_operating_reserve after paying for the operation
    if (ctx.gas < cost || ctx.gas - cost < min_operating_reserve_) {
        throw PoolError(ErrorCode::INSUFFICIENT_GAS,
                        "attached " + std::to_string(ctx.gas) + " < cost " +
                        std::to_string(cost) + " + reserve " +
                        std::to_string(min_operating_reserve_));
    }
}

void PoolController::settle_gas(const CallContext& ctx, uint64_t cost, const Address& excess_to,
                                Instructions& out) {
    gas_accrued_ += cost;
    uint64_t unused = ctx.gas - cost;
    if (unused > 0) {
        out.push_back(instr::excess(excess_to, unused));
    }
}

// =============================================================================
// Swap
// =============================================================================

SwapResult PoolController::swap(const CallContext& ctx, const SwapRequest& req) {
    return logged("swap", [&] {
        std::unique_lock lock(mutex_);

        require_active();
        Side side_in = side_for(req.token_wallet);
        Side side_out = other(side_in);
        FeeSchedule::validate_recipient(req.from, "swap sender");
        if (req.has_ref) {
            FeeSchedule::validate_recipient(req.ref_address, "referral address");
        }
        require_gas(ctx, gas::SWAP);

        SwapResult result{};
        result.quote = swap_engine_.quote(state_, side_in, req.amount_in, req.has_ref,
                                          schedule_.rates());

        if (result.quote.amount_out < req.min_out) {
            result.refunded = true;
            result.instructions.push_back(instr::refund(side_in, req.from, req.amount_in));
            settle_gas(ctx, gas::SWAP, req.from, result.instructions);

            logging::get()->info("swap refunded: out {} < min_out {}",
                                 coins::to_string(result.quote.amount_out),
                                 coins::to_string(req.min_out));
            return result;
        }

        swap_engine_.commit(state_, side_in, req.amount_in, result.quote);

        const Address& to = address::is_null(req.to) ? req.from : req.to;
        result.instructions.push_back(instr::transfer(side_out, to, result.quote.amount_out));
        if (result.quote.ref_fee > 0) {
            result.instructions.push_back(instr::payout(side_out, req.ref_address,
                                                        result.quote.ref_fee,
                                                        PayoutRole::REFERRAL));
        }
        settle_gas(ctx, gas::SWAP, req.from, result.instructions);

        logging::get()->info("swap {} -> {}: in={} out={} lp_fee={} protocol_fee={} ref_fee={}",
                             to_string(side_in), to_string(side_out),
                             coins::to_string(req.amount_in),
                             coins::to_string(result.quote.amount_out),
                             coins::to_string(result.quote.provider_fee),
                             coins::to_string(result.quote.protocol_fee),
                             coins::to_string(result.quote.ref_fee));
        return result;
    });
}

// =============================================================================
// Liquidity
// =============================================================================

ProvideResult PoolController::provide_liquidity(const CallContext& ctx,
                                                const ProvideLiquidityRequest& req) {
    return logged("provide_liquidity", [&] {
        std::unique_lock lock(mutex_);

        require_active();
        FeeSchedule::validate_recipient(req.from, "liquidity provider");
        require_gas(ctx, gas::PROVIDE_LIQUIDITY);

        ProvideResult result{};
        result.deposit = liquidity_engine_.quote_add(state_, req.amount0, req.amount1);

        if (result.deposit.lp_minted < req.min_lp_out) {
            result.refunded = true;
            result.instructions.push_back(instr::refund(Side::TOKEN0, req.from, req.amount0));
            result.instructions.push_back(instr::refund(Side::TOKEN1, req.from, req.amount1));
            settle_gas(ctx, gas::PROVIDE_LIQUIDITY, req.from, result.instructions);

            logging::get()->info("provide_liquidity refunded: lp {} < min_lp_out {}",
                                 coins::to_string(result.deposit.lp_minted),
                                 coins::to_string(req.min_lp_out));
            return result;
        }

        liquidity_engine_.commit(state_, result.deposit);

        result.instructions.push_back(instr::mint_lp(req.from, result.deposit.lp_minted));
        if (result.deposit.refund0 > 0) {
            result.instructions.push_back(
                instr::refund(Side::TOKEN0, req.from, result.deposit.refund0));
        }
        if (result.deposit.refund1 > 0) {
            result.instructions.push_back(
                instr::refund(Side::TOKEN1, req.from, result.deposit.refund1));
        }
        settle_gas(ctx, gas::PROVIDE_LIQUIDITY, req.from, result.instructions);

        logging::get()->info("provide_liquidity: used={}/{} lp_minted={} supply={}",
                             coins::to_string(result.deposit.used0),
                             coins::to_string(result.deposit.used1),
                             coins::to_string(result.deposit.lp_minted),
                             coins::to_string(state_.total_supply()));
        return result;
    });
}

BurnResult PoolController::burn_notification(const CallContext& ctx, const BurnNotification& req) {
    return logged("burn_notification", [&] {
        std::unique_lock lock(mutex_);

        require_active();
        FeeSchedule::validate_recipient(req.from, "burn owner");
        require_gas(ctx, gas::BURN);

        BurnResult result{};
        result.withdrawn = liquidity_engine_.quote_remove(state_, req.lp_amount);
        liquidity_engine_.commit(state_, req.lp_amount, result.withdrawn);

        if (result.withdrawn.amount0 > 0) {
            result.instructions.push_back(
                instr::transfer(Side::TOKEN0, req.from, result.withdrawn.amount0));
        }
        if (result.withdrawn.amount1 > 0) {
            result.instructions.push_back(
                instr::transfer(Side::TOKEN1, req.from, result.withdrawn.amount1));
        }
        const Address& excess_to = address::is_null(req.response) ? req.from : req.response;
        settle_gas(ctx, gas::BURN, excess_to, result.instructions);

        logging::get()->info("burn: lp={} out={}/{} supply={}",
                             coins::to_string(req.lp_amount),
                             coins::to_string(result.withdrawn.amount0),
                             coins::to_string(result.withdrawn.amount1),
                             coins::to_string(state_.total_supply()));
        return result;
    });
}

// =============================================================================
// Fee Collection
// =============================================================================

CollectResult PoolController::collect_fees(const CallContext& ctx) {
    return logged("collect_fees", [&] {
        std::unique_lock lock(mutex_);

        require_active();

        CollectResult result{};
        Instructions payouts = collector_.plan(state_, schedule_, ctx.sender);
        if (payouts.empty()) {
            // Not forced: nothing reached the minimum, nothing changes
            if (ctx.gas > 0) {
                result.instructions.push_back(instr::excess(ctx.sender, ctx.gas));
            }
            logging::get()->debug("collect_fees: below minimum, no-op");
            return result;
        }

        // Resource check comes before the accumulators are touched
        uint64_t cost = gas::COLLECT_BASE + gas::COLLECT_PER_PAYOUT * payouts.size();
        require_gas(ctx, cost);

        result.collected = true;
        result.instructions = collector_.collect(state_, schedule_, ctx.sender);
        settle_gas(ctx, cost, ctx.sender, result.instructions);

        logging::get()->info("collect_fees: {} payouts to collector {}",
                             payouts.size(), address::to_hex(ctx.sender));
        return result;
    });
}

// =============================================================================
// Administrative Operations
// =============================================================================

Instructions PoolController::set_fees(const CallContext& ctx, const SetFeesRequest& req) {
    return logged("set_fees", [&] {
        std::unique_lock lock(mutex_);

        require_authorized(ctx.sender);
        require_active();
        require_gas(ctx, gas::ADMIN);

        const Address& provider = address::is_null(req.provider_fee_address)
            ? schedule_.provider_fee_address()
            : req.provider_fee_address;
        schedule_.update(req.rates, provider, req.protocol_fee_address);

        Instructions out;
        settle_gas(ctx, gas::ADMIN, ctx.sender, out);

        logging::get()->info("set_fees: lp={} protocol={} ref={} protocol_address={}",
                             req.rates.lp_fee, req.rates.protocol_fee, req.rates.ref_fee,
                             address::to_hex(req.protocol_fee_address));
        return out;
    });
}

Instructions PoolController::set_lock_status(const CallContext& ctx, bool locked) {
    return logged("set_lock_status", [&] {
        std::unique_lock lock(mutex_);

        require_authorized(ctx.sender);
        require_gas(ctx, gas::ADMIN);

        locked_ = locked;

        Instructions out;
        settle_gas(ctx, gas::ADMIN, ctx.sender, out);

        logging::get()->info("set_lock_status: {}", locked ? "locked" : "active");
        return out;
    });
}

Instructions PoolController::reset_gas(const CallContext& ctx) {
    return logged("reset_gas", [&] {
        std::unique_lock lock(mutex_);

        require_authorized(ctx.sender);
        require_active();
        require_gas(ctx, gas::ADMIN);

        // Everything accrued so far (including this call) plus the unused
        // remainder goes back to the caller in one instruction
        uint64_t unused = ctx.gas - gas::ADMIN;
        Coins payout = static_cast<Coins>(gas_accrued_) + gas::ADMIN + unused;
        uint64_t released = gas_accrued_ + gas::ADMIN;
        gas_accrued_ = 0;

        Instructions out;
        out.push_back(instr::excess(ctx.sender, payout));

        logging::get()->info("reset_gas: released {} accrued units", released);
        return out;
    });
}

Instructions PoolController::add_authorized(const CallContext& ctx, const Address& addr) {
    return logged("add_authorized", [&] {
        std::unique_lock lock(mutex_);

        require_authorized(ctx.sender);
        require_active();
        FeeSchedule::validate_recipient(addr, "authorized address");
        require_gas(ctx, gas::ADMIN);

        authorized_.insert(addr);

        Instructions out;
        settle_gas(ctx, gas::ADMIN, ctx.sender, out);

        logging::get()->info("add_authorized: {}", address::to_hex(addr));
        return out;
    });
}

Instructions PoolController::remove_authorized(const CallContext& ctx, const Address& addr) {
    return logged("remove_authorized", [&] {
        std::unique_lock lock(mutex_);

        require_authorized(ctx.sender);
        require_active();
        if (addr == owner_) {
            throw PoolError(ErrorCode::INVALID_RECIPIENT, "owner cannot be removed");
        }
        require_gas(ctx, gas::ADMIN);

        authorized_.erase(addr);

        Instructions out;
        settle_gas(ctx, gas::ADMIN, ctx.sender, out);

        logging::get()->info("remove_authorized: {}", address::to_hex(addr));
        return out;
    });
}

// =============================================================================
// Query Operations
// =============================================================================

PoolData PoolController::get_pool_data() const {
    std::shared_lock lock(mutex_);
    return PoolData{
        wallet0_,
        wallet1_,
        state_.reserve0(),
        state_.reserve1(),
        state_.total_supply(),
        schedule_.rates(),
        schedule_.provider_fee_address(),
        schedule_.protocol_fee_address(),
        state_.fees(Side::TOKEN0),
        state_.fees(Side::TOKEN1),
        locked_,
        gas_accrued_
    };
}

std::pair<Coins, Coins> PoolController::get_reserves() const {
    std::shared_lock lock(mutex_);
    return {state_.reserve0(), state_.reserve1()};
}

Coins PoolController::get_total_supply() const {
    std::shared_lock lock(mutex_);
    return state_.total_supply();
}

PoolStatus PoolController::status() const {
    std::shared_lock lock(mutex_);
    return locked_ ? PoolStatus::LOCKED : PoolStatus::ACTIVE;
}

bool PoolController::is_authorized(const Address& addr) const {
    std::shared_lock lock(mutex_);
    return authorized_.find(addr) != authorized_.end();
}

SwapQuote PoolController::get_expected_outputs(Coins amount_in, const Address& token_wallet) const {
    std::shared_lock lock(mutex_);
    Side side_in = side_for(token_wallet);
    return swap_engine_.quote(state_, side_in, amount_in, true, schedule_.rates());
}

} // namespace cpamm
