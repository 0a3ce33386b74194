// cpamm - PoolController operations

#include <catch2/catch.hpp>
#include <cpamm/math.hpp>
#include <cpamm/pool.hpp>

#include "test_helpers.hpp"

using namespace cpamm;
using namespace cpamm::testing;

namespace {

constexpr uint64_t GAS = 20000000;

PoolConfig base_config() {
    return PoolConfig()
        .with_owner(OWNER)
        .with_wallets(WALLET0, WALLET1)
        .with_fees(30, 5, 10)
        .with_recipients(PROVIDER_FEES, PROTOCOL_FEES);
}

CallContext as(const Address& sender, uint64_t gas = GAS) {
    return CallContext{sender, gas};
}

SwapRequest swap_req(const Address& from, const Address& wallet, Coins amount_in,
                     Coins min_out = 0) {
    return SwapRequest{from, wallet, amount_in, min_out, false, address::NONE, address::NONE};
}

ProvideLiquidityRequest provide_req(const Address& from, Coins amount0, Coins amount1,
                                    Coins min_lp_out = 0) {
    return ProvideLiquidityRequest{from, amount0, amount1, min_lp_out};
}

void seed(PoolController& pool, Coins amount0 = 1000000, Coins amount1 = 1000000) {
    pool.provide_liquidity(as(ALICE), provide_req(ALICE, amount0, amount1));
}

bool same_state(const PoolData& a, const PoolData& b) {
    return a.reserve0 == b.reserve0 && a.reserve1 == b.reserve1 &&
           a.total_supply == b.total_supply && a.rates == b.rates &&
           a.provider_fee_address == b.provider_fee_address &&
           a.protocol_fee_address == b.protocol_fee_address &&
           a.fees0.provider == b.fees0.provider && a.fees0.protocol == b.fees0.protocol &&
           a.fees1.provider == b.fees1.provider && a.fees1.protocol == b.fees1.protocol &&
           a.locked == b.locked && a.gas_accrued == b.gas_accrued;
}

} // anonymous namespace

TEST_CASE("PoolController construction", "[pool]") {
    SECTION("Fresh pool is active and empty") {
        PoolController pool(base_config());
        REQUIRE(pool.status() == PoolStatus::ACTIVE);
        REQUIRE(pool.get_total_supply() == 0);
        REQUIRE(pool.get_reserves().first == 0);
        REQUIRE(pool.get_reserves().second == 0);
        REQUIRE(pool.is_authorized(OWNER));
        REQUIRE_FALSE(pool.is_authorized(ALICE));
        REQUIRE(pool.owner() == OWNER);
    }

    SECTION("Initial authorized set") {
        PoolController pool(base_config().with_authorized(ALICE));
        REQUIRE(pool.is_authorized(ALICE));
    }

    SECTION("Invalid configs") {
        REQUIRE(error_of([] { PoolController p(base_config().with_owner(address::NONE)); }) ==
                ErrorCode::INVALID_RECIPIENT);
        REQUIRE(error_of([] { PoolController p(base_config().with_wallets(WALLET0, WALLET0)); }) ==
                ErrorCode::INVALID_TOKEN);
        REQUIRE(error_of([] {
                    PoolController p(base_config().with_wallets(address::NONE, WALLET1));
                }) == ErrorCode::INVALID_TOKEN);
        REQUIRE(error_of([] { PoolController p(base_config().with_fees(201, 0, 0)); }) ==
                ErrorCode::FEE_OUT_OF_RANGE);
        REQUIRE(error_of([] {
                    PoolController p(base_config().with_recipients(PROVIDER_FEES, address::NONE));
                }) == ErrorCode::INVALID_RECIPIENT);
        REQUIRE(error_of([] {
                    PoolController p(base_config().with_authorized(address::NONE));
                }) == ErrorCode::INVALID_RECIPIENT);
    }
}

TEST_CASE("Providing liquidity", "[pool]") {
    PoolController pool(base_config());

    SECTION("First deposit mints LP and returns excess gas") {
        ProvideResult r = pool.provide_liquidity(as(ALICE), provide_req(ALICE, 100000, 400000));
        REQUIRE_FALSE(r.refunded);
        REQUIRE(r.deposit.lp_minted == 200000);
        REQUIRE(r.instructions.size() == 2);
        REQUIRE(r.instructions[0] == instr::mint_lp(ALICE, 200000));
        REQUIRE(r.instructions[1] == instr::excess(ALICE, GAS - gas::PROVIDE_LIQUIDITY));

        PoolData data = pool.get_pool_data();
        REQUIRE(data.reserve0 == 100000);
        REQUIRE(data.reserve1 == 400000);
        REQUIRE(data.total_supply == 200000);
        REQUIRE(data.gas_accrued == gas::PROVIDE_LIQUIDITY);
    }

    SECTION("Over-supplied side is refunded") {
        seed(pool);
        ProvideResult r = pool.provide_liquidity(as(BOB), provide_req(BOB, 1000, 3000));
        REQUIRE(r.deposit.lp_minted == 1000);
        REQUIRE(r.instructions.size() == 3);
        REQUIRE(r.instructions[0] == instr::mint_lp(BOB, 1000));
        REQUIRE(r.instructions[1] == instr::refund(Side::TOKEN1, BOB, 2000));
        REQUIRE(pool.get_reserves().second == 1001000);
    }

    SECTION("min_lp_out not met refunds both tokens") {
        seed(pool);
        PoolData before = pool.get_pool_data();

        ProvideResult r = pool.provide_liquidity(as(BOB), provide_req(BOB, 1000, 1000, 1001));
        REQUIRE(r.refunded);
        REQUIRE(r.instructions.size() == 3);
        REQUIRE(r.instructions[0] == instr::refund(Side::TOKEN0, BOB, 1000));
        REQUIRE(r.instructions[1] == instr::refund(Side::TOKEN1, BOB, 1000));

        PoolData after = pool.get_pool_data();
        REQUIRE(after.reserve0 == before.reserve0);
        REQUIRE(after.reserve1 == before.reserve1);
        REQUIRE(after.total_supply == before.total_supply);
    }

    SECTION("Tiny first deposit") {
        REQUIRE(error_of([&] { pool.provide_liquidity(as(ALICE), provide_req(ALICE, 10, 10)); }) ==
                ErrorCode::LOW_LIQUIDITY);
        REQUIRE(pool.get_total_supply() == 0);
    }
}

TEST_CASE("Swapping through the controller", "[pool]") {
    PoolController pool(base_config());
    seed(pool);

    SECTION("Output goes to the sender") {
        SwapResult r = pool.swap(as(BOB), swap_req(BOB, WALLET0, 1000));
        REQUIRE_FALSE(r.refunded);
        REQUIRE(r.quote.amount_out == 994);
        REQUIRE(r.instructions.size() == 2);
        REQUIRE(r.instructions[0] == instr::transfer(Side::TOKEN1, BOB, 994));
        REQUIRE(r.instructions[1] == instr::excess(BOB, GAS - gas::SWAP));

        PoolData data = pool.get_pool_data();
        REQUIRE(data.reserve0 == 1001000);
        REQUIRE(data.reserve1 == 999002);
        REQUIRE(data.fees1.provider == 3);
        REQUIRE(data.fees1.protocol == 1);
        REQUIRE(data.fees0.provider == 0);
    }

    SECTION("Referral fee is paid out immediately") {
        SwapRequest req = swap_req(BOB, WALLET0, 1000);
        req.has_ref = true;
        req.ref_address = CAROL;

        SwapResult r = pool.swap(as(BOB), req);
        REQUIRE(r.instructions.size() == 3);
        REQUIRE(r.instructions[0] == instr::transfer(Side::TOKEN1, BOB, 993));
        REQUIRE(r.instructions[1] == instr::payout(Side::TOKEN1, CAROL, 1, PayoutRole::REFERRAL));

        // The referral fee is never accumulated
        PoolData data = pool.get_pool_data();
        REQUIRE(data.fees1.provider == 3);
        REQUIRE(data.fees1.protocol == 1);
    }

    SECTION("Output to a different recipient") {
        SwapRequest req = swap_req(BOB, WALLET1, 1000);
        req.to = CAROL;

        SwapResult r = pool.swap(as(BOB), req);
        REQUIRE(r.instructions[0] == instr::transfer(Side::TOKEN0, CAROL, 994));
        REQUIRE(r.instructions[1] == instr::excess(BOB, GAS - gas::SWAP));
    }

    SECTION("min_out not met refunds the input") {
        PoolData before = pool.get_pool_data();

        SwapResult r = pool.swap(as(BOB), swap_req(BOB, WALLET0, 1000, 995));
        REQUIRE(r.refunded);
        REQUIRE(r.instructions.size() == 2);
        REQUIRE(r.instructions[0] == instr::refund(Side::TOKEN0, BOB, 1000));

        PoolData after = pool.get_pool_data();
        REQUIRE(after.reserve0 == before.reserve0);
        REQUIRE(after.reserve1 == before.reserve1);
        REQUIRE(after.fees1.provider == 0);
    }

    SECTION("min_out exactly met") {
        SwapResult r = pool.swap(as(BOB), swap_req(BOB, WALLET0, 1000, 994));
        REQUIRE_FALSE(r.refunded);
    }
}

TEST_CASE("Rejected operations leave the pool unchanged", "[pool]") {
    PoolController pool(base_config());

    SECTION("Swap on an empty pool") {
        PoolData before = pool.get_pool_data();
        REQUIRE(error_of([&] { pool.swap(as(BOB), swap_req(BOB, WALLET0, 1000)); }) ==
                ErrorCode::NO_LIQUIDITY);
        REQUIRE(same_state(before, pool.get_pool_data()));
    }

    seed(pool);
    PoolData before = pool.get_pool_data();

    SECTION("Zero input") {
        REQUIRE(error_of([&] { pool.swap(as(BOB), swap_req(BOB, WALLET0, 0)); }) ==
                ErrorCode::LOW_AMOUNT);
    }

    SECTION("Unknown token wallet") {
        REQUIRE(error_of([&] { pool.swap(as(BOB), swap_req(BOB, CAROL, 1000)); }) ==
                ErrorCode::INVALID_TOKEN);
    }

    SECTION("Referral without an address") {
        SwapRequest req = swap_req(BOB, WALLET0, 1000);
        req.has_ref = true;
        REQUIRE(error_of([&] { pool.swap(as(BOB), req); }) == ErrorCode::INVALID_RECIPIENT);
    }

    SECTION("Gas below cost plus operating reserve") {
        uint64_t just_short = gas::SWAP + 10000000 - 1;
        REQUIRE(error_of([&] { pool.swap(as(BOB, just_short), swap_req(BOB, WALLET0, 1000)); }) ==
                ErrorCode::INSUFFICIENT_GAS);
        REQUIRE(error_of([&] {
                    pool.provide_liquidity(as(BOB, 1000), provide_req(BOB, 1000, 1000));
                }) == ErrorCode::INSUFFICIENT_GAS);
    }

    SECTION("Burn above supply") {
        BurnNotification burn{1000001, ALICE, address::NONE};
        REQUIRE(error_of([&] { pool.burn_notification(as(ALICE), burn); }) ==
                ErrorCode::LOW_LIQUIDITY);
    }

    REQUIRE(same_state(before, pool.get_pool_data()));
}

TEST_CASE("Gas at exactly cost plus operating reserve is accepted", "[pool]") {
    PoolController pool(base_config());
    seed(pool);

    SwapResult r = pool.swap(as(BOB, gas::SWAP + 10000000), swap_req(BOB, WALLET0, 1000));
    REQUIRE(r.instructions.back() == instr::excess(BOB, 10000000));
}

TEST_CASE("Burning LP shares", "[pool]") {
    PoolController pool(base_config());
    seed(pool);

    SECTION("Pro-rata payout to the owner of the shares") {
        BurnResult r = pool.burn_notification(as(ALICE), BurnNotification{500000, ALICE, address::NONE});
        REQUIRE(r.withdrawn.amount0 == 500000);
        REQUIRE(r.withdrawn.amount1 == 500000);
        REQUIRE(r.instructions.size() == 3);
        REQUIRE(r.instructions[0] == instr::transfer(Side::TOKEN0, ALICE, 500000));
        REQUIRE(r.instructions[1] == instr::transfer(Side::TOKEN1, ALICE, 500000));
        REQUIRE(r.instructions[2] == instr::excess(ALICE, GAS - gas::BURN));
        REQUIRE(pool.get_total_supply() == 500000);
    }

    SECTION("Excess goes to the response address") {
        BurnResult r = pool.burn_notification(as(ALICE), BurnNotification{1000, ALICE, BOB});
        REQUIRE(r.instructions.back() == instr::excess(BOB, GAS - gas::BURN));
    }

    SECTION("Full burn empties the pool") {
        pool.burn_notification(as(ALICE), BurnNotification{1000000, ALICE, address::NONE});
        REQUIRE(pool.get_total_supply() == 0);
        REQUIRE(pool.get_reserves().first == 0);
        REQUIRE(error_of([&] { pool.swap(as(BOB), swap_req(BOB, WALLET0, 1000)); }) ==
                ErrorCode::NO_LIQUIDITY);
    }
}

TEST_CASE("Collecting fees through the controller", "[pool]") {
    PoolController pool(base_config().with_min_collect_fees(3));
    seed(pool);
    pool.swap(as(BOB), swap_req(BOB, WALLET0, 1000));   // token1 fees: 3 / 1

    SECTION("Pays recipients and charges per payout") {
        uint64_t accrued_before = pool.get_pool_data().gas_accrued;

        CollectResult r = pool.collect_fees(as(CAROL));
        REQUIRE(r.collected);
        REQUIRE(r.instructions.size() == 3);
        REQUIRE(r.instructions[0] ==
                instr::payout(Side::TOKEN1, PROVIDER_FEES, 3, PayoutRole::PROVIDER));
        REQUIRE(r.instructions[1] ==
                instr::payout(Side::TOKEN1, PROTOCOL_FEES, 1, PayoutRole::PROTOCOL));

        uint64_t cost = gas::COLLECT_BASE + 2 * gas::COLLECT_PER_PAYOUT;
        REQUIRE(r.instructions[2] == instr::excess(CAROL, GAS - cost));
        REQUIRE(pool.get_pool_data().gas_accrued == accrued_before + cost);
        REQUIRE(pool.get_pool_data().fees1.provider == 0);

        SECTION("Second collection is a no-op") {
            uint64_t accrued = pool.get_pool_data().gas_accrued;
            CollectResult again = pool.collect_fees(as(CAROL));
            REQUIRE_FALSE(again.collected);
            REQUIRE(again.instructions.size() == 1);
            REQUIRE(again.instructions[0] == instr::excess(CAROL, GAS));
            REQUIRE(pool.get_pool_data().gas_accrued == accrued);
        }
    }

    SECTION("Resource check comes before the accumulators are zeroed") {
        REQUIRE(error_of([&] { pool.collect_fees(as(CAROL, 1000)); }) ==
                ErrorCode::INSUFFICIENT_GAS);
        REQUIRE(pool.get_pool_data().fees1.provider == 3);
        REQUIRE(pool.get_pool_data().fees1.protocol == 1);
    }
}

TEST_CASE("Lock status", "[pool]") {
    PoolController pool(base_config());
    seed(pool);

    SECTION("Only authorized callers may lock") {
        REQUIRE(error_of([&] { pool.set_lock_status(as(BOB), true); }) ==
                ErrorCode::INVALID_CALLER);
        REQUIRE(pool.status() == PoolStatus::ACTIVE);
    }

    pool.set_lock_status(as(OWNER), true);
    REQUIRE(pool.status() == PoolStatus::LOCKED);
    REQUIRE(pool.get_pool_data().locked);

    SECTION("Mutations are rejected while locked") {
        REQUIRE(error_of([&] { pool.swap(as(BOB), swap_req(BOB, WALLET0, 1000)); }) ==
                ErrorCode::POOL_LOCKED);
        REQUIRE(error_of([&] { pool.provide_liquidity(as(BOB), provide_req(BOB, 10, 10)); }) ==
                ErrorCode::POOL_LOCKED);
        REQUIRE(error_of([&] {
                    pool.burn_notification(as(ALICE), BurnNotification{10, ALICE, address::NONE});
                }) == ErrorCode::POOL_LOCKED);
        REQUIRE(error_of([&] { pool.collect_fees(as(CAROL)); }) == ErrorCode::POOL_LOCKED);
        REQUIRE(error_of([&] {
                    pool.set_fees(as(OWNER), SetFeesRequest{{1, 1, 1}, PROTOCOL_FEES, address::NONE});
                }) == ErrorCode::POOL_LOCKED);
        REQUIRE(error_of([&] { pool.add_authorized(as(OWNER), BOB); }) == ErrorCode::POOL_LOCKED);
        REQUIRE(error_of([&] { pool.reset_gas(as(OWNER)); }) == ErrorCode::POOL_LOCKED);
    }

    SECTION("Queries still answer while locked") {
        REQUIRE(pool.get_total_supply() == 1000000);
        REQUIRE(pool.get_expected_outputs(1000, WALLET0).amount_out == 993);
    }

    SECTION("Unlock restores operations") {
        pool.set_lock_status(as(OWNER), false);
        REQUIRE(pool.status() == PoolStatus::ACTIVE);
        REQUIRE_FALSE(pool.swap(as(BOB), swap_req(BOB, WALLET0, 1000)).refunded);
    }
}

TEST_CASE("Updating fees", "[pool]") {
    PoolController pool(base_config());

    SECTION("Authorized update keeps the provider recipient when none is given") {
        pool.set_fees(as(OWNER), SetFeesRequest{{50, 20, 0}, CAROL, address::NONE});
        PoolData data = pool.get_pool_data();
        REQUIRE(data.rates == FeeRates{50, 20, 0});
        REQUIRE(data.protocol_fee_address == CAROL);
        REQUIRE(data.provider_fee_address == PROVIDER_FEES);
    }

    SECTION("Provider recipient can be replaced") {
        pool.set_fees(as(OWNER), SetFeesRequest{{50, 20, 0}, CAROL, BOB});
        REQUIRE(pool.get_pool_data().provider_fee_address == BOB);
    }

    SECTION("Rejections") {
        PoolData before = pool.get_pool_data();
        REQUIRE(error_of([&] {
                    pool.set_fees(as(BOB), SetFeesRequest{{50, 20, 0}, CAROL, address::NONE});
                }) == ErrorCode::INVALID_CALLER);
        REQUIRE(error_of([&] {
                    pool.set_fees(as(OWNER), SetFeesRequest{{50, 201, 0}, CAROL, address::NONE});
                }) == ErrorCode::FEE_OUT_OF_RANGE);
        REQUIRE(error_of([&] {
                    pool.set_fees(as(OWNER), SetFeesRequest{{50, 20, 0}, address::NONE, address::NONE});
                }) == ErrorCode::INVALID_RECIPIENT);
        REQUIRE(same_state(before, pool.get_pool_data()));
    }
}

TEST_CASE("Managing authorized callers", "[pool]") {
    PoolController pool(base_config());

    SECTION("Added caller may administer, removed caller may not") {
        pool.add_authorized(as(OWNER), ALICE);
        REQUIRE(pool.is_authorized(ALICE));
        pool.set_lock_status(as(ALICE), true);
        pool.set_lock_status(as(ALICE), false);

        pool.remove_authorized(as(OWNER), ALICE);
        REQUIRE_FALSE(pool.is_authorized(ALICE));
        REQUIRE(error_of([&] { pool.set_lock_status(as(ALICE), true); }) ==
                ErrorCode::INVALID_CALLER);
    }

    SECTION("Rejections") {
        REQUIRE(error_of([&] { pool.add_authorized(as(BOB), BOB); }) ==
                ErrorCode::INVALID_CALLER);
        REQUIRE(error_of([&] { pool.add_authorized(as(OWNER), address::NONE); }) ==
                ErrorCode::INVALID_RECIPIENT);
        REQUIRE(error_of([&] { pool.remove_authorized(as(OWNER), OWNER); }) ==
                ErrorCode::INVALID_RECIPIENT);
        REQUIRE(pool.is_authorized(OWNER));
    }
}

TEST_CASE("Resetting accrued gas", "[pool]") {
    PoolController pool(base_config());
    seed(pool);
    REQUIRE(pool.get_pool_data().gas_accrued == gas::PROVIDE_LIQUIDITY);

    SECTION("Pays everything accrued back to the caller") {
        Instructions out = pool.reset_gas(as(OWNER));
        REQUIRE(out.size() == 1);
        REQUIRE(out[0] == instr::excess(OWNER, gas::PROVIDE_LIQUIDITY + GAS));
        REQUIRE(pool.get_pool_data().gas_accrued == 0);
    }

    SECTION("Unauthorized caller") {
        REQUIRE(error_of([&] { pool.reset_gas(as(BOB)); }) == ErrorCode::INVALID_CALLER);
        REQUIRE(pool.get_pool_data().gas_accrued == gas::PROVIDE_LIQUIDITY);
    }
}

TEST_CASE("Expected outputs are a pure quote", "[pool]") {
    PoolController pool(base_config());
    seed(pool);
    PoolData before = pool.get_pool_data();

    SwapQuote q = pool.get_expected_outputs(1000, WALLET0);
    REQUIRE(q.base_out == 998);
    REQUIRE(q.provider_fee == 3);
    REQUIRE(q.protocol_fee == 1);
    REQUIRE(q.ref_fee == 1);
    REQUIRE(q.amount_out == 993);
    REQUIRE(same_state(before, pool.get_pool_data()));

    REQUIRE(error_of([&] { pool.get_expected_outputs(1000, CAROL); }) ==
            ErrorCode::INVALID_TOKEN);
}

TEST_CASE("Constant product holds across a swap sequence", "[pool]") {
    PoolController pool(base_config());
    seed(pool, 5000000000ULL, 7000000000ULL);
    Lcg rng(2024);

    for (int i = 0; i < 200; ++i) {
        auto reserves = pool.get_reserves();
        U256 k_before = math::mul_wide(reserves.first, reserves.second);

        const Address& wallet = (i % 3 == 0) ? WALLET1 : WALLET0;
        SwapResult r = pool.swap(as(BOB), swap_req(BOB, wallet, rng.between(1000, 100000000)));
        REQUIRE_FALSE(r.refunded);

        reserves = pool.get_reserves();
        REQUIRE(math::mul_wide(reserves.first, reserves.second) >= k_before);
    }
}
