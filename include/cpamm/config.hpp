#ifndef CPAMM_CONFIG_HPP
#define CPAMM_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "fee_schedule.hpp"

namespace cpamm {

// =============================================================================
// PoolConfig - deployment parameters for one pool instance
// =============================================================================

class PoolConfig {
public:
    Address owner{};
    Address wallet0{};
    Address wallet1{};
    FeeRates fees{20, 10, 10};
    Address provider_fee_address{};
    Address protocol_fee_address{};
    std::vector<Address> authorized;

    Coins min_liquidity = 1000;
    Coins min_swap_amount = 1;
    Coins min_collect_fees = fees::REQUIRED_MIN_COLLECT_FEES;
    uint64_t min_operating_reserve = 10000000;

    std::string log_level = "info";

    PoolConfig() = default;

    // Load from JSON file; throws std::runtime_error if unreadable
    static PoolConfig from_file(std::string_view path);

    // Load from JSON text; throws PoolError(INVALID_PAYLOAD) on bad fields
    static PoolConfig from_json(std::string_view content);

    // Builder methods
    PoolConfig& with_owner(const Address& addr) {
        owner = addr;
        return *this;
    }

    PoolConfig& with_wallets(const Address& w0, const Address& w1) {
        wallet0 = w0;
        wallet1 = w1;
        return *this;
    }

    PoolConfig& with_fees(uint32_t lp_fee, uint32_t protocol_fee, uint32_t ref_fee) {
        fees = FeeRates{lp_fee, protocol_fee, ref_fee};
        return *this;
    }

    PoolConfig& with_recipients(const Address& provider, const Address& protocol) {
        provider_fee_address = provider;
        protocol_fee_address = protocol;
        return *this;
    }

    PoolConfig& with_authorized(const Address& addr) {
        authorized.push_back(addr);
        return *this;
    }

    PoolConfig& with_min_liquidity(Coins amount) {
        min_liquidity = amount;
        return *this;
    }

    PoolConfig& with_min_swap_amount(Coins amount) {
        min_swap_amount = amount;
        return *this;
    }

    PoolConfig& with_min_collect_fees(Coins amount) {
        min_collect_fees = amount;
        return *this;
    }

    PoolConfig& with_min_operating_reserve(uint64_t units) {
        min_operating_reserve = units;
        return *this;
    }
};

} // namespace cpamm

#endif // CPAMM_CONFIG_HPP
