// =============================================================================
// fee_schedule.cpp - Fee rate bounds and recipients
// =============================================================================

#include "cpamm/fee_schedule.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/math.hpp"

namespace cpamm {

namespace {

void check_rate(uint32_t rate, const char* name) {
    if (rate > fees::MAX_FEE_RATE) {
        throw PoolError(ErrorCode::FEE_OUT_OF_RANGE,
                        std::string(name) + " " + std::to_string(rate) +
                        " exceeds " + std::to_string(fees::MAX_FEE_RATE) + " bps");
    }
}

} // anonymous namespace

FeeSchedule::FeeSchedule(const FeeRates& rates, const Address& provider_fee_address,
                         const Address& protocol_fee_address)
    : rates_{0, 0, 0} {
    update(rates, provider_fee_address, protocol_fee_address);
}

void FeeSchedule::validate(const FeeRates& rates) {
    check_rate(rates.lp_fee, "lp_fee");
    check_rate(rates.protocol_fee, "protocol_fee");
    check_rate(rates.ref_fee, "ref_fee");
}

void FeeSchedule::validate_recipient(const Address& addr, const char* what) {
    if (address::is_null(addr)) {
        throw PoolError(ErrorCode::INVALID_RECIPIENT, std::string(what) + " is null");
    }
}

void FeeSchedule::update(const FeeRates& rates, const Address& provider_fee_address,
                         const Address& protocol_fee_address) {
    // Validate everything before touching any field
    validate(rates);
    validate_recipient(provider_fee_address, "provider fee address");
    validate_recipient(protocol_fee_address, "protocol fee address");

    rates_ = rates;
    provider_fee_address_ = provider_fee_address;
    protocol_fee_address_ = protocol_fee_address;
}

Coins FeeSchedule::fee_for(Coins amount, uint32_t rate) {
    if (rate == 0 || amount == 0) return 0;
    return math::mul_div(amount, rate, fees::FEE_DIVIDER, math::Rounding::UP);
}

} // namespace cpamm
