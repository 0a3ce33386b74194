#ifndef CPAMM_FEE_SCHEDULE_HPP
#define CPAMM_FEE_SCHEDULE_HPP

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Fee Rates (basis points, each in [0, MAX_FEE_RATE])
// =============================================================================

struct FeeRates {
    uint32_t lp_fee;
    uint32_t protocol_fee;
    uint32_t ref_fee;

    bool operator==(const FeeRates& other) const {
        return lp_fee == other.lp_fee && protocol_fee == other.protocol_fee &&
               ref_fee == other.ref_fee;
    }
};

// =============================================================================
// FeeSchedule - three rates plus the two fee recipients
// =============================================================================

class FeeSchedule {
public:
    // Throws FEE_OUT_OF_RANGE / INVALID_RECIPIENT
    FeeSchedule(const FeeRates& rates, const Address& provider_fee_address,
                const Address& protocol_fee_address);

    const FeeRates& rates() const { return rates_; }
    uint32_t lp_fee() const { return rates_.lp_fee; }
    uint32_t protocol_fee() const { return rates_.protocol_fee; }
    uint32_t ref_fee() const { return rates_.ref_fee; }

    const Address& provider_fee_address() const { return provider_fee_address_; }
    const Address& protocol_fee_address() const { return protocol_fee_address_; }

    // Replaces all rates and both recipients, or nothing
    void update(const FeeRates& rates, const Address& provider_fee_address,
                const Address& protocol_fee_address);

    // ceil(amount * rate / FEE_DIVIDER)
    static Coins fee_for(Coins amount, uint32_t rate);

    static void validate(const FeeRates& rates);
    static void validate_recipient(const Address& addr, const char* what);

private:
    FeeRates rates_;
    Address provider_fee_address_;
    Address protocol_fee_address_;
};

} // namespace cpamm

#endif // CPAMM_FEE_SCHEDULE_HPP
