// =============================================================================
// fee_collector.cpp - Fee collection and payout split
// =============================================================================

#include "cpamm/fee_collector.hpp"

#include <algorithm>

namespace cpamm {

FeeCollector::FeeCollector(Coins min_collect_fees)
    : min_collect_fees_(min_collect_fees) {}

bool FeeCollector::is_collectible(const FeeAccumulator& acc) const {
    if (acc.empty()) return false;
    return acc.provider >= min_collect_fees_ || acc.protocol >= min_collect_fees_;
}

Coins FeeCollector::collector_reward(const FeeAccumulator& acc) {
    Coins reward = acc.total() / fees::COLLECTOR_REWARD_DIVIDER;
    return std::min(reward, acc.protocol);
}

void FeeCollector::plan_side(Side side, const FeeAccumulator& acc, const FeeSchedule& schedule,
                             const Address& collector, Instructions& out) const {
    if (!is_collectible(acc)) return;

    Coins reward = collector_reward(acc);
    Coins protocol_share = acc.protocol - reward;

    if (acc.provider > 0) {
        out.push_back(instr::payout(side, schedule.provider_fee_address(),
                                    acc.provider, PayoutRole::PROVIDER));
    }
    if (protocol_share > 0) {
        out.push_back(instr::payout(side, schedule.protocol_fee_address(),
                                    protocol_share, PayoutRole::PROTOCOL));
    }
    if (reward > 0) {
        out.push_back(instr::payout(side, collector, reward, PayoutRole::COLLECTOR));
    }
}

Instructions FeeCollector::plan(const ReserveState& state, const FeeSchedule& schedule,
                                const Address& collector) const {
    Instructions out;
    plan_side(Side::TOKEN0, state.fees(Side::TOKEN0), schedule, collector, out);
    plan_side(Side::TOKEN1, state.fees(Side::TOKEN1), schedule, collector, out);
    return out;
}

Instructions FeeCollector::collect(ReserveState& state, const FeeSchedule& schedule,
                                   const Address& collector) const {
    Instructions out = plan(state, schedule, collector);

    // Zero only after the payouts for the full pre-collection amounts exist
    for (Side side : {Side::TOKEN0, Side::TOKEN1}) {
        if (is_collectible(state.fees(side))) {
            state.take_fees(side);
        }
    }
    return out;
}

} // namespace cpamm
